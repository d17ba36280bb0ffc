// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_UUTID_THREADING_H_INCLUDED
#define HEADER_MODERN_UUTID_THREADING_H_INCLUDED

#include <modern-uutid/uutid.h>

#if MUUTID_MULTITHREADED
    #include <atomic>
#endif


namespace muutid::impl {

    #if MUUTID_MULTITHREADED
        
        template<class T>
        class atomic_if_multithreaded {
        public:
            atomic_if_multithreaded(): m_value{T{}} {}
            atomic_if_multithreaded(T value): m_value{value} {}
            T get() const { return this->m_value.load(std::memory_order_acquire); }
            void set(T val) { this->m_value.store(val, std::memory_order_release); }
        private:
            std::atomic<T> m_value;
        };

    #else

        template<class T>
        class atomic_if_multithreaded {
        public:
            atomic_if_multithreaded(): m_value{T{}} {}
            atomic_if_multithreaded(T value): m_value{value} {}
            T get() const { return this->m_value; }
            void set(T val) { this->m_value = val; }
        private:
            T m_value;
        };

    #endif
}

#endif
