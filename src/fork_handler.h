// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_UUTID_FORK_HANDLER_H_INCLUDED
#define HEADER_MODERN_UUTID_FORK_HANDLER_H_INCLUDED

#include <modern-uutid/uutid.h>

#if __has_include(<unistd.h>)
    #include <unistd.h>
    #include <pthread.h>
    #include <signal.h>

    #define MUUTID_HANDLE_FORK 1

#else 
    #define MUUTID_HANDLE_FORK 0
#endif

#include <new>
#include <exception>
#include <type_traits>

namespace muutid::impl {

#if MUUTID_HANDLE_FORK

    template<class T>
    class singleton_holder {
    public:
        singleton_holder() = default;
        ~singleton_holder() {
            if (m_memory_initialized)
                reinterpret_cast<T *>(&m_buf[0])->~T();
        }
        singleton_holder(const singleton_holder &) = delete;
        singleton_holder operator=(const singleton_holder &) = delete;

        void reset() {
            if (m_memory_initialized)
                reinterpret_cast<T *>(&m_buf[0])->~T();
            
            m_memory_initialized = false;
            //this can throw
            new (&m_buf[0]) T;
            m_memory_initialized = true;
        }

        operator bool() const 
            { return m_memory_initialized; }

        T & operator*() 
            { return *std::launder(reinterpret_cast<T *>(&m_buf[0])); }

    private:
        alignas(alignof(T)) uint8_t m_buf[sizeof(T)];
        bool m_memory_initialized = false;
    };

    /**
     * Per-thread instance of T that is re-created on first use after fork() in the child
     * 
     * Used for random generators so that parent and child do not produce the same stream
     */
    template<class T>
    class reset_on_fork_thread_local {
    private:
        using sig_atomic_counter = std::make_unsigned_t<sig_atomic_t>;
    public:
        static T & instance() {

            [[maybe_unused]]
            static int registered = []() {
                if (pthread_atfork(nullptr, nullptr, after_fork_in_child) != 0)
                    std::terminate();
                return 1;
            }();

            if (tl_inst.m_generation != s_generation) {
                tl_inst.m_obj.reset();
                tl_inst.m_generation = s_generation;
            }
            
            return *tl_inst.m_obj;
        }
    private:
        static void after_fork_in_child() {
            //NOTE 1: only signal safe functions can be called here!
            //NOTE 2: only one thread is running here
            s_generation = s_generation + 1;
        }

        reset_on_fork_thread_local():
            m_generation(s_generation - 1)
        {}
        ~reset_on_fork_thread_local() = default;
        reset_on_fork_thread_local(const reset_on_fork_thread_local &) = delete;
        reset_on_fork_thread_local & operator=(const reset_on_fork_thread_local &) = delete;

    private:
        sig_atomic_counter m_generation;
        singleton_holder<T> m_obj;
        
        static inline volatile sig_atomic_counter s_generation = 0;
        static thread_local inline reset_on_fork_thread_local tl_inst{};
    };


#else //!MUUTID_HANDLE_FORK

    template<class T>
    class reset_on_fork_thread_local {
    public:
        static T & instance() {

            thread_local T obj;
            return obj;
        }
    private:
        reset_on_fork_thread_local() = delete;
        ~reset_on_fork_thread_local() = delete;
        reset_on_fork_thread_local(const reset_on_fork_thread_local &) = delete;
        reset_on_fork_thread_local & operator=(const reset_on_fork_thread_local &) = delete;
    };


#endif //MUUTID_HANDLE_FORK

}


#endif
