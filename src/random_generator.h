// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_UUTID_RANDOM_GENERATOR_H_INCLUDED
#define HEADER_MODERN_UUTID_RANDOM_GENERATOR_H_INCLUDED

#include <random>
#include <chacha20.hpp>


namespace muutid::impl {

    using prng = chacha20_12;

    prng & get_random_generator();
}

#endif
