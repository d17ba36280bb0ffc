// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "random_generator.h"
#include "fork_handler.h"

#include <randutils.hpp>

namespace muutid::impl {

    prng & get_random_generator() {

        struct generator : prng {
            generator():
                prng(randutils::auto_seed_128{}.base())
            {}
        };

        return reset_on_fork_thread_local<generator>::instance();
    }

}

namespace {

    class prng_random_source final : public muutid::random_source {
    public:
        auto read(std::span<uint8_t> dest) -> size_t override {
            auto & gen = muutid::impl::get_random_generator();
            std::uniform_int_distribution<uint32_t> distrib;

            auto * out = dest.data();
            size_t left = dest.size();
            while (left != 0) {
                uint32_t val = distrib(gen);
                size_t count = std::min(left, sizeof(val));
                for (size_t i = 0; i < count; ++i, val >>= 8)
                    *out++ = uint8_t(val);
                left -= count;
            }
            return dest.size();
        }
    };
}

auto muutid::default_random_source() -> random_source & {
    static prng_random_source source;
    return source;
}
