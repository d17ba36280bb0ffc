// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-uutid/uutid.h>

#include "threading.h"

using namespace std::chrono;
using namespace muutid;
using namespace muutid::impl;

static atomic_if_multithreaded<random_source *> g_random_source{};
static atomic_if_multithreaded<int> g_version{default_version};

static bool read_full(random_source & source, std::span<uint8_t> dest) {
    while (!dest.empty()) {
        size_t count = source.read(dest);
        if (count == 0)
            return false;
        dest = dest.subspan(std::min(count, dest.size()));
    }
    return true;
}

static auto make_uutid(uutid::time_point_t when, int version, random_source & source) -> uutid {
    auto secs = std::chrono::floor<seconds>(when);
    uint32_t nsec = uint32_t((when - secs).count());

    //nanoseconds are below 2^30 so the top 2 bits of the shifted value stay clear
    uint32_t shifted = nsec << 2;
    uint16_t time_high = uint16_t(shifted >> 16);
    uint16_t time_low_and_version = uint16_t(((shifted & 0xFFFF) >> 4) & 0x0FFF);
    time_low_and_version |= uint16_t((unsigned(version) & 0xF) << 12);

    uutid ret;
    auto data = ret.bytes.data();
    data = write_bytes(uint32_t(secs.time_since_epoch().count()), data);
    data = write_bytes(time_high, data);
    data = write_bytes(time_low_and_version, data);

    if (!read_full(source, std::span{data, ret.bytes.data() + ret.bytes.size()}))
        return uutid();

    ret.bytes[8] = (ret.bytes[8] & 0x3F) | 0x80;
    return ret;
}

static auto now() -> uutid::time_point_t {
    return time_point_cast<nanoseconds>(system_clock::now());
}

auto uutid::generate() -> uutid {
    return uutid::generate(now());
}

auto uutid::generate(time_point_t when) -> uutid {
    random_source * source = g_random_source.get();
    return make_uutid(when, g_version.get(), source ? *source : default_random_source());
}

auto uutid_generator::generate() const -> uutid {
    return this->generate(now());
}

auto uutid_generator::generate(uutid::time_point_t when) const -> uutid {
    return make_uutid(when, m_version, this->source());
}

void muutid::set_random_source(random_source * source) {
    g_random_source.set(source);
}

void muutid::set_version(int version) {
    validate_version(version);
    g_version.set(version);
}

auto muutid::get_version() noexcept -> int {
    return g_version.get();
}
