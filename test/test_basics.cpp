// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "test_util.h"

#include <sstream>
#include <vector>
#include <map>
#include <unordered_map>

using namespace muutid;
using namespace std::literals;


TEST_SUITE("basics") {

static_assert(std::is_class_v<uutid>);
static_assert(std::is_trivially_copyable_v<uutid>);
static_assert(std::is_standard_layout_v<uutid>);
static_assert(std::has_unique_object_representations_v<uutid>);
static_assert(!std::is_trivially_default_constructible_v<uutid>);
static_assert(std::is_nothrow_default_constructible_v<uutid>);
static_assert(std::is_trivially_copy_constructible_v<uutid>);
static_assert(std::is_trivially_move_constructible_v<uutid>);
static_assert(std::is_trivially_copy_assignable_v<uutid>);
static_assert(std::is_trivially_move_assignable_v<uutid>);
static_assert(std::is_trivially_destructible_v<uutid>);
static_assert(std::equality_comparable<uutid>);
static_assert(std::totally_ordered<uutid>);
#if !defined(_LIBCPP_VERSION) || (defined(_LIBCPP_VERSION) && _LIBCPP_VERSION >= 140000)
static_assert(std::three_way_comparable<uutid>);
#endif
static_assert(std::regular<uutid>);


namespace {
    template<uutid U1> class some_class {};
    [[maybe_unused]] some_class<uutid("6216b0a7-290a-42a2-8f94-5b18df4e0537")> some_object;
    [[maybe_unused]] some_class<uutid(L"6216b0a7-290a-42a2-8f94-5b18df4e0537")> some_objectw;
    [[maybe_unused]] some_class<uutid(u"6216b0a7290a42a28f945b18df4e0537")> some_object16;
    [[maybe_unused]] some_class<uutid(U"6216b0a7290a42a28f945b18df4e0537")> some_object32;
    [[maybe_unused]] some_class<uutid(u8"6216B0A7-290A-42A2-8F94-5B18DF4E0537")> some_object8;

    [[maybe_unused]] std::map<uutid, std::string> m;
    [[maybe_unused]] std::unordered_map<uutid, std::string> um;
}

TEST_CASE("nil") {

    constexpr uutid u;

    constexpr uint8_t null_bytes[16] = {};

    CHECK(memcmp(u.bytes.data(), null_bytes, u.bytes.size()) == 0);
    CHECK(u.is_nil());
    CHECK(u.version() == 0);
    CHECK(!u.has_standard_variant());
    CHECK(u.time() == uutid::time_point_t{});
}

TEST_CASE("max") {

    constexpr uutid u = uutid::max();

    constexpr uint8_t max_bytes[16] = {
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF
    };

    CHECK(memcmp(u.bytes.data(), max_bytes, u.bytes.size()) == 0);
    CHECK(!u.is_nil());
}

TEST_CASE("bytes") {
    constexpr std::array<uint8_t, 16> buf1 = {1,2,3,4,5,6,7,8,9,10,11,12,13,14,15,16};
    std::vector<uint8_t> buf2{{1,2,3,4,5,6,7,8,9,10,11,12,13,14,15,16}};
    std::array<std::byte, 16> buf3;
    std::transform(buf1.begin(), buf1.end(), buf3.begin(), [](uint8_t b) { return std::byte(b); });

    constexpr uutid u1(buf1);
    constexpr uutid u2{std::array<uint8_t, 16>{{1,2,3,4,5,6,7,8,9,10,11,12,13,14,15,16}}};
    uutid u3{std::span<uint8_t, 16>{buf2}};
    uutid u4{std::span{buf2}.subspan<0, 16>()};
    uutid u5{buf3};

    CHECK(u1 == u2);
    CHECK(u1 != uutid());
    CHECK(uutid() < u2);
    CHECK(u2 == u3);
    CHECK(u3 == u4);
    CHECK(u4 == u5);

    CHECK(u2.bytes == buf1);
    CHECK(u3.bytes == buf1);
    CHECK(u5.to_bytes() == buf1);
}

TEST_CASE("from_bytes") {
    std::vector<uint8_t> buf{{1,2,3,4,5,6,7,8,9,10,11,12,13,14,15,16}};

    uutid u = uutid::from_bytes(buf);
    CHECK_EQUAL_SEQ(u.bytes, buf);
    CHECK(uutid::from_bytes(u.to_bytes()) == u);
    CHECK(uutid::from_bytes(std::span{buf}) == u);

    std::vector<uint8_t> shorter(buf.begin(), buf.end() - 1);
    std::vector<uint8_t> longer(buf);
    longer.push_back(17);

    CHECK(uutid::from_bytes(shorter) == uutid());
    CHECK(uutid::from_bytes(longer) == uutid());
    CHECK(uutid::from_bytes(std::vector<uint8_t>{}) == uutid());
    CHECK(uutid::from_bytes(std::array<uint8_t, 15>{}) == uutid());
    CHECK(uutid::from_bytes(std::array<uint8_t, 17>{{1}}) == uutid());

    std::string str("\x01\x02\x03\x04\x05\x06\x07\x08\x09\x0a\x0b\x0c\x0d\x0e\x0f\x10", 16);
    CHECK(uutid::from_bytes(str) == u);
}

TEST_CASE("literals") {
    constexpr uutid us("6216b0a7-290a-42a2-8f94-5b18df4e0537");
    constexpr uutid usw(L"6216b0a7-290a-42a2-8f94-5b18df4e0537");
    constexpr uutid us16(u"6216B0A7-290A-42A2-8F94-5B18DF4E0537");
    constexpr uutid us32(U"6216b0a7290a42a28f945b18df4e0537");
    constexpr uutid us8(u8"6216b0a7290a42a28f945b18df4e0537");

    constexpr std::array<uint8_t, 16> expected =
        {0x62,0x16,0xb0,0xa7,0x29,0x0a,0x42,0xa2,0x8f,0x94,0x5b,0x18,0xdf,0x4e,0x05,0x37};

    CHECK(us.bytes == expected);
    CHECK(usw.bytes == expected);
    CHECK(us16.bytes == expected);
    CHECK(us32.bytes == expected);
    CHECK(us8.bytes == expected);
}

TEST_CASE("fields") {
    constexpr uutid u("60038d46-1d6f-4361-8102-030405060708");

    static_assert(u.version() == 4);
    static_assert(u.has_standard_variant());

    constexpr auto t = u.time();
    constexpr auto expected = uutid::time_point_t(std::chrono::seconds(1610845510) + std::chrono::nanoseconds(123456900));
    static_assert(t == expected);
    CHECK(t == expected);

    constexpr uutid v9("60038d46-1d6f-9361-8102-030405060708");
    static_assert(v9.version() == 9);
    static_assert(v9.time() == expected);

    constexpr uutid c0("60038d46-1d6f-4361-0102-030405060708");
    static_assert(!c0.has_standard_variant());
}

TEST_CASE("max time") {
    constexpr uutid u = uutid::max();

    //all nanosecond bits set is more than a second, time() does not normalize that away
    constexpr auto expected = uutid::time_point_t(std::chrono::seconds(0xFFFFFFFFu) + std::chrono::nanoseconds(0x3FFFFFFCu));
    CHECK(u.time() == expected);
}

TEST_CASE("ordering") {
    constexpr uutid early("60038d46-1d6f-4361-ffff-ffffffffffff");
    constexpr uutid later("60038d46-1d70-4000-8000-000000000000");
    constexpr uutid next_second("60038d47-0000-4000-8000-000000000000");

    CHECK(early < later);
    CHECK(later < next_second);
    CHECK(early.time() < later.time());
    CHECK(later.time() < next_second.time());
}

TEST_CASE("clear") {
    uutid u("6216b0a7-290a-42a2-8f94-5b18df4e0537");
    CHECK(!u.is_nil());
    u.clear();
    CHECK(u.is_nil());
}

TEST_CASE("hash") {

    constexpr std::hash<uutid> hasher;

    CHECK(hasher(uutid()) != 0);

    constexpr uutid val("6216b0a7-290a-42a2-8f94-5b18df4e0537");
    CHECK(hasher(val) != 0);
    CHECK(hasher(val) != hasher(uutid()));
    CHECK(hasher(val) == hasher(val));
    CHECK(hash_value(val) == hasher(val));

    std::unordered_map<uutid, int> map;
    map[val] = 1;
    map[uutid()] = 2;
    CHECK(map.size() == 2);
    CHECK(map[val] == 1);
}

#if MUUTID_SUPPORTS_STD_FORMAT
TEST_CASE("format") {
    constexpr uutid val("6216b0a7-290a-42a2-8f94-5b18df4e0537");

    CHECK(std::format("{}", uutid()) == "00000000000000000000000000000000");
    CHECK(std::format("{}", val) == "6216b0a7290a42a28f945b18df4e0537");
    CHECK(std::format("{:x}", val) == "6216b0a7290a42a28f945b18df4e0537");
    CHECK(std::format("{:xU}", val) == "6216B0A7290A42A28F945B18DF4E0537");
    CHECK(std::format("{:u}", val) == "6216b0a7-290a-42a2-8f94-5b18df4e0537");
    CHECK(std::format("{:Uu}", val) == "6216B0A7-290A-42A2-8F94-5B18DF4E0537");
    CHECK(std::format("{:c}", val) == "c8bb19s9191a53wmbccdykg56w");
    CHECK(std::format("{:b}", val) == "YhawpykKQqKPlFsY304FNw");
    CHECK(std::format("{:bU}", val) == "YhawpykKQqKPlFsY304FNw");

    CHECK(std::format(L"{}", val) == L"6216b0a7290a42a28f945b18df4e0537");
    CHECK(std::format(L"{:u}", val) == L"6216b0a7-290a-42a2-8f94-5b18df4e0537");
}
#endif

TEST_CASE("output") {
    std::ostringstream obuf;

    obuf << uutid();
    CHECK(obuf.str() == "00000000000000000000000000000000");
    obuf.str("");

    obuf << uutid("6216b0a7-290a-42a2-8f94-5b18df4e0537");
    CHECK(obuf.str() == "6216b0a7290a42a28f945b18df4e0537");
    obuf.str("");

    obuf << std::uppercase << uutid("6216b0a7-290a-42a2-8f94-5b18df4e0537");
    CHECK(obuf.str() == "6216B0A7290A42A28F945B18DF4E0537");
    obuf.str("");
}

TEST_CASE("outputw") {
    std::wostringstream obuf;

    obuf << uutid();
    CHECK(obuf.str() == L"00000000000000000000000000000000");
    obuf.str(L"");

    obuf << uutid("6216b0a7-290a-42a2-8f94-5b18df4e0537");
    CHECK(obuf.str() == L"6216b0a7290a42a28f945b18df4e0537");
    obuf.str(L"");
}

TEST_CASE("input") {
    std::istringstream ibuf;
    uutid val;

    ibuf.str("00000000000000000000000000000000");
    ibuf >> val;
    CHECK(ibuf);
    CHECK(val == uutid());

    ibuf.clear();
    ibuf.str("6216b0a7290a42a28f945b18df4e0537");
    ibuf >> val;
    CHECK(ibuf);
    CHECK(val == uutid("6216b0a7-290a-42a2-8f94-5b18df4e0537"));

    ibuf.clear();
    ibuf.str("6216B0A7290A42A28F945B18DF4E0537");
    ibuf >> val;
    CHECK(ibuf);
    CHECK(val == uutid("6216b0a7-290a-42a2-8f94-5b18df4e0537"));

    ibuf.clear();
    ibuf.str("6216b0a7290a42a28f945b18df4e053");
    ibuf >> val;
    CHECK(!ibuf);
    CHECK(ibuf.fail());
    CHECK(ibuf.eof());

    ibuf.clear();
    ibuf.str("6216b0a7 290a42a28f945b18df4e0537");
    ibuf >> val;
    CHECK(!ibuf);
    CHECK(ibuf.fail());
    CHECK(!ibuf.eof());
}

TEST_CASE("inputw") {
    std::wistringstream ibuf;
    uutid val;

    ibuf.str(L"6216b0a7290a42a28f945b18df4e0537");
    ibuf >> val;
    CHECK(ibuf);
    CHECK(val == uutid("6216b0a7-290a-42a2-8f94-5b18df4e0537"));

    ibuf.clear();
    ibuf.str(L"6216b0a7-290a-42a2-8f94-5b18df4e0537");
    ibuf >> val;
    CHECK(!ibuf);
    CHECK(ibuf.fail());
}

}
