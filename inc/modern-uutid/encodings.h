// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_UUTID_ENCODINGS_H_INCLUDED
#define HEADER_MODERN_UUTID_ENCODINGS_H_INCLUDED

#include <modern-uutid/common.h>
#include <modern-uutid/bit_packer.h>

namespace muutid::impl {

    template<char_like C> struct uutid_char_traits {
        static constexpr C dash = C(u8'-');
        static constexpr C cl_br = C(u8'}');
        static constexpr C x = C(u8'x');
        static constexpr C c = C(u8'c');
        static constexpr C b = C(u8'b');
        static constexpr C u = C(u8'u');
        static constexpr C U = C(u8'U');
    };

    template<> struct uutid_char_traits<char> {
        static constexpr char dash = '-';
        static constexpr char cl_br = '}';
        static constexpr char x = 'x';
        static constexpr char c = 'c';
        static constexpr char b = 'b';
        static constexpr char u = 'u';
        static constexpr char U = 'U';
    };

    template<> struct uutid_char_traits<wchar_t> {
        static constexpr wchar_t dash = L'-';
        static constexpr wchar_t cl_br = L'}';
        static constexpr wchar_t x = L'x';
        static constexpr wchar_t c = L'c';
        static constexpr wchar_t b = L'b';
        static constexpr wchar_t u = L'u';
        static constexpr wchar_t U = L'U';
    };

    struct base16_alphabet_def {
        static constexpr char8_t chars[] = u8"0123456789abcdef" u8"0123456789ABCDEF";
        static constexpr size_t size = 16;
        static constexpr size_t upper_offset = 16;
    };

    struct base32_alphabet_def {
        static constexpr char8_t chars[] = u8"0123456789abcdefghjkmnpqrstvwxyz" u8"0123456789ABCDEFGHJKMNPQRSTVWXYZ";
        static constexpr size_t size = 32;
        static constexpr size_t upper_offset = 32;

        //Crockford decoding aliases
        static constexpr void add_aliases(std::array<uint8_t, 128> & reverse) noexcept {
            reverse[u8'i'] = 1;
            reverse[u8'I'] = 1;
            reverse[u8'l'] = 1;
            reverse[u8'L'] = 1;
            reverse[u8'o'] = 0;
            reverse[u8'O'] = 0;
        }
    };

    struct base64_alphabet_def {
        static constexpr char8_t chars[] = u8"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
        static constexpr size_t size = 64;
        static constexpr size_t upper_offset = 0;
    };

    template<class Def>
    consteval auto make_reverse_alphabet() {
        constexpr size_t count = std::size(Def::chars) - 1;

        std::array<uint8_t, 128> ret;
        for (size_t i = 0; i < std::size(ret); ++i) {
            auto idx = size_t(std::find(std::begin(Def::chars), std::begin(Def::chars) + count, char8_t(i)) - std::begin(Def::chars));
            ret[i] = uint8_t(idx != count ? idx % Def::size : Def::size);
        }
        if constexpr (requires { Def::add_aliases(ret); })
            Def::add_aliases(ret);
        return ret;
    }

    template<class Def>
    class alphabet {
    private:
        static constexpr auto reverse = make_reverse_alphabet<Def>();
    public:
        static constexpr size_t size = Def::size;

        template<char_like C>
        static constexpr C encode(uint8_t idx, bool uppercase) noexcept {
            return C(Def::chars[idx + (uppercase ? Def::upper_offset : 0)]);
        }

        /// Returns size for characters not in the alphabet
        template<char_like C>
        static constexpr uint8_t decode(C c) noexcept {
            if (unsigned(c) >= std::size(alphabet::reverse))
                return size;
            return alphabet::reverse[unsigned(c)];
        }
    };

    using base16_alphabet = alphabet<base16_alphabet_def>;
    using base32_alphabet = alphabet<base32_alphabet_def>;
    using base64_alphabet = alphabet<base64_alphabet_def>;

    
    struct base16_codec {
        static constexpr size_t char_length = 32;

        template<char_like T>
        static constexpr bool read_hex(const T * str, uint8_t & val) noexcept {
            uint8_t ret = 0;
            for (int i = 0; i < 2; ++i) {
                uint8_t nibble = base16_alphabet::decode(*str++);
                if (nibble >= base16_alphabet::size)
                    return false;
                ret = uint8_t((ret << 4) | nibble);
            }
            val = ret;
            return true;
        }

        template<char_like T>
        static constexpr void write_hex(uint8_t val, T * str, bool uppercase) noexcept {
            *str++ = base16_alphabet::encode<T>(uint8_t(val >> 4), uppercase);
            *str = base16_alphabet::encode<T>(uint8_t(val & 0x0F), uppercase);
        }

        template<char_like T>
        static constexpr bool read(const T * str, std::span<uint8_t, 16> dest) noexcept {
            for (uint8_t & b: dest) {
                if (!read_hex(str, b))
                    return false;
                str += 2;
            }
            return true;
        }

        template<char_like T>
        static constexpr void write(std::span<const uint8_t, 16> src, T * str, bool uppercase) noexcept {
            for (uint8_t b: src) {
                write_hex(b, str, uppercase);
                str += 2;
            }
        }
    };

    struct uuid_codec {
        static constexpr size_t char_length = 36;

        template<char_like T>
        static constexpr bool read(const T * str, std::span<uint8_t, 16> dest) noexcept {
            using tr = uutid_char_traits<T>;

            uint8_t * data = dest.data();
            for (int i = 0; i < 4; ++i, str += 2, ++data) {
                if (!base16_codec::read_hex(str, *data))
                    return false;
            }
            if (*str++ != tr::dash)
                return false;
            for (int i = 0; i < 3; ++i) {
                for (int j = 0; j < 2; ++j, str += 2, ++data) {
                    if (!base16_codec::read_hex(str, *data))
                        return false;
                }
                if (*str++ != tr::dash)
                    return false;
            }
            for (int i = 0; i < 6; ++i, str += 2, ++data) {
                if (!base16_codec::read_hex(str, *data))
                    return false;
            }
            return true;
        }

        template<char_like T>
        static constexpr void write(std::span<const uint8_t, 16> src, T * str, bool uppercase) noexcept {
            using tr = uutid_char_traits<T>;

            const uint8_t * data = src.data();
            for (int i = 0; i < 4; ++i, ++data, str += 2)
                base16_codec::write_hex(*data, str, uppercase);
            *str++ = tr::dash;
            for (int i = 0; i < 3; ++i) {
                for (int j = 0; j < 2; ++j, ++data, str += 2)
                    base16_codec::write_hex(*data, str, uppercase);
                *str++ = tr::dash;
            }
            for (int i = 0; i < 6; ++i, ++data, str += 2)
                base16_codec::write_hex(*data, str, uppercase);
        }
    };

    template<class Alphabet, size_t BitsPerChar>
    struct radix_codec {
        using packer = bit_packer<BitsPerChar, 16>;

        static constexpr size_t char_length = packer::unpacked_chars;

        template<char_like T>
        static constexpr bool read(const T * str, std::span<uint8_t, 16> dest) noexcept {
            std::array<uint8_t, char_length> groups;
            for (uint8_t & group: groups) {
                group = Alphabet::decode(*str++);
                if (group >= Alphabet::size)
                    return false;
            }
            return packer::pack_bits(groups, dest);
        }

        template<char_like T>
        static constexpr void write(std::span<const uint8_t, 16> src, T * str, bool uppercase) noexcept {
            std::array<uint8_t, char_length> groups;
            packer::unpack_bits(src, groups);
            for (uint8_t group: groups)
                *str++ = Alphabet::template encode<T>(group, uppercase);
        }
    };

    using base32_codec = radix_codec<base32_alphabet, 5>;
    using base64_codec = radix_codec<base64_alphabet, 6>;

    static_assert(base32_codec::char_length == 26);
    static_assert(base64_codec::char_length == 22);
}

#endif
