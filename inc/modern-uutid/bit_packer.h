// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_UUTID_BIT_PACKER_H_INCLUDED
#define HEADER_MODERN_UUTID_BIT_PACKER_H_INCLUDED

#include <modern-uutid/common.h>


namespace muutid::impl {

    /**
     * Splits bytes into BitsPerChar-wide groups and back, most significant bit first.
     * 
     * This is the RFC 4648 bit order: the last group is padded with zero bits
     * on the right when PackedBytes * 8 is not a multiple of BitsPerChar.
     */
    template<size_t BitsPerChar, size_t PackedBytes>
    requires(BitsPerChar > 0 && BitsPerChar < 8 && PackedBytes > 0)
    class bit_packer {
    public:
        static constexpr size_t bits_per_char = BitsPerChar;
        static constexpr size_t packed_bytes = PackedBytes;
        static constexpr size_t total_bits = PackedBytes * 8;
        static constexpr size_t unpacked_chars = (bit_packer::total_bits / BitsPerChar) + 
                                                 (bit_packer::total_bits % BitsPerChar != 0);
        static constexpr size_t padding_bits = bit_packer::unpacked_chars * BitsPerChar - bit_packer::total_bits;

    private:
        static constexpr uint32_t char_mask = (uint32_t(1) << BitsPerChar) - 1;

    public:
        bit_packer() = delete;

        /**
         * Packs groups in src into bytes in dst
         * 
         * Only the low BitsPerChar bits of each group are used.
         * 
         * @returns false if the padding bits of the last group are not zero. 
         * dst is fully written in either case.
         */
        static constexpr bool pack_bits(std::span<const uint8_t, bit_packer::unpacked_chars> src, 
                                        std::span<uint8_t, bit_packer::packed_bytes> dst) noexcept {
            uint32_t acc = 0;
            size_t acc_bits = 0;
            uint8_t * out = dst.data();
            for (uint8_t c: src) {
                acc = (acc << BitsPerChar) | (c & bit_packer::char_mask);
                acc_bits += BitsPerChar;
                if (acc_bits >= 8) {
                    acc_bits -= 8;
                    *out++ = uint8_t(acc >> acc_bits);
                    acc &= (uint32_t(1) << acc_bits) - 1;
                }
            }
            return acc == 0;
        }

        /// Unpacks bytes in src into groups in dst
        static constexpr void unpack_bits(std::span<const uint8_t, bit_packer::packed_bytes> src, 
                                          std::span<uint8_t, bit_packer::unpacked_chars> dst) noexcept {
            uint32_t acc = 0;
            size_t acc_bits = 0;
            uint8_t * out = dst.data();
            for (uint8_t b: src) {
                acc = (acc << 8) | b;
                acc_bits += 8;
                while (acc_bits >= BitsPerChar) {
                    acc_bits -= BitsPerChar;
                    *out++ = uint8_t((acc >> acc_bits) & bit_packer::char_mask);
                }
                acc &= (uint32_t(1) << acc_bits) - 1;
            }
            if constexpr (bit_packer::padding_bits != 0)
                *out = uint8_t((acc << bit_packer::padding_bits) & bit_packer::char_mask);
        }
    };
}

#endif 
