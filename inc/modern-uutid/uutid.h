// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_UUTID_UUTID_H_INCLUDED
#define HEADER_MODERN_UUTID_UUTID_H_INCLUDED

#include <modern-uutid/common.h>
#include <modern-uutid/encodings.h>

namespace muutid {

    namespace impl {
        constexpr int max_version = 9;
        constexpr int default_version = 4;

        inline void validate_version(int version) {
            if (version < 0 || version > max_version)
                MUUTID_THROW(invalid_uutid_version("uutid version must be between 0 and 9"));
        }
    }

    /**
     * Time based 128-bit identifier that prints like a UUID
     *
     * Layout (big endian):
     * - bytes 0-3: Unix seconds, truncated to 32 bits
     * - bytes 4-5: high 16 bits of (nanoseconds << 2)
     * - bytes 6-7: version in the top 4 bits, bits 4..15 of (nanoseconds << 2) in the low 12
     * - byte 8: `10` variant bits and 6 random bits
     * - bytes 9-15: random
     */
    class uutid {
    public:
        /// Textual encodings of uutid
        enum class encoding : uint8_t {
            base16,     ///< 32 hex digits
            base32,     ///< 26 characters of Crockford alphabet, no padding
            base64,     ///< 22 characters of URL-safe base64, no padding
            uuid        ///< 8-4-4-4-12 hex digits separated by dashes
        };

        /// Whether to print uutid in lower or upper case. Ignored for base64.
        enum format {
            lowercase,
            uppercase
        };

        using time_point_t = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

        /// Number of bytes in binary representation
        static constexpr size_t byte_length = 16;

        /// Number of characters in the given encoding
        static constexpr size_t char_length(encoding enc) noexcept {
            switch (enc) {
                case encoding::base16: return impl::base16_codec::char_length;
                case encoding::base32: return impl::base32_codec::char_length;
                case encoding::base64: return impl::base64_codec::char_length;
                case encoding::uuid:   return impl::uuid_codec::char_length;
            }
            return 0;
        }
    private:
        template<impl::char_like T>
        static constexpr bool read(const T * str, encoding enc, std::span<uint8_t, 16> dest) noexcept {
            switch (enc) {
                case encoding::base16: return impl::base16_codec::read(str, dest);
                case encoding::base32: return impl::base32_codec::read(str, dest);
                case encoding::base64: return impl::base64_codec::read(str, dest);
                case encoding::uuid:   return impl::uuid_codec::read(str, dest);
            }
            return false;
        }

        template<impl::char_like T>
        static constexpr void write(std::span<const uint8_t, 16> src, T * str, encoding enc, format fmt) noexcept {
            const bool upper = (fmt == uppercase);
            switch (enc) {
                case encoding::base16: impl::base16_codec::write(src, str, upper); break;
                case encoding::base32: impl::base32_codec::write(src, str, upper); break;
                case encoding::base64: impl::base64_codec::write(src, str, upper); break;
                case encoding::uuid:   impl::uuid_codec::write(src, str, upper); break;
            }
        }

        static auto parse(std::string_view src, encoding enc, const char * message) -> uutid {
            auto ret = uutid::from_chars(std::span{src.data(), src.size()}, enc);
            if (!ret)
                MUUTID_THROW(malformed_uutid(message));
            return *ret;
        }

    public:
        std::array<uint8_t, 16> bytes{};

    public:
        ///Constructs a Nil uutid
        constexpr uutid() noexcept = default;

        ///Constructs uutid from a UUID-formatted string literal
        template<impl::char_like T>
        consteval uutid(const T (&src)[impl::uuid_codec::char_length + 1]) noexcept {
            if (!impl::uuid_codec::read(src, this->bytes) || src[impl::uuid_codec::char_length] != 0)
                impl::invalid_constexpr_call("invalid uutid string");
        }

        ///Constructs uutid from a base16 string literal
        template<impl::char_like T>
        consteval uutid(const T (&src)[impl::base16_codec::char_length + 1]) noexcept {
            if (!impl::base16_codec::read(src, this->bytes) || src[impl::base16_codec::char_length] != 0)
                impl::invalid_constexpr_call("invalid uutid string");
        }

        /// Constructs uutid from a span of 16 byte-like objects
        template<impl::byte_like Byte>
        constexpr uutid(std::span<Byte, 16> src) noexcept {
            std::transform(src.begin(), src.end(), this->bytes.begin(), [](Byte b) {
                return static_cast<uint8_t>(b);
            });
        }

        /// Constructs uutid from anything convertible to a span of 16 byte-like objects
        template<class T>
        requires( !impl::is_span<T> && requires(const T & x) {
            std::span{x};
            requires impl::byte_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
            requires decltype(std::span{x})::extent == 16;
        })
        constexpr uutid(const T & src) noexcept:
            uutid{std::span{src}}
        {}

        /**
         * Generates a uutid for the current time
         *
         * Uses the version set via set_version() and the random source set via set_random_source().
         *
         * @returns Nil uutid if the random source is exhausted
         */
        MUUTID_EXPORTED static auto generate() -> uutid;

        /**
         * Generates a uutid for a given time
         *
         * Seconds outside of uint32_t range wrap around. Nanoseconds lose their lowest 2 bits.
         *
         * @returns Nil uutid if the random source is exhausted
         */
        MUUTID_EXPORTED static auto generate(time_point_t when) -> uutid;

        /// Returns a Max uutid
        static constexpr uutid max() noexcept
            { return uutid("ffffffff-ffff-ffff-ffff-ffffffffffff"); }

        /// Resets the object to a Nil uutid
        constexpr void clear() noexcept {
            *this = uutid();
        }

        /// Whether this is a Nil uutid
        constexpr bool is_nil() const noexcept {
            return *this == uutid();
        }

        /// Version tag stored at generation time
        constexpr unsigned version() const noexcept {
            return this->bytes[6] >> 4;
        }

        /// Whether the top two bits of byte 8 are `10`
        constexpr bool has_standard_variant() const noexcept {
            return (this->bytes[8] & 0xC0) == 0x80;
        }

        /// Returns the time embedded in uutid. Nil uutid returns Unix epoch.
        constexpr auto time() const noexcept -> time_point_t {
            uint32_t seconds;
            uint16_t ns_high, ns_low;
            auto ptr = this->bytes.data();
            ptr = impl::read_bytes(ptr, seconds);
            ptr = impl::read_bytes(ptr, ns_high);
            impl::read_bytes(ptr, ns_low);

            ns_low &= 0x0FFF;
            uint32_t nsec = ((uint32_t(ns_high) << 16) | (uint32_t(ns_low) << 4)) >> 2;

            return time_point_t(std::chrono::seconds(seconds) + std::chrono::nanoseconds(nsec));
        }

        constexpr friend auto operator==(const uutid & lhs, const uutid & rhs) noexcept -> bool = default;
        constexpr friend auto operator<=>(const uutid & lhs, const uutid & rhs) noexcept -> std::strong_ordering = default;

        /// Returns uutid from a span of byte-like objects or Nil uutid if the span size is not 16
        template<impl::byte_like Byte, size_t Extent>
        static constexpr auto from_bytes(std::span<Byte, Extent> src) noexcept -> uutid {
            if constexpr (Extent != std::dynamic_extent && Extent != uutid::byte_length) {
                return uutid();
            } else {
                if (src.size() != uutid::byte_length)
                    return uutid();
                return uutid(src.template first<uutid::byte_length>());
            }
        }

        /// Returns uutid from anything convertible to a span of byte-like objects or Nil uutid if the size is not 16
        template<class T>
        requires( !impl::is_span<T> && requires(const T & x) {
            std::span{x};
            requires impl::byte_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
        })
        static constexpr auto from_bytes(const T & src) noexcept -> uutid
            { return uutid::from_bytes(std::span{src}); }

        /// Parses uutid in a given encoding from a span of characters. The span must have the exact length.
        template<impl::char_like T, size_t Extent>
        static constexpr auto from_chars(std::span<const T, Extent> src, encoding enc) noexcept -> std::optional<uutid> {
            if (src.size() != uutid::char_length(enc))
                return std::nullopt;
            uutid ret;
            if (!uutid::read(src.data(), enc, ret.bytes))
                return std::nullopt;
            return ret;
        }

        /**
         * Parses uutid from a span of characters detecting the encoding from its length
         *
         * 22 is base64, 32 is base16, 36 is UUID and 16 is raw bytes (each character is one byte)
         */
        template<impl::char_like T, size_t Extent>
        static constexpr auto from_chars(std::span<const T, Extent> src) noexcept -> std::optional<uutid> {
            switch (src.size()) {
                case uutid::byte_length: {
                    uutid ret;
                    std::transform(src.begin(), src.end(), ret.bytes.begin(), [](T c) {
                        return uint8_t(c);
                    });
                    return ret;
                }
                case impl::base64_codec::char_length: return uutid::from_chars(src, encoding::base64);
                case impl::base16_codec::char_length: return uutid::from_chars(src, encoding::base16);
                case impl::uuid_codec::char_length:   return uutid::from_chars(src, encoding::uuid);
            }
            return std::nullopt;
        }

        /// Parses uutid in a given encoding from anything convertible to a span of characters
        template<class T>
        requires( !impl::is_span<T> && requires(T & x) {
            std::span{x};
            requires impl::char_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
        })
        static constexpr auto from_chars(const T & src, encoding enc) noexcept -> std::optional<uutid>
            { return uutid::from_chars(uutid::without_terminator(src), enc); }

        /// Parses uutid from anything convertible to a span of characters detecting the encoding
        template<class T>
        requires( !impl::is_span<T> && requires(T & x) {
            std::span{x};
            requires impl::char_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
        })
        static constexpr auto from_chars(const T & src) noexcept -> std::optional<uutid>
            { return uutid::from_chars(uutid::without_terminator(src)); }

        /// Parses base16 string. Throws malformed_uutid on failure.
        static auto from_base16(std::string_view src) -> uutid
            { return uutid::parse(src, encoding::base16, "invalid base16 uutid string"); }

        /// Parses base32 (Crockford) string. Throws malformed_uutid on failure.
        static auto from_base32(std::string_view src) -> uutid
            { return uutid::parse(src, encoding::base32, "invalid base32 uutid string"); }

        /// Parses URL-safe base64 string. Throws malformed_uutid on failure.
        static auto from_base64(std::string_view src) -> uutid
            { return uutid::parse(src, encoding::base64, "invalid base64 uutid string"); }

        /**
         * Parses UUID formatted string.
         *
         * 32 character input is parsed as base16. Throws malformed_uutid on failure.
         */
        static auto from_uuid(std::string_view src) -> uutid {
            if (src.size() == impl::base16_codec::char_length)
                return uutid::from_base16(src);
            return uutid::parse(src, encoding::uuid, "invalid uuid string");
        }

        /**
         * Parses uutid detecting the encoding from the input length
         *
         * 22 is base64, 32 is base16, 36 is UUID and 16 is raw bytes.
         * Throws unrecognized_uutid_format for other lengths and malformed_uutid
         * if the input is not valid for the detected encoding.
         */
        static auto from_string(std::string_view src) -> uutid {
            switch (src.size()) {
                case uutid::byte_length:              return uutid::from_bytes(std::span{src.data(), src.size()});
                case impl::base64_codec::char_length: return uutid::from_base64(src);
                case impl::base16_codec::char_length: return uutid::from_base16(src);
                case impl::uuid_codec::char_length:   return uutid::from_uuid(src);
            }
            MUUTID_THROW(unrecognized_uutid_format("unrecognized uutid string format"));
        }

        /**
         * Formats uutid into a span of characters
         *
         * @returns false if dest is shorter than char_length(enc)
         */
        template<impl::char_like T, size_t Extent>
        [[nodiscard]]
        constexpr bool to_chars(std::span<T, Extent> dest, encoding enc = encoding::base16, format fmt = lowercase) const noexcept {
            if (dest.size() < uutid::char_length(enc))
                return false;
            uutid::write(this->bytes, dest.data(), enc, fmt);
            return true;
        }

        /// Formats uutid into anything convertible to a span of characters
        template<class T>
        requires( !impl::is_span<T> && requires(T & x) {
            std::span{x};
            requires impl::char_like<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
            requires !std::is_const_v<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
        })
        [[nodiscard]]
        constexpr bool to_chars(T & dest, encoding enc = encoding::base16, format fmt = lowercase) const noexcept {
            return this->to_chars(std::span{dest}, enc, fmt);
        }

        template<impl::char_like T = char>
    #if __cpp_lib_constexpr_string >= 201907L
        constexpr
    #endif
        /// Returns a string with formatted uutid. Base16 by default.
        auto to_string(encoding enc = encoding::base16, format fmt = lowercase) const -> std::basic_string<T>
        {
            std::basic_string<T> ret(uutid::char_length(enc), T(0));
            (void)to_chars(ret, enc, fmt);
            return ret;
        }

        /// Returns a copy of the raw bytes
        constexpr auto to_bytes() const noexcept -> std::array<uint8_t, 16>
            { return this->bytes; }

        auto to_base16(format fmt = lowercase) const -> std::string
            { return this->to_string(encoding::base16, fmt); }

        auto to_base32(format fmt = lowercase) const -> std::string
            { return this->to_string(encoding::base32, fmt); }

        auto to_base64() const -> std::string
            { return this->to_string(encoding::base64); }

        auto to_uuid(format fmt = lowercase) const -> std::string
            { return this->to_string(encoding::uuid, fmt); }

        /// Prints uutid into an ostream as base16
        template<impl::char_like T>
        friend std::basic_ostream<T> & operator<<(std::basic_ostream<T> & str, const uutid val) {
            const auto flags = str.flags();
            const uutid::format fmt = (flags & std::ios_base::uppercase ? uutid::uppercase : uutid::lowercase);
            std::array<T, impl::base16_codec::char_length> buf;
            (void)val.to_chars(buf, encoding::base16, fmt);
            std::copy(buf.begin(), buf.end(), std::ostreambuf_iterator<T>(str));
            return str;
        }

        /// Reads base16 uutid from an istream
        template<impl::char_like T>
        friend std::basic_istream<T> & operator>>(std::basic_istream<T> & str, uutid & val) {
            std::array<T, impl::base16_codec::char_length> buf;
            auto * strbuf = str.rdbuf();
            for(T & c: buf) {
                auto res = strbuf->sbumpc();
                if (res == std::char_traits<T>::eof()) {
                    str.setstate(std::ios_base::eofbit | std::ios_base::failbit);
                    return str;
                }
                c = T(res);
            }
            if (auto maybe_val = uutid::from_chars(buf, encoding::base16))
                val = *maybe_val;
            else
                str.setstate(std::ios_base::failbit);
            return str;
        }

        /// Returns hash code for the uutid
        friend constexpr size_t hash_value(const uutid & val) noexcept {
            static_assert(sizeof(uutid) > sizeof(size_t) && sizeof(uutid) % sizeof(size_t) == 0);
            size_t temp;
            const uint8_t * data = val.bytes.data();
            size_t ret = 0;
            for(unsigned i = 0; i < sizeof(uutid) / sizeof(size_t); ++i) {
                memcpy(&temp, data, sizeof(size_t));
                ret = impl::hash_combine(ret, temp);
                data += sizeof(size_t);
            }
            return ret;
        }

    private:
        static constexpr bool is_literal_extent(size_t extent) noexcept {
            return extent == uutid::byte_length + 1 ||
                   extent == impl::base16_codec::char_length + 1 ||
                   extent == impl::base32_codec::char_length + 1 ||
                   extent == impl::base64_codec::char_length + 1 ||
                   extent == impl::uuid_codec::char_length + 1;
        }

        //string literals carry their terminating 0, raw character buffers do not
        template<class T>
        static constexpr auto without_terminator(const T & src) noexcept {
            std::span str{src};
            if constexpr (std::is_array_v<T>) {
                auto size = str.size();
                if (uutid::is_literal_extent(size) && str[size - 1] == 0)
                    --size;
                return str.first(size);
            } else {
                return str;
            }
        }
    };

    static_assert(sizeof(uutid) == 16);

    namespace impl {
        template<class Derived, class CharT>
        struct uutid_formatter_base {
            uutid::encoding enc = uutid::encoding::base16;
            uutid::format fmt = uutid::lowercase;

            template<class ParseContext>
            constexpr auto parse(ParseContext & ctx) -> typename ParseContext::iterator {
                using tr = uutid_char_traits<CharT>;

                auto it = ctx.begin();
                while(it != ctx.end()) {
                    if (*it == tr::x) {
                        this->enc = uutid::encoding::base16; ++it;
                    } else if (*it == tr::c) {
                        this->enc = uutid::encoding::base32; ++it;
                    } else if (*it == tr::b) {
                        this->enc = uutid::encoding::base64; ++it;
                    } else if (*it == tr::u) {
                        this->enc = uutid::encoding::uuid; ++it;
                    } else if (*it == tr::U) {
                        this->fmt = uutid::uppercase; ++it;
                    } else if (*it == tr::cl_br) {
                        break;
                    } else {
                        static_cast<Derived *>(this)->raise_exception("Invalid format args");
                    }
                }
                return it;
            }

            template <typename FormatContext>
            auto format(uutid val, FormatContext & ctx) const -> decltype(ctx.out())  {
                std::array<CharT, impl::uuid_codec::char_length> buf;
                (void)val.to_chars(buf, this->enc, this->fmt);
                return std::copy(buf.begin(), buf.begin() + uutid::char_length(this->enc), ctx.out());
            }
        };
    }
}

/// std::hash specialization for uutid
template<>
struct std::hash<muutid::uutid> {

    constexpr size_t operator()(const muutid::uutid & val) const noexcept {
        return hash_value(val);
    }
};


#if MUUTID_SUPPORTS_STD_FORMAT

/// uutid formatter for std::format
template<class CharT>
struct std::formatter<::muutid::uutid, CharT> :
    public ::muutid::impl::uutid_formatter_base<std::formatter<::muutid::uutid, CharT>, CharT>
{
    [[noreturn]] void raise_exception(const char * message) {
        MUUTID_THROW(std::format_error(message));
    }
};

#endif

#if MUUTID_SUPPORTS_FMT_FORMAT

/// uutid formatter for fmt::format
template<class CharT>
struct fmt::formatter<::muutid::uutid, CharT> :
    public ::muutid::impl::uutid_formatter_base<fmt::formatter<::muutid::uutid, CharT>, CharT>
{
    void raise_exception(const char * message) {
        FMT_THROW(fmt::format_error(message));
    }
};

#endif


namespace muutid {

    /**
     * Source of random bytes for uutid generation
     *
     * Implementations used from multiple threads must be thread safe.
     */
    class random_source {
    public:
        /**
         * Fill dest with random bytes
         *
         * Short reads are allowed. The caller keeps reading until its buffer is full.
         *
         * @returns number of bytes written. 0 means the source is exhausted.
         */
        virtual auto read(std::span<uint8_t> dest) -> size_t = 0;
    protected:
        random_source() noexcept = default;
        ~random_source() noexcept = default;
        random_source(const random_source &) noexcept = default;
        random_source & operator=(const random_source &) noexcept = default;
    };

    /**
     * Returns the built-in random source
     *
     * It is a per-thread ChaCha20 generator, reseeded after fork(). It never runs out.
     */
    MUUTID_EXPORTED auto default_random_source() -> random_source &;

    /**
     * Set the random source for uutid::generate()
     *
     * Pass `nullptr` to restore the default. The source is not owned and must stay
     * alive while it is set.
     *
     * This call affects all subsequent calls to uutid::generate(). It is meant to be called
     * once at startup, before the library is used concurrently.
     */
    MUUTID_EXPORTED void set_random_source(random_source * source);

    /**
     * Set the version tag for uutid::generate()
     *
     * Throws invalid_uutid_version if version is outside [0, 9]. The default is 4.
     *
     * This call affects all subsequent calls to uutid::generate(). It is meant to be called
     * once at startup, before the library is used concurrently.
     */
    MUUTID_EXPORTED void set_version(int version);

    /// Returns the version tag used by uutid::generate()
    MUUTID_EXPORTED auto get_version() noexcept -> int;


    /**
     * Generates uutids with its own version and random source
     *
     * Unlike uutid::generate() it never looks at the process-wide settings
     */
    class uutid_generator {
    public:
        static constexpr int default_version = impl::default_version;

        /**
         * Throws invalid_uutid_version if version is outside [0, 9].
         * `nullptr` source means default_random_source(). The source is not owned.
         */
        explicit uutid_generator(int version = default_version, random_source * source = nullptr):
            m_version(version),
            m_source(source) {
            impl::validate_version(version);
        }

        int version() const noexcept
            { return m_version; }

        random_source & source() const
            { return m_source ? *m_source : default_random_source(); }

        /// Generates a uutid for the current time. Nil uutid if the random source is exhausted.
        MUUTID_EXPORTED auto generate() const -> uutid;
        /// Generates a uutid for a given time. Nil uutid if the random source is exhausted.
        MUUTID_EXPORTED auto generate(uutid::time_point_t when) const -> uutid;

    private:
        int m_version;
        random_source * m_source;
    };
}

#endif
