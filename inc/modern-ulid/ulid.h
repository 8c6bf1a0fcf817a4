// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_ULID_H_INCLUDED
#define HEADER_MODERN_ULID_ULID_H_INCLUDED

#include <modern-ulid/base32.h>

namespace mulid {

    class entropy_source;

    class ulid {
    public:
        /// Whether to print ulid in lower or upper case
        enum format {
            lowercase,
            uppercase
        };

        /// Number of bytes in binary representation of ULID
        static constexpr size_t byte_length = impl::base32::binary_size;
        /// Number of characters in string representation of ULID
        static constexpr size_t char_length = impl::base32::text_size;
        /// Number of bytes of entropy
        static constexpr size_t entropy_length = 10;
        /// Number of characters in JSON representation of ULID (a quoted string)
        static constexpr size_t json_length = ulid::char_length + 2;
        /// Maximum Unix time in milliseconds that can be stored in a ULID
        static constexpr uint64_t max_time = std::numeric_limits<uint64_t>::max() >> 16;

        using time_point_t = std::chrono::sys_time<std::chrono::milliseconds>;

    private:
        static constexpr size_t time_length = ulid::byte_length - ulid::entropy_length;

        template<impl::char_like T>
        static constexpr auto read(std::basic_string_view<T> src, ulid & dest, bool strict) noexcept -> errc {
            if (src.size() != ulid::char_length)
                return errc::data_size;
            return impl::base32::decode(src.data(), dest.bytes, strict);
        }

        template<impl::char_like T>
        static constexpr void write(std::span<const uint8_t, 16> src, T * str, format fmt) noexcept {
            impl::base32::encode(src, str, fmt == ulid::uppercase);
        }
    public:
        std::array<uint8_t, 16> bytes{};

    public:
        ///Constructs a zeroed out ULID
        constexpr ulid() noexcept = default;

        ///Constructs ulid from a string literal
        template<impl::char_like T>
        consteval ulid(const T (&src)[ulid::char_length + 1]) noexcept {
            if (src[ulid::char_length] != 0 ||
                ulid::read(std::basic_string_view<T>(src, ulid::char_length), *this, true) != errc{})
                impl::invalid_constexpr_call("invalid ulid string");
        }

        /// Constructs ulid from a span of 16 byte-like objects
        template<impl::byte_like Byte>
        constexpr ulid(std::span<Byte, 16> src) noexcept {
            std::transform(src.begin(), src.end(), this->bytes.begin(), [](Byte b) {
                return static_cast<uint8_t>(b);
            });
        }

        /// Constructs ulid from anything convertible to a span of 16 byte-like objects
        template<class T>
        requires( !impl::is_span<T> && requires(const T & x) {
            std::span{x};
            requires impl::byte_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
            requires decltype(std::span{x})::extent == 16;
        })
        constexpr ulid(const T & src) noexcept:
            ulid{std::span{src}}
        {}

        /**
         * Creates a ULID from a Unix time in milliseconds and an entropy source
         *
         * Reads exactly 10 bytes from the entropy source. On failure `ec` is set to
         * errc::time_too_large if `ms` exceeds max_time or to the error reported by
         * the source, and a Nil ULID is returned.
         *
         * Safety for concurrent use depends only on the entropy source.
         */
        MULID_EXPORTED static auto make(uint64_t ms, entropy_source & entropy, std::error_code & ec) -> ulid;

        /// Same as above but throws std::system_error on failure
        MULID_EXPORTED static auto make(uint64_t ms, entropy_source & entropy) -> ulid;

        /**
         * Generates a ULID for the current time using the system entropy source
         *
         * Failure of the system entropy source is considered fatal and is reported via
         * std::system_error (or abort() if exceptions are disabled).
         */
        MULID_EXPORTED static auto generate() -> ulid;

        /// Generates a ULID for a given time using the system entropy source
        MULID_EXPORTED static auto generate(std::chrono::system_clock::time_point when) -> ulid;

        /// Returns a Nil ULID
        static constexpr ulid nil() noexcept
            { return ulid(); }

        /// Returns a Max ULID
        static constexpr ulid max() noexcept
            { return ulid("7ZZZZZZZZZZZZZZZZZZZZZZZZZ"); }

        /// Resets the object to a Nil ULID
        constexpr void clear() noexcept {
            *this = ulid();
        }

        constexpr friend auto operator==(const ulid & lhs, const ulid & rhs) noexcept -> bool = default;
        constexpr friend auto operator<=>(const ulid & lhs, const ulid & rhs) noexcept -> std::strong_ordering = default;

        /**
         * Compares two ULIDs byte by byte, most significant byte first
         *
         * @returns -1 if this < other, 0 if they are equal and 1 if this > other
         */
        constexpr auto compare(const ulid & other) const noexcept -> int {
            for (size_t i = 0; i < ulid::byte_length; ++i) {
                if (this->bytes[i] < other.bytes[i])
                    return -1;
                if (this->bytes[i] > other.bytes[i])
                    return 1;
            }
            return 0;
        }

        constexpr auto less(const ulid & other) const noexcept -> bool
            { return this->compare(other) < 0; }
        constexpr auto greater(const ulid & other) const noexcept -> bool
            { return this->compare(other) > 0; }
        constexpr auto equal(const ulid & other) const noexcept -> bool
            { return *this == other; }

        /// Whether all bytes are zero
        constexpr auto is_zero() const noexcept -> bool
            { return *this == ulid(); }
        /// Same as is_zero()
        constexpr auto is_nil() const noexcept -> bool
            { return this->is_zero(); }

        /// Number of leading zero bits, 128 for Nil ULID
        constexpr auto leading_zeros() const noexcept -> unsigned {
            for (size_t i = 0; i < ulid::byte_length; ++i) {
                if (auto b = this->bytes[i]; b != 0)
                    return unsigned(i * 8 + std::countl_zero(b));
            }
            return 128;
        }

        /// Number of trailing zero bits, 128 for Nil ULID
        constexpr auto trailing_zeros() const noexcept -> unsigned {
            for (size_t i = ulid::byte_length; i != 0; --i) {
                if (auto b = this->bytes[i - 1]; b != 0)
                    return unsigned((ulid::byte_length - i) * 8 + std::countr_zero(b));
            }
            return 128;
        }

        /// Unix time in milliseconds stored in the ULID
        constexpr auto time() const noexcept -> uint64_t {
            uint64_t val;
            impl::read_bytes(this->bytes.data(), val);
            return val >> 16;
        }

        /// Time stored in the ULID as a time point
        constexpr auto time_point() const noexcept -> time_point_t {
            return time_point_t(std::chrono::milliseconds(this->time()));
        }

        /**
         * Sets the time stored in the ULID
         *
         * @returns errc::time_too_large if `ms` exceeds max_time. The object is not modified in this case.
         */
        [[nodiscard]]
        constexpr auto set_time(uint64_t ms) noexcept -> errc {
            if (ms > ulid::max_time)
                return errc::time_too_large;
            auto data = this->bytes.data();
            data = impl::write_bytes(uint32_t(ms >> 16), data);
            impl::write_bytes(uint16_t(ms), data);
            return errc{};
        }

        /// Returns a copy of the entropy bytes
        constexpr auto entropy() const noexcept -> std::array<uint8_t, ulid::entropy_length> {
            std::array<uint8_t, ulid::entropy_length> ret;
            std::copy(this->bytes.begin() + ulid::time_length, this->bytes.end(), ret.begin());
            return ret;
        }

        /**
         * Sets the entropy bytes
         *
         * @returns errc::data_size if the source size is not entropy_length. The object is not modified in this case.
         */
        template<impl::byte_like Byte, size_t Extent>
        [[nodiscard]]
        constexpr auto set_entropy(std::span<Byte, Extent> src) noexcept -> errc {
            if constexpr (Extent != std::dynamic_extent)
                static_assert(Extent == ulid::entropy_length, "entropy must be 10 bytes long");

            if (src.size() != ulid::entropy_length)
                return errc::data_size;
            std::transform(src.begin(), src.end(), this->bytes.begin() + ulid::time_length, [](Byte b) {
                return static_cast<uint8_t>(b);
            });
            return errc{};
        }

        /// Sets the entropy bytes from anything convertible to a span of byte-like objects
        template<class T>
        requires( !impl::is_span<T> && requires(const T & x) {
            std::span{x};
            requires impl::byte_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
        })
        [[nodiscard]]
        constexpr auto set_entropy(const T & src) noexcept -> errc {
            return this->set_entropy(std::span{src});
        }

        /// Returns the binary representation
        constexpr auto marshal_binary() const noexcept -> std::array<uint8_t, 16>
            { return this->bytes; }

        /**
         * Writes the binary representation into a buffer
         *
         * @returns errc::buffer_size if the destination is not exactly byte_length long
         */
        template<impl::byte_like Byte, size_t Extent>
        requires(!std::is_const_v<Byte>)
        [[nodiscard]]
        constexpr auto marshal_binary_to(std::span<Byte, Extent> dest) const noexcept -> errc {
            if (dest.size() != ulid::byte_length)
                return errc::buffer_size;
            std::transform(this->bytes.begin(), this->bytes.end(), dest.begin(), [](uint8_t b) {
                return Byte(b);
            });
            return errc{};
        }

        /// Writes the binary representation into anything convertible to a span of byte-like objects
        template<class T>
        requires( !impl::is_span<T> && requires(T & x) {
            std::span{x};
            requires impl::byte_like<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
            requires !std::is_const_v<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
        })
        [[nodiscard]]
        constexpr auto marshal_binary_to(T & dest) const noexcept -> errc {
            return this->marshal_binary_to(std::span{dest});
        }

        /**
         * Reads binary representation
         *
         * @returns errc::data_size if the source is not exactly byte_length long. The object is
         * not modified in this case.
         */
        template<impl::byte_like Byte, size_t Extent>
        [[nodiscard]]
        constexpr auto unmarshal_binary(std::span<Byte, Extent> src) noexcept -> errc {
            if (src.size() != ulid::byte_length)
                return errc::data_size;
            std::transform(src.begin(), src.end(), this->bytes.begin(), [](Byte b) {
                return static_cast<uint8_t>(b);
            });
            return errc{};
        }

        /// Reads binary representation from anything convertible to a span of byte-like objects
        template<class T>
        requires( !impl::is_span<T> && requires(const T & x) {
            std::span{x};
            requires impl::byte_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
        })
        [[nodiscard]]
        constexpr auto unmarshal_binary(const T & src) noexcept -> errc {
            return this->unmarshal_binary(std::span{src});
        }


        /**
         * Parses ulid from its textual form
         *
         * Only validates the timestamp part of the input. Invalid characters in the entropy part
         * produce an unspecified ULID. Use parse_strict() if you need full validation.
         *
         * @returns errc::data_size if the input is not exactly char_length long,
         * errc::invalid_characters if the timestamp part contains invalid characters and
         * errc::overflow if the value does not fit in 128 bits. `dest` is not modified on failure.
         */
        template<impl::string_like S>
        [[nodiscard]]
        static constexpr auto parse(const S & src, ulid & dest) noexcept -> errc {
            return ulid::read(impl::to_string_view(src), dest, false);
        }

        /**
         * Parses ulid from its textual form validating every character
         *
         * Same as parse() but also returns errc::invalid_characters if any character of the
         * entropy part is invalid.
         */
        template<impl::string_like S>
        [[nodiscard]]
        static constexpr auto parse_strict(const S & src, ulid & dest) noexcept -> errc {
            return ulid::read(impl::to_string_view(src), dest, true);
        }

        /// Parses ulid from its textual form, returns nullopt on any error
        template<impl::string_like S>
        static constexpr auto from_chars(const S & src) noexcept -> std::optional<ulid> {
            ulid ret;
            if (ulid::read(impl::to_string_view(src), ret, true) != errc{})
                return std::nullopt;
            return ret;
        }

        /// Same as parse() but into this object
        template<impl::string_like S>
        [[nodiscard]]
        constexpr auto unmarshal_text(const S & src) noexcept -> errc {
            return ulid::read(impl::to_string_view(src), *this, false);
        }


        /// Formats ulid into a span of characters
        template<impl::char_like T, size_t Extent>
        [[nodiscard]]
        constexpr auto to_chars(std::span<T, Extent> dest, format fmt = ulid::uppercase) const noexcept ->
            std::conditional_t<Extent == std::dynamic_extent, bool, void> {

            if constexpr (Extent == std::dynamic_extent) {
                if (dest.size() < ulid::char_length)
                    return false;
            } else {
                static_assert(Extent >= ulid::char_length, "destination is too small");
            }

            ulid::write(this->bytes, dest.data(), fmt);

            if constexpr (Extent == std::dynamic_extent)
                return true;
        }

        /// Formats ulid into anything convertible to a span of characters
        template<class T>
        requires( !impl::is_span<T> && requires(T & x) {
            std::span{x};
            requires impl::char_like<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
            requires !std::is_const_v<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
        })
        [[nodiscard]]
        constexpr auto to_chars(T & dest, format fmt = ulid::uppercase) const noexcept {
            return this->to_chars(std::span{dest}, fmt);
        }

        /// Returns a character array with formatted ulid
        template<impl::char_like T = char>
        constexpr auto to_chars(format fmt = ulid::uppercase) const noexcept -> std::array<T, ulid::char_length> {
            std::array<T, ulid::char_length> ret;
            this->to_chars(ret, fmt);
            return ret;
        }

        /**
         * Writes the textual form into a buffer
         *
         * Unlike to_chars() the destination must be exactly char_length long.
         *
         * @returns errc::buffer_size if the destination has a wrong size
         */
        template<impl::char_like T, size_t Extent>
        [[nodiscard]]
        constexpr auto marshal_text_to(std::span<T, Extent> dest, format fmt = ulid::uppercase) const noexcept -> errc {
            if (dest.size() != ulid::char_length)
                return errc::buffer_size;
            ulid::write(this->bytes, dest.data(), fmt);
            return errc{};
        }

        template<class T>
        requires( !impl::is_span<T> && requires(T & x) {
            std::span{x};
            requires impl::char_like<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
            requires !std::is_const_v<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
        })
        [[nodiscard]]
        constexpr auto marshal_text_to(T & dest, format fmt = ulid::uppercase) const noexcept -> errc {
            return this->marshal_text_to(std::span{dest}, fmt);
        }


        template<impl::char_like T = char>
    #if __cpp_lib_constexpr_string >= 201907L
        constexpr
    #endif
        /// Returns a string with formatted ulid
        auto to_string(format fmt = ulid::uppercase) const -> std::basic_string<T>
        {
            std::basic_string<T> ret(ulid::char_length, T(0));
            (void)to_chars(ret, fmt);
            return ret;
        }

        /**
         * Writes the JSON form (textual form in double quotes) into a buffer
         *
         * @returns errc::buffer_size if the destination is not exactly json_length long
         */
        template<impl::char_like T, size_t Extent>
        [[nodiscard]]
        constexpr auto marshal_json_to(std::span<T, Extent> dest, format fmt = ulid::uppercase) const noexcept -> errc {
            using tr = impl::ulid_char_traits<T>;

            if (dest.size() != ulid::json_length)
                return errc::buffer_size;
            dest[0] = tr::quote;
            ulid::write(this->bytes, dest.data() + 1, fmt);
            dest[ulid::json_length - 1] = tr::quote;
            return errc{};
        }

        template<class T>
        requires( !impl::is_span<T> && requires(T & x) {
            std::span{x};
            requires impl::char_like<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
            requires !std::is_const_v<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
        })
        [[nodiscard]]
        constexpr auto marshal_json_to(T & dest, format fmt = ulid::uppercase) const noexcept -> errc {
            return this->marshal_json_to(std::span{dest}, fmt);
        }

        /// Returns the JSON form (textual form in double quotes)
        auto marshal_json(format fmt = ulid::uppercase) const -> std::string {
            std::string ret(ulid::json_length, '\0');
            (void)this->marshal_json_to(ret, fmt);
            return ret;
        }

        /**
         * Reads the JSON form (textual form in double quotes)
         *
         * @returns errc::data_size if the source is not exactly json_length long or is not
         * enclosed in double quotes. Otherwise the same as unmarshal_text().
         */
        template<impl::string_like S>
        [[nodiscard]]
        constexpr auto unmarshal_json(const S & src) noexcept -> errc {
            auto view = impl::to_string_view(src);
            using tr = impl::ulid_char_traits<typename decltype(view)::value_type>;

            if (view.size() != ulid::json_length || view.front() != tr::quote || view.back() != tr::quote)
                return errc::data_size;
            return ulid::read(view.substr(1, ulid::char_length), *this, false);
        }

        /// Prints ulid into an ostream. Lowercase unless std::uppercase is set on the stream.
        template<impl::char_like T>
        friend std::basic_ostream<T> & operator<<(std::basic_ostream<T> & str, const ulid val) {
            const auto flags = str.flags();
            const ulid::format fmt = (flags & std::ios_base::uppercase ? ulid::uppercase : ulid::lowercase);
            std::array<T, ulid::char_length> buf;
            val.to_chars(buf, fmt);
            std::copy(buf.begin(), buf.end(), std::ostreambuf_iterator<T>(str));
            return str;
        }

        /// Reads ulid from an istream
        template<impl::char_like T>
        friend std::basic_istream<T> & operator>>(std::basic_istream<T> & str, ulid & val) {
            std::array<T, ulid::char_length> buf;
            auto * strbuf = str.rdbuf();
            for(T & c: buf) {
                auto res = strbuf->sbumpc();
                if (res == std::char_traits<T>::eof()) {
                    str.setstate(std::ios_base::eofbit | std::ios_base::failbit);
                    return str;
                }
                c = T(res);
            }
            if (auto maybe_val = ulid::from_chars(buf))
                val = *maybe_val;
            else
                str.setstate(std::ios_base::failbit);
            return str;
        }

        /// Returns hash code for the ulid
        friend constexpr size_t hash_value(const ulid & val) noexcept {
            static_assert(sizeof(ulid) > sizeof(size_t) && sizeof(ulid) % sizeof(size_t) == 0);
            size_t temp;
            const uint8_t * data = val.bytes.data();
            size_t ret = 0;
            for(unsigned i = 0; i < sizeof(ulid) / sizeof(size_t); ++i) {
                memcpy(&temp, data, sizeof(size_t));
                ret = impl::hash_combine(ret, temp);
                data += sizeof(size_t);
            }
            return ret;
        }
    };

    static_assert(sizeof(ulid) == 16);

    /// Converts a time point to Unix milliseconds
    template<class Duration>
    constexpr auto timestamp(std::chrono::sys_time<Duration> when) noexcept -> uint64_t {
        return uint64_t(std::chrono::floor<std::chrono::milliseconds>(when).time_since_epoch().count());
    }

    /// Converts Unix milliseconds to a time point
    constexpr auto to_time_point(uint64_t ms) noexcept -> ulid::time_point_t {
        return ulid::time_point_t(std::chrono::milliseconds(ms));
    }

    namespace impl {
        template<class Derived, class CharT>
        struct ulid_formatter_base {
            ulid::format fmt = ulid::uppercase;

            template<class ParseContext>
            constexpr auto parse(ParseContext & ctx) -> typename ParseContext::iterator {
                using tr = ulid_char_traits<CharT>;

                auto it = ctx.begin();
                while(it != ctx.end()) {
                    if (*it == tr::l) {
                        this->fmt = ulid::lowercase; ++it;
                    } else if (*it == tr::u) {
                        this->fmt = ulid::uppercase; ++it;
                    } else if (*it == tr::cl_br) {
                        break;
                    } else {
                        static_cast<Derived *>(this)->raise_exception("Invalid format args");
                    }
                }
                return it;
            }

            template <typename FormatContext>
            auto format(ulid val, FormatContext & ctx) const -> decltype(ctx.out())  {
                std::array<CharT, ulid::char_length> buf;
                val.to_chars(buf, this->fmt);
                return std::copy(buf.begin(), buf.end(), ctx.out());
            }
        };
    }
}

/// std::hash specialization for ulid
template<>
struct std::hash<mulid::ulid> {

    constexpr size_t operator()(const mulid::ulid & val) const noexcept {
        return hash_value(val);
    }
};


#if MULID_SUPPORTS_STD_FORMAT

/// ulid formatter for std::format
template<class CharT>
struct std::formatter<::mulid::ulid, CharT> :
    public ::mulid::impl::ulid_formatter_base<std::formatter<::mulid::ulid, CharT>, CharT>
{
    [[noreturn]] void raise_exception(const char * message) {
        MULID_THROW(std::format_error(message));
    }
};

#endif

#if MULID_SUPPORTS_FMT_FORMAT

/// ulid formatter for fmt::format
template<class CharT>
struct fmt::formatter<::mulid::ulid, CharT> :
    public ::mulid::impl::ulid_formatter_base<fmt::formatter<::mulid::ulid, CharT>, CharT>
{
    void raise_exception(const char * message) {
        FMT_THROW(fmt::format_error(message));
    }
};

#endif

#endif
