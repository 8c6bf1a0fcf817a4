// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_COMMON_H_INCLUDED
#define HEADER_MODERN_ULID_COMMON_H_INCLUDED

// Config macros:
//
// The following macros must be defined identically when using and building this library:
//
// MULID_MULTITHREADED - auto-detected. Set to 1 to force multi-threaded build and 0 to force single threaded 1
// MULID_USE_EXCEPTIONS - auto-detected. Set to 1 to force usage of exceptions and 0 to force not using them
// MULID_SHARED - set to 1 when using/building a shared library version of the library
//
// The following macro should be set when building the library itself but not when using it:
//
// MULID_BUILDING_MULID - set 1 if building the library itself.

#include <cstdint>
#include <cstring>
#include <cstdio>
#include <cstdlib>

#include <concepts>
#include <compare>
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <optional>
#include <limits>
#include <chrono>
#include <algorithm>
#include <iterator>
#include <bit>
#include <istream>
#include <ostream>

#if !defined(MULID_MULTITHREADED)
    #if defined(_MSC_VER) && !defined(_MT)
        #define MULID_MULTITHREADED 0
    #elif defined(_LIBCPP_VERSION) && (defined(_LIBCPP_HAS_NO_THREADS) || defined(_LIBCPP_HAS_THREADS) && !_LIBCPP_HAS_THREADS)
        #define MULID_MULTITHREADED 0
    #elif defined(__GLIBCXX__) && !_GLIBCXX_HAS_GTHREADS
        #define MULID_MULTITHREADED 0
    #elif !__has_include(<thread>) || !__has_include(<mutex>) || !__has_include(<atomic>)
        #define MULID_MULTITHREADED 0
    #else
        #define MULID_MULTITHREADED 1
    #endif
#endif

#if !defined(MULID_USE_EXCEPTIONS)
    #if defined(__GNUC__) && !defined(__EXCEPTIONS)
        #define MULID_USE_EXCEPTIONS 0
    #elif defined(__clang__) && !defined(__cpp_exceptions)
        #define MULID_USE_EXCEPTIONS 0
    #elif defined(_MSC_VER) && !_HAS_EXCEPTIONS
        #define MULID_USE_EXCEPTIONS 0
    #else
        #define MULID_USE_EXCEPTIONS 1
    #endif
#endif

#if MULID_SHARED
    #if defined(_WIN32) || defined(_WIN64)
        #if MULID_BUILDING_MULID
            #define MULID_EXPORTED __declspec(dllexport)
        #else
            #define MULID_EXPORTED __declspec(dllimport)
        #endif
    #elif defined(__GNUC__)
        #define MULID_EXPORTED [[gnu::visibility("default")]]
    #else
        #define MULID_EXPORTED
    #endif
#else
    #define MULID_EXPORTED
#endif


//See https://github.com/llvm/llvm-project/issues/77773 for the sad story of how feature test
//macros are useless with libc++
#if (__cpp_lib_format >= 201907L || (defined(_LIBCPP_VERSION) && _LIBCPP_VERSION >= 170000)) && __has_include(<format>)

    #define MULID_SUPPORTS_STD_FORMAT 1

#endif

#if defined(FMT_VERSION) && FMT_VERSION >= 60000 && defined(FMT_THROW)

    #define MULID_SUPPORTS_FMT_FORMAT 1

#endif

#if MULID_USE_FMT && !MULID_SUPPORTS_FMT_FORMAT

    #error "MULID_USE_FMT is requested but fmt library (of version >= 6.0) is not detected. Did you forget to include <fmt/format.h> before this header?"

#endif

#if MULID_SUPPORTS_STD_FORMAT
    #include <format>
#endif

namespace mulid
{
    namespace impl {
        template<class T, size_t Extent>
        std::true_type is_span_helper(std::span<T, Extent> * x);

        std::false_type is_span_helper(...);

        template<class T>
        constexpr bool is_span = decltype(is_span_helper((T *)nullptr))::value;

        template<class T>
        concept byte_like = std::is_standard_layout_v<T> &&
                            sizeof(T) == sizeof(uint8_t) &&
        requires {
            static_cast<T>(uint8_t{});
            static_cast<uint8_t>(T{});
        };

        static_assert(byte_like<char>);
        static_assert(byte_like<unsigned char>);
        static_assert(byte_like<signed char>);
        static_assert(byte_like<std::byte>);

        template<class T>
        concept char_like = std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
                            std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;

        template<size_t N>
        requires(N > 0)
        struct ct_log2 {
            static constexpr size_t value = 1 + ct_log2<N / 2>::value;
        };
        template<>
        struct ct_log2<1> {
            static constexpr size_t value = 0;
        };

        static_assert(ct_log2<32>::value == 5);

        void invalid_constexpr_call(const char *);

        #if MULID_USE_EXCEPTIONS
            #define MULID_THROW(x) throw x
        #else
            [[noreturn]] inline void fail(const char* message) {
                fprintf(stderr, "mulid: fatal error: %s", message);
                abort();
            }
            #define MULID_THROW(x) ::mulid::impl::fail((x).what())
        #endif

        template<std::same_as<size_t> S>
        constexpr size_t hash_combine(S prev, S next) {
            constexpr auto digits = std::numeric_limits<S>::digits;
            static_assert(digits == 64 || digits == 32);

            if constexpr (digits == 64) {
                S x = prev + 0x9e3779b9 + next;
                const S m = 0xe9846af9b1a615d;
                x ^= x >> 32;
                x *= m;
                x ^= x >> 32;
                x *= m;
                x ^= x >> 28;
                return x;
            } else {
                S x = prev + 0x9e3779b9 + next;
                const S m1 = 0x21f0aaad;
                const S m2 = 0x735a2d97;
                x ^= x >> 16;
                x *= m1;
                x ^= x >> 15;
                x *= m2;
                x ^= x >> 15;
                return x;
            }
        }

        /// Reads a big-endian integer
        template<impl::byte_like Byte, std::unsigned_integral T>
        constexpr const Byte * read_bytes(const Byte * bytes, T & val) noexcept {
            T tmp = uint8_t(*bytes++);
            for(unsigned i = 0; i < sizeof(T) - 1; ++i)
                tmp = T(tmp << 8) | uint8_t(*bytes++);
            val = tmp;
            return bytes;
        }

        /// Writes a big-endian integer
        template<impl::byte_like Byte, std::unsigned_integral T>
        constexpr Byte * write_bytes(T val, Byte * bytes) noexcept {
            bytes[sizeof(T) - 1] = Byte(static_cast<uint8_t>(val));
            if constexpr (sizeof(T) > 1) {
                for(unsigned i = 1; i != sizeof(T); ++i) {
                    val >>= 8;
                    bytes[sizeof(T) - i - 1] = Byte(static_cast<uint8_t>(val));
                }
            }
            return bytes + sizeof(T);
        }

        //Uniform string_view access to the things we accept as textual input

        constexpr auto to_string_view(std::string_view str) noexcept
            { return str; }
        constexpr auto to_string_view(std::wstring_view str) noexcept
            { return str; }
        constexpr auto to_string_view(std::u8string_view str) noexcept
            { return str; }
        constexpr auto to_string_view(std::u16string_view str) noexcept
            { return str; }
        constexpr auto to_string_view(std::u32string_view str) noexcept
            { return str; }

        template<class T, size_t Extent>
        requires(char_like<std::remove_const_t<T>>)
        constexpr auto to_string_view(std::span<T, Extent> src) noexcept
            { return std::basic_string_view<std::remove_const_t<T>>(src.data(), src.size()); }

        template<char_like T, size_t N>
        constexpr auto to_string_view(const std::array<T, N> & src) noexcept
            { return std::basic_string_view<T>(src.data(), src.size()); }

        template<class T>
        concept string_like = requires(const T & x) {
            { impl::to_string_view(x) };
        };
    }
}

#endif
