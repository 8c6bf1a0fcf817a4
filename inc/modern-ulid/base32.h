// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_BASE32_H_INCLUDED
#define HEADER_MODERN_ULID_BASE32_H_INCLUDED

#include <modern-ulid/error.h>

namespace mulid::impl {

    template<char_like C> struct ulid_char_traits {
        static constexpr C l = C(u8'l');
        static constexpr C u = C(u8'u');
        static constexpr C cl_br = C(u8'}');
        static constexpr C quote = C(u8'"');
    };

    template<> struct ulid_char_traits<char> {
        static constexpr char l = 'l';
        static constexpr char u = 'u';
        static constexpr char cl_br = '}';
        static constexpr char quote = '"';
    };

    template<> struct ulid_char_traits<wchar_t> {
        static constexpr wchar_t l = L'l';
        static constexpr wchar_t u = L'u';
        static constexpr wchar_t cl_br = L'}';
        static constexpr wchar_t quote = L'"';
    };


    #define MULID_CROCKFORD_ALPHABET(...) \
            __VA_ARGS__##"0123456789abcdefghjkmnpqrstvwxyz" \
            __VA_ARGS__##"0123456789ABCDEFGHJKMNPQRSTVWXYZ"

    inline constexpr uint8_t base32_invalid = 0xFF;

    template<class C, size_t N>
    consteval auto make_reverse_base32_alphabet(const C (&chars)[N]) {
        std::array<uint8_t, 256> ret;
        for (size_t i = 0; i < std::size(ret); ++i) {
            auto val = size_t(std::find(std::begin(chars), std::end(chars) - 1, C(i)) - std::begin(chars));
            if (val != N - 1) {
                ret[i] = uint8_t(val % ((N - 1) / 2));
            } else {
                ret[i] = base32_invalid;
            }
        }
        return ret;
    }

    /**
     * Crockford base32 alphabet.
     *
     * Decoding is case insensitive. Unlike general purpose Crockford decoders, I, L, O and U
     * are not accepted as aliases: every character outside of the alphabet is invalid.
     */
    class base32_alphabet {
    public:
        static constexpr uint8_t invalid = base32_invalid;

    private:
        static constexpr const char narrow[] = MULID_CROCKFORD_ALPHABET();
        static constexpr const wchar_t wide[] = MULID_CROCKFORD_ALPHABET(L);
        static constexpr const char8_t utf[] = MULID_CROCKFORD_ALPHABET(u8);

        static constexpr auto reverse_narrow = make_reverse_base32_alphabet(narrow);
        static constexpr auto reverse_wide = make_reverse_base32_alphabet(wide);
        static constexpr auto reverse_utf = make_reverse_base32_alphabet(utf);

        template<class C>
        static constexpr bool is_utf = std::is_same_v<C, char32_t> ||
                                       std::is_same_v<C, char16_t> ||
                                       std::is_same_v<C, char8_t> ||
                                       (std::is_same_v<C, wchar_t> && L'a' == u8'a');

    public:
        static constexpr size_t size = (std::size(utf) - 1) / 2;

        static_assert(size == 32);

    public:
        template<char_like C>
        static constexpr C encode(bool uppercase, uint8_t idx) noexcept {
            auto real_idx = idx + (uppercase << ct_log2<size>::value);

            if constexpr (is_utf<C>) {
                return C(utf[real_idx]);
            } else if constexpr (std::is_same_v<C, wchar_t>) {
                return wide[real_idx];
            } else {
                return narrow[real_idx];
            }
        }

        /// Returns the 5-bit value of a character or `invalid`
        template<char_like C>
        static constexpr uint8_t decode(C c) noexcept {
            using unsigned_type = std::make_unsigned_t<C>;
            auto idx = size_t(unsigned_type(c));
            if (idx >= 256)
                return invalid;

            if constexpr (is_utf<C>) {
                return reverse_utf[idx];
            } else if constexpr (std::is_same_v<C, wchar_t>) {
                return reverse_wide[idx];
            } else {
                return reverse_narrow[idx];
            }
        }
    };

    #undef MULID_CROCKFORD_ALPHABET

    /**
     * Conversion between the 16 byte binary form and the 26 character text form.
     *
     * Each character carries 5 bits. 26 characters hold 130 bits so the first
     * character can only carry values 0-7.
     */
    class base32 {
    public:
        static constexpr size_t binary_size = 16;
        static constexpr size_t text_size = 26;

        template<char_like C>
        static constexpr void encode(std::span<const uint8_t, binary_size> src, C * dst, bool uppercase) noexcept {
            auto enc = [uppercase](unsigned val) {
                return base32_alphabet::encode<C>(uppercase, uint8_t(val));
            };

            //10 characters of timestamp
            dst[0]  = enc((src[0] & 224) >> 5);
            dst[1]  = enc(src[0] & 31);
            dst[2]  = enc((src[1] & 248) >> 3);
            dst[3]  = enc(((src[1] & 7) << 2) | ((src[2] & 192) >> 6));
            dst[4]  = enc((src[2] & 62) >> 1);
            dst[5]  = enc(((src[2] & 1) << 4) | ((src[3] & 240) >> 4));
            dst[6]  = enc(((src[3] & 15) << 1) | ((src[4] & 128) >> 7));
            dst[7]  = enc((src[4] & 124) >> 2);
            dst[8]  = enc(((src[4] & 3) << 3) | ((src[5] & 224) >> 5));
            dst[9]  = enc(src[5] & 31);

            //16 characters of entropy
            dst[10] = enc((src[6] & 248) >> 3);
            dst[11] = enc(((src[6] & 7) << 2) | ((src[7] & 192) >> 6));
            dst[12] = enc((src[7] & 62) >> 1);
            dst[13] = enc(((src[7] & 1) << 4) | ((src[8] & 240) >> 4));
            dst[14] = enc(((src[8] & 15) << 1) | ((src[9] & 128) >> 7));
            dst[15] = enc((src[9] & 124) >> 2);
            dst[16] = enc(((src[9] & 3) << 3) | ((src[10] & 224) >> 5));
            dst[17] = enc(src[10] & 31);
            dst[18] = enc((src[11] & 248) >> 3);
            dst[19] = enc(((src[11] & 7) << 2) | ((src[12] & 192) >> 6));
            dst[20] = enc((src[12] & 62) >> 1);
            dst[21] = enc(((src[12] & 1) << 4) | ((src[13] & 240) >> 4));
            dst[22] = enc(((src[13] & 15) << 1) | ((src[14] & 128) >> 7));
            dst[23] = enc((src[14] & 124) >> 2);
            dst[24] = enc(((src[14] & 3) << 3) | ((src[15] & 224) >> 5));
            dst[25] = enc(src[15] & 31);
        }

        /**
         * Decodes exactly text_size characters from src into dst.
         *
         * The timestamp characters are always validated. Entropy characters are only validated
         * when `strict` is set; otherwise invalid ones produce unspecified (but deterministic) bits.
         * On failure dst is not modified.
         */
        template<char_like C>
        static constexpr auto decode(const C * src, std::span<uint8_t, binary_size> dst, bool strict) noexcept -> errc {
            std::array<uint8_t, text_size> v;
            for (size_t i = 0; i < text_size; ++i)
                v[i] = base32_alphabet::decode(src[i]);

            for (size_t i = 0; i < 10; ++i) {
                if (v[i] == base32_alphabet::invalid)
                    return errc::invalid_characters;
            }

            if (v[0] > 7)
                return errc::overflow;

            if (strict) {
                for (size_t i = 10; i < text_size; ++i) {
                    if (v[i] == base32_alphabet::invalid)
                        return errc::invalid_characters;
                }
            }

            dst[0]  = uint8_t((v[0] << 5) | v[1]);
            dst[1]  = uint8_t((v[2] << 3) | (v[3] >> 2));
            dst[2]  = uint8_t((v[3] << 6) | (v[4] << 1) | (v[5] >> 4));
            dst[3]  = uint8_t((v[5] << 4) | (v[6] >> 1));
            dst[4]  = uint8_t((v[6] << 7) | (v[7] << 2) | (v[8] >> 3));
            dst[5]  = uint8_t((v[8] << 5) | v[9]);
            dst[6]  = uint8_t((v[10] << 3) | (v[11] >> 2));
            dst[7]  = uint8_t((v[11] << 6) | (v[12] << 1) | (v[13] >> 4));
            dst[8]  = uint8_t((v[13] << 4) | (v[14] >> 1));
            dst[9]  = uint8_t((v[14] << 7) | (v[15] << 2) | (v[16] >> 3));
            dst[10] = uint8_t((v[16] << 5) | v[17]);
            dst[11] = uint8_t((v[18] << 3) | (v[19] >> 2));
            dst[12] = uint8_t((v[19] << 6) | (v[20] << 1) | (v[21] >> 4));
            dst[13] = uint8_t((v[21] << 4) | (v[22] >> 1));
            dst[14] = uint8_t((v[22] << 7) | (v[23] << 2) | (v[24] >> 3));
            dst[15] = uint8_t((v[24] << 5) | v[25]);

            return errc{};
        }
    };
}

#endif
