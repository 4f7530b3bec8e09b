//
// Created by igor on 02/09/2025.
//
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <iomanip>

#include <pngchunk/exceptions.hh>

namespace pngchunk {
    /**
     * @struct type_tag
     * @brief Four byte chunk type code such as "IHDR" or "tEXt"
     *
     * Bit 5 (0x20) of each byte is the ASCII case bit and carries the
     * classification flags: ancillary, private, reserved and safe-to-copy.
     * The flags are advisory and are never enforced by the codec.
     */
    struct type_tag {
        static constexpr unsigned char property_bit = 0x20;

        std::array<char, 4> b{' ', ' ', ' ', ' '};

        constexpr type_tag() = default;

        // Constructor from 4 individual chars (no validation)
        constexpr type_tag(char c0, char c1, char c2, char c3)
            : b{ c0, c1, c2, c3 } {}

        // Constructor from 4 raw bytes (no validation)
        explicit constexpr type_tag(const std::array<std::uint8_t, 4>& bytes)
            : b{ static_cast<char>(bytes[0]), static_cast<char>(bytes[1]),
                 static_cast<char>(bytes[2]), static_cast<char>(bytes[3]) } {}

        // Constructor from raw memory (no validation)
        static type_tag from_bytes(const void* data) {
            type_tag result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        /**
         * @brief Validating constructor from text
         * @param sv Text; only the first 4 bytes are used
         * @throws invalid_tag_error if fewer than 4 bytes are given or
         *         any of the 4 bytes is not an ASCII letter
         */
        static type_tag from_text(std::string_view sv) {
            THROW_CHUNK_IF(sv.size() < 4, invalid_tag_error,
                           "Chunk type needs 4 characters, got ", sv.size());
            type_tag result(sv[0], sv[1], sv[2], sv[3]);
            THROW_CHUNK_UNLESS(result.is_valid(), invalid_tag_error,
                               "Chunk type ", result, " contains a non-alphabetic byte");
            return result;
        }

        // True if all four bytes are ASCII letters
        [[nodiscard]] constexpr bool is_valid() const {
            for (char c : b) {
                if (!is_ascii_alpha(c)) {
                    return false;
                }
            }
            return true;
        }

        // Ancillary bit of byte 0: uppercase = critical
        [[nodiscard]] constexpr bool is_critical() const {
            return !property(0);
        }

        // Private bit of byte 1: uppercase = public
        [[nodiscard]] constexpr bool is_public() const {
            return !property(1);
        }

        // Reserved bit of byte 2: must be uppercase in conforming data
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const {
            return !property(2);
        }

        // Safe-to-copy bit of byte 3: lowercase = safe to copy
        [[nodiscard]] constexpr bool is_safe_to_copy() const {
            return property(3);
        }

        [[nodiscard]] constexpr std::array<std::uint8_t, 4> bytes() const {
            return { static_cast<std::uint8_t>(b[0]), static_cast<std::uint8_t>(b[1]),
                     static_cast<std::uint8_t>(b[2]), static_cast<std::uint8_t>(b[3]) };
        }

        // Numeric code with byte 0 as the most significant byte
        [[nodiscard]] constexpr std::uint32_t to_uint32() const {
            auto v = bytes();
            return (std::uint32_t(v[0]) << 24) | (std::uint32_t(v[1]) << 16) |
                   (std::uint32_t(v[2]) << 8) | std::uint32_t(v[3]);
        }

        // Convert to string
        [[nodiscard]] std::string to_string() const {
            return {b.data(), 4};
        }

        // Convert to string_view
        [[nodiscard]] std::string_view to_string_view() const {
            return {b.data(), 4};
        }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        constexpr char operator[](std::size_t i) const { return b[i]; }

        [[nodiscard]] constexpr auto begin() const { return b.begin(); }
        [[nodiscard]] constexpr auto end() const { return b.end(); }

        // Comparison operators
        bool operator==(const type_tag& o) const { return b == o.b; }
        bool operator!=(const type_tag& o) const { return !(*this == o); }
        bool operator<(const type_tag& o) const { return b < o.b; }

        // Stream output
        friend std::ostream& operator<<(std::ostream& os, const type_tag& t) {
            if (os.flags() & std::ios::hex) {
                auto flags = os.flags();
                auto fill = os.fill();
                os << "0x" << std::hex << std::setfill('0') << std::setw(8)
                   << t.to_uint32();
                os.flags(flags);
                os.fill(fill);
            } else {
                os << '\'';
                for (char c : t.b) {
                    if (c >= 32 && c <= 126) {
                        os << c;
                    } else {
                        // Escape non-printable characters
                        auto flags = os.flags();
                        auto fill = os.fill();
                        os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                           << static_cast<unsigned>(static_cast<unsigned char>(c));
                        os.flags(flags);
                        os.fill(fill);
                    }
                }
                os << '\'';
            }
            return os;
        }

    private:
        static constexpr bool is_ascii_alpha(char c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        [[nodiscard]] constexpr bool property(std::size_t i) const {
            return (static_cast<unsigned char>(b[i]) & property_bit) != 0;
        }
    };

    // Hash function
    struct type_tag_hash {
        std::size_t operator()(const type_tag& t) const noexcept {
            return (static_cast<std::size_t>(t.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for compile-time tags; the text must be 4 letters
    constexpr type_tag operator""_tag(const char* str, std::size_t len) {
        if (len != 4) {
            throw std::invalid_argument("Chunk type literal must be exactly 4 characters");
        }
        type_tag t(str[0], str[1], str[2], str[3]);
        if (!t.is_valid()) {
            throw std::invalid_argument("Chunk type literal must be alphabetic");
        }
        return t;
    }

    /**
     * @namespace tags
     * @brief Well-known PNG chunk types
     */
    namespace tags {
        // Critical chunks
        inline constexpr type_tag IHDR('I', 'H', 'D', 'R');
        inline constexpr type_tag PLTE('P', 'L', 'T', 'E');
        inline constexpr type_tag IDAT('I', 'D', 'A', 'T');
        inline constexpr type_tag IEND('I', 'E', 'N', 'D');

        // Ancillary chunks
        inline constexpr type_tag tEXt('t', 'E', 'X', 't');
        inline constexpr type_tag zTXt('z', 'T', 'X', 't');
        inline constexpr type_tag iTXt('i', 'T', 'X', 't');
        inline constexpr type_tag gAMA('g', 'A', 'M', 'A');
        inline constexpr type_tag pHYs('p', 'H', 'Y', 's');
        inline constexpr type_tag tIME('t', 'I', 'M', 'E');
    }
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::type_tag> {
        std::size_t operator()(const pngchunk::type_tag& t) const noexcept {
            return pngchunk::type_tag_hash{}(t);
        }
    };
}
