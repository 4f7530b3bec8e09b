//
// Created by igor on 02/09/2025.
//

#pragma once

#include <cstdint>
#include <type_traits>

#include <pngchunk/pngchunk_config.h>

namespace pngchunk {
    // Platform endianness detection using CMake-generated config
#if LIBPNGCHUNK_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    // Byte swapping functions
    constexpr std::uint16_t swap16(std::uint16_t x) {
        return static_cast<std::uint16_t>((x << 8) | (x >> 8));
    }

    constexpr std::uint32_t swap32(std::uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    template<typename T>
    struct is_byte_swappable {
        static constexpr bool value =
            (std::is_integral_v <T> && (sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4)) ||
            std::is_enum_v <T>;
    };

    template<typename T>
    inline constexpr bool is_byte_swappable_v = is_byte_swappable <T>::value;

    // Generic swap_byte_order implementation
    template<typename T>
    constexpr T swap_byte_order(T x) noexcept {
        static_assert(is_byte_swappable_v <T>,
                      "swap_byte_order only supports integral types (1,2,4 bytes) and enum types");

        if constexpr (sizeof(T) == 1) {
            return x;
        } else if constexpr (std::is_enum_v <T>) {
            using underlying = std::underlying_type_t <T>;
            return static_cast <T>(swap_byte_order(static_cast <underlying>(x)));
        } else if constexpr (sizeof(T) == 2) {
            return static_cast <T>(swap16(static_cast <std::uint16_t>(x)));
        } else {
            return static_cast <T>(swap32(static_cast <std::uint32_t>(x)));
        }
    }
}
