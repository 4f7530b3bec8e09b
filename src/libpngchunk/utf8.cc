//
// Created by igor on 04/09/2025.
//

#include "utf8.hh"

namespace pngchunk {

    static bool is_continuation(unsigned char c) {
        return (c & 0xC0) == 0x80;
    }

    std::size_t find_invalid_utf8(const std::byte* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            auto c = static_cast<unsigned char>(data[i]);
            if (c < 0x80) {
                ++i;
                continue;
            }

            std::size_t len;
            // Valid range of the second byte depends on the lead byte
            unsigned char lo = 0x80;
            unsigned char hi = 0xBF;
            if (c >= 0xC2 && c <= 0xDF) {
                len = 2;
            } else if (c >= 0xE0 && c <= 0xEF) {
                len = 3;
                if (c == 0xE0) {
                    lo = 0xA0;   // overlong
                } else if (c == 0xED) {
                    hi = 0x9F;   // surrogates
                }
            } else if (c >= 0xF0 && c <= 0xF4) {
                len = 4;
                if (c == 0xF0) {
                    lo = 0x90;   // overlong
                } else if (c == 0xF4) {
                    hi = 0x8F;   // above U+10FFFF
                }
            } else {
                return i;
            }

            if (size - i < len) {
                return i;
            }

            auto second = static_cast<unsigned char>(data[i + 1]);
            if (second < lo || second > hi) {
                return i;
            }
            for (std::size_t k = 2; k < len; ++k) {
                if (!is_continuation(static_cast<unsigned char>(data[i + k]))) {
                    return i;
                }
            }
            i += len;
        }
        return utf8_npos;
    }
}
