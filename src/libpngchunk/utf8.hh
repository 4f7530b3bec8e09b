//
// Created by igor on 04/09/2025.
//

#pragma once

#include <cstddef>
#include <string>

namespace pngchunk {
    // Returns npos if [data, data + size) is well-formed UTF-8 (RFC 3629),
    // otherwise the offset of the first byte of the offending sequence.
    // Overlong forms, surrogates and code points above U+10FFFF are rejected.
    std::size_t find_invalid_utf8(const std::byte* data, std::size_t size);

    inline constexpr std::size_t utf8_npos = std::string::npos;
}
