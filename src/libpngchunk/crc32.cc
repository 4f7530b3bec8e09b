//
// Created by igor on 03/09/2025.
//

#include <pngchunk/crc32.hh>
#include <zlib.h>

namespace pngchunk {

    std::uint32_t crc32(const void* data, std::size_t size, std::uint32_t seed) {
        if (size == 0) {
            return seed;
        }
        return static_cast<std::uint32_t>(
            ::crc32_z(seed, static_cast<const Bytef*>(data), static_cast<z_size_t>(size)));
    }

    crc32_accumulator& crc32_accumulator::update(const void* data, std::size_t size) {
        m_crc = crc32(data, size, m_crc);
        return *this;
    }

} // namespace pngchunk
