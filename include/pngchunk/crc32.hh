/**
 * @file crc32.hh
 * @brief CRC-32 checksum used by chunk encoding and verification
 * @author Igor
 * @date 03/09/2025
 *
 * The checksum is CRC-32/ISO-HDLC (reflected, polynomial 0xEDB88320,
 * initial value and final XOR 0xFFFFFFFF), the same CRC PNG and zlib use.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @brief Compute or continue a CRC-32
     * @param data Bytes to checksum
     * @param size Number of bytes
     * @param seed CRC of preceding data, 0 to start a new checksum
     * @return CRC of the preceding data followed by [data, data + size)
     */
    PNGCHUNK_EXPORT std::uint32_t crc32(const void* data, std::size_t size, std::uint32_t seed = 0);

    /**
     * @class crc32_accumulator
     * @brief Incremental CRC-32 over several disjoint buffers
     */
    class PNGCHUNK_EXPORT crc32_accumulator {
    public:
        crc32_accumulator() = default;

        crc32_accumulator& update(const void* data, std::size_t size);

        [[nodiscard]] std::uint32_t value() const { return m_crc; }

        void reset() { m_crc = 0; }

    private:
        std::uint32_t m_crc = 0;
    };

} // namespace pngchunk
