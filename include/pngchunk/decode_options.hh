/**
 * @file decode_options.hh
 * @brief Decoding options for chunk parsing
 * @author Igor
 * @date 03/09/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @brief Largest chunk length allowed by the PNG specification (2^31 - 1)
     */
    inline constexpr std::uint32_t png_max_length = 0x7FFFFFFFu;

    /**
     * @struct decode_options
     * @brief Configuration options for decoding chunks
     *
     * The defaults accept every well-formed chunk. Checksum verification
     * is always strict and cannot be turned off.
     */
    struct decode_options {
        /**
         * @brief Maximum accepted declared payload length in bytes
         *
         * Chunks declaring more than this fail with size_limit_error
         * before any payload is read. Set to png_max_length to enforce
         * the PNG limit.
         */
        std::uint32_t max_length = 0xFFFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Byte offset of the chunk start
         * @param category Warning category (e.g., "reserved_bit")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * Called for advisory findings that do not reject the chunk.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
