/**
 * @file chunk.hh
 * @brief A single length-tag-payload-checksum chunk and its wire codec
 * @author Igor
 * @date 04/09/2025
 *
 * Wire layout (all integers big-endian):
 *
 *     offset      size    field
 *     0           4       length of the payload
 *     4           4       type tag
 *     8           length  payload
 *     8 + length  4       CRC-32 over type tag and payload
 */

#pragma once

#include <iosfwd>
#include <vector>
#include <string>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <pngchunk/export_pngchunk.h>
#include <pngchunk/type_tag.hh>
#include <pngchunk/decode_options.hh>

namespace pngchunk {

    /**
     * @class chunk
     * @brief Immutable, validated chunk
     *
     * A chunk always satisfies length() == data().size() and
     * crc() == crc32(chunk_type() ++ data()). Instances that would break
     * either rule are never created: construction computes the checksum
     * and decoding throws instead of returning a damaged chunk.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        /// Size of the length, type and checksum fields together
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Create a chunk from a tag and a payload
         *
         * The payload is stored exactly as given and the checksum is
         * computed here. The tag is not validated; use
         * type_tag::from_text to obtain a checked tag.
         *
         * @param tag Chunk type
         * @param data Payload bytes
         * @throws length_mismatch_error if the payload does not fit a 32-bit length
         */
        chunk(type_tag tag, std::vector<std::byte> data);

        /**
         * @brief Create a chunk whose payload is the bytes of a text
         * @param tag Chunk type
         * @param text Payload text, copied byte for byte
         */
        static chunk from_text(type_tag tag, std::string_view text);

        /**
         * @brief Decode one chunk occupying the whole buffer
         *
         * The buffer must hold exactly 12 + length bytes.
         *
         * @param data Start of the encoded chunk
         * @param size Buffer size in bytes
         * @param options Decode options
         * @return Validated chunk
         * @throws truncated_input_error if size < 12
         * @throws size_limit_error if the declared length exceeds options.max_length
         * @throws invalid_tag_error if the tag is not four ASCII letters
         * @throws length_mismatch_error if size != 12 + length
         * @throws checksum_mismatch_error if the stored CRC is wrong
         */
        static chunk decode(const void* data, std::size_t size, const decode_options& options);
        static chunk decode(const void* data, std::size_t size);
        static chunk decode(const std::vector<std::byte>& bytes, const decode_options& options);
        static chunk decode(const std::vector<std::byte>& bytes);
        static chunk decode(std::string_view bytes);

        /**
         * @brief Read one chunk from the current position of a stream
         *
         * Applies the same checks as decode. On success the stream is left
         * just past the checksum so consecutive chunks can be read.
         *
         * @param stream Input stream
         * @param options Decode options
         * @return Validated chunk
         * @throws truncated_input_error if the stream ends inside the chunk
         * @throws io_error if the stream fails
         */
        static chunk read(std::istream& stream, const decode_options& options);
        static chunk read(std::istream& stream);

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const type_tag& chunk_type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /// Total encoded size: 12 + length()
        [[nodiscard]] std::size_t encoded_size() const { return overhead + m_length; }

        /**
         * @brief View the payload as text
         * @return Payload bytes unchanged
         * @throws not_utf8_text_error if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /**
         * @brief Encode to the wire layout
         * @return 12 + length() bytes; decode(encode()) == *this
         */
        [[nodiscard]] std::vector<std::byte> encode() const;

        /**
         * @brief Write the encoded chunk to a stream
         * @throws io_error if the stream fails
         */
        void write(std::ostream& stream) const;

        /// Human-readable summary, e.g. "chunk 'RuSt' length=42 crc=0xabd1d84e"
        [[nodiscard]] std::string to_string() const;

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(std::uint32_t length, type_tag tag, std::vector<std::byte> data, std::uint32_t crc);

        static std::uint32_t compute_crc(const type_tag& tag, const std::vector<std::byte>& data);

        std::uint32_t m_length;
        type_tag m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngchunk
