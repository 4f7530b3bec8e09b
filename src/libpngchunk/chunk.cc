//
// Created by igor on 04/09/2025.
//

#include <pngchunk/chunk.hh>
#include <pngchunk/crc32.hh>
#include <pngchunk/exceptions.hh>
#include "input.hh"
#include "utf8.hh"

#include <istream>
#include <ostream>
#include <sstream>
#include <iomanip>
#include <limits>

namespace pngchunk {

    namespace {
        std::string hex32(std::uint32_t value) {
            std::ostringstream oss;
            oss << "0x" << std::hex << std::setfill('0') << std::setw(8) << value;
            return oss.str();
        }

        // Reads length and tag, the fields every chunk starts with
        struct chunk_prefix {
            std::uint32_t length;
            type_tag tag;
        };

        chunk_prefix read_prefix(reader_base& rd, std::uint64_t offset, const decode_options& options) {
            chunk_prefix prefix;
            prefix.length = rd.read<std::uint32_t>(byte_order::big);
            THROW_CHUNK_IF(prefix.length > options.max_length, size_limit_error,
                           "Chunk at offset ", offset, " declares ", prefix.length,
                           " payload bytes, limit is ", options.max_length);

            prefix.tag = rd.read_tag();
            THROW_CHUNK_UNLESS(prefix.tag.is_valid(), invalid_tag_error,
                               "Chunk at offset ", offset, " has type ", prefix.tag,
                               " with a non-alphabetic byte");
            return prefix;
        }

        void report_advisory_flags(const type_tag& tag, std::uint64_t offset, const decode_options& options) {
            if (!options.on_warning) {
                return;
            }
            if (!tag.is_reserved_bit_valid()) {
                options.on_warning(offset, "reserved_bit",
                                   build_error_msg("Chunk type ", tag, " has the reserved bit set"));
            }
        }
    }

    chunk::chunk(type_tag tag, std::vector<std::byte> data)
        : m_length(0)
        , m_type(tag)
        , m_data(std::move(data))
        , m_crc(0) {
        THROW_CHUNK_IF(m_data.size() > std::numeric_limits<std::uint32_t>::max(), length_mismatch_error,
                       "Payload of ", m_data.size(), " bytes does not fit a 32-bit chunk length");
        m_length = static_cast<std::uint32_t>(m_data.size());
        m_crc = compute_crc(m_type, m_data);
    }

    chunk::chunk(std::uint32_t length, type_tag tag, std::vector<std::byte> data, std::uint32_t crc)
        : m_length(length)
        , m_type(tag)
        , m_data(std::move(data))
        , m_crc(crc) {
    }

    chunk chunk::from_text(type_tag tag, std::string_view text) {
        const auto* first = reinterpret_cast<const std::byte*>(text.data());
        return chunk(tag, std::vector<std::byte>(first, first + text.size()));
    }

    std::uint32_t chunk::compute_crc(const type_tag& tag, const std::vector<std::byte>& data) {
        crc32_accumulator acc;
        acc.update(tag.b.data(), tag.b.size());
        acc.update(data.data(), data.size());
        return acc.value();
    }

    chunk chunk::decode(const void* data, std::size_t size, const decode_options& options) {
        THROW_CHUNK_IF(size < overhead, truncated_input_error,
                       "Chunk needs at least ", overhead, " bytes, got ", size);

        memory_reader rd(data, size);
        auto prefix = read_prefix(rd, 0, options);

        // Exactly the payload and the checksum must remain
        std::size_t available = rd.remaining() - 4;
        THROW_CHUNK_IF(available != prefix.length, length_mismatch_error,
                       "Chunk ", prefix.tag, " declares ", prefix.length,
                       " payload bytes but ", available, " are present");

        auto payload = rd.read_exact(prefix.length);
        auto stored = rd.read<std::uint32_t>(byte_order::big);

        auto actual = compute_crc(prefix.tag, payload);
        THROW_CHUNK_IF(actual != stored, checksum_mismatch_error,
                       "Chunk ", prefix.tag, " has checksum ", hex32(stored),
                       " but its contents hash to ", hex32(actual));

        report_advisory_flags(prefix.tag, 0, options);
        return chunk(prefix.length, prefix.tag, std::move(payload), stored);
    }

    chunk chunk::decode(const void* data, std::size_t size) {
        return decode(data, size, decode_options{});
    }

    chunk chunk::decode(const std::vector<std::byte>& bytes, const decode_options& options) {
        return decode(bytes.data(), bytes.size(), options);
    }

    chunk chunk::decode(const std::vector<std::byte>& bytes) {
        return decode(bytes.data(), bytes.size(), decode_options{});
    }

    chunk chunk::decode(std::string_view bytes) {
        return decode(bytes.data(), bytes.size(), decode_options{});
    }

    chunk chunk::read(std::istream& stream, const decode_options& options) {
        stream_reader rd(stream);
        std::uint64_t offset = rd.start_offset();

        auto prefix = read_prefix(rd, offset, options);
        auto payload = rd.read_exact(prefix.length);
        auto stored = rd.read<std::uint32_t>(byte_order::big);

        auto actual = compute_crc(prefix.tag, payload);
        THROW_CHUNK_IF(actual != stored, checksum_mismatch_error,
                       "Chunk ", prefix.tag, " at offset ", offset, " has checksum ", hex32(stored),
                       " but its contents hash to ", hex32(actual));

        report_advisory_flags(prefix.tag, offset, options);
        return chunk(prefix.length, prefix.tag, std::move(payload), stored);
    }

    chunk chunk::read(std::istream& stream) {
        return read(stream, decode_options{});
    }

    std::string chunk::data_as_string() const {
        std::size_t bad = find_invalid_utf8(m_data.data(), m_data.size());
        THROW_CHUNK_IF(bad != utf8_npos, not_utf8_text_error,
                       "Chunk ", m_type, " payload is not UTF-8: invalid sequence at byte ", bad);
        return std::string(reinterpret_cast<const char*>(m_data.data()), m_data.size());
    }

    std::vector<std::byte> chunk::encode() const {
        std::vector<std::byte> out;
        out.reserve(encoded_size());

        writer w(out);
        w.write<std::uint32_t>(m_length, byte_order::big);
        w.write_tag(m_type);
        w.write(m_data.data(), m_data.size());
        w.write<std::uint32_t>(m_crc, byte_order::big);
        return out;
    }

    void chunk::write(std::ostream& stream) const {
        auto bytes = encode();
        stream.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        THROW_IO_UNLESS(stream.good(), "Failed to write chunk ", m_type, " (", bytes.size(), " bytes)");
    }

    std::string chunk::to_string() const {
        std::ostringstream oss;
        oss << *this;
        return oss.str();
    }

    bool chunk::operator==(const chunk& o) const {
        return m_length == o.m_length && m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        auto flags = os.flags();
        os << std::dec << "chunk " << c.chunk_type() << " length=" << c.length() << " crc=" << hex32(c.crc());
        os.flags(flags);
        return os;
    }

} // namespace pngchunk
