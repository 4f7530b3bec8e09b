//
// Created by igor on 03/09/2025.
//

#include <istream>
#include <algorithm>

#include "input.hh"

namespace pngchunk {
    // Upper bound on a single allocation step while reading a payload
    static constexpr std::size_t READ_BLOCK = 64 * 1024;

    // reader_base implementation
    std::vector<std::byte> reader_base::read_exact(std::size_t size) {
        std::vector<std::byte> buffer;
        // Grow in blocks so a bogus length cannot force a huge allocation up front
        while (buffer.size() < size) {
            std::size_t step = std::min(size - buffer.size(), READ_BLOCK);
            std::size_t old_size = buffer.size();
            buffer.resize(old_size + step);
            std::size_t actual = read(buffer.data() + old_size, step);
            THROW_CHUNK_IF(actual != step, truncated_input_error,
                           "Unexpected end of input: requested ", size, " bytes, got ",
                           old_size + actual);
        }
        return buffer;
    }

    type_tag reader_base::read_tag() {
        std::array<char, 4> data;
        std::size_t actual = read(data.data(), 4);
        THROW_CHUNK_IF(actual != 4, truncated_input_error, "Failed to read chunk type");
        return type_tag(data[0], data[1], data[2], data[3]);
    }

    // memory_reader implementation
    memory_reader::memory_reader(const void* data, std::size_t size)
        : m_data(static_cast<const std::byte*>(data)), m_size(size), m_position(0) {
        THROW_IO_IF(!m_data && m_size > 0, "Null buffer with non-zero size ", m_size);
    }

    std::size_t memory_reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst || size == 0, "Null buffer in memory_reader::read");

        size = std::min(size, remaining());
        if (size == 0) {
            return 0;
        }

        std::memcpy(dst, m_data + m_position, size);
        m_position += size;
        return size;
    }

    // stream_reader implementation
    stream_reader::stream_reader(std::istream& is)
        : m_stream(is), m_start(0), m_consumed(0) {
        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state");
        auto pos = m_stream.tellg();
        if (pos != std::streampos(-1)) {
            m_start = static_cast<std::uint64_t>(pos);
        }
    }

    std::size_t stream_reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        THROW_IO_IF(m_stream.bad(), "Stream in bad state");

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed");
        m_consumed += bytes_read;
        return bytes_read;
    }

    // writer implementation
    void writer::write(const void* src, std::size_t size) {
        if (size == 0) {
            return;
        }
        THROW_IO_UNLESS(src, "Null buffer in writer::write");
        const auto* bytes = static_cast<const std::byte*>(src);
        m_buffer.insert(m_buffer.end(), bytes, bytes + size);
    }

    void writer::write_tag(const type_tag& tag) {
        std::array<char, 4> data;
        tag.to_bytes(data.data());
        write(data.data(), data.size());
    }
}
