//
// Created by igor on 03/09/2025.
//

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <cstring>

#include <pngchunk/exceptions.hh>
#include <pngchunk/byte_order.hh>
#include <pngchunk/type_tag.hh>

namespace pngchunk {

    // Base reader interface
    class reader_base {
        public:
            virtual ~reader_base() = default;

            // Returns the number of bytes actually read, short only at end of input
            virtual std::size_t read(void* dst, std::size_t size) = 0;
            virtual std::uint64_t tell() const = 0;

            // Throws truncated_input_error unless exactly size bytes are available
            std::vector<std::byte> read_exact(std::size_t size);

            template<typename T>
            T read(byte_order bo) {
                std::array<std::byte, sizeof(T)> buff;
                std::size_t actual = read(buff.data(), sizeof(T));
                THROW_CHUNK_IF(actual != sizeof(T), truncated_input_error,
                               "Unexpected end of input: needed ", sizeof(T), " bytes, got ", actual);

                T value;
                std::memcpy(&value, buff.data(), sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return value;
            }

            // Reads 4 raw tag bytes, no validation
            type_tag read_tag();
    };

    // Reader over a caller-owned byte range
    class memory_reader : public reader_base {
        public:
            memory_reader(const void* data, std::size_t size);

            using reader_base::read;
            std::size_t read(void* dst, std::size_t size) override;
            std::uint64_t tell() const override { return m_position; }

            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }
            [[nodiscard]] std::size_t size() const { return m_size; }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };

    // Reader over an input stream, starting at its current position
    class stream_reader : public reader_base {
        public:
            explicit stream_reader(std::istream& is);

            using reader_base::read;
            std::size_t read(void* dst, std::size_t size) override;
            std::uint64_t tell() const override { return m_consumed; }

            // Absolute stream position the reader started at, 0 if unknown
            [[nodiscard]] std::uint64_t start_offset() const { return m_start; }

        private:
            std::istream& m_stream;
            std::uint64_t m_start;
            std::uint64_t m_consumed;
    };

    // Appends encoded fields to a byte buffer
    class writer {
        public:
            explicit writer(std::vector<std::byte>& buffer) : m_buffer(buffer) {}

            void write(const void* src, std::size_t size);

            template<typename T>
            void write(T value, byte_order bo) {
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                write(&value, sizeof(T));
            }

            void write_tag(const type_tag& tag);

        private:
            std::vector<std::byte>& m_buffer;
    };
}
