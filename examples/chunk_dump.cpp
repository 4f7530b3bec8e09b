/**
 * @file chunk_dump.cpp
 * @brief Simple example demonstrating basic libpngchunk usage
 *
 * Builds a chunk carrying a text message, encodes it, decodes the bytes
 * back and prints what was recovered.
 */

#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>
#include <iostream>
#include <iomanip>

int main() {
    using namespace pngchunk;

    try {
        auto original = chunk::from_text(type_tag::from_text("RuSt"),
                                         "This is where your secret message will be!");
        auto bytes = original.encode();

        std::cout << "Encoded " << bytes.size() << " bytes:\n";
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            std::cout << std::hex << std::setw(2) << std::setfill('0')
                      << std::to_integer<unsigned>(bytes[i])
                      << ((i % 16 == 15) ? '\n' : ' ');
        }
        std::cout << std::dec << "\n\n";

        decode_options opts;
        opts.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "Warning at " << offset << " [" << category << "]: " << message << "\n";
        };

        auto decoded = chunk::decode(bytes, opts);
        const auto& tag = decoded.chunk_type();

        std::cout << decoded << "\n";
        std::cout << "  critical:       " << std::boolalpha << tag.is_critical() << "\n";
        std::cout << "  public:         " << tag.is_public() << "\n";
        std::cout << "  reserved valid: " << tag.is_reserved_bit_valid() << "\n";
        std::cout << "  safe to copy:   " << tag.is_safe_to_copy() << "\n";
        std::cout << "  message:        " << decoded.data_as_string() << "\n";

        // A single flipped bit must be caught by the checksum
        bytes[10] ^= std::byte{0x01};
        try {
            (void)chunk::decode(bytes);
            std::cerr << "Error: corrupted chunk was accepted\n";
            return 1;
        } catch (const checksum_mismatch_error& e) {
            std::cout << "\nCorruption detected: " << e.what() << "\n";
        }

    } catch (const chunk_error& e) {
        std::cerr << "Error (" << to_string(e.code()) << "): " << e.what() << "\n";
        return 1;
    }

    return 0;
}
