/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the chunk codec
 * @author Igor
 * @date 02/09/2025
 *
 * Every failure of the codec is reported as an exception derived from
 * chunk_error. The concrete type and the attached error_code tell the
 * caller which rule was violated.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace pngchunk {

    /**
     * @enum error_code
     * @brief Kind of failure carried by every chunk_error
     */
    enum class error_code {
        invalid_tag,       ///< Tag bytes are not all ASCII letters
        truncated_input,   ///< Fewer bytes than the fixed chunk fields need
        length_mismatch,   ///< Declared length differs from the payload span
        checksum_mismatch, ///< Trailing CRC differs from the recomputed one
        not_utf8_text,     ///< Payload is not valid UTF-8
        size_limit,        ///< Declared length exceeds decode_options::max_length
        io                 ///< Stream read or write failed
    };

    /**
     * @brief Get a stable name for an error code
     * @param code Error code
     * @return Name such as "checksum_mismatch"
     */
    inline const char* to_string(error_code code) {
        switch (code) {
            case error_code::invalid_tag:
                return "invalid_tag";
            case error_code::truncated_input:
                return "truncated_input";
            case error_code::length_mismatch:
                return "length_mismatch";
            case error_code::checksum_mismatch:
                return "checksum_mismatch";
            case error_code::not_utf8_text:
                return "not_utf8_text";
            case error_code::size_limit:
                return "size_limit";
            case error_code::io:
                return "io";
        }
        // make compiler happy
        return "unknown";
    }

    /**
     * @class chunk_error
     * @brief Base exception class for all codec errors
     *
     * Catching chunk_error catches every failure the library reports.
     */
    class chunk_error : public std::runtime_error {
    public:
        chunk_error(error_code code, const std::string& msg)
            : std::runtime_error(msg), m_code(code) {}

        [[nodiscard]] error_code code() const noexcept { return m_code; }

    private:
        error_code m_code;
    };

    /**
     * @class invalid_tag_error
     * @brief A type tag contains a byte that is not an ASCII letter
     */
    class invalid_tag_error : public chunk_error {
    public:
        explicit invalid_tag_error(const std::string& msg)
            : chunk_error(error_code::invalid_tag, msg) {}
    };

    /**
     * @class truncated_input_error
     * @brief Input ends before the fixed length, tag and checksum fields
     */
    class truncated_input_error : public chunk_error {
    public:
        explicit truncated_input_error(const std::string& msg)
            : chunk_error(error_code::truncated_input, msg) {}
    };

    /**
     * @class length_mismatch_error
     * @brief Declared length does not equal the supplied payload span
     */
    class length_mismatch_error : public chunk_error {
    public:
        explicit length_mismatch_error(const std::string& msg)
            : chunk_error(error_code::length_mismatch, msg) {}
    };

    /**
     * @class checksum_mismatch_error
     * @brief Stored CRC does not match the CRC of tag and payload
     */
    class checksum_mismatch_error : public chunk_error {
    public:
        explicit checksum_mismatch_error(const std::string& msg)
            : chunk_error(error_code::checksum_mismatch, msg) {}
    };

    /**
     * @class not_utf8_text_error
     * @brief Payload cannot be viewed as UTF-8 text
     */
    class not_utf8_text_error : public chunk_error {
    public:
        explicit not_utf8_text_error(const std::string& msg)
            : chunk_error(error_code::not_utf8_text, msg) {}
    };

    /**
     * @class size_limit_error
     * @brief Declared length is larger than the configured limit
     */
    class size_limit_error : public chunk_error {
    public:
        explicit size_limit_error(const std::string& msg)
            : chunk_error(error_code::size_limit, msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when reading from or writing to a stream fails.
     */
    class io_error : public chunk_error {
    public:
        explicit io_error(const std::string& msg)
            : chunk_error(error_code::io, msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_CHUNK
     * @brief Throw a chunk_error subclass with formatted message
     * @param type Exception class name inside namespace pngchunk
     * @param ... Variable arguments to format into error message
     */
    #define THROW_CHUNK(type, ...) \
        throw ::pngchunk::type(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_CHUNK_IF
     * @brief Conditionally throw a chunk_error subclass
     */
    #define THROW_CHUNK_IF(condition, type, ...) \
        do { if (condition) THROW_CHUNK(type, __VA_ARGS__); } while(0)

    /**
     * @def THROW_CHUNK_UNLESS
     * @brief Throw a chunk_error subclass unless condition is true
     */
    #define THROW_CHUNK_UNLESS(condition, type, ...) \
        do { if (!(condition)) THROW_CHUNK(type, __VA_ARGS__); } while(0)

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) THROW_CHUNK(io_error, __VA_ARGS__)

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
