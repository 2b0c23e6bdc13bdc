/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the chunk codec
 *
 * This file defines the exception hierarchy used to classify every failure
 * of chunk type construction, chunk parsing and payload decoding. Each
 * exception carries the diagnostic values that caused it.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <sstream>
#include <utility>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

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
     * @class pngchunk_error
     * @brief Base exception class for all codec errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every codec failure with a single catch block.
     */
    class PNGCHUNK_EXPORT pngchunk_error : public std::runtime_error {
    public:
        explicit pngchunk_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    // ------------------------------------------------------------------
    // Chunk type errors
    // ------------------------------------------------------------------

    /**
     * @class chunk_type_error
     * @brief Base class for malformed chunk type tags
     */
    class PNGCHUNK_EXPORT chunk_type_error : public pngchunk_error {
    public:
        explicit chunk_type_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class bad_byte
     * @brief A type tag byte is not an ASCII letter
     */
    class PNGCHUNK_EXPORT bad_byte : public chunk_type_error {
    public:
        explicit bad_byte(std::uint8_t byte)
            : chunk_type_error(build_error_msg("ChunkTypeError Bad byte: ", static_cast<unsigned>(byte))),
              m_byte(byte) {}

        [[nodiscard]] std::uint8_t byte() const { return m_byte; }

    private:
        std::uint8_t m_byte;
    };

    /**
     * @class bad_length
     * @brief A textual type tag is not exactly 4 bytes long
     */
    class PNGCHUNK_EXPORT bad_length : public chunk_type_error {
    public:
        bad_length(std::string text, std::size_t length)
            : chunk_type_error(build_error_msg("ChunkTypeError Bad length for ", text, " is ", length)),
              m_text(std::move(text)),
              m_length(length) {}

        [[nodiscard]] const std::string& text() const { return m_text; }
        [[nodiscard]] std::size_t length() const { return m_length; }

    private:
        std::string m_text;
        std::size_t m_length;
    };

    // ------------------------------------------------------------------
    // Chunk errors
    // ------------------------------------------------------------------

    /**
     * @class chunk_error
     * @brief Base class for errors raised while parsing or building a chunk
     */
    class PNGCHUNK_EXPORT chunk_error : public pngchunk_error {
    public:
        explicit chunk_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class read_error
     * @brief The input buffer ended before a parse stage had its bytes
     */
    class PNGCHUNK_EXPORT read_error : public chunk_error {
    public:
        read_error(std::size_t requested, std::size_t available)
            : chunk_error(build_error_msg("ChunkError reading chunk data: requested ", requested,
                                          " bytes, only ", available, " available")),
              m_requested(requested),
              m_available(available) {}

        [[nodiscard]] std::size_t requested() const { return m_requested; }
        [[nodiscard]] std::size_t available() const { return m_available; }

    private:
        std::size_t m_requested;
        std::size_t m_available;
    };

    /**
     * @class max_length_error
     * @brief Declared or supplied payload length exceeds the allowed limit
     */
    class PNGCHUNK_EXPORT max_length_error : public chunk_error {
    public:
        max_length_error(std::uint64_t length, std::uint64_t limit)
            : chunk_error(build_error_msg("ChunkError length is too long: ", length,
                                          " exceeds maximum of ", limit)),
              m_length(length),
              m_limit(limit) {}

        [[nodiscard]] std::uint64_t length() const { return m_length; }
        [[nodiscard]] std::uint64_t limit() const { return m_limit; }

    private:
        std::uint64_t m_length;
        std::uint64_t m_limit;
    };

    /**
     * @class invalid_chunk_type
     * @brief The type tag of a parsed chunk was rejected
     *
     * The message of the underlying chunk_type_error is preserved.
     */
    class PNGCHUNK_EXPORT invalid_chunk_type : public chunk_error {
    public:
        explicit invalid_chunk_type(const std::string& reason)
            : chunk_error(build_error_msg("ChunkError invalid chunk type: ", reason)) {}
    };

    /**
     * @class invalid_chunk_data
     * @brief Number of payload bytes read differs from the declared length
     */
    class PNGCHUNK_EXPORT invalid_chunk_data : public chunk_error {
    public:
        invalid_chunk_data(std::size_t actual, std::size_t expected)
            : chunk_error(build_error_msg("ChunkError invalid chunk Data (len ", actual,
                                          ") is the wrong length (expected ", expected, ")")),
              m_actual(actual),
              m_expected(expected) {}

        [[nodiscard]] std::size_t actual() const { return m_actual; }
        [[nodiscard]] std::size_t expected() const { return m_expected; }

    private:
        std::size_t m_actual;
        std::size_t m_expected;
    };

    /**
     * @class invalid_crc
     * @brief Stored checksum does not match the checksum of type and payload
     */
    class PNGCHUNK_EXPORT invalid_crc : public chunk_error {
    public:
        invalid_crc(std::uint32_t provided, std::uint32_t computed)
            : chunk_error(build_error_msg("ChunkError invalid crc: provided ", provided,
                                          ", computed ", computed)),
              m_provided(provided),
              m_computed(computed) {}

        [[nodiscard]] std::uint32_t provided() const { return m_provided; }
        [[nodiscard]] std::uint32_t computed() const { return m_computed; }

    private:
        std::uint32_t m_provided;
        std::uint32_t m_computed;
    };

    // ------------------------------------------------------------------
    // Payload decoding errors
    // ------------------------------------------------------------------

    /**
     * @class decode_error
     * @brief Chunk payload is not valid UTF-8 text
     */
    class PNGCHUNK_EXPORT decode_error : public pngchunk_error {
    public:
        explicit decode_error(std::size_t offset)
            : pngchunk_error(build_error_msg("invalid utf-8 sequence at offset ", offset)),
              m_offset(offset) {}

        [[nodiscard]] std::size_t offset() const { return m_offset; }

    private:
        std::size_t m_offset;
    };

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_CHUNK
     * @brief Throw a codec exception of the given type
     * @param type Exception class name in namespace pngchunk
     * @param ... Constructor arguments
     */
    #define THROW_CHUNK(type, ...) \
        throw ::pngchunk::type(__VA_ARGS__)

    /**
     * @def THROW_CHUNK_IF
     * @brief Conditionally throw a codec exception
     * @param condition Condition to check
     * @param type Exception class name in namespace pngchunk
     * @param ... Constructor arguments if condition is true
     */
    #define THROW_CHUNK_IF(condition, type, ...) \
        do { if (condition) THROW_CHUNK(type, __VA_ARGS__); } while(0)

    /**
     * @def THROW_CHUNK_UNLESS
     * @brief Throw a codec exception unless condition is true
     * @param condition Condition that must be true to avoid throwing
     * @param type Exception class name in namespace pngchunk
     * @param ... Constructor arguments if condition is false
     */
    #define THROW_CHUNK_UNLESS(condition, type, ...) \
        do { if (!(condition)) THROW_CHUNK(type, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
