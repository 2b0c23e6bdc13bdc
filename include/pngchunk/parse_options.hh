/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for chunk decoding
 */

#pragma once

#include <functional>
#include <limits>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @struct parse_options
     * @brief Configuration options for chunk::from_bytes
     *
     * Default-constructed options accept every chunk the wire format can
     * describe and ignore warnings.
     */
    struct parse_options {
        /**
         * @brief Maximum allowed payload length in bytes
         *
         * Chunks declaring a longer payload are rejected with
         * max_length_error before the payload is read. The default is
         * the largest value the 32-bit length field can hold.
         */
        std::uint32_t max_length = std::numeric_limits<std::uint32_t>::max();

        /**
         * @brief Strict chunk type mode
         *
         * When true, a type tag that is constructible but not valid
         * (reserved bit lowercase) is rejected with invalid_chunk_type.
         * When false, such chunks are accepted and a "reserved_bit"
         * warning is reported.
         */
        bool strict_type = false;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Offset in the input buffer the warning refers to
         * @param category Warning category ("reserved_bit", "trailing_data")
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
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
