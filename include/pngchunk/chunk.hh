/**
 * @file chunk.hh
 * @brief Length prefixed, CRC protected chunk record
 *
 * Wire layout (all integers big-endian):
 *
 * | field   | size     | content                              |
 * |---------|----------|--------------------------------------|
 * | length  | 4        | payload size in bytes                |
 * | type    | 4        | chunk_type letters                   |
 * | data    | length   | opaque payload                       |
 * | crc     | 4        | CRC-32 over type bytes and payload   |
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <iosfwd>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/parse_options.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class chunk
     * @brief Immutable chunk value
     *
     * A chunk in memory always satisfies length() == data().size() and
     * crc() == CRC-32(type bytes ++ data). Building one from a type and a
     * payload computes the checksum; parsing one verifies it.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        static constexpr std::size_t length_size = 4;
        static constexpr std::size_t type_size = 4;
        static constexpr std::size_t crc_size = 4;

        /// Bytes of framing around the payload
        static constexpr std::size_t overhead = length_size + type_size + crc_size;

        /**
         * @brief Build a chunk from a type and a payload
         * @param type Chunk type tag
         * @param data Payload, may be empty
         *
         * The payload size must fit in the 32-bit length field.
         *
         * @throws max_length_error if data holds more than 0xFFFFFFFF bytes
         */
        chunk(chunk_type type, std::vector<std::uint8_t> data);

        /**
         * @brief Parse and verify one chunk at the start of a buffer
         * @param data Pointer to the serialized chunk
         * @param size Number of bytes available
         * @return The verified chunk
         *
         * Bytes following the chunk are ignored.
         *
         * @throws read_error if the buffer ends inside the chunk
         * @throws invalid_chunk_type if the type tag is rejected
         * @throws invalid_crc if the stored checksum does not match
         */
        static chunk from_bytes(const std::uint8_t* data, std::size_t size);

        /**
         * @brief Parse and verify one chunk with custom options
         * @param data Pointer to the serialized chunk
         * @param size Number of bytes available
         * @param options Length limit, strictness and warning handler
         * @param consumed If not null, receives the number of bytes the chunk occupies
         * @return The verified chunk
         *
         * @throws max_length_error if the declared length exceeds options.max_length
         */
        static chunk from_bytes(const std::uint8_t* data, std::size_t size,
                                const parse_options& options,
                                std::size_t* consumed = nullptr);

        static chunk from_bytes(const std::vector<std::uint8_t>& raw);
        static chunk from_bytes(const std::vector<std::uint8_t>& raw,
                                const parse_options& options,
                                std::size_t* consumed = nullptr);

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::uint8_t>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /**
         * @brief Payload as text
         * @throws decode_error if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /**
         * @brief Serialize to the wire format
         * @return length, type, data and crc; overhead + length() bytes
         */
        [[nodiscard]] std::vector<std::uint8_t> as_bytes() const;

        /// Multi-line summary for diagnostics, not the wire format
        [[nodiscard]] std::string to_string() const;

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(std::uint32_t length, chunk_type type, std::vector<std::uint8_t> data, std::uint32_t crc);

        static std::uint32_t compute_crc(const chunk_type& type, const std::vector<std::uint8_t>& data);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::uint8_t> m_data;
        std::uint32_t m_crc;
    };

    /// Writes the same summary as chunk::to_string()
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngchunk
