/**
 * @file chunk_type.hh
 * @brief Four byte chunk type tag with case encoded property bits
 *
 * A chunk type is four ASCII letters. Bit 5 of every letter (the bit that
 * separates upper from lower case) carries a property of the chunk:
 *
 * | byte | uppercase          | lowercase          |
 * |------|--------------------|--------------------|
 * | 0    | critical           | ancillary          |
 * | 1    | public             | private            |
 * | 2    | reserved bit valid | reserved bit unset |
 * | 3    | unsafe to copy     | safe to copy       |
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <ostream>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    class PNGCHUNK_EXPORT chunk_type {
    public:
        using bytes_type = std::array<std::uint8_t, 4>;

        /**
         * @brief Construct from 4 individual bytes
         * @throws bad_byte for the first byte that is not an ASCII letter
         */
        chunk_type(std::uint8_t b0, std::uint8_t b1, std::uint8_t b2, std::uint8_t b3);

        /**
         * @brief Construct from a 4 byte array
         * @throws bad_byte for the first byte that is not an ASCII letter
         */
        explicit chunk_type(const bytes_type& bytes);

        /**
         * @brief Construct from text such as "IHDR"
         *
         * The length is counted in bytes and checked before any byte.
         *
         * @throws bad_length if text is not exactly 4 bytes long
         * @throws bad_byte for the first byte that is not an ASCII letter
         */
        explicit chunk_type(std::string_view text);

        // Raw bytes in wire order
        [[nodiscard]] const bytes_type& bytes() const { return m_bytes; }

        [[nodiscard]] bool is_critical() const { return bit_is_zero(m_bytes[0]); }
        [[nodiscard]] bool is_public() const { return bit_is_zero(m_bytes[1]); }
        [[nodiscard]] bool is_reserved_bit_valid() const { return bit_is_zero(m_bytes[2]); }

        // Polarity is inverted: a lowercase last letter means safe to copy
        [[nodiscard]] bool is_safe_to_copy() const { return !bit_is_zero(m_bytes[3]); }

        /**
         * @brief Check conformance of the tag
         * @return True if all bytes are ASCII letters and the reserved bit is valid
         *
         * A successfully constructed tag may still be invalid, e.g. "Rust".
         */
        [[nodiscard]] bool is_valid() const;

        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(m_bytes.data()), m_bytes.size()};
        }

        [[nodiscard]] static constexpr bool is_valid_byte(std::uint8_t b) {
            return (b >= 'A' && b <= 'Z') || (b >= 'a' && b <= 'z');
        }

        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }

        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            return os << t.to_string();
        }

    private:
        static constexpr std::uint8_t case_bit = 1u << 5;

        static constexpr bool bit_is_zero(std::uint8_t b) {
            return (b & case_bit) == 0;
        }

        bytes_type m_bytes;
    };

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            const auto& b = t.bytes();
            std::uint32_t v = (std::uint32_t(b[0]) << 24) | (std::uint32_t(b[1]) << 16) |
                              (std::uint32_t(b[2]) << 8) | std::uint32_t(b[3]);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

} // namespace pngchunk

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
