//
// Chunk type construction and validation
//

#include <algorithm>

#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>

namespace pngchunk {

    namespace {
        std::uint8_t checked_byte(std::uint8_t b) {
            THROW_CHUNK_UNLESS(chunk_type::is_valid_byte(b), bad_byte, b);
            return b;
        }
    }

    chunk_type::chunk_type(std::uint8_t b0, std::uint8_t b1, std::uint8_t b2, std::uint8_t b3)
        : m_bytes{checked_byte(b0), checked_byte(b1), checked_byte(b2), checked_byte(b3)} {}

    chunk_type::chunk_type(const bytes_type& bytes)
        : chunk_type(bytes[0], bytes[1], bytes[2], bytes[3]) {}

    chunk_type::chunk_type(std::string_view text)
        : m_bytes{} {
        THROW_CHUNK_IF(text.size() != m_bytes.size(), bad_length, std::string(text), text.size());
        for (std::size_t i = 0; i < m_bytes.size(); i++) {
            m_bytes[i] = checked_byte(static_cast<std::uint8_t>(text[i]));
        }
    }

    bool chunk_type::is_valid() const {
        return is_reserved_bit_valid() &&
               std::all_of(m_bytes.begin(), m_bytes.end(), [](std::uint8_t b) {
                   return is_valid_byte(b);
               });
    }

} // namespace pngchunk
