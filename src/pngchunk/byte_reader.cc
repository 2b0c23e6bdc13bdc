//
// Cursor over an in-memory byte buffer used by the chunk parser
//

#include <algorithm>
#include <cstring>

#include <pngchunk/endian.hh>
#include "byte_reader.hh"

namespace pngchunk {

    byte_reader::byte_reader(const std::uint8_t* data, std::size_t size)
        : m_data(data), m_size(data ? size : 0), m_position(0) {}

    byte_reader::byte_reader(const std::vector<std::uint8_t>& data)
        : byte_reader(data.data(), data.size()) {}

    std::size_t byte_reader::read(void* dst, std::size_t size) {
        if (size == 0) {
            return 0;
        }
        size = std::min(size, remaining());
        if (size == 0) {
            return 0;  // EOF-like behavior
        }
        std::memcpy(dst, m_data + m_position, size);
        m_position += size;
        return size;
    }

    void byte_reader::require(std::size_t size) const {
        // Checked before any allocation so a hostile length cannot reserve memory
        THROW_CHUNK_IF(size > remaining(), read_error, size, remaining());
    }

    std::vector<std::uint8_t> byte_reader::read_exact(std::size_t size) {
        require(size);
        std::vector<std::uint8_t> buffer(size);
        std::size_t actual = read(buffer.data(), size);
        buffer.resize(actual);
        return buffer;
    }

    std::uint32_t byte_reader::read_be32() {
        require(4);
        std::uint32_t value = load_be32(m_data + m_position);
        m_position += 4;
        return value;
    }

    std::array<std::uint8_t, 4> byte_reader::read_array4() {
        require(4);
        std::array<std::uint8_t, 4> result{};
        read(result.data(), result.size());
        return result;
    }
}
