//
// Cursor over an in-memory byte buffer used by the chunk parser
//

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <vector>

#include <pngchunk/exceptions.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    // Reads from a borrowed buffer; the buffer must outlive the reader
    class PNGCHUNK_EXPORT byte_reader {
        public:
            byte_reader(const std::uint8_t* data, std::size_t size);
            explicit byte_reader(const std::vector<std::uint8_t>& data);

            // Simple interface - returns number of bytes copied, 0 at end
            std::size_t read(void* dst, std::size_t size);

            // Convenience methods - throw read_error if the buffer is short
            std::vector<std::uint8_t> read_exact(std::size_t size);
            std::uint32_t read_be32();
            std::array<std::uint8_t, 4> read_array4();

            [[nodiscard]] std::size_t tell() const { return m_position; }
            [[nodiscard]] std::size_t size() const { return m_size; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }

        private:
            void require(std::size_t size) const;

            const std::uint8_t* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };
}
