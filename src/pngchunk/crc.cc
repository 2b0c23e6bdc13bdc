//
// CRC-32 (ISO-HDLC) on top of zlib
//

#include <algorithm>
#include <limits>

#include <zlib.h>

#include <pngchunk/crc.hh>

namespace pngchunk {

    std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t size) {
        if (size == 0) {
            return crc;
        }
        // zlib takes a uInt length, feed larger buffers in slices
        constexpr std::size_t max_slice = std::numeric_limits<uInt>::max();
        auto* p = static_cast<const Bytef*>(data);
        uLong value = crc;
        while (size > 0) {
            std::size_t slice = std::min(size, max_slice);
            value = ::crc32(value, p, static_cast<uInt>(slice));
            p += slice;
            size -= slice;
        }
        return static_cast<std::uint32_t>(value);
    }

} // namespace pngchunk
