/**
 * @file crc.hh
 * @brief CRC-32 (ISO-HDLC) checksum used to protect chunks
 *
 * This is the CRC-32 of zlib, PNG and Ethernet: reflected polynomial
 * 0xEDB88320, initial value and final xor 0xFFFFFFFF.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @brief Extend a running CRC-32 with more bytes
     * @param crc Checksum of the bytes seen so far (0 for none)
     * @param data Bytes to append
     * @param size Number of bytes
     * @return Checksum of the concatenation
     */
    PNGCHUNK_EXPORT std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t size);

    /**
     * @brief CRC-32 of a single byte range
     */
    inline std::uint32_t crc32(const void* data, std::size_t size) {
        return crc32_update(0, data, size);
    }

} // namespace pngchunk
