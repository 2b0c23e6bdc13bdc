/**
 * @file endian.hh
 * @brief Byte swapping and big-endian load/store helpers
 *
 * All multi-byte integers in a chunk are stored in network (big-endian)
 * order. Platform endianness comes from the CMake-generated config header.
 */

#pragma once

#include <cstdint>
#include <cstring>

#include <pngchunk/pngchunk_config.h>

namespace pngchunk {
    // Platform endianness detection using CMake-generated config
#if PNGCHUNK_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    inline std::uint32_t swap32(std::uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    inline std::uint32_t swap32be(std::uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }

    /**
     * @brief Read a big-endian 32-bit value from 4 bytes
     * @param src Pointer to at least 4 readable bytes
     * @return Value in host byte order
     */
    inline std::uint32_t load_be32(const void* src) {
        std::uint32_t value;
        std::memcpy(&value, src, sizeof(value));
        return swap32be(value);
    }

    /**
     * @brief Write a 32-bit value as 4 big-endian bytes
     * @param dst Pointer to at least 4 writable bytes
     * @param value Value in host byte order
     */
    inline void store_be32(void* dst, std::uint32_t value) {
        value = swap32be(value);
        std::memcpy(dst, &value, sizeof(value));
    }
}
