#pragma once

#include <cstdint>
#include <fstream>
#include <filesystem>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "unittest_config.h"

// Load a file from unittest/data as a byte vector
inline std::vector<std::uint8_t> load_test_data(const std::string& name) {
    static std::filesystem::path root(UNITTEST_PATH_TO_DATA_FILES);
    std::ifstream stream(root / name, std::ios::binary);
    if (!stream.good()) {
        throw std::runtime_error("Cannot open test file: " + name);
    }
    return {std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
}

inline std::vector<std::uint8_t> to_bytes(std::string_view s) {
    return {s.begin(), s.end()};
}

inline void append_be32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v >> 24));
    out.push_back(static_cast<std::uint8_t>(v >> 16));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v));
}

// Hand-assembled wire image, independent of chunk::as_bytes()
inline std::vector<std::uint8_t> make_raw_chunk(std::uint32_t length, std::string_view type,
                                                std::string_view payload, std::uint32_t crc) {
    std::vector<std::uint8_t> out;
    append_be32(out, length);
    out.insert(out.end(), type.begin(), type.end());
    out.insert(out.end(), payload.begin(), payload.end());
    append_be32(out, crc);
    return out;
}

inline constexpr std::string_view secret_message = "This is where your secret message will be!";
inline constexpr std::uint32_t secret_message_crc = 2882656334u;
