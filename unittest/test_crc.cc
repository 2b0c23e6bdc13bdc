#include <doctest/doctest.h>
#include <pngchunk/crc.hh>

#include <string_view>

using namespace pngchunk;

TEST_CASE("CRC-32 ISO-HDLC") {
    SUBCASE("check value") {
        std::string_view s = "123456789";
        CHECK(crc32(s.data(), s.size()) == 0xCBF43926u);
    }

    SUBCASE("empty input") {
        CHECK(crc32(nullptr, 0) == 0u);
        CHECK(crc32_update(0x12345678u, nullptr, 0) == 0x12345678u);
    }

    SUBCASE("known text") {
        std::string_view s = "The quick brown fox jumps over the lazy dog";
        CHECK(crc32(s.data(), s.size()) == 0x414FA339u);
    }

    SUBCASE("incremental equals one shot") {
        std::string_view tag = "RuSt";
        std::string_view msg = "This is where your secret message will be!";
        std::uint32_t running = crc32(tag.data(), tag.size());
        running = crc32_update(running, msg.data(), msg.size());
        CHECK(running == 2882656334u);
    }
}
