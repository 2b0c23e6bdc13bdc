//
// Test warning callback functionality of the chunk parser
//

#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/parse_options.hh>

#include <algorithm>
#include <functional>
#include <string>
#include <vector>
#include "test_utils.hh"

using namespace pngchunk;

// Helper to track warnings
struct warning_tracker {
    struct warning_info {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    std::vector<warning_info> warnings;

    void operator()(std::uint64_t offset, std::string_view category, std::string_view message) {
        warnings.push_back({offset, std::string(category), std::string(message)});
    }

    bool has_warning(std::string_view category) const {
        return std::any_of(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; });
    }
};

TEST_CASE("Warning callbacks - trailing_data") {
    auto raw = make_raw_chunk(42, "RuSt", secret_message, secret_message_crc);
    raw.insert(raw.end(), {0, 0, 0, 0, 'I', 'E', 'N', 'D'});

    parse_options opts;
    warning_tracker tracker;
    opts.on_warning = std::ref(tracker);

    chunk c = chunk::from_bytes(raw, opts);
    CHECK(c.length() == 42);

    REQUIRE(tracker.warnings.size() == 1);
    CHECK(tracker.warnings[0].category == "trailing_data");
    CHECK(tracker.warnings[0].offset == 54);
    CHECK(tracker.warnings[0].message.find("8 bytes") != std::string::npos);
}

TEST_CASE("Warning callbacks - reserved_bit") {
    auto raw = make_raw_chunk(3, "Rust", "abc", 3800272534u);

    parse_options opts;
    warning_tracker tracker;
    opts.on_warning = std::ref(tracker);

    CHECK_NOTHROW(chunk::from_bytes(raw, opts));

    REQUIRE(tracker.warnings.size() == 1);
    CHECK(tracker.warnings[0].category == "reserved_bit");
    CHECK(tracker.warnings[0].offset == 4);
    CHECK(tracker.warnings[0].message.find("Rust") != std::string::npos);
}

TEST_CASE("Warning callbacks - silent cases") {
    SUBCASE("clean chunk produces no warnings") {
        parse_options opts;
        warning_tracker tracker;
        opts.on_warning = std::ref(tracker);

        chunk::from_bytes(make_raw_chunk(42, "RuSt", secret_message, secret_message_crc), opts);
        CHECK(tracker.warnings.empty());
    }

    SUBCASE("warnings issued before a failure are kept") {
        auto raw = make_raw_chunk(3, "Rust", "abc", 1);
        raw.push_back(0);

        parse_options opts;
        warning_tracker tracker;
        opts.on_warning = std::ref(tracker);

        CHECK_THROWS_AS(chunk::from_bytes(raw, opts), invalid_crc);
        // reserved bit is reported before the crc is checked
        CHECK(tracker.has_warning("reserved_bit"));
        CHECK_FALSE(tracker.has_warning("trailing_data"));
    }

    SUBCASE("strict mode throws instead of warning") {
        parse_options opts;
        opts.strict_type = true;
        warning_tracker tracker;
        opts.on_warning = std::ref(tracker);

        CHECK_THROWS_AS(chunk::from_bytes(make_raw_chunk(3, "Rust", "abc", 3800272534u), opts),
                        invalid_chunk_type);
        CHECK(tracker.warnings.empty());
    }

    SUBCASE("missing handler is fine") {
        auto raw = make_raw_chunk(3, "Rust", "abc", 3800272534u);
        raw.push_back(0);
        CHECK_NOTHROW(chunk::from_bytes(raw, parse_options{}));
    }
}
