//
// Test warning callback functionality for advisory tag flags
//

#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/decode_options.hh>

#include <algorithm>
#include <sstream>
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

TEST_CASE("Warning callbacks - reserved_bit") {
    SUBCASE("reserved bit set is reported but accepted") {
        auto bytes = chunk::from_text(type_tag::from_text("Rust"), "payload").encode();

        warning_tracker tracker;
        decode_options opts;
        opts.on_warning = std::ref(tracker);

        auto c = chunk::decode(bytes, opts);
        CHECK(c.chunk_type().to_string() == "Rust");
        REQUIRE(tracker.warnings.size() == 1);
        CHECK(tracker.warnings[0].category == "reserved_bit");
        CHECK(tracker.warnings[0].offset == 0);
        CHECK(tracker.warnings[0].message.find("'Rust'") != std::string::npos);
    }

    SUBCASE("conforming tags produce no warnings") {
        warning_tracker tracker;
        decode_options opts;
        opts.on_warning = std::ref(tracker);

        (void)chunk::decode(load_test_data("secret_message.chunk"), opts);
        (void)chunk::decode(load_test_data("iend.chunk"), opts);
        CHECK(tracker.warnings.empty());
    }

    SUBCASE("no handler installed") {
        auto bytes = chunk::from_text(type_tag::from_text("Rust"), "payload").encode();
        CHECK_NOTHROW(chunk::decode(bytes));
    }

    SUBCASE("rejected chunks produce no warnings") {
        auto bytes = make_chunk_bytes(7, "Rust", "payload", 0);

        warning_tracker tracker;
        decode_options opts;
        opts.on_warning = std::ref(tracker);

        CHECK_THROWS_AS(chunk::decode(bytes, opts), checksum_mismatch_error);
        CHECK_FALSE(tracker.has_warning("reserved_bit"));
    }

    SUBCASE("stream offsets") {
        std::stringstream ss;
        chunk(tags::IEND, {}).write(ss);
        chunk::from_text(type_tag::from_text("Rust"), "payload").write(ss);
        ss.seekg(0);

        warning_tracker tracker;
        decode_options opts;
        opts.on_warning = std::ref(tracker);

        (void)chunk::read(ss, opts);
        (void)chunk::read(ss, opts);
        REQUIRE(tracker.warnings.size() == 1);
        CHECK(tracker.has_warning("reserved_bit"));
        CHECK(tracker.warnings[0].offset == 12);
    }
}
