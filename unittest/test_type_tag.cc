#include <doctest/doctest.h>
#include <pngchunk/type_tag.hh>
#include <pngchunk/exceptions.hh>

#include <sstream>
#include <unordered_map>
#include <set>

using namespace pngchunk;

TEST_SUITE("TYPE_TAG") {
    TEST_CASE("type_tag construction") {
        SUBCASE("from raw byte array") {
            type_tag t(std::array<std::uint8_t, 4>{82, 117, 83, 116});
            CHECK(t.bytes() == std::array<std::uint8_t, 4>{82, 117, 83, 116});
            CHECK(t.to_string() == "RuSt");
        }

        SUBCASE("from_bytes does not validate") {
            unsigned char binary[4] = {0x01, 'u', '1', 0xFF};
            type_tag t = type_tag::from_bytes(binary);
            CHECK(t[0] == 0x01);
            CHECK(t[2] == '1');
            CHECK(static_cast<unsigned char>(t[3]) == 0xFF);
            CHECK_FALSE(t.is_valid());
        }

        SUBCASE("from_text matches from bytes") {
            auto expected = type_tag(std::array<std::uint8_t, 4>{82, 117, 83, 116});
            auto actual = type_tag::from_text("RuSt");
            CHECK(expected == actual);
        }

        SUBCASE("from_text uses only the first four bytes") {
            auto t = type_tag::from_text("IENDxyz1");
            CHECK(t.to_string() == "IEND");
        }

        SUBCASE("from_text rejects non-alphabetic bytes") {
            CHECK_THROWS_AS(type_tag::from_text("Ru1t"), invalid_tag_error);
            CHECK_THROWS_AS(type_tag::from_text("Ru t"), invalid_tag_error);
            CHECK_THROWS_AS(type_tag::from_text("RuS@"), invalid_tag_error);
            CHECK_THROWS_AS(type_tag::from_text("[uSt"), invalid_tag_error);
            CHECK_THROWS_AS(type_tag::from_text(std::string_view("Ru\0t", 4)), invalid_tag_error);
        }

        SUBCASE("from_text rejects short input") {
            CHECK_THROWS_AS(type_tag::from_text("Ru"), invalid_tag_error);
            CHECK_THROWS_AS(type_tag::from_text(""), invalid_tag_error);
        }

        SUBCASE("from_text error carries the error code") {
            try {
                (void)type_tag::from_text("Ru1t");
                FAIL("Expected invalid_tag_error");
            } catch (const chunk_error& e) {
                CHECK(e.code() == error_code::invalid_tag);
            }
        }
    }

    TEST_CASE("type_tag validity") {
        CHECK(type_tag::from_text("RuSt").is_valid());
        CHECK(type_tag::from_text("Rust").is_valid());
        CHECK(type_tag('a', 'Z', 'z', 'A').is_valid());
        CHECK_FALSE(type_tag('R', 'u', '1', 't').is_valid());
        CHECK_FALSE(type_tag('@', 'A', 'A', 'A').is_valid());
        CHECK_FALSE(type_tag('A', 'A', 'A', '{').is_valid());
        CHECK_FALSE(type_tag().is_valid());
    }

    TEST_CASE("type_tag property bits") {
        SUBCASE("RuSt") {
            auto t = type_tag::from_text("RuSt");
            CHECK(t.is_critical());
            CHECK_FALSE(t.is_public());
            CHECK(t.is_reserved_bit_valid());
            CHECK(t.is_safe_to_copy());
        }

        SUBCASE("ancillary bit") {
            CHECK(type_tag::from_text("RuSt").is_critical());
            CHECK_FALSE(type_tag::from_text("ruSt").is_critical());
        }

        SUBCASE("private bit") {
            CHECK(type_tag::from_text("RUSt").is_public());
            CHECK_FALSE(type_tag::from_text("RuSt").is_public());
        }

        SUBCASE("reserved bit") {
            CHECK(type_tag::from_text("RuSt").is_reserved_bit_valid());
            CHECK_FALSE(type_tag::from_text("Rust").is_reserved_bit_valid());
        }

        SUBCASE("safe-to-copy bit") {
            CHECK(type_tag::from_text("RuSt").is_safe_to_copy());
            CHECK_FALSE(type_tag::from_text("RuST").is_safe_to_copy());
        }

        SUBCASE("well-known PNG chunks") {
            CHECK(tags::IHDR.is_critical());
            CHECK(tags::IHDR.is_public());
            CHECK_FALSE(tags::IHDR.is_safe_to_copy());
            CHECK(tags::IEND.is_critical());
            CHECK_FALSE(tags::tEXt.is_critical());
            CHECK(tags::tEXt.is_public());
            CHECK(tags::tEXt.is_safe_to_copy());
            CHECK_FALSE(tags::tIME.is_safe_to_copy());
            CHECK(tags::pHYs.is_safe_to_copy());
        }

        SUBCASE("flags are computable on invalid tags") {
            type_tag t('1', '1', '1', '1');
            CHECK_FALSE(t.is_valid());
            // '1' is 0x31, bit 5 set
            CHECK_FALSE(t.is_critical());
            CHECK_FALSE(t.is_public());
            CHECK_FALSE(t.is_reserved_bit_valid());
            CHECK(t.is_safe_to_copy());
        }
    }

    TEST_CASE("type_tag conversions") {
        SUBCASE("to_string is the inverse of from_text") {
            CHECK(type_tag::from_text("RuSt").to_string() == "RuSt");
            CHECK(type_tag::from_text("IHDR").to_string() == "IHDR");
            CHECK(type_tag::from_text("zTXt").to_string_view() == "zTXt");
        }

        SUBCASE("to_uint32 is big-endian") {
            CHECK(type_tag::from_text("RuSt").to_uint32() == 0x52755374u);
            CHECK(tags::IEND.to_uint32() == 0x49454E44u);
        }

        SUBCASE("to_bytes") {
            char out[4] = {};
            tags::IDAT.to_bytes(out);
            CHECK(std::string(out, 4) == "IDAT");
        }
    }

    TEST_CASE("type_tag comparison and hashing") {
        auto a = type_tag::from_text("RuSt");
        auto b = type_tag::from_text("RuSt");
        auto c = type_tag::from_text("Rust");

        CHECK(a == b);
        CHECK(a != c);
        CHECK((a < c || c < a));

        std::unordered_map<type_tag, int> counts;
        counts[a]++;
        counts[b]++;
        counts[c]++;
        CHECK(counts.size() == 2);
        CHECK(counts[a] == 2);

        std::set<type_tag> ordered{tags::IHDR, tags::IDAT, tags::IEND, tags::IDAT};
        CHECK(ordered.size() == 3);

        CHECK(type_tag_hash{}(a) == std::hash<type_tag>{}(b));
    }

    TEST_CASE("type_tag literal") {
        constexpr auto t = "RuSt"_tag;
        static_assert(t.is_valid(), "literal tag must be valid");
        static_assert(!t.is_public(), "lowercase second letter is private");
        CHECK(t == type_tag::from_text("RuSt"));
        CHECK_THROWS_AS(operator""_tag("Ru1t", 4), std::invalid_argument);
        CHECK_THROWS_AS(operator""_tag("Ru", 2), std::invalid_argument);
    }

    TEST_CASE("type_tag stream output") {
        SUBCASE("quoted text") {
            std::ostringstream oss;
            oss << type_tag::from_text("RuSt");
            CHECK(oss.str() == "'RuSt'");
        }

        SUBCASE("non-printable bytes are escaped") {
            std::ostringstream oss;
            oss << type_tag('R', '\x01', 'S', 't') << ' ' << 10;
            CHECK(oss.str() == "'R\\x01St' 10");
        }

        SUBCASE("hex mode") {
            std::ostringstream oss;
            oss << std::hex << tags::IEND;
            CHECK(oss.str() == "0x49454e44");
        }
    }
}
