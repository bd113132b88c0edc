#include "test_common.hpp"
#include "parse_utils.hpp"
#include <climits>
#include <cstdint>

TEST_CASE("parse_int validates range and format") {
    bool ok = false;
    REQUIRE(parse_int("42", 0, 100, ok) == 42);
    REQUIRE(ok);
    REQUIRE(parse_int("+7", 0, 100, ok) == 7);
    REQUIRE(ok);
    REQUIRE(parse_int("-3", -5, 5, ok) == -3);
    REQUIRE(ok);
    parse_int("101", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_int("12abc", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_int("", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_int("99999999999999999999", INT_MIN, INT_MAX, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_size_t rejects negatives") {
    bool ok = false;
    REQUIRE(parse_size_t("5", 1, 100, ok) == 5);
    REQUIRE(ok);
    parse_size_t("-1", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("0", 1, 100, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bytes understands unit suffixes") {
    bool ok = false;
    REQUIRE(parse_bytes("512", 0, SIZE_MAX, ok) == 512);
    REQUIRE(ok);
    REQUIRE(parse_bytes("10b", 0, SIZE_MAX, ok) == 10);
    REQUIRE(parse_bytes("2K", 0, SIZE_MAX, ok) == 2048);
    REQUIRE(parse_bytes("2kb", 0, SIZE_MAX, ok) == 2048);
    REQUIRE(parse_bytes("3M", 0, SIZE_MAX, ok) == 3u * 1024 * 1024);
    REQUIRE(parse_bytes("1GB", 0, SIZE_MAX, ok) == 1024ull * 1024 * 1024);
    REQUIRE(ok);
    parse_bytes("5T", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
    parse_bytes("kb", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
    parse_bytes("-1K", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
    parse_bytes("2M", 0, 1024, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_duration defaults to seconds") {
    bool ok = false;
    REQUIRE(parse_duration("90", ok) == std::chrono::seconds(90));
    REQUIRE(ok);
    REQUIRE(parse_duration("30s", ok) == std::chrono::seconds(30));
    REQUIRE(parse_duration("5m", ok) == std::chrono::minutes(5));
    REQUIRE(parse_duration("2h", ok) == std::chrono::hours(2));
    REQUIRE(parse_duration("1d", ok) == std::chrono::hours(24));
    REQUIRE(ok);
    parse_duration("5x", ok);
    REQUIRE_FALSE(ok);
    parse_duration("m", ok);
    REQUIRE_FALSE(ok);
    parse_duration("-5s", ok);
    REQUIRE_FALSE(ok);
    parse_duration("", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bool accepts common spellings") {
    bool ok = false;
    for (const char* yes : {"", "1", "true", "YES", "On"}) {
        REQUIRE(parse_bool(yes, ok));
        REQUIRE(ok);
    }
    for (const char* no : {"0", "false", "No", "OFF"}) {
        REQUIRE_FALSE(parse_bool(no, ok));
        REQUIRE(ok);
    }
    REQUIRE_FALSE(parse_bool("maybe", ok));
    REQUIRE_FALSE(ok);
}
