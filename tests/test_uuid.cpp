#include <catch2/catch.hpp>
#include <scribe/uuid.hpp>
#include <set>

using namespace scribe;

TEST_CASE("UUID v4 version and variant bits", "[uuid]") {
    auto u = Uuid::v4();
    REQUIRE((u.bytes[6] & 0xF0) == 0x40);
    REQUIRE((u.bytes[8] & 0xC0) == 0x80);
}

TEST_CASE("UUID v4 generates unique values", "[uuid]") {
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        auto s = new_id();
        REQUIRE(seen.insert(s).second);
    }
}

TEST_CASE("UUID to_string format", "[uuid]") {
    auto s = Uuid::v4().to_string();
    REQUIRE(s.size() == 36);
    REQUIRE(s[8] == '-');
    REQUIRE(s[13] == '-');
    REQUIRE(s[14] == '4');
    REQUIRE(s[18] == '-');
    REQUIRE(s[23] == '-');
}

TEST_CASE("UUID text is lowercase hex", "[uuid]") {
    for (int i = 0; i < 50; ++i) {
        auto s = new_id();
        for (size_t j = 0; j < s.size(); ++j) {
            if (j == 8 || j == 13 || j == 18 || j == 23) continue;
            char c = s[j];
            REQUIRE(((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')));
        }
    }
}
