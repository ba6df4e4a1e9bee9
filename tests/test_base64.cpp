#include <doctest/doctest.h>
#include "base64.hpp"

static std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

TEST_CASE("RFC 4648 test vectors") {
    CHECK(base64_encode(bytes_of("")) == "");
    CHECK(base64_encode(bytes_of("f")) == "Zg==");
    CHECK(base64_encode(bytes_of("fo")) == "Zm8=");
    CHECK(base64_encode(bytes_of("foo")) == "Zm9v");
    CHECK(base64_encode(bytes_of("foobar")) == "Zm9vYmFy");

    std::vector<uint8_t> out;
    REQUIRE(base64_decode("Zm9vYg==", out));
    CHECK(out == bytes_of("foob"));
    REQUIRE(base64_decode("Zm9vYmE=", out));
    CHECK(out == bytes_of("fooba"));
}

TEST_CASE("Every byte value survives encode and decode") {
    std::vector<uint8_t> all(256);
    for (int i = 0; i < 256; ++i) all[i] = static_cast<uint8_t>(i);

    std::vector<uint8_t> out;
    REQUIRE(base64_decode(base64_encode(all), out));
    CHECK(out == all);
}

TEST_CASE("Line breaks inside the encoding are ignored") {
    std::vector<uint8_t> out;
    REQUIRE(base64_decode("Zm9v\r\nYmFy\n", out));
    CHECK(out == bytes_of("foobar"));
}

TEST_CASE("Malformed encodings are rejected") {
    std::vector<uint8_t> out;
    CHECK_FALSE(base64_decode("Zm9", out));        // length
    CHECK_FALSE(base64_decode("Zm9v!mFy", out));   // alphabet
    CHECK_FALSE(base64_decode("Zg==Zm9v", out));   // padding in the middle
    CHECK_FALSE(base64_decode("Z===", out));       // too much padding
}
