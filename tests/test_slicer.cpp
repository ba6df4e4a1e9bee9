#include <doctest/doctest.h>
#include "envelope.hpp"
#include "slicer.hpp"
#include "transfer_error.hpp"

TEST_CASE("250 chars at chunk size 100 give chunks of 100, 100 and 50") {
    std::string text(250, 'x');
    auto chunks = slice_text(text, 100);

    REQUIRE(chunks.size() == 3);
    CHECK(chunks[0].text.size() == 100);
    CHECK(chunks[1].text.size() == 100);
    CHECK(chunks[2].text.size() == 50);
}

TEST_CASE("Chunk indices are dense and concatenation restores the text") {
    std::string text;
    for (int i = 0; i < 97; ++i) text += static_cast<char>('a' + i % 26);

    auto chunks = slice_text(text, 10);
    REQUIRE(chunks.size() == 10);

    std::string joined;
    for (size_t i = 0; i < chunks.size(); ++i) {
        CHECK(chunks[i].index == i);
        joined += chunks[i].text;
    }
    CHECK(joined == text);
}

TEST_CASE("Exact multiple of chunk size has no empty tail chunk") {
    auto chunks = slice_text(std::string(300, 'a'), 100);
    CHECK(chunks.size() == 3);
    CHECK(chunks.back().text.size() == 100);
}

TEST_CASE("Empty text yields no chunks") {
    CHECK(slice_text("", 5).empty());
}

TEST_CASE("Zero chunk size is rejected") {
    try {
        slice_text("abc", 0);
        FAIL("expected TransferError");
    } catch (const TransferError& e) {
        CHECK(e.kind() == ErrorKind::InvalidArgument);
    }
}

TEST_CASE("Chunk size counts code points, not bytes") {
    std::string zhong = "\xE4\xB8\xAD";  // U+4E2D
    std::string text;
    for (int i = 0; i < 250; ++i) text += zhong;

    auto chunks = slice_text(text, 100);
    REQUIRE(chunks.size() == 3);
    CHECK(count_code_points(chunks[0].text) == 100);
    CHECK(count_code_points(chunks[1].text) == 100);
    CHECK(count_code_points(chunks[2].text) == 50);
    CHECK(chunks[0].text.size() == 300);
    for (const auto& c : chunks)
        CHECK(is_valid_utf8(std::vector<uint8_t>(c.text.begin(), c.text.end())));

    std::string joined;
    for (const auto& c : chunks) joined += c.text;
    CHECK(joined == text);
}

TEST_CASE("No chunk ends inside a multi-byte sequence") {
    // ASCII, 2-, 3- and 4-byte sequences interleaved
    std::string unit = "a\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x98\x80";
    std::string text;
    for (int i = 0; i < 30; ++i) text += unit;

    for (size_t size : {1, 2, 3, 5, 7}) {
        auto chunks = slice_text(text, size);
        CHECK(chunks.size() == (120 + size - 1) / size);
        std::string joined;
        for (const auto& c : chunks) {
            REQUIRE_FALSE(c.text.empty());
            unsigned char first = static_cast<unsigned char>(c.text.front());
            CHECK((first & 0xC0) != 0x80);
            joined += c.text;
        }
        CHECK(joined == text);
    }
}

TEST_CASE("Stray continuation bytes count as single units") {
    std::string text = "\x80\x80" "ab";
    CHECK(count_code_points(text) == 4);
    auto chunks = slice_text(text, 3);
    REQUIRE(chunks.size() == 2);
    CHECK(chunks[1].text == "b");
}
