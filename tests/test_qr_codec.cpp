#include <doctest/doctest.h>
#include "qr_codec.hpp"
#include "transfer_error.hpp"

TEST_CASE("Rendered symbol is scaled by box size and padded with a quiet zone") {
    TransferConfig config;
    QrCodec codec(config);

    cv::Mat symbol = codec.render("IDX:000:hello");
    REQUIRE_FALSE(symbol.empty());
    CHECK(symbol.rows == symbol.cols);
    CHECK(symbol.cols % config.box_size == 0);
    CHECK(symbol.cols >= (21 + 2 * config.border) * config.box_size);

    // quiet zone is white
    CHECK(symbol.at<uint8_t>(0, 0) == 255);
    CHECK(symbol.at<uint8_t>(config.border * config.box_size - 1, config.border * config.box_size - 1) == 255);
}

TEST_CASE("A rendered symbol scans back to the same text") {
    TransferConfig config;
    QrCodec codec(config);

    cv::Mat symbol = codec.render("IDX:004:QRTEXT:a.txt:hello world");
    std::vector<std::string> scanned = codec.scan(symbol, false);
    REQUIRE(scanned.size() == 1);
    CHECK(scanned[0] == "IDX:004:QRTEXT:a.txt:hello world");
}

TEST_CASE("Chunks beyond the version cap fail with ChunkTooLarge") {
    TransferConfig config;
    config.version_cap = 1;
    QrCodec codec(config);
    CHECK(codec.max_text_bytes() == 17);

    CHECK_NOTHROW(codec.render(std::string(17, 'a')));
    try {
        codec.render(std::string(18, 'a'));
        FAIL("expected TransferError");
    } catch (const TransferError& e) {
        CHECK(e.kind() == ErrorKind::ChunkTooLarge);
    }
}

TEST_CASE("Nothing to scan in a blank image") {
    QrCodec codec(TransferConfig{});
    CHECK(codec.scan(cv::Mat(200, 200, CV_8UC3, cv::Scalar::all(255)), false).empty());
    CHECK(codec.scan(cv::Mat(), false).empty());
}

TEST_CASE("Version cap outside 1..40 is refused") {
    TransferConfig config;
    config.version_cap = 41;
    CHECK_THROWS_AS(QrCodec{config}, TransferError);
}
