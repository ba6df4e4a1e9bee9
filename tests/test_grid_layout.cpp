#include <doctest/doctest.h>
#include "grid_layout.hpp"
#include "transfer_error.hpp"

static cv::Mat black(int w, int h) {
    return cv::Mat(h, w, CV_8UC1, cv::Scalar(0));
}

static bool is_white(const cv::Mat& canvas, int x, int y) {
    return canvas.at<cv::Vec3b>(y, x) == cv::Vec3b(255, 255, 255);
}

TEST_CASE("Seven symbols default to a 3x3 grid") {
    GridSpec g = compute_grid(7, std::nullopt, std::nullopt);
    CHECK(g.cols == 3);
    CHECK(g.rows == 3);
}

TEST_CASE("Square and single symbol grids") {
    GridSpec one = compute_grid(1, std::nullopt, std::nullopt);
    CHECK(one.rows == 1);
    CHECK(one.cols == 1);

    GridSpec nine = compute_grid(9, std::nullopt, std::nullopt);
    CHECK(nine.rows == 3);
    CHECK(nine.cols == 3);

    GridSpec ten = compute_grid(10, std::nullopt, std::nullopt);
    CHECK(ten.cols == 4);
    CHECK(ten.rows == 3);
}

TEST_CASE("Missing dimension is derived by ceiling division") {
    GridSpec by_cols = compute_grid(7, std::nullopt, 2);
    CHECK(by_cols.cols == 2);
    CHECK(by_cols.rows == 4);

    GridSpec by_rows = compute_grid(7, 2, std::nullopt);
    CHECK(by_rows.rows == 2);
    CHECK(by_rows.cols == 4);
}

TEST_CASE("Grids that cannot hold every symbol are rejected") {
    CHECK_THROWS_AS(compute_grid(7, 2, 3), TransferError);
    CHECK_THROWS_AS(compute_grid(0, std::nullopt, std::nullopt), TransferError);
    CHECK_THROWS_AS(compute_grid(3, 0, std::nullopt), TransferError);
    CHECK_THROWS_AS(compute_grid(3, std::nullopt, -1), TransferError);
    CHECK_NOTHROW(compute_grid(6, 2, 3));
}

TEST_CASE("Canvas size follows cells, spacing and margin") {
    TransferConfig config;
    config.spacing = 20;
    config.margin = 5;

    std::vector<cv::Mat> images = {black(30, 30), black(50, 40), black(30, 30)};
    GridSpec spec;
    cv::Mat canvas = compose_grid(images, std::nullopt, std::nullopt, config, &spec);

    CHECK(spec.rows == 2);
    CHECK(spec.cols == 2);
    CHECK(spec.cell_width == 50);
    CHECK(spec.cell_height == 40);
    CHECK(canvas.cols == 2 * 50 + 20 + 2 * 5);
    CHECK(canvas.rows == 2 * 40 + 20 + 2 * 5);
    CHECK(canvas.type() == CV_8UC3);
}

TEST_CASE("Smaller symbols are centered in their cell and unused cells stay blank") {
    TransferConfig config;
    config.spacing = 10;
    config.margin = 0;

    std::vector<cv::Mat> images = {black(20, 20), black(40, 40), black(20, 20)};
    GridSpec spec;
    cv::Mat canvas = compose_grid(images, std::nullopt, std::nullopt, config, &spec);

    // cell 0 origin (0,0): 20x20 image is offset by 10 in a 40x40 cell
    CHECK(is_white(canvas, 5, 5));
    CHECK_FALSE(is_white(canvas, 15, 15));
    CHECK_FALSE(is_white(canvas, 29, 29));
    CHECK(is_white(canvas, 35, 35));

    // cell 1 origin (50,0) fully covered
    CHECK_FALSE(is_white(canvas, 50, 0));
    CHECK_FALSE(is_white(canvas, 89, 39));

    // spacing column between cells
    CHECK(is_white(canvas, 45, 20));

    // cell 3 (row 1, col 1) has no symbol
    cv::Point origin = spec.cell_origin(3);
    CHECK(origin == cv::Point(50, 50));
    for (int y = origin.y; y < origin.y + spec.cell_height; y += 7)
        for (int x = origin.x; x < origin.x + spec.cell_width; x += 7)
            CHECK(is_white(canvas, x, y));
}

TEST_CASE("Placement is row-major") {
    GridSpec spec;
    spec.rows = 2;
    spec.cols = 3;
    spec.cell_width = 10;
    spec.cell_height = 12;
    spec.spacing = 2;
    spec.margin = 4;

    CHECK(spec.cell_origin(0) == cv::Point(4, 4));
    CHECK(spec.cell_origin(2) == cv::Point(4 + 2 * 12, 4));
    CHECK(spec.cell_origin(4) == cv::Point(4 + 12, 4 + 14));
}
