#include "grid_layout.hpp"
#include "transfer_error.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>

static const cv::Scalar WHITE(255, 255, 255);

static int ceil_div(size_t a, size_t b) {
    return static_cast<int>((a + b - 1) / b);
}

static cv::Mat to_bgr(const cv::Mat& img) {
    cv::Mat bgr;
    switch (img.channels()) {
        case 1: cv::cvtColor(img, bgr, cv::COLOR_GRAY2BGR); break;
        case 4: cv::cvtColor(img, bgr, cv::COLOR_BGRA2BGR); break;
        default: bgr = img; break;
    }
    if (bgr.depth() != CV_8U) bgr.convertTo(bgr, CV_8U);
    return bgr;
}

cv::Point GridSpec::cell_origin(int idx) const {
    int row = idx / cols;
    int col = idx % cols;
    return {margin + col * (cell_width + spacing), margin + row * (cell_height + spacing)};
}

GridSpec compute_grid(size_t n, std::optional<int> rows, std::optional<int> cols) {
    if (n == 0)
        throw TransferError(ErrorKind::InvalidArgument, "cannot lay out an empty grid");
    if ((rows && *rows <= 0) || (cols && *cols <= 0))
        throw TransferError(ErrorKind::InvalidArgument, "rows and cols must be positive");

    GridSpec spec;
    if (!rows && !cols) {
        spec.cols = static_cast<int>(std::ceil(std::sqrt(static_cast<double>(n))));
        spec.rows = ceil_div(n, spec.cols);
    } else if (!rows) {
        spec.cols = *cols;
        spec.rows = ceil_div(n, spec.cols);
    } else if (!cols) {
        spec.rows = *rows;
        spec.cols = ceil_div(n, spec.rows);
    } else {
        spec.rows = *rows;
        spec.cols = *cols;
    }

    if (static_cast<size_t>(spec.rows) * static_cast<size_t>(spec.cols) < n) {
        throw TransferError(ErrorKind::InvalidArgument,
                            "grid " + std::to_string(spec.rows) + "x" + std::to_string(spec.cols) +
                            " has fewer cells than the " + std::to_string(n) + " symbols to place");
    }
    return spec;
}

cv::Mat center_on_cell(const cv::Mat& img, int width, int height) {
    cv::Mat bgr = to_bgr(img);
    if (bgr.cols == width && bgr.rows == height) return bgr;

    cv::Mat cell(height, width, CV_8UC3, WHITE);
    int x = (width - bgr.cols) / 2;
    int y = (height - bgr.rows) / 2;
    bgr.copyTo(cell(cv::Rect(x, y, bgr.cols, bgr.rows)));
    return cell;
}

cv::Mat compose_grid(const std::vector<cv::Mat>& images,
                     std::optional<int> rows,
                     std::optional<int> cols,
                     const TransferConfig& config,
                     GridSpec* spec_out) {
    GridSpec spec = compute_grid(images.size(), rows, cols);
    spec.spacing = config.spacing;
    spec.margin = config.margin;

    for (const auto& img : images) {
        if (img.empty())
            throw TransferError(ErrorKind::InvalidArgument, "cannot place an empty symbol image");
        spec.cell_width = std::max(spec.cell_width, img.cols);
        spec.cell_height = std::max(spec.cell_height, img.rows);
    }

    cv::Mat canvas(spec.canvas_height(), spec.canvas_width(), CV_8UC3, WHITE);

    for (size_t idx = 0; idx < images.size(); ++idx) {
        cv::Mat cell = center_on_cell(images[idx], spec.cell_width, spec.cell_height);
        cv::Point origin = spec.cell_origin(static_cast<int>(idx));
        cell.copyTo(canvas(cv::Rect(origin.x, origin.y, spec.cell_width, spec.cell_height)));
    }

    std::cout << "[GRID] " << images.size() << " symbols in " << spec.rows << "x" << spec.cols
              << " grid, cell " << spec.cell_width << "x" << spec.cell_height
              << ", canvas " << canvas.cols << "x" << canvas.rows << std::endl;

    if (spec_out) *spec_out = spec;
    return canvas;
}
