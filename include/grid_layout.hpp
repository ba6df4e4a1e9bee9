#pragma once

#include "config.hpp"
#include <opencv2/core.hpp>
#include <optional>
#include <vector>

struct GridSpec {
    int rows = 0;
    int cols = 0;
    int cell_width = 0;
    int cell_height = 0;
    int spacing = 0;
    int margin = 0;

    int canvas_width() const { return cols * cell_width + (cols - 1) * spacing + 2 * margin; }
    int canvas_height() const { return rows * cell_height + (rows - 1) * spacing + 2 * margin; }

    // Top-left pixel of the cell at linear (row-major) position idx
    cv::Point cell_origin(int idx) const;
};

// Rows/cols for n symbols. Both missing: cols = ceil(sqrt(n)), rows = ceil(n / cols).
// One missing: derived by ceiling division. Throws TransferError(InvalidArgument)
// for n == 0, a non-positive rows/cols or a grid with fewer than n cells.
GridSpec compute_grid(size_t n, std::optional<int> rows, std::optional<int> cols);

// Pads img to (width x height) on white, keeping it centered. Output is BGR.
cv::Mat center_on_cell(const cv::Mat& img, int width, int height);

// Places every image (row-major, in vector order) on one white BGR canvas.
// Cells past images.size() stay blank.
cv::Mat compose_grid(const std::vector<cv::Mat>& images,
                     std::optional<int> rows,
                     std::optional<int> cols,
                     const TransferConfig& config,
                     GridSpec* spec_out = nullptr);
