#pragma once

#include <string>
#include <cstddef>

// QR error correction levels, same order as cv::QRCodeEncoder::CorrectionLevel
enum class EccLevel { L = 0, M = 1, Q = 2, H = 3 };

constexpr std::size_t DEFAULT_CHUNK_SIZE = 1000;
constexpr int MAX_QR_VERSION = 40;
constexpr int QR_BOX_SIZE = 10;        // pixels per module
constexpr int QR_BORDER = 4;           // quiet zone, in modules
constexpr int QR_CODE_SPACING = 20;    // pixels between grid cells
constexpr int GRID_MARGIN = 0;         // pixels around the whole grid

constexpr char FRAME_TAG[] = "IDX";
constexpr unsigned int MAX_FRAME_INDEX = 999;

struct TransferConfig {
    std::size_t chunk_size = DEFAULT_CHUNK_SIZE;

    EccLevel ecc_level = EccLevel::L;
    int version_cap = MAX_QR_VERSION;
    int box_size = QR_BOX_SIZE;
    int border = QR_BORDER;

    int spacing = QR_CODE_SPACING;
    int margin = GRID_MARGIN;

    // Per-chunk symbols are also written here when non-empty (removed after encode)
    std::string scratch_dir;
};
