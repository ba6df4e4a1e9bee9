#include "symbol_scratch.hpp"
#include "transfer_error.hpp"

#include <opencv2/imgcodecs.hpp>

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

SymbolScratch::SymbolScratch(std::string dir) : dir_(std::move(dir)) {}

SymbolScratch::~SymbolScratch() {
    for (const auto& file : files_) {
        std::error_code ec;
        fs::remove(file, ec);
        if (ec) {
            std::cerr << "[SCRATCH] Could not remove " << file << ": " << ec.message() << std::endl;
        }
    }
}

void SymbolScratch::save(unsigned int index, const cv::Mat& symbol) {
    if (dir_.empty()) return;

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec)
        throw TransferError(ErrorKind::IoError, "cannot create scratch directory " + dir_ + ": " + ec.message());

    char name[32];
    std::snprintf(name, sizeof(name), "qrcode_%03u.png", index);
    std::string path = (fs::path(dir_) / name).string();

    // Track before writing so a half-written file is cleaned up too
    files_.push_back(path);
    if (!cv::imwrite(path, symbol))
        throw TransferError(ErrorKind::IoError, "cannot write symbol image " + path);
}
