#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

// Optical code collaborator: one tagged chunk in, one symbol image out; one
// composite image in, every readable payload out (order undefined).
class SymbolCodec {
public:
    virtual ~SymbolCodec() = default;

    // Throws TransferError(ChunkTooLarge) when text does not fit the version cap.
    virtual cv::Mat render(const std::string& text) = 0;

    virtual std::vector<std::string> scan(const cv::Mat& image, bool visual_debug) = 0;
};
