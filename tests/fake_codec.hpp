#pragma once

#include "symbol_codec.hpp"
#include "transfer_error.hpp"

#include <opencv2/core.hpp>
#include <algorithm>
#include <string>
#include <vector>

// In-memory stand-in for the QR codec. Symbol size grows with text length like a
// real capacity tier; scan() hands back every rendered text in reverse order.
class FakeCodec : public SymbolCodec {
public:
    size_t max_bytes = 4096;
    int fail_after = -1;  // render() throws ChunkTooLarge once this many symbols exist

    cv::Mat render(const std::string& text) override {
        if (text.size() > max_bytes || (fail_after >= 0 && static_cast<int>(rendered.size()) >= fail_after))
            throw TransferError(ErrorKind::ChunkTooLarge, "fake codec capacity exceeded");
        int side = 21 + 4 * static_cast<int>(text.size() / 16);
        rendered.push_back(text);
        return cv::Mat(side, side, CV_8UC1, cv::Scalar(0));
    }

    std::vector<std::string> scan(const cv::Mat& image, bool) override {
        if (image.empty()) return {};
        std::vector<std::string> out(rendered.rbegin(), rendered.rend());
        return out;
    }

    std::vector<std::string> rendered;
};
