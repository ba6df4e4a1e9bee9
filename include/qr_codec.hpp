#pragma once

#include "config.hpp"
#include "symbol_codec.hpp"
#include <opencv2/objdetect.hpp>

// SymbolCodec backed by OpenCV's QR encoder and detector.
class QrCodec : public SymbolCodec {
public:
    explicit QrCodec(const TransferConfig& config);

    cv::Mat render(const std::string& text) override;
    std::vector<std::string> scan(const cv::Mat& image, bool visual_debug) override;

    // Largest chunk, in bytes, that still fits the version cap.
    int max_text_bytes() const;

private:
    void show_detections(const cv::Mat& image,
                         const std::vector<std::string>& decoded,
                         const std::vector<cv::Point>& corners) const;

    EccLevel ecc_;
    int version_cap_;
    int box_size_;
    int border_;

    cv::Ptr<cv::QRCodeEncoder> encoder_;
    cv::QRCodeDetector detector_;
};
