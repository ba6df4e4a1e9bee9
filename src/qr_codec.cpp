#include "qr_codec.hpp"
#include "qr_capacity.hpp"
#include "transfer_error.hpp"

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

#include <iostream>

QrCodec::QrCodec(const TransferConfig& config)
    : ecc_(config.ecc_level),
      version_cap_(config.version_cap),
      box_size_(config.box_size),
      border_(config.border) {
    if (version_cap_ < MIN_QR_VERSION || version_cap_ > MAX_QR_VERSION)
        throw TransferError(ErrorKind::InvalidArgument,
                            "QR version cap must be within 1..40, got " + std::to_string(version_cap_));
    if (box_size_ <= 0 || border_ < 0)
        throw TransferError(ErrorKind::InvalidArgument, "invalid QR box size or border");

    cv::QRCodeEncoder::Params params;
    params.correction_level = static_cast<cv::QRCodeEncoder::CorrectionLevel>(static_cast<int>(ecc_));
    params.mode = cv::QRCodeEncoder::MODE_BYTE;
    params.version = 0;  // smallest version that fits
    encoder_ = cv::QRCodeEncoder::create(params);
    if (!encoder_) throw std::runtime_error("Failed to create QR encoder");
}

int QrCodec::max_text_bytes() const {
    return qr_byte_capacity(version_cap_, ecc_);
}

cv::Mat QrCodec::render(const std::string& text) {
    int version = min_qr_version(text.size(), ecc_);
    if (version == 0 || version > version_cap_) {
        throw TransferError(ErrorKind::ChunkTooLarge,
                            "chunk of " + std::to_string(text.size()) + " bytes exceeds QR version " +
                            std::to_string(version_cap_) + " capacity (" +
                            std::to_string(max_text_bytes()) + " bytes); reduce chunk_size");
    }

    cv::Mat modules;
    try {
        encoder_->encode(text, modules);
    } catch (const cv::Exception& e) {
        throw TransferError(ErrorKind::ChunkTooLarge,
                            std::string("QR encoder rejected chunk: ") + e.what());
    }
    if (modules.empty())
        throw TransferError(ErrorKind::ChunkTooLarge, "QR encoder produced no symbol");

    cv::Mat scaled;
    cv::resize(modules, scaled, cv::Size(), box_size_, box_size_, cv::INTER_NEAREST);

    cv::Mat symbol;
    int pad = border_ * box_size_;
    cv::copyMakeBorder(scaled, symbol, pad, pad, pad, pad, cv::BORDER_CONSTANT, cv::Scalar(255));
    return symbol;
}

std::vector<std::string> QrCodec::scan(const cv::Mat& image, bool visual_debug) {
    std::vector<std::string> results;
    if (image.empty()) return results;

    cv::Mat gray;
    if (image.channels() == 3)
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    else if (image.channels() == 4)
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    else
        gray = image;

    std::vector<std::string> decoded;
    std::vector<cv::Point> corners;
    if (!detector_.detectAndDecodeMulti(gray, decoded, corners)) {
        std::cerr << "[QR] No QR codes detected" << std::endl;
        if (visual_debug) show_detections(image, decoded, corners);
        return results;
    }

    for (const auto& data : decoded) {
        if (data.empty()) {
            std::cerr << "[QR] Detected a symbol that could not be decoded" << std::endl;
            continue;
        }
        std::cout << "[QR] Read: " << (data.size() > 30 ? data.substr(0, 30) + "..." : data) << std::endl;
        results.push_back(data);
    }

    if (visual_debug) show_detections(image, decoded, corners);
    return results;
}

void QrCodec::show_detections(const cv::Mat& image,
                              const std::vector<std::string>& decoded,
                              const std::vector<cv::Point>& corners) const {
    cv::Mat annotated;
    if (image.channels() == 1)
        cv::cvtColor(image, annotated, cv::COLOR_GRAY2BGR);
    else
        annotated = image.clone();

    for (size_t i = 0; i + 3 < corners.size(); i += 4) {
        std::vector<cv::Point> quad(corners.begin() + i, corners.begin() + i + 4);
        cv::polylines(annotated, quad, true, cv::Scalar(0, 255, 0), 2);
        cv::putText(annotated, std::to_string(i / 4), quad[0],
                    cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(0, 0, 255), 2);

        size_t n = i / 4;
        if (n < decoded.size())
            std::cout << "[QR] #" << n << " type: QRCODE, data: " << decoded[n] << std::endl;
    }

    cv::imshow("QR Code Array Reader", annotated);
    cv::waitKey(0);
    cv::destroyAllWindows();
}
