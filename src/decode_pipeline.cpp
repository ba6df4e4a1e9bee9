#include "decode_pipeline.hpp"
#include "payload_io.hpp"

#include <opencv2/imgcodecs.hpp>

#include <iostream>

static DecodeResult& fail(DecodeResult& r, ErrorKind kind, const std::string& message) {
    std::cerr << "[DECODE] " << to_string(r.stage_reached) << " failed: " << message << std::endl;
    r.success = false;
    r.error_kind = kind;
    r.error = message;
    return r;
}

DecodePipeline::DecodePipeline(SymbolCodec& codec) : codec_(codec) {}

DecodeResult DecodePipeline::decode_strings(const std::vector<std::string>& raw_strings) const {
    DecodeResult result;
    result.raw_strings = raw_strings;

    result.stage_reached = DecodeStage::Scanning;
    if (raw_strings.empty())
        return fail(result, ErrorKind::UnreadableImage, "no QR codes recognised in the image");

    // Frame parsing and index ordering both happen inside combine(), so its
    // failures are reported as Parsing
    result.stage_reached = DecodeStage::Parsing;
    Reassembler reassembler;
    result.reassembly = reassembler.combine(raw_strings);
    if (!result.reassembly.valid)
        return fail(result, result.reassembly.error_kind, result.reassembly.error);

    result.stage_reached = DecodeStage::Reassembling;
    if (result.reassembly.text.empty())
        return fail(result, ErrorKind::EmptyPayload, "reassembled payload is empty");

    result.stage_reached = DecodeStage::Unwrapping;
    result.payload = unwrap_envelope(result.reassembly.text);
    if (!result.payload.valid)
        return fail(result, result.payload.error_kind, result.payload.error);

    result.stage_reached = DecodeStage::Done;
    result.success = true;
    return result;
}

DecodeResult DecodePipeline::decode(const cv::Mat& image, bool visual_debug) const {
    DecodeResult result;
    result.stage_reached = DecodeStage::Scanning;
    if (image.empty())
        return fail(result, ErrorKind::UnreadableImage, "empty image");

    std::vector<std::string> scanned;
    try {
        scanned = codec_.scan(image, visual_debug);
    } catch (const cv::Exception& e) {
        return fail(result, ErrorKind::UnreadableImage, std::string("scanner error: ") + e.what());
    }

    std::cout << "[DECODE] Recognised " << scanned.size() << " QR codes" << std::endl;
    return decode_strings(scanned);
}

DecodeResult DecodePipeline::decode_image_file(const std::string& image_path, bool visual_debug) const {
    cv::Mat image = cv::imread(image_path, cv::IMREAD_COLOR);
    if (image.empty()) {
        DecodeResult result;
        result.stage_reached = DecodeStage::Scanning;
        return fail(result, ErrorKind::UnreadableImage, "cannot read image file '" + image_path + "'");
    }
    return decode(image, visual_debug);
}

DecodeResult DecodePipeline::decode_to_directory(const std::string& image_path,
                                                 const std::string& output_dir,
                                                 bool visual_debug) const {
    DecodeResult result = decode_image_file(image_path, visual_debug);
    if (!result.success) return result;

    result.stage_reached = DecodeStage::Writing;
    result.success = false;

    std::string error;
    if (!write_recovered_file(output_dir, result.payload, result.output_path, error))
        return fail(result, ErrorKind::IoError, error);

    result.stage_reached = DecodeStage::Done;
    result.success = true;
    std::cout << "[DECODE] File decoded and saved as " << result.output_path << std::endl;
    return result;
}

const char* to_string(DecodeStage stage) {
    switch (stage) {
        case DecodeStage::None:         return "None";
        case DecodeStage::Scanning:     return "Scanning";
        case DecodeStage::Parsing:      return "Parsing";
        case DecodeStage::Reassembling: return "Reassembling";
        case DecodeStage::Unwrapping:   return "Unwrapping";
        case DecodeStage::Writing:      return "Writing";
        case DecodeStage::Done:         return "Done";
    }
    return "Unknown";
}
