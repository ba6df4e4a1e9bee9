#include "encode_pipeline.hpp"
#include "frame_codec.hpp"
#include "payload_io.hpp"
#include "slicer.hpp"
#include "symbol_scratch.hpp"
#include "transfer_error.hpp"

#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

EncodePipeline::EncodePipeline(SymbolCodec& codec, const TransferConfig& config)
    : codec_(codec), config_(config) {}

cv::Mat EncodePipeline::compose(const std::string& text,
                                std::optional<int> rows,
                                std::optional<int> cols,
                                size_t* num_chunks,
                                GridSpec* grid) {
    std::vector<Chunk> chunks = slice_text(text, config_.chunk_size);
    if (chunks.empty())
        throw TransferError(ErrorKind::EmptyPayload, "nothing to encode: payload is empty");

    std::cout << "[ENCODE] Text split into " << chunks.size() << " chunks" << std::endl;

    SymbolScratch scratch(config_.scratch_dir);
    std::vector<cv::Mat> symbols;
    symbols.reserve(chunks.size());

    for (const auto& chunk : chunks) {
        std::string frame = encode_frame(chunk);
        cv::Mat symbol = codec_.render(frame);
        scratch.save(chunk.index, symbol);
        symbols.push_back(std::move(symbol));
    }

    cv::Mat canvas = compose_grid(symbols, rows, cols, config_, grid);
    if (num_chunks) *num_chunks = chunks.size();
    return canvas;
}

EncodeResult EncodePipeline::encode_payload(const std::string& filename,
                                            const std::vector<uint8_t>& bytes,
                                            std::optional<int> rows,
                                            std::optional<int> cols,
                                            const std::string& output_path) {
    Envelope env = make_envelope(filename, bytes);
    std::string data = serialize_envelope(env);

    std::cout << "[ENCODE] File type: " << to_string(env.kind) << std::endl;
    std::cout << "[ENCODE] File size: " << bytes.size() << " bytes" << std::endl;
    std::cout << "[ENCODE] Envelope size: " << data.size() << " bytes" << std::endl;

    EncodeResult result;
    result.kind = env.kind;
    cv::Mat canvas = compose(data, rows, cols, &result.num_chunks, &result.grid);

    fs::path out(output_path);
    if (out.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(out.parent_path(), ec);
        if (ec)
            throw TransferError(ErrorKind::IoError,
                                "cannot create " + out.parent_path().string() + ": " + ec.message());
    }

    bool written = false;
    try {
        written = cv::imwrite(output_path, canvas);
    } catch (const cv::Exception& e) {
        throw TransferError(ErrorKind::IoError, "cannot write " + output_path + ": " + e.what());
    }
    if (!written)
        throw TransferError(ErrorKind::IoError, "cannot write " + output_path);

    result.output_path = output_path;
    std::cout << "[ENCODE] QR array saved as " << output_path << std::endl;
    return result;
}

EncodeResult EncodePipeline::encode_file(const std::string& file_path,
                                         std::optional<int> rows,
                                         std::optional<int> cols,
                                         const std::string& output_path) {
    std::vector<uint8_t> bytes;
    if (!read_file_bytes(file_path, bytes))
        throw TransferError(ErrorKind::IoError, "cannot read " + file_path);

    std::string filename = fs::path(file_path).filename().string();
    std::string out = output_path.empty() ? default_array_path(file_path) : output_path;
    return encode_payload(filename, bytes, rows, cols, out);
}

std::string default_array_path(const std::string& file_path) {
    return fs::path(file_path).stem().string() + "_qr_array.png";
}
