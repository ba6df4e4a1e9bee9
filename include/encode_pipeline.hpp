#pragma once

#include "config.hpp"
#include "envelope.hpp"
#include "grid_layout.hpp"
#include "symbol_codec.hpp"

#include <optional>
#include <string>
#include <vector>

struct EncodeResult {
    std::string output_path;
    size_t      num_chunks = 0;
    PayloadKind kind       = PayloadKind::Text;
    GridSpec    grid;
};

// payload -> envelope -> chunks -> frames -> symbols -> grid image.
// Every failure throws TransferError; no output image is written in that case
// and any per-chunk scratch files are removed.
class EncodePipeline {
public:
    EncodePipeline(SymbolCodec& codec, const TransferConfig& config);

    // Split, tag and render text, then lay the symbols out on one canvas.
    cv::Mat compose(const std::string& text,
                    std::optional<int> rows,
                    std::optional<int> cols,
                    size_t* num_chunks = nullptr,
                    GridSpec* grid = nullptr);

    EncodeResult encode_payload(const std::string& filename,
                                const std::vector<uint8_t>& bytes,
                                std::optional<int> rows,
                                std::optional<int> cols,
                                const std::string& output_path);

    // Reads file_path; output defaults to "<stem>_qr_array.png" when empty.
    EncodeResult encode_file(const std::string& file_path,
                             std::optional<int> rows,
                             std::optional<int> cols,
                             const std::string& output_path = "");

private:
    SymbolCodec& codec_;
    TransferConfig config_;
};

std::string default_array_path(const std::string& file_path);
