#pragma once

#include "envelope.hpp"
#include "reassembler.hpp"
#include "symbol_codec.hpp"
#include "transfer_error.hpp"

#include <string>
#include <vector>

// Stages of the decode pipeline.
enum class DecodeStage {
    None,
    Scanning,
    Parsing,
    Reassembling,
    Unwrapping,
    Writing,
    Done
};

// Result from the full decode pipeline, with staged error reporting.
// A failed run keeps the stage it failed in as stage_reached.
struct DecodeResult {
    DecodeStage stage_reached = DecodeStage::None;
    bool        success       = false;
    ErrorKind   error_kind    = ErrorKind::None;
    std::string error;

    // Intermediate values (populated as stages complete).
    std::vector<std::string> raw_strings;
    ReassemblyResult         reassembly;
    UnwrapResult             payload;
    std::string              output_path;

    bool failed() const { return !success; }
};

// Composite image -> scanned strings -> frames -> payload string -> file.
//
// Stages:
//   1. SymbolCodec::scan() -> raw strings (order undefined)
//   2-3. Reassembler::combine() -> payload string
//   4. unwrap_envelope() -> filename + bytes
//   5. write_recovered_file() (decode_to_directory only)
//
// Never throws for bad input; failures come back in DecodeResult.
class DecodePipeline {
public:
    explicit DecodePipeline(SymbolCodec& codec);

    DecodeResult decode(const cv::Mat& image, bool visual_debug = false) const;

    DecodeResult decode_image_file(const std::string& image_path, bool visual_debug = false) const;

    DecodeResult decode_to_directory(const std::string& image_path,
                                     const std::string& output_dir,
                                     bool visual_debug = false) const;

    // Stages 2-4 on strings already scanned.
    DecodeResult decode_strings(const std::vector<std::string>& raw_strings) const;

private:
    SymbolCodec& codec_;
};

const char* to_string(DecodeStage stage);
