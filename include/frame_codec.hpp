#pragma once
#include "slicer.hpp"
#include "transfer_error.hpp"
#include <optional>
#include <string>
#include <vector>

// Wire formats:
//   current  "IDX:nnn:<text>"  index zero-padded to exactly 3 digits (0-999)
//   legacy   "<digits>:<text>" unbounded digits
// <text> is everything after the index separator, colons and line breaks included.

struct Frame {
    unsigned int index = 0;
    std::string text;
};

enum class FrameFormat { Current, Legacy, Recovered };

struct FrameMatcher {
    FrameFormat format;
    std::optional<Frame> (*match)(const std::string& raw);
};

// Result of a parse_frame() call.
struct ParseResult {
    bool        valid  = false;
    Frame       frame;
    FrameFormat format = FrameFormat::Current;
    ErrorKind   error_kind = ErrorKind::None;  // ParseFailure when !valid
    std::string error;
};

// Throws TransferError(IndexOverflow) when chunk.index > MAX_FRAME_INDEX.
std::string encode_frame(const Chunk& chunk);

std::optional<Frame> match_current_frame(const std::string& raw);
std::optional<Frame> match_legacy_frame(const std::string& raw);

// Matchers in priority order: current, then legacy.
const std::vector<FrameMatcher>& frame_matchers();

// Runs frame_matchers() in order. Never returns a partially parsed frame.
ParseResult parse_frame(const std::string& raw);

// True when raw starts with the current-format tag literal ("IDX:").
bool has_frame_tag(const std::string& raw);

// Fallback for tagged strings the strict pattern rejected (e.g. "IDX:7:..." or
// "IDX: 012:..."). Splits on the first two ':' and accepts when the first part
// is exactly the tag and the second reads as a non-negative integer.
std::optional<Frame> recover_frame(const std::string& raw);

const char* to_string(FrameFormat format);
