#pragma once

#include "frame_codec.hpp"
#include "transfer_error.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

// Result of Reassembler::combine().
struct ReassemblyResult {
    bool        valid      = false;
    std::string text;
    ErrorKind   error_kind = ErrorKind::None;
    std::string error;

    size_t frames     = 0;     // distinct indices recovered
    size_t duplicates = 0;     // frames that overwrote an earlier one
    size_t recovered  = 0;     // frames accepted only by the fallback stage
    size_t rejected   = 0;     // raw strings dropped as unparseable
    bool   verbatim   = false; // single untagged string taken as the whole payload
    bool   contiguous = true;  // indices form 0..N-1 without holes
};

// Rebuilds a payload from an unordered, possibly noisy set of scanned strings.
// Ordering comes only from the frame index. Duplicate index: the later string wins.
// A hole in the index set is not an error; see ReassemblyResult::contiguous.
class Reassembler {
public:
    ReassemblyResult combine(const std::vector<std::string>& raw_strings);

private:
    void store(Frame frame, FrameFormat format, ReassemblyResult& result);

    std::map<unsigned int, std::string> chunks_;
};
