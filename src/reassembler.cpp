#include "reassembler.hpp"
#include <algorithm>
#include <iostream>

static std::string preview(const std::string& s) {
    return s.size() > 30 ? s.substr(0, 30) + "..." : s;
}

static ReassemblyResult fail(ReassemblyResult r, ErrorKind kind, const std::string& message) {
    std::cerr << "[REASSEMBLY] " << message << std::endl;
    r.valid = false;
    r.error_kind = kind;
    r.error = message;
    return r;
}

void Reassembler::store(Frame frame, FrameFormat format, ReassemblyResult& result) {
    auto it = chunks_.find(frame.index);
    if (it != chunks_.end()) {
        std::cerr << "[REASSEMBLY] Duplicate index " << frame.index
                  << ", keeping the later copy" << std::endl;
        it->second = std::move(frame.text);
        result.duplicates++;
        return;
    }

    std::cout << "[REASSEMBLY] Matched (" << to_string(format) << "): index=" << frame.index
              << ", length=" << frame.text.size() << std::endl;
    chunks_.emplace(frame.index, std::move(frame.text));
}

ReassemblyResult Reassembler::combine(const std::vector<std::string>& raw_strings) {
    chunks_.clear();
    ReassemblyResult result;

    if (raw_strings.empty())
        return fail(result, ErrorKind::UnreadableImage, "no scanned strings to combine");

    // Stage 1: strict matchers in priority order
    std::vector<const std::string*> unparsed;
    for (const auto& raw : raw_strings) {
        ParseResult parsed = parse_frame(raw);
        if (parsed.valid)
            store(std::move(parsed.frame), parsed.format, result);
        else
            unparsed.push_back(&raw);
    }

    // Stage 2: recovery, only when every scanned string carries the tag literal
    if (!unparsed.empty()) {
        bool all_tagged = std::all_of(raw_strings.begin(), raw_strings.end(),
                                      [](const std::string& s) { return has_frame_tag(s); });
        std::vector<const std::string*> still_unparsed;
        for (const std::string* raw : unparsed) {
            if (all_tagged) {
                if (auto frame = recover_frame(*raw)) {
                    store(std::move(*frame), FrameFormat::Recovered, result);
                    result.recovered++;
                    continue;
                }
            }
            still_unparsed.push_back(raw);
        }
        unparsed.swap(still_unparsed);
    }

    if (chunks_.empty()) {
        if (raw_strings.size() == 1) {
            std::cout << "[REASSEMBLY] Single untagged code, using its content as-is" << std::endl;
            result.valid = true;
            result.verbatim = true;
            result.text = raw_strings.front();
            return result;
        }
        return fail(result, ErrorKind::ParseFailure,
                    "none of the " + std::to_string(raw_strings.size()) +
                    " scanned strings carries a frame index");
    }

    for (const std::string* raw : unparsed) {
        std::cerr << "[REASSEMBLY] Cannot parse index: " << preview(*raw) << std::endl;
    }
    result.rejected = unparsed.size();

    // std::map iterates in ascending index order
    size_t total = 0;
    for (const auto& [index, text] : chunks_) total += text.size();
    result.text.reserve(total);
    for (const auto& [index, text] : chunks_) result.text += text;

    result.frames = chunks_.size();
    result.contiguous = (static_cast<size_t>(chunks_.rbegin()->first) + 1 == chunks_.size());
    if (!result.contiguous) {
        std::cerr << "[REASSEMBLY] Warning: index set is not contiguous ("
                  << chunks_.size() << " frames, highest index "
                  << chunks_.rbegin()->first << "); payload may be incomplete" << std::endl;
    }

    result.valid = true;
    std::cout << "[REASSEMBLY] Combined " << result.frames << " frames, "
              << result.text.size() << " bytes" << std::endl;
    return result;
}
