#include "frame_codec.hpp"
#include "config.hpp"
#include "transfer_error.hpp"
#include <cctype>
#include <climits>
#include <cstdio>
#include <regex>
#include <stdexcept>

// Strict decimal to unsigned int. Empty, non-digit or out-of-range input fails.
static std::optional<unsigned int> parse_index(const std::string& digits) {
    if (digits.empty()) return std::nullopt;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    try {
        unsigned long value = std::stoul(digits);
        if (value > UINT_MAX) return std::nullopt;
        return static_cast<unsigned int>(value);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

static std::string trim_spaces(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

// Only the header is matched by regex; the body is taken from the suffix so
// long chunks never go through the regex engine.
static std::optional<Frame> match_header(const std::string& raw, const std::regex& header) {
    std::smatch m;
    if (!std::regex_search(raw, m, header, std::regex_constants::match_continuous))
        return std::nullopt;

    auto index = parse_index(m[1].str());
    if (!index) return std::nullopt;

    Frame f;
    f.index = *index;
    f.text = m.suffix().str();
    return f;
}

std::string encode_frame(const Chunk& chunk) {
    if (chunk.index > MAX_FRAME_INDEX) {
        throw TransferError(ErrorKind::IndexOverflow,
                            "chunk index " + std::to_string(chunk.index) +
                            " exceeds the " + std::to_string(MAX_FRAME_INDEX + 1) +
                            "-chunk capacity of the " + FRAME_TAG + " tag; increase chunk_size");
    }

    char header[16];
    std::snprintf(header, sizeof(header), "%s:%03u:", FRAME_TAG, chunk.index);
    return header + chunk.text;
}

std::optional<Frame> match_current_frame(const std::string& raw) {
    static const std::regex header(std::string("^") + FRAME_TAG + ":(\\d{3}):");
    return match_header(raw, header);
}

std::optional<Frame> match_legacy_frame(const std::string& raw) {
    static const std::regex header("^(\\d+):");
    return match_header(raw, header);
}

const std::vector<FrameMatcher>& frame_matchers() {
    static const std::vector<FrameMatcher> matchers = {
        {FrameFormat::Current, &match_current_frame},
        {FrameFormat::Legacy,  &match_legacy_frame},
    };
    return matchers;
}

ParseResult parse_frame(const std::string& raw) {
    for (const auto& matcher : frame_matchers()) {
        if (auto frame = matcher.match(raw)) {
            return {true, std::move(*frame), matcher.format, ErrorKind::None, {}};
        }
    }
    return {false, {}, FrameFormat::Current, ErrorKind::ParseFailure, "no frame format matches"};
}

bool has_frame_tag(const std::string& raw) {
    static const std::string prefix = std::string(FRAME_TAG) + ":";
    return raw.compare(0, prefix.size(), prefix) == 0;
}

std::optional<Frame> recover_frame(const std::string& raw) {
    size_t first = raw.find(':');
    if (first == std::string::npos) return std::nullopt;
    size_t second = raw.find(':', first + 1);
    if (second == std::string::npos) return std::nullopt;

    if (raw.compare(0, first, FRAME_TAG) != 0) return std::nullopt;

    auto index = parse_index(trim_spaces(raw.substr(first + 1, second - first - 1)));
    if (!index) return std::nullopt;

    Frame f;
    f.index = *index;
    f.text = raw.substr(second + 1);
    return f;
}

const char* to_string(FrameFormat format) {
    switch (format) {
        case FrameFormat::Current:   return "current";
        case FrameFormat::Legacy:    return "legacy";
        case FrameFormat::Recovered: return "recovered";
    }
    return "unknown";
}
