#include "envelope.hpp"
#include "base64.hpp"
#include <cctype>
#include <cstring>
#include <iostream>

static constexpr size_t TAG_LEN = sizeof(TEXT_TAG) - 1;
static_assert(sizeof(TEXT_TAG) == sizeof(FILE_TAG), "envelope tags must have equal length");

static bool starts_with(const std::string& s, size_t pos, const char* prefix) {
    return s.compare(pos, std::strlen(prefix), prefix) == 0;
}

// Length of a "<digits>:" prefix directly followed by an envelope tag, else 0.
static size_t residual_index_prefix(const std::string& data) {
    size_t i = 0;
    while (i < data.size() && std::isdigit(static_cast<unsigned char>(data[i]))) ++i;
    if (i == 0 || i >= data.size() || data[i] != ':') return 0;
    if (starts_with(data, i + 1, TEXT_TAG) || starts_with(data, i + 1, FILE_TAG)) return i + 1;
    return 0;
}

static UnwrapResult fail(ErrorKind kind, const std::string& message) {
    std::cerr << "[ENVELOPE] " << message << std::endl;
    UnwrapResult r;
    r.error_kind = kind;
    r.error = message;
    return r;
}

static std::string preview(const std::string& s, size_t n = 20) {
    return s.size() > n ? s.substr(0, n) + "..." : s;
}

bool is_valid_utf8(const std::vector<uint8_t>& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();

    while (i < n) {
        uint8_t c = bytes[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len;
        uint32_t cp;
        uint32_t min_cp;
        if ((c & 0xE0) == 0xC0) {
            len = 2; cp = c & 0x1F; min_cp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3; cp = c & 0x0F; min_cp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4; cp = c & 0x07; min_cp = 0x10000;
        } else {
            return false;
        }

        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            uint8_t cc = bytes[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (cp < min_cp) return false;                    // overlong
        if (cp > 0x10FFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;   // surrogate

        i += len;
    }
    return true;
}

PayloadKind classify_payload(const std::vector<uint8_t>& bytes) {
    return is_valid_utf8(bytes) ? PayloadKind::Text : PayloadKind::Binary;
}

Envelope make_envelope(const std::string& filename, const std::vector<uint8_t>& bytes) {
    if (filename.empty())
        throw TransferError(ErrorKind::InvalidArgument, "envelope filename is empty");
    if (filename.find_first_of(":/\\") != std::string::npos)
        throw TransferError(ErrorKind::InvalidArgument,
                            "envelope filename must not contain ':' or a path separator: " + filename);

    Envelope env;
    env.kind = classify_payload(bytes);
    env.filename = filename;
    if (env.kind == PayloadKind::Text)
        env.body.assign(bytes.begin(), bytes.end());
    else
        env.body = base64_encode(bytes);
    return env;
}

std::string serialize_envelope(const Envelope& env) {
    const char* tag = (env.kind == PayloadKind::Text) ? TEXT_TAG : FILE_TAG;
    std::string out;
    out.reserve(TAG_LEN + env.filename.size() + 1 + env.body.size());
    out += tag;
    out += env.filename;
    out += ':';
    out += env.body;
    return out;
}

std::string wrap_envelope(const std::string& filename, const std::vector<uint8_t>& bytes) {
    return serialize_envelope(make_envelope(filename, bytes));
}

UnwrapResult unwrap_envelope(const std::string& data) {
    size_t pos = residual_index_prefix(data);
    if (pos > 0) {
        std::cout << "[ENVELOPE] Stripped residual index prefix \""
                  << data.substr(0, pos) << "\"" << std::endl;
    }

    PayloadKind kind;
    if (starts_with(data, pos, TEXT_TAG)) {
        kind = PayloadKind::Text;
    } else if (starts_with(data, pos, FILE_TAG)) {
        kind = PayloadKind::Binary;
    } else {
        return fail(ErrorKind::UnsupportedFileType,
                    "unknown payload header: " + preview(data.substr(pos)));
    }
    pos += TAG_LEN;

    size_t colon = data.find(':', pos);
    if (colon == std::string::npos) {
        return fail(ErrorKind::UnsupportedFileType, "no separator between filename and content");
    }

    UnwrapResult r;
    r.kind = kind;
    r.filename = data.substr(pos, colon - pos);

    if (kind == PayloadKind::Text) {
        r.bytes.assign(data.begin() + colon + 1, data.end());
    } else if (!base64_decode(data.substr(colon + 1), r.bytes)) {
        return fail(ErrorKind::Base64DecodeError,
                    "malformed base64 body for " + r.filename);
    }

    r.valid = true;
    std::cout << "[ENVELOPE] " << to_string(kind) << " payload \"" << r.filename
              << "\", " << r.bytes.size() << " bytes" << std::endl;
    return r;
}

const char* to_string(PayloadKind kind) {
    return kind == PayloadKind::Text ? "text" : "binary";
}
