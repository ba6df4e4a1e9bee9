#include "base64.hpp"
#include <array>

static constexpr char ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static constexpr int8_t INVALID = -1;

static std::array<int8_t, 256> make_decode_table() {
    std::array<int8_t, 256> table;
    table.fill(INVALID);
    for (int i = 0; i < 64; ++i)
        table[static_cast<uint8_t>(ALPHABET[i])] = static_cast<int8_t>(i);
    return table;
}

static bool is_space(char c) {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= data.size(); i += 3) {
        uint32_t v = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out.push_back(ALPHABET[(v >> 18) & 0x3F]);
        out.push_back(ALPHABET[(v >> 12) & 0x3F]);
        out.push_back(ALPHABET[(v >> 6) & 0x3F]);
        out.push_back(ALPHABET[v & 0x3F]);
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t v = data[i] << 16;
        out.push_back(ALPHABET[(v >> 18) & 0x3F]);
        out.push_back(ALPHABET[(v >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        uint32_t v = (data[i] << 16) | (data[i + 1] << 8);
        out.push_back(ALPHABET[(v >> 18) & 0x3F]);
        out.push_back(ALPHABET[(v >> 12) & 0x3F]);
        out.push_back(ALPHABET[(v >> 6) & 0x3F]);
        out.push_back('=');
    }

    return out;
}

bool base64_decode(const std::string& text, std::vector<uint8_t>& out) {
    static const std::array<int8_t, 256> table = make_decode_table();

    std::string clean;
    clean.reserve(text.size());
    for (char c : text) {
        if (!is_space(c)) clean.push_back(c);
    }

    out.clear();
    if (clean.size() % 4 != 0) return false;
    if (clean.empty()) return true;

    size_t padding = 0;
    if (clean[clean.size() - 1] == '=') ++padding;
    if (clean[clean.size() - 2] == '=') ++padding;

    out.reserve(clean.size() / 4 * 3);

    for (size_t i = 0; i < clean.size(); i += 4) {
        bool last_quad = (i + 4 == clean.size());
        size_t pad_here = last_quad ? padding : 0;

        uint32_t v = 0;
        for (size_t j = 0; j < 4; ++j) {
            char c = clean[i + j];
            if (j >= 4 - pad_here) {
                // already counted as padding
                v <<= 6;
                continue;
            }
            int8_t d = table[static_cast<uint8_t>(c)];
            if (d == INVALID) return false;  // includes '=' in the middle
            v = (v << 6) | static_cast<uint32_t>(d);
        }

        out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
        if (pad_here < 2) out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        if (pad_here < 1) out.push_back(static_cast<uint8_t>(v & 0xFF));
    }

    return true;
}
