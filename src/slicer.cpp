#include "slicer.hpp"
#include "transfer_error.hpp"

// Byte length of the sequence starting at text[pos], clamped to the text end.
// Malformed input advances by one byte.
static size_t sequence_length(const std::string& text, size_t pos) {
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t len = 1;
    if ((lead & 0xE0) == 0xC0) len = 2;
    else if ((lead & 0xF0) == 0xE0) len = 3;
    else if ((lead & 0xF8) == 0xF0) len = 4;

    size_t end = pos + 1;
    while (end < text.size() && end < pos + len &&
           (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80)
        ++end;
    return end - pos;
}

size_t count_code_points(const std::string& text) {
    size_t count = 0;
    for (size_t pos = 0; pos < text.size(); pos += sequence_length(text, pos))
        ++count;
    return count;
}

std::vector<Chunk> slice_text(const std::string& text, std::size_t chunk_size) {
    if (chunk_size == 0)
        throw TransferError(ErrorKind::InvalidArgument, "chunk_size must be greater than 0");

    std::vector<Chunk> chunks;
    if (text.empty()) return chunks;

    size_t total_chunks = (count_code_points(text) + chunk_size - 1) / chunk_size;
    chunks.reserve(total_chunks);

    size_t offset = 0;
    for (size_t i = 0; i < total_chunks; ++i) {
        size_t end = offset;
        for (size_t n = 0; n < chunk_size && end < text.size(); ++n)
            end += sequence_length(text, end);

        Chunk c;
        c.index = static_cast<unsigned int>(i);
        c.text = text.substr(offset, end - offset);

        chunks.push_back(std::move(c));
        offset = end;
    }

    return chunks;
}
