#pragma once
#include <string>
#include <vector>
#include <cstddef>

struct Chunk {
    unsigned int index;
    std::string text;
};

// Number of UTF-8 code points in text. A stray continuation or invalid byte
// counts as one unit of its own.
std::size_t count_code_points(const std::string& text);

// Slice UTF-8 text into ceil(code_points / chunk_size) chunks, indexed 0..N-1
// in order. chunk_size counts code points, so no chunk ends inside a multi-byte
// sequence. Empty text gives no chunks.
// Throws TransferError(InvalidArgument) if chunk_size == 0.
std::vector<Chunk> slice_text(const std::string& text, std::size_t chunk_size);
