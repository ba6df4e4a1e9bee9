#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Standard alphabet (RFC 4648), padded output.
std::string base64_encode(const std::vector<uint8_t>& data);

// Whitespace is skipped. Any other character outside the alphabet, a length that
// is not a multiple of 4, or misplaced padding makes the decode fail.
bool base64_decode(const std::string& text, std::vector<uint8_t>& out);
