#pragma once

#include "envelope.hpp"
#include <cstdint>
#include <string>
#include <vector>

constexpr char UTF8_BOM[] = "\xEF\xBB\xBF";

bool read_file_bytes(const std::string& path, std::vector<uint8_t>& out);

// Name the payload is written under: the last path component of the envelope
// filename, or "recovered.txt" / "recovered.bin" when that is unusable.
std::string safe_output_name(const std::string& filename, PayloadKind kind);

// Writes an unwrapped payload into output_dir (created if needed). Text gets a
// leading UTF-8 BOM unless it already has one. The file appears only once fully
// written; on failure nothing is left behind.
bool write_recovered_file(const std::string& output_dir,
                          const UnwrapResult& payload,
                          std::string& out_path,
                          std::string& error);
