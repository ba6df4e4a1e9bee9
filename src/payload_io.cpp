#include "payload_io.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

bool read_file_bytes(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;

    in.seekg(0, std::ios::end);
    std::streamoff size = in.tellg();
    if (size < 0) return false;
    in.seekg(0, std::ios::beg);

    out.resize(static_cast<size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char*>(out.data()), size)) return false;
    return true;
}

std::string safe_output_name(const std::string& filename, PayloadKind kind) {
    fs::path name = fs::path(filename).filename();
    std::string s = name.string();
    if (s.empty() || s == "." || s == "..")
        return kind == PayloadKind::Text ? "recovered.txt" : "recovered.bin";
    return s;
}

bool write_recovered_file(const std::string& output_dir,
                          const UnwrapResult& payload,
                          std::string& out_path,
                          std::string& error) {
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        error = "cannot create output directory " + output_dir + ": " + ec.message();
        return false;
    }

    fs::path target = fs::path(output_dir) / safe_output_name(payload.filename, payload.kind);
    fs::path partial = target;
    partial += ".part";

    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out) {
            error = "cannot open " + partial.string() + " for writing";
            return false;
        }

        const size_t bom_len = std::strlen(UTF8_BOM);
        bool has_bom = payload.bytes.size() >= bom_len &&
                       std::memcmp(payload.bytes.data(), UTF8_BOM, bom_len) == 0;
        if (payload.kind == PayloadKind::Text && !has_bom)
            out.write(UTF8_BOM, static_cast<std::streamsize>(bom_len));

        out.write(reinterpret_cast<const char*>(payload.bytes.data()),
                  static_cast<std::streamsize>(payload.bytes.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(partial, ec);
            error = "write to " + partial.string() + " failed";
            return false;
        }
    }

    fs::rename(partial, target, ec);
    if (ec) {
        std::error_code ignore;
        fs::remove(partial, ignore);
        error = "cannot move " + partial.string() + " into place: " + ec.message();
        return false;
    }

    out_path = target.string();
    return true;
}
