#pragma once
#include "transfer_error.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Serialized forms:
//   "QRTEXT:<filename>:<text>"
//   "QRFILE:<filename>:<base64 of bytes>"

enum class PayloadKind { Text, Binary };

constexpr char TEXT_TAG[] = "QRTEXT:";
constexpr char FILE_TAG[] = "QRFILE:";

struct Envelope {
    PayloadKind kind = PayloadKind::Text;
    std::string filename;
    std::string body;
};

// Result of unwrap_envelope().
struct UnwrapResult {
    bool                 valid      = false;
    PayloadKind          kind       = PayloadKind::Text;
    std::string          filename;
    std::vector<uint8_t> bytes;
    ErrorKind            error_kind = ErrorKind::None;
    std::string          error;
};

// Strict UTF-8: rejects overlong forms, surrogates and code points above U+10FFFF.
bool is_valid_utf8(const std::vector<uint8_t>& bytes);

PayloadKind classify_payload(const std::vector<uint8_t>& bytes);

// Throws TransferError(InvalidArgument) for an empty filename or one containing
// ':' or a path separator.
Envelope make_envelope(const std::string& filename, const std::vector<uint8_t>& bytes);

std::string serialize_envelope(const Envelope& env);

// make_envelope() + serialize_envelope()
std::string wrap_envelope(const std::string& filename, const std::vector<uint8_t>& bytes);

// Strips a leftover "<digits>:" index in front of the tag, then splits tag,
// filename and body. Never throws.
UnwrapResult unwrap_envelope(const std::string& data);

const char* to_string(PayloadKind kind);
