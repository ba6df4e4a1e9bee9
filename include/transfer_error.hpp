#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    None,
    ChunkTooLarge,
    IndexOverflow,
    ParseFailure,
    UnreadableImage,
    Base64DecodeError,
    UnsupportedFileType,
    InvalidArgument,
    EmptyPayload,
    IoError
};

const char* to_string(ErrorKind kind);

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};
