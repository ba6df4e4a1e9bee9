#include "transfer_error.hpp"

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                return "None";
        case ErrorKind::ChunkTooLarge:       return "ChunkTooLarge";
        case ErrorKind::IndexOverflow:       return "IndexOverflow";
        case ErrorKind::ParseFailure:        return "ParseFailure";
        case ErrorKind::UnreadableImage:     return "UnreadableImage";
        case ErrorKind::Base64DecodeError:   return "Base64DecodeError";
        case ErrorKind::UnsupportedFileType: return "UnsupportedFileType";
        case ErrorKind::InvalidArgument:     return "InvalidArgument";
        case ErrorKind::EmptyPayload:        return "EmptyPayload";
        case ErrorKind::IoError:             return "IoError";
    }
    return "Unknown";
}

TransferError::TransferError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}
