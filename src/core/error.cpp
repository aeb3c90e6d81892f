#include "tus/core/error.hpp"

#include <sstream>

namespace tus {

Error Error::file_read(std::string message) {
    return Error{ErrorKind::FileRead, std::move(message), std::nullopt, std::nullopt};
}

Error Error::missing_header(const std::string& header_name) {
    return Error{ErrorKind::MissingHeader, "Missing required header: " + header_name, std::nullopt, header_name};
}

Error Error::transport(std::string message) {
    return Error{ErrorKind::Transport, std::move(message), std::nullopt, std::nullopt};
}

Error Error::from_status(int status_code, std::string body) {
    Error error;
    error.status_code = status_code;
    switch (status_code) {
        case 400:
            error.kind = ErrorKind::BadRequest;
            error.message = std::move(body);
            break;
        case 404:
            error.kind = ErrorKind::NotFound;
            error.message = "Upload resource not found on server";
            break;
        case 409:
            error.kind = ErrorKind::OffsetConflict;
            error.message = "Upload-Offset does not match the server offset";
            break;
        case 413:
            error.kind = ErrorKind::PayloadTooLarge;
            error.message = "File is larger than the server accepts";
            break;
        case 460:
            error.kind = ErrorKind::ChecksumMismatch;
            error.message = "Checksum mismatch";
            break;
        default:
            error.kind = ErrorKind::UnexpectedStatus;
            error.message = std::move(body);
            break;
    }
    return error;
}

bool Error::is_terminal() const noexcept {
    switch (kind) {
        case ErrorKind::NotFound:
        case ErrorKind::PayloadTooLarge:
        case ErrorKind::ChecksumMismatch:
        case ErrorKind::ProtocolViolation:
            return true;
        default:
            return false;
    }
}

const char* kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::FileRead: return "FileRead";
        case ErrorKind::EmptyFilename: return "EmptyFilename";
        case ErrorKind::InvalidFilename: return "InvalidFilename";
        case ErrorKind::InvalidHeader: return "InvalidHeader";
        case ErrorKind::InvalidHeaderValue: return "InvalidHeaderValue";
        case ErrorKind::MalformedUrl: return "MalformedUrl";
        case ErrorKind::Transport: return "Transport";
        case ErrorKind::BadRequest: return "BadRequest";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::OffsetConflict: return "OffsetConflict";
        case ErrorKind::PayloadTooLarge: return "PayloadTooLarge";
        case ErrorKind::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorKind::UnexpectedStatus: return "UnexpectedStatus";
        case ErrorKind::MissingHeader: return "MissingHeader";
        case ErrorKind::MissingUploadUrl: return "MissingUploadUrl";
        case ErrorKind::ProtocolViolation: return "ProtocolViolation";
        case ErrorKind::Serialization: return "Serialization";
        case ErrorKind::Config: return "Config";
    }
    return "Unknown";
}

std::string to_string(const Error& error) {
    std::ostringstream oss;
    oss << kind_name(error.kind);
    if (error.status_code) {
        oss << " (" << *error.status_code << ")";
    }
    if (!error.message.empty()) {
        oss << ": " << error.message;
    }
    return oss.str();
}

} // namespace tus
