#pragma once

#include <optional>
#include <string>

namespace tus {

/**
 * @brief Failure categories reported by the client
 *
 * Grouped by where the failure is detected:
 * - validation: FileRead, EmptyFilename, InvalidFilename (before any request)
 * - encoding: InvalidHeader, InvalidHeaderValue, MalformedUrl (before sending)
 * - transport: Transport (connection, DNS, socket I/O)
 * - protocol: BadRequest, NotFound, OffsetConflict, PayloadTooLarge,
 *   ChecksumMismatch, UnexpectedStatus (keyed by response status code)
 * - decode: MissingHeader, MissingUploadUrl, ProtocolViolation
 * - local: Serialization, Config
 */
enum class ErrorKind {
    FileRead,
    EmptyFilename,
    InvalidFilename,
    InvalidHeader,
    InvalidHeaderValue,
    MalformedUrl,
    Transport,
    BadRequest,
    NotFound,
    OffsetConflict,
    PayloadTooLarge,
    ChecksumMismatch,
    UnexpectedStatus,
    MissingHeader,
    MissingUploadUrl,
    ProtocolViolation,
    Serialization,
    Config
};

struct Error {
    ErrorKind kind = ErrorKind::UnexpectedStatus;
    std::string message;
    std::optional<int> status_code;   ///< Set for status-code keyed kinds
    std::optional<std::string> header; ///< Set for MissingHeader / InvalidHeader*

    static Error file_read(std::string message);
    static Error missing_header(const std::string& header_name);
    static Error from_status(int status_code, std::string body);
    static Error transport(std::string message);

    /// Terminal for the upload resource: retrying the same request cannot succeed.
    [[nodiscard]] bool is_terminal() const noexcept;
};

const char* kind_name(ErrorKind kind) noexcept;

std::string to_string(const Error& error);

} // namespace tus
