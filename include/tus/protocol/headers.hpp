#pragma once

#include "tus/core/result.hpp"
#include "tus/network/http_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tus::protocol {

/**
 * @brief Every header the client reads or writes
 *
 * wire_name() is the only place the header spellings live, so encode and
 * decode sites cannot drift apart.
 */
enum class HeaderField {
    TusResumable,          ///< Protocol version used by client or server
    TusVersion,            ///< Comma-separated versions the server supports
    TusExtension,          ///< Comma-separated extensions the server supports
    TusMaxSize,            ///< Maximum upload size in bytes
    TusChecksumAlgorithm,  ///< Comma-separated checksum algorithms
    UploadLength,          ///< Size of the entire upload in bytes
    UploadOffset,          ///< Byte offset within the upload resource
    UploadMetadata,        ///< Comma-separated "key base64(value)" pairs
    ContentType,
    Location,              ///< Upload resource URL returned on creation
    MethodOverride         ///< Real verb when tunnelling through POST
};

const char* wire_name(HeaderField field) noexcept;

inline constexpr const char* kOffsetOctetStream = "application/offset+octet-stream";
inline constexpr const char* kDefaultProtocolVersion = "1.0.0";
inline constexpr char kMetadataDelimiter = ',';

/// Ordered key/value pairs of the Upload-Metadata header.
using MetadataPairs = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Encode pairs as an Upload-Metadata value
 *
 * Each pair becomes "key base64(value)", joined with kMetadataDelimiter.
 * An empty value is written as the bare key. Keys must be non-empty and
 * must not contain spaces, the delimiter, ':' or control characters.
 */
Result<std::string> encode_metadata(const MetadataPairs& pairs);

/**
 * @brief Decode an Upload-Metadata value
 *
 * Inverse of encode_metadata(). Returns nullopt for any malformed entry
 * (empty key, invalid base64) rather than a partial result.
 */
std::optional<MetadataPairs> decode_metadata(const std::string& value);

/**
 * @brief All TUS fields of a response, decoded leniently
 *
 * A field is empty when the header is absent or its value does not parse.
 * Used for capability discovery and diagnostics; the upload state machine
 * reads its fields through the require_* functions instead.
 */
struct TypedHeaders {
    std::optional<uint64_t> offset;
    std::optional<uint64_t> upload_length;
    std::optional<uint64_t> max_size;
    std::optional<std::string> resumable;
    std::optional<std::string> location;
    std::optional<std::vector<std::string>> supported_versions;
    std::optional<std::vector<std::string>> extensions;
    std::optional<std::vector<std::string>> checksum_algorithms;
    std::optional<MetadataPairs> upload_metadata;
};

TypedHeaders decode_headers(const network::HeaderMap& headers);

// Lenient decoding: absence or malformed input yields nullopt, never an error.
std::optional<std::string> find_header(const network::HeaderMap& headers, HeaderField field);
std::optional<uint64_t> find_unsigned(const network::HeaderMap& headers, HeaderField field);
std::optional<std::vector<std::string>> find_list(const network::HeaderMap& headers, HeaderField field);

// Strict decoding: absence or malformed input is a MissingHeader error naming the header.
Result<std::string> require_header(const network::HeaderMap& headers, HeaderField field);
Result<uint64_t> require_unsigned(const network::HeaderMap& headers, HeaderField field);

std::optional<uint64_t> parse_unsigned(const std::string& text);

} // namespace tus::protocol
