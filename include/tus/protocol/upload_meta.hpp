#pragma once

#include "tus/core/result.hpp"
#include "tus/network/http_types.hpp"
#include "tus/network/url.hpp"
#include "tus/protocol/headers.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace tus::protocol {

using ExtraMetadata = std::map<std::string, std::string>;

inline constexpr std::size_t kDefaultChunkSize = 6 * 1024 * 1024;
// Largest chunk accepted from a persisted record or a config file
inline constexpr std::size_t kMaxChunkSize = 1024 * 1024 * 1024;

struct UploadStatus {
    uint64_t size = 0;            ///< Total file size, fixed at creation
    uint64_t bytes_uploaded = 0;  ///< Last offset reported by the server

    bool operator==(const UploadStatus& other) const {
        return size == other.size && bytes_uploaded == other.bytes_uploaded;
    }
};

enum class UploadState {
    Unstarted,   // no remote resource yet
    Created,     // remote resource exists, nothing uploaded
    InProgress,  // 0 < bytes_uploaded < size
    Complete     // bytes_uploaded >= size
};

const char* to_string(UploadState state) noexcept;

/**
 * @brief Immutable description of one upload attempt
 *
 * Every transition returns a new value and leaves the original untouched,
 * so a caller can keep any snapshot to inspect, persist or resume later.
 * Values share no mutable state and can be handed between threads freely.
 *
 * Invariants:
 * - bytes_uploaded <= size
 * - size is read from the file once, in from_file()
 * - remote_url goes from absent to present exactly once
 */
class UploadMeta {
public:
    /**
     * @brief Build the initial (Unstarted) value for a local file
     *
     * Fails with FileRead if the path does not exist, is a directory or is
     * not a regular file, and with EmptyFilename / InvalidFilename if the
     * path has no usable basename.
     */
    static Result<UploadMeta> from_file(const std::filesystem::path& file_path,
                                        const network::Url& upload_host,
                                        ExtraMetadata extra_meta = {},
                                        network::HeaderMap custom_headers = {},
                                        std::size_t chunk_size = kDefaultChunkSize,
                                        std::string version = kDefaultProtocolVersion);

    /// Restore a value written by to_json(); invariants are re-checked.
    static Result<UploadMeta> from_json(const nlohmann::json& json);

    nlohmann::json to_json() const;

    const network::Url& upload_host() const noexcept { return upload_host_; }
    const std::filesystem::path& file_path() const noexcept { return file_path_; }
    const std::optional<network::Url>& remote_url() const noexcept { return remote_url_; }
    const UploadStatus& status() const noexcept { return status_; }
    const std::string& version() const noexcept { return version_; }
    const ExtraMetadata& extra_meta() const noexcept { return extra_meta_; }
    const std::optional<std::string>& mime_type() const noexcept { return mime_type_; }
    const network::HeaderMap& custom_headers() const noexcept { return custom_headers_; }
    uint64_t error_count() const noexcept { return error_count_; }
    std::size_t chunk_size() const noexcept { return chunk_size_; }

    bool upload_complete() const noexcept { return status_.bytes_uploaded >= status_.size; }
    UploadState state() const noexcept;

    /// Basename sent as the "filename" metadata entry.
    Result<std::string> filename() const;

    /// filename, then filetype (if a mime type is set), then extra metadata.
    /// An extra entry named like a built-in one replaces its value in place.
    Result<MetadataPairs> metadata_pairs() const;

    /// metadata_pairs() encoded as an Upload-Metadata header value.
    Result<std::string> encoded_metadata() const;

    /// Fails with ProtocolViolation when bytes_uploaded would exceed size.
    Result<UploadMeta> with_bytes_uploaded(uint64_t bytes_uploaded) const;

    /// Fails with ProtocolViolation when a remote URL is already set.
    Result<UploadMeta> with_remote_url(network::Url remote_url) const;

    UploadMeta with_mime_type(std::string mime_type) const;
    UploadMeta with_error_recorded() const;

private:
    UploadMeta() = default;

    network::Url upload_host_;
    std::filesystem::path file_path_;
    std::optional<network::Url> remote_url_;
    UploadStatus status_;
    std::string version_ = kDefaultProtocolVersion;
    ExtraMetadata extra_meta_;
    std::optional<std::string> mime_type_;
    network::HeaderMap custom_headers_;
    uint64_t error_count_ = 0;
    std::size_t chunk_size_ = kDefaultChunkSize;
};

} // namespace tus::protocol
