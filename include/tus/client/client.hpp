#pragma once

#include "tus/client/options.hpp"
#include "tus/core/result.hpp"
#include "tus/network/transport.hpp"
#include "tus/network/url.hpp"
#include "tus/protocol/operation.hpp"
#include "tus/protocol/server_info.hpp"
#include "tus/protocol/upload_meta.hpp"

#include <filesystem>
#include <optional>

namespace tus::client {

using protocol::ExtraMetadata;
using protocol::TusServerInfo;
using protocol::UploadMeta;

/**
 * @brief Error plus the last Meta value known to be valid
 *
 * snapshot is empty only when the failure happened before any Meta could be
 * built (invalid path, unusable filename). Otherwise it reflects exactly the
 * progress the server confirmed, so it can be persisted and handed back to
 * resume() later.
 */
struct UploadError {
    Error error;
    std::optional<UploadMeta> snapshot;
};

template<typename T>
using UploadResult = Result<T, UploadError>;

/**
 * @brief Drives TUS uploads: create, resume, resynchronise, terminate
 *
 * Each call runs to completion on the calling thread, with at most one
 * request outstanding. The client holds no per-upload state; all progress
 * lives in the UploadMeta values passed in and returned, so one Client can
 * serve independent uploads from several threads if its transport allows.
 * Nothing is retried: retry policy belongs to the caller.
 */
class Client {
public:
    explicit Client(network::Transport& transport, ClientOptions options = {});

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /// OPTIONS probe; accepts 200 or 204.
    Result<TusServerInfo> get_server_info(const network::Url& url) const;

    /**
     * @brief Create the upload resource for a local file
     *
     * Validates the file before any request is made. On success the
     * returned Meta has its remote URL set and bytes_uploaded == 0.
     */
    UploadResult<UploadMeta> create(const std::filesystem::path& file,
                                    const network::Url& host,
                                    ExtraMetadata extra_meta = {},
                                    network::HeaderMap custom_headers = {}) const;

    /// Create from a prepared Unstarted Meta (e.g. one with a mime type set).
    UploadResult<UploadMeta> create(const UploadMeta& unstarted) const;

    /// Re-read bytes_uploaded from the server.
    UploadResult<UploadMeta> get_offset(const UploadMeta& meta) const;

    /**
     * @brief Send the file from bytes_uploaded to the end, one chunk at a time
     *
     * Returns once bytes_uploaded == size. On failure the snapshot holds the
     * last Meta the server confirmed, with error_count incremented.
     */
    UploadResult<UploadMeta> resume(const UploadMeta& meta) const;

    /// create() followed by resume().
    UploadResult<UploadMeta> upload(const std::filesystem::path& file,
                                    const network::Url& host,
                                    ExtraMetadata extra_meta = {},
                                    network::HeaderMap custom_headers = {}) const;

    /**
     * @brief Delete the upload resource, best effort
     *
     * Never reports failure: errors are logged at warn level and dropped,
     * so cleanup cannot interrupt the caller. Use try_terminate() to see
     * the outcome.
     */
    void terminate(const UploadMeta& meta) const;

    Result<void> try_terminate(const UploadMeta& meta) const;

    const ClientOptions& options() const noexcept { return options_; }

private:
    network::Transport& transport_;
    ClientOptions options_;
    protocol::Dispatcher dispatcher_;
};

} // namespace tus::client
