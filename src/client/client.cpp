#include "tus/client/client.hpp"
#include "tus/protocol/headers.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <vector>

namespace tus::client {
namespace fs = std::filesystem;

namespace {

protocol::DispatchOptions make_dispatch_options(const ClientOptions& options) {
    protocol::DispatchOptions dispatch;
    dispatch.method_override = options.method_override;
    dispatch.default_headers = options.default_headers;
    return dispatch;
}

UploadResult<UploadMeta> fail(Error error, std::optional<UploadMeta> snapshot) {
    return Err<UploadMeta>(UploadError{std::move(error), std::move(snapshot)});
}

Error protocol_violation(std::string message) {
    return Error{ErrorKind::ProtocolViolation, std::move(message), std::nullopt, std::nullopt};
}

} // namespace

Client::Client(network::Transport& transport, ClientOptions options)
    : transport_(transport)
    , options_(std::move(options))
    , dispatcher_(transport_, make_dispatch_options(options_)) {
}

Result<TusServerInfo> Client::get_server_info(const network::Url& url) const {
    network::HttpRequest request;
    request.method = network::HttpMethod::OPTIONS;
    request.url = url.to_string();
    for (const auto& [name, value] : options_.default_headers) {
        request.set_header(name, value);
    }

    auto response = transport_.execute(request);
    if (response.is_error()) {
        return Err<TusServerInfo>(response.error());
    }

    const int status = response.value().status_code;
    if (status != 200 && status != 204) {
        return Err<TusServerInfo>(Error::from_status(status, response.value().body_as_string()));
    }

    return Ok(TusServerInfo::from_headers(response.value().headers));
}

UploadResult<UploadMeta> Client::create(const fs::path& file,
                                        const network::Url& host,
                                        ExtraMetadata extra_meta,
                                        network::HeaderMap custom_headers) const {
    auto meta = UploadMeta::from_file(file, host, std::move(extra_meta), std::move(custom_headers),
                                      options_.chunk_size, options_.protocol_version);
    if (meta.is_error()) {
        return fail(meta.error(), std::nullopt);
    }
    return create(meta.value());
}

UploadResult<UploadMeta> Client::create(const UploadMeta& unstarted) const {
    auto created = dispatcher_.run(protocol::Create{}, unstarted);
    if (created.is_error()) {
        spdlog::warn("Create failed for {}: {}", unstarted.file_path().string(), to_string(created.error()));
        return fail(created.error(), unstarted);
    }

    spdlog::info("Created upload for {} ({} bytes) at {}",
                 created.value().file_path().string(),
                 created.value().status().size,
                 created.value().remote_url()->to_string());
    return Ok<UploadMeta, UploadError>(std::move(created.value()));
}

UploadResult<UploadMeta> Client::get_offset(const UploadMeta& meta) const {
    auto synced = dispatcher_.run(protocol::GetOffset{}, meta);
    if (synced.is_error()) {
        return fail(synced.error(), meta);
    }
    spdlog::debug("Server offset for {} is {}", meta.file_path().string(), synced.value().status().bytes_uploaded);
    return Ok<UploadMeta, UploadError>(std::move(synced.value()));
}

UploadResult<UploadMeta> Client::resume(const UploadMeta& meta) const {
    if (!meta.remote_url()) {
        return fail(Error{ErrorKind::MissingUploadUrl, "Missing upload URL - the upload must be created first",
                          std::nullopt, std::nullopt},
                    meta);
    }

    std::ifstream input(meta.file_path(), std::ios::binary);
    if (!input) {
        return fail(Error::file_read("Failed to open source file: " + meta.file_path().string()), meta);
    }

    UploadMeta current = meta;

    while (!current.upload_complete()) {
        const uint64_t offset = current.status().bytes_uploaded;
        const uint64_t remaining = current.status().size - offset;
        const auto to_read = static_cast<std::size_t>(std::min<uint64_t>(remaining, current.chunk_size()));

        std::vector<uint8_t> body(to_read);
        input.clear();
        input.seekg(static_cast<std::streamoff>(offset));
        input.read(reinterpret_cast<char*>(body.data()), static_cast<std::streamsize>(to_read));
        const auto bytes_read = static_cast<std::size_t>(input.gcount());
        if (bytes_read == 0) {
            return fail(Error::file_read("Zero bytes read from " + current.file_path().string() +
                                         " at offset " + std::to_string(offset) + "; file was truncated"),
                        current.with_error_recorded());
        }

        body.resize(bytes_read);
        auto next = dispatcher_.run(protocol::Upload{}, current, std::move(body));
        if (next.is_error()) {
            spdlog::warn("Upload of {} stopped at offset {}: {}",
                         current.file_path().string(), offset, to_string(next.error()));
            return fail(next.error(), current.with_error_recorded());
        }

        const uint64_t acknowledged = next.value().status().bytes_uploaded;
        if (acknowledged == offset) {
            return fail(protocol_violation("Server made no progress at offset " + std::to_string(offset)),
                        current.with_error_recorded());
        }
        if (acknowledged > offset + bytes_read) {
            return fail(protocol_violation("Server acknowledged offset " + std::to_string(acknowledged) +
                                           " beyond the " + std::to_string(offset + bytes_read) + " bytes sent"),
                        current.with_error_recorded());
        }

        spdlog::debug("Uploaded {} bytes of {} ({}/{})",
                      acknowledged - offset, current.file_path().string(), acknowledged, current.status().size);
        current = std::move(next.value());
    }

    spdlog::info("Upload of {} complete ({} bytes)", current.file_path().string(), current.status().size);
    return Ok<UploadMeta, UploadError>(std::move(current));
}

UploadResult<UploadMeta> Client::upload(const fs::path& file,
                                        const network::Url& host,
                                        ExtraMetadata extra_meta,
                                        network::HeaderMap custom_headers) const {
    auto created = create(file, host, std::move(extra_meta), std::move(custom_headers));
    if (created.is_error()) {
        return created;
    }
    return resume(created.value());
}

void Client::terminate(const UploadMeta& meta) const {
    auto result = try_terminate(meta);
    if (result.is_error()) {
        spdlog::warn("Ignoring failed termination of {}: {}",
                     meta.remote_url() ? meta.remote_url()->to_string() : meta.file_path().string(),
                     to_string(result.error()));
    }
}

Result<void> Client::try_terminate(const UploadMeta& meta) const {
    auto terminated = dispatcher_.run(protocol::Terminate{}, meta);
    if (terminated.is_error()) {
        return Err<void>(terminated.error());
    }
    spdlog::info("Terminated upload {}", meta.remote_url()->to_string());
    return Ok();
}

} // namespace tus::client
