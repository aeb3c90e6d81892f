#pragma once

#include "tus/core/logging.hpp"
#include "tus/core/result.hpp"
#include "tus/network/http_types.hpp"
#include "tus/protocol/headers.hpp"
#include "tus/protocol/upload_meta.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <string>

namespace tus::client {

struct ClientOptions {
    /// Bytes sent per PATCH request; bounds the client's memory use.
    std::size_t chunk_size = protocol::kDefaultChunkSize;
    std::string protocol_version = protocol::kDefaultProtocolVersion;
    /// Tunnel PATCH and DELETE through POST + X-HTTP-Method-Override.
    bool method_override = false;
    /// Sent with every request; per-upload custom headers take precedence.
    network::HeaderMap default_headers;
    logging::LoggingOptions logging;
};

/**
 * @brief Build options from a JSON object
 *
 * Recognised keys: chunk_size, protocol_version, method_override,
 * default_headers (object), logging.level, logging.pattern. Missing keys
 * keep their defaults. A zero chunk_size or a mistyped value is a Config
 * error.
 *
 * Example:
 * {
 *   "chunk_size": 1048576,
 *   "default_headers": {"Authorization": "Bearer abc"},
 *   "logging": {"level": "debug"}
 * }
 */
Result<ClientOptions> options_from_json(const nlohmann::json& json);

/// Read and parse a JSON options file.
Result<ClientOptions> load_options(const std::filesystem::path& path);

} // namespace tus::client
