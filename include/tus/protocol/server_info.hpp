#pragma once

#include "tus/network/http_types.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tus::protocol {

/**
 * @brief Protocol extensions a server can advertise in Tus-Extension
 *
 * The client implements creation and termination. The others are
 * recognised by name only so callers can inspect a server's capabilities.
 */
enum class Extension {
    Creation,
    CreationWithUpload,
    CreationDeferLength,
    Termination,
    Expiration,
    Checksum,
    ChecksumTrailer,
    Concatenation,
    ConcatenationUnfinished
};

std::optional<Extension> extension_from_string(const std::string& name);
const char* to_string(Extension extension) noexcept;

/**
 * @brief Capabilities reported by an OPTIONS request
 *
 * Every field is optional on the wire; absent or malformed headers leave the
 * corresponding member empty.
 */
struct TusServerInfo {
    std::optional<std::string> version;
    std::optional<uint64_t> max_size;
    std::set<Extension> extensions;
    std::vector<std::string> supported_versions;
    std::vector<std::string> checksum_algorithms;

    bool supports(Extension extension) const {
        return extensions.count(extension) > 0;
    }

    static TusServerInfo from_headers(const network::HeaderMap& headers);
};

} // namespace tus::protocol
