#include "tus/protocol/server_info.hpp"
#include "tus/protocol/headers.hpp"

#include <spdlog/spdlog.h>

namespace tus::protocol {

std::optional<Extension> extension_from_string(const std::string& name) {
    if (name == "creation") return Extension::Creation;
    if (name == "creation-with-upload") return Extension::CreationWithUpload;
    if (name == "creation-defer-length") return Extension::CreationDeferLength;
    if (name == "termination") return Extension::Termination;
    if (name == "expiration") return Extension::Expiration;
    if (name == "checksum") return Extension::Checksum;
    if (name == "checksum-trailer") return Extension::ChecksumTrailer;
    if (name == "concatenation") return Extension::Concatenation;
    if (name == "concatenation-unfinished") return Extension::ConcatenationUnfinished;
    return std::nullopt;
}

const char* to_string(Extension extension) noexcept {
    switch (extension) {
        case Extension::Creation: return "creation";
        case Extension::CreationWithUpload: return "creation-with-upload";
        case Extension::CreationDeferLength: return "creation-defer-length";
        case Extension::Termination: return "termination";
        case Extension::Expiration: return "expiration";
        case Extension::Checksum: return "checksum";
        case Extension::ChecksumTrailer: return "checksum-trailer";
        case Extension::Concatenation: return "concatenation";
        case Extension::ConcatenationUnfinished: return "concatenation-unfinished";
    }
    return "unknown";
}

TusServerInfo TusServerInfo::from_headers(const network::HeaderMap& headers) {
    const TypedHeaders typed = decode_headers(headers);

    TusServerInfo info;
    info.version = typed.resumable;
    info.max_size = typed.max_size;
    if (typed.extensions) {
        for (const auto& name : *typed.extensions) {
            if (auto extension = extension_from_string(name)) {
                info.extensions.insert(*extension);
            } else {
                spdlog::debug("Ignoring unknown TUS extension '{}'", name);
            }
        }
    }
    info.supported_versions = typed.supported_versions.value_or(std::vector<std::string>{});
    info.checksum_algorithms = typed.checksum_algorithms.value_or(std::vector<std::string>{});
    return info;
}

} // namespace tus::protocol
