#include "tus/client/options.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace tus::client {
using json = nlohmann::json;

namespace {

Error config_error(std::string message) {
    return Error{ErrorKind::Config, std::move(message), std::nullopt, std::nullopt};
}

} // namespace

Result<ClientOptions> options_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<ClientOptions>(config_error("Client options must be a JSON object"));
    }

    ClientOptions options;
    try {
        options.chunk_size = j.value("chunk_size", options.chunk_size);
        options.protocol_version = j.value("protocol_version", options.protocol_version);
        options.method_override = j.value("method_override", options.method_override);

        if (j.contains("default_headers")) {
            for (const auto& item : j.at("default_headers").items()) {
                options.default_headers[item.key()] = item.value().get<std::string>();
            }
        }

        if (j.contains("logging")) {
            const auto& logging = j.at("logging");
            options.logging.level = logging.value("level", options.logging.level);
            options.logging.pattern = logging.value("pattern", options.logging.pattern);
        }
    } catch (const json::exception& e) {
        return Err<ClientOptions>(config_error(std::string("Invalid client options: ") + e.what()));
    }

    if (options.chunk_size == 0 || options.chunk_size > protocol::kMaxChunkSize) {
        return Err<ClientOptions>(config_error("chunk_size must be between 1 and " +
                                               std::to_string(protocol::kMaxChunkSize)));
    }
    if (options.protocol_version.empty()) {
        return Err<ClientOptions>(config_error("protocol_version must not be empty"));
    }

    return Ok(std::move(options));
}

Result<ClientOptions> load_options(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<ClientOptions>(config_error("Unable to open config file " + path.string()));
    }

    json j;
    try {
        input >> j;
    } catch (const json::parse_error& e) {
        return Err<ClientOptions>(config_error("Malformed config file " + path.string() + ": " + e.what()));
    }

    auto options = options_from_json(j);
    if (options.is_ok()) {
        spdlog::debug("Loaded client options from {}", path.string());
    }
    return options;
}

} // namespace tus::client
