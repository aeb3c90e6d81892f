#include "tus/client/client.hpp"
#include "tus/client/options.hpp"
#include "tus/core/logging.hpp"
#include "tus/network/asio_transport.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using tus::client::Client;
using tus::client::ClientOptions;
using tus::client::UploadMeta;

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] FILE ENDPOINT\n\n";
    std::cout << "Uploads FILE to the TUS creation ENDPOINT. If the upload is interrupted,\n";
    std::cout << "its progress is written to the state file and the next run resumes it.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config FILE         JSON client options\n";
    std::cout << "  --state FILE          Where progress is kept (default: FILE.tus.json)\n";
    std::cout << "  --meta KEY=VALUE      Extra Upload-Metadata entry (repeatable)\n";
    std::cout << "  --header NAME=VALUE   Extra request header (repeatable)\n";
    std::cout << "  --mime TYPE           Send TYPE as the filetype metadata entry\n";
    std::cout << "  --chunk-size BYTES    Bytes per PATCH request\n";
    std::cout << "  --info                Print the server's capabilities first\n";
    std::cout << "  --terminate           Delete the upload from the server once complete\n";
    std::cout << "  --help                Show this help message\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " video.mp4 http://localhost:1080/files/\n";
    std::cout << "  " << program_name << " --meta owner=ops --chunk-size 1048576 dump.tar http://localhost:1080/files/\n";
}

bool split_assignment(const std::string& text, std::string& key, std::string& value) {
    const auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    key = text.substr(0, eq);
    value = text.substr(eq + 1);
    return true;
}

std::optional<UploadMeta> load_state(const fs::path& state_path, const fs::path& file) {
    std::ifstream input(state_path);
    if (!input) {
        return std::nullopt;
    }

    json j;
    try {
        input >> j;
    } catch (const json::parse_error& e) {
        spdlog::warn("Ignoring unreadable state file {}: {}", state_path.string(), e.what());
        return std::nullopt;
    }

    auto meta = UploadMeta::from_json(j);
    if (meta.is_error()) {
        spdlog::warn("Ignoring state file {}: {}", state_path.string(), tus::to_string(meta.error()));
        return std::nullopt;
    }
    if (meta.value().file_path() != file) {
        spdlog::warn("State file {} belongs to {}, starting over", state_path.string(),
                     meta.value().file_path().string());
        return std::nullopt;
    }
    return meta.value();
}

bool save_state(const fs::path& state_path, const UploadMeta& meta) {
    std::ofstream output(state_path, std::ios::trunc);
    if (!output) {
        spdlog::error("Failed to write state file {}", state_path.string());
        return false;
    }
    output << meta.to_json().dump(2);
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<fs::path> config_path;
    std::optional<fs::path> state_path;
    std::optional<std::string> mime_type;
    std::optional<std::size_t> chunk_size;
    tus::client::ExtraMetadata extra_meta;
    tus::network::HeaderMap custom_headers;
    bool show_info = false;
    bool terminate_after = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key;
        std::string value;

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--info") {
            show_info = true;
        } else if (arg == "--terminate") {
            terminate_after = true;
        } else if (arg == "--config" || arg == "--state" || arg == "--mime" || arg == "--chunk-size" ||
                   arg == "--meta" || arg == "--header") {
            if (i + 1 >= argc) {
                spdlog::error("{} requires a value", arg);
                return 1;
            }
            const std::string param = argv[++i];
            if (arg == "--config") {
                config_path = param;
            } else if (arg == "--state") {
                state_path = param;
            } else if (arg == "--mime") {
                mime_type = param;
            } else if (arg == "--chunk-size") {
                try {
                    chunk_size = std::stoul(param);
                } catch (const std::exception&) {
                    spdlog::error("Invalid chunk size: {}", param);
                    return 1;
                }
            } else if (!split_assignment(param, key, value)) {
                spdlog::error("{} expects KEY=VALUE, got '{}'", arg, param);
                return 1;
            } else if (arg == "--meta") {
                extra_meta[key] = value;
            } else {
                custom_headers[key] = value;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            spdlog::error("Unknown option: {}", arg);
            print_usage(argv[0]);
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        print_usage(argv[0]);
        return 1;
    }

    ClientOptions options;
    if (config_path) {
        auto loaded = tus::client::load_options(*config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", tus::to_string(loaded.error()));
            return 1;
        }
        options = loaded.value();
    }
    if (chunk_size) {
        if (*chunk_size == 0) {
            spdlog::error("Chunk size must be > 0");
            return 1;
        }
        options.chunk_size = *chunk_size;
    }
    tus::logging::init(options.logging);

    const fs::path file = positional[0];
    auto endpoint = tus::network::Url::parse(positional[1]);
    if (endpoint.is_error()) {
        spdlog::error("{}", tus::to_string(endpoint.error()));
        return 1;
    }
    const fs::path state = state_path.value_or(fs::path(file.string() + ".tus.json"));

    tus::network::AsioTransport transport;
    Client client(transport, options);

    if (show_info) {
        auto info = client.get_server_info(endpoint.value());
        if (info.is_error()) {
            spdlog::error("OPTIONS failed: {}", tus::to_string(info.error()));
            return 1;
        }
        spdlog::info("Server protocol version: {}", info.value().version.value_or("unknown"));
        if (info.value().max_size) {
            spdlog::info("Maximum upload size: {} bytes", *info.value().max_size);
        }
        for (auto extension : info.value().extensions) {
            spdlog::info("  extension: {}", tus::protocol::to_string(extension));
        }
    }

    tus::client::UploadResult<UploadMeta> result = [&]() -> tus::client::UploadResult<UploadMeta> {
        if (auto saved = load_state(state, file)) {
            if (saved->remote_url()) {
                spdlog::info("Resuming {} at {}", file.string(), saved->remote_url()->to_string());
                auto synced = client.get_offset(*saved);
                if (synced.is_error()) {
                    return synced;
                }
                return client.resume(synced.value());
            }
            // Creation failed last time; retry it with the saved settings
            auto created = client.create(*saved);
            if (created.is_error()) {
                return created;
            }
            return client.resume(created.value());
        }

        auto unstarted = UploadMeta::from_file(file, endpoint.value(), extra_meta, custom_headers,
                                               options.chunk_size, options.protocol_version);
        if (unstarted.is_error()) {
            return tus::Err<UploadMeta>(tus::client::UploadError{unstarted.error(), std::nullopt});
        }
        UploadMeta meta = unstarted.value();
        if (mime_type) {
            meta = meta.with_mime_type(*mime_type);
        }
        auto created = client.create(meta);
        if (created.is_error()) {
            return created;
        }
        return client.resume(created.value());
    }();

    if (result.is_error()) {
        const auto& failure = result.error();
        spdlog::error("Upload failed: {}", tus::to_string(failure.error));
        if (failure.snapshot && !failure.error.is_terminal() && save_state(state, *failure.snapshot)) {
            spdlog::info("Progress saved to {} ({} of {} bytes); run again to resume",
                         state.string(), failure.snapshot->status().bytes_uploaded,
                         failure.snapshot->status().size);
        } else {
            std::error_code ec;
            fs::remove(state, ec);
        }
        tus::logging::shutdown();
        return 1;
    }

    std::error_code ec;
    fs::remove(state, ec);

    const UploadMeta& done = result.value();
    std::cout << done.remote_url()->to_string() << "\n";

    if (terminate_after) {
        client.terminate(done);
    }

    tus::logging::shutdown();
    return 0;
}
