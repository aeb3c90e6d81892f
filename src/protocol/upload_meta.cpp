#include "tus/protocol/upload_meta.hpp"

#include <algorithm>
#include <system_error>

namespace tus::protocol {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Error protocol_violation(std::string message) {
    return Error{ErrorKind::ProtocolViolation, std::move(message), std::nullopt, std::nullopt};
}

Error serialization_error(std::string message) {
    return Error{ErrorKind::Serialization, std::move(message), std::nullopt, std::nullopt};
}

} // namespace

const char* to_string(UploadState state) noexcept {
    switch (state) {
        case UploadState::Unstarted: return "Unstarted";
        case UploadState::Created: return "Created";
        case UploadState::InProgress: return "InProgress";
        case UploadState::Complete: return "Complete";
    }
    return "Unknown";
}

Result<UploadMeta> UploadMeta::from_file(const fs::path& file_path,
                                         const network::Url& upload_host,
                                         ExtraMetadata extra_meta,
                                         network::HeaderMap custom_headers,
                                         std::size_t chunk_size,
                                         std::string version) {
    std::error_code ec;
    const auto file_status = fs::status(file_path, ec);
    if (ec || !fs::exists(file_status)) {
        return Err<UploadMeta>(Error::file_read("File not found: " + file_path.string()));
    }
    if (fs::is_directory(file_status)) {
        return Err<UploadMeta>(Error::file_read("Cannot be a directory: " + file_path.string()));
    }
    if (!fs::is_regular_file(file_status)) {
        return Err<UploadMeta>(Error::file_read("Not a regular file: " + file_path.string()));
    }

    const auto size = fs::file_size(file_path, ec);
    if (ec) {
        return Err<UploadMeta>(Error::file_read("Unable to stat " + file_path.string() + ": " + ec.message()));
    }

    UploadMeta meta;
    meta.file_path_ = file_path;
    meta.upload_host_ = upload_host;
    meta.status_ = UploadStatus{static_cast<uint64_t>(size), 0};
    meta.extra_meta_ = std::move(extra_meta);
    meta.custom_headers_ = std::move(custom_headers);
    meta.chunk_size_ = chunk_size == 0 ? kDefaultChunkSize : chunk_size;
    meta.version_ = std::move(version);

    auto name = meta.filename();
    if (name.is_error()) {
        return Err<UploadMeta>(name.error());
    }

    return Ok(std::move(meta));
}

UploadState UploadMeta::state() const noexcept {
    if (!remote_url_) {
        return UploadState::Unstarted;
    }
    if (upload_complete()) {
        return UploadState::Complete;
    }
    return status_.bytes_uploaded == 0 ? UploadState::Created : UploadState::InProgress;
}

Result<std::string> UploadMeta::filename() const {
    const std::string name = file_path_.filename().string();
    if (name.empty()) {
        return Err<std::string>(Error{ErrorKind::EmptyFilename, "Empty filename", std::nullopt, std::nullopt});
    }
    if (name == "/") {
        return Err<std::string>(Error{ErrorKind::InvalidFilename, "Filename cannot be '/'", std::nullopt, std::nullopt});
    }
    return Ok(name);
}

Result<MetadataPairs> UploadMeta::metadata_pairs() const {
    auto name = filename();
    if (name.is_error()) {
        return Err<MetadataPairs>(name.error());
    }

    MetadataPairs pairs;
    pairs.emplace_back("filename", name.value());
    if (mime_type_) {
        pairs.emplace_back("filetype", *mime_type_);
    }
    for (const auto& [key, value] : extra_meta_) {
        auto existing = std::find_if(pairs.begin(), pairs.end(),
                                     [&key](const auto& pair) { return pair.first == key; });
        if (existing != pairs.end()) {
            existing->second = value;
        } else {
            pairs.emplace_back(key, value);
        }
    }
    return Ok(std::move(pairs));
}

Result<std::string> UploadMeta::encoded_metadata() const {
    auto pairs = metadata_pairs();
    if (pairs.is_error()) {
        return Err<std::string>(pairs.error());
    }
    return encode_metadata(pairs.value());
}

Result<UploadMeta> UploadMeta::with_bytes_uploaded(uint64_t bytes_uploaded) const {
    if (bytes_uploaded > status_.size) {
        return Err<UploadMeta>(protocol_violation("Server offset " + std::to_string(bytes_uploaded) +
                                                  " exceeds upload size " + std::to_string(status_.size)));
    }
    UploadMeta next = *this;
    next.status_.bytes_uploaded = bytes_uploaded;
    return Ok(std::move(next));
}

Result<UploadMeta> UploadMeta::with_remote_url(network::Url remote_url) const {
    if (remote_url_) {
        return Err<UploadMeta>(protocol_violation("Upload already has a remote URL: " + remote_url_->to_string()));
    }
    UploadMeta next = *this;
    next.remote_url_ = std::move(remote_url);
    return Ok(std::move(next));
}

UploadMeta UploadMeta::with_mime_type(std::string mime_type) const {
    UploadMeta next = *this;
    next.mime_type_ = std::move(mime_type);
    return next;
}

UploadMeta UploadMeta::with_error_recorded() const {
    UploadMeta next = *this;
    ++next.error_count_;
    return next;
}

json UploadMeta::to_json() const {
    json j;
    j["upload_host"] = upload_host_.to_string();
    j["file_path"] = file_path_.string();
    j["remote_url"] = remote_url_ ? json(remote_url_->to_string()) : json(nullptr);
    j["status"] = {{"size", status_.size}, {"bytes_uploaded", status_.bytes_uploaded}};
    j["version"] = version_;
    j["extra_meta"] = json::object();
    for (const auto& [key, value] : extra_meta_) {
        j["extra_meta"][key] = value;
    }
    j["mime_type"] = mime_type_ ? json(*mime_type_) : json(nullptr);
    j["custom_headers"] = json::object();
    for (const auto& [name, value] : custom_headers_) {
        j["custom_headers"][name] = value;
    }
    j["error_count"] = error_count_;
    j["chunk_size"] = chunk_size_;
    return j;
}

Result<UploadMeta> UploadMeta::from_json(const json& j) {
    UploadMeta meta;
    try {
        auto host = network::Url::parse(j.at("upload_host").get<std::string>());
        if (host.is_error()) {
            return Err<UploadMeta>(host.error());
        }
        meta.upload_host_ = host.value();
        meta.file_path_ = fs::path(j.at("file_path").get<std::string>());

        const auto& remote = j.at("remote_url");
        if (!remote.is_null()) {
            auto url = network::Url::parse(remote.get<std::string>());
            if (url.is_error()) {
                return Err<UploadMeta>(url.error());
            }
            meta.remote_url_ = url.value();
        }

        const auto& status = j.at("status");
        meta.status_.size = status.at("size").get<uint64_t>();
        meta.status_.bytes_uploaded = status.at("bytes_uploaded").get<uint64_t>();

        meta.version_ = j.value("version", std::string(kDefaultProtocolVersion));
        if (j.contains("extra_meta")) {
            for (const auto& item : j.at("extra_meta").items()) {
                meta.extra_meta_[item.key()] = item.value().get<std::string>();
            }
        }
        if (j.contains("mime_type") && !j.at("mime_type").is_null()) {
            meta.mime_type_ = j.at("mime_type").get<std::string>();
        }
        if (j.contains("custom_headers")) {
            for (const auto& item : j.at("custom_headers").items()) {
                meta.custom_headers_[item.key()] = item.value().get<std::string>();
            }
        }
        meta.error_count_ = j.value("error_count", static_cast<uint64_t>(0));
        meta.chunk_size_ = j.value("chunk_size", kDefaultChunkSize);
    } catch (const json::exception& e) {
        return Err<UploadMeta>(serialization_error(std::string("Invalid upload record: ") + e.what()));
    }

    if (meta.status_.bytes_uploaded > meta.status_.size) {
        return Err<UploadMeta>(serialization_error("Invalid upload record: bytes_uploaded exceeds size"));
    }
    if (meta.chunk_size_ == 0 || meta.chunk_size_ > kMaxChunkSize) {
        return Err<UploadMeta>(serialization_error("Invalid upload record: chunk_size must be between 1 and " +
                                                   std::to_string(kMaxChunkSize)));
    }

    return Ok(std::move(meta));
}

} // namespace tus::protocol
