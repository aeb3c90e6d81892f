#include "tus/protocol/operation.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstring>

namespace tus::protocol {
namespace {

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// RFC 7230 token characters
bool is_token(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    static const char* kSpecials = "!#$%&'*+-.^_`|~";
    for (unsigned char c : name) {
        if (!std::isalnum(c) && std::strchr(kSpecials, c) == nullptr) {
            return false;
        }
    }
    return true;
}

bool is_field_value(const std::string& value) {
    for (unsigned char c : value) {
        if ((c < 0x20 && c != '\t') || c == 0x7f) {
            return false;
        }
    }
    return true;
}

Result<void> validate_headers(const network::HeaderMap& headers) {
    for (const auto& [name, value] : headers) {
        if (!is_token(name)) {
            return Err<void>(Error{ErrorKind::InvalidHeader, "Invalid header name: '" + name + "'",
                                   std::nullopt, name});
        }
        if (!is_field_value(value)) {
            return Err<void>(Error{ErrorKind::InvalidHeaderValue, "Invalid value for header " + name,
                                   std::nullopt, name});
        }
    }
    return Ok();
}

Result<network::Url> target_url(const Operation& op, const UploadMeta& meta) {
    if (std::holds_alternative<Create>(op)) {
        return Ok(meta.upload_host());
    }
    if (!meta.remote_url()) {
        return Err<network::Url>(Error{ErrorKind::MissingUploadUrl,
                                       "Missing upload URL - the upload must be created first",
                                       std::nullopt, std::nullopt});
    }
    return Ok(*meta.remote_url());
}

} // namespace

const char* name_of(const Operation& op) noexcept {
    return std::visit(overloaded{
        [](const Create&) { return "Create"; },
        [](const GetOffset&) { return "GetOffset"; },
        [](const Upload&) { return "Upload"; },
        [](const Terminate&) { return "Terminate"; },
    }, op);
}

network::HttpMethod method_of(const Operation& op) noexcept {
    return std::visit(overloaded{
        [](const Create&) { return network::HttpMethod::POST; },
        [](const GetOffset&) { return network::HttpMethod::HEAD; },
        [](const Upload&) { return network::HttpMethod::PATCH; },
        [](const Terminate&) { return network::HttpMethod::DELETE_METHOD; },
    }, op);
}

Result<network::HttpRequest> build_request(const Operation& op,
                                           const UploadMeta& meta,
                                           std::vector<uint8_t> body,
                                           const DispatchOptions& options) {
    auto url = target_url(op, meta);
    if (url.is_error()) {
        return Err<network::HttpRequest>(url.error());
    }

    auto metadata = meta.encoded_metadata();
    if (metadata.is_error()) {
        return Err<network::HttpRequest>(metadata.error());
    }

    network::HttpRequest request;
    request.method = method_of(op);
    request.url = url.value().to_string();

    request.set_header(wire_name(HeaderField::TusResumable), meta.version());
    request.set_header(wire_name(HeaderField::UploadMetadata), metadata.value());
    for (const auto& [name, value] : options.default_headers) {
        request.set_header(name, value);
    }
    for (const auto& [name, value] : meta.custom_headers()) {
        request.set_header(name, value);
    }

    std::visit(overloaded{
        [&](const Create&) {
            request.set_header(wire_name(HeaderField::UploadLength), std::to_string(meta.status().size));
        },
        [&](const GetOffset&) {},
        [&](const Upload&) {
            request.set_header(wire_name(HeaderField::ContentType), kOffsetOctetStream);
            request.set_header(wire_name(HeaderField::UploadOffset), std::to_string(meta.status().bytes_uploaded));
            request.body = std::move(body);
        },
        [&](const Terminate&) {},
    }, op);

    if (options.method_override &&
        (request.method == network::HttpMethod::PATCH || request.method == network::HttpMethod::DELETE_METHOD)) {
        request.set_header(wire_name(HeaderField::MethodOverride), network::HttpMethodUtils::to_string(request.method));
        request.method = network::HttpMethod::POST;
    }

    if (auto valid = validate_headers(request.headers); valid.is_error()) {
        return Err<network::HttpRequest>(valid.error());
    }

    return Ok(std::move(request));
}

Result<void> classify_status(const network::HttpResponse& response) {
    if (response.is_success()) {
        return Ok();
    }
    return Err<void>(Error::from_status(response.status_code, response.body_as_string()));
}

Result<UploadMeta> decode_response(const Operation& op,
                                   const UploadMeta& meta,
                                   const network::HttpResponse& response) {
    if (auto status = classify_status(response); status.is_error()) {
        return Err<UploadMeta>(status.error());
    }

    return std::visit(overloaded{
        [&](const Create&) -> Result<UploadMeta> {
            auto location = require_header(response.headers, HeaderField::Location);
            if (location.is_error()) {
                return Err<UploadMeta>(location.error());
            }
            auto remote = meta.upload_host().resolve(location.value());
            if (remote.is_error()) {
                return Err<UploadMeta>(remote.error());
            }
            return meta.with_remote_url(remote.value());
        },
        [&](const GetOffset&) -> Result<UploadMeta> {
            auto offset = require_unsigned(response.headers, HeaderField::UploadOffset);
            if (offset.is_error()) {
                return Err<UploadMeta>(offset.error());
            }
            return meta.with_bytes_uploaded(offset.value());
        },
        [&](const Upload&) -> Result<UploadMeta> {
            auto offset = require_unsigned(response.headers, HeaderField::UploadOffset);
            if (offset.is_error()) {
                return Err<UploadMeta>(offset.error());
            }
            if (offset.value() < meta.status().bytes_uploaded) {
                return Err<UploadMeta>(Error{ErrorKind::ProtocolViolation,
                                             "Server offset went backwards from " +
                                                 std::to_string(meta.status().bytes_uploaded) + " to " +
                                                 std::to_string(offset.value()),
                                             std::nullopt, std::nullopt});
            }
            return meta.with_bytes_uploaded(offset.value());
        },
        [&](const Terminate&) -> Result<UploadMeta> {
            return Ok(meta);
        },
    }, op);
}

Dispatcher::Dispatcher(network::Transport& transport, DispatchOptions options)
    : transport_(transport)
    , options_(std::move(options)) {
}

Result<UploadMeta> Dispatcher::run(const Operation& op,
                                   const UploadMeta& meta,
                                   std::vector<uint8_t> body) const {
    auto request = build_request(op, meta, std::move(body), options_);
    if (request.is_error()) {
        return Err<UploadMeta>(request.error());
    }

    spdlog::debug("{}: {} {}", name_of(op),
                  network::HttpMethodUtils::to_string(request.value().method), request.value().url);

    auto response = transport_.execute(request.value());
    if (response.is_error()) {
        return Err<UploadMeta>(response.error());
    }

    return decode_response(op, meta, response.value());
}

} // namespace tus::protocol
