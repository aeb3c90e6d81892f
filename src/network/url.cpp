#include "tus/network/url.hpp"

#include <algorithm>
#include <cctype>

namespace tus::network {
namespace {

Error malformed(const std::string& text, const std::string& reason) {
    return Error{ErrorKind::MalformedUrl, "Malformed URL '" + text + "': " + reason, std::nullopt, std::nullopt};
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string strip_fragment(const std::string& text) {
    return text.substr(0, text.find('#'));
}

} // namespace

uint16_t default_port(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

Result<Url> Url::parse(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return Err<Url>(malformed(text, "missing scheme"));
    }

    Url url;
    url.scheme = to_lower(text.substr(0, scheme_end));
    if (url.scheme != "http" && url.scheme != "https") {
        return Err<Url>(malformed(text, "unsupported scheme " + url.scheme));
    }

    const std::string rest = strip_fragment(text.substr(scheme_end + 3));
    const auto path_start = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_start);
    url.target = path_start == std::string::npos ? "/" : rest.substr(path_start);
    if (url.target.front() == '?') {
        url.target.insert(url.target.begin(), '/');
    }

    // Userinfo is not supported; credentials belong in custom headers
    if (authority.find('@') != std::string::npos) {
        return Err<Url>(malformed(text, "userinfo is not supported"));
    }

    std::string port_str;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return Err<Url>(malformed(text, "unterminated IPv6 literal"));
        }
        url.host = authority.substr(1, close - 1);
        const std::string after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return Err<Url>(malformed(text, "unexpected characters after host"));
            }
            port_str = after.substr(1);
        }
    } else {
        const auto colon = authority.rfind(':');
        url.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_str = authority.substr(colon + 1);
        }
    }

    if (url.host.empty()) {
        return Err<Url>(malformed(text, "missing host"));
    }

    if (port_str.empty()) {
        url.port = default_port(url.scheme);
    } else {
        if (port_str.size() > 5 ||
            !std::all_of(port_str.begin(), port_str.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return Err<Url>(malformed(text, "invalid port"));
        }
        const unsigned long port = std::stoul(port_str);
        if (port == 0 || port > 65535) {
            return Err<Url>(malformed(text, "port out of range"));
        }
        url.port = static_cast<uint16_t>(port);
    }

    return Ok(std::move(url));
}

Result<Url> Url::resolve(const std::string& reference) const {
    if (reference.empty()) {
        return Err<Url>(malformed(reference, "empty reference"));
    }
    if (reference.find("://") != std::string::npos) {
        return Url::parse(reference);
    }
    if (reference.rfind("//", 0) == 0) {
        return Url::parse(scheme + ":" + reference);
    }

    Url resolved = *this;
    const std::string ref = strip_fragment(reference);
    if (ref.front() == '/') {
        resolved.target = ref;
    } else if (ref.front() == '?') {
        resolved.target = target.substr(0, target.find('?')) + ref;
    } else {
        // Relative path: replace everything after the last '/' of the base path
        const std::string base_path = target.substr(0, target.find('?'));
        resolved.target = base_path.substr(0, base_path.rfind('/') + 1) + ref;
    }
    return Ok(std::move(resolved));
}

std::string Url::authority() const {
    const std::string host_part = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port == default_port(scheme)) {
        return host_part;
    }
    return host_part + ":" + std::to_string(port);
}

std::string Url::to_string() const {
    return scheme + "://" + authority() + target;
}

} // namespace tus::network
