#pragma once

#include "tus/core/result.hpp"

#include <cstdint>
#include <string>

namespace tus::network {

/**
 * @brief Absolute http(s) URL split into the parts a transport needs
 *
 * Only the components the client uses are modelled: scheme, host, port and
 * the request target (path plus query). Fragments are dropped.
 */
struct Url {
    std::string scheme;   ///< Lower-case, "http" or "https"
    std::string host;     ///< Without brackets for IPv6 literals
    uint16_t port = 0;    ///< Explicit or scheme default
    std::string target;   ///< Path and query, never empty ("/" at least)

    static Result<Url> parse(const std::string& text);

    /// Resolve a Location-style reference (absolute, scheme-relative,
    /// absolute-path or relative-path) against this URL.
    Result<Url> resolve(const std::string& reference) const;

    /// "host" or "host:port" when the port differs from the scheme default.
    std::string authority() const;

    std::string to_string() const;

    bool operator==(const Url& other) const {
        return scheme == other.scheme && host == other.host && port == other.port && target == other.target;
    }
    bool operator!=(const Url& other) const { return !(*this == other); }
};

uint16_t default_port(const std::string& scheme);

} // namespace tus::network
