#pragma once

#include "tus/core/result.hpp"
#include "tus/network/http_types.hpp"

namespace tus::network {

/**
 * @brief Executes one HTTP request and returns the server's response
 *
 * Any response the server produces, including 4xx and 5xx, is a successful
 * execution; only failures to exchange the request (DNS, connect, socket
 * I/O, malformed response) are reported as ErrorKind::Transport.
 * Implementations must not retry and must be safe to call from several
 * threads at once.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<HttpResponse> execute(const HttpRequest& request) = 0;
};

} // namespace tus::network
