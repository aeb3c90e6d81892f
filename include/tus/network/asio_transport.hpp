#pragma once

#include "tus/network/transport.hpp"

#include <boost/asio.hpp>

#include <array>

namespace tus::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief Blocking HTTP/1.1 transport over plain TCP using Boost.Asio
 *
 * One connection per request ("Connection: close"); the calling thread
 * blocks until the response is read or the exchange fails. Only the http
 * scheme is supported.
 */
class AsioTransport : public Transport {
public:
    AsioTransport() = default;

    AsioTransport(const AsioTransport&) = delete;
    AsioTransport& operator=(const AsioTransport&) = delete;

    Result<HttpResponse> execute(const HttpRequest& request) override;

private:
    static constexpr std::size_t kReadBufferSize = 8192;

    asio::io_context io_context_;
};

} // namespace tus::network
