#include "tus/network/asio_transport.hpp"
#include "tus/network/http_parser.hpp"
#include "tus/network/url.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <string>

namespace tus::network {

Result<HttpResponse> AsioTransport::execute(const HttpRequest& request) {
    auto url_result = Url::parse(request.url);
    if (url_result.is_error()) {
        return Err<HttpResponse>(url_result.error());
    }
    const Url& url = url_result.value();
    if (url.scheme != "http") {
        return Err<HttpResponse>(Error::transport("Unsupported scheme for plain TCP transport: " + url.scheme));
    }

    const std::string method = HttpMethodUtils::to_string(request.method);
    boost::system::error_code ec;

    tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(url.host, std::to_string(url.port), ec);
    if (ec) {
        spdlog::error("Failed to resolve {}: {}", url.host, ec.message());
        return Err<HttpResponse>(Error::transport("Failed to resolve " + url.host + ": " + ec.message()));
    }

    tcp::socket socket(io_context_);
    asio::connect(socket, endpoints, ec);
    if (ec) {
        spdlog::error("Failed to connect to {}: {}", url.authority(), ec.message());
        return Err<HttpResponse>(Error::transport("Failed to connect to " + url.authority() + ": " + ec.message()));
    }

    const std::vector<uint8_t> data = request.serialize(url.target, url.authority());
    asio::write(socket, asio::buffer(data), ec);
    if (ec) {
        spdlog::error("{} {} write error: {}", method, request.url, ec.message());
        return Err<HttpResponse>(Error::transport("Write error: " + ec.message()));
    }
    spdlog::debug("{} {} sent {} bytes", method, request.url, data.size());

    HttpResponseParser parser(request.method == HttpMethod::HEAD);
    std::array<char, kReadBufferSize> buffer;
    try {
        while (true) {
            const std::size_t bytes_read = socket.read_some(asio::buffer(buffer), ec);
            if (ec == asio::error::eof) {
                auto finished = parser.finish();
                if (finished.is_error()) {
                    return Err<HttpResponse>(finished.error());
                }
                break;
            }
            if (ec) {
                spdlog::error("{} {} read error: {}", method, request.url, ec.message());
                return Err<HttpResponse>(Error::transport("Read error: " + ec.message()));
            }

            auto parsed = parser.parse(buffer.data(), bytes_read);
            if (parsed.is_error()) {
                return Err<HttpResponse>(parsed.error());
            }
            if (parsed.value()) {
                break;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("{} {} response handling failed: {}", method, request.url, e.what());
        return Err<HttpResponse>(Error::transport("Failed to read response: " + std::string(e.what())));
    }

    boost::system::error_code shutdown_ec;
    socket.shutdown(tcp::socket::shutdown_both, shutdown_ec);

    HttpResponse response = parser.get_response();
    spdlog::debug("{} {} -> {}", method, request.url, response.status_code);
    return Ok(std::move(response));
}

} // namespace tus::network
