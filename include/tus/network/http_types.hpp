#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <strings.h>

namespace tus {
namespace network {

/**
 * @brief HTTP request methods used by the TUS protocol
 *
 * OPTIONS discovers server capabilities, POST creates an upload, HEAD reads
 * the current offset, PATCH appends bytes and DELETE terminates.
 */
enum class HttpMethod {
    GET,
    POST,
    PATCH,
    DELETE_METHOD,  // renamed to avoid Windows macro conflict
    HEAD,
    OPTIONS,
    UNKNOWN
};

/**
 * @brief Status codes the client distinguishes
 *
 * 460 is not an IANA code; the TUS checksum extension uses it to signal a
 * checksum mismatch.
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    NOT_FOUND = 404,
    CONFLICT = 409,
    PAYLOAD_TOO_LARGE = 413,
    CHECKSUM_MISMATCH = 460,
    INTERNAL_SERVER_ERROR = 500
};

/**
 * @brief Case-insensitive ordering for header names
 *
 * HTTP header names are case-insensitive per RFC 7230, so "Upload-Offset"
 * and "upload-offset" must address the same entry.
 */
struct HeaderNameLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const {
        return strcasecmp(lhs.c_str(), rhs.c_str()) < 0;
    }
};

using HeaderMap = std::map<std::string, std::string, HeaderNameLess>;

/**
 * @brief Transport-neutral description of one request
 *
 * The url is absolute (scheme, authority and path); the transport decides
 * how to reach it. The body is optional because only PATCH carries bytes.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;
    HeaderMap headers;
    std::vector<uint8_t> body;

    std::string get_header(const std::string& name) const {
        auto it = headers.find(name);
        return it != headers.end() ? it->second : std::string();
    }

    bool has_header(const std::string& name) const {
        return headers.find(name) != headers.end();
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    /**
     * @brief Serialize to HTTP/1.1 wire format
     *
     * Format:
     * PATCH /files/abc HTTP/1.1\r\n
     * Host: example.com:8080\r\n
     * Upload-Offset: 0\r\n
     * Content-Length: 64\r\n
     * \r\n
     * [body]
     *
     * @param target Origin-form request target (path + query)
     * @param host Value for the Host header
     */
    std::vector<uint8_t> serialize(const std::string& target, const std::string& host) const;
};

/**
 * @brief Response as returned by a transport
 *
 * Header lookups are case-insensitive; the body is kept as raw bytes and
 * only turned into text for error messages.
 */
struct HttpResponse {
    int status_code = 0;
    std::string reason_phrase;
    HeaderMap headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status_code)) {
    }

    std::optional<std::string> find_header(const std::string& name) const {
        auto it = headers.find(name);
        if (it == headers.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    bool is_success() const {
        return status_code >= 200 && status_code < 300;
    }

    static std::string get_reason_phrase(int status_code) {
        switch (status_code) {
            case 200: return "OK";
            case 201: return "Created";
            case 204: return "No Content";
            case 400: return "Bad Request";
            case 404: return "Not Found";
            case 409: return "Conflict";
            case 413: return "Payload Too Large";
            case 460: return "Checksum Mismatch";
            case 500: return "Internal Server Error";
            default: return "Unknown";
        }
    }
};

/**
 * @brief Helper functions for HTTP method conversions
 */
class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PATCH") return HttpMethod::PATCH;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PATCH: return "PATCH";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::OPTIONS: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }
};

inline std::vector<uint8_t> HttpRequest::serialize(const std::string& target, const std::string& host) const {
    std::ostringstream oss;

    // Request line
    oss << HttpMethodUtils::to_string(method) << " " << target << " HTTP/1.1\r\n";

    oss << "Host: " << host << "\r\n";
    for (const auto& [name, value] : headers) {
        if (strcasecmp(name.c_str(), "Host") == 0 || strcasecmp(name.c_str(), "Content-Length") == 0) {
            continue;
        }
        oss << name << ": " << value << "\r\n";
    }
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "Connection: close\r\n";

    // Empty line separates headers from body
    oss << "\r\n";

    std::string header_str = oss.str();
    std::vector<uint8_t> result(header_str.begin(), header_str.end());
    result.insert(result.end(), body.begin(), body.end());
    return result;
}

} // namespace network
} // namespace tus
