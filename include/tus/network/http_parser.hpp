#pragma once

#include "http_types.hpp"
#include "tus/core/result.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>

namespace tus {
namespace network {

/**
 * @brief State machine states for HTTP response parsing
 *
 * HTTP Response Format:
 * VERSION SP STATUS SP REASON CRLF  <- Status line
 * Header-Name: Header-Value CRLF    <- Headers (multiple)
 * CRLF                              <- Empty line
 * [Body]                            <- Content-Length, chunked, or until close
 */
enum class ParseState {
    VERSION,         // Parsing "HTTP/1.1"
    STATUS_CODE,     // Parsing the three digit status
    REASON,          // Parsing reason phrase up to CRLF
    HEADER_NAME,     // Parsing header field name
    HEADER_VALUE,    // Parsing header field value
    BODY,            // Reading exactly Content-Length bytes
    CHUNK_SIZE,      // Reading a hex chunk size line
    CHUNK_DATA,      // Reading chunk payload
    CHUNK_DATA_END,  // Expecting CRLF after chunk payload
    CHUNK_TRAILER,   // Reading trailer lines after the last chunk
    BODY_UNTIL_CLOSE,// No framing: body ends when the peer closes
    COMPLETE,        // Parsing complete, response ready
    PARSE_ERROR      // Parsing error occurred (renamed to avoid Windows macro conflict)
};

/**
 * @brief Incremental HTTP/1.1 response parser
 *
 * Data can be fed in arbitrary slices as it arrives from the socket.
 * Responses to HEAD and 1xx/204/304 responses never carry a body, even if
 * they advertise a Content-Length.
 *
 * Usage example:
 * ```cpp
 * HttpResponseParser parser(request.method == HttpMethod::HEAD);
 * while (!parser.is_complete()) {
 *     auto n = socket.read_some(asio::buffer(buffer), ec);
 *     if (ec == asio::error::eof) {
 *         auto done = parser.finish();
 *         break;
 *     }
 *     auto result = parser.parse(buffer.data(), n);
 *     if (result.is_error()) { ... }
 * }
 * HttpResponse response = parser.get_response();
 * ```
 */
class HttpResponseParser {
public:
    explicit HttpResponseParser(bool head_request = false) { reset(head_request); }

    /**
     * @brief Parse incoming data
     *
     * @return true once the full response has been read, false if more data
     *         is needed, or an error for malformed input
     */
    Result<bool> parse(const char* data, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            char c = data[i];

            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::VERSION:
                    ok = parse_version(c);
                    break;
                case ParseState::STATUS_CODE:
                    ok = parse_status_code(c);
                    break;
                case ParseState::REASON:
                    ok = parse_reason(c);
                    break;
                case ParseState::HEADER_NAME:
                    ok = parse_header_name(c);
                    break;
                case ParseState::HEADER_VALUE:
                    ok = parse_header_value(c);
                    break;
                case ParseState::BODY:
                    parse_body(c);
                    break;
                case ParseState::CHUNK_SIZE:
                    ok = parse_chunk_size(c);
                    break;
                case ParseState::CHUNK_DATA:
                    parse_chunk_data(c);
                    break;
                case ParseState::CHUNK_DATA_END:
                    ok = parse_chunk_data_end(c);
                    break;
                case ParseState::CHUNK_TRAILER:
                    parse_chunk_trailer(c);
                    break;
                case ParseState::BODY_UNTIL_CLOSE:
                    response_.body.push_back(static_cast<uint8_t>(c));
                    break;
                case ParseState::COMPLETE:
                    // Bytes after a complete response are ignored; the
                    // connection is not reused.
                    return Ok(true);
                case ParseState::PARSE_ERROR:
                    return Err<bool>(parse_error("Parser in error state"));
            }

            if (!ok) {
                state_ = ParseState::PARSE_ERROR;
                return Err<bool>(parse_error(error_context_ + " at line " + std::to_string(line_)));
            }

            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
        }

        return Ok(false);
    }

    /**
     * @brief Signal end of stream from the peer
     *
     * Completes a close-delimited body; any other unfinished state means the
     * response was truncated.
     */
    Result<bool> finish() {
        if (state_ == ParseState::COMPLETE) {
            return Ok(true);
        }
        if (state_ == ParseState::BODY_UNTIL_CLOSE) {
            state_ = ParseState::COMPLETE;
            return Ok(true);
        }
        state_ = ParseState::PARSE_ERROR;
        return Err<bool>(parse_error("Connection closed before response was complete"));
    }

    HttpResponse get_response() const {
        return response_;
    }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    void reset(bool head_request = false) {
        state_ = ParseState::VERSION;
        response_ = HttpResponse();
        head_request_ = head_request;
        buffer_.clear();
        current_header_name_.clear();
        error_context_.clear();
        remaining_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    // Upper bound on the up-front body allocation; larger bodies grow as they arrive
    static constexpr size_t kMaxReserve = 64 * 1024;

    ParseState state_;
    HttpResponse response_;
    bool head_request_;
    std::string buffer_;                // Temporary buffer for current token
    std::string current_header_name_;
    std::string error_context_;
    size_t remaining_;                  // Bytes left in body or current chunk
    size_t line_;
    bool last_char_was_cr_;

    static Error parse_error(const std::string& message) {
        return Error::transport("Malformed HTTP response: " + message);
    }

    bool fail(const char* context) {
        error_context_ = context;
        return false;
    }

    bool parse_version(char c) {
        if (c == ' ') {
            if (buffer_.rfind("HTTP/1.", 0) != 0) {
                return fail("Unsupported HTTP version");
            }
            buffer_.clear();
            state_ = ParseState::STATUS_CODE;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c)) || buffer_.size() > 16) {
            return fail("Invalid status line");
        }
        buffer_ += c;
        return true;
    }

    bool parse_status_code(char c) {
        if (c == ' ' || c == '\r') {
            if (buffer_.size() != 3) {
                return fail("Invalid status code");
            }
            response_.status_code = std::atoi(buffer_.c_str());
            buffer_.clear();
            state_ = ParseState::REASON;
            last_char_was_cr_ = (c == '\r');
            return true;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return fail("Invalid status code");
        }
        buffer_ += c;
        return true;
    }

    bool parse_reason(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            response_.reason_phrase = buffer_;
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            if (!buffer_.empty()) {
                return fail("Header line without colon");
            }
            return begin_body();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return fail("Empty header name");
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return fail("Invalid header name");
        }

        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        // Skip leading whitespace after colon
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            // Repeated fields are combined into one comma-separated list
            auto existing = response_.headers.find(current_header_name_);
            if (existing != response_.headers.end()) {
                existing->second += ", " + buffer_;
            } else {
                response_.headers[current_header_name_] = buffer_;
            }
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    /**
     * @brief Strict unsigned parse of a Content-Length or chunk size
     *
     * Only digits of the given base are accepted (no sign, no whitespace),
     * and values that do not fit in size_t are rejected.
     */
    static std::optional<uint64_t> parse_length(const std::string& text, unsigned base) {
        if (text.empty()) {
            return std::nullopt;
        }
        const uint64_t limit = std::numeric_limits<size_t>::max();
        uint64_t value = 0;
        for (unsigned char c : text) {
            unsigned digit = 0;
            if (std::isdigit(c)) {
                digit = static_cast<unsigned>(c - '0');
            } else if (base == 16 && std::isxdigit(c)) {
                digit = static_cast<unsigned>(std::tolower(c) - 'a' + 10);
            } else {
                return std::nullopt;
            }
            if (value > (limit - digit) / base) {
                return std::nullopt;
            }
            value = value * base + digit;
        }
        return value;
    }

    /**
     * @brief Pick the body framing once headers are complete
     */
    bool begin_body() {
        const int status = response_.status_code;
        if (head_request_ || (status >= 100 && status < 200) || status == 204 || status == 304) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        auto transfer_encoding = response_.find_header("Transfer-Encoding");
        if (transfer_encoding && transfer_encoding->find("chunked") != std::string::npos) {
            state_ = ParseState::CHUNK_SIZE;
            return true;
        }

        auto content_length = response_.find_header("Content-Length");
        if (content_length) {
            const auto length = parse_length(*content_length, 10);
            if (!length) {
                return fail("Invalid Content-Length");
            }
            if (*length == 0) {
                state_ = ParseState::COMPLETE;
                return true;
            }
            remaining_ = static_cast<size_t>(*length);
            response_.body.reserve(std::min(remaining_, kMaxReserve));
            state_ = ParseState::BODY;
            return true;
        }

        state_ = ParseState::BODY_UNTIL_CLOSE;
        return true;
    }

    void parse_body(char c) {
        response_.body.push_back(static_cast<uint8_t>(c));
        if (--remaining_ == 0) {
            state_ = ParseState::COMPLETE;
        }
    }

    bool parse_chunk_size(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            // Chunk extensions (";name=value") are ignored
            const auto size_str = buffer_.substr(0, buffer_.find(';'));
            buffer_.clear();
            if (size_str.empty()) {
                return fail("Empty chunk size");
            }
            const auto size = parse_length(size_str.substr(0, size_str.find_last_not_of(" \t") + 1), 16);
            if (!size) {
                return fail("Invalid chunk size");
            }
            if (*size == 0) {
                state_ = ParseState::CHUNK_TRAILER;
                return true;
            }
            remaining_ = static_cast<size_t>(*size);
            state_ = ParseState::CHUNK_DATA;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    void parse_chunk_data(char c) {
        response_.body.push_back(static_cast<uint8_t>(c));
        if (--remaining_ == 0) {
            state_ = ParseState::CHUNK_DATA_END;
        }
    }

    bool parse_chunk_data_end(char c) {
        if (c == '\r') {
            return true;
        }
        if (c == '\n') {
            state_ = ParseState::CHUNK_SIZE;
            return true;
        }
        return fail("Missing CRLF after chunk data");
    }

    void parse_chunk_trailer(char c) {
        if (c == '\r') {
            return;
        }
        if (c == '\n') {
            if (buffer_.empty()) {
                state_ = ParseState::COMPLETE;
            }
            buffer_.clear();
            return;
        }
        buffer_ += c;
    }
};

} // namespace network
} // namespace tus
