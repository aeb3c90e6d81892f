#pragma once

#include "tus/core/result.hpp"
#include "tus/network/http_types.hpp"
#include "tus/network/transport.hpp"
#include "tus/protocol/upload_meta.hpp"

#include <cstdint>
#include <variant>
#include <vector>

namespace tus::protocol {

/// POST to the upload host with Upload-Length; decodes Location.
struct Create {};
/// HEAD on the remote URL; decodes Upload-Offset.
struct GetOffset {};
/// PATCH one chunk at the current offset; decodes the new Upload-Offset.
struct Upload {};
/// DELETE the remote resource; decodes nothing.
struct Terminate {};

/**
 * @brief The closed set of TUS operations
 *
 * Each alternative selects a verb, its required headers, a target URL rule
 * and a response decode rule. Dispatch is by std::visit, so adding an
 * alternative fails to compile until every rule handles it.
 */
using Operation = std::variant<Create, GetOffset, Upload, Terminate>;

const char* name_of(const Operation& op) noexcept;

network::HttpMethod method_of(const Operation& op) noexcept;

struct DispatchOptions {
    /// Send PATCH and DELETE as POST with X-HTTP-Method-Override.
    bool method_override = false;
    /// Applied to every request after the protocol headers, before custom headers.
    network::HeaderMap default_headers;
};

/**
 * @brief Turn (operation, meta) into a request descriptor
 *
 * Header precedence, lowest first: Tus-Resumable and Upload-Metadata,
 * DispatchOptions::default_headers, the meta's custom headers, then the
 * operation's own required headers. Fails before anything is sent with
 * MissingUploadUrl, InvalidHeader or InvalidHeaderValue.
 */
Result<network::HttpRequest> build_request(const Operation& op,
                                           const UploadMeta& meta,
                                           std::vector<uint8_t> body = {},
                                           const DispatchOptions& options = {});

/**
 * @brief Map a non-2xx status to its error kind
 *
 * 400 BadRequest (carries the body), 404 NotFound, 409 OffsetConflict,
 * 413 PayloadTooLarge, 460 ChecksumMismatch, anything else
 * UnexpectedStatus with the code and body.
 */
Result<void> classify_status(const network::HttpResponse& response);

/**
 * @brief Apply the operation's decode rule to a response
 *
 * Classifies the status first; only 2xx responses are decoded. Required
 * fields are decoded strictly and fail with MissingHeader. An Upload reply
 * whose offset is below the request offset fails with ProtocolViolation.
 */
Result<UploadMeta> decode_response(const Operation& op,
                                   const UploadMeta& meta,
                                   const network::HttpResponse& response);

/**
 * @brief Runs single operations against a transport
 *
 * Stateless apart from its configuration; one instance may serve many
 * uploads concurrently if the transport allows it. Never retries.
 */
class Dispatcher {
public:
    Dispatcher(network::Transport& transport, DispatchOptions options);

    Result<UploadMeta> run(const Operation& op,
                           const UploadMeta& meta,
                           std::vector<uint8_t> body = {}) const;

    const DispatchOptions& options() const noexcept { return options_; }

private:
    network::Transport& transport_;
    DispatchOptions options_;
};

} // namespace tus::protocol
