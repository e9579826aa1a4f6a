#pragma once
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

/**
 * @brief Numeric error codes carried in error-response envelopes.
 *
 * The first five are the standard JSON-RPC codes, the rest are
 * tool-invocation specific.
 */
enum class ErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
    ToolNotFound = -32001,
    ToolError = -32002,
    Timeout = -32003,
    ValidationError = -32004,
    Cancelled = -32800
};

const char* errorCodeName(ErrorCode code);

enum class EnvelopeKind {
    Request,
    Response,
    ErrorResponse,
    Notification
};

/**
 * @brief One protocol message, independent of the transport that carried it.
 *
 * payload holds "params" for requests and notifications, "result" for
 * responses and the "error" object for error responses. Top-level fields
 * the codec does not know are kept in extra and written back on encode.
 */
struct Envelope {
    std::string version = "2.0";
    nlohmann::json id;
    EnvelopeKind kind = EnvelopeKind::Notification;
    std::string method;
    nlohmann::json payload;
    nlohmann::json extra = nlohmann::json::object();

    bool isRequest() const { return kind == EnvelopeKind::Request; }
    bool isNotification() const { return kind == EnvelopeKind::Notification; }
    bool isReply() const { return kind == EnvelopeKind::Response || kind == EnvelopeKind::ErrorResponse; }

    bool operator==(const Envelope& other) const;
    bool operator!=(const Envelope& other) const { return !(*this == other); }
};

struct DecodeError {
    ErrorCode code = ErrorCode::ParseError;
    std::string message;
    size_t offset = 0;
    std::string fragment;
    // Id of the offending message when it could be recovered, null otherwise.
    nlohmann::json id;
};

using DecodeResult = std::variant<Envelope, DecodeError>;

namespace EnvelopeCodec {
    // Deeper input is rejected as a parse error before it reaches the JSON parser.
    constexpr size_t kMaxNestingDepth = 512;

    /**
     * @brief Serialize to a single-line JSON text (no trailing newline).
     *
     * Key order is fixed, so equal envelopes always encode to equal bytes.
     * Invalid UTF-8 in strings is replaced rather than thrown.
     */
    std::string encode(const Envelope& envelope);

    /**
     * @brief Parse one JSON text into an envelope.
     *
     * Never throws: malformed JSON yields a ParseError, well-formed JSON
     * that is not a valid envelope yields an InvalidRequest error.
     */
    DecodeResult decode(const std::string& text);

    // Error response for a failed decode, addressed to the recovered id (or null).
    Envelope errorFor(const DecodeError& error);
}

Envelope makeRequest(const nlohmann::json& id, const std::string& method,
                     const nlohmann::json& params = nlohmann::json());
Envelope makeNotification(const std::string& method, const nlohmann::json& params = nlohmann::json());
Envelope makeResponse(const nlohmann::json& id, const nlohmann::json& result);
Envelope makeErrorResponse(const nlohmann::json& id, ErrorCode code, const std::string& message,
                           const nlohmann::json& data = nlohmann::json());

// Stable map key for a correlation id ("1" and 1 stay distinct).
std::string correlationKey(const nlohmann::json& id);
