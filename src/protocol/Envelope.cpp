#include "protocol/Envelope.h"
#include <algorithm>

namespace {
const auto kReplace = nlohmann::json::error_handler_t::replace;
constexpr size_t kFragmentBytes = 64;

std::string dumpJson(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, kReplace);
}

bool isKnownKey(const std::string& key) {
    return key == "jsonrpc" || key == "id" || key == "method" ||
           key == "params" || key == "result" || key == "error";
}

std::string fragmentAround(const std::string& text, size_t offset) {
    size_t start = offset > kFragmentBytes / 2 ? offset - kFragmentBytes / 2 : 0;
    return text.substr(std::min(start, text.size()), kFragmentBytes);
}

DecodeError invalid(const std::string& message, const std::string& text, const nlohmann::json& id = nlohmann::json()) {
    DecodeError err;
    err.code = ErrorCode::InvalidRequest;
    err.message = message;
    err.offset = 0;
    err.fragment = text.substr(0, kFragmentBytes);
    err.id = id;
    return err;
}

// Offset of the bracket that opens level maxDepth + 1, or npos when the text stays within maxDepth.
size_t nestingOverflowAt(const std::string& text, size_t maxDepth) {
    size_t depth = 0;
    bool inString = false;
    bool escaped = false;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (inString) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                inString = false;
            }
            continue;
        }
        if (c == '"') {
            inString = true;
        } else if (c == '[' || c == '{') {
            if (++depth > maxDepth) return i;
        } else if ((c == ']' || c == '}') && depth > 0) {
            --depth;
        }
    }
    return std::string::npos;
}

bool isValidId(const nlohmann::json& id) {
    return id.is_string() || id.is_number_integer() || id.is_number_unsigned() || id.is_null();
}
} // namespace

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::ParseError: return "parse-error";
        case ErrorCode::InvalidRequest: return "invalid-request";
        case ErrorCode::MethodNotFound: return "method-not-found";
        case ErrorCode::InvalidParams: return "invalid-params";
        case ErrorCode::InternalError: return "internal-error";
        case ErrorCode::ToolNotFound: return "tool-not-found";
        case ErrorCode::ToolError: return "tool-error";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::ValidationError: return "validation-error";
        case ErrorCode::Cancelled: return "cancelled";
    }
    return "unknown";
}

bool Envelope::operator==(const Envelope& other) const {
    return version == other.version && id == other.id && kind == other.kind &&
           method == other.method && payload == other.payload && extra == other.extra;
}

namespace EnvelopeCodec {

std::string encode(const Envelope& envelope) {
    std::string out = "{\"jsonrpc\":" + dumpJson(envelope.version);

    switch (envelope.kind) {
        case EnvelopeKind::Request:
            out += ",\"id\":" + dumpJson(envelope.id);
            out += ",\"method\":" + dumpJson(envelope.method);
            if (!envelope.payload.is_null()) out += ",\"params\":" + dumpJson(envelope.payload);
            break;
        case EnvelopeKind::Notification:
            out += ",\"method\":" + dumpJson(envelope.method);
            if (!envelope.payload.is_null()) out += ",\"params\":" + dumpJson(envelope.payload);
            break;
        case EnvelopeKind::Response:
            out += ",\"id\":" + dumpJson(envelope.id);
            out += ",\"result\":" + dumpJson(envelope.payload);
            break;
        case EnvelopeKind::ErrorResponse:
            out += ",\"id\":" + dumpJson(envelope.id);
            out += ",\"error\":" + dumpJson(envelope.payload);
            break;
    }

    if (envelope.extra.is_object()) {
        for (auto it = envelope.extra.begin(); it != envelope.extra.end(); ++it) {
            if (isKnownKey(it.key())) continue;
            out += "," + dumpJson(it.key()) + ":" + dumpJson(it.value());
        }
    }
    out += "}";
    return out;
}

DecodeResult decode(const std::string& text) {
    size_t tooDeep = nestingOverflowAt(text, kMaxNestingDepth);
    if (tooDeep != std::string::npos) {
        DecodeError err;
        err.code = ErrorCode::ParseError;
        err.message = "nesting deeper than " + std::to_string(kMaxNestingDepth) + " levels";
        err.offset = tooDeep;
        err.fragment = fragmentAround(text, tooDeep);
        return err;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        DecodeError err;
        err.code = ErrorCode::ParseError;
        err.message = e.what();
        err.offset = e.byte > 0 ? e.byte - 1 : 0;
        err.fragment = fragmentAround(text, err.offset);
        return err;
    }

    if (j.is_array()) {
        return invalid("batch envelopes are not supported", text);
    }
    if (!j.is_object()) {
        return invalid("envelope must be a JSON object", text);
    }

    nlohmann::json id = j.contains("id") ? j["id"] : nlohmann::json();
    if (!isValidId(id)) {
        return invalid("id must be a string, an integer or null", text);
    }

    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string()) {
        return invalid("missing jsonrpc version", text, id);
    }
    if (version->get<std::string>() != "2.0") {
        return invalid("unsupported jsonrpc version: " + version->get<std::string>(), text, id);
    }

    Envelope env;
    env.version = version->get<std::string>();
    env.id = id;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!isKnownKey(it.key())) env.extra[it.key()] = it.value();
    }

    if (j.contains("method")) {
        if (!j["method"].is_string()) {
            return invalid("method must be a string", text, id);
        }
        env.method = j["method"].get<std::string>();
        if (j.contains("params")) {
            const auto& params = j["params"];
            if (!params.is_object() && !params.is_array() && !params.is_null()) {
                return invalid("params must be an object or an array", text, id);
            }
            env.payload = params;
        }
        if (j.contains("id")) {
            if (id.is_null()) {
                return invalid("request id must not be null", text);
            }
            env.kind = EnvelopeKind::Request;
        } else {
            env.kind = EnvelopeKind::Notification;
        }
        return env;
    }

    if (j.contains("error")) {
        const auto& error = j["error"];
        if (!error.is_object() || !error.contains("code") || !error["code"].is_number_integer() ||
            !error.contains("message") || !error["message"].is_string()) {
            return invalid("error must be an object with integer code and string message", text, id);
        }
        if (!j.contains("id")) {
            return invalid("error response without id", text);
        }
        env.kind = EnvelopeKind::ErrorResponse;
        env.payload = error;
        return env;
    }

    if (j.contains("result")) {
        if (!j.contains("id") || id.is_null()) {
            return invalid("response without id", text);
        }
        env.kind = EnvelopeKind::Response;
        env.payload = j["result"];
        return env;
    }

    return invalid("envelope has neither method, result nor error", text, id);
}

Envelope errorFor(const DecodeError& error) {
    nlohmann::json data = {
        {"offset", error.offset},
        {"fragment", error.fragment}
    };
    const char* message = error.code == ErrorCode::ParseError ? "Parse error" : "Invalid request";
    data["detail"] = error.message;
    return makeErrorResponse(error.id, error.code, message, data);
}

} // namespace EnvelopeCodec

Envelope makeRequest(const nlohmann::json& id, const std::string& method, const nlohmann::json& params) {
    Envelope env;
    env.kind = EnvelopeKind::Request;
    env.id = id;
    env.method = method;
    env.payload = params;
    return env;
}

Envelope makeNotification(const std::string& method, const nlohmann::json& params) {
    Envelope env;
    env.kind = EnvelopeKind::Notification;
    env.method = method;
    env.payload = params;
    return env;
}

Envelope makeResponse(const nlohmann::json& id, const nlohmann::json& result) {
    Envelope env;
    env.kind = EnvelopeKind::Response;
    env.id = id;
    env.payload = result;
    return env;
}

Envelope makeErrorResponse(const nlohmann::json& id, ErrorCode code, const std::string& message,
                           const nlohmann::json& data) {
    Envelope env;
    env.kind = EnvelopeKind::ErrorResponse;
    env.id = id;
    env.payload = {
        {"code", static_cast<int>(code)},
        {"message", message}
    };
    if (!data.is_null()) {
        env.payload["data"] = data;
    }
    return env;
}

std::string correlationKey(const nlohmann::json& id) {
    return id.dump(-1, ' ', false, kReplace);
}
