#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace mcpx {

using Json = nlohmann::json;

struct JsonError {
    enum class Code {
        ParseError,
        NotAnObject,
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidParams,
        Internal
    };

    Code code{Code::Internal};
    std::string message;
};

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

// ─────────────────────────────────────────────────────────────────────────────
// Error codes sent back to clients
// ─────────────────────────────────────────────────────────────────────────────

namespace rpc_error {
inline constexpr std::int64_t kParseError = -32700;
inline constexpr std::int64_t kInvalidRequest = -32600;
inline constexpr std::int64_t kInternalError = -32603;
inline constexpr std::int64_t kBlockedByPolicy = -32001;
inline constexpr std::int64_t kReplyTooLarge = -32002;
inline constexpr std::int64_t kUpstreamUnavailable = -32003;
inline constexpr std::int64_t kUpstreamStreamLost = -32004;
}  // namespace rpc_error

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

struct JsonRpcId {
    std::variant<std::int64_t, std::string> value;

    static JsonRpcId integer(std::int64_t v);
    static JsonRpcId string(std::string v);

    [[nodiscard]] Json to_json() const;
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const JsonRpcId&, const JsonRpcId&) = default;
};

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// ProtocolMessage
// ─────────────────────────────────────────────────────────────────────────────
// One JSON-RPC 2.0 object as it travels through the proxy. The payload is kept
// verbatim so fields the proxy does not understand survive a round trip;
// kind and id are derived once at parse time.

enum class MessageKind {
    Request,       // method + id
    Notification,  // method, no id
    Response,      // result + id
    Error          // error (+ id, which may be null)
};

[[nodiscard]] constexpr std::string_view to_string(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::Request:      return "request";
        case MessageKind::Notification: return "notification";
        case MessageKind::Response:     return "response";
        case MessageKind::Error:        return "error";
    }
    return "unknown";
}

class ProtocolMessage {
public:
    /// Parse text as a single JSON-RPC object. Arrays (batches) are rejected
    /// with Code::NotAnObject.
    [[nodiscard]] static JsonResult<ProtocolMessage> parse(std::string_view text);

    [[nodiscard]] static JsonResult<ProtocolMessage> from_json(Json payload);

    [[nodiscard]] static ProtocolMessage request(
        JsonRpcId id, std::string method, std::optional<Json> params = std::nullopt);

    [[nodiscard]] static ProtocolMessage notification(
        std::string method, std::optional<Json> params = std::nullopt);

    [[nodiscard]] static ProtocolMessage response(JsonRpcId id, Json result);

    /// Error response; id is absent (null on the wire) when the request
    /// could not be correlated.
    [[nodiscard]] static ProtocolMessage error_response(
        std::optional<JsonRpcId> id, JsonRpcError error);

    [[nodiscard]] MessageKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::optional<JsonRpcId>& id() const noexcept { return id_; }

    /// Empty for responses and errors.
    [[nodiscard]] const std::string& method() const noexcept { return method_; }

    [[nodiscard]] const Json& payload() const noexcept { return payload_; }

    [[nodiscard]] bool is_request() const noexcept { return kind_ == MessageKind::Request; }
    [[nodiscard]] bool is_notification() const noexcept { return kind_ == MessageKind::Notification; }

    /// True for results and errors.
    [[nodiscard]] bool is_reply() const noexcept {
        return kind_ == MessageKind::Response || kind_ == MessageKind::Error;
    }

    /// True when this is a reply whose id equals request_id.
    [[nodiscard]] bool answers(const JsonRpcId& request_id) const noexcept;

    [[nodiscard]] std::string serialize() const;

private:
    ProtocolMessage(MessageKind kind, std::optional<JsonRpcId> id, std::string method, Json payload);

    MessageKind kind_;
    std::optional<JsonRpcId> id_;
    std::string method_;
    Json payload_;
};

}  // namespace mcpx
