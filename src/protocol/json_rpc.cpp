#include "mcpx/protocol/json_rpc.hpp"

namespace mcpx {
namespace {

constexpr std::string_view kJsonRpcVersion{"2.0"};

bool is_valid_params_type(const Json& node) {
    return node.is_object() || node.is_array();
}

JsonResult<JsonRpcId> parse_id_field(const Json& id_node) {
    if (id_node.is_number_integer() == true) {
        return JsonRpcId::integer(id_node.get<std::int64_t>());
    }
    if (id_node.is_string() == true) {
        return JsonRpcId::string(id_node.get<std::string>());
    }

    return tl::unexpected(JsonError{
        JsonError::Code::InvalidId,
        "id must be an integer or string"});
}

JsonResult<std::optional<JsonRpcId>> parse_optional_id(const Json& payload) {
    const auto it = payload.find("id");
    if (it == payload.end() || it->is_null()) {
        return std::optional<JsonRpcId>{};
    }
    auto parsed = parse_id_field(*it);
    if (parsed.has_value() == false) {
        return tl::unexpected(parsed.error());
    }
    return std::optional<JsonRpcId>{std::move(*parsed)};
}

JsonResult<void> validate_error_object(const Json& error_node) {
    if (error_node.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "error must be an object"});
    }
    const auto code = error_node.find("code");
    if (code == error_node.end() || code->is_number_integer() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "error.code must be an integer"});
    }
    const auto message = error_node.find("message");
    if (message == error_node.end() || message->is_string() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "error.message must be a string"});
    }
    return {};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcId JsonRpcId::integer(std::int64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::string(std::string value) {
    return JsonRpcId{std::move(value)};
}

Json JsonRpcId::to_json() const {
    return std::visit([](const auto& v) { return Json(v); }, value);
}

std::string JsonRpcId::to_string() const {
    if (const auto* number = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*number);
    }
    return std::get<std::string>(value);
}

Json JsonRpcError::to_json() const {
    Json payload = Json::object();
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

// ─────────────────────────────────────────────────────────────────────────────
// ProtocolMessage
// ─────────────────────────────────────────────────────────────────────────────

ProtocolMessage::ProtocolMessage(MessageKind kind,
                                 std::optional<JsonRpcId> id,
                                 std::string method,
                                 Json payload)
    : kind_(kind),
      id_(std::move(id)),
      method_(std::move(method)),
      payload_(std::move(payload)) {}

JsonResult<ProtocolMessage> ProtocolMessage::parse(std::string_view text) {
    Json payload = Json::parse(text, nullptr, false);
    if (payload.is_discarded()) {
        return tl::unexpected(JsonError{
            JsonError::Code::ParseError,
            "payload is not valid JSON"});
    }
    return from_json(std::move(payload));
}

JsonResult<ProtocolMessage> ProtocolMessage::from_json(Json payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::NotAnObject,
            "payload must be a JSON object"});
    }

    const auto version = payload.find("jsonrpc");
    if (version == payload.end()) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing jsonrpc version field"});
    }
    if (version->is_string() == false || *version != kJsonRpcVersion) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidVersion,
            "jsonrpc must equal \"2.0\""});
    }

    auto id = parse_optional_id(payload);
    if (id.has_value() == false) {
        return tl::unexpected(id.error());
    }

    const auto method = payload.find("method");
    if (method != payload.end()) {
        if (method->is_string() == false) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidParams,
                "method must be a string"});
        }
        const auto params = payload.find("params");
        if (params != payload.end() && is_valid_params_type(*params) == false) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidParams,
                "params must be an object or array"});
        }
        std::string method_name = method->get<std::string>();
        const MessageKind kind = id->has_value() ? MessageKind::Request : MessageKind::Notification;
        return ProtocolMessage(kind, std::move(*id), std::move(method_name), std::move(payload));
    }

    if (payload.contains("result")) {
        if (id->has_value() == false) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidId,
                "response is missing its id"});
        }
        return ProtocolMessage(MessageKind::Response, std::move(*id), {}, std::move(payload));
    }

    const auto error = payload.find("error");
    if (error != payload.end()) {
        auto valid = validate_error_object(*error);
        if (valid.has_value() == false) {
            return tl::unexpected(valid.error());
        }
        return ProtocolMessage(MessageKind::Error, std::move(*id), {}, std::move(payload));
    }

    return tl::unexpected(JsonError{
        JsonError::Code::MissingField,
        "message has neither method, result nor error"});
}

ProtocolMessage ProtocolMessage::request(JsonRpcId id, std::string method, std::optional<Json> params) {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id.to_json();
    payload["method"] = method;
    if (params.has_value()) {
        payload["params"] = std::move(*params);
    }
    return ProtocolMessage(MessageKind::Request, std::move(id), std::move(method), std::move(payload));
}

ProtocolMessage ProtocolMessage::notification(std::string method, std::optional<Json> params) {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method;
    if (params.has_value()) {
        payload["params"] = std::move(*params);
    }
    return ProtocolMessage(MessageKind::Notification, std::nullopt, std::move(method), std::move(payload));
}

ProtocolMessage ProtocolMessage::response(JsonRpcId id, Json result) {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id.to_json();
    payload["result"] = std::move(result);
    return ProtocolMessage(MessageKind::Response, std::move(id), {}, std::move(payload));
}

ProtocolMessage ProtocolMessage::error_response(std::optional<JsonRpcId> id, JsonRpcError error) {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id.has_value() ? id->to_json() : Json(nullptr);
    payload["error"] = error.to_json();
    return ProtocolMessage(MessageKind::Error, std::move(id), {}, std::move(payload));
}

bool ProtocolMessage::answers(const JsonRpcId& request_id) const noexcept {
    return is_reply() && id_.has_value() && *id_ == request_id;
}

std::string ProtocolMessage::serialize() const {
    return payload_.dump();
}

}  // namespace mcpx
