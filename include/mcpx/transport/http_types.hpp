#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mcpx {

// ─────────────────────────────────────────────────────────────────────────────
// Headers
// ─────────────────────────────────────────────────────────────────────────────
// Header names are case-insensitive (RFC 7230); the map keeps whatever casing
// the peer used and lookups go through find_header().

using HeaderMap = std::unordered_map<std::string, std::string>;

namespace header {
inline constexpr std::string_view kContentType = "Content-Type";
inline constexpr std::string_view kContentLength = "Content-Length";
inline constexpr std::string_view kAccept = "Accept";
inline constexpr std::string_view kSessionId = "Mcp-Session-Id";
inline constexpr std::string_view kProtocolVersion = "MCP-Protocol-Version";
inline constexpr std::string_view kLastEventId = "Last-Event-ID";
}  // namespace header

/// ASCII case-insensitive comparison for header names and tokens.
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

[[nodiscard]] HeaderMap::const_iterator find_header(const HeaderMap& headers, std::string_view name);

[[nodiscard]] std::optional<std::string> get_header(const HeaderMap& headers, std::string_view name);

/// Insert or replace, reusing an existing key regardless of its casing.
void set_header(HeaderMap& headers, std::string_view name, std::string value);

void erase_header(HeaderMap& headers, std::string_view name);

/// Remove headers that describe one connection rather than the message:
/// the fixed hop-by-hop set (Connection, Keep-Alive, Transfer-Encoding, ...),
/// anything the Connection header names, and Content-Length, since the
/// front end re-frames relayed bodies.
void strip_hop_by_hop_headers(HeaderMap& headers);

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Method
// ─────────────────────────────────────────────────────────────────────────────
// POST sends messages, GET opens or resumes an event stream, DELETE ends a
// session.

enum class HttpMethod {
    Get,
    Post,
    Delete
};

inline std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Delete: return "DELETE";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr bool is_success_status(int status) noexcept {
    return status >= 200 && status < 300;
}

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────

struct UrlComponents {
    std::string scheme;
    std::string host;
    std::uint16_t port{0};
    std::string path;
    std::string query;

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    [[nodiscard]] std::string host_with_port() const {
        return host + ":" + std::to_string(port);
    }
};

/// WHATWG parse via ada. Only http and https URLs with a host are accepted.
std::optional<UrlComponents> parse_url(const std::string& url);

}  // namespace mcpx
