#include "mcpx/transport/http_types.hpp"

#include <ada.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <ranges>
#include <vector>

namespace mcpx {

// ─────────────────────────────────────────────────────────────────────────────
// Headers
// ─────────────────────────────────────────────────────────────────────────────

namespace {

constexpr std::array<std::string_view, 9> kHopByHopHeaders = {
    "Connection", "Keep-Alive", "Proxy-Connection", "Proxy-Authenticate",
    "Proxy-Authorization", "TE", "Trailer", "Transfer-Encoding", "Upgrade"};

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

}  // namespace

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() && std::ranges::equal(a, b, [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

HeaderMap::const_iterator find_header(const HeaderMap& headers, std::string_view name) {
    return std::ranges::find_if(headers, [name](const auto& entry) { return iequals(entry.first, name); });
}

std::optional<std::string> get_header(const HeaderMap& headers, std::string_view name) {
    const auto it = find_header(headers, name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

void set_header(HeaderMap& headers, std::string_view name, std::string value) {
    const auto it = find_header(headers, name);
    if (it == headers.end()) {
        headers.emplace(std::string(name), std::move(value));
        return;
    }
    headers[it->first] = std::move(value);
}

void erase_header(HeaderMap& headers, std::string_view name) {
    const auto it = find_header(headers, name);
    if (it != headers.end()) {
        headers.erase(it);
    }
}

void strip_hop_by_hop_headers(HeaderMap& headers) {
    std::vector<std::string> doomed;
    if (const auto connection = get_header(headers, "Connection")) {
        std::string_view rest = *connection;
        while (rest.empty() == false) {
            const auto comma = rest.find(',');
            const auto token = trim(rest.substr(0, comma));
            if (token.empty() == false) {
                doomed.emplace_back(token);
            }
            rest = comma == std::string_view::npos ? std::string_view{} : rest.substr(comma + 1);
        }
    }
    for (const auto name : kHopByHopHeaders) {
        doomed.emplace_back(name);
    }
    doomed.emplace_back(header::kContentLength);

    std::erase_if(headers, [&doomed](const auto& entry) {
        return std::ranges::any_of(doomed, [&entry](const std::string& name) { return iequals(entry.first, name); });
    });
}

// ─────────────────────────────────────────────────────────────────────────────
// URL parsing
// ─────────────────────────────────────────────────────────────────────────────

std::optional<UrlComponents> parse_url(const std::string& url) {
    auto parsed = ada::parse<ada::url>(url);
    if (parsed.has_value() == false) {
        return std::nullopt;
    }
    const auto& ada_url = parsed.value();

    // ada reports the scheme with its trailing colon ("https:")
    std::string scheme = std::string(ada_url.get_protocol());
    if (scheme.empty() == false && scheme.back() == ':') {
        scheme.pop_back();
    }
    const bool is_https = (scheme == "https");
    if (scheme != "http" && is_https == false) {
        return std::nullopt;
    }

    std::string host = std::string(ada_url.get_hostname());
    if (host.empty()) {
        return std::nullopt;
    }

    std::uint16_t port = is_https ? 443 : 80;
    const auto port_text = ada_url.get_port();
    if (port_text.empty() == false) {
        const auto* first = port_text.data();
        const auto* last = port_text.data() + port_text.size();
        const auto [ptr, ec] = std::from_chars(first, last, port);
        if (ec != std::errc{} || ptr != last) {
            return std::nullopt;
        }
    }

    std::string path = std::string(ada_url.get_pathname());
    if (path.empty()) {
        path = "/";
    }

    UrlComponents result;
    result.scheme = std::move(scheme);
    result.host = std::move(host);
    result.port = port;
    result.path = std::move(path);
    result.query = std::string(ada_url.get_search());
    return result;
}

}  // namespace mcpx
