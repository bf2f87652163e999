#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace mcpx {

// ─────────────────────────────────────────────────────────────────────────────
// TransportError
// ─────────────────────────────────────────────────────────────────────────────
// Failure talking to an upstream: dispatching a request or reading its body.

struct TransportError {
    enum class Category {
        Network,    // connect/reset/IO failure
        Timeout,    // connect or read deadline passed
        Protocol,   // peer spoke something we cannot interpret
        Cancelled   // we aborted the exchange ourselves
    };

    Category category{Category::Network};
    std::string message;
    std::optional<int> status_code{};

    [[nodiscard]] static TransportError network(std::string msg) {
        return TransportError{Category::Network, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static TransportError timeout(std::string msg) {
        return TransportError{Category::Timeout, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static TransportError protocol(std::string msg) {
        return TransportError{Category::Protocol, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static TransportError cancelled() {
        return TransportError{Category::Cancelled, "exchange cancelled", std::nullopt};
    }
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Network:   return "network";
        case TransportError::Category::Timeout:   return "timeout";
        case TransportError::Category::Protocol:  return "protocol";
        case TransportError::Category::Cancelled: return "cancelled";
    }
    return "unknown";
}

template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace mcpx
