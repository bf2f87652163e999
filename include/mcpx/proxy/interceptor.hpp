#pragma once

#include "mcpx/protocol/json_rpc.hpp"
#include "mcpx/session/session.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <asio/awaitable.hpp>

namespace mcpx {

// ─────────────────────────────────────────────────────────────────────────────
// Interceptor actions
// ─────────────────────────────────────────────────────────────────────────────

struct ContinueAction {};

/// Replace the message; later interceptors see the replacement.
struct ModifyAction {
    ProtocolMessage message;
};

/// Stop here. The message is not forwarded.
struct BlockAction {
    std::string reason;
};

/// No verdict yet. The chain forwards the current message unchanged.
struct DeferAction {};

using InterceptAction = std::variant<ContinueAction, ModifyAction, BlockAction, DeferAction>;

struct InterceptContext {
    std::string session_id;
    HistoryDirection direction{HistoryDirection::UpstreamToClient};
    TransportKind upstream_transport{TransportKind::StreamableHttp};
    std::optional<std::string> event_id;   ///< set for stream events
};

// ─────────────────────────────────────────────────────────────────────────────
// IInterceptor
// ─────────────────────────────────────────────────────────────────────────────

class IInterceptor {
public:
    virtual ~IInterceptor() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    virtual asio::awaitable<InterceptAction> process(
        const ProtocolMessage& message, const InterceptContext& context) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// InterceptorChain
// ─────────────────────────────────────────────────────────────────────────────

struct ChainVerdict {
    enum class Outcome { Forward, Block };

    Outcome outcome{Outcome::Forward};
    ProtocolMessage message;        ///< what to forward (valid for Forward)
    bool modified{false};
    std::string reason;             ///< block reason
    std::string decided_by;         ///< interceptor that blocked

    [[nodiscard]] bool blocked() const noexcept { return outcome == Outcome::Block; }
};

/// Runs interceptors in registration order. Each call is bounded by the
/// per-interceptor timeout; an interceptor that times out or throws counts as
/// Continue and the chain moves on. Registration is not synchronised and is
/// expected to finish before traffic starts.
class InterceptorChain {
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{2000};

    explicit InterceptorChain(std::chrono::milliseconds timeout = kDefaultTimeout)
        : timeout_(timeout) {}

    InterceptorChain& add(std::shared_ptr<IInterceptor> interceptor);

    [[nodiscard]] bool empty() const noexcept { return interceptors_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return interceptors_.size(); }
    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

    asio::awaitable<ChainVerdict> run(ProtocolMessage message, InterceptContext context) const;

private:
    std::chrono::milliseconds timeout_;
    std::vector<std::shared_ptr<IInterceptor>> interceptors_;
};

}  // namespace mcpx
