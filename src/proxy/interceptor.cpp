#include "mcpx/proxy/interceptor.hpp"

#include "mcpx/log/logger.hpp"

#include <exception>

#include <asio/experimental/awaitable_operators.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

namespace mcpx {

using namespace asio::experimental::awaitable_operators;

namespace {

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

/// Interceptor result, or nullopt when it timed out or failed.
asio::awaitable<std::optional<InterceptAction>> call_bounded(
    IInterceptor& interceptor,
    const ProtocolMessage& message,
    const InterceptContext& context,
    std::chrono::milliseconds timeout)
{
    asio::steady_timer deadline(co_await asio::this_coro::executor, timeout);
    try {
        auto outcome = co_await (
            interceptor.process(message, context) ||
            deadline.async_wait(asio::use_awaitable)
        );
        if (outcome.index() == 1) {
            get_logger().warn_fmt("interceptor '{}' exceeded {}ms on session {}, continuing",
                interceptor.name(), timeout.count(), context.session_id);
            co_return std::nullopt;
        }
        co_return std::get<0>(std::move(outcome));
    } catch (const std::exception& e) {
        get_logger().error_fmt("interceptor '{}' failed on session {}: {}, continuing",
            interceptor.name(), context.session_id, e.what());
    }
    co_return std::nullopt;
}

}  // namespace

InterceptorChain& InterceptorChain::add(std::shared_ptr<IInterceptor> interceptor) {
    if (interceptor != nullptr) {
        interceptors_.push_back(std::move(interceptor));
    }
    return *this;
}

asio::awaitable<ChainVerdict> InterceptorChain::run(ProtocolMessage message, InterceptContext context) const {
    ChainVerdict verdict{ChainVerdict::Outcome::Forward, std::move(message), false, {}, {}};

    for (const auto& interceptor : interceptors_) {
        auto action = co_await call_bounded(*interceptor, verdict.message, context, timeout_);
        if (action.has_value() == false) {
            continue;
        }

        bool stop = false;
        std::visit(Overloaded{
            [](const ContinueAction&) {},
            [&](ModifyAction& modify) {
                verdict.message = std::move(modify.message);
                verdict.modified = true;
            },
            [&](BlockAction& block) {
                verdict.outcome = ChainVerdict::Outcome::Block;
                verdict.reason = std::move(block.reason);
                verdict.decided_by = std::string(interceptor->name());
                stop = true;
            },
            [&](const DeferAction&) {
                get_logger().debug_fmt("interceptor '{}' deferred, forwarding current message",
                    interceptor->name());
            }
        }, *action);

        if (stop) {
            get_logger().info_fmt("interceptor '{}' blocked {} on session {}: {}",
                verdict.decided_by, to_string(verdict.message.kind()), context.session_id, verdict.reason);
            break;
        }
    }

    co_return verdict;
}

}  // namespace mcpx
