#pragma once

#include "mcpx/session/session.hpp"
#include "mcpx/transport/http_types.hpp"
#include "mcpx/transport/transport_error.hpp"
#include "mcpx/upstream/upstream_response.hpp"

#include <memory>
#include <optional>
#include <string>

#include <asio/awaitable.hpp>

namespace mcpx {

/// One exchange to send upstream. Protocol headers (session id, protocol
/// version, Last-Event-ID) travel in `headers`.
struct UpstreamRequest {
    HttpMethod method{HttpMethod::Post};
    HeaderMap headers;
    std::optional<std::string> body;
};

// ─────────────────────────────────────────────────────────────────────────────
// IUpstreamDispatcher
// ─────────────────────────────────────────────────────────────────────────────
// Sends a request to one upstream server. Completes as soon as status and
// headers are known; the body is read later through the returned handle.

class IUpstreamDispatcher {
public:
    virtual ~IUpstreamDispatcher() = default;

    virtual asio::awaitable<TransportResult<UpstreamResponse>> async_dispatch(UpstreamRequest request) = 0;

    [[nodiscard]] virtual TransportKind kind() const noexcept = 0;
};

struct UpstreamEndpoint {
    std::string name;
    std::shared_ptr<IUpstreamDispatcher> dispatcher;
};

// ─────────────────────────────────────────────────────────────────────────────
// IUpstreamSelector
// ─────────────────────────────────────────────────────────────────────────────

class IUpstreamSelector {
public:
    virtual ~IUpstreamSelector() = default;

    [[nodiscard]] virtual UpstreamEndpoint select() = 0;
};

class StaticUpstreamSelector final : public IUpstreamSelector {
public:
    explicit StaticUpstreamSelector(UpstreamEndpoint endpoint)
        : endpoint_(std::move(endpoint)) {}

    [[nodiscard]] UpstreamEndpoint select() override { return endpoint_; }

private:
    UpstreamEndpoint endpoint_;
};

}  // namespace mcpx
