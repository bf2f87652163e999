#pragma once

#include "mcpx/transport/http_types.hpp"
#include "mcpx/transport/transport_error.hpp"

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio/awaitable.hpp>

namespace mcpx {

// ─────────────────────────────────────────────────────────────────────────────
// IBodySource
// ─────────────────────────────────────────────────────────────────────────────
// Incremental access to an upstream response body. Bodies are consumed
// exactly once, by whichever handler the classifier routed them to, and are
// never materialised up front.

class IBodySource {
public:
    virtual ~IBodySource() = default;

    /// Next chunk in arrival order, std::nullopt at a clean end of body.
    /// A transport failure mid-body is an error, not an end.
    virtual asio::awaitable<TransportResult<std::optional<std::string>>> async_read_some() = 0;

    /// Abort the exchange. Pending and later reads complete with a
    /// Cancelled error. Safe to call from any thread, more than once.
    virtual void cancel() noexcept = 0;
};

using BodyHandle = std::unique_ptr<IBodySource>;

// ─────────────────────────────────────────────────────────────────────────────
// UpstreamResponse
// ─────────────────────────────────────────────────────────────────────────────

struct UpstreamResponse {
    int status_code{0};
    HeaderMap headers;
    BodyHandle body;
};

// ─────────────────────────────────────────────────────────────────────────────
// MemoryBodySource
// ─────────────────────────────────────────────────────────────────────────────
// A body already held in memory, served in the given chunks. Used for replies
// synthesised by the stdio upstream and for locally generated responses. An
// optional trailing error models a connection that dropped after the last
// chunk.

class MemoryBodySource final : public IBodySource {
public:
    MemoryBodySource() = default;
    explicit MemoryBodySource(std::string body);
    explicit MemoryBodySource(std::vector<std::string> chunks,
                              std::optional<TransportError> trailing_error = std::nullopt);

    asio::awaitable<TransportResult<std::optional<std::string>>> async_read_some() override;
    void cancel() noexcept override;

    [[nodiscard]] bool cancelled() const noexcept { return cancelled_; }

private:
    std::deque<std::string> chunks_;
    std::optional<TransportError> trailing_error_;
    bool cancelled_{false};
};

/// Read a whole body, failing once more than max_bytes have arrived. The
/// source is cancelled on overflow.
asio::awaitable<TransportResult<std::string>> read_body(IBodySource& body, std::size_t max_bytes);

}  // namespace mcpx
