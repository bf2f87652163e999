#include "mcpx/upstream/upstream_response.hpp"

namespace mcpx {

MemoryBodySource::MemoryBodySource(std::string body) {
    if (body.empty() == false) {
        chunks_.push_back(std::move(body));
    }
}

MemoryBodySource::MemoryBodySource(std::vector<std::string> chunks,
                                   std::optional<TransportError> trailing_error)
    : chunks_(std::make_move_iterator(chunks.begin()), std::make_move_iterator(chunks.end()))
    , trailing_error_(std::move(trailing_error))
{}

asio::awaitable<TransportResult<std::optional<std::string>>> MemoryBodySource::async_read_some() {
    if (cancelled_) {
        co_return tl::unexpected(TransportError::cancelled());
    }
    if (chunks_.empty() == false) {
        std::string chunk = std::move(chunks_.front());
        chunks_.pop_front();
        co_return std::optional<std::string>{std::move(chunk)};
    }
    if (trailing_error_.has_value()) {
        co_return tl::unexpected(*trailing_error_);
    }
    co_return std::optional<std::string>{};
}

void MemoryBodySource::cancel() noexcept {
    cancelled_ = true;
}

asio::awaitable<TransportResult<std::string>> read_body(IBodySource& body, std::size_t max_bytes) {
    std::string collected;
    while (true) {
        auto chunk = co_await body.async_read_some();
        if (chunk.has_value() == false) {
            co_return tl::unexpected(chunk.error());
        }
        if (chunk->has_value() == false) {
            co_return collected;
        }
        if (collected.size() + (*chunk)->size() > max_bytes) {
            body.cancel();
            co_return tl::unexpected(TransportError::protocol(
                "body exceeds " + std::to_string(max_bytes) + " bytes"));
        }
        collected += **chunk;
    }
}

}  // namespace mcpx
