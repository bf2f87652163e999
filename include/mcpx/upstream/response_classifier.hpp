#pragma once

#include "mcpx/protocol/media_type.hpp"
#include "mcpx/upstream/upstream_response.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mcpx {

enum class ContentCategory {
    SingleReply,  ///< one JSON-RPC message, buffered and inspected
    EventStream,  ///< text/event-stream, processed incrementally
    Other         ///< relayed byte for byte
};

[[nodiscard]] constexpr std::string_view to_string(ContentCategory category) noexcept {
    switch (category) {
        case ContentCategory::SingleReply: return "single-reply";
        case ContentCategory::EventStream: return "event-stream";
        case ContentCategory::Other:       return "other";
    }
    return "unknown";
}

/// What the classifier learned from status and headers alone.
struct UpstreamResponseMeta {
    int status_code{0};
    ContentCategory category{ContentCategory::Other};
    std::optional<MediaType> media_type;
    std::optional<std::size_t> content_length;
    bool indeterminate_length{true};            ///< no usable Content-Length
    std::optional<std::string> upstream_session_id;
};

/// A classified response. The category is encoded in the type so each
/// handler can only receive what it was written for.
template <ContentCategory Category>
struct ClassifiedResponse {
    static constexpr ContentCategory category = Category;

    UpstreamResponseMeta meta;
    HeaderMap headers;
    BodyHandle body;
};

using SingleReplyResponse = ClassifiedResponse<ContentCategory::SingleReply>;
using EventStreamResponse = ClassifiedResponse<ContentCategory::EventStream>;
using PassThroughResponse = ClassifiedResponse<ContentCategory::Other>;

using RoutedResponse = std::variant<SingleReplyResponse, EventStreamResponse, PassThroughResponse>;

// ─────────────────────────────────────────────────────────────────────────────
// ResponseClassifier
// ─────────────────────────────────────────────────────────────────────────────
// Decides from the Content-Type header alone, never from the body:
//
//   application/json, */*+json   -> SingleReply
//   text/event-stream            -> EventStream
//   anything else, absent or malformed -> Other
//
// Parameters such as charset do not affect the decision. A declared length
// of zero does not change the category either: an empty event stream is a
// stream with no events.

class ResponseClassifier {
public:
    [[nodiscard]] static UpstreamResponseMeta inspect(int status_code, const HeaderMap& headers);

    /// Moves the body, untouched, into the matching alternative.
    [[nodiscard]] static RoutedResponse classify(UpstreamResponse response);
};

/// Digits only, no sign, no overflow; anything else is treated as absent.
[[nodiscard]] std::optional<std::size_t> parse_content_length(std::string_view value) noexcept;

}  // namespace mcpx
