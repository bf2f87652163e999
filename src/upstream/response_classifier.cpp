#include "mcpx/upstream/response_classifier.hpp"

#include "mcpx/log/logger.hpp"
#include "mcpx/session/session.hpp"

#include <charconv>

namespace mcpx {

std::optional<std::size_t> parse_content_length(std::string_view value) noexcept {
    while (value.empty() == false && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (value.empty() == false && (value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    if (value.empty()) {
        return std::nullopt;
    }

    std::size_t length = 0;
    const auto* last = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(value.data(), last, length);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return length;
}

UpstreamResponseMeta ResponseClassifier::inspect(int status_code, const HeaderMap& headers) {
    UpstreamResponseMeta meta;
    meta.status_code = status_code;

    if (const auto content_type = get_header(headers, header::kContentType)) {
        meta.media_type = parse_media_type(*content_type);
        if (meta.media_type.has_value() == false) {
            get_logger().debug_fmt("unparseable content type '{}', relaying as-is", *content_type);
        }
    }

    if (meta.media_type.has_value()) {
        if (meta.media_type->is_event_stream()) {
            meta.category = ContentCategory::EventStream;
        } else if (meta.media_type->is_json()) {
            meta.category = ContentCategory::SingleReply;
        }
    }

    if (const auto length = get_header(headers, header::kContentLength)) {
        meta.content_length = parse_content_length(*length);
    }
    meta.indeterminate_length = (meta.content_length.has_value() == false);

    if (auto session_id = get_header(headers, header::kSessionId)) {
        if (is_valid_session_id(*session_id)) {
            meta.upstream_session_id = std::move(*session_id);
        } else {
            MCPX_LOG_WARN("ignoring malformed upstream session id");
        }
    }

    return meta;
}

RoutedResponse ResponseClassifier::classify(UpstreamResponse response) {
    UpstreamResponseMeta meta = inspect(response.status_code, response.headers);
    get_logger().debug_fmt("upstream status {} classified as {}",
        meta.status_code, to_string(meta.category));

    switch (meta.category) {
        case ContentCategory::SingleReply:
            return SingleReplyResponse{std::move(meta), std::move(response.headers), std::move(response.body)};
        case ContentCategory::EventStream:
            return EventStreamResponse{std::move(meta), std::move(response.headers), std::move(response.body)};
        case ContentCategory::Other:
            break;
    }
    return PassThroughResponse{std::move(meta), std::move(response.headers), std::move(response.body)};
}

}  // namespace mcpx
