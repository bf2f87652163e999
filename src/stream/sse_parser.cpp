#include "mcpx/stream/sse_parser.hpp"

#include "mcpx/log/logger.hpp"

#include <charconv>

namespace mcpx {

// Consumed bytes are erased lazily once this many have accumulated.
constexpr std::size_t buffer_compact_threshold = 4096;

std::vector<StreamEvent> SseParser::feed(std::string_view chunk) {
    std::vector<StreamEvent> events;

    if (skip_lf_ && chunk.empty() == false) {
        skip_lf_ = false;
        if (chunk.front() == '\n') {
            chunk.remove_prefix(1);
        }
    }

    if (discarding_line_) {
        const auto end = chunk.find_first_of("\r\n");
        if (end == std::string_view::npos) {
            return events;
        }
        discarding_line_ = false;
        chunk.remove_prefix(past_line_end(chunk, end));
    }

    buffer_.append(chunk.data(), chunk.size());

    std::size_t end = 0;
    while ((end = buffer_.find_first_of("\r\n", buffer_pos_)) != std::string::npos) {
        const std::string_view line(buffer_.data() + buffer_pos_, end - buffer_pos_);
        buffer_pos_ = past_line_end(buffer_, end);

        if (line.size() > config_.max_line_size) {
            begin_skip();
            continue;
        }
        process_line(line, events);
    }

    if (buffer_size() > config_.max_line_size) {
        buffer_.clear();
        buffer_pos_ = 0;
        discarding_line_ = true;
        begin_skip();
        return events;
    }

    maybe_compact_buffer();
    return events;
}

std::size_t SseParser::past_line_end(std::string_view text, std::size_t end) {
    if (text[end] == '\n') {
        return end + 1;
    }
    if (end + 1 == text.size()) {
        // CR is the last byte seen so far; an LF opening the next chunk is
        // the second half of the same CRLF.
        skip_lf_ = true;
        return end + 1;
    }
    return text[end + 1] == '\n' ? end + 2 : end + 1;
}

void SseParser::reset() {
    buffer_.clear();
    buffer_pos_ = 0;
    skip_lf_ = false;
    discarding_line_ = false;
    discarding_record_ = false;
    clear_record();
}

bool SseParser::has_partial_record() const noexcept {
    return buffer_size() > 0
        || discarding_line_
        || discarding_record_
        || current_id_.has_value()
        || current_type_.has_value()
        || current_retry_.has_value()
        || data_seen_;
}

void SseParser::process_line(std::string_view line, std::vector<StreamEvent>& out) {
    if (line.empty()) {
        if (discarding_record_) {
            discarding_record_ = false;
            clear_record();
            return;
        }
        const bool has_fields = data_seen_
            || current_id_.has_value()
            || current_type_.has_value()
            || current_retry_.has_value();
        if (has_fields) {
            out.push_back(StreamEvent{
                std::move(current_id_),
                std::move(current_type_),
                std::move(current_data_),
                current_retry_
            });
        }
        clear_record();
        return;
    }

    if (discarding_record_ || line.front() == ':') {
        return;
    }

    const std::size_t colon_pos = line.find(':');
    if (colon_pos == std::string_view::npos) {
        apply_field(line, {});
        return;
    }

    std::size_t value_start = colon_pos + 1;
    if (value_start < line.size() && line[value_start] == ' ') {
        value_start += 1;
    }
    apply_field(line.substr(0, colon_pos), line.substr(value_start));
}

void SseParser::apply_field(std::string_view name, std::string_view value) {
    if (name == "data") {
        const std::size_t grown = current_data_.size() + value.size() + (data_seen_ ? 1 : 0);
        if (grown > config_.max_event_size) {
            begin_skip();
            return;
        }
        if (data_seen_) {
            current_data_ += '\n';
        }
        current_data_ += value;
        data_seen_ = true;
    } else if (name == "id") {
        // An id containing NUL is ignored, the record itself stays valid.
        if (value.find('\0') == std::string_view::npos) {
            current_id_ = std::string(value);
        }
    } else if (name == "event") {
        current_type_ = std::string(value);
    } else if (name == "retry") {
        std::uint32_t retry_ms = 0;
        const auto* last = value.data() + value.size();
        const auto [ptr, ec] = std::from_chars(value.data(), last, retry_ms);
        if (ec == std::errc{} && ptr == last && value.empty() == false) {
            current_retry_ = retry_ms;
        }
    }
    // Unknown field names are ignored.
}

void SseParser::begin_skip() {
    if (discarding_record_ == false) {
        ++skipped_records_;
        MCPX_LOG_WARN("event stream record exceeded size limits, skipping to next record boundary");
    }
    discarding_record_ = true;
    clear_record();
}

void SseParser::clear_record() {
    current_id_ = std::nullopt;
    current_type_ = std::nullopt;
    current_data_.clear();
    data_seen_ = false;
    current_retry_ = std::nullopt;
}

void SseParser::maybe_compact_buffer() {
    if (buffer_pos_ >= buffer_.size()) {
        buffer_.clear();
        buffer_pos_ = 0;
    } else if (buffer_pos_ > buffer_compact_threshold) {
        buffer_.erase(0, buffer_pos_);
        buffer_pos_ = 0;
    }
}

}  // namespace mcpx
