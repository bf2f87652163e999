#pragma once

#include "mcpx/stream/stream_event.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpx {

struct SseParserConfig {
    /// Longest single line accepted. A line that grows past this is a framing
    /// error: the partial line is dropped and the enclosing record skipped.
    std::size_t max_line_size{1024 * 1024};

    /// Largest accumulated data payload for one record.
    std::size_t max_event_size{512 * 1024};
};

/// Incremental event-stream parser.
///
/// Chunks may split lines and records anywhere. Records end at a blank line;
/// lines end at LF, CRLF or a lone CR, and a CRLF split across two chunks
/// still ends one line. Comment lines (leading ':') carry no fields and never
/// produce an event on their own, so keep-alive pings are invisible to
/// callers.
///
/// Framing errors never abort the stream. The offending record is dropped,
/// parsing resynchronises at the next blank line and skipped_records() is
/// incremented.
class SseParser {
public:
    SseParser() = default;
    explicit SseParser(SseParserConfig config) : config_(config) {}

    /// Returns every record completed by this chunk, in order.
    [[nodiscard]] std::vector<StreamEvent> feed(std::string_view chunk);

    /// Drops buffered bytes and the record in progress. The skip counter is
    /// kept; a resumed stream continues to count into it.
    void reset();

    /// True when bytes of an unfinished record are pending, i.e. the stream
    /// ended mid-record if no more input arrives.
    [[nodiscard]] bool has_partial_record() const noexcept;

    [[nodiscard]] std::size_t skipped_records() const noexcept { return skipped_records_; }
    [[nodiscard]] std::size_t buffer_size() const noexcept { return buffer_.size() - buffer_pos_; }
    [[nodiscard]] const SseParserConfig& config() const noexcept { return config_; }

private:
    /// Index just past the line terminator found at `end`.
    std::size_t past_line_end(std::string_view text, std::size_t end);
    void process_line(std::string_view line, std::vector<StreamEvent>& out);
    void apply_field(std::string_view name, std::string_view value);
    void begin_skip();
    void clear_record();
    void maybe_compact_buffer();

    SseParserConfig config_;
    std::string buffer_;
    std::size_t buffer_pos_{0};

    std::optional<std::string> current_id_;
    std::optional<std::string> current_type_;
    std::string current_data_;
    bool data_seen_{false};
    std::optional<std::uint32_t> current_retry_;

    bool skip_lf_{false};            // previous chunk ended in '\r'
    bool discarding_line_{false};    // inside an over-long line, drop to its end
    bool discarding_record_{false};  // drop lines until the next blank line
    std::size_t skipped_records_{0};
};

}  // namespace mcpx
