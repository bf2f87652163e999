#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace mcpx {

/// One record of an upstream event stream:
///
///   id: <position marker>     used for resumption and duplicate suppression
///   event: <type label>       absent means the default "message"
///   data: <payload line>      repeated lines are joined with "\n"
///   retry: <milliseconds>     reconnection hint from the server
///   <blank line>
struct StreamEvent {
    std::optional<std::string> id;
    std::optional<std::string> type;
    std::string data;
    std::optional<std::uint32_t> retry;

    friend bool operator==(const StreamEvent&, const StreamEvent&) = default;
};

/// Serialise back into event-stream framing, splitting data on '\n' into one
/// data line each and closing with the blank line.
[[nodiscard]] std::string to_wire_format(const StreamEvent& event);

}  // namespace mcpx
