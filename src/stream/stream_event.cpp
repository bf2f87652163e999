#include "mcpx/stream/stream_event.hpp"

#include <string_view>

namespace mcpx {

std::string to_wire_format(const StreamEvent& event) {
    std::string out;
    out.reserve(event.data.size() + 64);

    if (event.id.has_value()) {
        out += "id: ";
        out += *event.id;
        out += '\n';
    }
    if (event.type.has_value()) {
        out += "event: ";
        out += *event.type;
        out += '\n';
    }
    if (event.retry.has_value()) {
        out += "retry: ";
        out += std::to_string(*event.retry);
        out += '\n';
    }

    const bool has_fields = event.id.has_value() || event.type.has_value() || event.retry.has_value();
    if (event.data.empty() == false || has_fields == false) {
        std::string_view rest(event.data);
        while (true) {
            const auto newline = rest.find('\n');
            out += "data: ";
            out += rest.substr(0, newline);
            out += '\n';
            if (newline == std::string_view::npos) {
                break;
            }
            rest.remove_prefix(newline + 1);
        }
    }

    out += '\n';
    return out;
}

}  // namespace mcpx
