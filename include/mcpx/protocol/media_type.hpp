#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcpx {

// ─────────────────────────────────────────────────────────────────────────────
// MediaType
// ─────────────────────────────────────────────────────────────────────────────
// Parsed Content-Type value:
//
//   media-type = type "/" subtype *( OWS ";" OWS parameter )
//   parameter  = token "=" ( token / quoted-string )
//
// Type, subtype and parameter names are stored lowercased; parameter values
// keep their case with quoting removed.

struct MediaType {
    std::string type;
    std::string subtype;
    std::vector<std::pair<std::string, std::string>> parameters;

    /// Case-insensitive comparison of type and subtype; parameters ignored.
    [[nodiscard]] bool matches(std::string_view type_name, std::string_view subtype_name) const noexcept;

    /// True for "application/json" and structured-syntax "+json" subtypes.
    [[nodiscard]] bool is_json() const noexcept;

    [[nodiscard]] bool is_event_stream() const noexcept;

    /// First value of the named parameter (name matched case-insensitively).
    [[nodiscard]] std::optional<std::string> parameter(std::string_view name) const;

    /// "type/subtype"
    [[nodiscard]] std::string essence() const;
};

/// Parse a Content-Type header value. Returns nullopt for anything that does
/// not follow the grammar above (missing subtype, illegal token characters,
/// unterminated quoted string, parameter without '='). An empty parameter
/// slot such as a trailing ';' is tolerated.
[[nodiscard]] std::optional<MediaType> parse_media_type(std::string_view header);

}  // namespace mcpx
