#include "mcpx/protocol/media_type.hpp"

#include "mcpx/transport/http_types.hpp"

#include <algorithm>
#include <cctype>

namespace mcpx {
namespace {

[[nodiscard]] bool is_tchar(char c) noexcept {
    if (std::isalnum(static_cast<unsigned char>(c))) {
        return true;
    }
    constexpr std::string_view kExtra = "!#$%&'*+-.^_`|~";
    return kExtra.find(c) != std::string_view::npos;
}

[[nodiscard]] bool is_ows(char c) noexcept {
    return c == ' ' || c == '\t';
}

[[nodiscard]] std::string lowercase(std::string_view text) {
    std::string out(text);
    std::ranges::transform(out, out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/// Cursor over the header value; every reader leaves pos_ after what it took.
class Scanner {
public:
    explicit Scanner(std::string_view text) : text_(text) {}

    [[nodiscard]] bool at_end() const noexcept { return pos_ >= text_.size(); }
    [[nodiscard]] char peek() const noexcept { return text_[pos_]; }
    void advance() noexcept { ++pos_; }

    void skip_ows() noexcept {
        while (at_end() == false && is_ows(peek())) {
            ++pos_;
        }
    }

    [[nodiscard]] std::string_view token() noexcept {
        const std::size_t start = pos_;
        while (at_end() == false && is_tchar(peek())) {
            ++pos_;
        }
        return text_.substr(start, pos_ - start);
    }

    /// Reads a quoted-string starting at '"'; nullopt when unterminated.
    [[nodiscard]] std::optional<std::string> quoted_string() {
        advance();  // opening quote
        std::string value;
        while (at_end() == false) {
            const char c = peek();
            advance();
            if (c == '"') {
                return value;
            }
            if (c == '\\') {
                if (at_end()) {
                    return std::nullopt;
                }
                value.push_back(peek());
                advance();
                continue;
            }
            value.push_back(c);
        }
        return std::nullopt;
    }

private:
    std::string_view text_;
    std::size_t pos_{0};
};

}  // namespace

bool MediaType::matches(std::string_view type_name, std::string_view subtype_name) const noexcept {
    return iequals(type, type_name) && iequals(subtype, subtype_name);
}

bool MediaType::is_json() const noexcept {
    if (matches("application", "json")) {
        return true;
    }
    constexpr std::string_view kSuffix = "+json";
    return subtype.size() > kSuffix.size() && subtype.ends_with(kSuffix);
}

bool MediaType::is_event_stream() const noexcept {
    return matches("text", "event-stream");
}

std::optional<std::string> MediaType::parameter(std::string_view name) const {
    const auto it = std::ranges::find_if(parameters, [name](const auto& entry) {
        return iequals(entry.first, name);
    });
    if (it == parameters.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string MediaType::essence() const {
    return type + "/" + subtype;
}

std::optional<MediaType> parse_media_type(std::string_view header) {
    Scanner scan(header);
    scan.skip_ows();

    const std::string_view type = scan.token();
    if (type.empty() || scan.at_end() || scan.peek() != '/') {
        return std::nullopt;
    }
    scan.advance();

    const std::string_view subtype = scan.token();
    if (subtype.empty()) {
        return std::nullopt;
    }

    MediaType result;
    result.type = lowercase(type);
    result.subtype = lowercase(subtype);

    scan.skip_ows();
    while (scan.at_end() == false) {
        if (scan.peek() != ';') {
            return std::nullopt;
        }
        scan.advance();
        scan.skip_ows();
        if (scan.at_end() || scan.peek() == ';') {
            continue;  // empty parameter slot
        }

        const std::string_view name = scan.token();
        if (name.empty() || scan.at_end() || scan.peek() != '=') {
            return std::nullopt;
        }
        scan.advance();

        std::string value;
        if (scan.at_end() == false && scan.peek() == '"') {
            auto quoted = scan.quoted_string();
            if (quoted.has_value() == false) {
                return std::nullopt;
            }
            value = std::move(*quoted);
        } else {
            const std::string_view raw = scan.token();
            if (raw.empty()) {
                return std::nullopt;
            }
            value = std::string(raw);
        }

        result.parameters.emplace_back(lowercase(name), std::move(value));
        scan.skip_ows();
    }

    return result;
}

}  // namespace mcpx
