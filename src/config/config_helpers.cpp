#include <charconv>
#include <dlinkwm/config/config_helpers.h>

namespace dlinkwm::config {

std::string strip_comment(std::string_view line) {
    char quote = 0;
    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (quote == '"' && c == '\\') {
                ++i; // skip escaped char
            } else if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return std::string(line.substr(0, i));
        }
    }
    return std::string(line);
}

Result<std::string> parse_toml_string(std::string_view text, std::size_t& pos) {
    if (pos >= text.size() || (text[pos] != '"' && text[pos] != '\'')) {
        return Error{ErrorCode::InvalidData, "expected quoted string"};
    }
    const char quote = text[pos++];
    std::string out;
    while (pos < text.size()) {
        char c = text[pos++];
        if (c == quote) {
            return out;
        }
        if (quote == '\'' || c != '\\') {
            out.push_back(c);
            continue;
        }
        if (pos >= text.size()) {
            break;
        }
        char e = text[pos++];
        switch (e) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case 'n': out.push_back('\n'); break;
            case 't': out.push_back('\t'); break;
            case 'r': out.push_back('\r'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            default:
                return Error{ErrorCode::InvalidData,
                             std::string("unsupported escape sequence \\") + e};
        }
    }
    return Error{ErrorCode::InvalidData, "unterminated string"};
}

Result<std::vector<std::string>> parse_string_array(std::string_view text) {
    std::size_t pos = 0;
    auto skipSpace = [&]() {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
            ++pos;
    };

    skipSpace();
    if (pos >= text.size() || text[pos] != '[') {
        return Error{ErrorCode::InvalidData, "expected array of strings"};
    }
    ++pos;

    std::vector<std::string> values;
    while (true) {
        skipSpace();
        if (pos >= text.size()) {
            return Error{ErrorCode::InvalidData, "unterminated array"};
        }
        if (text[pos] == ']') {
            ++pos;
            break;
        }
        auto value = parse_toml_string(text, pos);
        if (!value) {
            return value.error();
        }
        values.push_back(std::move(value).value());
        skipSpace();
        if (pos < text.size() && text[pos] == ',') {
            ++pos;
            continue;
        }
        skipSpace();
        if (pos < text.size() && text[pos] == ']') {
            ++pos;
            break;
        }
        return Error{ErrorCode::InvalidData, "expected ',' or ']' in array"};
    }

    skipSpace();
    if (pos != text.size()) {
        return Error{ErrorCode::InvalidData, "unexpected content after array"};
    }
    return values;
}

int bracket_balance(std::string_view text) {
    int depth = 0;
    char quote = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote) {
            if (quote == '"' && c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '[') {
            ++depth;
        } else if (c == ']') {
            --depth;
        }
    }
    return depth;
}

std::string quote_toml_string(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default: out.push_back(c);
        }
    }
    out.push_back('"');
    return out;
}

std::string format_string_array(const std::vector<std::string>& values) {
    std::string out = "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0)
            out += ", ";
        out += quote_toml_string(values[i]);
    }
    out += "]";
    return out;
}

Result<bool> parse_bool(std::string_view value) {
    std::string v(value);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true")
        return true;
    if (v == "false")
        return false;
    return Error{ErrorCode::InvalidData, "expected boolean, got '" + std::string(value) + "'"};
}

Result<uint64_t> parse_uint(std::string_view value) {
    std::string digits;
    digits.reserve(value.size());
    for (char c : value) {
        if (c != '_')
            digits.push_back(c);
    }
    int base = 10;
    std::string_view body = digits;
    if (body.size() > 2 && body[0] == '0' && (body[1] == 'x' || body[1] == 'X')) {
        base = 16;
        body.remove_prefix(2);
    }
    uint64_t out = 0;
    auto [ptr, ec] = std::from_chars(body.data(), body.data() + body.size(), out, base);
    if (body.empty() || ec != std::errc{} || ptr != body.data() + body.size()) {
        return Error{ErrorCode::InvalidData,
                     "expected unsigned integer, got '" + std::string(value) + "'"};
    }
    return out;
}

} // namespace dlinkwm::config
