#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>
#include <dlinkwm/core/types.h>

namespace dlinkwm::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Removes a trailing '#' comment, ignoring '#' inside basic or literal strings.
std::string strip_comment(std::string_view line);

// Parses a TOML basic ("...") or literal ('...') string starting at `pos`. On success `pos`
// points past the closing quote.
Result<std::string> parse_toml_string(std::string_view text, std::size_t& pos);

// Parses a TOML array of strings: ["a", 'b', ...]. Trailing commas and newlines are allowed.
Result<std::vector<std::string>> parse_string_array(std::string_view text);

// Net '[' minus ']' outside strings; used to detect arrays that continue on following lines.
int bracket_balance(std::string_view text);

// Quotes a value as a TOML basic string, escaping backslashes, quotes and control chars.
std::string quote_toml_string(std::string_view value);

// Formats a list of names as a TOML/JSON style array: ["a", "b"].
std::string format_string_array(const std::vector<std::string>& values);

// Parse "true"/"false" (case-insensitive); anything else is InvalidData.
Result<bool> parse_bool(std::string_view value);

// Parse an unsigned integer (decimal, or hex with 0x prefix; '_' separators allowed).
Result<uint64_t> parse_uint(std::string_view value);

} // namespace dlinkwm::config
