#ifndef ESC_DOT_HPP
#define ESC_DOT_HPP

#include <optional>
#include <string>
#include <string_view>

// C style escapes for anything not printable, plus backslash and
// double quote: keys and values are arbitrary bytes.
std::string esc(std::string_view str);

// esc() wrapped in double quotes.
std::string quoted(std::string_view str);

// Inverse of esc(), empty if str holds a malformed escape.
std::optional<std::string> unesc(std::string_view str);

#endif // ESC_DOT_HPP
