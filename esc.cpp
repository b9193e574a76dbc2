#include "esc.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace {
bool needs_esc(unsigned char c)
{
  return !std::isprint(c) || (c == '\\') || (c == '"');
}

int hex_val(char c)
{
  if ('0' <= c && c <= '9')
    return c - '0';
  if ('a' <= c && c <= 'f')
    return c - 'a' + 10;
  if ('A' <= c && c <= 'F')
    return c - 'A' + 10;
  return -1;
}
} // namespace

std::string esc(std::string_view str)
{
  auto const nesc{std::count_if(begin(str), end(str), needs_esc)};
  if (!nesc)
    return std::string(str);
  std::string ret;
  ret.reserve(str.length() + 3 * nesc);
  for (auto c : str) {
    switch (c) {
    case '\a': ret += "\\a"; break;
    case '\b': ret += "\\b"; break;
    case '\f': ret += "\\f"; break;
    case '\n': ret += "\\n"; break;
    case '\r': ret += "\\r"; break;
    case '\t': ret += "\\t"; break;
    case '\v': ret += "\\v"; break;
    case '\\': ret += "\\\\"; break;
    case '"': ret += "\\\""; break;
    default:
      if (std::isprint(static_cast<unsigned char>(c))) {
        ret += c;
      }
      else {
        ret += fmt::format("\\x{:02x}", static_cast<unsigned char>(c));
      }
    }
  }
  return ret;
}

std::string quoted(std::string_view str)
{
  return fmt::format("\"{}\"", esc(str));
}

std::optional<std::string> unesc(std::string_view str)
{
  std::string ret;
  ret.reserve(str.length());
  for (auto it = begin(str); it != end(str); ++it) {
    if (*it != '\\') {
      ret += *it;
      continue;
    }
    if (++it == end(str))
      return {};
    switch (*it) {
    case 'a': ret += '\a'; break;
    case 'b': ret += '\b'; break;
    case 'f': ret += '\f'; break;
    case 'n': ret += '\n'; break;
    case 'r': ret += '\r'; break;
    case 't': ret += '\t'; break;
    case 'v': ret += '\v'; break;
    case '0': ret += '\0'; break;
    case '\\': ret += '\\'; break;
    case '"': ret += '"'; break;
    case 'x': {
      if (end(str) - it < 3)
        return {};
      auto const hi = hex_val(*++it);
      auto const lo = hex_val(*++it);
      if (hi < 0 || lo < 0)
        return {};
      ret += static_cast<char>(hi * 16 + lo);
      break;
    }
    default: return {};
    }
  }
  return ret;
}
