#include "CDB-make.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace CDB {

namespace {
[[noreturn]] void bad_input(std::size_t recno, char const* what)
{
  throw std::invalid_argument(
      fmt::format("cdbmake input record {}: {}", recno, what));
}

void expect(std::istream& in, char c, std::size_t recno, char const* what)
{
  if (in.get() != c)
    bad_input(recno, what);
}

// Decimal digits up to the terminator, which is consumed.
std::uint32_t get_len(std::istream& in, char term, std::size_t recno)
{
  auto len    = std::uint64_t{0};
  auto digits = 0;
  for (;;) {
    auto const c = in.get();
    if (c == term && digits)
      return static_cast<std::uint32_t>(len);
    if (!std::isdigit(c))
      bad_input(recno, "bad length");
    len = len * 10 + (c - '0');
    if (len > std::numeric_limits<std::uint32_t>::max())
      bad_input(recno, "length too large");
    ++digits;
  }
}

// Lengths come from the input, so the buffer only grows as bytes
// actually arrive.
std::string get_bytes(std::istream& in, std::uint32_t n, std::size_t recno)
{
  constexpr std::size_t chunk = 64 * 1024;

  std::string ret;
  while (ret.size() < n) {
    auto const have = ret.size();
    auto const want = std::min<std::size_t>(chunk, n - have);
    ret.resize(have + want);
    if (!in.read(&ret[have], want))
      bad_input(recno, "truncated");
  }
  return ret;
}
} // namespace

std::size_t make(std::istream& in, Writer& wtr)
{
  auto recno = std::size_t{0};
  for (;;) {
    auto const c = in.get();
    if (c == std::char_traits<char>::eof() || c == '\n')
      return recno; // the terminating empty line is optional on EOF
    ++recno;
    if (c != '+')
      bad_input(recno, "expecting '+'");

    auto const klen = get_len(in, ',', recno);
    auto const dlen = get_len(in, ':', recno);

    auto const key = get_bytes(in, klen, recno);
    expect(in, '-', recno, "expecting \"->\"");
    expect(in, '>', recno, "expecting \"->\"");
    auto const data = get_bytes(in, dlen, recno);
    expect(in, '\n', recno, "expecting newline");

    wtr.put(key, data);
  }
}

std::size_t make_lines(std::istream& in, Writer& wtr)
{
  auto        count = std::size_t{0};
  std::string line;
  while (std::getline(in, line)) {
    wtr.put(line, "1");
    ++count;
  }
  return count;
}

} // namespace CDB
