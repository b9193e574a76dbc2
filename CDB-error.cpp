#include "CDB-error.hpp"

#include <cerrno>
#include <cstring>

#include <fmt/format.h>

namespace CDB {

char const* to_string(errc e)
{
  switch (e) {
  case errc::too_small: return "file too small to be a CDB";
  case errc::key_not_found: return "key not in CDB";
  case errc::io_error: return "I/O error";
  case errc::corrupt_database: return "corrupt CDB";
  case errc::too_big: return "CDB would exceed 4 GiB";
  case errc::finalized: return "CDB already finalized";
  case errc::not_truncatable: return "resource can't be truncated";
  }
  return "unknown error";
}

Error::Error(errc code, std::string const& msg)
  : std::runtime_error(fmt::format("{}: {}", to_string(code), msg))
  , code_(code)
{
}

void throw_errno(std::string const& what)
{
  auto const errno_sv = errno;
  char       err[256]{};
  auto const msg = strerror_r(errno_sv, err, sizeof(err));
  throw Error(errc::io_error, fmt::format("{}: {} [{}]", what, msg, errno_sv));
}

} // namespace CDB
