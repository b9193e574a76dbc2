#include "CDB-mapped.hpp"

#include "CDB-error.hpp"

#include <cstring>
#include <system_error>

#include <fmt/format.h>

#include <glog/logging.h>

namespace CDB {

Mapped::Mapped(fs::path path)
  : path_(std::move(path))
{
  std::error_code ec;
  auto const sz = fs::file_size(path_, ec);
  if (ec) {
    throw Error(errc::io_error,
                fmt::format("stat {}: {}", path_.string(), ec.message()));
  }
  size_ = sz;
  if (size_ == 0)
    return;

  try {
    mapping_.open(path_.string());
  }
  catch (std::exception const& e) {
    throw Error(errc::io_error,
                fmt::format("mmap {}: {}", path_.string(), e.what()));
  }
  CHECK_EQ(mapping_.size(), size_);
}

void Mapped::read(std::uint64_t pos, char* s, std::size_t n)
{
  if (pos > size_ || n > size_ - pos) {
    throw Error(errc::io_error,
                fmt::format("short read from {} at {}", name(), pos));
  }
  if (n)
    std::memcpy(s, mapping_.data() + pos, n);
}

std::string_view Mapped::contents() const
{
  if (!mapping_.is_open())
    return {};
  return std::string_view(mapping_.data(), mapping_.size());
}

} // namespace CDB
