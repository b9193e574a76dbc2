#include "CDB-stream.hpp"

#include "CDB-error.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

namespace CDB {

void Stream::write(std::uint64_t, char const*, std::size_t)
{
  throw Error(errc::io_error, fmt::format("{} is read only", name()));
}

void Stream::truncate(std::uint64_t)
{
  throw Error(errc::not_truncatable, name());
}

std::string Stream::read(std::uint64_t pos, std::size_t n)
{
  std::string ret;
  ret.resize(n);
  if (n)
    read(pos, &ret[0], n);
  return ret;
}

//.............................................................................

namespace {
int open_flags(File::mode m)
{
  switch (m) {
  case File::mode::read: return O_RDONLY;
  case File::mode::create: return O_RDWR | O_CREAT | O_TRUNC;
  case File::mode::update: return O_RDWR;
  }
  return O_RDONLY;
}
} // namespace

File::File(fs::path path, mode m)
  : path_(std::move(path))
  , mode_(m)
{
  fd_ = ::open(path_.c_str(), open_flags(mode_) | O_CLOEXEC, 0644);
  if (fd_ == -1)
    throw_errno(fmt::format("open {}", path_.string()));
}

File::~File()
{
  if (fd_ != -1) {
    PCHECK(::close(fd_) == 0) << "close " << path_;
  }
}

std::uint64_t File::size() const
{
  struct stat st;
  if (fstat(fd_, &st) == -1)
    throw_errno(fmt::format("fstat {}", path_.string()));
  return static_cast<std::uint64_t>(st.st_size);
}

void File::read(std::uint64_t pos, char* s, std::size_t n)
{
  while (n) {
    auto const n_ret = ::pread(fd_, s, n, static_cast<off_t>(pos));
    if (n_ret == -1) {
      if (errno == EINTR)
        continue; // try read again
      throw_errno(fmt::format("read {} at {}", path_.string(), pos));
    }
    if (n_ret == 0) {
      throw Error(errc::io_error,
                  fmt::format("short read from {} at {}", path_.string(), pos));
    }
    s += n_ret;
    pos += n_ret;
    n -= n_ret;
  }
}

void File::write(std::uint64_t pos, char const* s, std::size_t n)
{
  if (!writable())
    Stream::write(pos, s, n);

  while (n) {
    auto const n_ret = ::pwrite(fd_, s, n, static_cast<off_t>(pos));
    if (n_ret == -1) {
      if (errno == EINTR)
        continue; // try write again
      throw_errno(fmt::format("write {} at {}", path_.string(), pos));
    }
    s += n_ret;
    pos += n_ret;
    n -= n_ret;
  }
}

void File::truncate(std::uint64_t length)
{
  if (!truncatable())
    Stream::truncate(length);

  if (::ftruncate(fd_, static_cast<off_t>(length)) == -1)
    throw_errno(fmt::format("truncate {} to {}", path_.string(), length));
}

//.............................................................................

void Memory::read(std::uint64_t pos, char* s, std::size_t n)
{
  if (pos > buf_.size() || n > buf_.size() - pos) {
    throw Error(errc::io_error,
                fmt::format("short read from {} at {}", name(), pos));
  }
  std::memcpy(s, buf_.data() + pos, n);
}

void Memory::write(std::uint64_t pos, char const* s, std::size_t n)
{
  if (buf_.size() < pos + n)
    buf_.resize(pos + n); // a gap fills with zeros, like a sparse file
  std::memcpy(&buf_[pos], s, n);
}

void Memory::truncate(std::uint64_t length)
{
  buf_.resize(length);
}

} // namespace CDB
