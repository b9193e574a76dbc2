#ifndef CDB_STREAM_DOT_HPP
#define CDB_STREAM_DOT_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <filesystem>

namespace CDB {

namespace fs = std::filesystem;

// A seekable byte resource.  Reads and writes are positional, there is
// no shared cursor.  Every failure throws CDB::Error.
class Stream {
public:
  Stream()              = default;
  Stream(Stream const&) = delete;
  Stream& operator=(Stream const&) = delete;
  virtual ~Stream()                = default;

  virtual std::uint64_t size() const = 0;

  // Reads exactly n bytes at pos, a short read is an error.
  virtual void read(std::uint64_t pos, char* s, std::size_t n) = 0;

  virtual void write(std::uint64_t pos, char const* s, std::size_t n);
  virtual void truncate(std::uint64_t length);

  virtual bool writable() const { return false; }
  virtual bool truncatable() const { return false; }

  virtual std::string name() const = 0;

  std::string read(std::uint64_t pos, std::size_t n);
};

// A file descriptor, owned.
class File : public Stream {
public:
  enum class mode : std::uint8_t {
    read,   // O_RDONLY
    create, // O_RDWR | O_CREAT | O_TRUNC
    update, // O_RDWR
  };

  File(fs::path path, mode m);
  ~File() override;

  std::uint64_t size() const override;
  using Stream::read;
  void read(std::uint64_t pos, char* s, std::size_t n) override;
  void write(std::uint64_t pos, char const* s, std::size_t n) override;
  void truncate(std::uint64_t length) override;

  bool writable() const override { return mode_ != mode::read; }
  bool truncatable() const override { return writable(); }

  std::string name() const override { return path_.string(); }

  int fd() const { return fd_; }

private:
  fs::path path_;
  mode     mode_;
  int      fd_{-1};
};

// Growable in-memory buffer, mostly for tests and building small
// databases before copying them somewhere.
class Memory : public Stream {
public:
  Memory() = default;
  explicit Memory(std::string contents)
    : buf_(std::move(contents))
  {
  }

  std::uint64_t size() const override { return buf_.size(); }
  using Stream::read;
  void read(std::uint64_t pos, char* s, std::size_t n) override;
  void write(std::uint64_t pos, char const* s, std::size_t n) override;
  void truncate(std::uint64_t length) override;

  bool writable() const override { return true; }
  bool truncatable() const override { return true; }

  std::string name() const override { return "<memory>"; }

  std::string_view contents() const { return buf_; }

private:
  std::string buf_;
};

} // namespace CDB

#endif // CDB_STREAM_DOT_HPP
