#ifndef CDB_MAPPED_DOT_HPP
#define CDB_MAPPED_DOT_HPP

#include "CDB-stream.hpp"

#include <boost/iostreams/device/mapped_file.hpp>

namespace CDB {

// Read only, memory mapped.  Lookups become memcpy()s from the page
// cache.  Can't be turned into a Writer.
class Mapped : public Stream {
public:
  explicit Mapped(fs::path path);

  std::uint64_t size() const override { return size_; }
  using Stream::read;
  void read(std::uint64_t pos, char* s, std::size_t n) override;

  std::string name() const override { return path_.string(); }

  std::string_view contents() const;

private:
  fs::path path_;

  // mapped_file_source refuses to map an empty file.
  std::uint64_t size_{0};

  boost::iostreams::mapped_file_source mapping_;
};

} // namespace CDB

#endif // CDB_MAPPED_DOT_HPP
