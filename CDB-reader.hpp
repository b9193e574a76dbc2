#ifndef CDB_READER_DOT_HPP
#define CDB_READER_DOT_HPP

#include "CDB-layout.hpp"
#include "CDB-stream.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace CDB {

class Writer;

using Record = std::pair<std::string, std::string>; // key, value

// Walks the records region in storage order.  Holds its own offset, so
// lookups on the Reader between calls to next() don't disturb it.  Must
// not outlive the Reader it came from.
class Cursor {
public:
  std::optional<Record> next();

  void          rewind() { pos_ = header_size; }
  std::uint64_t position() const { return pos_; }

private:
  friend class Reader;

  Cursor(Stream& stream, std::uint32_t table_start)
    : stream_(&stream)
    , table_start_(table_start)
  {
  }

  Stream*       stream_;
  std::uint32_t table_start_;
  std::uint64_t pos_{header_size};
};

class Reader {
public:
  // Reads and checks the header.  Throws CDB::Error: too_small if the
  // resource is under 2048 bytes, corrupt_database if a header entry
  // points outside it, io_error if it can't be read.
  explicit Reader(std::unique_ptr<Stream> stream);

  Reader(Reader&&) = default;
  Reader& operator=(Reader&&) = default;

  // The value of the occurrence-th record stored under key, counting
  // from zero in write order.  Empty if there is no such record.
  std::optional<std::string> get_from_pos(std::string_view key,
                                          std::uint32_t    occurrence);

  std::optional<std::string> get_first(std::string_view key)
  {
    return get_from_pos(key, 0);
  }

  // Like get_from_pos(), but a miss throws Error{errc::key_not_found}.
  std::string at(std::string_view key, std::uint32_t occurrence = 0);

  // Every value under key, in write order.
  std::vector<std::string> get(std::string_view key);

  bool contains(std::string_view key);

  // Every key in storage order, duplicates included.
  std::vector<std::string> keys();

  Cursor iterate() { return Cursor(*stream_, table_start_); }

  std::size_t   size() const { return length_; }
  bool          empty() const { return length_ == 0; }
  std::uint32_t table_start() const { return table_start_; }
  Header const& header() const { return header_; }

  Stream const& stream() const { return *stream_; }

  // Reads the hash tables back into memory, truncates them off the end
  // of the resource and hands the resource to a Writer.  This Reader is
  // left empty and must not be used again.
  Writer as_writer() &&;

private:
  // Calls match(data_pos, data_len) for each record stored under key,
  // skipping the first skip of them, until match returns false.
  void lookup_(std::string_view                                  key,
               std::uint32_t                                     skip,
               std::function<bool(std::uint64_t, std::uint32_t)> match);

  std::unique_ptr<Stream> stream_;

  Header        header_;
  std::uint32_t table_start_{0};
  std::size_t   length_{0};
};

} // namespace CDB

#endif // CDB_READER_DOT_HPP
