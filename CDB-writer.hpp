#ifndef CDB_WRITER_DOT_HPP
#define CDB_WRITER_DOT_HPP

#include "CDB-layout.hpp"
#include "CDB-reader.hpp"
#include "CDB-stream.hpp"

#include <cstdint>
#include <memory>
#include <string_view>

namespace CDB {

// Builds a database: records are appended as they are put(), the hash
// tables and header are only written by finalize().
//
// Nothing is written on destruction.  A Writer destroyed before
// finalize() leaves a resource that no Reader will accept as complete.
class Writer {
public:
  // Start a new database, anything already in stream is discarded.
  explicit Writer(std::unique_ptr<Stream> stream);

  // Resume building: stream holds a header and records but no hash
  // tables, index describes those records.  See Reader::as_writer().
  Writer(std::unique_ptr<Stream> stream, Index index);

  Writer(Writer&&) = default;
  Writer& operator=(Writer&&) = delete;
  ~Writer();

  // Duplicate keys are kept, in the order they were put.
  void put(std::string_view key, std::string_view value);

  // Write the hash tables and the header.  A second call does nothing.
  void finalize();

  bool        finalized() const { return finalized_; }
  std::size_t size() const { return nrecords_; }

  // finalize() and hand the resource to a Reader.  This Writer is left
  // empty and must not be used again.
  Reader as_reader() &&;

private:
  std::unique_ptr<Stream> stream_;

  Index         index_;
  std::uint64_t end_{header_size}; // where the next record goes
  std::size_t   nrecords_{0};
  bool          finalized_{false};
};

} // namespace CDB

#endif // CDB_WRITER_DOT_HPP
