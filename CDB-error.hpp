#ifndef CDB_ERROR_DOT_HPP
#define CDB_ERROR_DOT_HPP

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

namespace CDB {

enum class errc : std::uint8_t {
  too_small,        // under 2048 bytes, can't be a CDB
  key_not_found,    // lookup missed
  io_error,         // read/write/seek/truncate failed
  corrupt_database, // a length or position points outside the file
  too_big,          // would exceed 4 GiB
  finalized,        // put after the hash tables were written
  not_truncatable,  // as_writer on a read-only resource
};

char const* to_string(errc e);

inline std::ostream& operator<<(std::ostream& s, errc e)
{
  return s << to_string(e);
}

class Error : public std::runtime_error {
public:
  Error(errc code, std::string const& msg);

  errc code() const { return code_; }

private:
  errc code_;
};

// Throws Error{io_error} with the text for errno appended to what.
[[noreturn]] void throw_errno(std::string const& what);

} // namespace CDB

#endif // CDB_ERROR_DOT_HPP
