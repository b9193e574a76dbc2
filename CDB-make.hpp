#ifndef CDB_MAKE_DOT_HPP
#define CDB_MAKE_DOT_HPP

#include "CDB-writer.hpp"

#include <cstddef>
#include <istream>

namespace CDB {

// From cdb(1) man page, section Input/Output Format:
//     +klen,dlen:key->data\n
// one per record, the input ends with an empty line.  Throws
// std::invalid_argument on bad syntax.  Returns the number of records.
std::size_t make(std::istream& in, Writer& wtr);

// Each line of input is a key, the value is "1".
std::size_t make_lines(std::istream& in, Writer& wtr);

} // namespace CDB

#endif // CDB_MAKE_DOT_HPP
