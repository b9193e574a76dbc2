#ifndef CDB_HASH_DOT_HPP
#define CDB_HASH_DOT_HPP

#include <cstdint>
#include <string_view>

namespace CDB {

// DJB's hash: h = ((h << 5) + h) ^ c, starting from 5381, mod 2^32.
std::uint32_t hash(std::string_view s);

} // namespace CDB

#endif // CDB_HASH_DOT_HPP
