#include "CDB-hash.hpp"

namespace CDB {

std::uint32_t hash(std::string_view s)
{
  auto h = std::uint32_t{5381};
  for (unsigned char c : s) {
    h = ((h << 5) + h) ^ c;
  }
  return h;
}

} // namespace CDB
