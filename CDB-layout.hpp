#ifndef CDB_LAYOUT_DOT_HPP
#define CDB_LAYOUT_DOT_HPP

// On-disk geometry of a constant database, see <https://cr.yp.to/cdb/cdb.txt>
//
//   [0, 2048)       header: 256 x (u32 position, u32 nslots)
//   [2048, T)       records: u32 klen, u32 dlen, key, data
//   [T, EOF)        256 hash tables: nslots x (u32 hash, u32 position)
//
// All integers are little-endian.  T is the smallest header position.

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace CDB {

auto constexpr nbuckets    = std::size_t{256};
auto constexpr pair_size   = std::size_t{8};
auto constexpr header_size = nbuckets * pair_size; // 2048

// 32 bit offsets, the whole file must be addressable by a u32.
auto constexpr max_size
    = std::uint64_t{std::numeric_limits<std::uint32_t>::max()};

// Header entry: where a bucket's hash table lives and how many slots.
struct Bucket {
  std::uint32_t pos{0};
  std::uint32_t nslots{0};
};

// Hash table entry.  A pos of zero marks an empty slot, no record can
// start inside the header.
struct Slot {
  std::uint32_t hash{0};
  std::uint32_t pos{0};

  bool empty() const { return pos == 0; }
};

using Header = std::array<Bucket, nbuckets>;

// Writer side of the header: per-bucket slots in write order.
using Index = std::array<std::vector<Slot>, nbuckets>;

inline std::size_t bucket_of(std::uint32_t h) { return h & 0xff; }

inline void pack(std::uint32_t v, unsigned char* p)
{
  p[0] = static_cast<unsigned char>(v);
  p[1] = static_cast<unsigned char>(v >> 8);
  p[2] = static_cast<unsigned char>(v >> 16);
  p[3] = static_cast<unsigned char>(v >> 24);
}

inline std::uint32_t unpack(unsigned char const* p)
{
  return std::uint32_t{p[0]} | (std::uint32_t{p[1]} << 8)
         | (std::uint32_t{p[2]} << 16) | (std::uint32_t{p[3]} << 24);
}

inline void pack_pair(std::uint32_t a, std::uint32_t b, unsigned char* p)
{
  pack(a, p);
  pack(b, p + 4);
}

} // namespace CDB

#endif // CDB_LAYOUT_DOT_HPP
