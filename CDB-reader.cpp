/*
    This file is part of ghcdb - Gene's constant database library.
    Copyright (C) 2014  Gene Hightower <gene@digilicious.com>

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU Affero General Public License as
    published by the Free Software Foundation, either version 3 of the
    License, or (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Affero General Public License for more details.

    You should have received a copy of the GNU Affero General Public License
    along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#include "CDB-reader.hpp"

#include "CDB-error.hpp"
#include "CDB-hash.hpp"
#include "CDB-writer.hpp"

#include <algorithm>

#include <fmt/format.h>

#include <glog/logging.h>

namespace CDB {

namespace {
struct record_header {
  std::uint32_t klen;
  std::uint32_t dlen;
};

// The klen and dlen at pos, checked to lie inside the records region.
record_header read_record_header(Stream&       stream,
                                 std::uint64_t pos,
                                 std::uint32_t table_start)
{
  if (pos < header_size || pos + pair_size > table_start) {
    auto const msg = fmt::format("{}: record at {} outside of [{}, {})",
                                 stream.name(), pos, header_size, table_start);
    LOG(WARNING) << msg;
    throw Error(errc::corrupt_database, msg);
  }

  unsigned char buf[pair_size];
  stream.read(pos, reinterpret_cast<char*>(buf), sizeof(buf));
  auto const hdr = record_header{unpack(buf), unpack(buf + 4)};

  auto const end = pos + pair_size + hdr.klen + hdr.dlen;
  if (end > table_start) {
    auto const msg
        = fmt::format("{}: record at {} with lengths {},{} runs past {}",
                      stream.name(), pos, hdr.klen, hdr.dlen, table_start);
    LOG(WARNING) << msg;
    throw Error(errc::corrupt_database, msg);
  }
  return hdr;
}

Slot read_slot(Stream& stream, std::uint64_t pos)
{
  unsigned char buf[pair_size];
  stream.read(pos, reinterpret_cast<char*>(buf), sizeof(buf));
  return Slot{unpack(buf), unpack(buf + 4)};
}
} // namespace

std::optional<Record> Cursor::next()
{
  // The hash tables start where the records end, there is no explicit
  // end marker.
  if (pos_ >= table_start_)
    return {};

  auto const hdr = read_record_header(*stream_, pos_, table_start_);
  pos_ += pair_size;

  Record rec;
  rec.first = stream_->read(pos_, hdr.klen);
  pos_ += hdr.klen;
  rec.second = stream_->read(pos_, hdr.dlen);
  pos_ += hdr.dlen;

  return rec;
}

//.............................................................................

Reader::Reader(std::unique_ptr<Stream> stream)
  : stream_(std::move(stream))
{
  CHECK_NOTNULL(stream_.get());

  auto const sz = stream_->size();
  if (sz < header_size) {
    throw Error(errc::too_small,
                fmt::format("{} is {} bytes", stream_->name(), sz));
  }

  unsigned char buf[header_size];
  stream_->read(0, reinterpret_cast<char*>(buf), sizeof(buf));

  auto table_start = std::uint64_t{sz};
  auto nslots      = std::uint64_t{0};

  for (auto i = 0u; i < nbuckets; ++i) {
    auto const p = buf + i * pair_size;
    auto&      b = header_[i];
    b.pos        = unpack(p);
    b.nslots     = unpack(p + 4);

    if (b.pos < header_size || b.pos > sz
        || std::uint64_t{b.nslots} * pair_size > sz - b.pos) {
      throw Error(errc::corrupt_database,
                  fmt::format("{}: bucket {} table at {} with {} slots lies "
                              "outside of {} bytes",
                              stream_->name(), i, b.pos, b.nslots, sz));
    }

    table_start = std::min(table_start, std::uint64_t{b.pos});
    nslots += b.nslots >> 1;
  }

  table_start_ = static_cast<std::uint32_t>(table_start);
  length_      = static_cast<std::size_t>(nslots);

  VLOG(1) << stream_->name() << ": " << length_ << " records, tables at "
          << table_start_;
}

void Reader::lookup_(std::string_view                                  key,
                     std::uint32_t                                     skip,
                     std::function<bool(std::uint64_t, std::uint32_t)> match)
{
  auto const  h = hash(key);
  auto const& b = header_[bucket_of(h)];

  // Can't have more matches than slots.
  if (skip >= b.nslots)
    return;

  auto slot    = (h >> 8) % b.nslots;
  auto matches = std::uint32_t{0};

  for (auto n = 0u; n < b.nslots; ++n) {
    auto const s = read_slot(*stream_, b.pos + std::uint64_t{slot} * pair_size);
    if (s.empty())
      return;

    if (s.hash == h) {
      auto const hdr = read_record_header(*stream_, s.pos, table_start_);
      if (hdr.klen == key.length()
          && stream_->read(s.pos + pair_size, hdr.klen) == key) {
        if (matches++ >= skip) {
          if (!match(s.pos + pair_size + hdr.klen, hdr.dlen))
            return;
        }
      }
    }

    if (++slot == b.nslots)
      slot = 0;
  }
}

std::optional<std::string> Reader::get_from_pos(std::string_view key,
                                                std::uint32_t    occurrence)
{
  std::optional<std::string> val;
  lookup_(key, occurrence, [this, &val](auto dpos, auto dlen) {
    val = stream_->read(dpos, dlen);
    return false;
  });
  return val;
}

std::string Reader::at(std::string_view key, std::uint32_t occurrence)
{
  auto val = get_from_pos(key, occurrence);
  if (!val) {
    throw Error(errc::key_not_found,
                fmt::format("{} (occurrence {}) in {}", std::string(key),
                            occurrence, stream_->name()));
  }
  return *val;
}

std::vector<std::string> Reader::get(std::string_view key)
{
  // One pass over the slot sequence yields the same values, in the same
  // order, as get_from_pos(key, 0), get_from_pos(key, 1), ... would.
  std::vector<std::string> vals;
  lookup_(key, 0, [this, &vals](auto dpos, auto dlen) {
    vals.push_back(stream_->read(dpos, dlen));
    return true;
  });
  return vals;
}

bool Reader::contains(std::string_view key)
{
  auto found = false;
  lookup_(key, 0, [&found](auto, auto) {
    found = true;
    return false;
  });
  return found;
}

std::vector<std::string> Reader::keys()
{
  std::vector<std::string> ret;
  ret.reserve(length_);
  auto cur = iterate();
  while (auto rec = cur.next()) {
    ret.push_back(std::move(rec->first));
  }
  return ret;
}

Writer Reader::as_writer() &&
{
  if (!stream_->truncatable())
    throw Error(errc::not_truncatable, stream_->name());

  // Rebuild the Writer's per-bucket lists.  Records are appended, so
  // sorting by position restores write order, which keeps duplicate keys
  // in the same order after the tables are rebuilt.
  Index index;
  for (auto const& b : header_) {
    if (b.nslots == 0)
      continue;
    auto const tbl = stream_->read(b.pos, std::size_t{b.nslots} * pair_size);
    auto       p   = reinterpret_cast<unsigned char const*>(tbl.data());
    for (auto i = 0u; i < b.nslots; ++i, p += pair_size) {
      auto const s = Slot{unpack(p), unpack(p + 4)};
      if (s.empty())
        continue;
      if (s.pos < header_size || s.pos >= table_start_) {
        throw Error(errc::corrupt_database,
                    fmt::format("{}: slot points to {}, records end at {}",
                                stream_->name(), s.pos, table_start_));
      }
      index[bucket_of(s.hash)].push_back(s);
    }
  }
  for (auto& slots : index) {
    std::sort(begin(slots), end(slots),
              [](Slot const& a, Slot const& b) { return a.pos < b.pos; });
  }

  stream_->truncate(table_start_);

  VLOG(1) << stream_->name() << ": reopened for writing at " << table_start_;

  return Writer(std::move(stream_), std::move(index));
}

} // namespace CDB
