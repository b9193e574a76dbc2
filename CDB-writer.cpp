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

#include "CDB-writer.hpp"

#include "CDB-error.hpp"
#include "CDB-hash.hpp"

#include <string>
#include <vector>

#include <fmt/format.h>

#include <glog/logging.h>

namespace CDB {

Writer::Writer(std::unique_ptr<Stream> stream)
  : stream_(std::move(stream))
{
  CHECK_NOTNULL(stream_.get());

  char const zeros[header_size]{};
  stream_->write(0, zeros, sizeof(zeros));

  if (stream_->size() > header_size)
    stream_->truncate(header_size);
}

Writer::Writer(std::unique_ptr<Stream> stream, Index index)
  : stream_(std::move(stream))
  , index_(std::move(index))
{
  CHECK_NOTNULL(stream_.get());

  end_ = stream_->size();
  if (end_ < header_size) {
    throw Error(errc::too_small,
                fmt::format("{} is {} bytes", stream_->name(), end_));
  }
  for (auto const& slots : index_)
    nrecords_ += slots.size();
}

Writer::~Writer()
{
  if (stream_ && !finalized_) {
    LOG(WARNING) << stream_->name() << ": writer destroyed before finalize, "
                 << nrecords_ << " records have no hash table";
  }
}

void Writer::put(std::string_view key, std::string_view value)
{
  if (finalized_)
    throw Error(errc::finalized, stream_->name());

  // Room for this record, and 2 slots per record for all of them.
  auto const rec_len = pair_size + key.length() + value.length();
  auto const tables  = (nrecords_ + 1) * 2 * pair_size;
  if (rec_len > max_size || end_ + rec_len + tables > max_size) {
    throw Error(errc::too_big, fmt::format("{}: {} records, {} bytes",
                                           stream_->name(), nrecords_, end_));
  }

  std::string rec;
  rec.resize(pair_size);
  pack_pair(static_cast<std::uint32_t>(key.length()),
            static_cast<std::uint32_t>(value.length()),
            reinterpret_cast<unsigned char*>(&rec[0]));
  rec.append(key);
  rec.append(value);

  stream_->write(end_, rec.data(), rec.size());

  auto const h = hash(key);
  index_[bucket_of(h)].push_back(Slot{h, static_cast<std::uint32_t>(end_)});

  end_ += rec.size();
  ++nrecords_;
}

void Writer::finalize()
{
  if (finalized_)
    return;

  // Tables go after the records.  end_ only moves once the header is
  // written, so a failed finalize() can be retried over the same bytes.
  auto   pos = end_;
  Header header;

  for (auto i = 0u; i < nbuckets; ++i) {
    auto const& slots  = index_[i];
    auto const  nslots = static_cast<std::uint32_t>(slots.size() * 2);

    // Linear probing in write order, at most half full so there is
    // always an empty slot.
    std::vector<Slot> table(nslots);
    for (auto const& s : slots) {
      auto where  = (s.hash >> 8) % nslots;
      auto tries  = std::uint32_t{0};
      while (!table[where].empty()) {
        CHECK_LT(++tries, nslots) << "no free slot in bucket " << i;
        if (++where == nslots)
          where = 0;
      }
      table[where] = s;
    }

    std::string buf(std::size_t{nslots} * pair_size, '\0');
    auto        p = reinterpret_cast<unsigned char*>(&buf[0]);
    for (auto const& s : table) {
      pack_pair(s.hash, s.pos, p);
      p += pair_size;
    }

    header[i] = Bucket{static_cast<std::uint32_t>(pos), nslots};
    stream_->write(pos, buf.data(), buf.size());
    pos += buf.size();
  }

  unsigned char hdr[header_size];
  for (auto i = 0u; i < nbuckets; ++i) {
    pack_pair(header[i].pos, header[i].nslots, hdr + i * pair_size);
  }
  stream_->write(0, reinterpret_cast<char const*>(hdr), sizeof(hdr));

  end_       = pos;
  finalized_ = true;
  index_     = Index{};

  VLOG(1) << stream_->name() << ": finalized " << nrecords_ << " records, "
          << end_ << " bytes";
}

Reader Writer::as_reader() &&
{
  finalize();
  return Reader(std::move(stream_));
}

} // namespace CDB
