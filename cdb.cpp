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

#include "CDB-make.hpp"
#include "CDB.hpp"
#include "esc.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

using namespace std::string_literals;

DEFINE_bool(encoded, false, "KEY and VALUE use C style escapes");
DEFINE_bool(yes_i_am_sure, false, "really dump every record with \"all\"");
DEFINE_bool(lines, false, "make: one key per input line, each value \"1\"");

namespace {
auto constexpr usage = R"(query and build constant databases

  cdb [flags] FILE count
  cdb [flags] FILE get KEY
  cdb [flags] FILE (top|tail) [COUNT]
  cdb [flags] FILE all --yes_i_am_sure
  cdb [flags] FILE put KEY VALUE
  cdb [flags] FILE make < input)";

auto constexpr default_count = std::size_t{10};

void display(CDB::Record const& rec)
{
  std::cout << quoted(rec.first) << ": " << quoted(rec.second) << '\n';
}

std::string arg_bytes(char const* arg)
{
  if (!FLAGS_encoded)
    return arg;
  auto bytes = unesc(arg);
  if (!bytes)
    throw std::invalid_argument(fmt::format("bad escape in {}", arg));
  return *bytes;
}

std::size_t arg_count(int argc, char* argv[], int n)
{
  if (n >= argc)
    return default_count;
  auto const count = std::stol(argv[n]);
  if (count < 0) {
    throw std::invalid_argument(
        fmt::format("COUNT must be a positive number: {}", argv[n]));
  }
  return count ? static_cast<std::size_t>(count) : default_count;
}

int get(CDB::Reader& rdr, std::string const& key)
{
  auto const vals = rdr.get(key);
  if (vals.empty()) {
    std::cout << "There are no values under " << quoted(key) << '\n';
    return 1;
  }
  if (vals.size() == 1) {
    std::cout << quoted(key) << ": " << quoted(vals[0]) << '\n';
    return 0;
  }
  std::cout << "Values under key " << quoted(key) << '\n';
  for (auto const& val : vals)
    std::cout << "    " << quoted(val) << '\n';
  return 0;
}

// Show records skipping the first skip of them, at most count.
void show(CDB::Reader& rdr, std::size_t skip, std::size_t count)
{
  auto cur = rdr.iterate();
  for (auto n = std::size_t{0}; n < skip + count; ++n) {
    auto rec = cur.next();
    if (!rec)
      break;
    if (n >= skip)
      display(*rec);
  }
}

int make(CDB::fs::path const& db)
{
  // Build beside the target, then rename, so readers of db see either
  // the old database or the new one.
  auto tmp = db;
  tmp += ".tmp";

  auto       wtr = CDB::create(tmp);
  auto const n   = FLAGS_lines ? CDB::make_lines(std::cin, wtr)
                               : CDB::make(std::cin, wtr);
  wtr.finalize();

  std::error_code ec;
  CDB::fs::rename(tmp, db, ec);
  if (ec) {
    LOG(ERROR) << "can't rename " << tmp << " to " << db << ": " << ec;
    return 1;
  }
  LOG(INFO) << "wrote " << n << " records to " << db;
  return 0;
}

int run(int argc, char* argv[])
{
  if (argc < 3) {
    std::cerr << google::ProgramUsage() << '\n';
    return 2;
  }

  CDB::fs::path const db{argv[1]};
  auto const          cmd = std::string{argv[2]};

  if (cmd == "make")
    return make(db);

  if (cmd == "put") {
    if (argc != 5) {
      std::cerr << google::ProgramUsage() << '\n';
      return 2;
    }
    auto wtr = CDB::update(db);
    wtr.put(arg_bytes(argv[3]), arg_bytes(argv[4]));
    wtr.finalize();
    return 0;
  }

  auto rdr = CDB::open(db);

  if (cmd == "count") {
    std::cout << "There are " << rdr.size() << " items in the CDB at " << db
              << '\n';
  }
  else if (cmd == "get") {
    if (argc != 4) {
      std::cerr << google::ProgramUsage() << '\n';
      return 2;
    }
    return get(rdr, arg_bytes(argv[3]));
  }
  else if (cmd == "top") {
    show(rdr, 0, arg_count(argc, argv, 3));
  }
  else if (cmd == "tail") {
    auto const count = arg_count(argc, argv, 3);
    auto const len   = rdr.size();
    show(rdr, len - std::min(len, count), count);
  }
  else if (cmd == "all") {
    if (!FLAGS_yes_i_am_sure) {
      std::cerr << "refusing to dump " << rdr.size()
                << " records without --yes_i_am_sure\n";
      return 2;
    }
    show(rdr, 0, rdr.size());
  }
  else {
    std::cerr << "unknown command " << quoted(cmd) << '\n'
              << google::ProgramUsage() << '\n';
    return 2;
  }

  return 0;
}
} // namespace

int main(int argc, char* argv[])
{
  google::SetUsageMessage(usage);
  google::SetVersionString("1.0");
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  try {
    return run(argc, argv);
  }
  catch (CDB::Error const& e) {
    LOG(ERROR) << e.what();
  }
  catch (std::invalid_argument const& e) {
    LOG(ERROR) << e.what();
  }
  catch (std::out_of_range const& e) {
    LOG(ERROR) << "COUNT out of range: " << e.what();
  }
  return EXIT_FAILURE;
}
