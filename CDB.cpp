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

#include "CDB.hpp"

#include <glog/logging.h>

namespace CDB {

Reader open(fs::path const& db)
{
  return Reader(std::make_unique<Mapped>(db));
}

Writer create(fs::path const& db)
{
  return Writer(std::make_unique<File>(db, File::mode::create));
}

Writer update(fs::path const& db)
{
  Reader rdr(std::make_unique<File>(db, File::mode::update));
  LOG(INFO) << "appending to " << db << " with " << rdr.size() << " records";
  return std::move(rdr).as_writer();
}

} // namespace CDB
