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

#ifndef CDB_DOT_HPP
#define CDB_DOT_HPP

#include "CDB-error.hpp"
#include "CDB-hash.hpp"
#include "CDB-layout.hpp"
#include "CDB-mapped.hpp"
#include "CDB-reader.hpp"
#include "CDB-stream.hpp"
#include "CDB-writer.hpp"

namespace CDB {

// Read only, memory mapped.
Reader open(fs::path const& db);

// A new, empty database; an existing file is replaced.
Writer create(fs::path const& db);

// Append to an existing database: the hash tables are stripped and
// rebuilt by the returned Writer's finalize().
Writer update(fs::path const& db);

} // namespace CDB

#endif // CDB_DOT_HPP
