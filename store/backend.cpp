// Copyright 2015 Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
// * Redistributions of source code must retain the above copyright
//   notice, this list of conditions and the following disclaimer.
// * Redistributions in binary form must reproduce the above copyright
//   notice, this list of conditions and the following disclaimer in the
//   documentation and/or other materials provided with the distribution.
// * Neither the name of Google Inc. nor the names of its contributors
//   may be used to endorse or promote products derived from this software
//   without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "store/backend.hpp"

#include <fstream>

#include "store/exceptions.hpp"
#include "store/transaction.hpp"
#include "utils/env.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/sanity.hpp"
#include "utils/sqlite/exceptions.hpp"
#include "utils/sqlite/statement.hpp"
#include "utils/stream.hpp"

namespace fs = utils::fs;
namespace sqlite = utils::sqlite;


/// The current schema version.
///
/// Any new database gets this schema version.  This must be kept in sync
/// with the value in schema.sql.
const int store::detail::current_schema_version = 1;


namespace {


/// Opens a database and defines session pragmas.
///
/// \param file The database file to be opened.
/// \param flags The flags for the open; see sqlite::database::open.
///
/// \return The opened database.
///
/// \throw store::error If there is a problem opening or creating the database.
static sqlite::database
do_open(const fs::path& file, const int flags)
{
    try {
        sqlite::database database = sqlite::database::open(file, flags);
        database.exec("PRAGMA foreign_keys = ON");
        return database;
    } catch (const sqlite::error& e) {
        throw store::error(F("Cannot open '%s': %s") % file % e.what());
    }
}


/// Checks if a database is empty (i.e. if it is new).
///
/// \param db The database to check.
///
/// \return True if the database is empty.
static bool
empty_database(sqlite::database& db)
{
    sqlite::statement stmt = db.create_statement("SELECT * FROM sqlite_master");
    return !stmt.step();
}


/// Queries the schema version of a database.
///
/// \param db The database to query.
///
/// \return The most recent schema version recorded in the database.
///
/// \throw store::integrity_error If the metadata is missing or invalid.
static int
schema_version(sqlite::database& db)
{
    try {
        sqlite::statement stmt = db.create_statement(
            "SELECT schema_version FROM metadata "
            "ORDER BY schema_version DESC LIMIT 1");
        if (!stmt.step())
            throw store::integrity_error("The metadata table is empty");
        return stmt.column_int(0);
    } catch (const sqlite::error& e) {
        throw store::integrity_error(F("Invalid metadata: %s") % e.what());
    }
}


}  // anonymous namespace


/// Returns the path to the schema file used by open_rw().
///
/// \return The schema file in the directory named by VBENCH_STOREDIR, if
/// defined, or in the built-in store directory otherwise.
fs::path
store::detail::schema_file(void)
{
    return fs::path(utils::getenv_with_default("VBENCH_STOREDIR",
                                               VBENCH_STOREDIR)) /
        "schema.sql";
}


/// Initializes an empty database.
///
/// \param db The database to initialize.
/// \param file The schema file to use.
///
/// \throw store::error If there is a problem initializing the database.
void
store::detail::initialize(sqlite::database& db, const fs::path& file)
{
    PRE(empty_database(db));

    std::ifstream input(file.c_str());
    if (!input)
        throw error(F("Cannot open database schema '%s'") % file);

    LI(F("Populating new database with schema from %s") % file);
    const std::string schema_string = utils::read_stream(input);
    try {
        db.exec(schema_string);
    } catch (const sqlite::error& e) {
        throw error(F("Failed to initialize database: %s") % e.what());
    }

    if (schema_version(db) != detail::current_schema_version)
        UNREACHABLE_MSG("current_schema_version is out of sync with "
                        "schema.sql");
}


/// Internal implementation for the backend.
struct store::backend::impl {
    /// The SQLite database this backend talks to.
    sqlite::database database;

    /// Constructor.
    ///
    /// \param database_ The SQLite database instance.
    ///
    /// \throw integrity_error If the schema version of the database is not
    ///     the one this module implements.
    impl(sqlite::database& database_) :
        database(database_)
    {
        const int version = schema_version(database);
        if (version != detail::current_schema_version)
            throw integrity_error(F("Found schema version %s in database but "
                                    "this version does not exist") % version);
    }
};


/// Constructs a new backend.
///
/// \param pimpl_ The internal data.
store::backend::backend(impl* pimpl_) :
    _pimpl(pimpl_)
{
}


/// Destructor.
store::backend::~backend(void)
{
}


/// Opens a database in read-write mode and creates it if necessary.
///
/// \param file The database file to be opened.
///
/// \return The backend representation.
///
/// \throw store::error If there is any problem opening or creating
///     the database.
store::backend
store::backend::open_rw(const fs::path& file)
{
    sqlite::database db = do_open(file, sqlite::open_readwrite |
                                  sqlite::open_create);
    if (empty_database(db))
        detail::initialize(db, detail::schema_file());
    return backend(new impl(db));
}


/// Gets the connection to the SQLite database.
///
/// \return A database connection.
sqlite::database&
store::backend::database(void)
{
    return _pimpl->database;
}


/// Opens a transaction.
///
/// \return A new transaction.
store::transaction
store::backend::start(void)
{
    return transaction(*this);
}
