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

#include "utils/sqlite/statement.hpp"

extern "C" {
#include <sqlite3.h>
}

#include <map>

#include "utils/defs.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/noncopyable.hpp"
#include "utils/sanity.hpp"
#include "utils/sqlite/database.hpp"
#include "utils/sqlite/exceptions.hpp"

namespace sqlite = utils::sqlite;


namespace {


static sqlite::type c_type_to_cxx(const int) UTILS_PURE;


/// Maps a SQLite 3 data type to our own representation.
///
/// \param original The native SQLite 3 data type.
///
/// \return Our internal representation for the native data type.
static sqlite::type
c_type_to_cxx(const int original)
{
    switch (original) {
    case SQLITE_BLOB: return sqlite::type_blob;
    case SQLITE_FLOAT: return sqlite::type_float;
    case SQLITE_INTEGER: return sqlite::type_integer;
    case SQLITE_NULL: return sqlite::type_null;
    case SQLITE_TEXT: return sqlite::type_text;
    default: UNREACHABLE_MSG(F("Unknown data type returned by SQLite 3: %s") %
                             original);
    }
    UNREACHABLE;
}


/// Handles the return value of a sqlite3_bind_* call.
///
/// \param db The database the call was made on.
/// \param api_function The name of the SQLite function that was called.
/// \param error The return value of the call.
///
/// \throw std::bad_alloc If there was no memory for the binding.
/// \throw api_error If the binding fails for any other reason.
static void
handle_bind_error(sqlite::database& db, const char* api_function,
                  const int error)
{
    switch (error) {
    case SQLITE_OK:
        return;
    case SQLITE_RANGE:
        UNREACHABLE_MSG("Invalid index for bind argument");
    case SQLITE_NOMEM:
        throw std::bad_alloc();
    default:
        throw sqlite::api_error::from_database(db, api_function);
    }
}


}  // anonymous namespace


/// Internal implementation for sqlite::statement.
struct utils::sqlite::statement::impl : utils::noncopyable {
    /// The database this statement belongs to.
    sqlite::database db;

    /// The SQLite 3 internal statement.
    ::sqlite3_stmt* stmt;

    /// Cache for the column names in a statement; lazily initialized.
    std::map< std::string, int > column_cache;

    /// Constructor.
    ///
    /// \param db_ The database this statement belongs to.  Be aware that we
    ///     keep a *copy* of the database; in other words, the database is
    ///     kept alive while the statement is.
    /// \param stmt_ The SQLite internal statement.
    impl(database& db_, ::sqlite3_stmt* stmt_) :
        db(db_),
        stmt(stmt_)
    {
    }

    /// Destructor.
    ~impl(void)
    {
        (void)::sqlite3_finalize(stmt);
    }
};


/// Initializes a statement object.
///
/// This is an internal function.  Use database::create_statement() to
/// instantiate one of these objects.
///
/// \param db The database this statement belongs to.
/// \param raw_stmt A void pointer representing a SQLite native statement of
///     type ::sqlite3_stmt.
sqlite::statement::statement(database& db, void* raw_stmt) :
    _pimpl(new impl(db, static_cast< ::sqlite3_stmt* >(raw_stmt)))
{
}


/// Destructor for the statement.
///
/// Remember that statements are reference-counted, so the statement will only
/// cease to be valid once its last copy is destroyed.
sqlite::statement::~statement(void)
{
}


/// Performs a processing step on the statement.
///
/// \return True if the statement returned a row; false if the processing has
/// finished.
///
/// \throw api_error If the processing of the step raises an error.
bool
sqlite::statement::step(void)
{
    const int error = ::sqlite3_step(_pimpl->stmt);
    switch (error) {
    case SQLITE_DONE:
        return false;
    case SQLITE_ROW:
        return true;
    default:
        throw api_error::from_database(_pimpl->db, "sqlite3_step");
    }
    UNREACHABLE;
}


/// Performs a processing step on a statement that does not return results.
///
/// \throw api_error If the processing of the step raises an error.
void
sqlite::statement::step_without_results(void)
{
    const bool data = step();
    INV_MSG(!data, "The statement should not have returned any rows");
}


/// Returns the number of columns in the step result.
///
/// \return The number of columns available for data retrieval.
int
sqlite::statement::column_count(void)
{
    return ::sqlite3_column_count(_pimpl->stmt);
}


/// Returns the name of a particular column in the result.
///
/// \param index The column to request the name of.
///
/// \return The name of the requested column.
std::string
sqlite::statement::column_name(const int index)
{
    const char* name = ::sqlite3_column_name(_pimpl->stmt, index);
    if (name == NULL)
        throw api_error::from_database(_pimpl->db, "sqlite3_column_name");
    return name;
}


/// Returns the type of a particular column in the result.
///
/// \param index The column to request the type of.
///
/// \return The type of the requested column.
sqlite::type
sqlite::statement::column_type(const int index)
{
    return c_type_to_cxx(::sqlite3_column_type(_pimpl->stmt, index));
}


/// Finds a column by name.
///
/// \param name The name of the column to search for.
///
/// \return The column identifier.
///
/// \throw value_error If the name cannot be found.
int
sqlite::statement::column_id(const char* name)
{
    std::map< std::string, int >& cache = _pimpl->column_cache;

    if (cache.empty()) {
        for (int i = 0; i < column_count(); i++) {
            const std::string aux_name = column_name(i);
            INV(cache.find(aux_name) == cache.end());
            cache[aux_name] = i;
        }
    }

    const std::map< std::string, int >::const_iterator iter = cache.find(name);
    if (iter == cache.end())
        throw sqlite::error(F("Unknown column '%s'") % name);
    else
        return (*iter).second;
}


/// Returns a particular column in the result as a double.
///
/// \param index The column to retrieve.
///
/// \return The value.
double
sqlite::statement::column_double(const int index)
{
    PRE(column_type(index) == type_float);
    return ::sqlite3_column_double(_pimpl->stmt, index);
}


/// Returns a particular column in the result as an integer.
///
/// \param index The column to retrieve.
///
/// \return The value.
int
sqlite::statement::column_int(const int index)
{
    PRE(column_type(index) == type_integer);
    return ::sqlite3_column_int(_pimpl->stmt, index);
}


/// Returns a particular column in the result as a 64-bit integer.
///
/// \param index The column to retrieve.
///
/// \return The value.
int64_t
sqlite::statement::column_int64(const int index)
{
    PRE(column_type(index) == type_integer);
    return ::sqlite3_column_int64(_pimpl->stmt, index);
}


/// Returns a particular column in the result as a text string.
///
/// \param index The column to retrieve.
///
/// \return The value; empty for NULL.
std::string
sqlite::statement::column_text(const int index)
{
    const unsigned char* text = ::sqlite3_column_text(_pimpl->stmt, index);
    if (text == NULL)
        return "";
    return reinterpret_cast< const char* >(text);
}


/// Resets a statement to allow further processing.
void
sqlite::statement::reset(void)
{
    (void)::sqlite3_reset(_pimpl->stmt);
}


/// Looks up the index of a named parameter.
///
/// \param stmt The statement to query.
/// \param name The name of the parameter, including its prefix.
///
/// \return The index of the parameter.
static int
parameter_index(::sqlite3_stmt* stmt, const char* name)
{
    const int index = ::sqlite3_bind_parameter_index(stmt, name);
    PRE_MSG(index > 0, F("Parameter %s not found") % name);
    return index;
}


/// Binds a double value to a parameter of a prepared statement.
///
/// \param name The name of the parameter; must exist.
/// \param value The value to bind.
void
sqlite::statement::bind(const char* name, const double value)
{
    handle_bind_error(_pimpl->db, "sqlite3_bind_double",
                      ::sqlite3_bind_double(_pimpl->stmt, parameter_index(
                          _pimpl->stmt, name), value));
}


/// Binds an integer value to a parameter of a prepared statement.
///
/// \param name The name of the parameter; must exist.
/// \param value The value to bind.
void
sqlite::statement::bind(const char* name, const int value)
{
    handle_bind_error(_pimpl->db, "sqlite3_bind_int",
                      ::sqlite3_bind_int(_pimpl->stmt, parameter_index(
                          _pimpl->stmt, name), value));
}


/// Binds a 64-bit integer value to a parameter of a prepared statement.
///
/// \param name The name of the parameter; must exist.
/// \param value The value to bind.
void
sqlite::statement::bind(const char* name, const int64_t value)
{
    handle_bind_error(_pimpl->db, "sqlite3_bind_int64",
                      ::sqlite3_bind_int64(_pimpl->stmt, parameter_index(
                          _pimpl->stmt, name), value));
}


/// Binds a NULL value to a parameter of a prepared statement.
///
/// \param name The name of the parameter; must exist.
void
sqlite::statement::bind(const char* name, const null& /* value */)
{
    handle_bind_error(_pimpl->db, "sqlite3_bind_null",
                      ::sqlite3_bind_null(_pimpl->stmt, parameter_index(
                          _pimpl->stmt, name)));
}


/// Binds a text string to a parameter of a prepared statement.
///
/// \param name The name of the parameter; must exist.
/// \param value The string to bind.  SQLite generates an internal copy of
///     this string.
void
sqlite::statement::bind(const char* name, const std::string& value)
{
    handle_bind_error(_pimpl->db, "sqlite3_bind_text",
                      ::sqlite3_bind_text(_pimpl->stmt, parameter_index(
                          _pimpl->stmt, name), value.c_str(),
                          static_cast< int >(value.length()),
                          SQLITE_TRANSIENT));
}


/// Clears any bindings and releases their memory.
void
sqlite::statement::clear_bindings(void)
{
    const int error = ::sqlite3_clear_bindings(_pimpl->stmt);
    PRE_MSG(error == SQLITE_OK, "SQLite3 contract has changed; it should "
            "only return SQLITE_OK");
}
