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

#include <cstdint>

#include <atf-c++.hpp>

#include "utils/fs/path.hpp"
#include "utils/sqlite/database.hpp"
#include "utils/sqlite/exceptions.hpp"

namespace fs = utils::fs;
namespace sqlite = utils::sqlite;


namespace {


/// Opens a new database with a test table.
///
/// \return The new database.
static sqlite::database
create_test_db(void)
{
    sqlite::database db = sqlite::database::open(
        fs::path("test.db"), sqlite::open_readwrite | sqlite::open_create);
    db.exec("CREATE TABLE t (i INTEGER, f REAL, s TEXT, b BLOB)");
    return db;
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(step__no_results);
ATF_TEST_CASE_BODY(step__no_results)
{
    sqlite::database db = create_test_db();
    sqlite::statement stmt = db.create_statement("SELECT * FROM t");
    ATF_REQUIRE(!stmt.step());
}


ATF_TEST_CASE_WITHOUT_HEAD(step_without_results);
ATF_TEST_CASE_BODY(step_without_results)
{
    sqlite::database db = create_test_db();
    sqlite::statement stmt = db.create_statement(
        "INSERT INTO t (i) VALUES (5)");
    stmt.step_without_results();
    ATF_REQUIRE_EQ(1, db.last_insert_rowid());
}


ATF_TEST_CASE_WITHOUT_HEAD(create_statement__invalid);
ATF_TEST_CASE_BODY(create_statement__invalid)
{
    sqlite::database db = create_test_db();
    ATF_REQUIRE_THROW_RE(sqlite::api_error, "sqlite3_prepare",
                         db.create_statement("SELECT * FROM missing"));
}


ATF_TEST_CASE_WITHOUT_HEAD(bind_and_columns);
ATF_TEST_CASE_BODY(bind_and_columns)
{
    sqlite::database db = create_test_db();
    {
        sqlite::statement stmt = db.create_statement(
            "INSERT INTO t (i, f, s, b) VALUES (:i, :f, :s, :b)");
        stmt.bind(":i", static_cast< int64_t >(1234567890123LL));
        stmt.bind(":f", 2.5);
        stmt.bind(":s", std::string("forest"));
        stmt.bind(":b", sqlite::null());
        stmt.step_without_results();
    }

    sqlite::statement stmt = db.create_statement("SELECT i, f, s, b FROM t");
    ATF_REQUIRE(stmt.step());
    ATF_REQUIRE_EQ(4, stmt.column_count());
    ATF_REQUIRE_EQ("s", stmt.column_name(2));

    ATF_REQUIRE(stmt.column_type(0) == sqlite::type_integer);
    ATF_REQUIRE_EQ(1234567890123LL, stmt.column_int64(0));
    ATF_REQUIRE(stmt.column_type(1) == sqlite::type_float);
    ATF_REQUIRE_EQ(2.5, stmt.column_double(1));
    ATF_REQUIRE(stmt.column_type(2) == sqlite::type_text);
    ATF_REQUIRE_EQ("forest", stmt.column_text(2));
    ATF_REQUIRE(stmt.column_type(3) == sqlite::type_null);
    ATF_REQUIRE(!stmt.step());
}


ATF_TEST_CASE_WITHOUT_HEAD(column_id);
ATF_TEST_CASE_BODY(column_id)
{
    sqlite::database db = create_test_db();
    db.exec("INSERT INTO t (i, s) VALUES (7, 'x')");

    sqlite::statement stmt = db.create_statement("SELECT s, i FROM t");
    ATF_REQUIRE(stmt.step());
    ATF_REQUIRE_EQ(0, stmt.column_id("s"));
    ATF_REQUIRE_EQ(1, stmt.column_id("i"));
    ATF_REQUIRE_EQ(7, stmt.column_int(stmt.column_id("i")));
    ATF_REQUIRE_THROW_RE(sqlite::error, "Unknown column 'foo'",
                         stmt.column_id("foo"));
}


ATF_TEST_CASE_WITHOUT_HEAD(reset_and_rebind);
ATF_TEST_CASE_BODY(reset_and_rebind)
{
    sqlite::database db = create_test_db();
    sqlite::statement stmt = db.create_statement(
        "INSERT INTO t (i) VALUES (:i)");
    stmt.bind(":i", 1);
    stmt.step_without_results();
    stmt.reset();
    stmt.bind(":i", 2);
    stmt.step_without_results();
    stmt.reset();
    stmt.clear_bindings();
    stmt.step_without_results();

    sqlite::statement query = db.create_statement(
        "SELECT COUNT(*), SUM(i), COUNT(i) FROM t");
    ATF_REQUIRE(query.step());
    ATF_REQUIRE_EQ(3, query.column_int(0));
    ATF_REQUIRE_EQ(3, query.column_int(1));
    ATF_REQUIRE_EQ(2, query.column_int(2));
}


ATF_TEST_CASE_WITHOUT_HEAD(step__constraint_error);
ATF_TEST_CASE_BODY(step__constraint_error)
{
    sqlite::database db = sqlite::database::open(
        fs::path("test.db"), sqlite::open_readwrite | sqlite::open_create);
    db.exec("CREATE TABLE u (name TEXT NOT NULL)");
    sqlite::statement stmt = db.create_statement(
        "INSERT INTO u (name) VALUES (:name)");
    stmt.bind(":name", sqlite::null());
    ATF_REQUIRE_THROW_RE(sqlite::api_error, "NOT NULL", stmt.step());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, step__no_results);
    ATF_ADD_TEST_CASE(tcs, step_without_results);
    ATF_ADD_TEST_CASE(tcs, create_statement__invalid);
    ATF_ADD_TEST_CASE(tcs, bind_and_columns);
    ATF_ADD_TEST_CASE(tcs, column_id);
    ATF_ADD_TEST_CASE(tcs, reset_and_rebind);
    ATF_ADD_TEST_CASE(tcs, step__constraint_error);
}
