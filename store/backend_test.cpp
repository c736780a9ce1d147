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

#include <atf-c++.hpp>

#include "store/exceptions.hpp"
#include "utils/env.hpp"
#include "utils/fs/operations.hpp"
#include "utils/sqlite/database.hpp"
#include "utils/sqlite/statement.hpp"

namespace fs = utils::fs;
namespace sqlite = utils::sqlite;


ATF_TEST_CASE(open_rw__create_new);
ATF_TEST_CASE_HEAD(open_rw__create_new)
{
    set_md_var("require.files", store::detail::schema_file().c_str());
}
ATF_TEST_CASE_BODY(open_rw__create_new)
{
    store::backend backend = store::backend::open_rw(fs::path("test.db"));
    ATF_REQUIRE(fs::exists(fs::path("test.db")));

    sqlite::statement stmt = backend.database().create_statement(
        "SELECT schema_version FROM metadata");
    ATF_REQUIRE(stmt.step());
    ATF_REQUIRE_EQ(store::detail::current_schema_version, stmt.column_int(0));
    ATF_REQUIRE(!stmt.step());
}


ATF_TEST_CASE(open_rw__reopen);
ATF_TEST_CASE_HEAD(open_rw__reopen)
{
    set_md_var("require.files", store::detail::schema_file().c_str());
}
ATF_TEST_CASE_BODY(open_rw__reopen)
{
    {
        store::backend backend = store::backend::open_rw(fs::path("test.db"));
        backend.database().exec("INSERT INTO benchmarks (name, tool, "
                                "tool_version, start_time, threads) "
                                "VALUES ('a', 'b', '', 0, 1)");
    }
    store::backend backend = store::backend::open_rw(fs::path("test.db"));
    sqlite::statement stmt = backend.database().create_statement(
        "SELECT name FROM benchmarks");
    ATF_REQUIRE(stmt.step());
    ATF_REQUIRE_EQ("a", stmt.column_text(0));
}


ATF_TEST_CASE_WITHOUT_HEAD(open_rw__missing_schema);
ATF_TEST_CASE_BODY(open_rw__missing_schema)
{
    utils::setenv("VBENCH_STOREDIR", (fs::current_path() / "none").str());
    ATF_REQUIRE_THROW_RE(store::error, "Cannot open database schema",
                         store::backend::open_rw(fs::path("test.db")));
}


ATF_TEST_CASE_WITHOUT_HEAD(open_rw__bad_schema_version);
ATF_TEST_CASE_BODY(open_rw__bad_schema_version)
{
    {
        sqlite::database db = sqlite::database::open(
            fs::path("test.db"), sqlite::open_readwrite | sqlite::open_create);
        db.exec("CREATE TABLE metadata (schema_version INTEGER, "
                "timestamp INTEGER)");
        db.exec("INSERT INTO metadata VALUES (5, 0)");
    }
    ATF_REQUIRE_THROW_RE(store::integrity_error, "schema version 5",
                         store::backend::open_rw(fs::path("test.db")));
}


ATF_TEST_CASE_WITHOUT_HEAD(open_rw__cannot_open);
ATF_TEST_CASE_BODY(open_rw__cannot_open)
{
    ATF_REQUIRE_THROW_RE(store::error, "Cannot open 'missing/test.db'",
                         store::backend::open_rw(fs::path("missing/test.db")));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, open_rw__create_new);
    ATF_ADD_TEST_CASE(tcs, open_rw__reopen);
    ATF_ADD_TEST_CASE(tcs, open_rw__missing_schema);
    ATF_ADD_TEST_CASE(tcs, open_rw__bad_schema_version);
    ATF_ADD_TEST_CASE(tcs, open_rw__cannot_open);
}
