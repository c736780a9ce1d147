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

#include "utils/text/table.hpp"

#include <atf-c++.hpp>

namespace text = utils::text;


namespace {


/// Builds a table row from up to three cells.
///
/// \param c1 The first cell.
/// \param c2 The second cell.
/// \param c3 The third cell, or empty to omit it.
///
/// \return The new row.
static text::table_row
make_row(const char* c1, const char* c2, const char* c3 = NULL)
{
    text::table_row row;
    row.push_back(c1);
    row.push_back(c2);
    if (c3 != NULL)
        row.push_back(c3);
    return row;
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(table__accessors);
ATF_TEST_CASE_BODY(table__accessors)
{
    text::table table(2);
    ATF_REQUIRE_EQ(2, table.ncolumns());
    ATF_REQUIRE(table.empty());
    ATF_REQUIRE(table.begin() == table.end());

    table.add_row(make_row("a", "b"));
    ATF_REQUIRE(!table.empty());
    ATF_REQUIRE_EQ("b", (*table.begin())[1]);
    ATF_REQUIRE(++table.begin() == table.end());
}


ATF_TEST_CASE_WITHOUT_HEAD(format_table__empty);
ATF_TEST_CASE_BODY(format_table__empty)
{
    ATF_REQUIRE(text::format_table(text::table(3)).empty());
}


ATF_TEST_CASE_WITHOUT_HEAD(format_table__aligned);
ATF_TEST_CASE_BODY(format_table__aligned)
{
    text::table table(3);
    table.add_row(make_row("task", "verdict", "category"));
    table.add_row(make_row("a.c", "TRUE", "correct"));
    table.add_row(make_row("long-name.c", "FALSE(unreach-call)", "wrong"));

    const std::vector< std::string > lines = text::format_table(table);
    ATF_REQUIRE_EQ(3, lines.size());
    ATF_REQUIRE_EQ("task         verdict              category", lines[0]);
    ATF_REQUIRE_EQ("a.c          TRUE                 correct", lines[1]);
    ATF_REQUIRE_EQ("long-name.c  FALSE(unreach-call)  wrong", lines[2]);
}


ATF_TEST_CASE_WITHOUT_HEAD(format_table__custom_separator);
ATF_TEST_CASE_BODY(format_table__custom_separator)
{
    text::table table(2);
    table.add_row(make_row("ab", "c"));
    table.add_row(make_row("d", ""));

    const std::vector< std::string > lines = text::format_table(table, " | ");
    ATF_REQUIRE_EQ(2, lines.size());
    ATF_REQUIRE_EQ("ab | c", lines[0]);
    ATF_REQUIRE_EQ("d  | ", lines[1]);
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, table__accessors);
    ATF_ADD_TEST_CASE(tcs, format_table__empty);
    ATF_ADD_TEST_CASE(tcs, format_table__aligned);
    ATF_ADD_TEST_CASE(tcs, format_table__custom_separator);
}
