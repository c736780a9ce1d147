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

#include "utils/text/operations.ipp"

#include <set>
#include <string>
#include <vector>

#include <atf-c++.hpp>

#include "utils/text/exceptions.hpp"

namespace text = utils::text;


ATF_TEST_CASE_WITHOUT_HEAD(join__empty);
ATF_TEST_CASE_BODY(join__empty)
{
    std::vector< std::string > lines;
    ATF_REQUIRE_EQ("", text::join(lines, ", "));
}


ATF_TEST_CASE_WITHOUT_HEAD(join__several);
ATF_TEST_CASE_BODY(join__several)
{
    std::vector< std::string > lines;
    lines.push_back("-timeout");
    ATF_REQUIRE_EQ("-timeout", text::join(lines, " "));
    lines.push_back("60");
    lines.push_back("-no-witness");
    ATF_REQUIRE_EQ("-timeout 60 -no-witness", text::join(lines, " "));

    std::set< std::string > names;
    names.insert("b.lua");
    names.insert("a.lua");
    ATF_REQUIRE_EQ("a.lua, b.lua", text::join(names, ", "));
}


ATF_TEST_CASE_WITHOUT_HEAD(quote);
ATF_TEST_CASE_BODY(quote)
{
    ATF_REQUIRE_EQ("''", text::quote("", '\''));
    ATF_REQUIRE_EQ("'task'", text::quote("task", '\''));
    ATF_REQUIRE_EQ("\"a \\\"b\\\"\"", text::quote("a \"b\"", '"'));
}


ATF_TEST_CASE_WITHOUT_HEAD(split__empty_tokens_dropped);
ATF_TEST_CASE_BODY(split__empty_tokens_dropped)
{
    ATF_REQUIRE(text::split("", ' ').empty());
    ATF_REQUIRE(text::split("   ", ' ').empty());

    std::vector< std::string > words = text::split("  a  b c ", ' ');
    ATF_REQUIRE_EQ(3, words.size());
    ATF_REQUIRE_EQ("a", words[0]);
    ATF_REQUIRE_EQ("b", words[1]);
    ATF_REQUIRE_EQ("c", words[2]);

    words = text::split("2015-03-04", '-');
    ATF_REQUIRE_EQ(3, words.size());
    ATF_REQUIRE_EQ("2015", words[0]);
    ATF_REQUIRE_EQ("04", words[2]);
}


ATF_TEST_CASE_WITHOUT_HEAD(strip);
ATF_TEST_CASE_BODY(strip)
{
    ATF_REQUIRE_EQ("", text::strip(""));
    ATF_REQUIRE_EQ("", text::strip(" \t\n"));
    ATF_REQUIRE_EQ("TRUE", text::strip("TRUE"));
    ATF_REQUIRE_EQ("FALSE(unreach-call)",
                   text::strip("\n  FALSE(unreach-call) \r\n"));
    ATF_REQUIRE_EQ("a b", text::strip(" a b "));
}


ATF_TEST_CASE_WITHOUT_HEAD(to_type__ok);
ATF_TEST_CASE_BODY(to_type__ok)
{
    ATF_REQUIRE_EQ(12, text::to_type< int >("12"));
    ATF_REQUIRE_EQ(-1, text::to_type< int >("-1"));
    ATF_REQUIRE_EQ(2.5, text::to_type< double >("2.5"));
    ATF_REQUIRE(text::to_type< bool >("true"));
    ATF_REQUIRE(!text::to_type< bool >("false"));
    ATF_REQUIRE_EQ(" raw ", text::to_type< std::string >(" raw "));
}


ATF_TEST_CASE_WITHOUT_HEAD(to_type__invalid);
ATF_TEST_CASE_BODY(to_type__invalid)
{
    ATF_REQUIRE_THROW_RE(text::value_error, "Empty",
                         text::to_type< int >(""));
    ATF_REQUIRE_THROW(text::value_error, text::to_type< int >(" 3"));
    ATF_REQUIRE_THROW(text::value_error, text::to_type< int >("3 "));
    ATF_REQUIRE_THROW(text::value_error, text::to_type< int >("3a"));
    ATF_REQUIRE_THROW(text::value_error, text::to_type< int >("abc"));
    ATF_REQUIRE_THROW_RE(text::value_error, "Invalid boolean value 'yes'",
                         text::to_type< bool >("yes"));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, join__empty);
    ATF_ADD_TEST_CASE(tcs, join__several);
    ATF_ADD_TEST_CASE(tcs, quote);
    ATF_ADD_TEST_CASE(tcs, split__empty_tokens_dropped);
    ATF_ADD_TEST_CASE(tcs, strip);
    ATF_ADD_TEST_CASE(tcs, to_type__ok);
    ATF_ADD_TEST_CASE(tcs, to_type__invalid);
}
