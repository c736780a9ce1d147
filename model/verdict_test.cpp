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

#include "model/verdict.hpp"

#include <sstream>

#include <atf-c++.hpp>


ATF_TEST_CASE_WITHOUT_HEAD(verdict__taxonomy_strings);
ATF_TEST_CASE_BODY(verdict__taxonomy_strings)
{
    ATF_REQUIRE_EQ("true", model::verdict(model::verdict::true_prop).str());
    ATF_REQUIRE_EQ("false(reach)",
                   model::verdict(model::verdict::false_reach).str());
    ATF_REQUIRE_EQ("false(valid-deref)",
                   model::verdict(model::verdict::false_deref).str());
    ATF_REQUIRE_EQ("false(valid-free)",
                   model::verdict(model::verdict::false_free).str());
    ATF_REQUIRE_EQ("false(termination)",
                   model::verdict(model::verdict::false_termination).str());
    ATF_REQUIRE_EQ("unknown", model::verdict(model::verdict::unknown).str());
}


ATF_TEST_CASE_WITHOUT_HEAD(verdict__make_error);
ATF_TEST_CASE_BODY(verdict__make_error)
{
    const model::verdict verdict = model::verdict::make_error("timeout");
    ATF_REQUIRE(verdict.is_error());
    ATF_REQUIRE(!verdict.is_false());
    ATF_REQUIRE_EQ(model::verdict::error, verdict.type());
    ATF_REQUIRE_EQ("timeout", verdict.reason());
    ATF_REQUIRE_EQ("timeout", verdict.str());
}


ATF_TEST_CASE_WITHOUT_HEAD(verdict__is_false);
ATF_TEST_CASE_BODY(verdict__is_false)
{
    ATF_REQUIRE(!model::verdict(model::verdict::true_prop).is_false());
    ATF_REQUIRE( model::verdict(model::verdict::false_reach).is_false());
    ATF_REQUIRE( model::verdict(model::verdict::false_deref).is_false());
    ATF_REQUIRE( model::verdict(model::verdict::false_free).is_false());
    ATF_REQUIRE( model::verdict(model::verdict::false_termination).is_false());
    ATF_REQUIRE(!model::verdict(model::verdict::unknown).is_false());
}


ATF_TEST_CASE_WITHOUT_HEAD(verdict__operators_eq_and_ne);
ATF_TEST_CASE_BODY(verdict__operators_eq_and_ne)
{
    const model::verdict true1(model::verdict::true_prop);
    const model::verdict true2(model::verdict::true_prop);
    const model::verdict error1 = model::verdict::make_error("a");
    const model::verdict error2 = model::verdict::make_error("b");

    ATF_REQUIRE(  true1 == true2);
    ATF_REQUIRE(!(true1 != true2));
    ATF_REQUIRE(!(true1 == error1));
    ATF_REQUIRE(  error1 != error2);
    ATF_REQUIRE(  error1 == model::verdict::make_error("a"));
}


ATF_TEST_CASE_WITHOUT_HEAD(verdict__output);
ATF_TEST_CASE_BODY(verdict__output)
{
    std::ostringstream str;
    str << model::verdict(model::verdict::false_reach);
    ATF_REQUIRE_EQ("model::verdict{'false(reach)'}", str.str());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, verdict__taxonomy_strings);
    ATF_ADD_TEST_CASE(tcs, verdict__make_error);
    ATF_ADD_TEST_CASE(tcs, verdict__is_false);
    ATF_ADD_TEST_CASE(tcs, verdict__operators_eq_and_ne);
    ATF_ADD_TEST_CASE(tcs, verdict__output);
}
