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

#include "utils/optional.ipp"

#include <sstream>
#include <string>

#include <atf-c++.hpp>

#include "utils/fs/path.hpp"

namespace fs = utils::fs;

using utils::none;
using utils::optional;


ATF_TEST_CASE_WITHOUT_HEAD(default_and_none);
ATF_TEST_CASE_BODY(default_and_none)
{
    const optional< int > empty1;
    ATF_REQUIRE(!empty1);

    const optional< int > empty2(none);
    ATF_REQUIRE(!empty2);
    ATF_REQUIRE(empty1 == empty2);

    ATF_REQUIRE_EQ(7, empty1.get_default(7));
}


ATF_TEST_CASE_WITHOUT_HEAD(with_value);
ATF_TEST_CASE_BODY(with_value)
{
    const optional< std::string > name("sv-comp");
    ATF_REQUIRE(name);
    ATF_REQUIRE_EQ("sv-comp", name.get());
    ATF_REQUIRE_EQ("sv-comp", name.get_default("other"));

    const optional< fs::path > path = utils::make_optional(fs::path("a//b"));
    ATF_REQUIRE_EQ(fs::path("a/b"), path.get());
}


ATF_TEST_CASE_WITHOUT_HEAD(copy_and_assign);
ATF_TEST_CASE_BODY(copy_and_assign)
{
    optional< int > limit(900);
    const optional< int > copy(limit);
    ATF_REQUIRE_EQ(900, copy.get());

    limit = none;
    ATF_REQUIRE(!limit);
    ATF_REQUIRE(copy);

    limit = 15;
    ATF_REQUIRE_EQ(15, limit.get());
    limit.get() = 20;
    ATF_REQUIRE_EQ(20, limit.get());

    limit = copy;
    ATF_REQUIRE_EQ(900, limit.get());

    optional< int > other;
    other = optional< int >();
    ATF_REQUIRE(!other);
}


ATF_TEST_CASE_WITHOUT_HEAD(compare);
ATF_TEST_CASE_BODY(compare)
{
    ATF_REQUIRE(optional< int >(1) == optional< int >(1));
    ATF_REQUIRE(optional< int >(1) != optional< int >(2));
    ATF_REQUIRE(optional< int >(1) != optional< int >());
    ATF_REQUIRE(optional< int >() == optional< int >(none));
}


ATF_TEST_CASE_WITHOUT_HEAD(output);
ATF_TEST_CASE_BODY(output)
{
    std::ostringstream str;
    str << optional< int >() << " " << optional< int >(4);
    ATF_REQUIRE_EQ("none 4", str.str());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, default_and_none);
    ATF_ADD_TEST_CASE(tcs, with_value);
    ATF_ADD_TEST_CASE(tcs, copy_and_assign);
    ATF_ADD_TEST_CASE(tcs, compare);
    ATF_ADD_TEST_CASE(tcs, output);
}
