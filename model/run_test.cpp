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

#include "model/run.hpp"

#include <sstream>

#include <atf-c++.hpp>

#include "model/run_set.hpp"
#include "model/task_set.hpp"
#include "utils/optional.ipp"

namespace fs = utils::fs;

using utils::none;


namespace {


/// Builds a list of strings from two values.
///
/// \param first The first string.
/// \param second The second string.
///
/// \return A vector with both strings.
static std::vector< std::string >
two_strings(const char* first, const char* second)
{
    std::vector< std::string > strings;
    strings.push_back(first);
    strings.push_back(second);
    return strings;
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(run__ctor_and_getters);
ATF_TEST_CASE_BODY(run__ctor_and_getters)
{
    const model::run run(fs::path("a/b.c"), two_strings("-x", "-y"),
                         utils::make_optional(fs::path("ALL.prp")),
                         fs::path("logs/default.b.c.log"));
    ATF_REQUIRE_EQ(fs::path("a/b.c"), run.task());
    ATF_REQUIRE(two_strings("-x", "-y") == run.options());
    ATF_REQUIRE_EQ(fs::path("ALL.prp"), run.property_file().get());
    ATF_REQUIRE_EQ(fs::path("logs/default.b.c.log"), run.log_file());
}


ATF_TEST_CASE_WITHOUT_HEAD(run__operators_eq_and_ne);
ATF_TEST_CASE_BODY(run__operators_eq_and_ne)
{
    const model::run run1(fs::path("a.c"), two_strings("-x", "-y"), none,
                          fs::path("a.log"));
    const model::run run2 = run1;
    const model::run run3(fs::path("a.c"), two_strings("-y", "-x"), none,
                          fs::path("a.log"));
    const model::run run4(fs::path("a.c"), two_strings("-x", "-y"),
                          utils::make_optional(fs::path("p")),
                          fs::path("a.log"));
    ATF_REQUIRE(  run1 == run2);
    ATF_REQUIRE(!(run1 != run2));
    ATF_REQUIRE(  run1 != run3);
    ATF_REQUIRE(  run1 != run4);
}


ATF_TEST_CASE_WITHOUT_HEAD(run__output);
ATF_TEST_CASE_BODY(run__output)
{
    std::ostringstream str;
    str << model::run(fs::path("a.c"), two_strings("-x", "-y"), none,
                      fs::path("a.log"));
    ATF_REQUIRE_EQ("model::run{task='a.c', options=[-x, -y], "
                   "log_file='a.log'}", str.str());
}


ATF_TEST_CASE_WITHOUT_HEAD(run_set__ctor_and_getters);
ATF_TEST_CASE_BODY(run_set__ctor_and_getters)
{
    std::vector< model::run > runs;
    runs.push_back(model::run(fs::path("a.c"), two_strings("-x", "-y"), none,
                              fs::path("a.log")));
    const model::run_set run_set("default", two_strings("-x", "-y"), runs);
    ATF_REQUIRE_EQ("default", run_set.name());
    ATF_REQUIRE(two_strings("-x", "-y") == run_set.options());
    ATF_REQUIRE_EQ(1, run_set.runs().size());
    ATF_REQUIRE(runs[0] == run_set.runs()[0]);
}


ATF_TEST_CASE_WITHOUT_HEAD(task_set__ctor_and_getters);
ATF_TEST_CASE_BODY(task_set__ctor_and_getters)
{
    std::vector< fs::path > files;
    files.push_back(fs::path("loops/a.c"));
    const model::task_set task_set("loops", files, none,
                                   two_strings("--32", "--slice"));
    ATF_REQUIRE_EQ("loops", task_set.name());
    ATF_REQUIRE(files == task_set.files());
    ATF_REQUIRE(!task_set.property_file());
    ATF_REQUIRE(two_strings("--32", "--slice") == task_set.options());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, run__ctor_and_getters);
    ATF_ADD_TEST_CASE(tcs, run__operators_eq_and_ne);
    ATF_ADD_TEST_CASE(tcs, run__output);
    ATF_ADD_TEST_CASE(tcs, run_set__ctor_and_getters);
    ATF_ADD_TEST_CASE(tcs, task_set__ctor_and_getters);
}
