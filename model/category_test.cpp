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

#include "model/category.hpp"

#include <atf-c++.hpp>

#include "utils/fs/path.hpp"

namespace fs = utils::fs;


namespace {


/// Shorthand to classify a verdict of a given type against a task.
///
/// \param task Name of the task file.
/// \param type Type of the verdict.
///
/// \return The category of the verdict.
static model::category
categorize(const char* task, const model::verdict::verdict_type type)
{
    return model::categorize(fs::path(task), model::verdict(type));
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(categorize__correct);
ATF_TEST_CASE_BODY(categorize__correct)
{
    ATF_REQUIRE_EQ(model::category_correct,
                   categorize("dir/loop_true-unreach-call.c",
                              model::verdict::true_prop));
    ATF_REQUIRE_EQ(model::category_correct,
                   categorize("list_false-unreach-call.i",
                              model::verdict::false_reach));
    ATF_REQUIRE_EQ(model::category_correct,
                   categorize("list_false-valid-deref.i",
                              model::verdict::false_deref));
    ATF_REQUIRE_EQ(model::category_correct,
                   categorize("list_false-valid-free.i",
                              model::verdict::false_free));
    ATF_REQUIRE_EQ(model::category_correct,
                   categorize("count_false-termination.c",
                              model::verdict::false_termination));
    ATF_REQUIRE_EQ(model::category_correct,
                   categorize("count_true-termination.c",
                              model::verdict::true_prop));
}


ATF_TEST_CASE_WITHOUT_HEAD(categorize__wrong);
ATF_TEST_CASE_BODY(categorize__wrong)
{
    ATF_REQUIRE_EQ(model::category_wrong,
                   categorize("loop_true-unreach-call.c",
                              model::verdict::false_reach));
    ATF_REQUIRE_EQ(model::category_wrong,
                   categorize("list_false-unreach-call.i",
                              model::verdict::true_prop));
    ATF_REQUIRE_EQ(model::category_wrong,
                   categorize("list_false-valid-deref.i",
                              model::verdict::false_free));
}


ATF_TEST_CASE_WITHOUT_HEAD(categorize__unknown_and_error);
ATF_TEST_CASE_BODY(categorize__unknown_and_error)
{
    ATF_REQUIRE_EQ(model::category_unknown,
                   categorize("loop_true-unreach-call.c",
                              model::verdict::unknown));
    ATF_REQUIRE_EQ(model::category_error,
                   model::categorize(fs::path("loop_true-unreach-call.c"),
                                     model::verdict::make_error("timeout")));
}


ATF_TEST_CASE_WITHOUT_HEAD(categorize__missing);
ATF_TEST_CASE_BODY(categorize__missing)
{
    ATF_REQUIRE_EQ(model::category_missing,
                   categorize("plain.c", model::verdict::true_prop));
    ATF_REQUIRE_EQ(model::category_missing,
                   categorize("plain.c", model::verdict::false_reach));
}


ATF_TEST_CASE_WITHOUT_HEAD(category_name);
ATF_TEST_CASE_BODY(category_name)
{
    ATF_REQUIRE_EQ(std::string("correct"),
                   model::category_name(model::category_correct));
    ATF_REQUIRE_EQ(std::string("wrong"),
                   model::category_name(model::category_wrong));
    ATF_REQUIRE_EQ(std::string("unknown"),
                   model::category_name(model::category_unknown));
    ATF_REQUIRE_EQ(std::string("error"),
                   model::category_name(model::category_error));
    ATF_REQUIRE_EQ(std::string("missing"),
                   model::category_name(model::category_missing));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, categorize__correct);
    ATF_ADD_TEST_CASE(tcs, categorize__wrong);
    ATF_ADD_TEST_CASE(tcs, categorize__unknown_and_error);
    ATF_ADD_TEST_CASE(tcs, categorize__missing);
    ATF_ADD_TEST_CASE(tcs, category_name);
}
