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

#include "engine/tools/aprove.hpp"

#include <atf-c++.hpp>

#include "utils/process/status.hpp"

namespace fs = utils::fs;
namespace process = utils::process;


namespace {


/// Classifies a single line of output printed by a successful AProVE.
///
/// \param line The output line.
///
/// \return The verdict.
static model::verdict
classify(const char* line)
{
    return engine::tools::aprove().determine_result(
        process::status::fake_exited(0), std::vector< std::string >(1, line),
        false);
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(name);
ATF_TEST_CASE_BODY(name)
{
    ATF_REQUIRE_EQ("AProVE", engine::tools::aprove().name());
}


ATF_TEST_CASE_WITHOUT_HEAD(determine_result__markers);
ATF_TEST_CASE_BODY(determine_result__markers)
{
    ATF_REQUIRE_EQ("true", classify("YES").str());
    ATF_REQUIRE_EQ("true", classify("TRUE").str());
    ATF_REQUIRE_EQ("false(termination)", classify("FALSE").str());
    ATF_REQUIRE_EQ("false(termination)", classify("NO").str());
    ATF_REQUIRE_EQ("unknown", classify("MAYBE").str());
    ATF_REQUIRE_EQ("unknown", classify("").str());
}


ATF_TEST_CASE_WITHOUT_HEAD(determine_result__priority);
ATF_TEST_CASE_BODY(determine_result__priority)
{
    std::vector< std::string > output;
    output.push_back("TRUE");
    output.push_back("FALSE_REACH");
    ATF_REQUIRE_EQ(model::verdict(model::verdict::true_prop),
                   engine::tools::aprove().determine_result(
                       process::status::fake_exited(0), output, false));

    output.clear();
    output.push_back("NO");
    output.push_back("YES");
    ATF_REQUIRE_EQ(model::verdict(model::verdict::true_prop),
                   engine::tools::aprove().determine_result(
                       process::status::fake_exited(0), output, false));
}


ATF_TEST_CASE_WITHOUT_HEAD(determine_result__pure);
ATF_TEST_CASE_BODY(determine_result__pure)
{
    const engine::tools::aprove tool;
    const std::vector< std::string > output(1, "NO");
    const model::verdict first = tool.determine_result(
        process::status::fake_exited(1), output, false);
    for (int i = 0; i < 10; i++)
        ATF_REQUIRE_EQ(first, tool.determine_result(
                           process::status::fake_exited(1), output, false));
}


ATF_TEST_CASE_WITHOUT_HEAD(program_files);
ATF_TEST_CASE_BODY(program_files)
{
    const std::vector< fs::path > files = engine::tools::aprove().program_files(
        fs::path("/opt/aprove/AProVE.sh"));
    ATF_REQUIRE_EQ(4, files.size());
    ATF_REQUIRE_EQ(fs::path("/opt/aprove/aprove.jar"), files[0]);
    ATF_REQUIRE_EQ(fs::path("/opt/aprove/AProVE.sh"), files[1]);
    ATF_REQUIRE_EQ(fs::path("/opt/aprove/bin"), files[2]);
    ATF_REQUIRE_EQ(fs::path("/opt/aprove/newstrategy.strategy"), files[3]);
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, name);
    ATF_ADD_TEST_CASE(tcs, determine_result__markers);
    ATF_ADD_TEST_CASE(tcs, determine_result__priority);
    ATF_ADD_TEST_CASE(tcs, determine_result__pure);
    ATF_ADD_TEST_CASE(tcs, program_files);
}
