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

#include "engine/tools/symbiotic.hpp"

#include <atf-c++.hpp>

#include "engine/exceptions.hpp"
#include "utils/optional.ipp"
#include "utils/process/status.hpp"

namespace fs = utils::fs;
namespace process = utils::process;

using utils::none;


ATF_TEST_CASE_WITHOUT_HEAD(cmdline__with_property_file);
ATF_TEST_CASE_BODY(cmdline__with_property_file)
{
    const process::args_vector args = engine::tools::symbiotic().cmdline(
        fs::path("/usr/bin/symbiotic"), std::vector< std::string >(1, "--32"),
        std::vector< fs::path >(1, fs::path("dir/t.c")),
        utils::make_optional(fs::path("ALL.prp")), model::resource_limits());

    process::args_vector exp_args;
    exp_args.push_back("/usr/bin/symbiotic");
    exp_args.push_back("--32");
    exp_args.push_back("--prp=ALL.prp");
    exp_args.push_back("dir/t.c");
    ATF_REQUIRE(exp_args == args);
}


ATF_TEST_CASE_WITHOUT_HEAD(cmdline__too_many_tasks);
ATF_TEST_CASE_BODY(cmdline__too_many_tasks)
{
    ATF_REQUIRE_THROW(engine::error,
                      engine::tools::symbiotic().cmdline(
                          fs::path("symbiotic"), std::vector< std::string >(),
                          std::vector< fs::path >(), none,
                          model::resource_limits()));
}


ATF_TEST_CASE_WITHOUT_HEAD(determine_result__timeout_first);
ATF_TEST_CASE_BODY(determine_result__timeout_first)
{
    const model::verdict verdict = engine::tools::symbiotic().determine_result(
        process::status::fake_signaled(9, false),
        std::vector< std::string >(1, "TRUE"), true);
    ATF_REQUIRE(verdict.is_error());
    ATF_REQUIRE_EQ("timeout", verdict.str());
}


ATF_TEST_CASE_WITHOUT_HEAD(determine_result__answers);
ATF_TEST_CASE_BODY(determine_result__answers)
{
    const engine::tools::symbiotic tool;
    ATF_REQUIRE_EQ("true", tool.determine_result(
        process::status::fake_exited(0),
        std::vector< std::string >(1, "  TRUE\n"), false).str());
    ATF_REQUIRE_EQ("unknown", tool.determine_result(
        process::status::fake_exited(0),
        std::vector< std::string >(1, "UNKNOWN"), false).str());
    ATF_REQUIRE_EQ("false(reach)", tool.determine_result(
        process::status::fake_exited(1),
        std::vector< std::string >(1, "FALSE"), false).str());
}


ATF_TEST_CASE_WITHOUT_HEAD(determine_result__no_output);
ATF_TEST_CASE_BODY(determine_result__no_output)
{
    const engine::tools::symbiotic tool;
    ATF_REQUIRE_EQ("error (no output)", tool.determine_result(
        process::status::fake_exited(0), std::vector< std::string >(),
        false).str());
    ATF_REQUIRE_EQ("error (no output)", tool.determine_result(
        process::status::fake_exited(0), std::vector< std::string >(1, "  "),
        false).str());
}


ATF_TEST_CASE_WITHOUT_HEAD(determine_result__no_output_and_killed);
ATF_TEST_CASE_BODY(determine_result__no_output_and_killed)
{
    const engine::tools::symbiotic tool;
    const model::verdict verdict = tool.determine_result(
        process::status(0, (1 << 8) | 9), std::vector< std::string >(),
        false);
    ATF_REQUIRE(verdict.is_error());
    ATF_REQUIRE_EQ("Failed with returncode: 1 (signal: 9)", verdict.str());
}


ATF_TEST_CASE_WITHOUT_HEAD(determine_result__failure);
ATF_TEST_CASE_BODY(determine_result__failure)
{
    const engine::tools::symbiotic tool;
    ATF_REQUIRE_EQ("Failed with returncode: 2 (signal: 0)",
                   tool.determine_result(
                       process::status::fake_exited(2),
                       std::vector< std::string >(1, "Segfault somewhere"),
                       false).str());
    ATF_REQUIRE_EQ("error (unknown)",
                   tool.determine_result(
                       process::status::fake_exited(0),
                       std::vector< std::string >(1, "garbage"),
                       false).str());
}


ATF_TEST_CASE_WITHOUT_HEAD(program_files);
ATF_TEST_CASE_BODY(program_files)
{
    const std::vector< fs::path > files =
        engine::tools::symbiotic().program_files(fs::path("/opt/sym/symbiotic"));
    ATF_REQUIRE_EQ(13, files.size());
    ATF_REQUIRE_EQ(fs::path("/opt/sym/symbiotic"), files[0]);
    ATF_REQUIRE_EQ(fs::path("/opt/sym/build-fix.sh"), files[1]);
    ATF_REQUIRE_EQ(fs::path("/opt/sym/lib32/klee/runtime/"
                            "kleeRuntimeIntrinsic.bc"), files[12]);
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, cmdline__with_property_file);
    ATF_ADD_TEST_CASE(tcs, cmdline__too_many_tasks);
    ATF_ADD_TEST_CASE(tcs, determine_result__timeout_first);
    ATF_ADD_TEST_CASE(tcs, determine_result__answers);
    ATF_ADD_TEST_CASE(tcs, determine_result__no_output);
    ATF_ADD_TEST_CASE(tcs, determine_result__no_output_and_killed);
    ATF_ADD_TEST_CASE(tcs, determine_result__failure);
    ATF_ADD_TEST_CASE(tcs, program_files);
}
