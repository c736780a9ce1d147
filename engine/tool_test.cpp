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

#include "engine/tool.hpp"

extern "C" {
#include <sys/stat.h>
}

#include <fstream>

#include <atf-c++.hpp>

#include "engine/exceptions.hpp"
#include "utils/env.hpp"
#include "utils/fs/operations.hpp"
#include "utils/optional.ipp"
#include "utils/process/status.hpp"

namespace fs = utils::fs;
namespace process = utils::process;

using utils::none;


namespace {


/// Adapter that follows the generic classification rules.
///
/// Prints SAFE or UNSAFE on success; anything else is a failure.
class mock_tool : public engine::tool {
public:
    fs::path
    executable(void) const
    {
        return engine::find_executable("mock-tool");
    }

    std::string
    name(void) const
    {
        return "mock";
    }

    model::verdict
    determine_result(const process::status& status,
                     const std::vector< std::string >& output,
                     const bool is_timeout) const
    {
        if (is_timeout)
            return model::verdict::make_error("timeout");
        const std::string text = engine::join_output(output);
        if (text.find("UNSAFE") != std::string::npos)
            return model::verdict(model::verdict::false_reach);
        else if (text.find("SAFE") != std::string::npos)
            return model::verdict(model::verdict::true_prop);
        else if (status.exit_code() != 0)
            return engine::failure_verdict(status);
        else
            return model::verdict(model::verdict::unknown);
    }
};


/// Creates an executable shell script.
///
/// \param path The path to the script.
/// \param contents The body of the script, without the interpreter line.
static void
create_script(const fs::path& path, const std::string& contents)
{
    std::ofstream output(path.c_str());
    ATF_REQUIRE(output);
    output << "#! /bin/sh\n" << contents;
    output.close();
    ATF_REQUIRE(::chmod(path.c_str(), 0755) != -1);
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(registry__builtin);
ATF_TEST_CASE_BODY(registry__builtin)
{
    engine::register_tools();
    ATF_REQUIRE_EQ("AProVE", engine::find_tool("aprove")->name());
    ATF_REQUIRE_EQ("Forest", engine::find_tool("forest")->name());
    ATF_REQUIRE_EQ("symbiotic", engine::find_tool("symbiotic")->name());

    engine::register_tools();
    const std::vector< std::string > names = engine::registered_tools();
    ATF_REQUIRE_EQ(3, names.size());
    ATF_REQUIRE_EQ("aprove", names[0]);
    ATF_REQUIRE_EQ("forest", names[1]);
    ATF_REQUIRE_EQ("symbiotic", names[2]);
}


ATF_TEST_CASE_WITHOUT_HEAD(registry__custom);
ATF_TEST_CASE_BODY(registry__custom)
{
    const engine::tool_ptr tool(new mock_tool());
    engine::register_tool("mock", tool);
    ATF_REQUIRE(tool == engine::find_tool("mock"));
}


ATF_TEST_CASE_WITHOUT_HEAD(registry__unknown);
ATF_TEST_CASE_BODY(registry__unknown)
{
    engine::register_tools();
    ATF_REQUIRE_THROW_RE(engine::tool_not_found_error, "Unsupported tool 'foo'",
                         engine::find_tool("foo"));
}


ATF_TEST_CASE_WITHOUT_HEAD(find_executable__found);
ATF_TEST_CASE_BODY(find_executable__found)
{
    fs::mkdir(fs::path("bin"), 0755);
    create_script(fs::path("bin/mock-tool"), "exit 0\n");
    utils::setenv("PATH", (fs::current_path() / "bin").str());

    ATF_REQUIRE_EQ(fs::current_path() / "bin/mock-tool",
                   mock_tool().executable());
}


ATF_TEST_CASE_WITHOUT_HEAD(find_executable__not_found);
ATF_TEST_CASE_BODY(find_executable__not_found)
{
    utils::setenv("PATH", (fs::current_path() / "empty").str());
    ATF_REQUIRE_THROW_RE(engine::tool_not_found_error, "mock-tool",
                         mock_tool().executable());
}


ATF_TEST_CASE_WITHOUT_HEAD(default_cmdline);
ATF_TEST_CASE_BODY(default_cmdline)
{
    std::vector< fs::path > tasks;
    tasks.push_back(fs::path("a.c"));
    tasks.push_back(fs::path("b.c"));
    const process::args_vector args = mock_tool().cmdline(
        fs::path("/bin/mock"), std::vector< std::string >(1, "-v"), tasks,
        utils::make_optional(fs::path("p.prp")), model::resource_limits());

    process::args_vector exp_args;
    exp_args.push_back("/bin/mock");
    exp_args.push_back("-v");
    exp_args.push_back("a.c");
    exp_args.push_back("b.c");
    ATF_REQUIRE(exp_args == args);
}


ATF_TEST_CASE_WITHOUT_HEAD(default_program_files);
ATF_TEST_CASE_BODY(default_program_files)
{
    const std::vector< fs::path > files = mock_tool().program_files(
        fs::path("/bin/mock"));
    ATF_REQUIRE_EQ(1, files.size());
    ATF_REQUIRE_EQ(fs::path("/bin/mock"), files[0]);
}


ATF_TEST_CASE_WITHOUT_HEAD(default_version);
ATF_TEST_CASE_BODY(default_version)
{
    ATF_REQUIRE(mock_tool().version(fs::path("/bin/mock")).empty());
}


ATF_TEST_CASE_WITHOUT_HEAD(version_from_tool__ok);
ATF_TEST_CASE_BODY(version_from_tool__ok)
{
    create_script(fs::path("tool"),
                  "if [ \"${1}\" = --version ]; then\n"
                  "    echo '  1.2.3 '\n"
                  "    echo 'second line'\n"
                  "fi\n");
    ATF_REQUIRE_EQ("1.2.3",
                   engine::version_from_tool(fs::current_path() / "tool"));
}


ATF_TEST_CASE_WITHOUT_HEAD(version_from_tool__custom_arg);
ATF_TEST_CASE_BODY(version_from_tool__custom_arg)
{
    create_script(fs::path("tool"),
                  "if [ \"${1}\" = -V ]; then echo 4.5; fi\n");
    ATF_REQUIRE_EQ("4.5",
                   engine::version_from_tool(fs::current_path() / "tool",
                                             "-V"));
}


ATF_TEST_CASE_WITHOUT_HEAD(version_from_tool__no_output);
ATF_TEST_CASE_BODY(version_from_tool__no_output)
{
    create_script(fs::path("tool"), "exit 1\n");
    ATF_REQUIRE(engine::version_from_tool(
        fs::current_path() / "tool").empty());
}


ATF_TEST_CASE_WITHOUT_HEAD(join_output);
ATF_TEST_CASE_BODY(join_output)
{
    std::vector< std::string > lines;
    ATF_REQUIRE_EQ("", engine::join_output(lines));
    lines.push_back("first");
    lines.push_back("second");
    ATF_REQUIRE_EQ("first\nsecond", engine::join_output(lines));
}


ATF_TEST_CASE_WITHOUT_HEAD(failure_verdict);
ATF_TEST_CASE_BODY(failure_verdict)
{
    const model::verdict verdict = engine::failure_verdict(
        process::status::fake_exited(3));
    ATF_REQUIRE(verdict.is_error());
    ATF_REQUIRE_EQ("Failed with returncode: 3 (signal: 0)", verdict.str());
}


ATF_TEST_CASE_WITHOUT_HEAD(determine_result__exit_and_signal);
ATF_TEST_CASE_BODY(determine_result__exit_and_signal)
{
    const process::status status(0, (1 << 8) | 9);
    const model::verdict verdict = mock_tool().determine_result(
        status, std::vector< std::string >(), false);
    ATF_REQUIRE(verdict.is_error());
    ATF_REQUIRE(verdict.str().find("1") != std::string::npos);
    ATF_REQUIRE(verdict.str().find("9") != std::string::npos);
    ATF_REQUIRE_EQ("Failed with returncode: 1 (signal: 9)", verdict.str());
}


ATF_TEST_CASE_WITHOUT_HEAD(determine_result__unknown_on_success);
ATF_TEST_CASE_BODY(determine_result__unknown_on_success)
{
    ATF_REQUIRE_EQ(model::verdict(model::verdict::unknown),
                   mock_tool().determine_result(
                       process::status::fake_exited(0),
                       std::vector< std::string >(1, "no answer"), false));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, registry__builtin);
    ATF_ADD_TEST_CASE(tcs, registry__custom);
    ATF_ADD_TEST_CASE(tcs, registry__unknown);

    ATF_ADD_TEST_CASE(tcs, find_executable__found);
    ATF_ADD_TEST_CASE(tcs, find_executable__not_found);

    ATF_ADD_TEST_CASE(tcs, default_cmdline);
    ATF_ADD_TEST_CASE(tcs, default_program_files);
    ATF_ADD_TEST_CASE(tcs, default_version);

    ATF_ADD_TEST_CASE(tcs, version_from_tool__ok);
    ATF_ADD_TEST_CASE(tcs, version_from_tool__custom_arg);
    ATF_ADD_TEST_CASE(tcs, version_from_tool__no_output);

    ATF_ADD_TEST_CASE(tcs, join_output);
    ATF_ADD_TEST_CASE(tcs, failure_verdict);
    ATF_ADD_TEST_CASE(tcs, determine_result__exit_and_signal);
    ATF_ADD_TEST_CASE(tcs, determine_result__unknown_on_success);
}
