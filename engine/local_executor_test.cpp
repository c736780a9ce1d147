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

#include "engine/local_executor.hpp"

extern "C" {
#include <sys/stat.h>
}

#include <stdexcept>
#include <string>
#include <vector>

#include <atf-c++.hpp>

#include "engine/config.hpp"
#include "engine/output_handler.hpp"
#include "engine/tool.hpp"
#include "model/benchmark.hpp"
#include "model/resource_limits.hpp"
#include "utils/datetime.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.ipp"
#include "utils/text/operations.ipp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace process = utils::process;
namespace text = utils::text;

using utils::none;
using utils::optional;


namespace {


/// Adapter for a shell script stored in the work directory of the test.
class script_tool : public engine::tool {
public:
    /// \return The path to the script.
    fs::path
    executable(void) const
    {
        return fs::path("tool.sh").to_absolute();
    }

    /// \return The name of the tool.
    std::string
    name(void) const
    {
        return "Script";
    }

    /// Classifies the output of the script by its first line.
    ///
    /// \param status The termination status of the script.
    /// \param output The lines printed by the script.
    /// \param is_timeout Whether the script was killed.
    ///
    /// \return The verdict of the run.
    model::verdict
    determine_result(const process::status& status,
                     const std::vector< std::string >& output,
                     const bool is_timeout) const
    {
        if (is_timeout)
            return model::verdict::make_error("timeout");
        if (!output.empty() && output[0] == "TRUE")
            return model::verdict(model::verdict::true_prop);
        if (!output.empty() && output[0] == "FALSE")
            return model::verdict(model::verdict::false_reach);
        if (!output.empty() && output[0] == "CRASH")
            throw std::logic_error("Cannot classify a crash");
        if (status.exit_code() != 0)
            return engine::failure_verdict(status);
        return model::verdict(model::verdict::unknown);
    }
};


/// Registers the script tool once per test program.
static void
register_script_tool(void)
{
    static bool registered = false;
    if (!registered) {
        engine::register_tool("script", engine::tool_ptr(new script_tool()));
        registered = true;
    }
}


/// Creates the script that stands in for the tool.
///
/// \param body The shell code to run; $1 is the task.
static void
create_tool(const std::string& body)
{
    atf::utils::create_file("tool.sh", "#!/bin/sh\n" + body + "\n");
    ATF_REQUIRE(::chmod("tool.sh", 0755) != -1);
}


/// Builds a benchmark with a single run set.
///
/// \param tasks The tasks of the run set.
/// \param limits The resource limits of the runs.
/// \param threads Number of runs to execute in parallel.
///
/// \return A benchmark writing its results under results/.
static model::benchmark
make_benchmark(const std::vector< std::string >& tasks,
               const model::resource_limits& limits, const int threads)
{
    const std::string output_base = "results/bench";
    std::vector< model::run > runs;
    for (std::vector< std::string >::const_iterator iter = tasks.begin();
         iter != tasks.end(); ++iter)
        runs.push_back(model::run(
            fs::path(*iter), std::vector< std::string >(1, "--flag"), none,
            fs::path(output_base + ".logfiles/default." + *iter + ".log")));

    std::vector< model::run_set > run_sets;
    run_sets.push_back(model::run_set("default", std::vector< std::string >(),
                                      runs));
    return model::benchmark(
        "bench", "script", fs::path("bench.lua"),
        std::vector< model::task_set >(), run_sets, limits, threads,
        std::vector< std::string >(),
        datetime::timestamp::from_values(2016, 5, 6, 7, 8, 9), output_base);
}


/// Runs a benchmark with the local executor.
///
/// \param benchmark The benchmark to execute.
/// \param config The configuration to pass to the executor.
///
/// \return The code returned by execute_benchmark.
static int
execute(const model::benchmark& benchmark, const engine::config& config)
{
    register_script_tool();
    engine::local_executor executor;
    executor.init(config, benchmark);
    engine::output_handler handler(benchmark, executor.get_system_info());
    return executor.execute_benchmark(benchmark, handler);
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(execute_benchmark__verdicts);
ATF_TEST_CASE_BODY(execute_benchmark__verdicts)
{
    create_tool("case \"${2}\" in\n"
                "*true*) echo TRUE ;;\n"
                "*false*) echo FALSE ;;\n"
                "*) echo 'something else'; exit 3 ;;\n"
                "esac");

    std::vector< std::string > tasks;
    tasks.push_back("a_true.c");
    tasks.push_back("b_false.c");
    tasks.push_back("c_other.c");
    tasks.push_back("d_true.c");
    const model::benchmark benchmark = make_benchmark(
        tasks, model::resource_limits(), 2);

    ATF_REQUIRE_EQ(0, execute(benchmark, engine::config_builder().build()));

    const std::string report = "results/bench.txt";
    ATF_REQUIRE(atf::utils::grep_file("^a_true.c +true ", report));
    ATF_REQUIRE(atf::utils::grep_file("^b_false.c +false\\(reach\\) ",
                                      report));
    ATF_REQUIRE(atf::utils::grep_file(
        "^c_other.c +Failed with returncode: 3 \\(signal: 0\\) ", report));
    ATF_REQUIRE(atf::utils::grep_file("^d_true.c +true ", report));

    const std::string log = "results/bench.logfiles/default.a_true.c.log";
    ATF_REQUIRE(atf::utils::grep_file("tool.sh --flag a_true.c$", log));
    ATF_REQUIRE(atf::utils::grep_file("^TRUE$", log));
}


ATF_TEST_CASE_WITHOUT_HEAD(execute_benchmark__classification_error);
ATF_TEST_CASE_BODY(execute_benchmark__classification_error)
{
    create_tool("case \"${2}\" in\n"
                "*crash*) echo CRASH ;;\n"
                "*) echo TRUE ;;\n"
                "esac");

    std::vector< std::string > tasks;
    tasks.push_back("a_true.c");
    tasks.push_back("b_crash.c");
    tasks.push_back("c_true.c");
    tasks.push_back("d_true.c");
    const model::benchmark benchmark = make_benchmark(
        tasks, model::resource_limits(), 3);

    ATF_REQUIRE_THROW_RE(std::logic_error, "Cannot classify a crash",
                         execute(benchmark, engine::config_builder().build()));
}


ATF_TEST_CASE_WITHOUT_HEAD(execute_benchmark__timeout);
ATF_TEST_CASE_BODY(execute_benchmark__timeout)
{
    create_tool("echo TRUE; sleep 60");

    const model::benchmark benchmark = make_benchmark(
        std::vector< std::string >(1, "slow.c"),
        model::resource_limits(utils::make_optional(1), none, none), 1);
    const datetime::timestamp start = datetime::timestamp::now();
    ATF_REQUIRE_EQ(0, execute(benchmark, engine::config_builder().build()));
    const datetime::delta elapsed = datetime::timestamp::now() - start;

    ATF_REQUIRE(elapsed < datetime::delta(30, 0));
    ATF_REQUIRE(atf::utils::grep_file("^slow.c +timeout ",
                                      "results/bench.txt"));
}


ATF_TEST_CASE_WITHOUT_HEAD(execute_benchmark__start_failure);
ATF_TEST_CASE_BODY(execute_benchmark__start_failure)
{
    create_tool("echo TRUE");
    fs::mkdir_p(fs::path("results"), 0755);
    atf::utils::create_file("results/bench.logfiles", "not a directory");

    std::vector< std::string > tasks;
    tasks.push_back("a_true.c");
    const model::benchmark benchmark = make_benchmark(
        tasks, model::resource_limits(), 1);

    ATF_REQUIRE_EQ(1, execute(benchmark, engine::config_builder().build()));
    ATF_REQUIRE(atf::utils::grep_file("^a_true.c +error \\(",
                                      "results/bench.txt"));
}


ATF_TEST_CASE_WITHOUT_HEAD(execute_benchmark__stopped);
ATF_TEST_CASE_BODY(execute_benchmark__stopped)
{
    create_tool("echo TRUE");
    register_script_tool();

    const model::benchmark benchmark = make_benchmark(
        std::vector< std::string >(1, "a_true.c"), model::resource_limits(),
        1);
    engine::local_executor executor;
    executor.init(engine::config_builder().build(), benchmark);
    executor.stop();
    executor.stop();

    engine::output_handler handler(benchmark, executor.get_system_info());
    ATF_REQUIRE_EQ(0, executor.execute_benchmark(benchmark, handler));
    ATF_REQUIRE(!fs::exists(
        fs::path("results/bench.logfiles/default.a_true.c.log")));
    ATF_REQUIRE(atf::utils::grep_file("interrupted", "results/bench.txt"));
}


ATF_TEST_CASE_WITHOUT_HEAD(init__unknown_tool);
ATF_TEST_CASE_BODY(init__unknown_tool)
{
    const model::benchmark benchmark(
        "bench", "no-such-tool", fs::path("bench.lua"),
        std::vector< model::task_set >(), std::vector< model::run_set >(),
        model::resource_limits(), 1, std::vector< std::string >(),
        datetime::timestamp::from_values(2016, 5, 6, 7, 8, 9),
        "results/bench");
    engine::local_executor executor;
    ATF_REQUIRE_THROW_RE(engine::tool_not_found_error, "no-such-tool",
                         executor.init(engine::config_builder().build(),
                                       benchmark));
}


ATF_TEST_CASE_WITHOUT_HEAD(shrink_file__small);
ATF_TEST_CASE_BODY(shrink_file__small)
{
    atf::utils::create_file("file", "0123456789");
    engine::detail::shrink_file(fs::path("file"), 10);
    ATF_REQUIRE(atf::utils::compare_file("file", "0123456789"));
}


ATF_TEST_CASE_WITHOUT_HEAD(shrink_file__large);
ATF_TEST_CASE_BODY(shrink_file__large)
{
    atf::utils::create_file("file", "head-middle-middle-middle-tail");
    engine::detail::shrink_file(fs::path("file"), 10);
    ATF_REQUIRE(atf::utils::grep_file("^head-$", "file"));
    ATF_REQUIRE(atf::utils::grep_file("WAS TOO LONG", "file"));
    ATF_REQUIRE(atf::utils::grep_file("^-tail$", "file"));
    ATF_REQUIRE(!atf::utils::grep_file("middle", "file"));
}


ATF_TEST_CASE_WITHOUT_HEAD(read_tool_output__skips_header);
ATF_TEST_CASE_BODY(read_tool_output__skips_header)
{
    atf::utils::create_file("log", "tool --flag task.c\n"
                            "-----\n"
                            "\n"
                            "first\n"
                            "second\n");
    const std::vector< std::string > output =
        engine::detail::read_tool_output(fs::path("log"));
    ATF_REQUIRE_EQ(2, output.size());
    ATF_REQUIRE_EQ("first", output[0]);
    ATF_REQUIRE_EQ("second", output[1]);
}


ATF_TEST_CASE_WITHOUT_HEAD(read_tool_output__only_header);
ATF_TEST_CASE_BODY(read_tool_output__only_header)
{
    atf::utils::create_file("log", "tool task.c\n-----\n\n");
    ATF_REQUIRE(engine::detail::read_tool_output(fs::path("log")).empty());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, execute_benchmark__verdicts);
    ATF_ADD_TEST_CASE(tcs, execute_benchmark__classification_error);
    ATF_ADD_TEST_CASE(tcs, execute_benchmark__timeout);
    ATF_ADD_TEST_CASE(tcs, execute_benchmark__start_failure);
    ATF_ADD_TEST_CASE(tcs, execute_benchmark__stopped);
    ATF_ADD_TEST_CASE(tcs, init__unknown_tool);
    ATF_ADD_TEST_CASE(tcs, shrink_file__small);
    ATF_ADD_TEST_CASE(tcs, shrink_file__large);
    ATF_ADD_TEST_CASE(tcs, read_tool_output__skips_header);
    ATF_ADD_TEST_CASE(tcs, read_tool_output__only_header);
}
