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

#include "engine/orchestrator.hpp"

extern "C" {
#include <stdlib.h>
}

#include <string>
#include <vector>

#include <atf-c++.hpp>

#include "engine/config.hpp"
#include "engine/exceptions.hpp"
#include "engine/executor.hpp"
#include "engine/output_handler.hpp"
#include "engine/tool.hpp"
#include "utils/datetime.hpp"
#include "utils/env.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.ipp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;


namespace {


/// Start time used by all tests, to make the output names predictable.
static const datetime::timestamp start_time =
    datetime::timestamp::from_values(2015, 1, 2, 3, 4, 0);


/// Record of the calls received by the mock executors.
struct call_log {
    /// Names of the benchmarks that have been executed.
    std::vector< std::string > executed;

    /// Number of times stop() has been called.
    int stops;

    /// Orchestrator to stop once the first benchmark completes, if any.
    engine::orchestrator* stop_after_first;

    /// Constructor.
    call_log(void) : stops(0), stop_after_first(NULL) {}
};


/// Executor that simulates the execution of benchmarks.
///
/// The behavior depends on the name of the benchmark: "broken" throws an
/// error and "partial" returns a failure code.
class mock_executor : public engine::executor {
    /// Record of the calls.
    call_log& _calls;

public:
    /// Constructor.
    ///
    /// \param calls_ Record of the calls to update.
    explicit mock_executor(call_log& calls_) : _calls(calls_) {}

    /// Does nothing.
    void
    init(const engine::config& UTILS_UNUSED_PARAM(config),
         const model::benchmark& UTILS_UNUSED_PARAM(benchmark))
    {
    }

    /// Simulates the execution of a benchmark.
    ///
    /// \param benchmark The benchmark to execute.
    /// \param handler The recipient of the results.
    ///
    /// \return 1 for the "partial" benchmark, 0 otherwise.
    int
    execute_benchmark(const model::benchmark& benchmark,
                      engine::output_handler& handler)
    {
        fs::mkdir_p(fs::path(benchmark.log_folder()), 0755);
        handler.output_before_benchmark("1.0");
        _calls.executed.push_back(benchmark.name());
        if (benchmark.name() == "broken")
            throw engine::error("Executor failed");
        handler.output_after_benchmark(false);
        if (_calls.stop_after_first != NULL)
            _calls.stop_after_first->stop();
        return benchmark.name() == "partial" ? 1 : 0;
    }

    /// \return A fixed system description.
    engine::system_info
    get_system_info(void) const
    {
        return engine::system_info("host", "OS 1.0", "CPU", 1, 1024);
    }

    /// Counts the calls.
    void
    stop(void)
    {
        _calls.stops++;
    }
};


/// Orchestrator that uses the mock executor.
class mock_orchestrator : public engine::orchestrator {
    /// Record of the calls.
    call_log& _calls;

protected:
    /// \return A new mock executor.
    std::shared_ptr< engine::executor >
    load_executor(void)
    {
        return std::shared_ptr< engine::executor >(new mock_executor(_calls));
    }

public:
    /// Constructor.
    ///
    /// \param calls_ Record of the calls to update.
    explicit mock_orchestrator(call_log& calls_) : _calls(calls_) {}
};


/// Creates a benchmark file.
///
/// \param name The name of the file, without extension.
///
/// \return The path to the file.
static fs::path
create_benchmark_file(const std::string& name)
{
    engine::register_tools();
    const fs::path file(name + ".lua");
    atf::utils::create_file(file.str(), "benchmark = {tool = 'forest'}\n");
    return file;
}


/// Builds a configuration for a set of benchmark files.
///
/// \param names The names of the benchmark files, without extension.
///
/// \return A builder with the files and a fixed start time.
static engine::config_builder
make_config(const std::vector< std::string >& names)
{
    engine::config_builder builder;
    for (std::vector< std::string >::const_iterator iter = names.begin();
         iter != names.end(); ++iter)
        builder.add_benchmark_file(create_benchmark_file(*iter));
    builder.set_start_time(start_time);
    return builder;
}


/// Computes the log folder of a benchmark created by these tests.
///
/// \param name The name of the benchmark.
///
/// \return The path to the log folder.
static fs::path
log_folder(const std::string& name)
{
    return fs::path(F("results/%s.2015-01-02_0304.logfiles") % name);
}


/// Runs a shell command and fails the test if it does not succeed.
///
/// \param command The command to run.
static void
run_shell(const std::string& command)
{
    ATF_REQUIRE_EQ(0, ::system(command.c_str()));
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(start__all_files_in_order);
ATF_TEST_CASE_BODY(start__all_files_in_order)
{
    std::vector< std::string > names;
    names.push_back("second");
    names.push_back("first");

    call_log calls;
    mock_orchestrator orchestrator(calls);
    ATF_REQUIRE_EQ(0, orchestrator.start(make_config(names).build()));

    ATF_REQUIRE(names == calls.executed);
    ATF_REQUIRE_EQ(2, orchestrator.completed_benchmarks());
    ATF_REQUIRE(!orchestrator.interrupted());
    ATF_REQUIRE(!fs::exists(log_folder("first")));
    ATF_REQUIRE(!fs::exists(log_folder("second")));
    ATF_REQUIRE(fs::exists(fs::path("results/first.2015-01-02_0304.txt")));
}


ATF_TEST_CASE_WITHOUT_HEAD(start__exit_codes_combined);
ATF_TEST_CASE_BODY(start__exit_codes_combined)
{
    std::vector< std::string > names;
    names.push_back("partial");
    names.push_back("ok");

    call_log calls;
    mock_orchestrator orchestrator(calls);
    ATF_REQUIRE_EQ(1, orchestrator.start(make_config(names).build()));
    ATF_REQUIRE_EQ(2, calls.executed.size());
}


ATF_TEST_CASE_WITHOUT_HEAD(start__executor_failure);
ATF_TEST_CASE_BODY(start__executor_failure)
{
    std::vector< std::string > names;
    names.push_back("ok");
    names.push_back("broken");
    names.push_back("never");

    call_log calls;
    mock_orchestrator orchestrator(calls);
    ATF_REQUIRE_THROW_RE(engine::error, "Executor failed",
                         orchestrator.start(make_config(names).build()));

    ATF_REQUIRE_EQ(2, calls.executed.size());
    ATF_REQUIRE_EQ(1, orchestrator.completed_benchmarks());
    ATF_REQUIRE(!fs::exists(log_folder("ok")));
    ATF_REQUIRE(!fs::exists(log_folder("broken")));
}


ATF_TEST_CASE_WITHOUT_HEAD(start__existing_results);
ATF_TEST_CASE_BODY(start__existing_results)
{
    fs::mkdir_p(log_folder("old"), 0755);
    atf::utils::create_file(log_folder("old").str() + "/run.log", "data\n");

    call_log calls;
    mock_orchestrator orchestrator(calls);
    ATF_REQUIRE_THROW_RE(
        engine::existing_results_error, "will not overwrite",
        orchestrator.start(
            make_config(std::vector< std::string >(1, "old")).build()));

    ATF_REQUIRE(calls.executed.empty());
    ATF_REQUIRE(atf::utils::compare_file(
        log_folder("old").str() + "/run.log", "data\n"));
}


ATF_TEST_CASE_WITHOUT_HEAD(start__load_error);
ATF_TEST_CASE_BODY(start__load_error)
{
    atf::utils::create_file("invalid.lua", "benchmark = \n");
    engine::config_builder builder;
    builder.add_benchmark_file(fs::path("invalid.lua"));

    call_log calls;
    mock_orchestrator orchestrator(calls);
    ATF_REQUIRE_THROW_RE(engine::load_error, "invalid.lua",
                         orchestrator.start(builder.build()));
    ATF_REQUIRE(calls.executed.empty());
}


ATF_TEST_CASE_WITHOUT_HEAD(stop__idempotent);
ATF_TEST_CASE_BODY(stop__idempotent)
{
    call_log calls;
    mock_orchestrator orchestrator(calls);
    ATF_REQUIRE(!orchestrator.interrupted());
    orchestrator.stop();
    orchestrator.stop();
    ATF_REQUIRE(orchestrator.interrupted());

    ATF_REQUIRE_EQ(0, orchestrator.start(
        make_config(std::vector< std::string >(1, "first")).build()));
    orchestrator.stop();
    ATF_REQUIRE(calls.executed.empty());
    ATF_REQUIRE_EQ(1, calls.stops);
    ATF_REQUIRE_EQ(0, orchestrator.completed_benchmarks());
}


ATF_TEST_CASE_WITHOUT_HEAD(stop__skips_remaining_files);
ATF_TEST_CASE_BODY(stop__skips_remaining_files)
{
    std::vector< std::string > names;
    names.push_back("first");
    names.push_back("second");

    call_log calls;
    mock_orchestrator orchestrator(calls);
    calls.stop_after_first = &orchestrator;
    ATF_REQUIRE_EQ(0, orchestrator.start(make_config(names).build()));

    ATF_REQUIRE_EQ(1, calls.executed.size());
    ATF_REQUIRE_EQ("first", calls.executed[0]);
    ATF_REQUIRE_EQ(1, calls.stops);
    ATF_REQUIRE(orchestrator.interrupted());
    ATF_REQUIRE_EQ(1, orchestrator.completed_benchmarks());
}


ATF_TEST_CASE_WITHOUT_HEAD(start__commit);
ATF_TEST_CASE_BODY(start__commit)
{
    if (!fs::find_in_path("git"))
        ATF_SKIP("git not installed");
    utils::setenv("GIT_CEILING_DIRECTORIES",
                  fs::current_path().branch_path().str());
    run_shell("git init -q . && git config user.email test@example.com && "
              "git config user.name Test && echo a >tracked && "
              "git add tracked && git commit -q -m initial");

    call_log calls;
    mock_orchestrator orchestrator(calls);
    ATF_REQUIRE_EQ(0, orchestrator.start(
        make_config(std::vector< std::string >(1, "first"))
        .set_commit(true).set_commit_message("New results").build()));

    run_shell("git log -1 --format=%s >subject");
    ATF_REQUIRE(atf::utils::compare_file("subject", "New results\n"));
    run_shell("git ls-files results >files");
    ATF_REQUIRE(atf::utils::compare_file(
        "files", "results/first.2015-01-02_0304.results.db\n"
        "results/first.2015-01-02_0304.txt\n"));
}


ATF_TEST_CASE_WITHOUT_HEAD(start__commit_dirty_repository);
ATF_TEST_CASE_BODY(start__commit_dirty_repository)
{
    if (!fs::find_in_path("git"))
        ATF_SKIP("git not installed");
    utils::setenv("GIT_CEILING_DIRECTORIES",
                  fs::current_path().branch_path().str());
    run_shell("git init -q . && git config user.email test@example.com && "
              "git config user.name Test && echo a >tracked && "
              "git add tracked && git commit -q -m initial && "
              "echo b >tracked");

    call_log calls;
    mock_orchestrator orchestrator(calls);
    ATF_REQUIRE_EQ(0, orchestrator.start(
        make_config(std::vector< std::string >(1, "first"))
        .set_commit(true).build()));

    run_shell("git log -1 --format=%s >subject");
    ATF_REQUIRE(atf::utils::compare_file("subject", "initial\n"));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, start__all_files_in_order);
    ATF_ADD_TEST_CASE(tcs, start__exit_codes_combined);
    ATF_ADD_TEST_CASE(tcs, start__executor_failure);
    ATF_ADD_TEST_CASE(tcs, start__existing_results);
    ATF_ADD_TEST_CASE(tcs, start__load_error);
    ATF_ADD_TEST_CASE(tcs, stop__idempotent);
    ATF_ADD_TEST_CASE(tcs, stop__skips_remaining_files);
    ATF_ADD_TEST_CASE(tcs, start__commit);
    ATF_ADD_TEST_CASE(tcs, start__commit_dirty_repository);
}
