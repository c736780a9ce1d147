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

#include "engine/benchmark_file.hpp"

#include <atf-c++.hpp>

#include "engine/config.hpp"
#include "engine/exceptions.hpp"
#include "engine/tool.hpp"
#include "model/resource_limits.hpp"
#include "model/run.hpp"
#include "model/run_set.hpp"
#include "model/task_set.hpp"
#include "utils/datetime.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.ipp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;

using utils::none;


namespace {


/// Start time used by all tests.
static const datetime::timestamp start_time =
    datetime::timestamp::from_values(2015, 7, 8, 9, 10, 11);


/// Creates a tree of tasks under the defs directory.
static void
create_tasks(void)
{
    fs::mkdir_p(fs::path("defs/loops"), 0755);
    fs::mkdir_p(fs::path("defs/arrays"), 0755);
    atf::utils::create_file("defs/loops/a_true-unreach-call.c", "");
    atf::utils::create_file("defs/loops/b_false-unreach-call.c", "");
    atf::utils::create_file("defs/arrays/c_true-unreach-call.c", "");
    atf::utils::create_file("defs/ALL.prp", "");
}


/// Writes a benchmark file with two run definitions and two task sets.
static void
create_benchmark_file(void)
{
    create_tasks();
    atf::utils::create_file(
        "defs/sample.lua",
        "benchmark = {\n"
        "    tool = 'symbiotic',\n"
        "    timelimit = 900,\n"
        "    memlimit = 15000,\n"
        "    threads = 3,\n"
        "    options = {'--32'},\n"
        "    rundefinitions = {\n"
        "        {name = 'default', options = {'--slice'}},\n"
        "        {name = 'noslice', propertyfile = 'ALL.prp'},\n"
        "    },\n"
        "    tasks = {\n"
        "        {name = 'loops', files = {'loops/*.c'},\n"
        "         propertyfile = 'ALL.prp', options = {'--fast'}},\n"
        "        {name = 'arrays', files = {'arrays/*.c', 'none/*.c'}},\n"
        "    },\n"
        "}\n");
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(load_benchmark__complete);
ATF_TEST_CASE_BODY(load_benchmark__complete)
{
    engine::register_tools();
    create_benchmark_file();

    const model::benchmark benchmark = engine::load_benchmark(
        fs::path("defs/sample.lua"), engine::config_builder().build(),
        start_time);

    ATF_REQUIRE_EQ("sample", benchmark.name());
    ATF_REQUIRE_EQ("symbiotic", benchmark.tool_name());
    ATF_REQUIRE_EQ("results/sample.2015-07-08_0910", benchmark.output_base());
    ATF_REQUIRE_EQ(3, benchmark.threads());
    ATF_REQUIRE(model::resource_limits(utils::make_optional(900),
                                       utils::make_optional(15000), none) ==
                benchmark.limits());
    ATF_REQUIRE_EQ(1, benchmark.options().size());
    ATF_REQUIRE_EQ("--32", benchmark.options()[0]);

    ATF_REQUIRE_EQ(2, benchmark.task_sets().size());
    ATF_REQUIRE_EQ("loops", benchmark.task_sets()[0].name());
    ATF_REQUIRE_EQ(2, benchmark.task_sets()[0].files().size());
    ATF_REQUIRE_EQ(1, benchmark.task_sets()[1].files().size());

    ATF_REQUIRE_EQ(2, benchmark.run_sets().size());
    const model::run_set& first = benchmark.run_sets()[0];
    ATF_REQUIRE_EQ("default", first.name());
    ATF_REQUIRE_EQ(3, first.runs().size());

    const model::run& run = first.runs()[0];
    ATF_REQUIRE_EQ("a_true-unreach-call.c", run.task().leaf_name());
    ATF_REQUIRE_EQ(2, run.options().size());
    ATF_REQUIRE_EQ("--slice", run.options()[0]);
    ATF_REQUIRE_EQ("--fast", run.options()[1]);
    ATF_REQUIRE_EQ("ALL.prp", run.property_file().get().leaf_name());
    ATF_REQUIRE_EQ(fs::path("results/sample.2015-07-08_0910.logfiles/"
                            "default.a_true-unreach-call.c.log"),
                   run.log_file());

    const model::run& array_run = first.runs()[2];
    ATF_REQUIRE_EQ("c_true-unreach-call.c", array_run.task().leaf_name());
    ATF_REQUIRE(!array_run.property_file());

    const model::run& noslice_run = benchmark.run_sets()[1].runs()[2];
    ATF_REQUIRE_EQ("ALL.prp", noslice_run.property_file().get().leaf_name());
}


ATF_TEST_CASE_WITHOUT_HEAD(load_benchmark__overrides);
ATF_TEST_CASE_BODY(load_benchmark__overrides)
{
    engine::register_tools();
    create_benchmark_file();

    const engine::config config = engine::config_builder()
        .set_name("custom")
        .set_output_path("out/")
        .set_time_limit(-1)
        .set_memory_limit(2000)
        .set_core_limit(4)
        .set_num_threads(1)
        .build();
    const model::benchmark benchmark = engine::load_benchmark(
        fs::path("defs/sample.lua"), config, start_time);

    ATF_REQUIRE_EQ("custom", benchmark.name());
    ATF_REQUIRE_EQ("out/custom.2015-07-08_0910", benchmark.output_base());
    ATF_REQUIRE_EQ(1, benchmark.threads());
    ATF_REQUIRE(model::resource_limits(none, utils::make_optional(2000),
                                       utils::make_optional(4)) ==
                benchmark.limits());
}


ATF_TEST_CASE_WITHOUT_HEAD(load_benchmark__selection);
ATF_TEST_CASE_BODY(load_benchmark__selection)
{
    engine::register_tools();
    create_benchmark_file();

    const engine::config config = engine::config_builder()
        .add_run_definition("noslice")
        .add_run_definition("unknown")
        .add_task_set("arrays")
        .build();
    const model::benchmark benchmark = engine::load_benchmark(
        fs::path("defs/sample.lua"), config, start_time);

    ATF_REQUIRE_EQ(1, benchmark.run_sets().size());
    ATF_REQUIRE_EQ("noslice", benchmark.run_sets()[0].name());
    ATF_REQUIRE_EQ(1, benchmark.run_sets()[0].runs().size());
    ATF_REQUIRE_EQ(1, benchmark.task_sets().size());
    ATF_REQUIRE_EQ("arrays", benchmark.task_sets()[0].name());
}


ATF_TEST_CASE_WITHOUT_HEAD(load_benchmark__empty_selection);
ATF_TEST_CASE_BODY(load_benchmark__empty_selection)
{
    engine::register_tools();
    create_benchmark_file();

    const engine::config config = engine::config_builder()
        .add_task_set("missing")
        .build();
    const model::benchmark benchmark = engine::load_benchmark(
        fs::path("defs/sample.lua"), config, start_time);

    ATF_REQUIRE_EQ(2, benchmark.run_sets().size());
    ATF_REQUIRE_EQ(0, benchmark.num_runs());
}


ATF_TEST_CASE_WITHOUT_HEAD(load_benchmark__syntax_error);
ATF_TEST_CASE_BODY(load_benchmark__syntax_error)
{
    engine::register_tools();
    atf::utils::create_file("bad.lua", "benchmark = {\n");
    ATF_REQUIRE_THROW_RE(
        engine::load_error, "Load of 'bad.lua' failed",
        engine::load_benchmark(fs::path("bad.lua"),
                               engine::config_builder().build(), start_time));
}


ATF_TEST_CASE_WITHOUT_HEAD(load_benchmark__missing_table);
ATF_TEST_CASE_BODY(load_benchmark__missing_table)
{
    engine::register_tools();
    atf::utils::create_file("empty.lua", "foo = 3\n");
    ATF_REQUIRE_THROW_RE(
        engine::load_error, "'benchmark' table is not defined",
        engine::load_benchmark(fs::path("empty.lua"),
                               engine::config_builder().build(), start_time));
}


ATF_TEST_CASE_WITHOUT_HEAD(load_benchmark__unknown_tool);
ATF_TEST_CASE_BODY(load_benchmark__unknown_tool)
{
    engine::register_tools();
    atf::utils::create_file("tool.lua", "benchmark = {tool = 'foo'}\n");
    ATF_REQUIRE_THROW_RE(
        engine::load_error, "Unsupported tool 'foo'",
        engine::load_benchmark(fs::path("tool.lua"),
                               engine::config_builder().build(), start_time));
}


ATF_TEST_CASE_WITHOUT_HEAD(load_benchmark__bad_types);
ATF_TEST_CASE_BODY(load_benchmark__bad_types)
{
    engine::register_tools();
    atf::utils::create_file("types.lua",
                            "benchmark = {tool = 'forest', timelimit = 'x'}\n");
    ATF_REQUIRE_THROW_RE(
        engine::load_error, "'timelimit' must be a number",
        engine::load_benchmark(fs::path("types.lua"),
                               engine::config_builder().build(), start_time));

    atf::utils::create_file("types.lua",
                            "benchmark = {tool = 'forest', tasks = {3}}\n");
    ATF_REQUIRE_THROW_RE(
        engine::load_error, "Element 1 of 'tasks' must be a table",
        engine::load_benchmark(fs::path("types.lua"),
                               engine::config_builder().build(), start_time));
}


ATF_TEST_CASE_WITHOUT_HEAD(load_benchmark__invalid_limit);
ATF_TEST_CASE_BODY(load_benchmark__invalid_limit)
{
    engine::register_tools();
    atf::utils::create_file("limit.lua",
                            "benchmark = {tool = 'forest', memlimit = 0}\n");
    ATF_REQUIRE_THROW_RE(
        engine::load_error, "Invalid memory limit 0",
        engine::load_benchmark(fs::path("limit.lua"),
                               engine::config_builder().build(), start_time));
}


ATF_TEST_CASE_WITHOUT_HEAD(normalize_output_path);
ATF_TEST_CASE_BODY(normalize_output_path)
{
    fs::mkdir_p(fs::path("existing"), 0755);
    ATF_REQUIRE_EQ("existing/", engine::normalize_output_path("existing"));
    ATF_REQUIRE_EQ("existing/", engine::normalize_output_path("existing/"));
    ATF_REQUIRE_EQ("existing/", engine::normalize_output_path("existing///"));
    ATF_REQUIRE_EQ("results/", engine::normalize_output_path("results/"));
    ATF_REQUIRE_EQ("prefix-", engine::normalize_output_path("prefix-"));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, load_benchmark__complete);
    ATF_ADD_TEST_CASE(tcs, load_benchmark__overrides);
    ATF_ADD_TEST_CASE(tcs, load_benchmark__selection);
    ATF_ADD_TEST_CASE(tcs, load_benchmark__empty_selection);
    ATF_ADD_TEST_CASE(tcs, load_benchmark__syntax_error);
    ATF_ADD_TEST_CASE(tcs, load_benchmark__missing_table);
    ATF_ADD_TEST_CASE(tcs, load_benchmark__unknown_tool);
    ATF_ADD_TEST_CASE(tcs, load_benchmark__bad_types);
    ATF_ADD_TEST_CASE(tcs, load_benchmark__invalid_limit);
    ATF_ADD_TEST_CASE(tcs, normalize_output_path);
}
