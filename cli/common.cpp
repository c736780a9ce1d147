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

#include "cli/common.hpp"

#include <vector>

#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/parser.ipp"
#include "utils/format/macros.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.ipp"
#include "utils/text/exceptions.hpp"
#include "utils/text/operations.ipp"

namespace cmdline = utils::cmdline;
namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace text = utils::text;


/// Option to select the run definitions to execute.
const cmdline::string_option cli::rundefinition_option(
    'r', "rundefinition",
    "Execute only the specified run definition; can be repeated",
    "name");


/// Option to select the task sets to execute.
const cmdline::string_option cli::tasks_option(
    't', "tasks",
    "Execute only the specified set of tasks; can be repeated",
    "name");


/// Option to override the name of the benchmark.
const cmdline::string_option cli::name_option(
    'n', "name",
    "Name of the benchmark, used in the names of the output files",
    "name");


/// Option to specify where to store the results.
const cmdline::string_option cli::outputpath_option(
    'o', "outputpath",
    "Output prefix for the generated results; a directory must end with '/'",
    "path", "results/");


/// Option to override the time limit of the runs.
const cmdline::int_option cli::timelimit_option(
    'T', "timelimit",
    "Time limit in seconds for each run; -1 to disable",
    "seconds");


/// Option to override the memory limit of the runs.
const cmdline::int_option cli::memorylimit_option(
    'M', "memorylimit",
    "Memory limit in MB for each run; -1 to disable",
    "MB");


/// Option to set the number of runs to execute in parallel.
const cmdline::int_option cli::numthreads_option(
    'N', "numOfThreads",
    "Number of runs to execute in parallel",
    "n");


/// Option to override the number of cores available to each run.
const cmdline::int_option cli::limitcores_option(
    'c', "limitCores",
    "Number of cores each run may use; -1 to disable",
    "n");


/// Option to set the maximum size of the log files.
const cmdline::int_option cli::maxlogfilesize_option(
    "maxLogfileSize",
    "Shrink log files larger than this size in MB; -1 to disable",
    "MB", "20");


/// Option to commit the results to git.
const cmdline::bool_option cli::commit_option(
    "commit",
    "If the output path is a git repository without local changes, add and "
    "commit the result files");


/// Option to set the message of the results commit.
const cmdline::string_option cli::message_option(
    "message",
    "Commit message if --commit is used",
    "text", "Results for benchmark run");


/// Option to set the start time of the benchmarks.
const cmdline::string_option cli::starttime_option(
    "startTime",
    "Start time of the benchmark, used in the names of the output files",
    "'YYYY-MM-DD hh:mm'");


/// Option to enable debugging output.
const cmdline::bool_option cli::debug_option(
    'd', "debug",
    "Print debugging output to stderr");


/// Option to print the version and exit.
const cmdline::bool_option cli::version_option(
    "version",
    "Print the version of the program and exit");


/// Gets the options understood by vbench.
///
/// \return The collection of all options.
cmdline::options_vector
cli::all_options(void)
{
    cmdline::options_vector options;
    options.push_back(&rundefinition_option);
    options.push_back(&tasks_option);
    options.push_back(&name_option);
    options.push_back(&outputpath_option);
    options.push_back(&timelimit_option);
    options.push_back(&memorylimit_option);
    options.push_back(&numthreads_option);
    options.push_back(&limitcores_option);
    options.push_back(&maxlogfilesize_option);
    options.push_back(&commit_option);
    options.push_back(&message_option);
    options.push_back(&starttime_option);
    options.push_back(&debug_option);
    options.push_back(&version_option);
    return options;
}


/// Parses the start time given in the command line.
///
/// \param raw_value The text given by the user, as 'YYYY-MM-DD hh:mm'.
///
/// \return The timestamp, in local time.
///
/// \throw cmdline::usage_error If the value is malformed.
datetime::timestamp
cli::parse_start_time(const std::string& raw_value)
{
    const std::string error_message = F("Invalid start time '%s'; must be "
                                        "in the format 'YYYY-MM-DD hh:mm'") %
        raw_value;

    const std::vector< std::string > parts = text::split(
        text::strip(raw_value), ' ');
    if (parts.size() != 2)
        throw cmdline::usage_error(error_message);
    const std::vector< std::string > date = text::split(parts[0], '-');
    const std::vector< std::string > time = text::split(parts[1], ':');
    if (date.size() != 3 || time.size() != 2)
        throw cmdline::usage_error(error_message);

    int year, month, day, hour, minute;
    try {
        year = text::to_type< int >(date[0]);
        month = text::to_type< int >(date[1]);
        day = text::to_type< int >(date[2]);
        hour = text::to_type< int >(time[0]);
        minute = text::to_type< int >(time[1]);
    } catch (const text::value_error& unused_error) {
        throw cmdline::usage_error(error_message);
    }
    if (year < 1970 || month < 1 || month > 12 || day < 1 || day > 31 ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59)
        throw cmdline::usage_error(error_message);

    // mktime(3) silently normalizes out-of-range days like February 31st.
    const datetime::timestamp start_time = datetime::timestamp::from_values(
        year, month, day, hour, minute, 0);
    if (text::to_type< int >(start_time.strftime("%m")) != month ||
        text::to_type< int >(start_time.strftime("%d")) != day)
        throw cmdline::usage_error(error_message);
    return start_time;
}


namespace {


/// Gets a limit from the command line.
///
/// \param cmdline The parsed command line.
/// \param option The option holding the limit.
/// \param builder The configuration to update.
/// \param setter The method of the builder that sets the limit.
///
/// \throw cmdline::usage_error If the limit is neither positive nor -1.
static void
set_limit(const cmdline::parsed_cmdline& cmdline,
          const cmdline::int_option& option, engine::config_builder& builder,
          engine::config_builder& (engine::config_builder::* setter)(const int))
{
    if (!cmdline.has_option(option.long_name()))
        return;
    const int value = cmdline.get_option< cmdline::int_option >(
        option.long_name());
    if (value != -1 && value <= 0)
        throw cmdline::usage_error(F("Invalid value %s for --%s; must be "
                                     "positive or -1") % value %
                                   option.long_name());
    (builder.*setter)(value);
}


}  // anonymous namespace


/// Builds the configuration of the program from the command line.
///
/// \param cmdline The parsed command line.
///
/// \return The configuration.
///
/// \throw cmdline::usage_error If the command line is invalid; all missing
///     or non-regular benchmark files are reported at once.
engine::config
cli::config_from_cmdline(const cmdline::parsed_cmdline& cmdline)
{
    if (cmdline.arguments().empty())
        throw cmdline::usage_error("No benchmark files specified");

    engine::config_builder builder;
    std::vector< std::string > missing;
    for (cmdline::args_vector::const_iterator iter =
             cmdline.arguments().begin(); iter != cmdline.arguments().end();
         ++iter) {
        const fs::path file(*iter);
        if (!fs::is_regular_file(file))
            missing.push_back(*iter);
        else
            builder.add_benchmark_file(file);
    }
    if (!missing.empty())
        throw cmdline::usage_error(F("File(s) not found: %s") %
                                   text::join(missing, ", "));

    const std::vector< std::string > run_definitions =
        cmdline.get_multi_option< cmdline::string_option >(
            rundefinition_option.long_name());
    for (std::vector< std::string >::const_iterator iter =
             run_definitions.begin(); iter != run_definitions.end(); ++iter)
        builder.add_run_definition(*iter);

    const std::vector< std::string > task_sets =
        cmdline.get_multi_option< cmdline::string_option >(
            tasks_option.long_name());
    for (std::vector< std::string >::const_iterator iter = task_sets.begin();
         iter != task_sets.end(); ++iter)
        builder.add_task_set(*iter);

    if (cmdline.has_option(name_option.long_name()))
        builder.set_name(cmdline.get_option< cmdline::string_option >(
            name_option.long_name()));
    const std::string output_path = cmdline.get_option<
        cmdline::string_option >(outputpath_option.long_name());
    if (output_path.empty())
        throw cmdline::usage_error(F("Invalid empty value for --%s") %
                                   outputpath_option.long_name());
    builder.set_output_path(output_path);

    set_limit(cmdline, timelimit_option, builder,
              &engine::config_builder::set_time_limit);
    set_limit(cmdline, memorylimit_option, builder,
              &engine::config_builder::set_memory_limit);
    set_limit(cmdline, limitcores_option, builder,
              &engine::config_builder::set_core_limit);
    set_limit(cmdline, maxlogfilesize_option, builder,
              &engine::config_builder::set_max_logfile_size);

    if (cmdline.has_option(numthreads_option.long_name())) {
        const int threads = cmdline.get_option< cmdline::int_option >(
            numthreads_option.long_name());
        if (threads <= 0)
            throw cmdline::usage_error(F("Invalid value %s for --%s; must be "
                                         "positive") % threads %
                                       numthreads_option.long_name());
        builder.set_num_threads(threads);
    }

    builder.set_commit(cmdline.has_option(commit_option.long_name()));
    builder.set_commit_message(cmdline.get_option< cmdline::string_option >(
        message_option.long_name()));

    if (cmdline.has_option(starttime_option.long_name()))
        builder.set_start_time(parse_start_time(
            cmdline.get_option< cmdline::string_option >(
                starttime_option.long_name())));

    builder.set_debug(cmdline.has_option(debug_option.long_name()));
    return builder.build();
}
