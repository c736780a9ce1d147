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

#include "engine/config.hpp"

#include "utils/optional.ipp"
#include "utils/sanity.hpp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;

using utils::none;
using utils::optional;


/// Internal implementation of the config class.
struct engine::config::impl {
    /// Benchmark definition files, in execution order.
    std::vector< fs::path > benchmark_files;

    /// Names of the run definitions to execute; empty means all.
    std::vector< std::string > run_definitions;

    /// Names of the task sets to execute; empty means all.
    std::vector< std::string > task_sets;

    /// Name of the benchmark, overriding the file name.
    optional< std::string > name;

    /// Directory (or prefix) for the output files.
    std::string output_path;

    /// Time limit in seconds.
    optional< int > time_limit;

    /// Memory limit in megabytes.
    optional< int > memory_limit;

    /// Number of runs to execute in parallel.
    optional< int > num_threads;

    /// Limit on the number of cores per run.
    optional< int > core_limit;

    /// Maximum size of a log file in megabytes; none means unlimited.
    optional< int > max_logfile_size;

    /// Whether to commit the results into a git repository.
    bool commit;

    /// Message for the commit of the results.
    std::string commit_message;

    /// Start time to use instead of the current time.
    optional< datetime::timestamp > start_time;

    /// Whether debug output was requested.
    bool debug;

    /// Constructor with the default values.
    impl(void) :
        output_path("results/"),
        max_logfile_size(20),
        commit(false),
        commit_message("Results for benchmark run"),
        debug(false)
    {
    }
};


/// Constructs a new config from its internal data.
///
/// \param pimpl_ The internal data; ownership is shared.
engine::config::config(std::shared_ptr< impl > pimpl_) :
    _pimpl(pimpl_)
{
}


/// Destructor.
engine::config::~config(void)
{
}


/// \return The benchmark definition files, in execution order.
const std::vector< fs::path >&
engine::config::benchmark_files(void) const
{
    return _pimpl->benchmark_files;
}


/// \return The names of the selected run definitions; empty means all.
const std::vector< std::string >&
engine::config::run_definitions(void) const
{
    return _pimpl->run_definitions;
}


/// \return The names of the selected task sets; empty means all.
const std::vector< std::string >&
engine::config::task_sets(void) const
{
    return _pimpl->task_sets;
}


/// \return The user-provided name of the benchmark, if any.
const optional< std::string >&
engine::config::name(void) const
{
    return _pimpl->name;
}


/// \return The output path as given by the user.  See
/// engine::normalize_output_path() for its canonical form.
const std::string&
engine::config::output_path(void) const
{
    return _pimpl->output_path;
}


/// \return The time limit in seconds, if any.
const optional< int >&
engine::config::time_limit(void) const
{
    return _pimpl->time_limit;
}


/// \return The memory limit in megabytes, if any.
const optional< int >&
engine::config::memory_limit(void) const
{
    return _pimpl->memory_limit;
}


/// \return The number of parallel runs, if any.
const optional< int >&
engine::config::num_threads(void) const
{
    return _pimpl->num_threads;
}


/// \return The core limit, if any.
const optional< int >&
engine::config::core_limit(void) const
{
    return _pimpl->core_limit;
}


/// \return The maximum size of log files in megabytes; none if unlimited.
const optional< int >&
engine::config::max_logfile_size(void) const
{
    return _pimpl->max_logfile_size;
}


/// \return Whether to commit the results into a git repository.
bool
engine::config::commit(void) const
{
    return _pimpl->commit;
}


/// \return The message for the commit of the results.
const std::string&
engine::config::commit_message(void) const
{
    return _pimpl->commit_message;
}


/// \return The start time to use instead of the current time, if any.
const optional< datetime::timestamp >&
engine::config::start_time(void) const
{
    return _pimpl->start_time;
}


/// \return Whether debug output was requested.
bool
engine::config::debug(void) const
{
    return _pimpl->debug;
}


/// Constructor.
engine::config_builder::config_builder(void) :
    _data(new config::impl())
{
}


/// Destructor.
engine::config_builder::~config_builder(void)
{
}


/// Appends a benchmark definition file.
///
/// \param file The file to append.
///
/// \return A reference to this builder.
engine::config_builder&
engine::config_builder::add_benchmark_file(const fs::path& file)
{
    _data->benchmark_files.push_back(file);
    return *this;
}


/// Selects a run definition for execution.
///
/// \param name The name of the run definition.
///
/// \return A reference to this builder.
engine::config_builder&
engine::config_builder::add_run_definition(const std::string& name)
{
    _data->run_definitions.push_back(name);
    return *this;
}


/// Selects a task set for execution.
///
/// \param name The name of the task set.
///
/// \return A reference to this builder.
engine::config_builder&
engine::config_builder::add_task_set(const std::string& name)
{
    _data->task_sets.push_back(name);
    return *this;
}


/// Sets the name of the benchmark.
///
/// \param name The name to set.
///
/// \return A reference to this builder.
engine::config_builder&
engine::config_builder::set_name(const std::string& name)
{
    _data->name = name;
    return *this;
}


/// Sets the output path.
///
/// \param path The output path, as given by the user.  Cannot be empty.
///
/// \return A reference to this builder.
engine::config_builder&
engine::config_builder::set_output_path(const std::string& path)
{
    PRE(!path.empty());
    _data->output_path = path;
    return *this;
}


/// Sets the time limit.
///
/// \param seconds The limit in seconds, or -1 to disable it.
///
/// \return A reference to this builder.
engine::config_builder&
engine::config_builder::set_time_limit(const int seconds)
{
    _data->time_limit = seconds;
    return *this;
}


/// Sets the memory limit.
///
/// \param megabytes The limit in megabytes, or -1 to disable it.
///
/// \return A reference to this builder.
engine::config_builder&
engine::config_builder::set_memory_limit(const int megabytes)
{
    _data->memory_limit = megabytes;
    return *this;
}


/// Sets the number of runs to execute in parallel.
///
/// \param threads The number of runs; must be positive.
///
/// \return A reference to this builder.
engine::config_builder&
engine::config_builder::set_num_threads(const int threads)
{
    PRE(threads > 0);
    _data->num_threads = threads;
    return *this;
}


/// Sets the core limit.
///
/// \param cores The number of cores, or -1 to disable the limit.
///
/// \return A reference to this builder.
engine::config_builder&
engine::config_builder::set_core_limit(const int cores)
{
    _data->core_limit = cores;
    return *this;
}


/// Sets the maximum size of log files.
///
/// \param megabytes The size in megabytes, or -1 to keep log files intact.
///
/// \return A reference to this builder.
engine::config_builder&
engine::config_builder::set_max_logfile_size(const int megabytes)
{
    if (megabytes == -1)
        _data->max_logfile_size = none;
    else
        _data->max_logfile_size = megabytes;
    return *this;
}


/// Sets whether to commit the results into a git repository.
///
/// \param commit Whether to commit.
///
/// \return A reference to this builder.
engine::config_builder&
engine::config_builder::set_commit(const bool commit)
{
    _data->commit = commit;
    return *this;
}


/// Sets the message for the commit of the results.
///
/// \param message The commit message.
///
/// \return A reference to this builder.
engine::config_builder&
engine::config_builder::set_commit_message(const std::string& message)
{
    _data->commit_message = message;
    return *this;
}


/// Sets the start time of the benchmarks.
///
/// \param start_time The start time.
///
/// \return A reference to this builder.
engine::config_builder&
engine::config_builder::set_start_time(const datetime::timestamp& start_time)
{
    _data->start_time = start_time;
    return *this;
}


/// Sets whether debug output was requested.
///
/// \param debug Whether debug output was requested.
///
/// \return A reference to this builder.
engine::config_builder&
engine::config_builder::set_debug(const bool debug)
{
    _data->debug = debug;
    return *this;
}


/// Creates a new config object from the accumulated data.
///
/// The builder can be reused after this call; the built object does not
/// share state with it.
///
/// \return The built config.
engine::config
engine::config_builder::build(void) const
{
    return config(std::shared_ptr< config::impl >(
        new config::impl(*_data)));
}
