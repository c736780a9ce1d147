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

#include "model/benchmark.hpp"

#include "utils/format/macros.hpp"
#include "utils/sanity.hpp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;


/// Internal implementation of a benchmark.
struct model::benchmark::impl {
    /// Name of the benchmark.
    std::string name;

    /// Name of the tool adapter used by the benchmark.
    std::string tool_name;

    /// Path to the file that defined the benchmark.
    fs::path definition_file;

    /// Task sets selected for execution.
    std::vector< task_set > task_sets;

    /// Run sets selected for execution.
    std::vector< run_set > run_sets;

    /// Limits for every run.
    resource_limits limits;

    /// Number of runs to execute in parallel.
    int threads;

    /// Tool options common to all runs.
    std::vector< std::string > options;

    /// Moment in which the benchmark was started.
    datetime::timestamp start_time;

    /// Prefix of all the output files of the benchmark.
    std::string output_base;

    /// Constructor.
    ///
    /// \param name_ Name of the benchmark.
    /// \param tool_name_ Name of the tool adapter.
    /// \param definition_file_ Path to the file that defined the benchmark.
    /// \param task_sets_ Task sets selected for execution.
    /// \param run_sets_ Run sets selected for execution.
    /// \param limits_ Limits for every run.
    /// \param threads_ Number of runs to execute in parallel.
    /// \param options_ Tool options common to all runs.
    /// \param start_time_ Moment in which the benchmark was started.
    /// \param output_base_ Prefix of all the output files.
    impl(const std::string& name_, const std::string& tool_name_,
         const fs::path& definition_file_,
         const std::vector< task_set >& task_sets_,
         const std::vector< run_set >& run_sets_,
         const resource_limits& limits_, const int threads_,
         const std::vector< std::string >& options_,
         const datetime::timestamp& start_time_,
         const std::string& output_base_) :
        name(name_),
        tool_name(tool_name_),
        definition_file(definition_file_),
        task_sets(task_sets_),
        run_sets(run_sets_),
        limits(limits_),
        threads(threads_),
        options(options_),
        start_time(start_time_),
        output_base(output_base_)
    {
    }
};


/// Constructs a new benchmark.
///
/// \param name_ Name of the benchmark; cannot be empty.
/// \param tool_name_ Name of the tool adapter used by the benchmark.
/// \param definition_file_ Path to the file that defined the benchmark.
/// \param task_sets_ Task sets selected for execution.
/// \param run_sets_ Run sets selected for execution.
/// \param limits_ Limits for every run.
/// \param threads_ Number of runs to execute in parallel; must be positive.
/// \param options_ Tool options common to all runs.
/// \param start_time_ Moment in which the benchmark was started.
/// \param output_base_ Prefix of all the output files of the benchmark,
///     including the output directory.
model::benchmark::benchmark(const std::string& name_,
                            const std::string& tool_name_,
                            const fs::path& definition_file_,
                            const std::vector< task_set >& task_sets_,
                            const std::vector< run_set >& run_sets_,
                            const resource_limits& limits_,
                            const int threads_,
                            const std::vector< std::string >& options_,
                            const datetime::timestamp& start_time_,
                            const std::string& output_base_) :
    _pimpl(new impl(name_, tool_name_, definition_file_, task_sets_,
                    run_sets_, limits_, threads_, options_, start_time_,
                    output_base_))
{
    PRE(!name_.empty());
    PRE(threads_ > 0);
    PRE(!output_base_.empty());
}


/// Destructor.
model::benchmark::~benchmark(void)
{
}


/// \return The name of the benchmark.
const std::string&
model::benchmark::name(void) const
{
    return _pimpl->name;
}


/// \return The name of the tool adapter used by the benchmark.
const std::string&
model::benchmark::tool_name(void) const
{
    return _pimpl->tool_name;
}


/// \return The path to the file that defined the benchmark.
const fs::path&
model::benchmark::definition_file(void) const
{
    return _pimpl->definition_file;
}


/// \return The task sets selected for execution.
const std::vector< model::task_set >&
model::benchmark::task_sets(void) const
{
    return _pimpl->task_sets;
}


/// \return The run sets selected for execution.
const std::vector< model::run_set >&
model::benchmark::run_sets(void) const
{
    return _pimpl->run_sets;
}


/// \return The limits for every run.
const model::resource_limits&
model::benchmark::limits(void) const
{
    return _pimpl->limits;
}


/// \return The number of runs to execute in parallel.
int
model::benchmark::threads(void) const
{
    return _pimpl->threads;
}


/// \return The tool options common to all runs.
const std::vector< std::string >&
model::benchmark::options(void) const
{
    return _pimpl->options;
}


/// \return The moment in which the benchmark was started.
const datetime::timestamp&
model::benchmark::start_time(void) const
{
    return _pimpl->start_time;
}


/// Returns the prefix of all the output files of the benchmark.
///
/// The prefix includes the output directory, the name of the benchmark and
/// its start time, as in "results/foo.2015-01-01_1200".
///
/// \return The prefix as a string, as it need not name an existing file.
const std::string&
model::benchmark::output_base(void) const
{
    return _pimpl->output_base;
}


/// \return The folder that receives the log files of all runs, including
/// a trailing separator.
std::string
model::benchmark::log_folder(void) const
{
    return _pimpl->output_base + ".logfiles/";
}


/// Computes the log file of a run.
///
/// \param run_set_name The name of the run set the run belongs to.
/// \param task The input file of the run.
///
/// \return The path to the log file.
fs::path
model::benchmark::log_file(const std::string& run_set_name,
                           const fs::path& task) const
{
    return fs::path(F("%s%s.%s.log") % log_folder() % run_set_name %
                    task.leaf_name());
}


/// \return The total number of runs of the benchmark.
std::size_t
model::benchmark::num_runs(void) const
{
    std::size_t count = 0;
    for (std::vector< run_set >::const_iterator iter =
             _pimpl->run_sets.begin(); iter != _pimpl->run_sets.end(); ++iter)
        count += (*iter).runs().size();
    return count;
}
