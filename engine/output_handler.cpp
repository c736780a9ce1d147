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

#include "engine/output_handler.hpp"

#include <cstdint>
#include <fstream>
#include <map>
#include <mutex>

#include "engine/exceptions.hpp"
#include "model/category.hpp"
#include "store/backend.hpp"
#include "store/transaction.hpp"
#include "utils/datetime.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/operations.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"
#include "utils/text/operations.ipp"
#include "utils/text/table.hpp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace text = utils::text;

using utils::optional;


namespace {


/// Number of categories a run can be classified into.
static const int num_categories = model::category_missing + 1;


/// Accumulated statistics of a collection of runs.
struct statistics {
    /// Number of runs per category.
    int counts[num_categories];

    /// Total CPU time of the runs.
    datetime::delta cpu_time;

    /// Total wall time of the runs.
    datetime::delta wall_time;

    /// Constructs empty statistics.
    statistics(void)
    {
        for (int i = 0; i < num_categories; i++)
            counts[i] = 0;
    }

    /// Accounts for a new run.
    ///
    /// \param category The category of the run.
    /// \param result The outcome of the run.
    void
    add(const model::category category, const model::run_result& result)
    {
        counts[category]++;
        cpu_time += result.cpu_time();
        wall_time += result.wall_time();
    }

    /// \return The total number of runs.
    int
    total(void) const
    {
        int count = 0;
        for (int i = 0; i < num_categories; i++)
            count += counts[i];
        return count;
    }
};


/// Formats a limit for the report.
///
/// \param limit The limit, if any.
/// \param unit The unit of the limit.
///
/// \return The textual representation of the limit.
static std::string
format_limit(const optional< int >& limit, const char* unit)
{
    if (limit)
        return F("%s %s") % limit.get() % unit;
    else
        return "-";
}


/// Formats a time delta in seconds.
///
/// \param delta The time to format.
///
/// \return The seconds with two decimals.
static std::string
format_seconds(const datetime::delta& delta)
{
    return F("%.2s") % delta.to_seconds();
}


/// Formats the line with the counts of each category.
///
/// \param stats The statistics to format.
///
/// \return A single line of text.
static std::string
format_counts(const statistics& stats)
{
    std::vector< std::string > parts;
    for (int i = 0; i < num_categories; i++)
        parts.push_back(F("%s %s") % stats.counts[i] %
                        model::category_name(
                            static_cast< model::category >(i)));
    return text::join(parts, ", ");
}


}  // anonymous namespace


/// Internal implementation of the output_handler.
struct engine::output_handler::impl : utils::noncopyable {
    /// The benchmark being recorded.
    model::benchmark benchmark;

    /// Properties of the host.
    system_info sysinfo;

    /// Version of the tool, as reported by output_before_benchmark().
    std::string tool_version;

    /// Path to the text report.
    fs::path report_file;

    /// Path to the results database.
    fs::path database_file;

    /// The results database; none until output_before_benchmark().
    optional< store::backend > backend;

    /// Identifier of the benchmark in the database.
    int64_t benchmark_id;

    /// Identifiers of the run sets in the database, by name.
    std::map< std::string, int64_t > run_set_ids;

    /// Results of the runs of the current run set, keyed by log file.
    std::map< fs::path, model::run_result > results;

    /// Statistics of the whole benchmark.
    statistics total_stats;

    /// Files created so far.
    std::set< fs::path > created_files;

    /// Protects the members modified by output_after_run().
    std::mutex mutex;

    /// Constructor.
    ///
    /// \param benchmark_ The benchmark being recorded.
    /// \param sysinfo_ Properties of the host.
    impl(const model::benchmark& benchmark_, const system_info& sysinfo_) :
        benchmark(benchmark_),
        sysinfo(sysinfo_),
        report_file(benchmark_.output_base() + ".txt"),
        database_file(benchmark_.output_base() + ".results.db"),
        benchmark_id(0)
    {
    }

    /// Appends lines to the text report.
    ///
    /// \param lines The lines to append.
    ///
    /// \throw engine::error If the report cannot be written.
    void
    append_report(const std::vector< std::string >& lines)
    {
        std::ofstream output(report_file.c_str(), std::ios::app);
        if (!output)
            throw engine::error(F("Cannot write report %s") % report_file);
        for (std::vector< std::string >::const_iterator iter = lines.begin();
             iter != lines.end(); ++iter)
            output << *iter << '\n';
        created_files.insert(report_file);
    }
};


/// Constructs a new output handler.
///
/// No files are created until output_before_benchmark() is called.
///
/// \param benchmark The benchmark to record.
/// \param sysinfo Properties of the host that runs the benchmark.
engine::output_handler::output_handler(const model::benchmark& benchmark,
                                       const system_info& sysinfo) :
    _pimpl(new impl(benchmark, sysinfo))
{
}


/// Destructor.
engine::output_handler::~output_handler(void)
{
}


/// Writes the header of the report and records the benchmark.
///
/// \param tool_version The version of the tool, possibly empty.
///
/// \throw engine::error If the report cannot be written.
/// \throw store::error If the database cannot be written.
/// \throw fs::error If the output directory cannot be created.
void
engine::output_handler::output_before_benchmark(
    const std::string& tool_version)
{
    PRE(!_pimpl->backend);
    const model::benchmark& benchmark = _pimpl->benchmark;
    _pimpl->tool_version = tool_version;

    const fs::path output_dir = _pimpl->report_file.branch_path();
    if (!fs::exists(output_dir))
        fs::mkdir_p(output_dir, 0755);

    const system_info& sysinfo = _pimpl->sysinfo;
    std::vector< std::string > lines;
    lines.push_back(F("BENCHMARK INFORMATION"));
    lines.push_back(F("benchmark definition:    %s") %
                    benchmark.definition_file());
    lines.push_back(F("name:                    %s") % benchmark.name());
    lines.push_back(F("run sets:                %s") %
                    benchmark.run_sets().size());
    lines.push_back(F("date:                    %s") %
                    benchmark.start_time().strftime("%Y-%m-%d %H:%M:%S"));
    lines.push_back(F("tool:                    %s %s") % benchmark.tool_name() %
                    tool_version);
    lines.push_back(F("time limit:              %s") %
                    format_limit(benchmark.limits().time_limit(), "s"));
    lines.push_back(F("memory limit:            %s") %
                    format_limit(benchmark.limits().memory_limit(), "MB"));
    lines.push_back(F("core limit:              %s") %
                    format_limit(benchmark.limits().core_limit(), "cores"));
    lines.push_back(F("options:                 %s") %
                    text::join(benchmark.options(), " "));
    lines.push_back("");
    lines.push_back(F("SYSTEM INFORMATION"));
    lines.push_back(F("host:                    %s") % sysinfo.hostname);
    lines.push_back(F("os:                      %s") % sysinfo.os);
    lines.push_back(F("cpu:                     %s") % sysinfo.cpu_model);
    lines.push_back(F("cores:                   %s") % sysinfo.cores);
    lines.push_back(F("memory:                  %s MB") %
                    (sysinfo.memory / (1024 * 1024)));
    lines.push_back("");
    _pimpl->append_report(lines);

    std::map< std::string, std::string > properties;
    properties["hostname"] = sysinfo.hostname;
    properties["os"] = sysinfo.os;
    properties["cpu_model"] = sysinfo.cpu_model;
    properties["cores"] = F("%s") % sysinfo.cores;
    properties["memory"] = F("%s") % sysinfo.memory;

    _pimpl->backend = store::backend::open_rw(_pimpl->database_file);
    _pimpl->created_files.insert(_pimpl->database_file);
    store::transaction tx = _pimpl->backend.get().start();
    _pimpl->benchmark_id = tx.put_benchmark(benchmark, tool_version,
                                            properties);
    tx.commit();
}


/// Records the start of a run set.
///
/// \param run_set The run set about to be executed.
///
/// \throw store::error If the database cannot be written.
void
engine::output_handler::output_before_run_set(const model::run_set& run_set)
{
    PRE(_pimpl->backend);
    LI(F("Executing run set '%s' with %s runs") % run_set.name() %
       run_set.runs().size());

    store::transaction tx = _pimpl->backend.get().start();
    _pimpl->run_set_ids[run_set.name()] = tx.put_run_set(
        run_set, _pimpl->benchmark_id);
    tx.commit();
    _pimpl->results.clear();
}


/// Records the outcome of a run.
///
/// \param run_set The run set the run belongs to.
/// \param run The executed run.
/// \param result The outcome of the run.
///
/// \throw store::error If the database cannot be written.
void
engine::output_handler::output_after_run(const model::run_set& run_set,
                                         const model::run& run,
                                         const model::run_result& result)
{
    const model::category category = model::categorize(run.task(),
                                                       result.get_verdict());

    std::lock_guard< std::mutex > lock(_pimpl->mutex);
    PRE(_pimpl->run_set_ids.find(run_set.name()) !=
        _pimpl->run_set_ids.end());

    LI(F("%s: %s (%s)") % run.task() % result.get_verdict().str() %
       model::category_name(category));

    _pimpl->results.insert(std::make_pair(run.log_file(), result));
    if (fs::exists(run.log_file()))
        _pimpl->created_files.insert(run.log_file());

    store::transaction tx = _pimpl->backend.get().start();
    tx.put_run(run, result, category, _pimpl->run_set_ids[run_set.name()]);
    tx.commit();
}


/// Writes the table of results of a run set to the report.
///
/// Runs without a recorded result are left out of the table.
///
/// \param run_set The run set that was executed.
///
/// \throw engine::error If the report cannot be written.
void
engine::output_handler::output_after_run_set(const model::run_set& run_set)
{
    std::lock_guard< std::mutex > lock(_pimpl->mutex);

    text::table table(5);
    {
        text::table_row heading;
        heading.push_back("task");
        heading.push_back("verdict");
        heading.push_back("category");
        heading.push_back("cpu time");
        heading.push_back("wall time");
        table.add_row(heading);
    }

    statistics stats;
    for (std::vector< model::run >::const_iterator iter =
             run_set.runs().begin(); iter != run_set.runs().end(); ++iter) {
        const std::map< fs::path, model::run_result >::const_iterator
            result_iter = _pimpl->results.find((*iter).log_file());
        if (result_iter == _pimpl->results.end())
            continue;
        const model::run_result& result = (*result_iter).second;
        const model::category category = model::categorize(
            (*iter).task(), result.get_verdict());
        stats.add(category, result);

        text::table_row row;
        row.push_back((*iter).task().str());
        row.push_back(result.get_verdict().str());
        row.push_back(model::category_name(category));
        row.push_back(format_seconds(result.cpu_time()));
        row.push_back(format_seconds(result.wall_time()));
        table.add_row(row);
    }

    for (int i = 0; i < num_categories; i++)
        _pimpl->total_stats.counts[i] += stats.counts[i];
    _pimpl->total_stats.cpu_time += stats.cpu_time;
    _pimpl->total_stats.wall_time += stats.wall_time;

    std::vector< std::string > lines;
    lines.push_back(F("RUN SET %s (%s)") % run_set.name() %
                    text::join(run_set.options(), " "));
    const std::vector< std::string > formatted = text::format_table(table);
    lines.insert(lines.end(), formatted.begin(), formatted.end());
    lines.push_back(F("Statistics: %s runs; %s") % stats.total() %
                    format_counts(stats));
    lines.push_back(F("Total time: %s s cpu, %s s wall") %
                    format_seconds(stats.cpu_time) %
                    format_seconds(stats.wall_time));
    lines.push_back("");
    _pimpl->append_report(lines);
}


/// Writes the trailer of the report.
///
/// \param interrupted Whether the benchmark was interrupted by the user.
///
/// \throw engine::error If the report cannot be written.
void
engine::output_handler::output_after_benchmark(const bool interrupted)
{
    std::lock_guard< std::mutex > lock(_pimpl->mutex);

    std::vector< std::string > lines;
    if (interrupted)
        lines.push_back("The benchmark was interrupted by the user; some "
                        "runs may not be done.");
    lines.push_back(F("In total: %s runs; %s") % _pimpl->total_stats.total() %
                    format_counts(_pimpl->total_stats));
    _pimpl->append_report(lines);
}


/// Returns the set of files written so far.
///
/// \return The paths of the report, the database and the log files of the
/// recorded runs.
std::set< fs::path >
engine::output_handler::all_created_files(void) const
{
    std::lock_guard< std::mutex > lock(_pimpl->mutex);
    return _pimpl->created_files;
}


/// Summarizes the benchmark in free text.
///
/// \return A description suitable for a commit message.
std::string
engine::output_handler::description(void) const
{
    std::lock_guard< std::mutex > lock(_pimpl->mutex);
    const model::benchmark& benchmark = _pimpl->benchmark;

    std::vector< std::string > run_set_names;
    for (std::vector< model::run_set >::const_iterator iter =
             benchmark.run_sets().begin(); iter != benchmark.run_sets().end();
         ++iter)
        run_set_names.push_back((*iter).name());

    std::string description = F("Benchmark %s executed with %s %s") %
        benchmark.name() % benchmark.tool_name() % _pimpl->tool_version;
    description = text::strip(description);
    description += F("\nRun sets: %s") % text::join(run_set_names, ", ");
    description += F("\nResults: %s runs; %s") % _pimpl->total_stats.total() %
        format_counts(_pimpl->total_stats);
    description += F("\nHost: %s (%s)") % _pimpl->sysinfo.hostname %
        _pimpl->sysinfo.os;
    return description;
}


/// \return The path to the text report.
fs::path
engine::output_handler::report_file(void) const
{
    return _pimpl->report_file;
}


/// \return The path to the results database.
fs::path
engine::output_handler::database_file(void) const
{
    return _pimpl->database_file;
}
