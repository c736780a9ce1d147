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
#include <sys/resource.h>

#include <errno.h>
}

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <mutex>
#include <set>
#include <thread>

#include "engine/exceptions.hpp"
#include "engine/output_handler.hpp"
#include "model/run_result.hpp"
#include "utils/datetime.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/operations.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/process/child.ipp"
#include "utils/process/deadline_killer.hpp"
#include "utils/process/exceptions.hpp"
#include "utils/process/operations.hpp"
#include "utils/sanity.hpp"
#include "utils/stream.hpp"
#include "utils/text/operations.ipp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace process = utils::process;
namespace text = utils::text;

using utils::none;
using utils::optional;


/// Number of lines written to a log file before the output of the tool.
const std::size_t engine::detail::log_header_lines = 3;


namespace {


/// Group of threads that are joined when the group goes out of scope.
///
/// If spawning a thread fails, the threads spawned so far are still joined
/// before the error propagates.
class thread_joiner : utils::noncopyable {
    /// The threads spawned so far.
    std::vector< std::thread > _threads;

public:
    /// Joins all the threads.
    ~thread_joiner(void)
    {
        for (std::vector< std::thread >::iterator iter = _threads.begin();
             iter != _threads.end(); ++iter)
            (*iter).join();
    }

    /// Spawns a new thread.
    ///
    /// \param body The code to run in the thread.  Must not throw.
    template< typename Function >
    void
    spawn(Function body)
    {
        _threads.reserve(_threads.size() + 1);
        _threads.push_back(std::thread(body));
    }
};


/// Time a run may exceed its time limit in wall clock before being killed.
static const datetime::delta wall_time_grace(2, 0);


/// Marker inserted in the middle of a shrunk log file.
static const char* shrink_marker =
    "\n\n\nWARNING: THE LOG FILE WAS TOO LONG, SOME LINES IN THE MIDDLE "
    "WERE REMOVED.\n\n\n";


/// Functor to execute a tool with resource limits in a subprocess.
class run_tool {
    /// The command line to execute, including the program name.
    process::args_vector _args;

    /// Memory limit in megabytes, if any.
    optional< int > _memory_limit;

    /// CPU time limit in seconds, if any.
    optional< int > _time_limit;

    /// Sets a resource limit of the current process.
    ///
    /// \param resource The resource to limit.
    /// \param soft The soft limit.
    /// \param hard The hard limit.
    ///
    /// \throw process::system_error If the limit cannot be set.
    static void
    set_limit(const int resource, const rlim_t soft, const rlim_t hard)
    {
        struct ::rlimit limit;
        limit.rlim_cur = soft;
        limit.rlim_max = hard;
        if (::setrlimit(resource, &limit) == -1) {
            const int original_errno = errno;
            throw process::system_error("setrlimit failed", original_errno);
        }
    }

public:
    /// Constructor.
    ///
    /// \param args The command line to execute, including the program name.
    /// \param limits The resource limits to apply.
    run_tool(const process::args_vector& args,
             const model::resource_limits& limits) :
        _args(args),
        _memory_limit(limits.memory_limit()),
        _time_limit(limits.time_limit())
    {
    }

    /// Applies the limits and executes the tool.
    void
    operator()(void)
    {
        if (_memory_limit) {
            const rlim_t bytes = static_cast< rlim_t >(
                _memory_limit.get()) * 1024 * 1024;
            set_limit(RLIMIT_AS, bytes, bytes);
        }
        if (_time_limit) {
            const rlim_t seconds = static_cast< rlim_t >(_time_limit.get());
            set_limit(RLIMIT_CPU, seconds, seconds + 1);
        }

        const process::args_vector args(_args.begin() + 1, _args.end());
        process::exec(fs::path(_args[0]), args);
    }
};


/// Reads a section of a file.
///
/// \param input The stream to read from.
/// \param offset Position of the first byte to read.
/// \param length Number of bytes to read.
///
/// \return The bytes read.
static std::string
read_section(std::ifstream& input, const uint64_t offset,
             const uint64_t length)
{
    std::string buffer(static_cast< std::size_t >(length), '\0');
    input.seekg(static_cast< std::streamoff >(offset));
    input.read(&buffer[0], static_cast< std::streamsize >(length));
    buffer.resize(static_cast< std::size_t >(input.gcount()));
    return buffer;
}


}  // anonymous namespace


/// Reduces a file to its beginning and its end if it is too large.
///
/// \param file The file to shrink.
/// \param max_size The maximum size in bytes the file may have.
///
/// \throw engine::error If the file cannot be rewritten.
/// \throw fs::error If the size of the file cannot be queried.
void
engine::detail::shrink_file(const fs::path& file, const uint64_t max_size)
{
    const uint64_t size = fs::file_size(file);
    if (size <= max_size)
        return;

    LD(F("Shrinking %s from %s to %s bytes") % file % size % max_size);
    std::string head, tail;
    {
        std::ifstream input(file.c_str(), std::ios::binary);
        if (!input)
            throw engine::error(F("Cannot read %s") % file);
        head = read_section(input, 0, max_size / 2);
        tail = read_section(input, size - max_size / 2, max_size / 2);
    }

    std::ofstream output(file.c_str(), std::ios::binary | std::ios::trunc);
    if (!output)
        throw engine::error(F("Cannot write %s") % file);
    output << head << shrink_marker << tail;
}


/// Reads the output of a tool from its log file.
///
/// \param file The log file of the run.
///
/// \return The lines printed by the tool, without the header of the log.
///
/// \throw engine::error If the file cannot be read.
std::vector< std::string >
engine::detail::read_tool_output(const fs::path& file)
{
    std::ifstream input(file.c_str());
    if (!input)
        throw engine::error(F("Cannot read %s") % file);
    std::vector< std::string > lines = utils::read_lines(input);
    if (lines.size() <= log_header_lines)
        return std::vector< std::string >();
    lines.erase(lines.begin(), lines.begin() + log_header_lines);
    return lines;
}


/// Internal implementation of the local_executor.
struct engine::local_executor::impl : utils::noncopyable {
    /// Adapter of the tool being benchmarked.
    tool_ptr tool;

    /// Path to the executable of the tool.
    optional< fs::path > executable;

    /// Maximum size of a log file in bytes, if any.
    optional< uint64_t > max_logfile_size;

    /// Whether stop() has been called.
    std::atomic< bool > stopped;

    /// Whether any run could not be executed.
    std::atomic< bool > failed;

    /// Protects active_pids.
    std::mutex mutex;

    /// Process groups of the runs in progress.
    std::set< int > active_pids;

    /// Constructor.
    impl(void) :
        stopped(false),
        failed(false)
    {
    }

    /// Registers a new process group so that stop() can kill it.
    ///
    /// \param pid The process group to register.
    void
    add_active(const int pid)
    {
        std::lock_guard< std::mutex > lock(mutex);
        active_pids.insert(pid);
        if (stopped)
            process::terminate_group(pid);
    }

    /// Unregisters a process group.
    ///
    /// \param pid The process group to unregister.
    void
    remove_active(const int pid)
    {
        std::lock_guard< std::mutex > lock(mutex);
        active_pids.erase(pid);
    }

    /// Writes the header of the log file of a run.
    ///
    /// \param log_file The log file to create.
    /// \param args The command line of the run.
    void
    write_log_header(const fs::path& log_file,
                     const process::args_vector& args)
    {
        std::ofstream output(log_file.c_str(), std::ios::trunc);
        if (!output)
            throw engine::error(F("Cannot create log file %s") % log_file);
        output << text::join(args, " ") << '\n'
               << std::string(80, '-') << '\n'
               << '\n';
    }

    /// Executes a single run.
    ///
    /// \param benchmark The benchmark the run belongs to.
    /// \param run The run to execute.
    ///
    /// \return The outcome of the run.
    model::run_result
    execute_run(const model::benchmark& benchmark, const model::run& run)
    {
        const model::resource_limits& limits = benchmark.limits();

        std::vector< std::string > options = benchmark.options();
        options.insert(options.end(), run.options().begin(),
                       run.options().end());
        const process::args_vector args = tool->cmdline(
            executable.get(), options,
            std::vector< fs::path >(1, run.task()), run.property_file(),
            limits);
        INV(!args.empty());

        const fs::path log_dir = run.log_file().branch_path();
        if (!fs::exists(log_dir))
            fs::mkdir_p(log_dir, 0755);
        write_log_header(run.log_file(), args);

        LD(F("Executing %s") % text::join(args, " "));
        const datetime::timestamp start_time = datetime::timestamp::now();
        std::unique_ptr< process::child > child =
            process::child::fork_files(run_tool(args, limits),
                                       run.log_file(), run.log_file());
        add_active(child->pid());

        bool timed_out = false;
        optional< process::status > status;
        {
            std::unique_ptr< process::deadline_killer > killer;
            if (limits.time_limit())
                killer.reset(new process::deadline_killer(
                    datetime::delta(limits.time_limit().get(), 0) +
                    wall_time_grace, child->pid()));
            try {
                status = child->wait();
            } catch (...) {
                remove_active(child->pid());
                throw;
            }
            if (killer.get() != NULL)
                timed_out = killer->unschedule();
        }
        remove_active(child->pid());
        const datetime::delta wall_time =
            datetime::timestamp::now() - start_time;
        const datetime::delta cpu_time = child->cpu_time();
        if (limits.time_limit() &&
            !(cpu_time < datetime::delta(limits.time_limit().get(), 0)))
            timed_out = true;

        if (max_logfile_size)
            detail::shrink_file(run.log_file(), max_logfile_size.get());
        const std::vector< std::string > output =
            detail::read_tool_output(run.log_file());
        const model::verdict verdict = tool->determine_result(
            status.get(), output, timed_out);

        return model::run_result(status, timed_out, wall_time, cpu_time,
                                 output, verdict);
    }

    /// Executes a run and reports its result.
    ///
    /// Failures to start the run are reported as an error verdict.
    ///
    /// \param benchmark The benchmark the run belongs to.
    /// \param run_set The run set the run belongs to.
    /// \param run The run to execute.
    /// \param handler The recipient of the result.
    void
    process_run(const model::benchmark& benchmark,
                const model::run_set& run_set, const model::run& run,
                output_handler& handler)
    {
        optional< model::run_result > result;
        try {
            result = execute_run(benchmark, run);
        } catch (const std::runtime_error& e) {
            LW(F("Could not execute run for %s: %s") % run.task() % e.what());
            failed = true;
            result = model::run_result(
                none, false, datetime::delta(), datetime::delta(),
                std::vector< std::string >(),
                model::verdict::make_error(F("error (%s)") % e.what()));
        }
        handler.output_after_run(run_set, run, result.get());
    }
};


/// Constructs a new executor.
engine::local_executor::local_executor(void) :
    _pimpl(new impl())
{
}


/// Destructor.
engine::local_executor::~local_executor(void)
{
}


/// Looks up the tool of the benchmark and its executable.
///
/// \param config The configuration of the program.
/// \param benchmark The benchmark that will be executed.
///
/// \throw engine::tool_not_found_error If the tool is not supported or is
///     not installed.
void
engine::local_executor::init(const config& config,
                             const model::benchmark& benchmark)
{
    _pimpl->tool = find_tool(benchmark.tool_name());
    _pimpl->executable = _pimpl->tool->executable();
    LI(F("Using %s at %s") % _pimpl->tool->name() %
       _pimpl->executable.get());

    const std::vector< fs::path > files = _pimpl->tool->program_files(
        _pimpl->executable.get());
    for (std::vector< fs::path >::const_iterator iter = files.begin();
         iter != files.end(); ++iter)
        LD(F("Program file of %s: %s") % _pimpl->tool->name() % *iter);

    if (config.max_logfile_size())
        _pimpl->max_logfile_size = static_cast< uint64_t >(
            config.max_logfile_size().get()) * 1024 * 1024;
    else
        _pimpl->max_logfile_size = none;

    if (benchmark.limits().core_limit())
        LW(F("The core limit of %s is not enforced by the local executor") %
           benchmark.limits().core_limit().get());
}


/// Executes all the runs of a benchmark.
///
/// The runs of each run set are distributed among as many worker threads as
/// the benchmark allows.  A run set is only started once the previous one
/// has completed.
///
/// \param benchmark The benchmark to execute.
/// \param handler The recipient of the results.
///
/// \return 0 if all runs could be executed; 1 otherwise.
///
/// \throw engine::error If the results cannot be recorded.
int
engine::local_executor::execute_benchmark(const model::benchmark& benchmark,
                                          output_handler& handler)
{
    PRE(_pimpl->tool.get() != NULL);

    handler.output_before_benchmark(
        _pimpl->tool->version(_pimpl->executable.get()));

    for (std::vector< model::run_set >::const_iterator iter =
             benchmark.run_sets().begin();
         iter != benchmark.run_sets().end() && !_pimpl->stopped; ++iter) {
        const model::run_set& run_set = *iter;
        const std::vector< model::run >& runs = run_set.runs();
        handler.output_before_run_set(run_set);

        std::atomic< std::size_t > next_run(0);
        std::mutex error_mutex;
        std::exception_ptr worker_error;

        const std::size_t num_workers = std::min(
            static_cast< std::size_t >(benchmark.threads()), runs.size());
        {
            thread_joiner workers;
            for (std::size_t i = 0; i < num_workers; i++) {
                workers.spawn([&]() {
                    while (!_pimpl->stopped) {
                        const std::size_t index = next_run++;
                        if (index >= runs.size())
                            break;
                        try {
                            _pimpl->process_run(benchmark, run_set,
                                                runs[index], handler);
                        } catch (...) {
                            std::lock_guard< std::mutex > lock(error_mutex);
                            if (!worker_error)
                                worker_error = std::current_exception();
                            stop();
                        }
                    }
                });
            }
        }

        if (worker_error) {
            _pimpl->failed = true;
            try {
                std::rethrow_exception(worker_error);
            } catch (const std::runtime_error& e) {
                throw engine::error(F("Cannot record results of run set %s: "
                                      "%s") % run_set.name() % e.what());
            }
        }
        handler.output_after_run_set(run_set);
    }

    handler.output_after_benchmark(_pimpl->stopped);
    return _pimpl->failed ? EXIT_FAILURE : EXIT_SUCCESS;
}


/// Describes the local machine.
///
/// \return The properties of the host.
engine::system_info
engine::local_executor::get_system_info(void) const
{
    return probe_system_info();
}


/// Cancels the execution of the benchmark.
///
/// No new runs are started and the process groups of the active runs are
/// terminated.
void
engine::local_executor::stop(void)
{
    if (_pimpl->stopped.exchange(true))
        return;

    LI("Stopping the execution of the benchmark");
    std::lock_guard< std::mutex > lock(_pimpl->mutex);
    for (std::set< int >::const_iterator iter = _pimpl->active_pids.begin();
         iter != _pimpl->active_pids.end(); ++iter)
        process::terminate_group(*iter);
}
