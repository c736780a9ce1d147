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

#include <atomic>
#include <cstdlib>
#include <mutex>

#include "engine/benchmark_file.hpp"
#include "engine/exceptions.hpp"
#include "engine/git.hpp"
#include "engine/local_executor.hpp"
#include "engine/output_handler.hpp"
#include "model/benchmark.hpp"
#include "utils/datetime.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/auto_cleaners.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;


/// Internal implementation of the orchestrator.
struct engine::orchestrator::impl : utils::noncopyable {
    /// Whether stop() has been called.  Never reset.
    std::atomic< bool > interrupted;

    /// Number of benchmark files executed to completion.
    std::atomic< std::size_t > completed;

    /// Protects current_executor.
    std::mutex mutex;

    /// The executor of the benchmarks, once loaded.
    std::shared_ptr< executor > current_executor;

    /// Constructor.
    impl(void) :
        interrupted(false),
        completed(0)
    {
    }

    /// Commits the results of a benchmark to git.
    ///
    /// Failures are reported as warnings only.
    ///
    /// \param config The configuration of the program.
    /// \param benchmark The executed benchmark.
    /// \param handler The handler that recorded the results.
    void
    commit_results(const config& config, const model::benchmark& benchmark,
                   const output_handler& handler)
    {
        const fs::path output_dir =
            fs::path(benchmark.output_base()).branch_path();
        try {
            git::add_files_to_repository(
                output_dir, handler.all_created_files(),
                config.commit_message() + "\n\n" + handler.description());
        } catch (const std::runtime_error& e) {
            LW(F("Could not add files to git repository: %s") % e.what());
        }
    }

    /// Executes a single benchmark file.
    ///
    /// \param config The configuration of the program.
    /// \param file The benchmark file to execute.
    ///
    /// \return The code returned by the executor.
    ///
    /// \throw existing_results_error If the results of the benchmark already
    ///     exist.
    /// \throw load_error If the benchmark file is invalid.
    int
    execute_file(const config& config, const fs::path& file)
    {
        const datetime::timestamp start_time = config.start_time() ?
            config.start_time().get() : datetime::timestamp::now();
        const model::benchmark benchmark = load_benchmark(file, config,
                                                          start_time);

        const fs::path log_folder(benchmark.log_folder());
        if (fs::exists(log_folder))
            throw existing_results_error(log_folder);

        current_executor->init(config, benchmark);
        output_handler handler(benchmark,
                               current_executor->get_system_info());

        int exit_code;
        {
            fs::auto_rmdir log_folder_cleaner(log_folder);
            LI(F("Executing benchmark %s with %s runs") % benchmark.name() %
               benchmark.num_runs());
            exit_code = current_executor->execute_benchmark(benchmark,
                                                            handler);
        }

        if (config.commit() && !interrupted)
            commit_results(config, benchmark, handler);
        return exit_code;
    }
};


/// Constructs a new orchestrator.
engine::orchestrator::orchestrator(void) :
    _pimpl(new impl())
{
}


/// Destructor.
engine::orchestrator::~orchestrator(void)
{
}


/// Creates the executor that runs the benchmarks.
///
/// \return A new executor; the local executor unless overridden.
std::shared_ptr< engine::executor >
engine::orchestrator::load_executor(void)
{
    return std::shared_ptr< executor >(new local_executor());
}


/// Executes all the benchmark files of the configuration.
///
/// \param config The configuration of the program.
///
/// \return The combination of the codes returned by the executor for every
/// benchmark; 0 if all runs could be executed.
///
/// \throw existing_results_error If the results of a benchmark already
///     exist.  The benchmarks that follow are not executed.
/// \throw load_error If a benchmark file is invalid.
/// \throw engine::error If the executor fails.
int
engine::orchestrator::start(const config& config)
{
    {
        std::shared_ptr< executor > new_executor = load_executor();
        INV(new_executor.get() != NULL);
        std::lock_guard< std::mutex > lock(_pimpl->mutex);
        _pimpl->current_executor = new_executor;
        if (_pimpl->interrupted)
            _pimpl->current_executor->stop();
    }

    int exit_code = EXIT_SUCCESS;
    const std::vector< fs::path >& files = config.benchmark_files();
    for (std::vector< fs::path >::const_iterator iter = files.begin();
         iter != files.end(); ++iter) {
        if (_pimpl->interrupted) {
            LI("Interrupted; not executing the remaining benchmarks");
            break;
        }
        exit_code |= _pimpl->execute_file(config, *iter);
        ++_pimpl->completed;
    }
    return exit_code;
}


/// Cancels the execution of the benchmarks.
///
/// Subsequent calls have no effect.  This can be called from any thread.
void
engine::orchestrator::stop(void)
{
    if (_pimpl->interrupted.exchange(true))
        return;

    LI("Stopping the execution of the benchmarks");
    std::lock_guard< std::mutex > lock(_pimpl->mutex);
    if (_pimpl->current_executor.get() != NULL)
        _pimpl->current_executor->stop();
}


/// Checks whether the execution has been cancelled.
///
/// \return True if stop() has been called.
bool
engine::orchestrator::interrupted(void) const
{
    return _pimpl->interrupted;
}


/// Counts the benchmark files executed to completion so far.
///
/// \return A number of benchmark files.
std::size_t
engine::orchestrator::completed_benchmarks(void) const
{
    return _pimpl->completed;
}
