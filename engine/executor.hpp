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

/// \file engine/executor.hpp
/// Interface to the mechanisms that execute the runs of a benchmark.

#if !defined(ENGINE_EXECUTOR_HPP)
#define ENGINE_EXECUTOR_HPP

#include "engine/config.hpp"
#include "engine/system_info.hpp"
#include "model/benchmark.hpp"

namespace engine {


class output_handler;


/// Abstract interface of a benchmark executor.
///
/// An executor is initialized once per benchmark and then asked to execute
/// all of its runs.  stop() can be called at any time from a different
/// thread to cancel the execution.
class executor {
public:
    /// Destructor.
    virtual ~executor(void) {}

    /// Prepares the executor for the execution of a benchmark.
    ///
    /// \param config The configuration of the program.
    /// \param benchmark The benchmark that will be executed.
    ///
    /// \throw engine::error If the benchmark cannot be executed, for
    ///     example because the tool is not installed.
    virtual void init(const config& config,
                      const model::benchmark& benchmark) = 0;

    /// Executes all the runs of a benchmark.
    ///
    /// \param benchmark The benchmark to execute.
    /// \param handler The recipient of the results.
    ///
    /// \return 0 if all runs could be executed; non-zero otherwise.
    virtual int execute_benchmark(const model::benchmark& benchmark,
                                  output_handler& handler) = 0;

    /// Describes the machine the runs are executed on.
    ///
    /// \return The properties of the host.
    virtual system_info get_system_info(void) const = 0;

    /// Cancels the execution of the benchmark.
    ///
    /// This must be idempotent, safe to call from a thread other than the
    /// one running execute_benchmark() and must not block.
    virtual void stop(void) = 0;
};


}  // namespace engine

#endif  // !defined(ENGINE_EXECUTOR_HPP)
