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

/// \file engine/local_executor.hpp
/// Execution of the runs of a benchmark on the local machine.

#if !defined(ENGINE_LOCAL_EXECUTOR_HPP)
#define ENGINE_LOCAL_EXECUTOR_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "engine/executor.hpp"
#include "engine/tool.hpp"
#include "utils/fs/path.hpp"
#include "utils/noncopyable.hpp"

namespace engine {


namespace detail {


/// Number of lines written to a log file before the output of the tool.
extern const std::size_t log_header_lines;


void shrink_file(const utils::fs::path&, const uint64_t);
std::vector< std::string > read_tool_output(const utils::fs::path&);


}  // namespace detail


/// Executor that spawns every run as a subprocess of the current process.
///
/// Runs are executed by a pool of worker threads.  The memory limit is
/// applied with RLIMIT_AS, the time limit with RLIMIT_CPU and a wall-clock
/// deadline that kills the process group of the run.
class local_executor : public executor, utils::noncopyable {
    struct impl;

    /// Pointer to the internal implementation.
    std::unique_ptr< impl > _pimpl;

public:
    local_executor(void);
    ~local_executor(void);

    void init(const config&, const model::benchmark&);
    int execute_benchmark(const model::benchmark&, output_handler&);
    system_info get_system_info(void) const;
    void stop(void);
};


}  // namespace engine

#endif  // !defined(ENGINE_LOCAL_EXECUTOR_HPP)
