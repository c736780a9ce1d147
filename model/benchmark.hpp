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

/// \file model/benchmark.hpp
/// Definition of the "benchmark" concept.

#if !defined(MODEL_BENCHMARK_HPP)
#define MODEL_BENCHMARK_HPP

#include <memory>
#include <string>
#include <vector>

#include "model/resource_limits.hpp"
#include "model/run_set.hpp"
#include "model/task_set.hpp"
#include "utils/datetime.hpp"
#include "utils/fs/path.hpp"

namespace model {


/// Representation of one parsed benchmark definition.
///
/// Benchmarks are immutable.  Copies share the same internal data.
class benchmark {
    struct impl;

    /// Pointer to the shared internal implementation.
    std::shared_ptr< impl > _pimpl;

public:
    benchmark(const std::string&, const std::string&,
              const utils::fs::path&, const std::vector< task_set >&,
              const std::vector< run_set >&, const resource_limits&,
              const int, const std::vector< std::string >&,
              const utils::datetime::timestamp&, const std::string&);
    ~benchmark(void);

    const std::string& name(void) const;
    const std::string& tool_name(void) const;
    const utils::fs::path& definition_file(void) const;
    const std::vector< task_set >& task_sets(void) const;
    const std::vector< run_set >& run_sets(void) const;
    const resource_limits& limits(void) const;
    int threads(void) const;
    const std::vector< std::string >& options(void) const;
    const utils::datetime::timestamp& start_time(void) const;

    const std::string& output_base(void) const;
    std::string log_folder(void) const;
    utils::fs::path log_file(const std::string&, const utils::fs::path&) const;
    std::size_t num_runs(void) const;
};


}  // namespace model

#endif  // !defined(MODEL_BENCHMARK_HPP)
