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

/// \file engine/output_handler.hpp
/// Recording of the results of a benchmark.

#if !defined(ENGINE_OUTPUT_HANDLER_HPP)
#define ENGINE_OUTPUT_HANDLER_HPP

#include <memory>
#include <set>
#include <string>

#include "engine/system_info.hpp"
#include "model/benchmark.hpp"
#include "model/run.hpp"
#include "model/run_result.hpp"
#include "model/run_set.hpp"
#include "utils/fs/path.hpp"
#include "utils/noncopyable.hpp"

namespace engine {


/// Writes the results of a benchmark into a text report and a database.
///
/// The report goes to <output base>.txt and the database to
/// <output base>.results.db.  The methods must be called in this order:
/// output_before_benchmark() once; then, for every run set,
/// output_before_run_set(), output_after_run() for each run and
/// output_after_run_set(); and finally output_after_benchmark().
///
/// output_after_run() can be called concurrently from several threads.
class output_handler : utils::noncopyable {
    struct impl;

    /// Pointer to the internal implementation.
    std::unique_ptr< impl > _pimpl;

public:
    output_handler(const model::benchmark&, const system_info&);
    ~output_handler(void);

    void output_before_benchmark(const std::string&);
    void output_before_run_set(const model::run_set&);
    void output_after_run(const model::run_set&, const model::run&,
                          const model::run_result&);
    void output_after_run_set(const model::run_set&);
    void output_after_benchmark(const bool);

    std::set< utils::fs::path > all_created_files(void) const;
    std::string description(void) const;

    utils::fs::path report_file(void) const;
    utils::fs::path database_file(void) const;
};


}  // namespace engine

#endif  // !defined(ENGINE_OUTPUT_HANDLER_HPP)
