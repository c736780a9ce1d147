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

/// \file engine/orchestrator.hpp
/// Top-level driver of the execution of benchmarks.

#if !defined(ENGINE_ORCHESTRATOR_HPP)
#define ENGINE_ORCHESTRATOR_HPP

#include <cstddef>
#include <memory>

#include "engine/config.hpp"
#include "engine/executor.hpp"
#include "utils/noncopyable.hpp"

namespace engine {


/// Executes the benchmarks listed in the configuration one after the other.
///
/// Every benchmark file is loaded, checked for existing results, executed
/// and, if requested, its results committed to git.  The execution can be
/// cancelled at any time from another thread with stop().
class orchestrator : utils::noncopyable {
    struct impl;

    /// Pointer to the internal implementation.
    std::unique_ptr< impl > _pimpl;

protected:
    virtual std::shared_ptr< executor > load_executor(void);

public:
    orchestrator(void);
    virtual ~orchestrator(void);

    int start(const config&);
    void stop(void);
    bool interrupted(void) const;
    std::size_t completed_benchmarks(void) const;
};


}  // namespace engine

#endif  // !defined(ENGINE_ORCHESTRATOR_HPP)
