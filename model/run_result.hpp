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

/// \file model/run_result.hpp
/// Definition of the "run result" concept.

#if !defined(MODEL_RUN_RESULT_HPP)
#define MODEL_RUN_RESULT_HPP

#include <ostream>
#include <string>
#include <vector>

#include "model/verdict.hpp"
#include "utils/datetime.hpp"
#include "utils/optional.hpp"
#include "utils/process/status.hpp"

namespace model {


/// Outcome of the execution of a run.
class run_result {
    /// Termination status of the tool; none if the tool never started.
    utils::optional< utils::process::status > _status;

    /// Whether the tool was killed because it exceeded its time limit.
    bool _timed_out;

    /// Wall-clock time consumed by the tool.
    utils::datetime::delta _wall_time;

    /// CPU time consumed by the tool and its descendants.
    utils::datetime::delta _cpu_time;

    /// Lines printed by the tool.
    std::vector< std::string > _output;

    /// Classified outcome.
    verdict _verdict;

public:
    run_result(const utils::optional< utils::process::status >&, const bool,
               const utils::datetime::delta&, const utils::datetime::delta&,
               const std::vector< std::string >&, const verdict&);

    const utils::optional< utils::process::status >& status(void) const;
    bool timed_out(void) const;
    const utils::datetime::delta& wall_time(void) const;
    const utils::datetime::delta& cpu_time(void) const;
    const std::vector< std::string >& output(void) const;
    const model::verdict& get_verdict(void) const;

    int exit_code(void) const;
    int signal(void) const;

    bool operator==(const run_result&) const;
    bool operator!=(const run_result&) const;
};


std::ostream& operator<<(std::ostream&, const run_result&);


}  // namespace model

#endif  // !defined(MODEL_RUN_RESULT_HPP)
