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

/// \file model/run_set.hpp
/// Definition of the "run set" concept.

#if !defined(MODEL_RUN_SET_HPP)
#define MODEL_RUN_SET_HPP

#include <string>
#include <vector>

#include "model/run.hpp"

namespace model {


/// Group of runs that share one tool invocation pattern.
///
/// A run set corresponds to one selected run definition of a benchmark,
/// applied to all the selected task sets.
class run_set {
    /// Name of the run definition.
    std::string _name;

    /// Options of the run definition.
    std::vector< std::string > _options;

    /// Runs of the set, in execution order.
    std::vector< run > _runs;

public:
    run_set(const std::string&, const std::vector< std::string >&,
            const std::vector< run >&);

    const std::string& name(void) const;
    const std::vector< std::string >& options(void) const;
    const std::vector< run >& runs(void) const;
};


}  // namespace model

#endif  // !defined(MODEL_RUN_SET_HPP)
