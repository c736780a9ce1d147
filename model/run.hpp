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

/// \file model/run.hpp
/// Definition of the "run" concept.

#if !defined(MODEL_RUN_HPP)
#define MODEL_RUN_HPP

#include <ostream>
#include <string>
#include <vector>

#include "utils/fs/path.hpp"
#include "utils/optional.hpp"

namespace model {


/// One execution of a tool on a single task.
///
/// A run is immutable; its outcome is described separately by a run_result.
class run {
    /// The input file analyzed by the tool.
    utils::fs::path _task;

    /// Tool options for this run, in command-line order.
    std::vector< std::string > _options;

    /// Property file to pass to the tool, if any.
    utils::optional< utils::fs::path > _property_file;

    /// File that receives the output of the tool.
    utils::fs::path _log_file;

public:
    run(const utils::fs::path&, const std::vector< std::string >&,
        const utils::optional< utils::fs::path >&, const utils::fs::path&);

    const utils::fs::path& task(void) const;
    const std::vector< std::string >& options(void) const;
    const utils::optional< utils::fs::path >& property_file(void) const;
    const utils::fs::path& log_file(void) const;

    bool operator==(const run&) const;
    bool operator!=(const run&) const;
};


std::ostream& operator<<(std::ostream&, const run&);


}  // namespace model

#endif  // !defined(MODEL_RUN_HPP)
