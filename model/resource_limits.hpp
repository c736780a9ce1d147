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

/// \file model/resource_limits.hpp
/// Definition of the "resource limits" concept.

#if !defined(MODEL_RESOURCE_LIMITS_HPP)
#define MODEL_RESOURCE_LIMITS_HPP

#include <ostream>

#include "utils/optional.hpp"

namespace model {


/// Limits applied to every run of a benchmark.
///
/// All limits are optional; an absent limit is not enforced.
class resource_limits {
    /// Maximum CPU and wall time per run, in seconds.
    utils::optional< int > _time_limit;

    /// Maximum memory per run, in megabytes.
    utils::optional< int > _memory_limit;

    /// Maximum number of cores per run.
    utils::optional< int > _core_limit;

public:
    resource_limits(void);
    resource_limits(const utils::optional< int >&,
                    const utils::optional< int >&,
                    const utils::optional< int >&);

    const utils::optional< int >& time_limit(void) const;
    const utils::optional< int >& memory_limit(void) const;
    const utils::optional< int >& core_limit(void) const;

    bool operator==(const resource_limits&) const;
    bool operator!=(const resource_limits&) const;
};


std::ostream& operator<<(std::ostream&, const resource_limits&);


}  // namespace model

#endif  // !defined(MODEL_RESOURCE_LIMITS_HPP)
