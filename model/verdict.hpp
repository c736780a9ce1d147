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

/// \file model/verdict.hpp
/// Definition of the "verdict" concept.
///
/// A verdict is the canonical classification of the outcome of a tool run.
/// The set of verdicts is closed, with the exception of errors, which carry a
/// free-text reason describing what went wrong.

#if !defined(MODEL_VERDICT_HPP)
#define MODEL_VERDICT_HPP

#include <ostream>
#include <string>

namespace model {


/// Representation of a single verdict.
///
/// A verdict is never empty: the default for a run with no recognizable output
/// is unknown, and every failure is an error with a reason.
class verdict {
public:
    /// List of possible types for the verdict.
    enum verdict_type {
        true_prop,
        false_reach,
        false_deref,
        false_free,
        false_termination,
        unknown,
        error,
    };

private:
    /// The type of the verdict.
    verdict_type _type;

    /// The reason for an error verdict; empty otherwise.
    std::string _reason;

public:
    explicit verdict(const verdict_type);
    static verdict make_error(const std::string&);

    verdict_type type(void) const;
    const std::string& reason(void) const;
    std::string str(void) const;

    bool is_error(void) const;
    bool is_false(void) const;

    bool operator==(const verdict&) const;
    bool operator!=(const verdict&) const;
};


std::ostream& operator<<(std::ostream&, const verdict&);


}  // namespace model

#endif  // !defined(MODEL_VERDICT_HPP)
