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

/// \file model/task_set.hpp
/// Definition of the "task set" concept.

#if !defined(MODEL_TASK_SET_HPP)
#define MODEL_TASK_SET_HPP

#include <string>
#include <vector>

#include "utils/fs/path.hpp"
#include "utils/optional.hpp"

namespace model {


/// Named group of input files analyzed with the same settings.
class task_set {
    /// Name of the set, used to select it from the command line.
    std::string _name;

    /// The input files, already expanded from their patterns.
    std::vector< utils::fs::path > _files;

    /// Property file to pass to the tool for these tasks, if any.
    utils::optional< utils::fs::path > _property_file;

    /// Additional tool options for these tasks.
    std::vector< std::string > _options;

public:
    task_set(const std::string&, const std::vector< utils::fs::path >&,
             const utils::optional< utils::fs::path >&,
             const std::vector< std::string >&);

    const std::string& name(void) const;
    const std::vector< utils::fs::path >& files(void) const;
    const utils::optional< utils::fs::path >& property_file(void) const;
    const std::vector< std::string >& options(void) const;
};


}  // namespace model

#endif  // !defined(MODEL_TASK_SET_HPP)
