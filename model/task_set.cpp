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

#include "model/task_set.hpp"

#include "utils/optional.ipp"
#include "utils/sanity.hpp"

namespace fs = utils::fs;

using utils::optional;


/// Constructs a new task set.
///
/// \param name_ The name of the set; cannot be empty.
/// \param files_ The input files of the set.
/// \param property_file_ The property file for the tasks, if any.
/// \param options_ Extra tool options for the tasks.
model::task_set::task_set(const std::string& name_,
                          const std::vector< fs::path >& files_,
                          const optional< fs::path >& property_file_,
                          const std::vector< std::string >& options_) :
    _name(name_),
    _files(files_),
    _property_file(property_file_),
    _options(options_)
{
    PRE(!name_.empty());
}


/// \return The name of the set.
const std::string&
model::task_set::name(void) const
{
    return _name;
}


/// \return The input files of the set.
const std::vector< fs::path >&
model::task_set::files(void) const
{
    return _files;
}


/// \return The property file for the tasks, if any.
const optional< fs::path >&
model::task_set::property_file(void) const
{
    return _property_file;
}


/// \return The extra tool options for the tasks.
const std::vector< std::string >&
model::task_set::options(void) const
{
    return _options;
}
