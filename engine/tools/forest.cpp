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

#include "engine/tools/forest.hpp"

#include "engine/exceptions.hpp"
#include "utils/defs.hpp"
#include "utils/format/macros.hpp"
#include "utils/optional.ipp"

namespace fs = utils::fs;
namespace process = utils::process;

using utils::optional;


/// Locates the Forest executable.
///
/// \return The path to the executable.
///
/// \throw tool_not_found_error If the executable is not in the PATH.
fs::path
engine::tools::forest::executable(void) const
{
    return find_executable("forest");
}


/// \return The name of the tool.
std::string
engine::tools::forest::name(void) const
{
    return "Forest";
}


/// Queries the version of Forest.
///
/// \param executable The path to the executable.
///
/// \return The version string, possibly empty.
std::string
engine::tools::forest::version(const fs::path& executable) const
{
    return version_from_tool(executable);
}


/// Composes the command line to run Forest.
///
/// \param executable The path to the executable.
/// \param options The options for the tool.
/// \param tasks The input files; only one is supported.
/// \param property_file The property file to check, if any.
///
/// \return The command line.
///
/// \throw engine::error If more than one task is given.
process::args_vector
engine::tools::forest::cmdline(
    const fs::path& executable, const std::vector< std::string >& options,
    const std::vector< fs::path >& tasks,
    const optional< fs::path >& property_file,
    const model::resource_limits& UTILS_UNUSED_PARAM(limits)) const
{
    if (tasks.size() != 1)
        throw engine::error(F("Forest supports exactly one input file; "
                              "got %s") % tasks.size());

    process::args_vector args;
    args.push_back(executable.str());
    if (property_file) {
        args.push_back("-propertyfile");
        args.push_back(property_file.get().str());
    }
    args.insert(args.end(), options.begin(), options.end());
    args.push_back("-svcomp_only_output");
    args.push_back(tasks[0].str());
    return args;
}


/// Classifies the output of Forest.
///
/// Later, more specific markers override earlier ones.
///
/// \param output The lines printed by Forest.
///
/// \return The verdict of the run.
model::verdict
engine::tools::forest::determine_result(
    const process::status& UTILS_UNUSED_PARAM(status),
    const std::vector< std::string >& output,
    const bool UTILS_UNUSED_PARAM(is_timeout)) const
{
    const std::string text = join_output(output);
    model::verdict::verdict_type type = model::verdict::unknown;
    if (text.find("TRUE") != std::string::npos)
        type = model::verdict::true_prop;
    if (text.find("FALSE_REACH") != std::string::npos)
        type = model::verdict::false_reach;
    if (text.find("FALSE_DEREF") != std::string::npos)
        type = model::verdict::false_deref;
    if (text.find("FALSE_FREE") != std::string::npos)
        type = model::verdict::false_free;
    return model::verdict(type);
}
