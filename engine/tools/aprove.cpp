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

#include "engine/tools/aprove.hpp"

#include "utils/defs.hpp"

namespace fs = utils::fs;
namespace process = utils::process;


namespace {


/// Files that must accompany the AProVE executable, relative to its
/// directory.
static const char* required_paths[] = {
    "aprove.jar",
    "AProVE.sh",
    "bin",
    "newstrategy.strategy",
    NULL,
};


}  // anonymous namespace


/// Locates the AProVE wrapper script.
///
/// \return The path to AProVE.sh.
///
/// \throw tool_not_found_error If the script is not in the PATH.
fs::path
engine::tools::aprove::executable(void) const
{
    return find_executable("AProVE.sh");
}


/// \return The name of the tool.
std::string
engine::tools::aprove::name(void) const
{
    return "AProVE";
}


/// Classifies the output of AProVE.
///
/// AProVE answers YES or NO to the termination question; TRUE and FALSE are
/// accepted too.  The markers are checked in that order and the first one
/// present wins.
///
/// \param output The lines printed by AProVE.
///
/// \return The verdict of the run.
model::verdict
engine::tools::aprove::determine_result(
    const process::status& UTILS_UNUSED_PARAM(status),
    const std::vector< std::string >& output,
    const bool UTILS_UNUSED_PARAM(is_timeout)) const
{
    const std::string text = join_output(output);
    if (text.find("YES") != std::string::npos)
        return model::verdict(model::verdict::true_prop);
    else if (text.find("TRUE") != std::string::npos)
        return model::verdict(model::verdict::true_prop);
    else if (text.find("FALSE") != std::string::npos)
        return model::verdict(model::verdict::false_termination);
    else if (text.find("NO") != std::string::npos)
        return model::verdict(model::verdict::false_termination);
    else
        return model::verdict(model::verdict::unknown);
}


/// Lists the files AProVE needs to run.
///
/// \param executable The path to AProVE.sh.
///
/// \return The support files, located next to the executable.
std::vector< fs::path >
engine::tools::aprove::program_files(const fs::path& executable) const
{
    const fs::path folder = executable.branch_path();
    std::vector< fs::path > files;
    for (const char** iter = required_paths; *iter != NULL; ++iter)
        files.push_back(folder / *iter);
    return files;
}
