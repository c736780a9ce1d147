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

#include "engine/tools/symbiotic.hpp"

#include "engine/exceptions.hpp"
#include "utils/defs.hpp"
#include "utils/format/macros.hpp"
#include "utils/optional.ipp"
#include "utils/text/operations.hpp"

namespace fs = utils::fs;
namespace process = utils::process;
namespace text = utils::text;

using utils::optional;


namespace {


/// Support files of Symbiotic, relative to the directory of its executable.
static const char* support_files[] = {
    "build-fix.sh",
    "path_to_ml.pl",
    "bin/klee",
    "bin/opt",
    "bin/clang",
    "bin/llvm-link",
    "bin/llvm-slicer",
    "lib.c",
    "lib/libllvmdg.so",
    "lib/LLVMsvc15.so",
    "lib/klee/runtime/kleeRuntimeIntrinsic.bc",
    "lib32/klee/runtime/kleeRuntimeIntrinsic.bc",
    NULL,
};


}  // anonymous namespace


/// Locates the Symbiotic executable.
///
/// \return The path to the executable.
///
/// \throw tool_not_found_error If the executable is not in the PATH.
fs::path
engine::tools::symbiotic::executable(void) const
{
    return find_executable("symbiotic");
}


/// \return The name of the tool.
std::string
engine::tools::symbiotic::name(void) const
{
    return "symbiotic";
}


/// Queries the version of Symbiotic.
///
/// \param executable The path to the executable.
///
/// \return The version string, possibly empty.
std::string
engine::tools::symbiotic::version(const fs::path& executable) const
{
    return version_from_tool(executable);
}


/// Composes the command line to run Symbiotic.
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
engine::tools::symbiotic::cmdline(
    const fs::path& executable, const std::vector< std::string >& options,
    const std::vector< fs::path >& tasks,
    const optional< fs::path >& property_file,
    const model::resource_limits& UTILS_UNUSED_PARAM(limits)) const
{
    if (tasks.size() != 1)
        throw engine::error(F("Symbiotic supports exactly one input file; "
                              "got %s") % tasks.size());

    process::args_vector args;
    args.push_back(executable.str());
    args.insert(args.end(), options.begin(), options.end());
    if (property_file)
        args.push_back((F("--prp=%s") % property_file.get()).str());
    args.push_back(tasks[0].str());
    return args;
}


/// Classifies the output of Symbiotic.
///
/// \param status The termination status of Symbiotic.
/// \param output The lines printed by Symbiotic.
/// \param is_timeout Whether Symbiotic exceeded its time limit.
///
/// \return The verdict of the run.
model::verdict
engine::tools::symbiotic::determine_result(
    const process::status& status, const std::vector< std::string >& output,
    const bool is_timeout) const
{
    if (is_timeout)
        return model::verdict::make_error("timeout");

    const std::string text = text::strip(join_output(output));
    if (text == "TRUE")
        return model::verdict(model::verdict::true_prop);
    else if (text == "UNKNOWN")
        return model::verdict(model::verdict::unknown);
    else if (text == "FALSE")
        return model::verdict(model::verdict::false_reach);

    if (status.exit_code() != 0)
        return failure_verdict(status);
    else if (text.empty())
        return model::verdict::make_error("error (no output)");
    else
        return model::verdict::make_error("error (unknown)");
}


/// Lists the files Symbiotic needs to run.
///
/// \param executable The path to the executable.
///
/// \return The executable followed by its support files.
std::vector< fs::path >
engine::tools::symbiotic::program_files(const fs::path& executable) const
{
    const fs::path folder = executable.branch_path();
    std::vector< fs::path > files(1, executable);
    for (const char** iter = support_files; *iter != NULL; ++iter)
        files.push_back(folder / *iter);
    return files;
}
