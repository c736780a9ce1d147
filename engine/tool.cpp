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

#include "engine/tool.hpp"

#include <map>

#include "engine/capture.hpp"
#include "engine/exceptions.hpp"
#include "engine/tools/aprove.hpp"
#include "engine/tools/forest.hpp"
#include "engine/tools/symbiotic.hpp"
#include "utils/defs.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/exceptions.hpp"
#include "utils/fs/operations.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/process/exceptions.hpp"
#include "utils/sanity.hpp"
#include "utils/text/operations.ipp"

namespace fs = utils::fs;
namespace process = utils::process;
namespace text = utils::text;

using utils::optional;


namespace {


/// Collection of registered tool adapters, keyed by name.
typedef std::map< std::string, engine::tool_ptr > tools_map;


/// Global table of registered tool adapters.
///
/// Use register_tool() to add an entry to this global table.
static tools_map registry;


}  // anonymous namespace


/// Destructor.
engine::tool::~tool(void)
{
}


/// Determines the version of the tool.
///
/// The default implementation reports no version.
///
/// \return A version string, possibly empty.
std::string
engine::tool::version(const fs::path& UTILS_UNUSED_PARAM(executable)) const
{
    return "";
}


/// Composes the command line to run the tool.
///
/// The default implementation passes the options followed by the tasks.
///
/// \param executable The path to the executable of the tool.
/// \param options The options for the tool.
/// \param tasks The input files to analyze.
/// \param property_file The property file to check, if any.  Ignored by
///     the default implementation.
/// \param limits The resource limits of the run.  Ignored by the default
///     implementation.
///
/// \return The command line, including the executable as the first item.
process::args_vector
engine::tool::cmdline(const fs::path& executable,
                      const std::vector< std::string >& options,
                      const std::vector< fs::path >& tasks,
                      const optional< fs::path >& UTILS_UNUSED_PARAM(
                          property_file),
                      const model::resource_limits& UTILS_UNUSED_PARAM(
                          limits)) const
{
    process::args_vector args;
    args.push_back(executable.str());
    args.insert(args.end(), options.begin(), options.end());
    for (std::vector< fs::path >::const_iterator iter = tasks.begin();
         iter != tasks.end(); ++iter)
        args.push_back((*iter).str());
    return args;
}


/// Lists the files the tool needs to run.
///
/// \param executable The path to the executable of the tool.
///
/// \return The files needed by the tool; by default, just the executable.
std::vector< fs::path >
engine::tool::program_files(const fs::path& executable) const
{
    return std::vector< fs::path >(1, executable);
}


/// Registers a new tool adapter.
///
/// \param name The name of the adapter, as used by benchmark definitions.
/// \param adapter The adapter itself.
void
engine::register_tool(const std::string& name, const tool_ptr adapter)
{
    PRE(registry.find(name) == registry.end());
    registry.insert(tools_map::value_type(name, adapter));
}


/// Looks up a tool adapter by name.
///
/// \param name The name of the adapter.
///
/// \return The adapter.
///
/// \throw tool_not_found_error If there is no adapter with the given name.
engine::tool_ptr
engine::find_tool(const std::string& name)
{
    const tools_map::const_iterator iter = registry.find(name);
    if (iter == registry.end())
        throw tool_not_found_error(F("Unsupported tool '%s'") % name);
    return (*iter).second;
}


/// \return The names of all registered tool adapters, sorted.
std::vector< std::string >
engine::registered_tools(void)
{
    std::vector< std::string > names;
    for (tools_map::const_iterator iter = registry.begin();
         iter != registry.end(); ++iter)
        names.push_back((*iter).first);
    return names;
}


/// Registers the built-in tool adapters.
///
/// Adapters already registered under the same names are left untouched.
void
engine::register_tools(void)
{
    if (registry.find("aprove") == registry.end())
        register_tool("aprove", tool_ptr(new tools::aprove()));
    if (registry.find("forest") == registry.end())
        register_tool("forest", tool_ptr(new tools::forest()));
    if (registry.find("symbiotic") == registry.end())
        register_tool("symbiotic", tool_ptr(new tools::symbiotic()));
}


/// Locates an executable in the PATH.
///
/// \param name The base name of the executable.
///
/// \return The path to the executable.
///
/// \throw tool_not_found_error If the executable is not in the PATH.
fs::path
engine::find_executable(const std::string& name)
{
    const optional< fs::path > executable = fs::find_in_path(name.c_str());
    if (!executable)
        throw tool_not_found_error(F("Could not find executable '%s'") % name);
    return executable.get();
}


/// Queries the version of a tool by running it.
///
/// Failures are not fatal: the version is informational only.
///
/// \param executable The path to the executable of the tool.
/// \param arg The argument that makes the tool print its version.
///
/// \return The first line printed by the tool, stripped; or an empty string
/// if the tool could not be queried.
std::string
engine::version_from_tool(const fs::path& executable, const std::string& arg)
{
    std::vector< std::string > output;
    try {
        const process::status status = detail::run_and_capture(
            executable, process::args_vector(1, arg), output);
        if (!status.exited() || status.exitstatus() != 0)
            LW(F("Cannot determine version of %s: exited with %s") %
               executable % status);
    } catch (const engine::error& e) {
        LW(F("Cannot determine version of %s: %s") % executable % e.what());
    } catch (const fs::error& e) {
        LW(F("Cannot determine version of %s: %s") % executable % e.what());
    } catch (const process::error& e) {
        LW(F("Cannot determine version of %s: %s") % executable % e.what());
    }
    if (output.empty())
        return "";
    return text::strip(output[0]);
}


/// Joins the lines printed by a tool into a single string.
///
/// \param output The lines printed by the tool.
///
/// \return The lines separated by newlines.
std::string
engine::join_output(const std::vector< std::string >& output)
{
    return text::join(output, "\n");
}


/// Constructs the verdict of a tool that failed without a known result.
///
/// \param status The termination status of the tool.
///
/// \return An error verdict that embeds the exit code and the signal.
model::verdict
engine::failure_verdict(const process::status& status)
{
    return model::verdict::make_error(
        F("Failed with returncode: %s (signal: %s)") % status.exit_code() %
        status.signal());
}
