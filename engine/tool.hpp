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

/// \file engine/tool.hpp
/// Interface to the analysis tools that can be benchmarked.
///
/// Every supported tool is represented by an adapter that implements the
/// tool interface.  Adapters are registered by name at startup and looked up
/// by the name given in a benchmark definition.

#if !defined(ENGINE_TOOL_HPP)
#define ENGINE_TOOL_HPP

#include <memory>
#include <string>
#include <vector>

#include "model/resource_limits.hpp"
#include "model/verdict.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.hpp"
#include "utils/process/operations.hpp"
#include "utils/process/status.hpp"

namespace engine {


/// Capabilities every adapter of an analysis tool provides.
class tool {
public:
    virtual ~tool(void);

    /// Locates the executable of the tool.
    ///
    /// \return The path to the executable.
    ///
    /// \throw tool_not_found_error If the executable cannot be found.
    virtual utils::fs::path executable(void) const = 0;

    /// Returns the name of the tool for reporting purposes.
    ///
    /// \return A user-friendly name.
    virtual std::string name(void) const = 0;

    virtual std::string version(const utils::fs::path&) const;

    virtual utils::process::args_vector cmdline(
        const utils::fs::path&, const std::vector< std::string >&,
        const std::vector< utils::fs::path >&,
        const utils::optional< utils::fs::path >&,
        const model::resource_limits&) const;

    /// Classifies the outcome of a run of the tool.
    ///
    /// This must be a pure function of its arguments and must not throw.
    ///
    /// \param status The termination status of the tool.
    /// \param output The lines printed by the tool.
    /// \param is_timeout Whether the tool was killed for exceeding its time
    ///     limit.
    ///
    /// \return The verdict of the run.
    virtual model::verdict determine_result(
        const utils::process::status& status,
        const std::vector< std::string >& output,
        const bool is_timeout) const = 0;

    virtual std::vector< utils::fs::path > program_files(
        const utils::fs::path&) const;
};


/// Pointer to a tool adapter.
typedef std::shared_ptr< const tool > tool_ptr;


void register_tool(const std::string&, const tool_ptr);
tool_ptr find_tool(const std::string&);
std::vector< std::string > registered_tools(void);
void register_tools(void);

utils::fs::path find_executable(const std::string&);
std::string version_from_tool(const utils::fs::path&,
                              const std::string& = "--version");
std::string join_output(const std::vector< std::string >&);
model::verdict failure_verdict(const utils::process::status&);


}  // namespace engine

#endif  // !defined(ENGINE_TOOL_HPP)
