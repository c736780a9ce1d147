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

#include "engine/capture.hpp"

#include <fstream>
#include <memory>

#include "engine/exceptions.hpp"
#include "utils/env.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/auto_cleaners.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"
#include "utils/process/child.ipp"
#include "utils/stream.hpp"

namespace fs = utils::fs;
namespace process = utils::process;


namespace {


/// Functor to execute an auxiliary program.
class run_program {
    /// Path to the program.
    fs::path _program;

    /// Arguments to the program, without the program name.
    process::args_vector _args;

public:
    /// Constructor.
    ///
    /// \param program Path to the program.
    /// \param args Arguments to the program, without the program name.
    run_program(const fs::path& program, const process::args_vector& args) :
        _program(program), _args(args)
    {
    }

    /// Executes the program.
    void
    operator()(void)
    {
        process::exec(_program, _args);
    }
};


}  // anonymous namespace


/// Runs a program to completion and collects its output.
///
/// The stdout and stderr of the program are merged.
///
/// \param program Path to the program to run.
/// \param args Arguments to the program, without the program name.
/// \param [out] output The lines printed by the program.
///
/// \return The termination status of the program.
///
/// \throw engine::error If the output of the program cannot be read.
/// \throw fs::error If the temporary file cannot be created.
/// \throw process::error If the program cannot be spawned.
process::status
engine::detail::run_and_capture(const fs::path& program,
                                const process::args_vector& args,
                                std::vector< std::string >& output)
{
    const std::string tmpdir = utils::getenv_with_default("TMPDIR", "/tmp");
    fs::auto_file output_file(fs::mkstemp_keep(tmpdir + "/vbench.XXXXXX"));

    LD(F("Running %s with %s arguments") % program % args.size());
    std::unique_ptr< process::child > child = process::child::fork_files(
        run_program(program, args), output_file.file(), output_file.file());
    const process::status status = child->wait();

    std::ifstream input(output_file.file().c_str());
    if (!input)
        throw engine::error(F("Cannot read output of %s") % program);
    output = utils::read_lines(input);
    return status;
}
