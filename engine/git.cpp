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

#include "engine/git.hpp"

#include <cstdlib>
#include <fstream>

#include "engine/capture.hpp"
#include "engine/tool.hpp"
#include "utils/env.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/auto_cleaners.hpp"
#include "utils/fs/operations.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/process/status.hpp"
#include "utils/text/operations.ipp"

namespace fs = utils::fs;
namespace process = utils::process;
namespace text = utils::text;

using utils::optional;


namespace {


/// Runs git and checks that it succeeded.
///
/// \param git Path to the git binary.
/// \param directory Directory in which to run git.
/// \param args The git subcommand and its arguments.
///
/// \return The output of git.
///
/// \throw engine::git::error If git cannot be run or fails.
static std::vector< std::string >
run_git(const fs::path& git, const fs::path& directory,
        const process::args_vector& args)
{
    process::args_vector real_args;
    real_args.push_back("-C");
    real_args.push_back(directory.str());
    real_args.insert(real_args.end(), args.begin(), args.end());

    std::vector< std::string > output;
    try {
        const process::status status = engine::detail::run_and_capture(
            git, real_args, output);
        if (!status.exited() || status.exitstatus() != EXIT_SUCCESS)
            throw engine::git::error(
                F("git %s failed: %s") % args[0] %
                text::strip(engine::join_output(output)));
    } catch (const engine::git::error& unused_error) {
        throw;
    } catch (const std::runtime_error& e) {
        throw engine::git::error(F("Cannot run git %s: %s") % args[0] %
                                 e.what());
    }
    return output;
}


}  // anonymous namespace


/// Constructs a new error with a plain-text message.
///
/// \param message The plain-text error message.
engine::git::error::error(const std::string& message) :
    engine::error(message)
{
}


/// Destructor for the error.
engine::git::error::~error(void) throw()
{
}


/// Commits a set of files to the git repository holding a directory.
///
/// The repository must not have uncommitted changes to tracked files, so that
/// the new commit contains the given files only.
///
/// \param output_path Directory within the repository.
/// \param files The files to add, relative to the current directory or
///     absolute.
/// \param message The commit message.
///
/// \throw engine::git::error If the files cannot be committed.
void
engine::git::add_files_to_repository(const fs::path& output_path,
                                     const std::set< fs::path >& files,
                                     const std::string& message)
{
    if (!fs::is_directory(output_path))
        throw engine::git::error(F("Output path %s is not a directory") %
                                 output_path);

    const optional< fs::path > git = fs::find_in_path("git");
    if (!git)
        throw engine::git::error("Cannot find git in the PATH");

    process::args_vector toplevel_args;
    toplevel_args.push_back("rev-parse");
    toplevel_args.push_back("--show-toplevel");
    const std::vector< std::string > toplevel_output = run_git(
        git.get(), output_path, toplevel_args);
    if (toplevel_output.empty())
        throw engine::git::error(F("Cannot determine git repository of %s") %
                                 output_path);
    const fs::path toplevel(text::strip(toplevel_output[0]));
    LI(F("Committing results to git repository %s") % toplevel);

    process::args_vector status_args;
    status_args.push_back("status");
    status_args.push_back("--porcelain");
    status_args.push_back("--untracked-files=no");
    const std::vector< std::string > status_output = run_git(
        git.get(), toplevel, status_args);
    if (!text::strip(engine::join_output(status_output)).empty())
        throw engine::git::error("Git repository has local changes");

    process::args_vector add_args;
    add_args.push_back("add");
    add_args.push_back("--force");
    add_args.push_back("--");
    for (std::set< fs::path >::const_iterator iter = files.begin();
         iter != files.end(); ++iter)
        add_args.push_back((*iter).to_absolute().str());
    run_git(git.get(), toplevel, add_args);

    const std::string tmpdir = utils::getenv_with_default("TMPDIR", "/tmp");
    fs::auto_file message_file(fs::mkstemp_keep(tmpdir + "/vbench.XXXXXX"));
    {
        std::ofstream output(message_file.file().c_str());
        if (!output)
            throw engine::git::error(F("Cannot write commit message to %s") %
                                     message_file.file());
        output << message << '\n';
    }
    process::args_vector commit_args;
    commit_args.push_back("commit");
    commit_args.push_back("--quiet");
    commit_args.push_back(F("--file=%s") % message_file.file());
    run_git(git.get(), toplevel, commit_args);
}
