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

extern "C" {
#include <stdlib.h>
}

#include <set>
#include <string>

#include <atf-c++.hpp>

#include "utils/env.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.ipp"

namespace fs = utils::fs;


namespace {


/// Skips the test case if git is not installed.
///
/// Also prevents git from looking for repositories above the work directory
/// of the test case.
static void
require_git(void)
{
    if (!fs::find_in_path("git"))
        ATF_SKIP("git not installed");
    utils::setenv("GIT_CEILING_DIRECTORIES",
                  fs::current_path().branch_path().str());
}


/// Runs a shell command and fails the test if it does not succeed.
///
/// \param command The command to run.
static void
run_shell(const std::string& command)
{
    ATF_REQUIRE_EQ(0, ::system(command.c_str()));
}


/// Creates a git repository with one committed file.
///
/// \param directory The directory to turn into a repository.
static void
create_repository(const std::string& directory)
{
    fs::mkdir_p(fs::path(directory), 0755);
    run_shell(F("cd %s && git init -q . && "
                "git config user.email test@example.com && "
                "git config user.name Test && "
                "echo first >tracked && git add tracked && "
                "git commit -q -m initial") % directory);
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(add_files_to_repository__ok);
ATF_TEST_CASE_BODY(add_files_to_repository__ok)
{
    require_git();
    create_repository("repo");
    fs::mkdir_p(fs::path("repo/results"), 0755);
    atf::utils::create_file("repo/results/a.txt", "result a\n");
    atf::utils::create_file("repo/results/b.db", "result b\n");

    std::set< fs::path > files;
    files.insert(fs::path("repo/results/a.txt"));
    files.insert(fs::path("repo/results/b.db"));
    engine::git::add_files_to_repository(fs::path("repo/results"), files,
                                         "Results for benchmark run\n\nmore");

    run_shell("cd repo && git log -1 --format=%s >../subject");
    ATF_REQUIRE(atf::utils::compare_file("subject",
                                         "Results for benchmark run\n"));
    run_shell("cd repo && git ls-files >../files");
    ATF_REQUIRE(atf::utils::compare_file(
        "files", "results/a.txt\nresults/b.db\ntracked\n"));
}


ATF_TEST_CASE_WITHOUT_HEAD(add_files_to_repository__local_changes);
ATF_TEST_CASE_BODY(add_files_to_repository__local_changes)
{
    require_git();
    create_repository("repo");
    atf::utils::create_file("repo/tracked", "modified\n");
    atf::utils::create_file("repo/new.txt", "new\n");

    std::set< fs::path > files;
    files.insert(fs::path("repo/new.txt"));
    ATF_REQUIRE_THROW_RE(
        engine::git::error, "Git repository has local changes",
        engine::git::add_files_to_repository(fs::path("repo"), files, "msg"));

    run_shell("cd repo && git ls-files >../files");
    ATF_REQUIRE(atf::utils::compare_file("files", "tracked\n"));
}


ATF_TEST_CASE_WITHOUT_HEAD(add_files_to_repository__untracked_files_ignored);
ATF_TEST_CASE_BODY(add_files_to_repository__untracked_files_ignored)
{
    require_git();
    create_repository("repo");
    atf::utils::create_file("repo/unrelated", "untracked\n");
    atf::utils::create_file("repo/new.txt", "new\n");

    std::set< fs::path > files;
    files.insert(fs::path("repo/new.txt"));
    engine::git::add_files_to_repository(fs::path("repo"), files, "msg");

    run_shell("cd repo && git ls-files >../files");
    ATF_REQUIRE(atf::utils::compare_file("files", "new.txt\ntracked\n"));
}


ATF_TEST_CASE_WITHOUT_HEAD(add_files_to_repository__not_a_directory);
ATF_TEST_CASE_BODY(add_files_to_repository__not_a_directory)
{
    atf::utils::create_file("file", "");
    ATF_REQUIRE_THROW_RE(
        engine::git::error, "not a directory",
        engine::git::add_files_to_repository(
            fs::path("file"), std::set< fs::path >(), "msg"));
}


ATF_TEST_CASE_WITHOUT_HEAD(add_files_to_repository__not_a_repository);
ATF_TEST_CASE_BODY(add_files_to_repository__not_a_repository)
{
    require_git();
    fs::mkdir_p(fs::path("plain"), 0755);
    ATF_REQUIRE_THROW_RE(
        engine::git::error, "rev-parse",
        engine::git::add_files_to_repository(
            fs::path("plain"), std::set< fs::path >(), "msg"));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, add_files_to_repository__ok);
    ATF_ADD_TEST_CASE(tcs, add_files_to_repository__local_changes);
    ATF_ADD_TEST_CASE(tcs, add_files_to_repository__untracked_files_ignored);
    ATF_ADD_TEST_CASE(tcs, add_files_to_repository__not_a_directory);
    ATF_ADD_TEST_CASE(tcs, add_files_to_repository__not_a_repository);
}
