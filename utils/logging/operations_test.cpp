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

#include "utils/logging/operations.hpp"

extern "C" {
#include <unistd.h>
}

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <atf-c++.hpp>

#include "utils/datetime.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/operations.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace logging = utils::logging;


ATF_TEST_CASE_WITHOUT_HEAD(generate_log_name__before_log);
ATF_TEST_CASE_BODY(generate_log_name__before_log)
{
    datetime::set_mock_now(2011, 2, 21, 18, 10, 0);
    ATF_REQUIRE_EQ(fs::path("/some/dir/foobar.20110221-181000.log"),
                   logging::generate_log_name(fs::path("/some/dir"), "foobar"));

    datetime::set_mock_now(2011, 2, 21, 18, 10, 1);
    logging::log(logging::level_info, "file", 123, "A message");

    datetime::set_mock_now(2011, 2, 21, 18, 10, 2);
    ATF_REQUIRE_EQ(fs::path("/some/dir/foobar.20110221-181000.log"),
                   logging::generate_log_name(fs::path("/some/dir"), "foobar"));
}


ATF_TEST_CASE_WITHOUT_HEAD(generate_log_name__after_log);
ATF_TEST_CASE_BODY(generate_log_name__after_log)
{
    datetime::set_mock_now(2011, 2, 21, 18, 15, 0);
    logging::log(logging::level_info, "file", 123, "A message");
    datetime::set_mock_now(2011, 2, 21, 18, 15, 1);
    logging::log(logging::level_info, "file", 123, "A message");

    datetime::set_mock_now(2011, 2, 21, 18, 15, 2);
    ATF_REQUIRE_EQ(fs::path("/some/dir/foobar.20110221-181500.log"),
                   logging::generate_log_name(fs::path("/some/dir"), "foobar"));
}


ATF_TEST_CASE_WITHOUT_HEAD(set_persistency__backlog_filtered);
ATF_TEST_CASE_BODY(set_persistency__backlog_filtered)
{
    datetime::set_mock_now(2011, 2, 21, 18, 20, 0);
    LD("Debug message");
    LI("Info message");
    LW("Warning message");
    LE("Error message");

    logging::set_persistency("warning", fs::path("test.log"));

    std::ifstream input("test.log");
    ATF_REQUIRE(input);

    const pid_t pid = ::getpid();
    std::string line;
    ATF_REQUIRE(std::getline(input, line).good());
    ATF_REQUIRE_MATCH(
        (F("20110221-182000 W %s .*operations_test.cpp:[0-9]+: "
           "Warning message") % pid).str(), line);
    ATF_REQUIRE(std::getline(input, line).good());
    ATF_REQUIRE_MATCH(
        (F("20110221-182000 E %s .*: Error message") % pid).str(), line);
    ATF_REQUIRE(!std::getline(input, line));
}


ATF_TEST_CASE_WITHOUT_HEAD(set_persistency__later_messages);
ATF_TEST_CASE_BODY(set_persistency__later_messages)
{
    datetime::set_mock_now(2011, 2, 21, 18, 25, 0);
    logging::set_persistency("info", fs::path("test.log"));
    LI("First");
    LD("Hidden");
    datetime::set_mock_now(2011, 2, 21, 18, 25, 1);
    logging::log(logging::level_warning, "src.cpp", 42, "Second");

    ATF_REQUIRE(atf::utils::grep_file("20110221-182500 I .*: First",
                                      "test.log"));
    ATF_REQUIRE(!atf::utils::grep_file("Hidden", "test.log"));
    ATF_REQUIRE(atf::utils::grep_file(
        "20110221-182501 W [0-9]+ src.cpp:42: Second", "test.log"));
}


ATF_TEST_CASE_WITHOUT_HEAD(set_persistency__invalid_level);
ATF_TEST_CASE_BODY(set_persistency__invalid_level)
{
    ATF_REQUIRE_THROW_RE(std::range_error, "Unrecognized log level 'foo'",
                         logging::set_persistency("foo", fs::path("test.log")));
    ATF_REQUIRE(!fs::exists(fs::path("test.log")));
}


ATF_TEST_CASE_WITHOUT_HEAD(set_persistency__cannot_create);
ATF_TEST_CASE_BODY(set_persistency__cannot_create)
{
    ATF_REQUIRE_THROW_RE(std::runtime_error, "Failed to create log file",
                         logging::set_persistency("debug",
                                                  fs::path("a/b/c.log")));
}


ATF_TEST_CASE_WITHOUT_HEAD(set_echo);
ATF_TEST_CASE_BODY(set_echo)
{
    datetime::set_mock_now(2011, 2, 21, 18, 30, 5);
    logging::set_persistency("info", fs::path("test.log"));

    std::ostringstream echo;
    logging::set_echo(&echo);
    LI("Visible");
    LD("Below the level");
    logging::set_echo(NULL);
    LI("Not echoed");

    ATF_REQUIRE_EQ("2011-02-21 18:30:05 - INFO - Visible\n", echo.str());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, generate_log_name__before_log);
    ATF_ADD_TEST_CASE(tcs, generate_log_name__after_log);
    ATF_ADD_TEST_CASE(tcs, set_persistency__backlog_filtered);
    ATF_ADD_TEST_CASE(tcs, set_persistency__later_messages);
    ATF_ADD_TEST_CASE(tcs, set_persistency__invalid_level);
    ATF_ADD_TEST_CASE(tcs, set_persistency__cannot_create);
    ATF_ADD_TEST_CASE(tcs, set_echo);
}
