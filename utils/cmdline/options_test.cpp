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

#include "utils/cmdline/options.hpp"

#include <atf-c++.hpp>

#include "utils/cmdline/exceptions.hpp"

namespace cmdline = utils::cmdline;


ATF_TEST_CASE_WITHOUT_HEAD(base_option__short_name__no_arg);
ATF_TEST_CASE_BODY(base_option__short_name__no_arg)
{
    const cmdline::base_option o('d', "debug", "Echo the log to stderr");
    ATF_REQUIRE(o.has_short_name());
    ATF_REQUIRE_EQ('d', o.short_name());
    ATF_REQUIRE_EQ("debug", o.long_name());
    ATF_REQUIRE_EQ("Echo the log to stderr", o.description());
    ATF_REQUIRE(!o.needs_arg());
    ATF_REQUIRE(!o.has_default_value());
    ATF_REQUIRE_EQ("-d", o.format_short_name());
    ATF_REQUIRE_EQ("--debug", o.format_long_name());
}


ATF_TEST_CASE_WITHOUT_HEAD(base_option__short_name__with_arg);
ATF_TEST_CASE_BODY(base_option__short_name__with_arg)
{
    const cmdline::base_option o('T', "timelimit", "Time limit", "seconds");
    ATF_REQUIRE(o.needs_arg());
    ATF_REQUIRE_EQ("seconds", o.arg_name());
    ATF_REQUIRE(!o.has_default_value());
    ATF_REQUIRE_EQ("-T seconds", o.format_short_name());
    ATF_REQUIRE_EQ("--timelimit=seconds", o.format_long_name());
}


ATF_TEST_CASE_WITHOUT_HEAD(base_option__long_name__default);
ATF_TEST_CASE_BODY(base_option__long_name__default)
{
    const cmdline::base_option o("message", "Commit message", "text",
                                 "Results");
    ATF_REQUIRE(!o.has_short_name());
    ATF_REQUIRE_EQ("message", o.long_name());
    ATF_REQUIRE(o.needs_arg());
    ATF_REQUIRE(o.has_default_value());
    ATF_REQUIRE_EQ("Results", o.default_value());
    ATF_REQUIRE_EQ("--message=text", o.format_long_name());
}


ATF_TEST_CASE_WITHOUT_HEAD(bool_option);
ATF_TEST_CASE_BODY(bool_option)
{
    const cmdline::bool_option o1('c', "commit", "Commit results");
    ATF_REQUIRE_EQ('c', o1.short_name());
    ATF_REQUIRE(!o1.needs_arg());

    const cmdline::bool_option o2("version", "Print the version");
    ATF_REQUIRE(!o2.has_short_name());
    ATF_REQUIRE_EQ("version", o2.long_name());
    ATF_REQUIRE(!o2.needs_arg());
}


ATF_TEST_CASE_WITHOUT_HEAD(int_option__validate);
ATF_TEST_CASE_BODY(int_option__validate)
{
    const cmdline::int_option o('N', "numOfThreads", "Threads", "count", "1");
    ATF_REQUIRE_EQ("1", o.default_value());

    o.validate("4");
    o.validate("-1");
    ATF_REQUIRE_THROW_RE(cmdline::option_argument_value_error,
                         "Invalid argument 'four' for option --numOfThreads: "
                         "Not a valid integer", o.validate("four"));
    ATF_REQUIRE_THROW(cmdline::option_argument_value_error, o.validate(""));
    ATF_REQUIRE_THROW(cmdline::option_argument_value_error,
                      o.validate("1.5"));
}


ATF_TEST_CASE_WITHOUT_HEAD(int_option__convert);
ATF_TEST_CASE_BODY(int_option__convert)
{
    ATF_REQUIRE_EQ(900, cmdline::int_option::convert("900"));
    ATF_REQUIRE_EQ(-1, cmdline::int_option::convert("-1"));
}


ATF_TEST_CASE_WITHOUT_HEAD(string_option);
ATF_TEST_CASE_BODY(string_option)
{
    const cmdline::string_option o('o', "outputpath", "Output prefix",
                                   "path", "results/");
    ATF_REQUIRE_EQ("results/", o.default_value());
    o.validate("");
    o.validate("any value");
    ATF_REQUIRE_EQ("a b", cmdline::string_option::convert("a b"));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, base_option__short_name__no_arg);
    ATF_ADD_TEST_CASE(tcs, base_option__short_name__with_arg);
    ATF_ADD_TEST_CASE(tcs, base_option__long_name__default);
    ATF_ADD_TEST_CASE(tcs, bool_option);
    ATF_ADD_TEST_CASE(tcs, int_option__validate);
    ATF_ADD_TEST_CASE(tcs, int_option__convert);
    ATF_ADD_TEST_CASE(tcs, string_option);
}
