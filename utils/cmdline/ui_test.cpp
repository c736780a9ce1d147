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

#include "utils/cmdline/ui.hpp"

#include <atf-c++.hpp>

#include "utils/cmdline/globals.hpp"
#include "utils/cmdline/ui_mock.hpp"

namespace cmdline = utils::cmdline;


ATF_TEST_CASE_WITHOUT_HEAD(ui_mock__logs);
ATF_TEST_CASE_BODY(ui_mock__logs)
{
    cmdline::ui_mock ui;
    ui.out("first");
    ui.err("second");
    ui.out("");

    ATF_REQUIRE_EQ(2, ui.out_log().size());
    ATF_REQUIRE_EQ("first", ui.out_log()[0]);
    ATF_REQUIRE_EQ("", ui.out_log()[1]);
    ATF_REQUIRE_EQ(1, ui.err_log().size());
    ATF_REQUIRE_EQ("second", ui.err_log()[0]);
}


ATF_TEST_CASE_WITHOUT_HEAD(ui__out);
ATF_TEST_CASE_BODY(ui__out)
{
    cmdline::ui ui;
    ui.out("A message for stdout");
}


ATF_TEST_CASE_WITHOUT_HEAD(ui__err);
ATF_TEST_CASE_BODY(ui__err)
{
    cmdline::ui ui;
    ui.err("A message for stderr");
}


ATF_TEST_CASE_WITHOUT_HEAD(print_error);
ATF_TEST_CASE_BODY(print_error)
{
    cmdline::init("error-program");
    cmdline::ui_mock ui;
    cmdline::print_error(&ui, "The error.");
    ATF_REQUIRE(ui.out_log().empty());
    ATF_REQUIRE_EQ(1, ui.err_log().size());
    ATF_REQUIRE_EQ("error-program: E: The error.", ui.err_log()[0]);
}


ATF_TEST_CASE_WITHOUT_HEAD(print_info);
ATF_TEST_CASE_BODY(print_info)
{
    cmdline::init("/usr/bin/info-program");
    cmdline::ui_mock ui;
    cmdline::print_info(&ui, "The info.");
    ATF_REQUIRE(ui.out_log().empty());
    ATF_REQUIRE_EQ(1, ui.err_log().size());
    ATF_REQUIRE_EQ("info-program: I: The info.", ui.err_log()[0]);
}


ATF_TEST_CASE_WITHOUT_HEAD(print_warning);
ATF_TEST_CASE_BODY(print_warning)
{
    cmdline::init("warning-program");
    cmdline::ui_mock ui;
    cmdline::print_warning(&ui, "The warning.");
    ATF_REQUIRE(ui.out_log().empty());
    ATF_REQUIRE_EQ(1, ui.err_log().size());
    ATF_REQUIRE_EQ("warning-program: W: The warning.", ui.err_log()[0]);
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, ui_mock__logs);
    ATF_ADD_TEST_CASE(tcs, ui__out);
    ATF_ADD_TEST_CASE(tcs, ui__err);
    ATF_ADD_TEST_CASE(tcs, print_error);
    ATF_ADD_TEST_CASE(tcs, print_info);
    ATF_ADD_TEST_CASE(tcs, print_warning);
}
