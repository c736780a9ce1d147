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

#include "utils/process/status.hpp"

#include <sstream>

#include <atf-c++.hpp>

namespace process = utils::process;


ATF_TEST_CASE_WITHOUT_HEAD(fake_exited);
ATF_TEST_CASE_BODY(fake_exited)
{
    const process::status status = process::status::fake_exited(3);
    ATF_REQUIRE_EQ(-1, status.dead_pid());
    ATF_REQUIRE(status.exited());
    ATF_REQUIRE_EQ(3, status.exitstatus());
    ATF_REQUIRE(!status.signaled());
    ATF_REQUIRE_EQ(3, status.exit_code());
    ATF_REQUIRE_EQ(0, status.signal());
    ATF_REQUIRE(!status.success());

    ATF_REQUIRE(process::status::fake_exited(0).success());
}


ATF_TEST_CASE_WITHOUT_HEAD(fake_signaled);
ATF_TEST_CASE_BODY(fake_signaled)
{
    const process::status status = process::status::fake_signaled(9, false);
    ATF_REQUIRE(!status.exited());
    ATF_REQUIRE(status.signaled());
    ATF_REQUIRE_EQ(9, status.termsig());
    ATF_REQUIRE(!status.coredump());
    ATF_REQUIRE_EQ(0, status.exit_code());
    ATF_REQUIRE_EQ(9, status.signal());
    ATF_REQUIRE(!status.success());

    const process::status core = process::status::fake_signaled(6, true);
    ATF_REQUIRE(core.coredump());
    ATF_REQUIRE_EQ(6, core.signal());
}


ATF_TEST_CASE_WITHOUT_HEAD(compare_and_output);
ATF_TEST_CASE_BODY(compare_and_output)
{
    ATF_REQUIRE(process::status(10, 0) == process::status(10, 0));
    ATF_REQUIRE(process::status::fake_exited(1) !=
                process::status::fake_exited(2));

    std::ostringstream str;
    str << process::status::fake_exited(2);
    ATF_REQUIRE_EQ("status{exit_code=2, signal=0}", str.str());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, fake_exited);
    ATF_ADD_TEST_CASE(tcs, fake_signaled);
    ATF_ADD_TEST_CASE(tcs, compare_and_output);
}
