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

#include "engine/system_info.hpp"

extern "C" {
#include <unistd.h>
}

#include <sstream>

#include <atf-c++.hpp>


ATF_TEST_CASE_WITHOUT_HEAD(probe_system_info);
ATF_TEST_CASE_BODY(probe_system_info)
{
    const engine::system_info info = engine::probe_system_info();

    char hostname[256];
    ATF_REQUIRE(::gethostname(hostname, sizeof(hostname)) != -1);
    hostname[sizeof(hostname) - 1] = '\0';
    ATF_REQUIRE_EQ(hostname, info.hostname);

    ATF_REQUIRE(!info.os.empty());
    ATF_REQUIRE(!info.cpu_model.empty());
    ATF_REQUIRE(info.cores >= 1);
    ATF_REQUIRE(info.memory > 0);
}


ATF_TEST_CASE_WITHOUT_HEAD(output);
ATF_TEST_CASE_BODY(output)
{
    std::ostringstream str;
    str << engine::system_info("host", "Linux 4.0", "Some CPU", 4, 1024);
    ATF_REQUIRE_EQ("system_info{hostname='host', os='Linux 4.0', "
                   "cpu_model='Some CPU', cores=4, memory=1024}", str.str());
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, probe_system_info);
    ATF_ADD_TEST_CASE(tcs, output);
}
