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

/// \file cli/common.hpp
/// Command-line options of vbench and their interpretation.

#if !defined(CLI_COMMON_HPP)
#define CLI_COMMON_HPP

#include <string>

#include "engine/config.hpp"
#include "utils/cmdline/options.hpp"
#include "utils/cmdline/parser.hpp"
#include "utils/datetime.hpp"

namespace cli {


extern const utils::cmdline::string_option rundefinition_option;
extern const utils::cmdline::string_option tasks_option;
extern const utils::cmdline::string_option name_option;
extern const utils::cmdline::string_option outputpath_option;
extern const utils::cmdline::int_option timelimit_option;
extern const utils::cmdline::int_option memorylimit_option;
extern const utils::cmdline::int_option numthreads_option;
extern const utils::cmdline::int_option limitcores_option;
extern const utils::cmdline::int_option maxlogfilesize_option;
extern const utils::cmdline::bool_option commit_option;
extern const utils::cmdline::string_option message_option;
extern const utils::cmdline::string_option starttime_option;
extern const utils::cmdline::bool_option debug_option;
extern const utils::cmdline::bool_option version_option;


utils::cmdline::options_vector all_options(void);
utils::datetime::timestamp parse_start_time(const std::string&);
engine::config config_from_cmdline(const utils::cmdline::parsed_cmdline&);


}  // namespace cli

#endif  // !defined(CLI_COMMON_HPP)
