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

/// \file engine/system_info.hpp
/// Description of the machine that executes a benchmark.

#if !defined(ENGINE_SYSTEM_INFO_HPP)
#define ENGINE_SYSTEM_INFO_HPP

#include <cstdint>
#include <ostream>
#include <string>

namespace engine {


/// Properties of the host that are recorded along with the results.
struct system_info {
    /// Name of the host.
    std::string hostname;

    /// Name and release of the operating system.
    std::string os;

    /// Model name of the CPU.
    std::string cpu_model;

    /// Number of online cores.
    int cores;

    /// Total physical memory in bytes.
    uint64_t memory;

    system_info(const std::string&, const std::string&, const std::string&,
                const int, const uint64_t);

    bool operator==(const system_info&) const;
};


std::ostream& operator<<(std::ostream&, const system_info&);


system_info probe_system_info(void);


}  // namespace engine

#endif  // !defined(ENGINE_SYSTEM_INFO_HPP)
