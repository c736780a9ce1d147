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
#include <sys/sysinfo.h>
#include <sys/utsname.h>

#include <unistd.h>
}

#include <fstream>

#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/text/operations.hpp"

namespace text = utils::text;


namespace {


/// Value reported for properties that cannot be determined.
static const char* unknown_value = "unknown";


/// Queries the name of the host.
///
/// \return The host name or "unknown".
static std::string
probe_hostname(void)
{
    char name[256];
    if (::gethostname(name, sizeof(name)) == -1) {
        LW("gethostname(2) failed; cannot determine the host name");
        return unknown_value;
    }
    name[sizeof(name) - 1] = '\0';
    return name;
}


/// Queries the name and release of the operating system.
///
/// \return The system name and release, or "unknown".
static std::string
probe_os(void)
{
    struct ::utsname uts;
    if (::uname(&uts) == -1) {
        LW("uname(2) failed; cannot determine the operating system");
        return unknown_value;
    }
    return F("%s %s") % uts.sysname % uts.release;
}


/// Queries the model of the CPU from /proc/cpuinfo.
///
/// \return The model name of the first CPU, or "unknown".
static std::string
probe_cpu_model(void)
{
    std::ifstream input("/proc/cpuinfo");
    std::string line;
    while (std::getline(input, line)) {
        if (line.compare(0, 10, "model name") != 0)
            continue;
        const std::string::size_type colon = line.find(':');
        if (colon == std::string::npos)
            continue;
        const std::string value = text::strip(line.substr(colon + 1));
        if (!value.empty())
            return value;
    }
    LD("No CPU model name in /proc/cpuinfo");
    return unknown_value;
}


}  // anonymous namespace


/// Constructs a new system_info.
///
/// \param hostname_ Name of the host.
/// \param os_ Name and release of the operating system.
/// \param cpu_model_ Model name of the CPU.
/// \param cores_ Number of online cores.
/// \param memory_ Total physical memory in bytes.
engine::system_info::system_info(const std::string& hostname_,
                                 const std::string& os_,
                                 const std::string& cpu_model_,
                                 const int cores_,
                                 const uint64_t memory_) :
    hostname(hostname_),
    os(os_),
    cpu_model(cpu_model_),
    cores(cores_),
    memory(memory_)
{
}


/// Equality comparator.
///
/// \param other The object to compare to.
///
/// \return True if the two objects are equal; false otherwise.
bool
engine::system_info::operator==(const system_info& other) const
{
    return hostname == other.hostname && os == other.os &&
        cpu_model == other.cpu_model && cores == other.cores &&
        memory == other.memory;
}


/// Injects the object into a stream.
///
/// \param output The stream into which to inject the object.
/// \param object The object to format.
///
/// \return The output stream.
std::ostream&
engine::operator<<(std::ostream& output, const system_info& object)
{
    output << F("system_info{hostname=%s, os=%s, cpu_model=%s, cores=%s, "
                "memory=%s}")
        % text::quote(object.hostname, '\'') % text::quote(object.os, '\'')
        % text::quote(object.cpu_model, '\'') % object.cores % object.memory;
    return output;
}


/// Gathers the properties of the current host.
///
/// Properties that cannot be determined are reported as unknown or zero;
/// the probe never fails.
///
/// \return The properties of the host.
engine::system_info
engine::probe_system_info(void)
{
    long cores = ::sysconf(_SC_NPROCESSORS_ONLN);
    if (cores == -1) {
        LW("sysconf(_SC_NPROCESSORS_ONLN) failed; assuming 1 core");
        cores = 1;
    }

    uint64_t memory = 0;
    struct ::sysinfo info;
    if (::sysinfo(&info) == 0)
        memory = static_cast< uint64_t >(info.totalram) * info.mem_unit;
    else
        LW("sysinfo(2) failed; cannot determine the amount of memory");

    return system_info(probe_hostname(), probe_os(), probe_cpu_model(),
                       static_cast< int >(cores), memory);
}
