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
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "utils/datetime.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;
namespace logging = utils::logging;

using utils::none;
using utils::optional;


namespace {


/// The user-provided log level; entries below it are discarded.
static logging::level log_level = logging::level_debug;


/// First time recorded by the logging module.
static optional< datetime::timestamp > first_timestamp = none;


/// In-memory record of log entries before persistency is enabled.
static std::vector< std::pair< logging::level, std::string > > backlog;


/// Stream to the currently open log file.
static std::unique_ptr< std::ostream > logfile;


/// Stream to which entries at or above the log level are echoed.
static std::ostream* echo_stream = NULL;


/// Serializes access to the state above from concurrent threads.
static std::mutex log_mutex;


/// Constant string to strftime to format timestamps in the log file.
static const char* timestamp_format = "%Y%m%d-%H%M%S";


/// Constant string to strftime to format timestamps in the echoed entries.
static const char* echo_timestamp_format = "%Y-%m-%d %H:%M:%S";


/// Converts a level to a printable character.
///
/// \param level The level to convert.
///
/// \return The printable character, to be used in log messages.
static char
level_to_char(const logging::level level)
{
    switch (level) {
    case logging::level_error: return 'E';
    case logging::level_warning: return 'W';
    case logging::level_info: return 'I';
    case logging::level_debug: return 'D';
    }
    UNREACHABLE;
}


/// Converts a level to its name, as shown in echoed entries.
///
/// \param level The level to convert.
///
/// \return The upper-case name of the level.
static const char*
level_to_name(const logging::level level)
{
    switch (level) {
    case logging::level_error: return "ERROR";
    case logging::level_warning: return "WARNING";
    case logging::level_info: return "INFO";
    case logging::level_debug: return "DEBUG";
    }
    UNREACHABLE;
}


/// Parses a textual log level.
///
/// \param text The textual level, as provided by the user.
///
/// \return The parsed level.
///
/// \throw std::range_error If the input level is invalid.
static logging::level
parse_level(const std::string& text)
{
    if (text == "error")
        return logging::level_error;
    else if (text == "warning")
        return logging::level_warning;
    else if (text == "info")
        return logging::level_info;
    else if (text == "debug")
        return logging::level_debug;
    else
        throw std::range_error(F("Unrecognized log level '%s'") % text);
}


}  // anonymous namespace


/// Generates a standard log name.
///
/// This always adds the same timestamp to the log name for a particular run.
/// Also, the timestamp added to the file name corresponds to the first
/// timestamp recorded by the module; it does not necessarily contain the
/// current value of "now".
///
/// \param logdir The path to the directory in which to place the log.
/// \param progname The name of the program that is generating the log.
///
/// \return A string representation of the log name based on \p logdir and
/// \p progname.
fs::path
logging::generate_log_name(const fs::path& logdir, const std::string& progname)
{
    std::lock_guard< std::mutex > lock(log_mutex);
    if (!first_timestamp)
        first_timestamp = datetime::timestamp::now();
    return logdir / (F("%s.%s.log") % progname %
                     first_timestamp.get().strftime(timestamp_format));
}


/// Logs an entry to the log file.
///
/// If the log is not yet set to persistent mode, the entry is recorded in the
/// in-memory backlog.  Otherwise, it is just written to disk.  Entries as
/// severe as the configured level or more are also echoed, if an echo stream
/// has been set.
///
/// \param message_level The level of the entry.
/// \param file The file from which the log message is generated.
/// \param line The line from which the log message is generated.
/// \param user_message The raw message to store.
void
logging::log(const level message_level, const char* file, const int line,
             const std::string& user_message)
{
    std::lock_guard< std::mutex > lock(log_mutex);

    const datetime::timestamp now = datetime::timestamp::now();
    if (!first_timestamp)
        first_timestamp = now;

    if (echo_stream != NULL && message_level <= log_level)
        (*echo_stream) << now.strftime(echo_timestamp_format) << " - "
                       << level_to_name(message_level) << " - "
                       << user_message << '\n';

    if (logfile.get() == NULL) {
        const std::string message = F("%s %c %d %s:%d: %s") %
            now.strftime(timestamp_format) % level_to_char(message_level) %
            ::getpid() % file % line % user_message;
        backlog.push_back(std::make_pair(message_level, message));
    } else if (message_level <= log_level) {
        INV(backlog.empty());
        (*logfile) << (F("%s %c %d %s:%d: %s") %
                       now.strftime(timestamp_format) %
                       level_to_char(message_level) % ::getpid() % file %
                       line % user_message).str()
                   << '\n';
        (*logfile).flush();
    }
}


/// Makes the log persistent.
///
/// Calling this function flushes the in-memory log, if any, to disk and sets
/// the logging module to send log entries to disk from this point onwards.
/// There is no way back, and the caller program should execute this function as
/// early as possible to ensure that a crash at startup does not discard too
/// many useful log entries.
///
/// Any previously-set log file is closed.  Backlog entries below the new
/// level are dropped.
///
/// \param new_level The textual level to set the logging to.
/// \param path The file to write the logs to.
///
/// \throw std::range_error If the given log level is invalid.
/// \throw std::runtime_error If the given file cannot be created.
void
logging::set_persistency(const std::string& new_level, const fs::path& path)
{
    const level parsed_level = parse_level(new_level);

    std::lock_guard< std::mutex > lock(log_mutex);
    std::unique_ptr< std::ofstream > new_logfile(
        new std::ofstream(path.c_str()));
    if (!(*new_logfile))
        throw std::runtime_error(F("Failed to create log file %s") % path);

    log_level = parsed_level;
    logfile.reset(new_logfile.release());
    for (std::vector< std::pair< level, std::string > >::const_iterator
             iter = backlog.begin(); iter != backlog.end(); ++iter) {
        if ((*iter).first <= log_level)
            (*logfile) << (*iter).second << '\n';
    }
    (*logfile).flush();
    backlog.clear();
}


/// Sets the stream to which relevant log entries are echoed.
///
/// \param output The stream to use, or NULL to disable echoing.  The stream
///     must remain valid until the echo is disabled.
void
logging::set_echo(std::ostream* output)
{
    std::lock_guard< std::mutex > lock(log_mutex);
    echo_stream = output;
}
