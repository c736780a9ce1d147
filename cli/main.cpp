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

#include "cli/main.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

#include "cli/common.hpp"
#include "engine/exceptions.hpp"
#include "engine/tool.hpp"
#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/globals.hpp"
#include "utils/cmdline/parser.ipp"
#include "utils/env.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/operations.hpp"
#include "utils/logging/macros.hpp"
#include "utils/logging/operations.hpp"
#include "utils/optional.ipp"
#include "utils/signals/interrupts.hpp"

namespace cmdline = utils::cmdline;
namespace fs = utils::fs;
namespace logging = utils::logging;
namespace signals = utils::signals;

using utils::optional;


namespace {


/// Sets up the log file of the program.
///
/// Problems creating the log file are reported as warnings only; the log
/// entries are kept in memory in that case.
///
/// \param ui Object to interact with the I/O of the program.
/// \param debug Whether debugging output was requested.
static void
setup_logging(cmdline::ui* ui, const bool debug)
{
    const fs::path log_name = cli::detail::default_log_name();
    try {
        fs::mkdir_p(log_name.branch_path(), 0755);
        logging::set_persistency(debug ? "debug" : "info", log_name);
    } catch (const std::runtime_error& e) {
        cmdline::print_warning(ui, F("Cannot create log file %s: %s") %
                               log_name % e.what());
    }
    if (debug)
        logging::set_echo(&std::cerr);
}


/// Tells the user that the benchmarks did not run to completion.
///
/// \param ui Object to interact with the I/O of the program.
static void
report_interruption(cmdline::ui* ui)
{
    cmdline::print_info(ui, "Script was interrupted by user, some runs "
                        "may not be done.");
}


/// Executes the benchmarks requested in the command line.
///
/// \param ui Object to interact with the I/O of the program.
/// \param argc The number of arguments passed on the command line.
/// \param argv NULL-terminated array containing the command line arguments.
/// \param orchestrator The driver of the benchmarks.
///
/// \return The exit code of the program.
///
/// \throw cmdline::usage_error If the command line is invalid.
static int
safe_main(cmdline::ui* ui, int argc, const char* const argv[],
          engine::orchestrator& orchestrator)
{
    const cmdline::parsed_cmdline cmdline = cmdline::parse(
        argc, argv, cli::all_options());

    if (cmdline.has_option(cli::version_option.long_name())) {
        ui->out(F("%s %s") % cmdline::progname() % VBENCH_VERSION);
        return EXIT_SUCCESS;
    }

    setup_logging(ui, cmdline.has_option(cli::debug_option.long_name()));
    const engine::config config = cli::config_from_cmdline(cmdline);
    engine::register_tools();

    int exit_code;
    try {
        exit_code = orchestrator.start(config);
    } catch (...) {
        if (orchestrator.interrupted())
            report_interruption(ui);
        throw;
    }
    if (orchestrator.interrupted()) {
        report_interruption(ui);
        const int signo = signals::fired_signal();
        if (orchestrator.completed_benchmarks() == 0 && signo != -1)
            return 128 + signo;
    }
    return exit_code;
}


}  // anonymous namespace


/// Computes the path to the default log file.
///
/// The log goes to ~/.vbench/logs if HOME is defined, or to the temporary
/// directory otherwise.
///
/// \return The path to the log file.
fs::path
cli::detail::default_log_name(void)
{
    const optional< fs::path > home = utils::get_home();
    if (home) {
        return logging::generate_log_name(home.get() / ".vbench" / "logs",
                                          cmdline::progname());
    } else {
        const std::string tmpdir = utils::getenv_with_default("TMPDIR",
                                                              "/tmp");
        return logging::generate_log_name(fs::path(tmpdir),
                                          cmdline::progname());
    }
}


/// Testable entry point, with catch-all exception handlers.
///
/// \param ui Object to interact with the I/O of the program.
/// \param argc The number of arguments passed on the command line.
/// \param argv NULL-terminated array containing the command line arguments.
/// \param orchestrator The driver of the benchmarks.
///
/// \return 0 on success, some other integer on error.
int
cli::main(cmdline::ui* ui, const int argc, const char* const* const argv,
          engine::orchestrator& orchestrator)
{
    try {
        return safe_main(ui, argc, argv, orchestrator);
    } catch (const cmdline::usage_error& e) {
        cmdline::print_error(ui, F("Usage error: %s.") % e.what());
        return EXIT_FAILURE;
    } catch (const engine::existing_results_error& e) {
        cmdline::print_error(ui, e.what());
        return EXIT_FAILURE;
    } catch (const engine::load_error& e) {
        cmdline::print_error(ui, e.what());
        return EXIT_FAILURE;
    } catch (const std::runtime_error& e) {
        cmdline::print_error(ui, F("%s.") % e.what());
        return EXIT_FAILURE;
    }
}


/// Delegate for ::main().
///
/// This function is supposed to be called directly from the top-level ::main()
/// function.  It takes care of initializing internal libraries, installing the
/// handlers of the interrupt signals and then calls the testable entry point.
///
/// \param argc The number of arguments passed on the command line.
/// \param argv NULL-terminated array containing the command line arguments.
///
/// \return 0 on success, some other integer on error.
int
cli::main(const int argc, const char* const* const argv)
{
    cmdline::init(argv[0]);
    cmdline::ui ui;

    engine::orchestrator orchestrator;
    signals::setup_interrupts(
        [&orchestrator](const int signo) {
            LI(F("Stopping benchmarks due to signal %s") % signo);
            orchestrator.stop();
        });

    return main(&ui, argc, argv, orchestrator);
}
