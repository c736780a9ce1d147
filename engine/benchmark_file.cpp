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

#include "engine/benchmark_file.hpp"

#include <algorithm>
#include <stdexcept>

#include <lutok/exceptions.hpp>
#include <lutok/operations.hpp>
#include <lutok/stack_cleaner.hpp>
#include <lutok/state.ipp>

#include "engine/exceptions.hpp"
#include "engine/tool.hpp"
#include "model/resource_limits.hpp"
#include "model/run.hpp"
#include "model/run_set.hpp"
#include "model/task_set.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/operations.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"

namespace datetime = utils::datetime;
namespace fs = utils::fs;

using utils::none;
using utils::optional;


namespace {


/// Format of the start time in the name of the output files.
static const char* output_time_format = "%Y-%m-%d_%H%M";


/// A run definition as declared in a benchmark file.
struct run_definition {
    /// Name of the run definition.
    std::string name;

    /// Options for the tool.
    std::vector< std::string > options;

    /// Property file for the tasks that do not specify their own.
    optional< fs::path > property_file;
};


/// Error raised when the contents of a benchmark table are invalid.
class format_error : public std::runtime_error {
public:
    /// Constructs a new error.
    ///
    /// \param message Description of the problem.
    explicit format_error(const std::string& message) :
        std::runtime_error(message)
    {
    }
};


/// Pushes the value of a field of the table on top of the stack.
///
/// \param state The Lua state.
/// \param field The name of the field.
static void
push_field(lutok::state& state, const std::string& field)
{
    state.push_string(field);
    state.get_table(-2);
}


/// Gets an optional string field of the table on top of the stack.
///
/// \param state The Lua state.
/// \param field The name of the field.
/// \param context Description of the table for error messages.
///
/// \return The value of the field, or none if it is not set.
///
/// \throw format_error If the field is not a string.
static optional< std::string >
get_string(lutok::state& state, const std::string& field,
           const std::string& context)
{
    lutok::stack_cleaner cleaner(state);
    push_field(state, field);
    if (state.is_nil(-1))
        return none;
    if (!state.is_string(-1) || state.is_number(-1))
        throw format_error(F("%s: '%s' must be a string") % context % field);
    return utils::make_optional(state.to_string(-1));
}


/// Gets an optional integer field of the table on top of the stack.
///
/// \param state The Lua state.
/// \param field The name of the field.
/// \param context Description of the table for error messages.
///
/// \return The value of the field, or none if it is not set.
///
/// \throw format_error If the field is not a number.
static optional< int >
get_int(lutok::state& state, const std::string& field,
        const std::string& context)
{
    lutok::stack_cleaner cleaner(state);
    push_field(state, field);
    if (state.is_nil(-1))
        return none;
    if (!state.is_number(-1))
        throw format_error(F("%s: '%s' must be a number") % context % field);
    return utils::make_optional(static_cast< int >(state.to_integer(-1)));
}


/// Gets an optional list of strings of the table on top of the stack.
///
/// \param state The Lua state.
/// \param field The name of the field.
/// \param context Description of the table for error messages.
///
/// \return The values of the list in order; empty if the field is not set.
///
/// \throw format_error If the field is not a table of strings.
static std::vector< std::string >
get_string_list(lutok::state& state, const std::string& field,
                const std::string& context)
{
    lutok::stack_cleaner cleaner(state);
    push_field(state, field);
    if (state.is_nil(-1))
        return std::vector< std::string >();
    if (!state.is_table(-1))
        throw format_error(F("%s: '%s' must be a table") % context % field);

    std::vector< std::string > values;
    for (int i = 1; ; i++) {
        state.push_integer(i);
        state.get_table(-2);
        if (state.is_nil(-1)) {
            state.pop(1);
            break;
        }
        if (!state.is_string(-1)) {
            throw format_error(F("%s: '%s' must only contain strings") %
                               context % field);
        }
        values.push_back(state.to_string(-1));
        state.pop(1);
    }
    return values;
}


/// Calls a function for every table of a list in the table on top of the
/// stack.
///
/// The element being processed is on top of the stack when the function is
/// invoked.
///
/// \param state The Lua state.
/// \param field The name of the field holding the list.
/// \param hook The function to call for every element, with its position.
///
/// \throw format_error If the field is not a list of tables.
template< typename Hook >
static void
for_each_table(lutok::state& state, const std::string& field, Hook hook)
{
    lutok::stack_cleaner cleaner(state);
    push_field(state, field);
    if (state.is_nil(-1))
        return;
    if (!state.is_table(-1))
        throw format_error(F("'%s' must be a table") % field);

    for (int i = 1; ; i++) {
        state.push_integer(i);
        state.get_table(-2);
        if (state.is_nil(-1)) {
            state.pop(1);
            break;
        }
        if (!state.is_table(-1))
            throw format_error(F("Element %s of '%s' must be a table") % i %
                               field);
        hook(i);
        state.pop(1);
    }
}


/// Resolves a path of the benchmark file against its directory.
///
/// \param directory Directory containing the benchmark file.
/// \param name The path as written in the benchmark file.
///
/// \return The path to use.
static fs::path
resolve(const fs::path& directory, const std::string& name)
{
    const fs::path path(name);
    if (path.is_absolute())
        return path;
    else
        return directory / path;
}


/// Combines a limit of the benchmark file with the command line.
///
/// \param file_value The limit set in the benchmark file, if any.
/// \param override_value The limit given in the command line, if any; -1
///     disables the limit.
/// \param name The name of the limit for error messages.
///
/// \return The limit to apply.
///
/// \throw format_error If the resulting limit is not positive.
static optional< int >
merge_limit(const optional< int >& file_value,
            const optional< int >& override_value, const char* name)
{
    optional< int > limit = file_value;
    if (override_value) {
        if (override_value.get() == -1)
            limit = none;
        else
            limit = override_value;
    }
    if (limit && limit.get() <= 0)
        throw format_error(F("Invalid %s %s; must be positive") % name %
                           limit.get());
    return limit;
}


/// Checks whether a name has been selected.
///
/// \param selection The selected names; empty means all.
/// \param name The name to check.
///
/// \return True if the name is selected.
static bool
is_selected(const std::vector< std::string >& selection,
            const std::string& name)
{
    return selection.empty() ||
        std::find(selection.begin(), selection.end(), name) !=
        selection.end();
}


/// Warns about selected names that do not exist.
///
/// \param selection The selected names.
/// \param existing The names defined in the benchmark file.
/// \param what Description of the kind of names.
/// \param file The benchmark file.
static void
warn_unknown(const std::vector< std::string >& selection,
             const std::vector< std::string >& existing, const char* what,
             const fs::path& file)
{
    for (std::vector< std::string >::const_iterator iter = selection.begin();
         iter != selection.end(); ++iter) {
        if (std::find(existing.begin(), existing.end(), *iter) ==
            existing.end())
            LW(F("The selected %s '%s' is not defined in %s") % what % *iter %
               file);
    }
}


/// Parses a benchmark file into a benchmark.
///
/// \param file The benchmark file.
/// \param config The configuration of the program.
/// \param start_time The start time of the benchmark.
///
/// \return The loaded benchmark.
///
/// \throw std::runtime_error If the file is invalid.
static model::benchmark
parse_benchmark(const fs::path& file, const engine::config& config,
                const datetime::timestamp& start_time)
{
    const fs::path directory = file.branch_path();

    lutok::state state;
    state.open_base();
    state.open_string();
    state.open_table();
    lutok::stack_cleaner cleaner(state);

    lutok::do_file(state, file.str(), 0, 0, 0);

    state.get_global("benchmark");
    if (!state.is_table(-1))
        throw format_error("The global 'benchmark' table is not defined");

    const optional< std::string > tool_name = get_string(state, "tool",
                                                         "benchmark");
    if (!tool_name)
        throw format_error("benchmark: 'tool' is not defined");
    (void)engine::find_tool(tool_name.get());

    const model::resource_limits limits(
        merge_limit(get_int(state, "timelimit", "benchmark"),
                    config.time_limit(), "time limit"),
        merge_limit(get_int(state, "memlimit", "benchmark"),
                    config.memory_limit(), "memory limit"),
        merge_limit(get_int(state, "cpucores", "benchmark"),
                    config.core_limit(), "core limit"));

    int threads = 1;
    const optional< int > file_threads = get_int(state, "threads",
                                                 "benchmark");
    if (config.num_threads())
        threads = config.num_threads().get();
    else if (file_threads)
        threads = file_threads.get();
    if (threads <= 0)
        throw format_error(F("Invalid number of threads %s") % threads);

    const std::vector< std::string > options = get_string_list(
        state, "options", "benchmark");

    std::vector< run_definition > run_definitions;
    std::vector< std::string > run_definition_names;
    for_each_table(state, "rundefinitions", [&](const int position) {
        const std::string context = F("rundefinitions[%s]") % position;
        run_definition definition;
        const optional< std::string > name = get_string(state, "name",
                                                        context);
        definition.name = name ? name.get() : (F("run%s") % position).str();
        definition.options = get_string_list(state, "options", context);
        const optional< std::string > property_file = get_string(
            state, "propertyfile", context);
        if (property_file)
            definition.property_file = resolve(directory,
                                               property_file.get());
        run_definition_names.push_back(definition.name);
        if (is_selected(config.run_definitions(), definition.name))
            run_definitions.push_back(definition);
    });
    warn_unknown(config.run_definitions(), run_definition_names,
                 "run definition", file);

    std::vector< model::task_set > task_sets;
    std::vector< std::string > task_set_names;
    for_each_table(state, "tasks", [&](const int position) {
        const std::string context = F("tasks[%s]") % position;
        const optional< std::string > name = get_string(state, "name",
                                                        context);
        if (!name)
            throw format_error(F("%s: 'name' is not defined") % context);
        task_set_names.push_back(name.get());
        if (!is_selected(config.task_sets(), name.get()))
            return;

        std::vector< fs::path > files;
        const std::vector< std::string > patterns = get_string_list(
            state, "files", context);
        for (std::vector< std::string >::const_iterator iter =
                 patterns.begin(); iter != patterns.end(); ++iter) {
            const std::vector< fs::path > matches = fs::glob(
                resolve(directory, *iter).str());
            if (matches.empty())
                LW(F("No files found matching '%s' in task set '%s'") %
                   *iter % name.get());
            files.insert(files.end(), matches.begin(), matches.end());
        }

        optional< fs::path > property_file;
        const optional< std::string > raw_property_file = get_string(
            state, "propertyfile", context);
        if (raw_property_file)
            property_file = resolve(directory, raw_property_file.get());

        task_sets.push_back(model::task_set(
            name.get(), files, property_file,
            get_string_list(state, "options", context)));
    });
    warn_unknown(config.task_sets(), task_set_names, "task set", file);

    const std::string name = config.name() ? config.name().get() :
        file.leaf_name().substr(0, file.leaf_name().rfind('.'));
    const std::string output_base =
        normalize_output_path(config.output_path()) + name + "." +
        start_time.strftime(output_time_format);
    const std::string log_folder = output_base + ".logfiles/";

    std::vector< model::run_set > run_sets;
    for (std::vector< run_definition >::const_iterator definition =
             run_definitions.begin(); definition != run_definitions.end();
         ++definition) {
        std::vector< model::run > runs;
        for (std::vector< model::task_set >::const_iterator task_set =
                 task_sets.begin(); task_set != task_sets.end(); ++task_set) {
            std::vector< std::string > run_options = (*definition).options;
            run_options.insert(run_options.end(),
                               (*task_set).options().begin(),
                               (*task_set).options().end());
            const optional< fs::path > property_file =
                (*task_set).property_file() ? (*task_set).property_file() :
                (*definition).property_file;

            for (std::vector< fs::path >::const_iterator task =
                     (*task_set).files().begin();
                 task != (*task_set).files().end(); ++task) {
                runs.push_back(model::run(
                    *task, run_options, property_file,
                    fs::path(log_folder + (*definition).name + "." +
                             (*task).leaf_name() + ".log")));
            }
        }
        run_sets.push_back(model::run_set((*definition).name,
                                          (*definition).options, runs));
    }
    if (run_sets.empty())
        LW(F("No run definitions selected in %s") % file);

    return model::benchmark(name, tool_name.get(), file, task_sets, run_sets,
                            limits, threads, options, start_time,
                            output_base);
}


}  // anonymous namespace


/// Normalizes the path in which to store the results of benchmarks.
///
/// The path is used as a prefix for the names of the output files.  If it
/// names a directory, it is returned with exactly one trailing separator;
/// otherwise it is returned as is.
///
/// \param output_path The path given by the user.
///
/// \return The normalized prefix.
std::string
engine::normalize_output_path(const std::string& output_path)
{
    std::string normalized = output_path;
    while (normalized.length() > 1 &&
           normalized[normalized.length() - 1] == '/' &&
           normalized[normalized.length() - 2] == '/')
        normalized.erase(normalized.length() - 1);

    if (!normalized.empty() && normalized[normalized.length() - 1] != '/' &&
        fs::is_directory(fs::path(normalized)))
        normalized += '/';
    return normalized;
}


/// Loads a benchmark from a benchmark file.
///
/// \param file The benchmark file to load.
/// \param config The configuration of the program, which selects the run
///     definitions and task sets and overrides the limits of the file.
/// \param start_time The start time of the benchmark.
///
/// \return The loaded benchmark.
///
/// \throw load_error If the file cannot be loaded.
model::benchmark
engine::load_benchmark(const fs::path& file, const config& config,
                       const datetime::timestamp& start_time)
{
    LI(F("Loading benchmark file %s") % file);
    try {
        return parse_benchmark(file, config, start_time);
    } catch (const load_error& unused_error) {
        throw;
    } catch (const std::runtime_error& e) {
        throw load_error(file, e.what());
    }
}
