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

#include "store/transaction.hpp"

#include "store/backend.hpp"
#include "store/dbtypes.hpp"
#include "store/exceptions.hpp"
#include "utils/format/macros.hpp"
#include "utils/logging/macros.hpp"
#include "utils/optional.ipp"
#include "utils/sanity.hpp"
#include "utils/sqlite/database.hpp"
#include "utils/sqlite/exceptions.hpp"
#include "utils/sqlite/statement.hpp"
#include "utils/text/operations.ipp"

namespace sqlite = utils::sqlite;
namespace text = utils::text;


/// Internal implementation for a store transaction.
struct store::transaction::impl {
    /// The SQLite database this transaction deals with.
    sqlite::database _db;

    /// Whether the transaction has been committed or rolled back.
    bool _finished;

    /// Opens a transaction.
    ///
    /// \param backend_ The backend this transaction is connected to.
    ///
    /// \throw store::error If the transaction cannot be started.
    impl(backend& backend_) :
        _db(backend_.database()),
        _finished(false)
    {
        try {
            _db.exec("BEGIN TRANSACTION");
        } catch (const sqlite::error& e) {
            throw store::error(e.what());
        }
    }

    /// Destructor; rolls back the transaction if it is still open.
    ~impl(void)
    {
        if (!_finished) {
            try {
                _db.exec("ROLLBACK");
            } catch (const sqlite::error& e) {
                LW(F("Failed to roll back transaction: %s") % e.what());
            }
        }
    }

    /// Terminates the transaction.
    ///
    /// \param command The SQL command that terminates the transaction.
    ///
    /// \throw store::error If the command fails.
    void
    finish(const char* command)
    {
        PRE(!_finished);
        try {
            _db.exec(command);
            _finished = true;
        } catch (const sqlite::error& e) {
            throw store::error(e.what());
        }
    }
};


/// Creates a new transaction.
///
/// \param backend_ The backend this transaction belongs to.
store::transaction::transaction(backend& backend_) :
    _pimpl(new impl(backend_))
{
}


/// Destructor.
store::transaction::~transaction(void)
{
}


/// Commits the transaction.
///
/// \throw error If there is any problem when talking to the database.
void
store::transaction::commit(void)
{
    _pimpl->finish("COMMIT");
}


/// Rolls the transaction back.
///
/// \throw error If there is any problem when talking to the database.
void
store::transaction::rollback(void)
{
    _pimpl->finish("ROLLBACK");
}


/// Puts a benchmark into the database.
///
/// \param benchmark The benchmark to put.
/// \param tool_version The version of the tool used by the benchmark.
/// \param host_properties Properties of the host that runs the benchmark.
///
/// \return The identifier of the inserted benchmark.
///
/// \throw error If there is any problem when talking to the database.
int64_t
store::transaction::put_benchmark(
    const model::benchmark& benchmark, const std::string& tool_version,
    const std::map< std::string, std::string >& host_properties)
{
    try {
        sqlite::statement stmt = _pimpl->_db.create_statement(
            "INSERT INTO benchmarks (name, tool, tool_version, start_time, "
            "                        time_limit, memory_limit, core_limit, "
            "                        threads) "
            "VALUES (:name, :tool, :tool_version, :start_time, :time_limit, "
            "        :memory_limit, :core_limit, :threads)");
        stmt.bind(":name", benchmark.name());
        stmt.bind(":tool", benchmark.tool_name());
        stmt.bind(":tool_version", tool_version);
        bind_timestamp(stmt, ":start_time", benchmark.start_time());
        bind_optional_int(stmt, ":time_limit", benchmark.limits().time_limit());
        bind_optional_int(stmt, ":memory_limit",
                          benchmark.limits().memory_limit());
        bind_optional_int(stmt, ":core_limit", benchmark.limits().core_limit());
        stmt.bind(":threads", benchmark.threads());
        stmt.step_without_results();
        const int64_t benchmark_id = _pimpl->_db.last_insert_rowid();

        sqlite::statement prop_stmt = _pimpl->_db.create_statement(
            "INSERT INTO host_properties (benchmark_id, property_name, "
            "                             property_value) "
            "VALUES (:benchmark_id, :property_name, :property_value)");
        for (std::map< std::string, std::string >::const_iterator iter =
                 host_properties.begin(); iter != host_properties.end();
             ++iter) {
            prop_stmt.bind(":benchmark_id", benchmark_id);
            prop_stmt.bind(":property_name", (*iter).first);
            prop_stmt.bind(":property_value", (*iter).second);
            prop_stmt.step_without_results();
            prop_stmt.reset();
        }

        return benchmark_id;
    } catch (const sqlite::error& e) {
        throw error(e.what());
    }
}


/// Puts a run set into the database.
///
/// \param run_set The run set to put.
/// \param benchmark_id The benchmark this run set belongs to.
///
/// \return The identifier of the inserted run set.
///
/// \throw error If there is any problem when talking to the database.
int64_t
store::transaction::put_run_set(const model::run_set& run_set,
                                const int64_t benchmark_id)
{
    try {
        sqlite::statement stmt = _pimpl->_db.create_statement(
            "INSERT INTO run_sets (benchmark_id, name, options) "
            "VALUES (:benchmark_id, :name, :options)");
        stmt.bind(":benchmark_id", benchmark_id);
        stmt.bind(":name", run_set.name());
        stmt.bind(":options", text::join(run_set.options(), " "));
        stmt.step_without_results();
        return _pimpl->_db.last_insert_rowid();
    } catch (const sqlite::error& e) {
        throw error(e.what());
    }
}


/// Puts the result of a run into the database.
///
/// \param run The run that was executed.
/// \param result The outcome of the run.
/// \param category The category of the verdict of the run.
/// \param run_set_id The run set this run belongs to.
///
/// \return The identifier of the inserted run.
///
/// \throw error If there is any problem when talking to the database.
int64_t
store::transaction::put_run(const model::run& run,
                            const model::run_result& result,
                            const model::category category,
                            const int64_t run_set_id)
{
    try {
        sqlite::statement stmt = _pimpl->_db.create_statement(
            "INSERT INTO runs (run_set_id, task, log_file, verdict, "
            "                  category, exit_code, signal, timed_out, "
            "                  cpu_time, wall_time) "
            "VALUES (:run_set_id, :task, :log_file, :verdict, :category, "
            "        :exit_code, :signal, :timed_out, :cpu_time, "
            "        :wall_time)");
        stmt.bind(":run_set_id", run_set_id);
        stmt.bind(":task", run.task().str());
        stmt.bind(":log_file", run.log_file().str());
        stmt.bind(":verdict", result.get_verdict().str());
        stmt.bind(":category", std::string(model::category_name(category)));
        stmt.bind(":exit_code", result.exit_code());
        stmt.bind(":signal", result.signal());
        bind_bool(stmt, ":timed_out", result.timed_out());
        bind_delta(stmt, ":cpu_time", result.cpu_time());
        bind_delta(stmt, ":wall_time", result.wall_time());
        stmt.step_without_results();
        return _pimpl->_db.last_insert_rowid();
    } catch (const sqlite::error& e) {
        throw error(e.what());
    }
}
