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

/// \file engine/config.hpp
/// Run-time configuration of the benchmark orchestrator.

#if !defined(ENGINE_CONFIG_HPP)
#define ENGINE_CONFIG_HPP

#include <memory>
#include <string>
#include <vector>

#include "utils/datetime.hpp"
#include "utils/fs/path.hpp"
#include "utils/optional.hpp"

namespace engine {


class config_builder;


/// Immutable snapshot of the options that control a benchmark execution.
///
/// Limits are tri-state: none if the user did not provide a value (and thus
/// the benchmark definition decides), -1 if the user disabled the limit, or a
/// positive value otherwise.
class config {
    struct impl;

    /// Pointer to the shared internal implementation.
    std::shared_ptr< impl > _pimpl;

    friend class config_builder;
    explicit config(std::shared_ptr< impl >);

public:
    ~config(void);

    const std::vector< utils::fs::path >& benchmark_files(void) const;
    const std::vector< std::string >& run_definitions(void) const;
    const std::vector< std::string >& task_sets(void) const;
    const utils::optional< std::string >& name(void) const;
    const std::string& output_path(void) const;
    const utils::optional< int >& time_limit(void) const;
    const utils::optional< int >& memory_limit(void) const;
    const utils::optional< int >& num_threads(void) const;
    const utils::optional< int >& core_limit(void) const;
    const utils::optional< int >& max_logfile_size(void) const;
    bool commit(void) const;
    const std::string& commit_message(void) const;
    const utils::optional< utils::datetime::timestamp >& start_time(
        void) const;
    bool debug(void) const;
};


/// Builder for config objects.
class config_builder {
    /// The data being built.
    std::shared_ptr< config::impl > _data;

public:
    config_builder(void);
    ~config_builder(void);

    config_builder& add_benchmark_file(const utils::fs::path&);
    config_builder& add_run_definition(const std::string&);
    config_builder& add_task_set(const std::string&);
    config_builder& set_name(const std::string&);
    config_builder& set_output_path(const std::string&);
    config_builder& set_time_limit(const int);
    config_builder& set_memory_limit(const int);
    config_builder& set_num_threads(const int);
    config_builder& set_core_limit(const int);
    config_builder& set_max_logfile_size(const int);
    config_builder& set_commit(const bool);
    config_builder& set_commit_message(const std::string&);
    config_builder& set_start_time(const utils::datetime::timestamp&);
    config_builder& set_debug(const bool);

    config build(void) const;
};


}  // namespace engine

#endif  // !defined(ENGINE_CONFIG_HPP)
