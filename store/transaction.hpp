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

/// \file store/transaction.hpp
/// Implementation of transactions on the backend.

#if !defined(STORE_TRANSACTION_HPP)
#define STORE_TRANSACTION_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "model/benchmark.hpp"
#include "model/category.hpp"
#include "model/run.hpp"
#include "model/run_result.hpp"
#include "model/run_set.hpp"

namespace store {


class backend;


/// Representation of a transaction.
///
/// Transactions are the entry place for high-level calls that access the
/// database.  A transaction that is neither committed nor rolled back when
/// its last copy goes away is rolled back.
class transaction {
    struct impl;

    /// Pointer to the shared internal implementation.
    std::shared_ptr< impl > _pimpl;

    friend class backend;
    explicit transaction(backend&);

public:
    ~transaction(void);

    void commit(void);
    void rollback(void);

    int64_t put_benchmark(const model::benchmark&, const std::string&,
                          const std::map< std::string, std::string >&);
    int64_t put_run_set(const model::run_set&, const int64_t);
    int64_t put_run(const model::run&, const model::run_result&,
                    const model::category, const int64_t);
};


}  // namespace store

#endif  // !defined(STORE_TRANSACTION_HPP)
