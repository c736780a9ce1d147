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

/// \file utils/sanity.hpp
/// Set of macros that replace the standard assert macro with more semantical
/// expressivity and meaningful diagnostics.
///
/// Use PRE to check the inputs of a function, POST to check its outputs, INV
/// for any other internal consistency check and UNREACHABLE to mark code paths
/// that cannot be taken.  These checks are for programming errors only: they
/// must never be used to validate user input.

#if !defined(UTILS_SANITY_HPP)
#define UTILS_SANITY_HPP

#include <cstddef>
#include <string>

#include "utils/defs.hpp"

namespace utils {


/// Kinds of sanity checks, used to tailor the diagnostic message.
enum assert_type {
    invariant,
    postcondition,
    precondition,
    unreachable,
};


void sanity_failure(const assert_type, const char*, const std::size_t,
                    const std::string&) UTILS_NORETURN;


}  // namespace utils


#if !defined(NDEBUG)
#   define _UTILS_ASSERT(type, expr, message) \
    do { \
        if (!(expr)) \
            utils::sanity_failure(type, __FILE__, __LINE__, message); \
    } while (0)
#else
#   define _UTILS_ASSERT(type, expr, message) do {} while (0)
#endif


#define INV(expr) _UTILS_ASSERT(utils::invariant, expr, #expr)
#define INV_MSG(expr, msg) _UTILS_ASSERT(utils::invariant, expr, msg)

#define PRE(expr) _UTILS_ASSERT(utils::precondition, expr, #expr)
#define PRE_MSG(expr, msg) _UTILS_ASSERT(utils::precondition, expr, msg)

#define POST(expr) _UTILS_ASSERT(utils::postcondition, expr, #expr)
#define POST_MSG(expr, msg) _UTILS_ASSERT(utils::postcondition, expr, msg)


/// Marks a code path as unreachable.
///
/// Unlike the other checks, this one is always enabled: reaching this point
/// would otherwise lead to undefined behavior.
#define UNREACHABLE UNREACHABLE_MSG("")
#define UNREACHABLE_MSG(msg) \
    do { \
        utils::sanity_failure(utils::unreachable, __FILE__, __LINE__, msg); \
    } while (0)


#endif  // !defined(UTILS_SANITY_HPP)
