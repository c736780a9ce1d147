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

/// \file utils/defs.hpp
/// Compiler attributes and other portability macros.
///
/// Kept as a separate header so that code using these macros does not need to
/// know which compiler extensions are in use.

#if !defined(UTILS_DEFS_HPP)
#define UTILS_DEFS_HPP


/// Marks a function as never returning to its caller.
#define UTILS_NORETURN __attribute__((noreturn))


/// Marks a function as free of side-effects.
#define UTILS_PURE __attribute__((pure))


/// Silences warnings about an unused variable or function.
#define UTILS_UNUSED __attribute__((unused))


/// Names an unused parameter.
///
/// The parameter is renamed so that accidental uses of it fail to compile,
/// and the unused attribute keeps the compiler quiet.
///
/// \param name The name of the parameter.
#define UTILS_UNUSED_PARAM(name) unused_ ## name UTILS_UNUSED


#endif  // !defined(UTILS_DEFS_HPP)
