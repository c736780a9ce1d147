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

#include "model/category.hpp"

#include <cstddef>

#include "utils/fs/path.hpp"
#include "utils/sanity.hpp"

namespace fs = utils::fs;


namespace {


/// Association between a file name marker and the verdict it expects.
struct marker {
    /// Substring to look for in the base name of the task file.
    const char* text;

    /// Verdict expected for the tasks carrying the marker.
    model::verdict::verdict_type expected;
};


/// Known file name markers.
static const marker markers[] = {
    { "_true-unreach-call", model::verdict::true_prop },
    { "_true-valid-memsafety", model::verdict::true_prop },
    { "_true-termination", model::verdict::true_prop },
    { "_false-unreach-call", model::verdict::false_reach },
    { "_false-valid-deref", model::verdict::false_deref },
    { "_false-valid-free", model::verdict::false_free },
    { "_false-termination", model::verdict::false_termination },
};


}  // anonymous namespace


/// Compares a verdict against the expectations encoded in a task file name.
///
/// A true verdict is correct if the name expects a property to hold and does
/// not expect any violation.  A false verdict is correct if the name expects
/// exactly that violation.  Tasks without any marker yield the missing
/// category.
///
/// \param task The task file the verdict was produced for.
/// \param result The verdict to classify.
///
/// \return The category of the verdict.
model::category
model::categorize(const fs::path& task, const verdict& result)
{
    if (result.is_error())
        return category_error;
    if (result.type() == verdict::unknown)
        return category_unknown;

    const std::string name = task.leaf_name();
    bool any_marker = false;
    bool expects_true = false;
    bool expects_false = false;
    bool expects_this = false;
    for (std::size_t i = 0; i < sizeof(markers) / sizeof(markers[0]); ++i) {
        if (name.find(markers[i].text) == std::string::npos)
            continue;
        any_marker = true;
        if (markers[i].expected == verdict::true_prop)
            expects_true = true;
        else
            expects_false = true;
        if (markers[i].expected == result.type())
            expects_this = true;
    }

    if (!any_marker)
        return category_missing;
    if (result.type() == verdict::true_prop)
        return (expects_true && !expects_false) ? category_correct :
            category_wrong;
    INV(result.is_false());
    return expects_this ? category_correct : category_wrong;
}


/// Returns the textual name of a category.
///
/// \param value The category to convert.
///
/// \return A lower-case name.
const char*
model::category_name(const category value)
{
    switch (value) {
    case category_correct: return "correct";
    case category_wrong: return "wrong";
    case category_unknown: return "unknown";
    case category_error: return "error";
    case category_missing: return "missing";
    }
    UNREACHABLE;
}
