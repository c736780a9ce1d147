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

/// \file engine/tools/forest.hpp
/// Adapter for the Forest test generator.

#if !defined(ENGINE_TOOLS_FOREST_HPP)
#define ENGINE_TOOLS_FOREST_HPP

#include "engine/tool.hpp"

namespace engine {
namespace tools {


/// Adapter for Forest.
class forest : public tool {
public:
    utils::fs::path executable(void) const;
    std::string name(void) const;
    std::string version(const utils::fs::path&) const;
    utils::process::args_vector cmdline(
        const utils::fs::path&, const std::vector< std::string >&,
        const std::vector< utils::fs::path >&,
        const utils::optional< utils::fs::path >&,
        const model::resource_limits&) const;
    model::verdict determine_result(const utils::process::status&,
                                    const std::vector< std::string >&,
                                    const bool) const;
};


}  // namespace tools
}  // namespace engine

#endif  // !defined(ENGINE_TOOLS_FOREST_HPP)
