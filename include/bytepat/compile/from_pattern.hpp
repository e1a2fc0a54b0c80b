#pragma once

#include <cstddef>
#include "compiled_pattern.hpp"
#include "pattern.hpp"

namespace bytepat::compile {

// Literal runs longer than this are compared chunk by chunk instead of
// being expanded.
inline constexpr std::size_t max_fused_literal = 256;

struct LoweringOptions {
    bool no_captures = false;
    bool fuse_literals = false;
};

CompiledPattern from_pattern(const ast::Pattern& pattern,
                             LoweringOptions options = {});

}  // namespace bytepat::compile
