#pragma once

#include <optional>
#include <string_view>
#include "captures.hpp"
#include "compiled_pattern.hpp"

namespace bytepat::engine {

// Length and literal checks only; never allocates.
bool is_match(const compile::CompiledPattern& pattern, std::string_view input);

std::optional<Captures> apply(const compile::CompiledPattern& pattern,
                              std::string_view input);

}  // namespace bytepat::engine
