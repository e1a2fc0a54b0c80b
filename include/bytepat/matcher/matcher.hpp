#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include "captures.hpp"
#include "compiled_pattern.hpp"
#include "error.hpp"

namespace bytepat {

namespace pattern_constants {

using OptionType = std::size_t;

inline constexpr OptionType none = 0;
inline constexpr OptionType no_captures = 1;
inline constexpr OptionType optimize = 1 << 1;

}  // namespace pattern_constants

using CompiledPattern = compile::CompiledPattern;
using Captures = engine::Captures;

// Throws LexError or ParseError.
CompiledPattern compile_pattern(std::string_view source,
                                pattern_constants::OptionType f =
                                    pattern_constants::none);

std::optional<Captures> match_bytes(const CompiledPattern& compiled,
                                    std::string_view input);

std::optional<Captures> match_bytes(const CompiledPattern& compiled,
                                    std::span<const std::uint8_t> input);

class Matcher {
public:
    using FlagType = pattern_constants::OptionType;
    using Captures = engine::Captures;

    explicit Matcher(std::string_view pattern,
                     FlagType f = pattern_constants::none);

    explicit Matcher(CompiledPattern&& compiled);

    bool is_match(std::string_view str) const;
    std::optional<Captures> captures(std::string_view str) const;

    const CompiledPattern& compiled() const { return compiled_; }

    friend std::string to_str(const Matcher& matcher);

private:
    CompiledPattern compiled_;
};

bool match(std::string_view pattern, std::string_view str);

std::optional<Captures> captures(std::string_view pattern,
                                 std::string_view str);

}  // namespace bytepat
