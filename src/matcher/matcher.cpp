#include "matcher.hpp"
#include <utility>
#include "from_pattern.hpp"
#include "engine.hpp"
#include "parse.hpp"
#include "tokenize.hpp"

namespace bytepat {

CompiledPattern compile_pattern(std::string_view source,
                                pattern_constants::OptionType f) {
    compile::LoweringOptions options;
    options.no_captures = f & pattern_constants::no_captures;
    options.fuse_literals = f & pattern_constants::optimize;
    return compile::from_pattern(token::parse(token::tokenize(source)),
                                 options);
}

std::optional<Captures> match_bytes(const CompiledPattern& compiled,
                                    std::string_view input) {
    return engine::apply(compiled, input);
}

std::optional<Captures> match_bytes(const CompiledPattern& compiled,
                                    std::span<const std::uint8_t> input) {
    // char may alias any object, so viewing the bytes as char is defined.
    return engine::apply(
        compiled, std::string_view(reinterpret_cast<const char*>(input.data()),
                                   input.size()));
}

Matcher::Matcher(std::string_view pattern, FlagType f)
    : compiled_(compile_pattern(pattern, f)) {}

Matcher::Matcher(CompiledPattern&& compiled) : compiled_(std::move(compiled)) {}

bool Matcher::is_match(std::string_view str) const {
    return engine::is_match(compiled_, str);
}

std::optional<Matcher::Captures> Matcher::captures(std::string_view str) const {
    return engine::apply(compiled_, str);
}

std::string to_str(const Matcher& matcher) {
    return compile::to_str(matcher.compiled_);
}

bool match(std::string_view pattern, std::string_view str) {
    return Matcher(pattern, pattern_constants::no_captures).is_match(str);
}

std::optional<Captures> captures(std::string_view pattern,
                                 std::string_view str) {
    return Matcher(pattern).captures(str);
}

}  // namespace bytepat
