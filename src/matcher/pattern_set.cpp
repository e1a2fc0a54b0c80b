#include "pattern_set.hpp"
#include <utility>
#include "engine.hpp"

namespace bytepat {

PatternSet::PatternSet(std::initializer_list<std::string_view> patterns,
                       Matcher::FlagType f) {
    arms_.reserve(patterns.size());
    for (auto pattern : patterns) {
        add(pattern, f);
    }
}

std::size_t PatternSet::add(std::string_view pattern, Matcher::FlagType f) {
    return add(compile_pattern(pattern, f));
}

std::size_t PatternSet::add(CompiledPattern&& compiled) {
    arms_.push_back(std::move(compiled));
    return arms_.size() - 1;
}

const CompiledPattern& PatternSet::arm(std::size_t index) const {
    return arms_.at(index);
}

std::optional<PatternSet::Match> PatternSet::match(
    std::string_view input) const {
    for (std::size_t i = 0; i < arms_.size(); ++i) {
        if (auto captures = engine::apply(arms_[i], input)) {
            return Match{i, std::move(*captures)};
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> PatternSet::match_arm(
    std::string_view input) const {
    for (std::size_t i = 0; i < arms_.size(); ++i) {
        if (engine::is_match(arms_[i], input)) {
            return i;
        }
    }
    return std::nullopt;
}

}  // namespace bytepat
