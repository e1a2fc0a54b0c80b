#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <vector>
#include "matcher.hpp"

namespace bytepat {

// Ordered match arms; the first arm whose pattern matches wins.
class PatternSet {
public:
    struct Match {
        std::size_t arm;
        Captures captures;
    };

    PatternSet() = default;

    explicit PatternSet(std::initializer_list<std::string_view> patterns,
                        Matcher::FlagType f = pattern_constants::none);

    std::size_t add(std::string_view pattern,
                    Matcher::FlagType f = pattern_constants::none);
    std::size_t add(CompiledPattern&& compiled);

    std::size_t size() const { return arms_.size(); }
    bool empty() const { return arms_.empty(); }

    const CompiledPattern& arm(std::size_t index) const;

    std::optional<Match> match(std::string_view input) const;
    std::optional<std::size_t> match_arm(std::string_view input) const;

private:
    std::vector<CompiledPattern> arms_;
};

}  // namespace bytepat
