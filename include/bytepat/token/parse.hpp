#pragma once

#include <cstddef>
#include <optional>
#include <ranges>
#include <string>
#include <unordered_set>
#include <vector>
#include "pattern.hpp"
#include "token.hpp"

namespace bytepat::token {

namespace detail {

// Left-to-right term builder. A RepeatSuffix is fused into the term just
// before it, which gives the parser its single token of lookahead.
class PatternBuilder {
public:
    void feed(const Token& token);
    ast::Pattern finish() &&;

private:
    enum class State { Terms, BracketOpen, BracketBound, Done };

    void push_term(ast::Term term, std::size_t position);
    void apply_repeat(const RepeatSuffix& suffix, std::size_t position);
    std::string bind(const Identifier& ident, std::size_t position);

    ast::Pattern pattern_;
    std::vector<std::size_t> positions_;
    std::unordered_set<std::string> bindings_;
    State state_ = State::Terms;
    bool suffix_open_ = false;
    std::optional<std::string> rest_binding_;
    std::size_t bracket_pos_ = 0;
};

}  // namespace detail

template <std::ranges::input_range R>
ast::Pattern parse(R&& tokens) {
    detail::PatternBuilder builder;
    for (auto&& token : tokens) {
        builder.feed(token);
    }
    return std::move(builder).finish();
}

}  // namespace bytepat::token
