#include "parse.hpp"
#include <limits>
#include <type_traits>
#include <utility>

namespace bytepat::token {

namespace detail {

namespace {

template <typename T>
constexpr bool always_false = false;

}  // namespace

std::string PatternBuilder::bind(const Identifier& ident,
                                 std::size_t position) {
    if (!bindings_.insert(ident.name).second) {
        throw ParseError(ErrorKind::DuplicateBinding, position,
                         "Duplicate binding '" + ident.name + "'");
    }
    return ident.name;
}

void PatternBuilder::push_term(ast::Term term, std::size_t position) {
    pattern_.terms.push_back(std::move(term));
    positions_.push_back(position);
}

void PatternBuilder::apply_repeat(const RepeatSuffix& suffix,
                                  std::size_t position) {
    if (!suffix_open_) {
        throw ParseError(ErrorKind::UnexpectedToken, position,
                         "Repeat suffix does not follow a literal or wildcard");
    }
    std::visit(
        [&](auto& term) {
            using T = std::decay_t<decltype(term)>;
            if constexpr (std::is_same_v<T, ast::Literal> ||
                          std::is_same_v<T, ast::Wildcard>) {
                term.repeat = suffix.count;
            } else {
                throw ParseError(ErrorKind::UnexpectedToken, position,
                                 "Repeat suffix after a rest capture");
            }
        },
        pattern_.terms.back());
    suffix_open_ = false;
}

void PatternBuilder::feed(const Token& token) {
    const std::size_t pos = token.position;

    switch (state_) {
        case State::Done:
            if (std::holds_alternative<OpenBracket>(token.value)) {
                throw ParseError(ErrorKind::MultipleRest, pos,
                                 "Only one rest capture is allowed");
            }
            throw ParseError(ErrorKind::RestNotLast, pos,
                             "Rest capture must be the last term");

        case State::BracketOpen:
            if (std::holds_alternative<Wildcard>(token.value)) {
                rest_binding_.reset();
            } else if (const auto* ident =
                           std::get_if<Identifier>(&token.value)) {
                rest_binding_ = bind(*ident, pos);
            } else {
                throw ParseError(ErrorKind::BracketMismatch, pos,
                                 "Expected '_' or a name after '['");
            }
            state_ = State::BracketBound;
            return;

        case State::BracketBound:
            if (!std::holds_alternative<CloseBracket>(token.value)) {
                throw ParseError(ErrorKind::BracketMismatch, pos,
                                 "Expected ']' to close rest capture");
            }
            push_term(ast::Rest{std::move(rest_binding_)}, bracket_pos_);
            rest_binding_.reset();
            state_ = State::Done;
            return;

        case State::Terms:
            break;
    }

    std::visit(
        [&](const auto& tok) {
            using T = std::decay_t<decltype(tok)>;
            if constexpr (std::is_same_v<T, LiteralChar>) {
                push_term(ast::Literal{std::string(1, tok.value)}, pos);
                suffix_open_ = true;
            } else if constexpr (std::is_same_v<T, LiteralString>) {
                push_term(ast::Literal{tok.bytes}, pos);
                suffix_open_ = true;
            } else if constexpr (std::is_same_v<T, Wildcard>) {
                push_term(ast::Wildcard{}, pos);
                suffix_open_ = true;
            } else if constexpr (std::is_same_v<T, Identifier>) {
                push_term(ast::Wildcard{bind(tok, pos)}, pos);
                suffix_open_ = true;
            } else if constexpr (std::is_same_v<T, RepeatSuffix>) {
                apply_repeat(tok, pos);
            } else if constexpr (std::is_same_v<T, OpenBracket>) {
                bracket_pos_ = pos;
                state_ = State::BracketOpen;
                suffix_open_ = false;
            } else if constexpr (std::is_same_v<T, CloseBracket>) {
                throw ParseError(ErrorKind::BracketMismatch, pos,
                                 "Unbalanced ']'");
            } else {
                static_assert(always_false<T>, "Unhandled token type");
            }
        },
        token.value);
}

ast::Pattern PatternBuilder::finish() && {
    if (state_ == State::BracketOpen || state_ == State::BracketBound) {
        throw ParseError(ErrorKind::BracketMismatch, bracket_pos_,
                         "Unclosed rest capture");
    }

    std::size_t length = 0;
    for (std::size_t i = 0; i < pattern_.terms.size(); ++i) {
        const auto& term = pattern_.terms[i];
        std::size_t term_length = 0;
        if (const auto* lit = std::get_if<ast::Literal>(&term)) {
            if (lit->repeat != 0 &&
                lit->bytes.size() >
                    std::numeric_limits<std::size_t>::max() / lit->repeat) {
                throw ParseError(ErrorKind::LengthOverflow, positions_[i],
                                 "Literal length overflows");
            }
            term_length = lit->bytes.size() * lit->repeat;
        } else {
            term_length = ast::byte_length(term);
        }
        if (term_length > std::numeric_limits<std::size_t>::max() - length) {
            throw ParseError(ErrorKind::LengthOverflow, positions_[i],
                             "Pattern length overflows");
        }
        length += term_length;
    }

    return std::move(pattern_);
}

}  // namespace detail

}  // namespace bytepat::token
