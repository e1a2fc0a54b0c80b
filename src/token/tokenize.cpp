#include "tokenize.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace bytepat::token {

namespace {

struct ParseResult {
    std::size_t new_pos;
    Token token;
};

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c));
}

std::string describe_byte(char c) {
    const auto byte = static_cast<unsigned char>(c);
    if (std::isprint(byte)) {
        return std::string("'") + c + "'";
    }
    constexpr char hex[] = "0123456789abcdef";
    return std::string("0x") + hex[byte >> 4] + hex[byte & 0xf];
}

std::size_t parse_repeat_count(std::string_view digits, std::size_t position) {
    std::size_t value = 0;
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), last, value);
    if (ec != std::errc{} || ptr != last) {
        throw LexError(ErrorKind::InvalidRepeatCount, position,
                       "Repeat count out of range");
    }
    return value;
}

// pattern[pos] is the backslash.
std::pair<char, std::size_t> parse_escape(std::string_view pattern,
                                          std::size_t pos) {
    const std::size_t start = pos;
    if (++pos >= pattern.size()) {
        throw LexError(ErrorKind::UnterminatedLiteral, start,
                       "Escape at end of pattern");
    }
    switch (pattern[pos]) {
        case 'n':
            return {'\n', pos + 1};
        case 'r':
            return {'\r', pos + 1};
        case 't':
            return {'\t', pos + 1};
        case '0':
            return {'\0', pos + 1};
        case '\\':
            return {'\\', pos + 1};
        case '\'':
            return {'\'', pos + 1};
        case '"':
            return {'"', pos + 1};
        case 'x': {
            if (pos + 2 >= pattern.size()) {
                throw LexError(ErrorKind::InvalidEscape, start,
                               "Hex escape requires two digits");
            }
            unsigned value = 0;
            const char* first = pattern.data() + pos + 1;
            auto [ptr, ec] = std::from_chars(first, first + 2, value, 16);
            if (ec != std::errc{} || ptr != first + 2) {
                throw LexError(ErrorKind::InvalidEscape, start,
                               "Hex escape requires two digits");
            }
            return {static_cast<char>(value), pos + 3};
        }
        default:
            throw LexError(ErrorKind::InvalidEscape, start,
                           "Invalid escape sequence '\\" +
                               std::string(1, pattern[pos]) + "'");
    }
}

ParseResult parse_char_literal(std::string_view pattern,
                               std::size_t quote,
                               std::size_t token_start) {
    std::size_t pos = quote + 1;
    if (pos >= pattern.size()) {
        throw LexError(ErrorKind::UnterminatedLiteral, token_start,
                       "Unterminated char literal");
    }
    if (pattern[pos] == '\'') {
        throw LexError(ErrorKind::InvalidCharLiteral, token_start,
                       "Empty char literal");
    }

    char value;
    if (pattern[pos] == '\\') {
        auto [c, new_pos] = parse_escape(pattern, pos);
        value = c;
        pos = new_pos;
    } else {
        value = pattern[pos++];
    }

    if (pos < pattern.size() && pattern[pos] == '\'') {
        return {pos + 1, Token{LiteralChar{value}, token_start}};
    }
    if (pattern.find('\'', pos) == std::string_view::npos) {
        throw LexError(ErrorKind::UnterminatedLiteral, token_start,
                       "Unterminated char literal");
    }
    throw LexError(ErrorKind::InvalidCharLiteral, token_start,
                   "Char literal must hold exactly one byte");
}

ParseResult parse_string_literal(std::string_view pattern,
                                 std::size_t quote,
                                 std::size_t token_start) {
    std::string bytes;
    std::size_t pos = quote + 1;

    while (pos < pattern.size()) {
        const char c = pattern[pos];
        if (c == '"') {
            return {pos + 1,
                    Token{LiteralString{std::move(bytes)}, token_start}};
        }
        if (c == '\\') {
            auto [byte, new_pos] = parse_escape(pattern, pos);
            bytes.push_back(byte);
            pos = new_pos;
        } else {
            bytes.push_back(c);
            ++pos;
        }
    }

    throw LexError(ErrorKind::UnterminatedLiteral, token_start,
                   "Unterminated string literal");
}

ParseResult parse_literal(std::string_view pattern,
                          std::size_t quote,
                          std::size_t token_start) {
    return pattern[quote] == '"'
               ? parse_string_literal(pattern, quote, token_start)
               : parse_char_literal(pattern, quote, token_start);
}

bool is_digits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), is_digit);
}

void push_name(std::vector<Token>& tokens,
               std::string_view name,
               std::size_t position) {
    if (name == "_") {
        tokens.push_back(Token{Wildcard{}, position});
    } else {
        tokens.push_back(Token{Identifier{std::string(name)}, position});
    }
}

void push_repeat(std::vector<Token>& tokens,
                 std::string_view digits,
                 std::size_t position) {
    tokens.push_back(
        Token{RepeatSuffix{parse_repeat_count(digits, position)}, position});
}

// A word directly after a closing quote that starts with "x<digit>" must be
// a repeat suffix. Outside brackets "_x<digits>" is a repeated wildcard;
// every other word is taken whole.
void push_word(std::vector<Token>& tokens,
               std::string_view word,
               std::size_t position,
               bool after_literal,
               bool after_bracket) {
    if (after_bracket) {
        push_name(tokens, word, position);
        return;
    }
    if (after_literal && word.size() > 1 && word[0] == 'x' &&
        is_digit(word[1])) {
        if (!is_digits(word.substr(1))) {
            throw LexError(ErrorKind::InvalidRepeatCount, position,
                           "Malformed repeat suffix '" + std::string(word) +
                               "'");
        }
        push_repeat(tokens, word.substr(1), position);
        return;
    }
    if (word.size() > 2 && word.substr(0, 2) == "_x" &&
        is_digits(word.substr(2))) {
        push_name(tokens, "_", position);
        push_repeat(tokens, word.substr(2), position + 1);
        return;
    }
    push_name(tokens, word, position);
}

}  // namespace

std::vector<Token> tokenize(std::string_view pattern) {
    std::vector<Token> tokens;
    std::size_t pos = 0;
    bool after_literal = false;

    while (pos < pattern.size()) {
        const char c = pattern[pos];
        bool closed_literal = false;

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++pos;
        } else if (c == '\'' || c == '"') {
            auto [new_pos, token] = parse_literal(pattern, pos, pos);
            tokens.push_back(std::move(token));
            pos = new_pos;
            closed_literal = true;
        } else if (c == '[') {
            tokens.push_back(Token{OpenBracket{}, pos});
            ++pos;
        } else if (c == ']') {
            tokens.push_back(Token{CloseBracket{}, pos});
            ++pos;
        } else if (is_ident_start(c)) {
            std::size_t end = pos;
            while (end < pattern.size() && is_ident_char(pattern[end])) {
                ++end;
            }
            const auto word = pattern.substr(pos, end - pos);

            if (word == "b" && end < pattern.size() &&
                (pattern[end] == '"' || pattern[end] == '\'')) {
                auto [new_pos, token] = parse_literal(pattern, end, pos);
                tokens.push_back(std::move(token));
                pos = new_pos;
                closed_literal = true;
            } else {
                const bool after_bracket =
                    !tokens.empty() &&
                    std::holds_alternative<OpenBracket>(tokens.back().value);
                push_word(tokens, word, pos, after_literal, after_bracket);
                pos = end;
            }
        } else {
            throw LexError(ErrorKind::UnexpectedCharacter, pos,
                           "Unexpected character " + describe_byte(c));
        }

        after_literal = closed_literal;
    }

    return tokens;
}

}  // namespace bytepat::token
