#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bytepat::ast {

// An exact byte run, replicated `repeat` times.
struct Literal {
    std::string bytes;
    std::size_t repeat = 1;

    bool operator==(const Literal&) const = default;
};

// Matches exactly `repeat` arbitrary bytes.
struct Wildcard {
    std::optional<std::string> binding;
    std::size_t repeat = 1;

    bool operator==(const Wildcard&) const = default;
};

// Matches all remaining input. Only ever the last term.
struct Rest {
    std::optional<std::string> binding;

    bool operator==(const Rest&) const = default;
};

using Term = std::variant<Literal, Wildcard, Rest>;

struct Pattern {
    std::vector<Term> terms;

    bool operator==(const Pattern&) const = default;
};

// Number of input bytes the term consumes; a Rest term contributes 0.
std::size_t byte_length(const Term& term);

// Writes the bytes as a double-quoted literal, escaping as needed.
void append_quoted(std::string& out, std::string_view bytes);

std::string to_str(const Pattern& pattern);

}  // namespace bytepat::ast
