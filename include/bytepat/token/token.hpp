#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include "error.hpp"

namespace bytepat::token {

struct LiteralChar {
    char value;
};
struct LiteralString {
    std::string bytes;
};
struct Identifier {
    std::string name;
};
struct Wildcard {};
struct RepeatSuffix {
    std::size_t count;
};
struct OpenBracket {};
struct CloseBracket {};

using TokenValue = std::variant<LiteralChar,
                                LiteralString,
                                Identifier,
                                Wildcard,
                                RepeatSuffix,
                                OpenBracket,
                                CloseBracket>;

struct Token {
    TokenValue value;
    std::size_t position = 0;
};

}  // namespace bytepat::token
