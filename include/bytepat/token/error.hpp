#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bytepat {

enum class ErrorKind {
    UnterminatedLiteral,
    InvalidEscape,
    InvalidCharLiteral,
    InvalidRepeatCount,
    UnexpectedCharacter,
    UnexpectedToken,
    DuplicateBinding,
    RestNotLast,
    MultipleRest,
    BracketMismatch,
    LengthOverflow,
};

std::string_view to_str(ErrorKind kind);

class CompileError : public std::runtime_error {
public:
    CompileError(ErrorKind kind, std::size_t position, const std::string& what)
        : std::runtime_error(what), kind_(kind), position_(position) {}

    ErrorKind kind() const noexcept { return kind_; }
    std::size_t position() const noexcept { return position_; }

private:
    ErrorKind kind_;
    std::size_t position_;
};

class LexError : public CompileError {
public:
    using CompileError::CompileError;
};

class ParseError : public CompileError {
public:
    using CompileError::CompileError;
};

// Renders "line:column: error: <what>" followed by the source line and a
// caret under the offending byte.
std::string format_diagnostic(std::string_view source,
                              const CompileError& error);

}  // namespace bytepat
