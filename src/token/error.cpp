#include "error.hpp"
#include <algorithm>
#include <string>

namespace bytepat {

std::string_view to_str(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnterminatedLiteral:
            return "unterminated literal";
        case ErrorKind::InvalidEscape:
            return "invalid escape";
        case ErrorKind::InvalidCharLiteral:
            return "invalid char literal";
        case ErrorKind::InvalidRepeatCount:
            return "invalid repeat count";
        case ErrorKind::UnexpectedCharacter:
            return "unexpected character";
        case ErrorKind::UnexpectedToken:
            return "unexpected token";
        case ErrorKind::DuplicateBinding:
            return "duplicate binding";
        case ErrorKind::RestNotLast:
            return "rest capture not last";
        case ErrorKind::MultipleRest:
            return "multiple rest captures";
        case ErrorKind::BracketMismatch:
            return "bracket mismatch";
        case ErrorKind::LengthOverflow:
            return "length overflow";
    }
    return "unknown error";
}

std::string format_diagnostic(std::string_view source,
                              const CompileError& error) {
    const std::size_t pos = std::min(error.position(), source.size());

    const std::size_t line_start = [&] {
        auto nl = source.rfind('\n', pos == 0 ? 0 : pos - 1);
        if (pos == 0 || nl == std::string_view::npos) {
            return std::size_t{0};
        }
        return nl + 1;
    }();
    std::size_t line_end = source.find('\n', line_start);
    if (line_end == std::string_view::npos) {
        line_end = source.size();
    }

    const auto line_no =
        std::count(source.begin(), source.begin() + line_start, '\n') + 1;
    const std::size_t column = pos - line_start;

    std::string out;
    out += std::to_string(line_no);
    out += ':';
    out += std::to_string(column + 1);
    out += ": error: ";
    out += error.what();
    out += '\n';
    out += "  ";
    out += source.substr(line_start, line_end - line_start);
    out += '\n';
    out += "  ";
    out.append(column, ' ');
    out += '^';
    return out;
}

}  // namespace bytepat
