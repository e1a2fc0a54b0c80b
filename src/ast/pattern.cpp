#include "pattern.hpp"
#include <string>
#include <type_traits>

namespace bytepat::ast {

namespace {

template <typename T>
constexpr bool always_false = false;

void append_repeat(std::string& out, std::size_t repeat) {
    if (repeat != 1) {
        out += 'x';
        out += std::to_string(repeat);
    }
}

}  // namespace

std::size_t byte_length(const Term& term) {
    return std::visit(
        [](const auto& t) -> std::size_t {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, Literal>) {
                return t.bytes.size() * t.repeat;
            } else if constexpr (std::is_same_v<T, Wildcard>) {
                return t.repeat;
            } else if constexpr (std::is_same_v<T, Rest>) {
                return 0;
            } else {
                static_assert(always_false<T>, "Unhandled term type");
            }
        },
        term);
}

void append_quoted(std::string& out, std::string_view bytes) {
    constexpr char hex[] = "0123456789abcdef";

    out += '"';
    for (char c : bytes) {
        switch (c) {
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\0':
                out += "\\0";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '"':
                out += "\\\"";
                break;
            default: {
                const auto byte = static_cast<unsigned char>(c);
                if (byte < 0x20 || byte >= 0x7f) {
                    out += "\\x";
                    out += hex[byte >> 4];
                    out += hex[byte & 0xf];
                } else {
                    out += c;
                }
            }
        }
    }
    out += '"';
}

std::string to_str(const Pattern& pattern) {
    std::string out;

    for (const auto& term : pattern.terms) {
        if (!out.empty()) {
            out += ' ';
        }
        std::visit(
            [&out](const auto& t) {
                using T = std::decay_t<decltype(t)>;
                if constexpr (std::is_same_v<T, Literal>) {
                    append_quoted(out, t.bytes);
                    append_repeat(out, t.repeat);
                } else if constexpr (std::is_same_v<T, Wildcard>) {
                    out += t.binding.value_or("_");
                    append_repeat(out, t.repeat);
                } else if constexpr (std::is_same_v<T, Rest>) {
                    out += '[';
                    out += t.binding.value_or("_");
                    out += ']';
                } else {
                    static_assert(always_false<T>, "Unhandled term type");
                }
            },
            term);
    }

    return out;
}

}  // namespace bytepat::ast
