#include "compiled_pattern.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include "pattern.hpp"

namespace bytepat {

std::string_view to_str(CaptureKind kind) {
    return kind == CaptureKind::Byte ? "byte" : "slice";
}

}  // namespace bytepat

namespace bytepat::compile {

const std::shared_ptr<const CompiledPattern::CaptureTable>&
CompiledPattern::empty_table() {
    static const std::shared_ptr<const CaptureTable> table =
        std::make_shared<const CaptureTable>();
    return table;
}

CompiledPattern::CompiledPattern() : captures_(empty_table()) {}

CompiledPattern::CompiledPattern(CompiledPattern&& other) noexcept
    : steps_(std::exchange(other.steps_, {})),
      captures_(std::exchange(other.captures_, empty_table())),
      fixed_length_(std::exchange(other.fixed_length_, 0)),
      has_rest_(std::exchange(other.has_rest_, false)) {}

CompiledPattern& CompiledPattern::operator=(CompiledPattern&& other) noexcept {
    if (this != &other) {
        steps_ = std::exchange(other.steps_, {});
        captures_ = std::exchange(other.captures_, empty_table());
        fixed_length_ = std::exchange(other.fixed_length_, 0);
        has_rest_ = std::exchange(other.has_rest_, false);
    }
    return *this;
}

CompiledPattern::CompiledPattern(std::vector<Step>&& steps,
                                 CaptureTable&& captures,
                                 std::size_t fixed_length,
                                 bool has_rest)
    : steps_(std::move(steps)),
      captures_(std::make_shared<const CaptureTable>(std::move(captures))),
      fixed_length_(fixed_length),
      has_rest_(has_rest) {}

bool CompiledPattern::accepts_length(std::size_t length) const {
    return has_rest_ ? length >= fixed_length_ : length == fixed_length_;
}

const CaptureInfo* CompiledPattern::find_capture(std::string_view name) const {
    auto it = std::ranges::find_if(
        *captures_, [name](const CaptureInfo& c) { return c.name == name; });
    return it != captures_->end() ? &*it : nullptr;
}

const CaptureInfo& CompiledPattern::expect_capture(std::string_view name,
                                                   CaptureKind kind) const {
    const CaptureInfo* info = find_capture(name);
    if (!info) {
        throw CaptureError(CaptureErrorKind::UnknownCaptureName,
                           std::string(name),
                           "No capture named '" + std::string(name) + "'");
    }
    if (info->kind != kind) {
        throw CaptureError(CaptureErrorKind::WrongCaptureKind,
                           std::string(name),
                           "Capture '" + std::string(name) + "' is a " +
                               std::string(to_str(info->kind)) + ", not a " +
                               std::string(to_str(kind)));
    }
    return *info;
}

ByteCapture CompiledPattern::byte_capture(std::string_view name) const {
    return ByteCapture{expect_capture(name, CaptureKind::Byte).slot};
}

SliceCapture CompiledPattern::slice_capture(std::string_view name) const {
    return SliceCapture{expect_capture(name, CaptureKind::Slice).slot};
}

namespace {

template <typename T>
constexpr bool always_false = false;

void append_term(std::string& out, std::string_view text) {
    if (!out.empty()) {
        out += ' ';
    }
    out += text;
}

void append_gap(std::string& out, std::size_t length) {
    append_term(out, length == 1 ? "_" : "_x" + std::to_string(length));
}

}  // namespace

std::string to_str(const CompiledPattern& pattern) {
    const auto& captures = pattern.captures();
    std::string out;
    std::size_t cursor = 0;
    std::optional<SlotID> rest_slot;

    for (const auto& step : pattern.steps()) {
        std::visit(
            [&](const auto& s) {
                using T = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<T, LiteralStep>) {
                    if (s.offset > cursor) {
                        append_gap(out, s.offset - cursor);
                    }
                    std::string literal;
                    ast::append_quoted(literal, s.bytes);
                    if (s.repeat != 1) {
                        literal += 'x' + std::to_string(s.repeat);
                    }
                    append_term(out, literal);
                    cursor = s.offset + s.bytes.size() * s.repeat;
                } else if constexpr (std::is_same_v<T, CaptureStep>) {
                    if (s.offset > cursor) {
                        append_gap(out, s.offset - cursor);
                    }
                    const auto& info = captures[s.slot];
                    if (info.kind == CaptureKind::Byte) {
                        append_term(out, info.name);
                    } else {
                        append_term(out,
                                    info.name + 'x' + std::to_string(s.length));
                    }
                    cursor = s.offset + s.length;
                } else if constexpr (std::is_same_v<T, RestStep>) {
                    rest_slot = s.slot;
                } else {
                    static_assert(always_false<T>, "Unhandled step type");
                }
            },
            step);
    }

    if (pattern.fixed_length() > cursor) {
        append_gap(out, pattern.fixed_length() - cursor);
    }
    if (pattern.has_rest()) {
        append_term(out, "[" +
                             (rest_slot ? captures[*rest_slot].name
                                        : std::string("_")) +
                             "]");
    }

    return out;
}

}  // namespace bytepat::compile
