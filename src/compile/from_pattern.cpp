#include "from_pattern.hpp"
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace bytepat::compile {

namespace {

template <typename T>
constexpr bool always_false = false;

struct Lowering {
    std::vector<Step> steps;
    CompiledPattern::CaptureTable captures;
    std::size_t offset = 0;
    bool has_rest = false;
};

SlotID add_capture(Lowering& state, const std::string& name, CaptureKind kind) {
    const SlotID slot = state.captures.size();
    state.captures.push_back(CaptureInfo{name, kind, slot});
    return slot;
}

// Appends `bytes` to the previous literal step when the two runs are
// adjacent in the input.
bool fuse_into_previous(Lowering& state, const std::string& bytes) {
    if (state.steps.empty()) {
        return false;
    }
    auto* prev = std::get_if<LiteralStep>(&state.steps.back());
    if (!prev || prev->repeat != 1 ||
        prev->offset + prev->bytes.size() != state.offset ||
        prev->bytes.size() + bytes.size() > max_fused_literal) {
        return false;
    }
    prev->bytes += bytes;
    return true;
}

void handle_literal(Lowering& state,
                    const ast::Literal& lit,
                    bool fuse_literals) {
    const std::size_t length = lit.bytes.size() * lit.repeat;
    if (length == 0) {
        return;
    }

    if (fuse_literals && length <= max_fused_literal) {
        std::string expanded;
        expanded.reserve(length);
        for (std::size_t i = 0; i < lit.repeat; ++i) {
            expanded += lit.bytes;
        }
        if (!fuse_into_previous(state, expanded)) {
            state.steps.push_back(
                LiteralStep{state.offset, std::move(expanded), 1});
        }
    } else {
        state.steps.push_back(LiteralStep{state.offset, lit.bytes, lit.repeat});
    }
    state.offset += length;
}

void handle_wildcard(Lowering& state,
                     const ast::Wildcard& wildcard,
                     bool no_captures) {
    if (wildcard.binding && !no_captures) {
        const auto kind =
            wildcard.repeat == 1 ? CaptureKind::Byte : CaptureKind::Slice;
        const SlotID slot = add_capture(state, *wildcard.binding, kind);
        state.steps.push_back(
            CaptureStep{state.offset, wildcard.repeat, slot});
    }
    state.offset += wildcard.repeat;
}

void handle_rest(Lowering& state, const ast::Rest& rest, bool no_captures) {
    state.has_rest = true;
    if (rest.binding && !no_captures) {
        const SlotID slot =
            add_capture(state, *rest.binding, CaptureKind::Slice);
        state.steps.push_back(RestStep{slot});
    }
}

}  // namespace

CompiledPattern from_pattern(const ast::Pattern& pattern,
                             LoweringOptions options) {
    Lowering state;

    for (const auto& term : pattern.terms) {
        std::visit(
            [&](const auto& t) {
                using T = std::decay_t<decltype(t)>;
                if constexpr (std::is_same_v<T, ast::Literal>) {
                    handle_literal(state, t, options.fuse_literals);
                } else if constexpr (std::is_same_v<T, ast::Wildcard>) {
                    handle_wildcard(state, t, options.no_captures);
                } else if constexpr (std::is_same_v<T, ast::Rest>) {
                    handle_rest(state, t, options.no_captures);
                } else {
                    static_assert(always_false<T>, "Unhandled term type");
                }
            },
            term);
    }

    return CompiledPattern(std::move(state.steps), std::move(state.captures),
                           state.offset, state.has_rest);
}

}  // namespace bytepat::compile
