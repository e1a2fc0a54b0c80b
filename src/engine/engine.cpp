#include "engine.hpp"
#include <utility>
#include <vector>

namespace bytepat::engine {

namespace {

bool literal_matches(const compile::LiteralStep& step, std::string_view input) {
    const std::size_t length = step.bytes.size();
    std::size_t pos = step.offset;
    for (std::size_t i = 0; i < step.repeat; ++i) {
        if (input.substr(pos, length) != step.bytes) {
            return false;
        }
        pos += length;
    }
    return true;
}

}  // namespace

bool is_match(const compile::CompiledPattern& pattern, std::string_view input) {
    if (!pattern.accepts_length(input.size())) {
        return false;
    }
    for (const auto& step : pattern.steps()) {
        if (const auto* lit = std::get_if<compile::LiteralStep>(&step)) {
            if (!literal_matches(*lit, input)) {
                return false;
            }
        }
    }
    return true;
}

std::optional<Captures> apply(const compile::CompiledPattern& pattern,
                              std::string_view input) {
    if (!pattern.accepts_length(input.size())) {
        return std::nullopt;
    }

    std::vector<std::string_view> values(pattern.captures().size());

    for (const auto& step : pattern.steps()) {
        if (const auto* lit = std::get_if<compile::LiteralStep>(&step)) {
            if (!literal_matches(*lit, input)) {
                return std::nullopt;
            }
        } else if (const auto* cap =
                       std::get_if<compile::CaptureStep>(&step)) {
            values[cap->slot] = input.substr(cap->offset, cap->length);
        } else if (const auto* rest = std::get_if<compile::RestStep>(&step)) {
            values[rest->slot] = input.substr(pattern.fixed_length());
        }
    }

    return Captures(pattern.capture_table(), std::move(values));
}

}  // namespace bytepat::engine
