#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>
#include "compiled_pattern.hpp"

namespace bytepat::engine {

// Values borrow from the matched input; the input must outlive them.
class Captures {
public:
    using CaptureTable = compile::CompiledPattern::CaptureTable;

    Captures(std::shared_ptr<const CaptureTable> table,
             std::vector<std::string_view>&& values);

    std::size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    bool contains(std::string_view name) const;
    std::optional<CaptureKind> kind_of(std::string_view name) const;

    std::uint8_t byte_at(std::string_view name) const;
    std::string_view slice_at(std::string_view name) const;

    // Unchecked; the handle must come from the pattern that produced this.
    std::uint8_t get(compile::ByteCapture capture) const {
        return static_cast<std::uint8_t>(values_[capture.slot].front());
    }
    std::string_view get(compile::SliceCapture capture) const {
        return values_[capture.slot];
    }

private:
    std::string_view value_of(std::string_view name, CaptureKind kind) const;

    std::shared_ptr<const CaptureTable> table_;
    std::vector<std::string_view> values_;
};

}  // namespace bytepat::engine
