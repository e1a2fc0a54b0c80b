#pragma once

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace bytepat {

enum class CaptureKind { Byte, Slice };

std::string_view to_str(CaptureKind kind);

enum class CaptureErrorKind { WrongCaptureKind, UnknownCaptureName };

class CaptureError : public std::runtime_error {
public:
    CaptureError(CaptureErrorKind kind,
                 std::string name,
                 const std::string& what)
        : std::runtime_error(what), kind_(kind), name_(std::move(name)) {}

    CaptureErrorKind kind() const noexcept { return kind_; }
    const std::string& name() const noexcept { return name_; }

private:
    CaptureErrorKind kind_;
    std::string name_;
};

}  // namespace bytepat

namespace bytepat::compile {

using SlotID = std::size_t;

struct CaptureInfo {
    std::string name;
    CaptureKind kind;
    SlotID slot;
};

struct LiteralStep {
    std::size_t offset;
    std::string bytes;
    std::size_t repeat;
};
struct CaptureStep {
    std::size_t offset;
    std::size_t length;
    SlotID slot;
};
// Always starts at fixed_length().
struct RestStep {
    SlotID slot;
};
using Step = std::variant<LiteralStep, CaptureStep, RestStep>;

// Kind-checked handles, resolved once per pattern.
struct ByteCapture {
    SlotID slot;
};
struct SliceCapture {
    SlotID slot;
};

class CompiledPattern {
public:
    using CaptureTable = std::vector<CaptureInfo>;

    CompiledPattern();

    CompiledPattern(std::vector<Step>&& steps,
                    CaptureTable&& captures,
                    std::size_t fixed_length,
                    bool has_rest);

    CompiledPattern(const CompiledPattern&) = default;
    CompiledPattern& operator=(const CompiledPattern&) = default;

    // A moved-from pattern is the empty pattern.
    CompiledPattern(CompiledPattern&& other) noexcept;
    CompiledPattern& operator=(CompiledPattern&& other) noexcept;

    std::size_t fixed_length() const { return fixed_length_; }
    bool has_rest() const { return has_rest_; }
    bool accepts_length(std::size_t length) const;

    const std::vector<Step>& steps() const { return steps_; }
    const CaptureTable& captures() const { return *captures_; }
    const std::shared_ptr<const CaptureTable>& capture_table() const {
        return captures_;
    }

    const CaptureInfo* find_capture(std::string_view name) const;

    ByteCapture byte_capture(std::string_view name) const;
    SliceCapture slice_capture(std::string_view name) const;

private:
    static const std::shared_ptr<const CaptureTable>& empty_table();

    const CaptureInfo& expect_capture(std::string_view name,
                                      CaptureKind kind) const;

    std::vector<Step> steps_;
    std::shared_ptr<const CaptureTable> captures_;
    std::size_t fixed_length_ = 0;
    bool has_rest_ = false;
};

std::string to_str(const CompiledPattern& pattern);

}  // namespace bytepat::compile
