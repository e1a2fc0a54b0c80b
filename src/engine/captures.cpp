#include "captures.hpp"
#include <string>
#include <utility>

namespace bytepat::engine {

Captures::Captures(std::shared_ptr<const CaptureTable> table,
                   std::vector<std::string_view>&& values)
    : table_(std::move(table)), values_(std::move(values)) {}

bool Captures::contains(std::string_view name) const {
    return kind_of(name).has_value();
}

std::optional<CaptureKind> Captures::kind_of(std::string_view name) const {
    for (const auto& info : *table_) {
        if (info.name == name) {
            return info.kind;
        }
    }
    return std::nullopt;
}

std::string_view Captures::value_of(std::string_view name,
                                    CaptureKind kind) const {
    for (const auto& info : *table_) {
        if (info.name != name) {
            continue;
        }
        if (info.kind != kind) {
            throw CaptureError(CaptureErrorKind::WrongCaptureKind,
                               std::string(name),
                               "Capture '" + std::string(name) + "' is a " +
                                   std::string(to_str(info.kind)) +
                                   ", not a " + std::string(to_str(kind)));
        }
        return values_[info.slot];
    }
    throw CaptureError(CaptureErrorKind::UnknownCaptureName, std::string(name),
                       "No capture named '" + std::string(name) + "'");
}

std::uint8_t Captures::byte_at(std::string_view name) const {
    return static_cast<std::uint8_t>(
        value_of(name, CaptureKind::Byte).front());
}

std::string_view Captures::slice_at(std::string_view name) const {
    return value_of(name, CaptureKind::Slice);
}

}  // namespace bytepat::engine
