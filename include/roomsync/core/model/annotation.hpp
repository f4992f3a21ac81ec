#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <iosfwd>

#include "roomsync/core/model/point.hpp"
#include "lcr/optional.hpp"


namespace roomsync::core {

// ===============================================================
// ANNOTATION TYPE ENUM
// ===============================================================
enum class AnnotationType : std::uint8_t {
    Text,
    Arrow,
    Circle,
    Freehand,
    Unknown
};

[[nodiscard]] inline constexpr std::string_view to_string(AnnotationType t) noexcept {
    switch (t) {
        case AnnotationType::Text:     return "text";
        case AnnotationType::Arrow:    return "arrow";
        case AnnotationType::Circle:   return "circle";
        case AnnotationType::Freehand: return "freehand";
        default:                       return "unknown";
    }
}

[[nodiscard]] inline constexpr AnnotationType to_annotation_type_enum(std::string_view s) noexcept {
    if (s == "text")     return AnnotationType::Text;
    if (s == "arrow")    return AnnotationType::Arrow;
    if (s == "circle")   return AnnotationType::Circle;
    if (s == "freehand") return AnnotationType::Freehand;
    return AnnotationType::Unknown;
}

constexpr double DEFAULT_FONT_SIZE    = 14.0;
constexpr double DEFAULT_STROKE_WIDTH = 2.0;

struct AnnotationStyle {
    std::string color;
    double font_size{DEFAULT_FONT_SIZE};
    double stroke_width{DEFAULT_STROKE_WIDTH};

    bool operator==(const AnnotationStyle&) const = default;
};

// Caller overrides on top of the participant's default style
struct AnnotationStylePatch {
    lcr::optional<std::string> color;
    lcr::optional<double> font_size;
    lcr::optional<double> stroke_width;
};

struct Annotation {
    std::string id;
    std::string author_id;
    AnnotationType type{AnnotationType::Text};
    Point3 position;
    std::string content;
    AnnotationStyle style;
    std::uint64_t timestamp{0};   // ms since epoch

    bool operator==(const Annotation&) const = default;
};

std::ostream& operator<<(std::ostream& os, const Annotation& a);

} // namespace roomsync::core
