#include "roomsync/core/model/measurement.hpp"
#include "roomsync/core/model/annotation.hpp"

#include <ostream>


namespace roomsync::core {

bool SharedMeasurement::same_content(const SharedMeasurement& other) const noexcept {
    return id == other.id
        && author_id == other.author_id
        && points == other.points
        && distance == other.distance
        && unit == other.unit
        && label == other.label
        && locked == other.locked;
}

// ---------------------------------
// Debug / logging helpers
// ---------------------------------

std::ostream& operator<<(std::ostream& os, const SharedMeasurement& m) {
    os << "[Measurement] {"
       << "id=" << m.id
       << ", author=" << m.author_id
       << ", points=" << m.points.size()
       << ", distance=" << m.distance << m.unit
       << ", v=" << m.version;
    if (m.label.has()) {
        os << ", label=" << m.label.value();
    }
    if (m.locked) {
        os << ", locked";
    }
    os << "}";
    return os;
}

std::ostream& operator<<(std::ostream& os, const Annotation& a) {
    os << "[Annotation] {"
       << "id=" << a.id
       << ", author=" << a.author_id
       << ", type=" << to_string(a.type)
       << ", at=(" << a.position.x << "," << a.position.y << "," << a.position.z << ")"
       << ", content=" << a.content
       << "}";
    return os;
}

} // namespace roomsync::core
