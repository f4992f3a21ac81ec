#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <iosfwd>

#include "roomsync/core/model/point.hpp"
#include "lcr/optional.hpp"


namespace roomsync::core {

// A measurement shared across the session.
// version starts at 1 and strictly increases on every accepted mutation.
// A locked measurement can only be mutated by the host.
struct SharedMeasurement {
    std::string id;
    std::string author_id;
    std::vector<Point3> points;
    double distance{0.0};
    std::string unit;
    lcr::optional<std::string> label;
    std::uint64_t timestamp{0};   // ms since epoch
    std::uint64_t version{1};
    bool locked{false};

    // Same payload regardless of version and timestamp
    [[nodiscard]] bool same_content(const SharedMeasurement& other) const noexcept;

    bool operator==(const SharedMeasurement&) const = default;
};

// Geometry handed over by the measuring subsystem
struct MeasurementInput {
    std::string id;
    std::vector<Point3> points;
    double distance{0.0};
    std::string unit;
    lcr::optional<std::string> label;
};

// Partial update. Only present fields are applied.
struct MeasurementPatch {
    lcr::optional<std::vector<Point3>> points;
    lcr::optional<double> distance;
    lcr::optional<std::string> unit;
    lcr::optional<std::string> label;
    lcr::optional<bool> locked;

    [[nodiscard]] bool empty() const noexcept {
        return !points.has() && !distance.has() && !unit.has() && !label.has() && !locked.has();
    }
};

std::ostream& operator<<(std::ostream& os, const SharedMeasurement& m);

} // namespace roomsync::core
