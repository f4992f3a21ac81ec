#pragma once


namespace roomsync::core {

// Spatial point in scene coordinates (units are owned by the measuring subsystem)
struct Point3 {
    double x{0.0};
    double y{0.0};
    double z{0.0};

    bool operator==(const Point3&) const = default;
};

} // namespace roomsync::core
