// =============================================================================
// SKYROAM - COORDINATE PROJECTOR
// Equirectangular (lat, lon) -> local metres around a fixed origin
// =============================================================================
#pragma once

#include "Shared/Types.hpp"
#include "Shared/Config.hpp"

#include <cmath>

namespace skyroam::server {

class CoordinateProjector {
public:
    static constexpr double METERS_PER_DEGREE_LAT = 111132.0;
    static constexpr double METERS_PER_DEGREE_LON_EQUATOR = 111319.5;

    CoordinateProjector(double origin_lat, double origin_lon) noexcept
        : m_origin_lat(origin_lat)
        , m_origin_lon(origin_lon)
        , m_meters_per_lon(METERS_PER_DEGREE_LON_EQUATOR * std::cos(origin_lat * DEG_TO_RAD))
    {}

    explicit CoordinateProjector(const WorldConfig& world) noexcept
        : CoordinateProjector(world.origin_lat, world.origin_lon) {}

    // x grows east, z grows south
    [[nodiscard]] Point2 project(double lat, double lon) const noexcept {
        const double x = (lon - m_origin_lon) * m_meters_per_lon;
        const double z = -(lat - m_origin_lat) * METERS_PER_DEGREE_LAT;
        return {static_cast<float>(x), static_cast<float>(z)};
    }

    [[nodiscard]] double meters_per_degree_lon() const noexcept { return m_meters_per_lon; }

private:
    static constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;

    double m_origin_lat;
    double m_origin_lon;
    double m_meters_per_lon;
};

} // namespace skyroam::server
