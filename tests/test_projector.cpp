#include "Server/CoordinateProjector.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace skyroam;
using namespace skyroam::server;

TEST(CoordinateProjector, OriginMapsToZero) {
    const CoordinateProjector p(40.771220, -73.979577);
    const Point2 o = p.project(40.771220, -73.979577);
    EXPECT_NEAR(o.x, 0.0f, 1e-4f);
    EXPECT_NEAR(o.z, 0.0f, 1e-4f);
}

TEST(CoordinateProjector, NorthIsNegativeZAndEastIsPositiveX) {
    const CoordinateProjector p(40.0, -74.0);

    const Point2 north = p.project(40.001, -74.0);
    EXPECT_NEAR(north.z, -111.132f, 1e-2f);
    EXPECT_NEAR(north.x, 0.0f, 1e-4f);

    const Point2 east = p.project(40.0, -73.999);
    const double expected = 111319.5 * std::cos(40.0 * 3.14159265358979323846 / 180.0) * 0.001;
    EXPECT_NEAR(east.x, static_cast<float>(expected), 1e-2f);
    EXPECT_GT(east.x, 0.0f);
}

TEST(CoordinateProjector, LongitudeScaleShrinksAwayFromEquator) {
    const CoordinateProjector equator(0.0, 0.0);
    const CoordinateProjector nyc(WorldConfig{});
    EXPECT_DOUBLE_EQ(equator.meters_per_degree_lon(), CoordinateProjector::METERS_PER_DEGREE_LON_EQUATOR);
    EXPECT_LT(nyc.meters_per_degree_lon(), equator.meters_per_degree_lon());
}
