/**
 * @file test_spatial_buffer.cpp
 * @brief Unit tests for the buffered region and sampling grid
 */

#include <gtest/gtest.h>
#include "FaultModel.hpp"
#include "SpatialBuffer.hpp"
#include "SrcmodReader.hpp"
#include "TestFixtures.hpp"
#include <cmath>
#include <stdexcept>

using namespace CFSM;

class SpatialBufferTest : public ::testing::Test {
protected:
    const double radius = 1000.0;
};

TEST_F(SpatialBufferTest, SingleCornerDisk) {
    BufferedRegion region = SpatialBuffer::buildRegion(std::vector<GeoPoint>{GeoPoint(0.0, 0.0)}, radius);
    ASSERT_FALSE(region.empty());
    EXPECT_EQ(region.shape().size(), 1u);

    EXPECT_TRUE(region.contains(0.0, 0.0));
    for (double deg = 0.0; deg < 360.0; deg += 17.0) {
        double a = deg * M_PI / 180.0;
        EXPECT_TRUE(region.contains(0.99 * radius * std::cos(a), 0.99 * radius * std::sin(a)))
            << "inside at " << deg;
        EXPECT_FALSE(region.contains(1.01 * radius * std::cos(a), 1.01 * radius * std::sin(a)))
            << "outside at " << deg;
    }

    EXPECT_NEAR(region.area(), M_PI * radius * radius, 0.001 * M_PI * radius * radius);

    PlaneBox box = region.bounds();
    EXPECT_NEAR(box.min_corner().x(), -radius, 1.0);
    EXPECT_NEAR(box.max_corner().y(), radius, 1.0);
}

TEST_F(SpatialBufferTest, CircleResolution) {
    BufferedRegion coarse = SpatialBuffer::buildRegion(std::vector<GeoPoint>{GeoPoint(5.0, 5.0)},
                                                       radius, 16);
    auto vertices = coarse.boundaryVertices();
    EXPECT_NEAR(static_cast<double>(vertices.size()), 16.0, 1.0);
    for (const auto& v : vertices) {
        EXPECT_NEAR(std::hypot(v.x - 5.0, v.y - 5.0), radius, 1e-6 * radius);
    }
}

TEST_F(SpatialBufferTest, CircleIsInscribed) {
    BufferedRegion coarse = SpatialBuffer::buildRegion(std::vector<GeoPoint>{GeoPoint(0.0, 0.0)},
                                                       radius, 16);
    auto vertices = coarse.boundaryVertices();
    ASSERT_GE(vertices.size(), 2u);
    const GeoPoint& a = vertices[0];
    const GeoPoint& b = vertices[1];
    ASSERT_NEAR(std::hypot(b.x - a.x, b.y - a.y), 2.0 * radius * std::sin(M_PI / 16.0), 1e-3 * radius);

    // The edge midpoint sits at r cos(pi/16), about 0.981 r
    double mx = 0.5 * (a.x + b.x), my = 0.5 * (a.y + b.y);
    double m = std::hypot(mx, my);
    EXPECT_FALSE(coarse.contains(0.99 * radius * mx / m, 0.99 * radius * my / m));
    EXPECT_TRUE(coarse.contains(0.97 * radius * mx / m, 0.97 * radius * my / m));
    EXPECT_TRUE(coarse.contains(0.99 * a.x, 0.99 * a.y));
}

TEST_F(SpatialBufferTest, OverlappingDisksMerge) {
    std::vector<GeoPoint> close = {GeoPoint(0.0, 0.0), GeoPoint(1500.0, 0.0)};
    EXPECT_EQ(SpatialBuffer::buildRegion(close, radius).shape().size(), 1u);

    std::vector<GeoPoint> apart = {GeoPoint(0.0, 0.0), GeoPoint(5000.0, 0.0)};
    BufferedRegion region = SpatialBuffer::buildRegion(apart, radius);
    EXPECT_EQ(region.shape().size(), 2u);
    EXPECT_FALSE(region.contains(2500.0, 0.0));
    EXPECT_TRUE(region.contains(5000.0, 500.0));
}

TEST_F(SpatialBufferTest, DuplicateCornersDoNotChangeTheRegion) {
    std::vector<GeoPoint> once = {GeoPoint(0.0, 0.0), GeoPoint(1500.0, 0.0)};
    std::vector<GeoPoint> twice = {GeoPoint(0.0, 0.0), GeoPoint(1500.0, 0.0),
                                   GeoPoint(0.0, 0.0), GeoPoint(1500.0, 0.0, -10.0)};
    EXPECT_NEAR(SpatialBuffer::buildRegion(once, radius).area(),
                SpatialBuffer::buildRegion(twice, radius).area(), 1e-6);
}

TEST_F(SpatialBufferTest, InvalidArguments) {
    std::vector<GeoPoint> none;
    std::vector<GeoPoint> one = {GeoPoint(0.0, 0.0)};
    EXPECT_THROW(SpatialBuffer::buildRegion(none, radius), std::invalid_argument);
    EXPECT_THROW(SpatialBuffer::buildRegion(std::vector<FaultPatch>{}, radius), std::invalid_argument);
    EXPECT_THROW(SpatialBuffer::buildRegion(one, 0.0), std::invalid_argument);
    EXPECT_THROW(SpatialBuffer::buildRegion(one, -5.0), std::invalid_argument);
    EXPECT_THROW(SpatialBuffer::buildRegion(one, radius, 4), std::invalid_argument);

    BufferedRegion region = SpatialBuffer::buildRegion(one, radius);
    EXPECT_THROW(SpatialBuffer::buildGrid(region, 0.0), std::invalid_argument);
}

TEST_F(SpatialBufferTest, GridInteriorIsStrictlyInside) {
    const double r = 10000.0;
    const double spacing = 1000.0;
    BufferedRegion region = SpatialBuffer::buildRegion(std::vector<GeoPoint>{GeoPoint(0.0, 0.0)}, r);
    SampleGrid grid = SpatialBuffer::buildGrid(region, spacing);

    // About π r² / spacing² points
    EXPECT_GT(grid.interior.size(), 290u);
    EXPECT_LT(grid.interior.size(), 330u);
    for (const auto& p : grid.interior) {
        EXPECT_TRUE(region.contains(p.x, p.y));
    }

    // Boundary points are the region's vertices, kept out of the interior
    EXPECT_EQ(grid.boundary.size(), region.boundaryVertices().size());
    for (const auto& p : grid.boundary) {
        EXPECT_FALSE(region.contains(p.x, p.y));
    }

    // Regular lattice anchored at the box minimum
    PlaneBox box = region.bounds();
    for (const auto& p : grid.interior) {
        double i = (p.x - box.min_corner().x()) / spacing;
        double j = (p.y - box.min_corner().y()) / spacing;
        EXPECT_NEAR(i, std::round(i), 1e-6);
        EXPECT_NEAR(j, std::round(j), 1e-6);
    }
}

TEST_F(SpatialBufferTest, GridPointsCarryDepth) {
    BufferedRegion region = SpatialBuffer::buildRegion(std::vector<GeoPoint>{GeoPoint(0.0, 0.0)}, 5000.0);
    SampleGrid grid = SpatialBuffer::buildGrid(region, 1000.0);
    auto pts = grid.points(-2500.0);

    ASSERT_EQ(pts.size(), grid.size());
    ASSERT_GT(grid.interior.size(), 0u);
    EXPECT_DOUBLE_EQ(pts.front().x, grid.interior.front().x);
    EXPECT_DOUBLE_EQ(pts[grid.interior.size()].x, grid.boundary.front().x);
    for (const auto& p : pts) {
        EXPECT_DOUBLE_EQ(p.z, -2500.0);
    }
}

TEST_F(SpatialBufferTest, RegionAroundFaultCoversEveryCorner) {
    SrcmodReader reader;
    FaultModelBuilder builder(makeProjectorFactory("local"));
    FaultModel model = builder.build(reader.parse(TestFixtures::strikeSlipFsp()));

    BufferedRegion region = SpatialBuffer::buildRegion(model.getPatches(), 20000.0, 72);
    for (const auto& patch : model.getPatches()) {
        for (const auto& c : patch.getProjectedCorners()) {
            EXPECT_TRUE(region.contains(c.x, c.y));
        }
    }
    // 10 km long fault buffered by 20 km
    PlaneBox box = region.bounds();
    EXPECT_NEAR(box.max_corner().y() - box.min_corner().y(), 50000.0, 100.0);
    EXPECT_NEAR(box.max_corner().x() - box.min_corner().x(), 40000.0, 100.0);
    EXPECT_EQ(region.shape().size(), 1u);
}
