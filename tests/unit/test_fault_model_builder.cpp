/**
 * @file test_fault_model_builder.cpp
 * @brief Unit tests for FaultPatch and FaultModelBuilder
 */

#include <gtest/gtest.h>
#include "FaultModel.hpp"
#include "SrcmodReader.hpp"
#include "TestFixtures.hpp"
#include <cmath>
#include <stdexcept>

using namespace CFSM;

class FaultModelBuilderTest : public ::testing::Test {
protected:
    FaultModelBuilderTest() : builder(makeProjectorFactory("local")) {}

    FaultModelBuilder builder;
    SrcmodReader reader;
    const double tol = 1e-6;
};

TEST_F(FaultModelBuilderTest, PatchNormalizesAngles) {
    FaultPatch::Definition def;
    def.strike = -30.0;
    def.angle = 400.0;
    def.dip = 200.0;
    def.length = 1000.0;
    def.width = 500.0;
    def.slip = 2.0;
    def.rake = 90.0;

    FaultPatch patch(def);
    EXPECT_NEAR(patch.getStrike(), 330.0, tol);
    EXPECT_NEAR(patch.getAngle(), 40.0, tol);
    EXPECT_NEAR(patch.getDip(), -160.0, tol);

    // Pure dip slip
    EXPECT_NEAR(patch.getSlipStrike(), 0.0, 1e-12);
    EXPECT_NEAR(patch.getSlipDip(), 2.0, 1e-12);
}

TEST_F(FaultModelBuilderTest, PatchRejectsDegenerateSize) {
    FaultPatch::Definition def;
    def.length = 0.0;
    def.width = 100.0;
    EXPECT_THROW(FaultPatch{def}, std::invalid_argument);
    def.length = 100.0;
    def.width = -1.0;
    EXPECT_THROW(FaultPatch{def}, std::invalid_argument);
}

TEST_F(FaultModelBuilderTest, BuildsVerticalStrikeSlipFault) {
    FaultModel model = builder.build(reader.parse(TestFixtures::strikeSlipFsp()));

    ASSERT_EQ(model.size(), 4u);
    EXPECT_EQ(*model.tag, "s2001SYNTH01TEST");
    EXPECT_DOUBLE_EQ(*model.magnitude, 6.1);
    EXPECT_EQ(model.date, TimeUtils::makeUtc(2001, 7, 4));
    EXPECT_NEAR(model.getMeanDip(), 90.0, tol);
    EXPECT_NEAR(model.getMeanStrike(), 0.0, tol);

    // Local projection puts the epicenter at the origin
    EXPECT_NEAR(model.getEpicenterProjected().x, 0.0, tol);
    EXPECT_NEAR(model.getEpicenterProjected().y, 0.0, tol);

    const FaultPatch& p = model.getPatches()[0];
    EXPECT_NEAR(p.getLength(), 5000.0, tol);
    EXPECT_NEAR(p.getWidth(), 5000.0, tol);       // LEN / rows
    EXPECT_NEAR(p.getDip(), 90.0, tol);
    EXPECT_NEAR(p.getAngle(), 90.0, tol);
    EXPECT_NEAR(p.getDepthTop(), 0.0, tol);
    EXPECT_NEAR(p.getDepthBottom(), 5000.0, tol);
    EXPECT_NEAR(p.getSlip(), 1.5, tol);
    EXPECT_NEAR(p.getRake(), 180.0, tol);
    EXPECT_NEAR(p.getSlipStrike(), -1.5, 1e-12);
    EXPECT_NEAR(p.getSlipDip(), 0.0, 1e-12);

    // North-striking: corners differ only in northing along the top edge
    double yc = (34.477477 - 34.5) * 111000.0;
    const auto& c = p.getProjectedCorners();
    EXPECT_NEAR(p.getProjectedTopCenter().x, 0.0, tol);
    EXPECT_NEAR(p.getProjectedTopCenter().y, yc, 1e-3);
    EXPECT_NEAR(c[0].x, 0.0, tol);
    EXPECT_NEAR(c[0].y, yc + 2500.0, 1e-3);
    EXPECT_NEAR(c[1].y, yc - 2500.0, 1e-3);
    EXPECT_NEAR(c[2].y, yc + 2500.0, 1e-3);
    EXPECT_NEAR(c[2].z, 5000.0, tol);
    EXPECT_NEAR(c[3].y, yc - 2500.0, 1e-3);

    // Local frame follows the X, Y, Z columns
    const auto& l = p.getLocalCorners();
    EXPECT_NEAR(l[0].x, 0.0, tol);
    EXPECT_NEAR(l[0].y, 0.0, tol);
    EXPECT_NEAR(l[1].y, -5000.0, tol);
    EXPECT_NEAR(l[3].z, 5000.0, tol);

    // Second depth row sits directly below the first
    const FaultPatch& deep = model.getPatches()[2];
    EXPECT_NEAR(deep.getDepthTop(), 5000.0, tol);
    EXPECT_NEAR(deep.getDepthBottom(), 10000.0, tol);
    EXPECT_NEAR(deep.getSlip(), 0.8, tol);
}

TEST_F(FaultModelBuilderTest, SkipsSingleRowSegments) {
    FaultModel model = builder.build(reader.parse(TestFixtures::twoSegmentFsp()));

    // Only the first segment has two depth rows
    ASSERT_EQ(model.size(), 4u);
    for (const auto& p : model.getPatches()) {
        EXPECT_NEAR(p.getStrike(), 45.0, tol);
        EXPECT_NEAR(p.getAngle(), 45.0, tol);
        EXPECT_NEAR(p.getDip(), 60.0, tol);
        EXPECT_NEAR(p.getLength(), 5000.0, tol);
        EXPECT_NEAR(p.getWidth(), 5000.0, tol);
    }
    EXPECT_NEAR(model.getPatches()[0].getDepthTop(), 1000.0, tol);
    EXPECT_NEAR(model.getPatches()[0].getDepthBottom(), 5330.0, tol);

    const FaultPatch& p = model.getPatches()[3];
    EXPECT_NEAR(p.getRake(), 85.0, tol);
    EXPECT_NEAR(p.getSlipStrike(), 1.4 * std::cos(85.0 * M_PI / 180.0), 1e-9);
    EXPECT_NEAR(p.getSlipDip(), 1.4 * std::sin(85.0 * M_PI / 180.0), 1e-9);

    EXPECT_NEAR(model.getMeanDip(), 60.0, tol);
    EXPECT_NEAR(model.getMeanStrike(), 45.0, tol);
}

TEST_F(FaultModelBuilderTest, CornersSpanPatchLengthAlongStrike) {
    FaultModel model = builder.build(reader.parse(TestFixtures::twoSegmentFsp()));
    for (const auto& p : model.getPatches()) {
        const auto& c = p.getLocalCorners();
        EXPECT_NEAR(std::hypot(c[0].x - c[1].x, c[0].y - c[1].y), p.getLength(), 1e-6);
        EXPECT_NEAR(std::hypot(c[2].x - c[3].x, c[2].y - c[3].y), p.getLength(), 1e-6);
        // Top edge direction follows the Cartesian angle
        double dir = std::atan2(c[0].y - c[1].y, c[0].x - c[1].x) * 180.0 / M_PI;
        EXPECT_NEAR(dir, p.getAngle(), 1e-6);
    }
}

TEST_F(FaultModelBuilderTest, MissingEpicenterIsFatal) {
    RuptureDescription d = reader.parse(TestFixtures::strikeSlipFsp());
    d.epicenterLatitude.reset();
    EXPECT_THROW(builder.build(d), RuptureParseError);
}

TEST_F(FaultModelBuilderTest, MissingDipIsFatal) {
    RuptureDescription d = reader.parse(TestFixtures::strikeSlipFsp());
    d.segments[0].fields.erase("DIP");
    EXPECT_THROW(builder.build(d), RuptureParseError);
}

TEST_F(FaultModelBuilderTest, StrikeFallsBackToHeader) {
    RuptureDescription d = reader.parse(TestFixtures::twoSegmentFsp());
    d.segments[0].fields.erase("STRIKE");
    FaultModel model = builder.build(d);
    ASSERT_FALSE(model.empty());
    EXPECT_NEAR(model.getPatches()[0].getStrike(), 30.0, tol);
    EXPECT_NEAR(model.getPatches()[0].getAngle(), 60.0, tol);
}

TEST_F(FaultModelBuilderTest, RequiresProjectorFactory) {
    EXPECT_THROW(FaultModelBuilder{ProjectorFactory()}, std::invalid_argument);
}
