/**
 * @file test_okada_strike_slip.cpp
 * @brief Symmetry and boundary checks of the Okada solution for a vertical strike-slip fault
 */

#include <gtest/gtest.h>
#include "Dc3dSolver.hpp"
#include "FaultModel.hpp"
#include "StressFieldEngine.hpp"
#include <cmath>

using namespace CFSM;

namespace {

double magnitude(const SymmetricTensor& t) {
    return std::sqrt(t.xx * t.xx + t.yy * t.yy + t.zz * t.zz
                     + 2.0 * (t.xy * t.xy + t.xz * t.xz + t.yz * t.yz));
}

} // namespace

class OkadaStrikeSlipTest : public ::testing::Test {
protected:
    // Vertical fault in the plane y = 0, from 5 to 15 km depth, 10 km long
    const double depth = 10000.0;
    const double dip = 90.0;
    const std::array<double, 2> strikeSpan = {{-5000.0, 5000.0}};
    const std::array<double, 2> dipSpan = {{-5000.0, 5000.0}};
    const Vec3 slip = {1.0, 0.0, 0.0};
    const double lambda = 3.0e10;
    const double mu = 3.0e10;
    const double alpha = (lambda + mu) / (lambda + 2.0 * mu);

    Dc3dSolver solver;

    DislocationResponse at(double x, double y, double z) const {
        return solver.solve(alpha, {x, y, z}, depth, dip, strikeSpan, dipSpan, slip);
    }

    SymmetricTensor stressAt(double x, double y, double z) const {
        DislocationResponse r = at(x, y, z);
        EXPECT_EQ(r.status, 0);
        SymmetricTensor strain = SymmetricTensor::symmetricPart(r.gradient);
        double tr = strain.trace();
        return SymmetricTensor(lambda * tr + 2.0 * mu * strain.xx,
                               lambda * tr + 2.0 * mu * strain.yy,
                               lambda * tr + 2.0 * mu * strain.zz,
                               2.0 * mu * strain.xy, 2.0 * mu * strain.xz, 2.0 * mu * strain.yz);
    }
};

TEST_F(OkadaStrikeSlipTest, DisplacementSymmetryAcrossFaultPlane) {
    const double points[][3] = {{2000.0, 3000.0, -2500.0}, {-4000.0, 8000.0, -7000.0},
                                {12000.0, 1500.0, 0.0}, {0.0, 20000.0, -10000.0}};
    for (const auto& p : points) {
        DislocationResponse a = at(p[0], p[1], p[2]);
        DislocationResponse b = at(p[0], -p[1], p[2]);
        ASSERT_EQ(a.status, 0);
        ASSERT_EQ(b.status, 0);

        double scale = 1e-9 + 1e-6 * std::abs(a.displacement[0]);
        EXPECT_NEAR(a.displacement[0], -b.displacement[0], scale);
        EXPECT_NEAR(a.displacement[1], b.displacement[1], 1e-9 + 1e-6 * std::abs(a.displacement[1]));
        EXPECT_NEAR(a.displacement[2], -b.displacement[2], 1e-9 + 1e-6 * std::abs(a.displacement[2]));
    }
}

TEST_F(OkadaStrikeSlipTest, StressSymmetryAcrossFaultPlane) {
    const double points[][3] = {{2000.0, 3000.0, -2500.0}, {-4000.0, 8000.0, -7000.0},
                                {7000.0, 500.0, -12000.0}};
    for (const auto& p : points) {
        SymmetricTensor a = stressAt(p[0], p[1], p[2]);
        SymmetricTensor b = stressAt(p[0], -p[1], p[2]);
        double tol = 1e-6 * (1.0 + magnitude(a));

        // Normal stresses and the xz shear change sign
        EXPECT_NEAR(a.xx, -b.xx, tol);
        EXPECT_NEAR(a.yy, -b.yy, tol);
        EXPECT_NEAR(a.zz, -b.zz, tol);
        EXPECT_NEAR(a.xz, -b.xz, tol);
        // The fault-parallel shears do not
        EXPECT_NEAR(a.xy, b.xy, tol);
        EXPECT_NEAR(a.yz, b.yz, tol);
    }
}

TEST_F(OkadaStrikeSlipTest, FreeSurfaceIsTractionFree) {
    const double points[][2] = {{2000.0, 3000.0}, {-9000.0, 6000.0}, {15000.0, -4000.0}};
    for (const auto& p : points) {
        SymmetricTensor s = stressAt(p[0], p[1], 0.0);
        double tol = 1e-6 * (1.0 + magnitude(s));
        EXPECT_NEAR(s.zz, 0.0, tol);
        EXPECT_NEAR(s.xz, 0.0, tol);
        EXPECT_NEAR(s.yz, 0.0, tol);
    }
}

TEST_F(OkadaStrikeSlipTest, FieldDecaysWithDistance) {
    double near = magnitude(stressAt(0.0, 5000.0, -10000.0));
    double far = magnitude(stressAt(0.0, 50000.0, -10000.0));
    double farther = magnitude(stressAt(0.0, 200000.0, -10000.0));
    EXPECT_GT(near, far);
    EXPECT_GT(far, farther);
    EXPECT_GT(near, 1.0e4);
}

TEST_F(OkadaStrikeSlipTest, SingularAndInvalidPoints) {
    // On the fault edge
    EXPECT_NE(at(5000.0, 0.0, -10000.0).status, 0);
    // Above the free surface
    EXPECT_NE(at(1000.0, 1000.0, 10.0).status, 0);
}

TEST_F(OkadaStrikeSlipTest, EngineKeepsSymmetryInMapFrame) {
    // A patch whose strike runs east so that the fault frame matches the map frame
    auto projector = std::make_shared<LocalTangentProjector>(0.0, 0.0);
    FaultModel model(projector, 0.0, 0.0);
    FaultPatch::Definition def;
    def.projectedTopCenter = GeoPoint(0.0, 0.0, 0.0);
    def.depthTop = 5000.0;
    def.depthBottom = 15000.0;
    def.dip = dip;
    def.strike = 90.0;
    def.angle = 0.0;
    def.rake = 0.0;
    def.slip = 1.0;
    def.length = 10000.0;
    def.width = 10000.0;
    model.addPatch(FaultPatch(def));

    StressFieldEngine engine(solver, lambda, mu);
    SymmetricTensor e1, s1, e2, s2;
    engine.computePoint(GeoPoint(2000.0, 3000.0, -2500.0), model, e1, s1);
    engine.computePoint(GeoPoint(2000.0, -3000.0, -2500.0), model, e2, s2);
    double tol = 1e-6 * (1.0 + magnitude(s1));
    EXPECT_NEAR(s1.xx, -s2.xx, tol);
    EXPECT_NEAR(s1.xy, s2.xy, tol);
    EXPECT_GT(magnitude(s1), 0.0);
}

TEST_F(OkadaStrikeSlipTest, NorthStrikingPatchAcrossFaultPlane) {
    // Single vertical patch striking north with 1 m of pure strike slip
    auto projector = std::make_shared<LocalTangentProjector>(0.0, 0.0);
    FaultModel model(projector, 0.0, 0.0);
    FaultPatch::Definition def;
    def.projectedTopCenter = GeoPoint(0.0, 0.0, 0.0);
    def.depthTop = 5000.0;
    def.depthBottom = 15000.0;
    def.dip = dip;
    def.strike = 0.0;
    def.angle = 90.0;
    def.rake = 0.0;
    def.slip = 1.0;
    def.length = 10000.0;
    def.width = 10000.0;
    model.addPatch(FaultPatch(def));

    StressFieldEngine engine(solver, lambda, mu);
    const double offsets[][2] = {{3000.0, 2000.0}, {8000.0, 5000.0}, {1500.0, 12000.0}};
    for (const auto& o : offsets) {
        SymmetricTensor e1, s1, e2, s2;
        engine.computePoint(GeoPoint(o[0], o[1], -2500.0), model, e1, s1);
        engine.computePoint(GeoPoint(-o[0], o[1], -2500.0), model, e2, s2);
        double tol = 1e-6 * (1.0 + magnitude(s1));

        // Tensors are in the patch frame; its y axis is the fault normal
        EXPECT_NEAR(s1.xx, -s2.xx, tol);
        EXPECT_NEAR(s1.yy, -s2.yy, tol);
        EXPECT_NEAR(s1.zz, -s2.zz, tol);
        EXPECT_NEAR(s1.xz, -s2.xz, tol);
        EXPECT_NEAR(s1.xy, s2.xy, tol);
        EXPECT_NEAR(s1.yz, s2.yz, tol);
        EXPECT_GT(magnitude(s1), 1.0e3);
    }
}
