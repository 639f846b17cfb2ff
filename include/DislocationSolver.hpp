#ifndef DISLOCATION_SOLVER_HPP
#define DISLOCATION_SOLVER_HPP

#include "Tensor.hpp"
#include <array>

namespace CFSM {

/**
 * @brief Displacement and displacement gradient from one dislocation
 *
 * gradient[i][j] = ∂u_i/∂x_j. status is the solver's return code; 0 means
 * a regular result, non-zero a singular point.
 */
struct DislocationResponse {
    Vec3 displacement = {0.0, 0.0, 0.0};
    Matrix3 gradient = {{{0.0, 0.0, 0.0}, {0.0, 0.0, 0.0}, {0.0, 0.0, 0.0}}};
    int status = 0;
};

/**
 * @brief Elastic half-space solver for a rectangular dislocation
 *
 * The fault frame has x along strike, y horizontal and perpendicular to
 * strike, z up (observation z <= 0). The rectangle spans strike_span along
 * x and dip_span along the dip direction from a reference point at depth.
 * Implementations must be deterministic and free of side effects so that
 * they can be called concurrently.
 */
class DislocationSolver {
public:
    virtual ~DislocationSolver() = default;

    /**
     * @param alpha Medium constant (λ+μ)/(λ+2μ)
     * @param point Observation point in the fault frame (m)
     * @param depth Depth of the fault reference point (m, positive)
     * @param dip Dip angle (degrees)
     * @param strike_span Along-strike extent [AL1, AL2] (m)
     * @param dip_span Along-dip extent [AW1, AW2] (m)
     * @param dislocation Strike-slip, dip-slip and tensile components (m)
     */
    virtual DislocationResponse solve(double alpha, const Vec3& point,
                                      double depth, double dip,
                                      const std::array<double, 2>& strike_span,
                                      const std::array<double, 2>& dip_span,
                                      const Vec3& dislocation) const = 0;
};

} // namespace CFSM

#endif // DISLOCATION_SOLVER_HPP
