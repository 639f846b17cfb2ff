#include "Dc3dSolver.hpp"

namespace CFSM {

DislocationResponse Dc3dSolver::solve(double alpha, const Vec3& point,
                                      double depth, double dip,
                                      const std::array<double, 2>& strike_span,
                                      const std::array<double, 2>& dip_span,
                                      const Vec3& dislocation) const {
    double ux, uy, uz;
    double uxx, uyx, uzx, uxy, uyy, uzy, uxz, uyz, uzz;
    int iret = 0;

    dc3d_(&alpha, &point[0], &point[1], &point[2], &depth, &dip,
          &strike_span[0], &strike_span[1], &dip_span[0], &dip_span[1],
          &dislocation[0], &dislocation[1], &dislocation[2],
          &ux, &uy, &uz,
          &uxx, &uyx, &uzx, &uxy, &uyy, &uzy, &uxz, &uyz, &uzz,
          &iret);

    DislocationResponse r;
    r.displacement = {ux, uy, uz};
    // DC3D returns UIJ = ∂u_i/∂x_j
    r.gradient[0] = {uxx, uxy, uxz};
    r.gradient[1] = {uyx, uyy, uyz};
    r.gradient[2] = {uzx, uzy, uzz};
    r.status = iret;
    return r;
}

} // namespace CFSM
