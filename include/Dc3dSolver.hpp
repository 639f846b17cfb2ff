#ifndef DC3D_SOLVER_HPP
#define DC3D_SOLVER_HPP

#include "DislocationSolver.hpp"

// Okada (1992) DC3D, Fortran 77 calling convention
extern "C" void dc3d_(
    // in
    const double* ALPHA,
    const double* X, const double* Y, const double* Z,
    const double* DEPTH, const double* DIP,
    const double* AL1, const double* AL2, const double* AW1, const double* AW2,
    const double* DISL1, const double* DISL2, const double* DISL3,
    // out
    double* UX, double* UY, double* UZ,
    double* UXX, double* UYX, double* UZX,
    double* UXY, double* UYY, double* UZY,
    double* UXZ, double* UYZ, double* UZZ,
    int* IRET);

namespace CFSM {

/**
 * @brief DislocationSolver backed by Okada's DC3D routine
 */
class Dc3dSolver : public DislocationSolver {
public:
    DislocationResponse solve(double alpha, const Vec3& point,
                              double depth, double dip,
                              const std::array<double, 2>& strike_span,
                              const std::array<double, 2>& dip_span,
                              const Vec3& dislocation) const override;
};

} // namespace CFSM

#endif // DC3D_SOLVER_HPP
