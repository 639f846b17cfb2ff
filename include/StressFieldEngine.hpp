#ifndef STRESS_FIELD_ENGINE_HPP
#define STRESS_FIELD_ENGINE_HPP

#include "CoordinateSystem.hpp"
#include "DislocationSolver.hpp"
#include "Tensor.hpp"
#include <petscsys.h>
#include <vector>

namespace CFSM {

class FaultModel;

/**
 * @brief Strain and stress tensors, one of each per observation point
 */
struct StressField {
    std::vector<SymmetricTensor> strains;
    std::vector<SymmetricTensor> stresses;

    size_t size() const { return strains.size(); }
    void resize(size_t n) {
        strains.resize(n);
        stresses.resize(n);
    }
};

/**
 * @brief Superposes the elastic response of every fault patch
 *
 * For each observation point (projected frame, z negative down) and patch,
 * the point is moved into the patch frame (translated to the patch top
 * centre, rotated by minus the patch angle) and handed to the dislocation
 * solver. The symmetric part of the displacement gradients is summed over
 * patches, and stress follows from Hooke's law
 *   σ = λ tr(ε) I + 2μ ε
 */
class StressFieldEngine {
public:
    /**
     * @throws std::invalid_argument unless μ > 0 and λ + 2μ > 0
     */
    StressFieldEngine(const DislocationSolver& solver,
                      double lame_lambda, double shear_modulus_mu);

    double getAlpha() const { return alpha_; }
    double getLameLambda() const { return lambda_; }
    double getShearModulus() const { return mu_; }

    StressField computeField(const std::vector<GeoPoint>& points,
                             const FaultModel& model) const;

    // Strain and stress at a single point; returns the singular evaluation count
    size_t computePoint(const GeoPoint& point, const FaultModel& model,
                      SymmetricTensor& strain, SymmetricTensor& stress) const;

    /**
     * @brief Evaluate points [begin, end) into the same slots of out
     *
     * out must already hold points.size() entries. Returns the number of
     * solver calls that reported a singular point.
     */
    size_t computeRange(const std::vector<GeoPoint>& points, const FaultModel& model,
                        size_t begin, size_t end, StressField& out) const;

    /**
     * @brief Evaluate the field with points split across the ranks of comm
     *
     * Every rank must pass the same points; on return every rank holds the
     * complete field.
     */
    PetscErrorCode computeFieldDistributed(MPI_Comm comm,
                                           const std::vector<GeoPoint>& points,
                                           const FaultModel& model,
                                           StressField& out) const;

    SymmetricTensor stressFromStrain(const SymmetricTensor& strain) const;

private:
    const DislocationSolver& solver_;
    double lambda_;
    double mu_;
    double alpha_;
};

} // namespace CFSM

#endif // STRESS_FIELD_ENGINE_HPP
