#include "StressFieldEngine.hpp"
#include "FaultModel.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace CFSM {

namespace {

// Components packed per point for the collective gather
constexpr int COMPONENTS_PER_POINT = 12;

void pack(const SymmetricTensor& t, double* dst) {
    dst[0] = t.xx; dst[1] = t.yy; dst[2] = t.zz;
    dst[3] = t.xy; dst[4] = t.xz; dst[5] = t.yz;
}

SymmetricTensor unpack(const double* src) {
    return SymmetricTensor(src[0], src[1], src[2], src[3], src[4], src[5]);
}

SymmetricTensor strainAt(const DislocationSolver& solver, double alpha,
                         const GeoPoint& point, const FaultModel& model,
                         size_t& singular) {
    SymmetricTensor strain;
    for (const auto& patch : model.getPatches()) {
        const GeoPoint& origin = patch.getProjectedTopCenter();
        auto local = rotate2D(point.x - origin.x, point.y - origin.y, -patch.getAngle());

        DislocationResponse r = solver.solve(alpha,
                                             {local[0], local[1], point.z},
                                             patch.getDepthBottom(),
                                             patch.getDip(),
                                             {0.0, patch.getLength()},
                                             {0.0, patch.getWidth()},
                                             {patch.getSlipStrike(), patch.getSlipDip(), 0.0});
        if (r.status != 0) {
            ++singular;
        }
        strain += SymmetricTensor::symmetricPart(r.gradient);
    }
    return strain;
}

} // namespace

StressFieldEngine::StressFieldEngine(const DislocationSolver& solver,
                                     double lame_lambda, double shear_modulus_mu)
    : solver_(solver), lambda_(lame_lambda), mu_(shear_modulus_mu) {
    if (!(mu_ > 0.0) || !(lambda_ + 2.0 * mu_ > 0.0)) {
        std::ostringstream oss;
        oss << "Invalid elastic moduli: lambda = " << lambda_ << ", mu = " << mu_;
        throw std::invalid_argument(oss.str());
    }
    alpha_ = (lambda_ + mu_) / (lambda_ + 2.0 * mu_);
}

SymmetricTensor StressFieldEngine::stressFromStrain(const SymmetricTensor& strain) const {
    return SymmetricTensor::identity() * (lambda_ * strain.trace()) + strain * (2.0 * mu_);
}

size_t StressFieldEngine::computePoint(const GeoPoint& point, const FaultModel& model,
                                       SymmetricTensor& strain, SymmetricTensor& stress) const {
    size_t singular = 0;
    strain = strainAt(solver_, alpha_, point, model, singular);
    stress = stressFromStrain(strain);
    if (singular > 0) {
        std::cerr << "Warning: dislocation solver reported " << singular
                  << " singular evaluations at (" << point.x << ", " << point.y
                  << ", " << point.z << ")" << std::endl;
    }
    return singular;
}

size_t StressFieldEngine::computeRange(const std::vector<GeoPoint>& points,
                                       const FaultModel& model,
                                       size_t begin, size_t end,
                                       StressField& out) const {
    if (begin > end || end > points.size() || out.size() != points.size()) {
        throw std::out_of_range("computeRange: slice outside the point set");
    }
    size_t singular = 0;
    for (size_t i = begin; i < end; ++i) {
        out.strains[i] = strainAt(solver_, alpha_, points[i], model, singular);
        out.stresses[i] = stressFromStrain(out.strains[i]);
    }
    return singular;
}

StressField StressFieldEngine::computeField(const std::vector<GeoPoint>& points,
                                            const FaultModel& model) const {
    StressField field;
    field.resize(points.size());
    size_t singular = computeRange(points, model, 0, points.size(), field);
    if (singular > 0) {
        std::cerr << "Warning: dislocation solver reported " << singular
                  << " singular evaluations" << std::endl;
    }
    return field;
}

PetscErrorCode StressFieldEngine::computeFieldDistributed(MPI_Comm comm,
                                                          const std::vector<GeoPoint>& points,
                                                          const FaultModel& model,
                                                          StressField& out) const {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    PetscMPIInt size;
    ierr = MPI_Comm_size(comm, &size); CHKERRQ(ierr);

    PetscInt n_global = static_cast<PetscInt>(points.size());
    PetscInt n_local = PETSC_DECIDE;
    ierr = PetscSplitOwnership(comm, &n_local, &n_global); CHKERRQ(ierr);

    PetscInt start = 0;
    ierr = MPI_Scan(&n_local, &start, 1, MPIU_INT, MPI_SUM, comm); CHKERRQ(ierr);
    start -= n_local;

    out.resize(points.size());
    size_t singular = computeRange(points, model, static_cast<size_t>(start),
                                   static_cast<size_t>(start + n_local), out);

    std::vector<double> local_buf(static_cast<size_t>(n_local) * COMPONENTS_PER_POINT);
    for (PetscInt i = 0; i < n_local; ++i) {
        double* dst = &local_buf[static_cast<size_t>(i) * COMPONENTS_PER_POINT];
        pack(out.strains[start + i], dst);
        pack(out.stresses[start + i], dst + 6);
    }

    PetscMPIInt send_count = static_cast<PetscMPIInt>(n_local * COMPONENTS_PER_POINT);
    std::vector<PetscMPIInt> counts(size), displs(size);
    ierr = MPI_Allgather(&send_count, 1, MPI_INT, counts.data(), 1, MPI_INT, comm); CHKERRQ(ierr);
    displs[0] = 0;
    for (PetscMPIInt r = 1; r < size; ++r) {
        displs[r] = displs[r - 1] + counts[r - 1];
    }

    std::vector<double> global_buf(points.size() * COMPONENTS_PER_POINT);
    ierr = MPI_Allgatherv(local_buf.data(), send_count, MPI_DOUBLE,
                          global_buf.data(), counts.data(), displs.data(), MPI_DOUBLE,
                          comm); CHKERRQ(ierr);

    for (size_t i = 0; i < points.size(); ++i) {
        const double* src = &global_buf[i * COMPONENTS_PER_POINT];
        out.strains[i] = unpack(src);
        out.stresses[i] = unpack(src + 6);
    }

    unsigned long local_singular = singular, total_singular = 0;
    ierr = MPI_Allreduce(&local_singular, &total_singular, 1, MPI_UNSIGNED_LONG, MPI_SUM, comm); CHKERRQ(ierr);
    if (total_singular > 0) {
        ierr = PetscPrintf(comm, "Warning: dislocation solver reported %lu singular evaluations\n",
                           total_singular); CHKERRQ(ierr);
    }

    PetscFunctionReturn(0);
}

} // namespace CFSM
