#ifndef TENSOR_ANALYSIS_HPP
#define TENSOR_ANALYSIS_HPP

#include "Tensor.hpp"
#include <vector>

namespace CFSM {

/**
 * @brief Receiver fault plane used to resolve Coulomb stresses
 *
 * Built once per run from the receiver azimuth and dip (degrees).
 */
struct ReceiverOrientation {
    double azimuth;         // Receiver azimuth (degrees)
    double dip;             // Receiver dip (degrees)
    Vec3 normal;            // Unit normal to the receiver plane
    Vec3 inPlane;           // Unit vector in the preferred slip direction

    ReceiverOrientation() : azimuth(0), dip(0), normal({1, 0, 0}), inPlane({0, 1, 0}) {}
};

/**
 * @brief Scalar reductions of symmetric tensor fields
 *
 * Every function returns one value per input tensor. The Coulomb criteria
 * are three conventions over the same resolved stress; a study should pick
 * one and use it consistently. The sign convention of cfs() is kept as the
 * classical formula and is not reinterpreted here.
 */
namespace TensorAnalysis {

    struct Invariants {
        std::vector<double> i1;     // tr(T)
        std::vector<double> i2;     // Sum of 2x2 principal minors
        std::vector<double> i3;     // det(T)
    };

    SymmetricTensor deviatoric(const SymmetricTensor& tensor);
    std::vector<SymmetricTensor> deviatoric(const std::vector<SymmetricTensor>& tensors);

    Invariants invariants(const std::vector<SymmetricTensor>& tensors);

    // (λmax - λmin) / 2
    std::vector<double> maxShear(const std::vector<SymmetricTensor>& tensors);

    // n·T·s + μf (n·T·n)
    double cfs(const SymmetricTensor& tensor, const Vec3& n_normal,
               const Vec3& n_in_plane, double coefficient_of_friction);
    std::vector<double> cfs(const std::vector<SymmetricTensor>& tensors,
                            const Vec3& n_normal, const Vec3& n_in_plane,
                            double coefficient_of_friction);

    // μf (n·T·n)
    std::vector<double> cfsNormal(const std::vector<SymmetricTensor>& tensors,
                                  const Vec3& n_normal,
                                  double coefficient_of_friction);

    // |n·T·s| + |n·T·(n×s)| + μf (n·T·n)
    std::vector<double> cfsTotal(const std::vector<SymmetricTensor>& tensors,
                                 const Vec3& n_normal, const Vec3& n_in_plane,
                                 double coefficient_of_friction);

    /**
     * @brief Receiver plane vectors from an azimuth and dip
     *
     * The reference normal (1,0,0) and in-plane (0,1,0) vectors are rotated
     * about the vertical axis by the azimuth, then by (dip - 90).
     */
    ReceiverOrientation receiverOrientation(double azimuth_deg, double dip_deg);
}

} // namespace CFSM

#endif // TENSOR_ANALYSIS_HPP
