#include "TensorAnalysis.hpp"
#include "CoordinateSystem.hpp"
#include <cmath>

namespace CFSM {
namespace TensorAnalysis {

SymmetricTensor deviatoric(const SymmetricTensor& tensor) {
    return tensor - SymmetricTensor::identity() * tensor.mean();
}

std::vector<SymmetricTensor> deviatoric(const std::vector<SymmetricTensor>& tensors) {
    std::vector<SymmetricTensor> ret;
    ret.reserve(tensors.size());
    for (const auto& t : tensors) {
        ret.push_back(deviatoric(t));
    }
    return ret;
}

Invariants invariants(const std::vector<SymmetricTensor>& tensors) {
    Invariants ret;
    ret.i1.reserve(tensors.size());
    ret.i2.reserve(tensors.size());
    ret.i3.reserve(tensors.size());
    for (const auto& t : tensors) {
        ret.i1.push_back(t.trace());
        ret.i2.push_back(t.principalMinorSum());
        ret.i3.push_back(t.determinant());
    }
    return ret;
}

std::vector<double> maxShear(const std::vector<SymmetricTensor>& tensors) {
    std::vector<double> ret;
    ret.reserve(tensors.size());
    for (const auto& t : tensors) {
        auto p = t.principalValues();
        ret.push_back((p[0] - p[2]) / 2.0);
    }
    return ret;
}

double cfs(const SymmetricTensor& tensor, const Vec3& n_normal,
           const Vec3& n_in_plane, double coefficient_of_friction) {
    double delta_tau = tensor.contract(n_normal, n_in_plane);
    double delta_sigma = tensor.contract(n_normal, n_normal);
    return delta_tau + coefficient_of_friction * delta_sigma;
}

std::vector<double> cfs(const std::vector<SymmetricTensor>& tensors,
                        const Vec3& n_normal, const Vec3& n_in_plane,
                        double coefficient_of_friction) {
    std::vector<double> ret;
    ret.reserve(tensors.size());
    for (const auto& t : tensors) {
        ret.push_back(cfs(t, n_normal, n_in_plane, coefficient_of_friction));
    }
    return ret;
}

std::vector<double> cfsNormal(const std::vector<SymmetricTensor>& tensors,
                              const Vec3& n_normal,
                              double coefficient_of_friction) {
    std::vector<double> ret;
    ret.reserve(tensors.size());
    for (const auto& t : tensors) {
        ret.push_back(coefficient_of_friction * t.contract(n_normal, n_normal));
    }
    return ret;
}

std::vector<double> cfsTotal(const std::vector<SymmetricTensor>& tensors,
                             const Vec3& n_normal, const Vec3& n_in_plane,
                             double coefficient_of_friction) {
    std::vector<double> ret;
    ret.reserve(tensors.size());
    Vec3 n_cross = cross(n_normal, n_in_plane);
    for (const auto& t : tensors) {
        double delta_tau1 = t.contract(n_normal, n_in_plane);
        double delta_tau2 = t.contract(n_normal, n_cross);
        double delta_sigma = t.contract(n_normal, n_normal);
        ret.push_back(std::abs(delta_tau1) + std::abs(delta_tau2)
                      + coefficient_of_friction * delta_sigma);
    }
    return ret;
}

// Rotation about the vertical axis: [[c, s, 0], [-s, c, 0], [0, 0, 1]]
static Vec3 rotateAboutVertical(const Vec3& v, double angle_rad) {
    double c = std::cos(angle_rad);
    double s = std::sin(angle_rad);
    return {c*v[0] + s*v[1], -s*v[0] + c*v[1], v[2]};
}

ReceiverOrientation receiverOrientation(double azimuth_deg, double dip_deg) {
    ReceiverOrientation r;
    r.azimuth = azimuth_deg;
    r.dip = dip_deg;

    double rotation_angle = Geodetic::deg2rad(dip_deg - 90.0);
    double azimuth = Geodetic::deg2rad(azimuth_deg);

    r.inPlane = rotateAboutVertical(rotateAboutVertical({0, 1, 0}, azimuth), rotation_angle);
    r.normal = rotateAboutVertical(rotateAboutVertical({1, 0, 0}, azimuth), rotation_angle);
    return r;
}

} // namespace TensorAnalysis
} // namespace CFSM
