#include "Tensor.hpp"
#include <algorithm>
#include <functional>
#include <stdexcept>

namespace CFSM {

// =============================================================================
// SymmetricTensor Implementation
// =============================================================================

SymmetricTensor SymmetricTensor::symmetricPart(const Matrix3& G) {
    return SymmetricTensor(G[0][0], G[1][1], G[2][2],
                           0.5 * (G[0][1] + G[1][0]),
                           0.5 * (G[0][2] + G[2][0]),
                           0.5 * (G[1][2] + G[2][1]));
}

double SymmetricTensor::operator()(int i, int j) const {
    if (i == j) {
        switch (i) {
            case 0: return xx;
            case 1: return yy;
            case 2: return zz;
        }
    } else {
        int k = i + j;  // 1 -> xy, 2 -> xz, 3 -> yz
        switch (k) {
            case 1: return xy;
            case 2: return xz;
            case 3: return yz;
        }
    }
    throw std::out_of_range("SymmetricTensor index out of range");
}

double SymmetricTensor::determinant() const {
    return xx*yy*zz + 2.0*xy*yz*xz - xx*yz*yz - yy*xz*xz - zz*xy*xy;
}

double SymmetricTensor::principalMinorSum() const {
    return (xx*yy - xy*xy) + (yy*zz - yz*yz) + (xx*zz - xz*xz);
}

Vec3 SymmetricTensor::apply(const Vec3& v) const {
    return {xx*v[0] + xy*v[1] + xz*v[2],
            xy*v[0] + yy*v[1] + yz*v[2],
            xz*v[0] + yz*v[1] + zz*v[2]};
}

std::array<double, 3> SymmetricTensor::principalValues() const {
    std::array<double, 3> principal;

    double off = xy*xy + xz*xz + yz*yz;
    if (off == 0.0) {
        principal = {xx, yy, zz};
        std::sort(principal.begin(), principal.end(), std::greater<double>());
        return principal;
    }

    // Trigonometric solution of det(T - λI) = 0 for real symmetric T
    double q = mean();
    double p2 = (xx - q)*(xx - q) + (yy - q)*(yy - q) + (zz - q)*(zz - q) + 2.0*off;
    double p = std::sqrt(p2 / 6.0);

    SymmetricTensor B = (*this - SymmetricTensor::identity() * q) * (1.0 / p);
    double r = std::clamp(B.determinant() / 2.0, -1.0, 1.0);
    double phi = std::acos(r) / 3.0;

    principal[0] = q + 2.0*p*std::cos(phi);
    principal[2] = q + 2.0*p*std::cos(phi + 2.0*M_PI/3.0);
    principal[1] = 3.0*q - principal[0] - principal[2];

    std::sort(principal.begin(), principal.end(), std::greater<double>());
    return principal;
}

Matrix3 SymmetricTensor::toMatrix() const {
    Matrix3 M;
    M[0] = {xx, xy, xz};
    M[1] = {xy, yy, yz};
    M[2] = {xz, yz, zz};
    return M;
}

SymmetricTensor SymmetricTensor::operator+(const SymmetricTensor& other) const {
    return SymmetricTensor(xx + other.xx, yy + other.yy, zz + other.zz,
                           xy + other.xy, xz + other.xz, yz + other.yz);
}

SymmetricTensor SymmetricTensor::operator-(const SymmetricTensor& other) const {
    return SymmetricTensor(xx - other.xx, yy - other.yy, zz - other.zz,
                           xy - other.xy, xz - other.xz, yz - other.yz);
}

SymmetricTensor SymmetricTensor::operator*(double scale) const {
    return SymmetricTensor(xx*scale, yy*scale, zz*scale,
                           xy*scale, xz*scale, yz*scale);
}

SymmetricTensor& SymmetricTensor::operator+=(const SymmetricTensor& other) {
    xx += other.xx; yy += other.yy; zz += other.zz;
    xy += other.xy; xz += other.xz; yz += other.yz;
    return *this;
}

} // namespace CFSM
