#ifndef TENSOR_HPP
#define TENSOR_HPP

#include <array>
#include <cmath>

namespace CFSM {

using Vec3 = std::array<double, 3>;
using Matrix3 = std::array<std::array<double, 3>, 3>;

inline double dot(const Vec3& a, const Vec3& b) {
    return a[0]*b[0] + a[1]*b[1] + a[2]*b[2];
}

inline Vec3 cross(const Vec3& a, const Vec3& b) {
    return {a[1]*b[2] - a[2]*b[1],
            a[2]*b[0] - a[0]*b[2],
            a[0]*b[1] - a[1]*b[0]};
}

inline double norm(const Vec3& a) {
    return std::sqrt(dot(a, a));
}

/**
 * @brief Symmetric 3x3 tensor (strain or stress)
 *
 * Only the six independent components are stored, so the tensor is
 * symmetric by construction:
 * | xx  xy  xz |
 * | xy  yy  yz |
 * | xz  yz  zz |
 */
struct SymmetricTensor {
    double xx, yy, zz;      // Normal components
    double xy, xz, yz;      // Shear components

    SymmetricTensor() : xx(0), yy(0), zz(0), xy(0), xz(0), yz(0) {}
    SymmetricTensor(double sxx, double syy, double szz,
                    double sxy, double sxz, double syz)
        : xx(sxx), yy(syy), zz(szz), xy(sxy), xz(sxz), yz(syz) {}

    // Symmetric part ½(G + Gᵀ) of a general 3x3 matrix
    static SymmetricTensor symmetricPart(const Matrix3& G);

    static SymmetricTensor identity() { return SymmetricTensor(1, 1, 1, 0, 0, 0); }

    double operator()(int i, int j) const;

    double trace() const { return xx + yy + zz; }
    double mean() const { return trace() / 3.0; }
    double determinant() const;

    // Sum of the three 2x2 principal minors
    double principalMinorSum() const;

    // T·v
    Vec3 apply(const Vec3& v) const;

    // a·T·b
    double contract(const Vec3& a, const Vec3& b) const { return dot(apply(a), b); }

    // Eigenvalues sorted λ₁ >= λ₂ >= λ₃
    std::array<double, 3> principalValues() const;

    Matrix3 toMatrix() const;

    SymmetricTensor operator+(const SymmetricTensor& other) const;
    SymmetricTensor operator-(const SymmetricTensor& other) const;
    SymmetricTensor operator*(double scale) const;
    SymmetricTensor& operator+=(const SymmetricTensor& other);
};

inline SymmetricTensor operator*(double scale, const SymmetricTensor& t) {
    return t * scale;
}

} // namespace CFSM

#endif // TENSOR_HPP
