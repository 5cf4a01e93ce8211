#ifndef polysimp_Point_hpp_
#define polysimp_Point_hpp_

#include <cmath>
#include <vector>
#include <Eigen/Geometry>

#include "libpolysimp.h"

namespace PolySimp {

// Planar vector / point of the simplified path. Unaligned, so that it may be
// stored in std::vector without an aligned allocator.
using Vec2d   = Eigen::Matrix<double, 2, 1, Eigen::DontAlign>;
using Pointf  = Vec2d;
using Pointfs = std::vector<Pointf>;

// 2D cross product (per product) of two vectors: u.x * v.y - u.y * v.x
template<typename Derived, typename Derived2>
inline typename Derived::Scalar cross2(const Eigen::MatrixBase<Derived> &v1, const Eigen::MatrixBase<Derived2> &v2)
{
    static_assert(Derived::IsVectorAtCompileTime && int(Derived::SizeAtCompileTime) == 2, "cross2(): first parameter is not a 2D vector");
    static_assert(Derived2::IsVectorAtCompileTime && int(Derived2::SizeAtCompileTime) == 2, "cross2(): second parameter is not a 2D vector");
    static_assert(std::is_same<typename Derived::Scalar, typename Derived2::Scalar>::value, "cross2(): Both vectors must be of the same type.");
    return v1.x() * v2.y() - v1.y() * v2.x();
}

// Vector rotated by 90 degrees CCW.
template<typename Derived>
inline Eigen::Matrix<typename Derived::Scalar, 2, 1, Eigen::DontAlign> perp(const Eigen::MatrixBase<Derived> &v)
{
    static_assert(Derived::IsVectorAtCompileTime && int(Derived::SizeAtCompileTime) == 2, "perp(): parameter is not a 2D vector");
    return { - v.y(), v.x() };
}

inline double dist_sq(const Vec2d &a, const Vec2d &b) { return (a - b).squaredNorm(); }

// True if any of the coordinates is an infinity or a NaN.
inline bool is_singular(const Vec2d &p) { return ! (std::isfinite(p.x()) && std::isfinite(p.y())); }

inline bool is_approx(const Vec2d &p1, const Vec2d &p2, double epsilon = 1e-9)
{
    return std::abs(p1.x() - p2.x()) < epsilon && std::abs(p1.y() - p2.y()) < epsilon;
}

} // namespace PolySimp

#endif // polysimp_Point_hpp_
