#include "Geometry.hpp"

#include <cmath>
#include <utility>

namespace PolySimp { namespace Geometry {

bool segments_intersect(const Vec2d &a, const Vec2d &b, const Vec2d &c, const Vec2d &d)
{
    // The segments intersect only if the end points of each of them are on the opposite sides of the other.
    const Vec2d  ab  = b - a;
    const Vec2d  ac  = c - a;
    const Vec2d  ad  = d - a;
    const double sab = cross2(ab, ac) * cross2(ab, ad);
    if (sab > 0)
        return false;
    const Vec2d  cd  = d - c;
    const Vec2d  cb  = b - c;
    // ac is used instead of ca, thus the sign of the test is reversed.
    const double scd = cross2(cd, ac) * cross2(cd, cb);
    if (scd < 0)
        return false;
    if (sab == 0 && scd == 0) {
        // All four points are collinear, test for an overlap.
        const double ab2 = ab.squaredNorm();
        return ac.squaredNorm() <= ab2 || ad.squaredNorm() < ab2;
    }
    return true;
}

Vec2d project(const Vec2d &p, const Line &line)
{
    const double t = - line.eval(p) / line.normal_sq();
    return { p.x() + t * line.a, p.y() + t * line.b };
}

Vec2d intersection(const Line &l1, const Line &l2)
{
    // Solve A x = b with A = [a11 a12; a21 a22] by Gaussian elimination with full pivoting.
    double a11 = l1.a, a12 = l1.b, b1 = - l1.c;
    double a21 = l2.a, a22 = l2.b, b2 = - l2.c;

    // Rearrange the system so that a11 is the pivot.
    if (std::max(std::abs(a11), std::abs(a12)) < std::max(std::abs(a21), std::abs(a22))) {
        std::swap(a11, a21);
        std::swap(a12, a22);
        std::swap(b1, b2);
    }
    bool swap_result = false;
    if (std::abs(a11) < std::abs(a12)) {
        std::swap(a11, a12);
        std::swap(a21, a22);
        swap_result = true;
    }

    a22 -= a12 * a21 / a11;
    b2  -= b1  * a21 / a11;
    const double x2 = b2 / a22;
    const double x1 = (b1 - a12 * x2) / a11;

    return swap_result ? Vec2d(x2, x1) : Vec2d(x1, x2);
}

} } // namespace PolySimp::Geometry
