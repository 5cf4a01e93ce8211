#include "Line.hpp"

#include <cmath>

namespace PolySimp {

Vec2d Line::origin() const
{
    const double k = - c / this->normal_sq();
    return { a * k, b * k };
}

LineCoord Line::map(const Vec2d &p) const
{
    const double n2 = this->normal_sq();
    const double t  = this->eval(p) / n2;
    const double k  = c / n2 - t;
    // Resolve s from the coordinate with the larger coefficient to avoid a division by a near zero value.
    const double s  = std::abs(a) > std::abs(b) ? (p.y() + b * k) / a : - (p.x() + a * k) / b;
    return { s, t };
}

Vec2d Line::unmap(double s, double t) const
{
    const double k = t - c / this->normal_sq();
    return { k * a - s * b, k * b + s * a };
}

} // namespace PolySimp
