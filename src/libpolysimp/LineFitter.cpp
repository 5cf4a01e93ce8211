#include "LineFitter.hpp"
#include "Exception.hpp"

#include <cmath>
#include <limits>
#include <string>

namespace PolySimp {

void LineFitter::push(const Vec2d &p)
{
    const double x = p.x();
    const double y = p.y();
    const Sums  &s = m_sums.back();
    m_points.emplace_back(p);
    m_sums.push_back({ s.x + x, s.y + y, s.xx + x * x, s.yy + y * y, s.xy + x * y });
}

void LineFitter::clear()
{
    m_sums.clear();
    m_sums.emplace_back();
    m_points.clear();
}

Line LineFitter::fit_line(size_t i, size_t j) const
{
    if (j >= this->size() || i > j + 1)
        throw OutOfRange("LineFitter::fit_line(): invalid range " + std::to_string(i) + ".." + std::to_string(j) +
                         " of " + std::to_string(this->size()) + " points");
    if (i == j) {
        const Vec2d &p = m_points[i];
        return fit_line(p.x(), p.y(), p.x() * p.x(), p.y() * p.y(), p.x() * p.y(), 1.);
    }
    const Sums &lo = m_sums[i];
    const Sums &hi = m_sums[j + 1];
    return fit_line(hi.x - lo.x, hi.y - lo.y, hi.xx - lo.xx, hi.yy - lo.yy, hi.xy - lo.xy, double(j + 1 - i));
}

Line LineFitter::fit_line_whole() const
{
    return this->empty() ? fit_line(0., 0., 0., 0., 0., 0.) : this->fit_line(0, this->size() - 1);
}

Line LineFitter::fit_line(double sum_x, double sum_y, double sum_xx, double sum_yy, double sum_xy, double n)
{
    if (n <= 0)
        return { 1., -1., 0. };

    // Both terms are non-negative by the Cauchy-Schwarz inequality, clamp them against rounding errors.
    const double fa = std::max(n * sum_xx - sum_x * sum_x, 0.);
    const double fb = std::max(n * sum_yy - sum_y * sum_y, 0.);

    // All the points are nearly coincident (always the case for a single point). The direction of the line
    // is ill conditioned, just return a line passing through the points.
    if (fa <= std::numeric_limits<double>::epsilon() && fb <= std::numeric_limits<double>::epsilon())
        return { -1., -1., (sum_x + sum_y) / n };

    // Both branches are equivalent in exact arithmetic, take the one dividing by the larger term.
    if (fa < fb) {
        const double b = (sum_x * sum_y - n * sum_xy) / fb;
        return { 1., b, - (sum_y * b + sum_x) / n };
    } else {
        const double a = (sum_x * sum_y - n * sum_xy) / fa;
        return { a, 1., - (sum_x * a + sum_y) / n };
    }
}

} // namespace PolySimp
