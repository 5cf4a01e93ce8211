#ifndef polysimp_LineFitter_hpp_
#define polysimp_LineFitter_hpp_

#include <vector>

#include "libpolysimp.h"
#include "Line.hpp"
#include "Point.hpp"

namespace PolySimp {

// Least squares linear approximation of a contiguous range of an append only point sequence.
//
// Given a line L: a x + b y + c = 0, the squared distance of a point p = (x, y) from L is
//      d(L, p) = (a x + b y + c)^2 / (a^2 + b^2).
// The line minimizing the sum of d(L, p_k) over a point range is obtained from the roots
// of the derivatives of that sum, which only depend on the sums of x, y, x^2, y^2 and x y
// over the range. These are kept as prefix sums, so that after a linear preprocessing
// the optimal line of any range is calculated in a constant time.
class LineFitter
{
public:
    LineFitter() { this->clear(); }

    // Append a point to the approximated sequence.
    void    push(const Vec2d &p);
    // Forget all points.
    void    clear();
    // Number of points pushed since the last clear.
    size_t  size() const { return m_sums.size() - 1; }
    bool    empty() const { return this->size() == 0; }

    // Line approximating points i..j inclusive.
    // Throws OutOfRange if j is not a valid index or if i > j + 1.
    Line    fit_line(size_t i, size_t j) const;
    // Line approximating all points pushed so far.
    Line    fit_line_whole() const;

    // Line approximating n points given their coordinate sums.
    static Line fit_line(double sum_x, double sum_y, double sum_xx, double sum_yy, double sum_xy, double n);

private:
    struct Sums {
        double x  { 0. };
        double y  { 0. };
        double xx { 0. };
        double yy { 0. };
        double xy { 0. };
    };

    // m_sums[k] aggregates points 0..k-1, m_sums[0] is zero.
    std::vector<Sums> m_sums;
    // Differences of the prefix sums lose precision, single point ranges are fitted from the points.
    Pointfs           m_points;
};

} // namespace PolySimp

#endif // polysimp_LineFitter_hpp_
