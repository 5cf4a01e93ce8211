#ifndef polysimp_Line_hpp_
#define polysimp_Line_hpp_

#include <ostream>

#include "libpolysimp.h"
#include "Point.hpp"

namespace PolySimp {

// Point expressed in the (s, t) coordinate system of a Line.
// The values are meaningful only together with the Line that produced them.
struct LineCoord
{
    double s { 0. };
    double t { 0. };
};

// Infinite line given implicitly by a x + b y + c = 0.
//
// Each implicit definition spans its own coordinate system:
//      (x, y) = O + s T + t N
// where O is the projection of the cartesian origin onto the line,
// T = (-b, a) is the tangent and N = (a, b) is the normal.
// The coefficients are not normalized, thus neither T nor N is a unit vector
// and two definitions of the same line may produce different coordinate systems.
class Line
{
public:
    Line() = default;
    Line(double a, double b, double c) : a(a), b(b), c(c) {}

    // Projection of (0, 0) onto the line, the origin of the line coordinate system.
    Vec2d       origin() const;
    Vec2d       tangent() const { return { - b, a }; }
    Vec2d       normal() const { return { a, b }; }
    // Squared length of the normal vector.
    double      normal_sq() const { return a * a + b * b; }

    // Cartesian (x, y) to line (s, t).
    LineCoord   map(const Vec2d &p) const;
    // Line (s, t) to cartesian (x, y).
    Vec2d       unmap(const LineCoord &l) const { return this->unmap(l.s, l.t); }
    Vec2d       unmap(double s, double t) const;
    // Convert a coordinate given in this line's system into the system of other line.
    LineCoord   remap(const Line &other, const LineCoord &l) const { return this->remap(other, l.s, l.t); }
    LineCoord   remap(const Line &other, double s, double t) const { return other.map(this->unmap(s, t)); }

    // Signed value of the implicit equation, proportional to the signed distance.
    double      eval(const Vec2d &p) const { return a * p.x() + b * p.y() + c; }
    // Squared euclidean distance of a point from the line.
    double      distance_to_squared(const Vec2d &p) const { return sqr(this->eval(p)) / this->normal_sq(); }

    bool operator==(const Line &rhs) const { return a == rhs.a && b == rhs.b && c == rhs.c; }
    bool operator!=(const Line &rhs) const { return ! (*this == rhs); }

    double a { 1. };
    double b { -1. };
    double c { 0. };
};

inline std::ostream& operator<<(std::ostream &os, const Line &l)
{
    return os << "(" << l.a << ", " << l.b << ", " << l.c << ")";
}

} // namespace PolySimp

#endif // polysimp_Line_hpp_
