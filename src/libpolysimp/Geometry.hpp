#ifndef polysimp_Geometry_hpp_
#define polysimp_Geometry_hpp_

#include "libpolysimp.h"
#include "Line.hpp"
#include "Point.hpp"

namespace PolySimp { namespace Geometry {

// Signed area of the parallelogram spanned by (b - a) and (p - a).
// Positive if p is left of the directed line a->b, negative if right, zero if collinear.
inline double side(const Vec2d &a, const Vec2d &b, const Vec2d &p)
{
    return cross2(b - a, p - a);
}

// Test whether segments ab and cd intersect.
// Touching segments intersect. If all four points are collinear, the segments intersect
// if c lies inside the closed disk around a of radius |ab| or d lies inside the open one.
bool segments_intersect(const Vec2d &a, const Vec2d &b, const Vec2d &c, const Vec2d &d);

// Orthogonal projection of a point onto an infinite line.
Vec2d project(const Vec2d &p, const Line &line);

// Intersection of two infinite lines.
// The result contains infinities if the lines are parallel and NaNs if they are identical,
// test it with is_singular() before use.
Vec2d intersection(const Line &l1, const Line &l2);

} } // namespace PolySimp::Geometry

#endif // polysimp_Geometry_hpp_
