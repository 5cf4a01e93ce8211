#ifndef polysimp_ErrorBox_hpp_
#define polysimp_ErrorBox_hpp_

#include <array>

#include "libpolysimp.h"
#include "Line.hpp"
#include "Point.hpp"

namespace PolySimp {

// Axis aligned rectangle [s0, s1] x [t0, t1] in the coordinate system of a line, bounding a growing point set.
// When the set is extended, the rectangle is carried over into the coordinate system of the new line,
// so that the maximum distance of the set from the newest line is bounded without revisiting the points.
// For details on the line coordinates see Line.
class ErrorBox
{
public:
    // Box containing a single point in the coordinate system of line.
    ErrorBox(const Line &line, const Vec2d &p);

    // Add a point to the bounded set and convert the box into the coordinate system of line.
    void        extend(const Line &line, const Vec2d &p);

    // Upper bound of the squared distance between any point inside the box and line().
    double      error() const;

    // Box corners in cartesian coordinates: (s0, t0), (s0, t1), (s1, t1), (s1, t0).
    std::array<Vec2d, 4> cartesian_corners() const;

    const Line& line() const { return m_line; }
    double      s0() const { return m_s0; }
    double      s1() const { return m_s1; }
    double      t0() const { return m_t0; }
    double      t1() const { return m_t1; }

private:
    Line    m_line;
    double  m_s0;
    double  m_s1;
    double  m_t0;
    double  m_t1;
};

} // namespace PolySimp

#endif // polysimp_ErrorBox_hpp_
