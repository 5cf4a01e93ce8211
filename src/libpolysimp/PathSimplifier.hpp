#ifndef polysimp_PathSimplifier_hpp_
#define polysimp_PathSimplifier_hpp_

#include <vector>

#include "libpolysimp.h"
#include "Line.hpp"
#include "LineFitter.hpp"
#include "Path.hpp"
#include "Point.hpp"
#include "SimplePathHull.hpp"

namespace PolySimp {

// Online simplification of a growing polygonal line.
//
// The simplified path is the shortest route in the unweighted admissible segment graph, whose vertices
// are the path points. Points i < j are connected if
//   1) the subpath i..j is simple,
//   2) the maximum distance of the subpath points from L, the least squares line of the subpath,
//      does not exceed the threshold,
//   3) point i is a pioneer with respect to L,
//   4) point j is a pioneer with respect to L.
// A point is a pioneer, if its projection onto L is extremal among the projections of the subpath points.
// A pioneer is always a vertex of the convex hull of the subpath and testing a hull vertex takes
// a constant time, see is_pioneer().
//
// When point j is appended, i = j - 1, j - 2, ... is tested against j while the hull of the subpath
// and an ErrorBox bounding the distance from L are extended by point i. The scan stops as soon as
// rule 1, 2 or 4 fails, as the rule will never hold again for a smaller i. The distance of j from
// the start in the graph is found along the way by dynamic programming.
//
// The simplified path is reconstructed from the least squares lines of the route edges,
// see simplified_points().
class PathSimplifier : public PathListener
{
public:
    // Outcome of testing the segment (i, j) while appending point j.
    enum class Verdict : unsigned char {
        // Segment is admissible. Also the first entry of each trace.
        Accept,
        // Subpath i..j is not simple (rule 1).
        Cut,
        // Maximum error exceeds the threshold (rule 2).
        Threshold,
        // Point i is not a pioneer (rule 3).
        PioneerWeak,
        // Point j is not a pioneer (rule 4).
        PioneerStrong,
    };

    struct PointTag {
        // Number of edges of the shortest route from point 0.
        size_t  distance    { 0 };
        // Preceding point along the shortest route, NO_INDEX for point 0.
        size_t  predecessor { NO_INDEX };
        // A segment starting at this point intersects a later non adjacent segment.
        // Once set, the point never starts an admissible segment again.
        bool    cut         { false };
    };

    // Attach a simplifier to a path. Points already present in the path are processed as if
    // they were appended after the simplifier was attached.
    // The path must outlive the simplifier.
    // Throws InvalidArgument if threshold is not a positive finite number.
    PathSimplifier(Path &path, double threshold);
    ~PathSimplifier() override;

    PathSimplifier(const PathSimplifier &) = delete;
    PathSimplifier& operator=(const PathSimplifier &) = delete;

    void on_append(const Path &sender, const Vec2d &p) override;
    void on_clear(const Path &sender) override;

    // Vertices of the simplified path, starting with the projection of the first original point.
    Pointfs             simplified_points() const;
    Path                get_simplified() const { return Path(this->simplified_points()); }

    const Path&         path() const { return m_path; }
    const LineFitter&   fitter() const { return m_fitter; }
    // Verdicts of the latest append for i = j - 1, j - 2, ..., preceded by an Accept sentinel.
    const std::vector<Verdict>& trace() const { return m_trace; }
    // Throws OutOfRange for an invalid index.
    const PointTag&     tag(size_t idx) const;
    size_t              size() const { return m_tags.size(); }
    double              threshold() const { return m_threshold; }

    // Test whether a hull node is a pioneer with respect to line: the projections of its hull neighbors
    // onto the line lie on the same side of its own projection. Evicted nodes are never pioneers.
    static bool         is_pioneer(const Line &line, const SimplePathHull &hull, size_t node);

private:
    Path                   &m_path;
    // Updated before the route scan of the same append.
    LineFitter              m_fitter;
    std::vector<PointTag>   m_tags;
    double                  m_threshold;
    double                  m_threshold_sq;
    std::vector<Verdict>    m_trace;
};

// Stable lower case name of a verdict: accept, cut, threshold, pioneer_weak, pioneer_strong.
const char* verdict_name(PathSimplifier::Verdict verdict);

} // namespace PolySimp

#endif // polysimp_PathSimplifier_hpp_
