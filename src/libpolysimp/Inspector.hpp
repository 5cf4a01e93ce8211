#ifndef polysimp_Inspector_hpp_
#define polysimp_Inspector_hpp_

#include <array>
#include <optional>

#include "libpolysimp.h"
#include "ErrorBox.hpp"
#include "PathSimplifier.hpp"
#include "Point.hpp"

namespace PolySimp {

// State of the admissibility scan of the latest appended point, captured at a given trace position.
struct TraceSnapshot
{
    // Index of the latest appended point.
    size_t                                  j     { NO_INDEX };
    // Smallest index extended into the error box and offered to the hull.
    size_t                                  i_min { NO_INDEX };
    // Verdict at the inspected trace position.
    std::optional<PathSimplifier::Verdict>  verdict;
    std::optional<ErrorBox>                 error_box;
    std::array<Vec2d, 4>                    error_box_corners;
    // Hull vertices in CCW order starting with the last accepted point.
    Pointfs                                 hull;

    bool empty() const { return ! verdict.has_value(); }
};

// Recompute the error box and the convex hull of the latest append as they were when the scan
// reached trace position depth. The depth is clamped to the trace size.
// Returns an empty snapshot if no point was appended yet.
TraceSnapshot inspect_trace(const PathSimplifier &simplifier, size_t depth);

} // namespace PolySimp

#endif // polysimp_Inspector_hpp_
