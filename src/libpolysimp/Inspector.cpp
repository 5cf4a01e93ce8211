#include "Inspector.hpp"
#include "SimplePathHull.hpp"

#include <algorithm>

namespace PolySimp {

TraceSnapshot inspect_trace(const PathSimplifier &simplifier, size_t depth)
{
    TraceSnapshot out;
    const auto   &trace = simplifier.trace();
    if (simplifier.size() == 0 || trace.empty())
        return out;

    const Path       &path   = simplifier.path();
    const LineFitter &fitter = simplifier.fitter();
    const size_t      j      = simplifier.size() - 1;
    const size_t      k      = std::min(depth, trace.size() - 1);
    const Vec2d      &pj     = path.point(j);

    out.j       = j;
    out.verdict = trace[k];
    // The point, which was cut, was neither extended into the error box nor offered to the hull.
    out.i_min   = trace[k] == PathSimplifier::Verdict::Cut ? j - k + 1 : j - k;

    ErrorBox       error_box(fitter.fit_line(j, j), pj);
    SimplePathHull hull;
    hull.offer(pj);
    for (size_t i = j; i -- > out.i_min;) {
        const Vec2d &pi = path.point(i);
        error_box.extend(fitter.fit_line(i, j), pi);
        hull.offer(pi);
    }

    out.error_box_corners = error_box.cartesian_corners();
    out.error_box         = error_box;
    out.hull              = hull.polygon();
    return out;
}

} // namespace PolySimp
