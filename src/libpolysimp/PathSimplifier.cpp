#include "PathSimplifier.hpp"
#include "ErrorBox.hpp"
#include "Exception.hpp"
#include "Geometry.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

namespace PolySimp {

PathSimplifier::PathSimplifier(Path &path, double threshold) :
    m_path(path), m_threshold(threshold), m_threshold_sq(sqr(threshold))
{
    if (! (threshold > 0.) || ! std::isfinite(threshold)) {
        BOOST_LOG_TRIVIAL(error) << "PathSimplifier: invalid threshold " << threshold;
        throw InvalidArgument("PathSimplifier: threshold must be a positive number, got " + std::to_string(threshold));
    }

    // Replay the points, which were appended before the simplifier was attached.
    this->on_clear(path);
    for (const Vec2d &p : path)
        this->on_append(path, p);
    const bool subscribed = path.subscribe(this);
    assert(subscribed);
    UNUSED(subscribed);

    BOOST_LOG_TRIVIAL(debug) << boost::format("PathSimplifier: attached to a path of %1% points, threshold %2%") % path.size() % threshold;
}

PathSimplifier::~PathSimplifier()
{
    m_path.unsubscribe(this);
}

void PathSimplifier::on_clear(const Path &sender)
{
    assert(&sender == &m_path);
    UNUSED(sender);
    m_fitter.clear();
    m_tags.clear();
    m_trace.clear();
    BOOST_LOG_TRIVIAL(debug) << "PathSimplifier: cleared";
}

void PathSimplifier::on_append(const Path &sender, const Vec2d &pj)
{
    assert(&sender == &m_path);
    // Line statistics have to include pj before the scan.
    m_fitter.push(pj);

    const size_t j = m_tags.size();
    m_trace.clear();
    m_trace.emplace_back(Verdict::Accept);

    if (j == 0) {
        m_tags.push_back({ 0, NO_INDEX, false });
        return;
    }

    ErrorBox       error_box(m_fitter.fit_line(j, j), pj);
    SimplePathHull hull;
    const size_t   nj = *hull.offer(pj);

    // Consecutive points are always connected.
    size_t best_predecessor = j - 1;
    size_t best_distance    = m_tags[j - 1].distance;

    for (size_t i = j; i -- > 0;) {
        const Vec2d &pi = sender.point(i);
        PointTag    &ti = m_tags[i];

        // The hull only handles simple polylines. Once a segment starting at i intersects
        // a later segment, no subpath starting at i or before is simple.
        if (ti.cut || (i + 2 < j && Geometry::segments_intersect(pi, sender.point(i + 1), sender.point(j - 1), pj))) {
            ti.cut = true;
            m_trace.emplace_back(Verdict::Cut);
            break;
        }

        const Line line = m_fitter.fit_line(i, j);
        error_box.extend(line, pi);
        if (error_box.error() > m_threshold_sq) {
            m_trace.emplace_back(Verdict::Threshold);
            break;
        }

        // If i is not a pioneer, a smaller i may still be one.
        // If j is not a pioneer, it will never become one again.
        std::optional<size_t> ni = hull.offer(pi);
        if (! ni || ! is_pioneer(line, hull, *ni)) {
            m_trace.emplace_back(Verdict::PioneerWeak);
            continue;
        }
        if (! is_pioneer(line, hull, nj)) {
            m_trace.emplace_back(Verdict::PioneerStrong);
            break;
        }

        m_trace.emplace_back(Verdict::Accept);
        if (ti.distance < best_distance) {
            best_predecessor = i;
            best_distance    = ti.distance;
        }
    }

    m_tags.push_back({ best_distance + 1, best_predecessor, false });
    BOOST_LOG_TRIVIAL(trace) << boost::format("PathSimplifier: point %1% distance %2% predecessor %3% last verdict %4%")
        % j % (best_distance + 1) % best_predecessor % verdict_name(m_trace.back());
}

bool PathSimplifier::is_pioneer(const Line &line, const SimplePathHull &hull, size_t node)
{
    const SimplePathHull::Node &n = hull.node(node);
    if (! n.valid)
        return false;
    const Vec2d  t  = line.tangent();
    const double dp = t.dot(hull.node(n.prev).pos - n.pos);
    const double dn = t.dot(hull.node(n.next).pos - n.pos);
    return dp * dn >= 0;
}

const PathSimplifier::PointTag& PathSimplifier::tag(size_t idx) const
{
    if (idx >= m_tags.size())
        throw OutOfRange("PathSimplifier::tag(): index " + std::to_string(idx) + " out of range, " +
                         std::to_string(m_tags.size()) + " points were processed");
    return m_tags[idx];
}

Pointfs PathSimplifier::simplified_points() const
{
    const size_t n = m_tags.size();
    if (n <= 1)
        return Pointfs(m_path.begin(), m_path.begin() + n);

    // Walk the shortest route backwards. The inner vertices are the intersections of the lines
    // of the adjacent route edges. The first and the last vertex are projections of the first
    // and the last original point onto the lines of the first and the last edge.
    Pointfs out;
    out.reserve(m_tags[n - 1].distance + 1);
    size_t j    = n - 1;
    size_t i    = m_tags[j].predecessor;
    Line   line = m_fitter.fit_line(i, j);
    out.emplace_back(Geometry::project(m_path.point(j), line));
    while (i != 0) {
        j = i;
        i = m_tags[j].predecessor;
        const Vec2d &pj        = m_path.point(j);
        const Line   prev_line = line;
        line = m_fitter.fit_line(i, j);
        // If the lines are parallel or the intersection is too far, fall back to the original point.
        // Such a fallback only keeps the simplified path within twice the threshold from the original one.
        if (Vec2d p = Geometry::intersection(line, prev_line); is_singular(p) || dist_sq(p, pj) > 4. * m_threshold_sq)
            out.emplace_back(pj);
        else
            out.emplace_back(p);
    }
    out.emplace_back(Geometry::project(m_path.point(0), line));
    std::reverse(out.begin(), out.end());
    return out;
}

const char* verdict_name(PathSimplifier::Verdict verdict)
{
    switch (verdict) {
    case PathSimplifier::Verdict::Accept:        return "accept";
    case PathSimplifier::Verdict::Cut:           return "cut";
    case PathSimplifier::Verdict::Threshold:     return "threshold";
    case PathSimplifier::Verdict::PioneerWeak:   return "pioneer_weak";
    case PathSimplifier::Verdict::PioneerStrong: return "pioneer_strong";
    }
    return "unknown";
}

} // namespace PolySimp
