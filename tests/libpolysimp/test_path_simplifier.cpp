#include <catch2/catch.hpp>

#include <libpolysimp/Exception.hpp>
#include <libpolysimp/Path.hpp>
#include <libpolysimp/PathSimplifier.hpp>

#include "test_utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

using namespace PolySimp;
using Verdict = PathSimplifier::Verdict;

static void check_points(const Pointfs &result, const Pointfs &expected)
{
    REQUIRE(result.size() == expected.size());
    for (size_t i = 0; i < result.size(); ++ i)
        REQUIRE(is_approx(result[i], expected[i]));
}

static Pointfs random_walk(size_t num_points, double step)
{
    Pointfs out;
    Vec2d   p(0., 0.);
    for (size_t i = 0; i < num_points; ++ i) {
        out.emplace_back(p);
        p += Vec2d(random_value(- step, step), random_value(- step, step));
    }
    return out;
}

// Distance of a point from a polyline given by its vertices.
static double distance_to_polyline(const Vec2d &p, const Pointfs &polyline)
{
    double dist_min = std::sqrt(dist_sq(p, polyline.front()));
    for (size_t i = 1; i < polyline.size(); ++ i) {
        const Vec2d  a  = polyline[i - 1];
        const Vec2d  v  = polyline[i] - a;
        const double l2 = v.squaredNorm();
        const double t  = l2 == 0. ? 0. : std::clamp((p - a).dot(v) / l2, 0., 1.);
        dist_min = std::min(dist_min, (a + t * v - p).norm());
    }
    return dist_min;
}

TEST_CASE("Invalid threshold", "[PathSimplifier]") {
    Path path;
    auto threshold = GENERATE(0., -1., std::numeric_limits<double>::infinity(), std::numeric_limits<double>::quiet_NaN());
    REQUIRE_THROWS_AS(PathSimplifier(path, threshold), InvalidArgument);
    REQUIRE(path.num_listeners() == 0);
}

TEST_CASE("Short paths", "[PathSimplifier]") {
    Path           path;
    PathSimplifier simplifier(path, 1.);
    REQUIRE(simplifier.threshold() == 1.);
    REQUIRE(simplifier.size() == 0);
    REQUIRE(simplifier.simplified_points().empty());
    REQUIRE(simplifier.get_simplified().empty());
    REQUIRE_THROWS_AS(simplifier.tag(0), OutOfRange);

    path.append(3., 4.);
    REQUIRE(simplifier.size() == 1);
    REQUIRE(simplifier.simplified_points() == Pointfs{ { 3., 4. } });
    REQUIRE(simplifier.tag(0).distance == 0);
    REQUIRE(simplifier.tag(0).predecessor == NO_INDEX);
    REQUIRE(simplifier.trace() == std::vector<Verdict>{ Verdict::Accept });

    path.append(5., 4.);
    check_points(simplifier.simplified_points(), { { 3., 4. }, { 5., 4. } });
    REQUIRE(simplifier.tag(1).distance == 1);
    REQUIRE(simplifier.tag(1).predecessor == 0);
}

TEST_CASE("Collinear points", "[PathSimplifier]") {
    Path           path;
    PathSimplifier simplifier(path, 1.);
    for (const Vec2d &p : { Vec2d(0., 0.), Vec2d(5., 0.), Vec2d(10., 0.) })
        path.append(p);
    REQUIRE(simplifier.simplified_points() == Pointfs{ { 0., 0. }, { 10., 0. } });
    REQUIRE(simplifier.tag(2).distance == 1);
    REQUIRE(simplifier.tag(2).predecessor == 0);
    REQUIRE(simplifier.trace() == std::vector<Verdict>{ Verdict::Accept, Verdict::Accept, Verdict::Accept });
    REQUIRE(simplifier.get_simplified() == Path{ { 0., 0. }, { 10., 0. } });
}

TEST_CASE("Right angle", "[PathSimplifier]") {
    Path           path;
    PathSimplifier simplifier(path, 1.);
    for (const Vec2d &p : { Vec2d(0., 0.), Vec2d(10., 0.), Vec2d(10., 10.) })
        path.append(p);
    check_points(simplifier.simplified_points(), { { 0., 0. }, { 10., 0. }, { 10., 10. } });
    REQUIRE(simplifier.tag(2).predecessor == 1);
    REQUIRE(simplifier.trace() == std::vector<Verdict>{ Verdict::Accept, Verdict::Accept, Verdict::Threshold });
}

TEST_CASE("Scan stops at a point, which is not a pioneer", "[PathSimplifier]") {
    Path           path;
    PathSimplifier simplifier(path, 100.);
    for (const Vec2d &p : { Vec2d(0., 0.), Vec2d(1., 0.), Vec2d(2., 0.), Vec2d(10., 0.) })
        path.append(p);
    REQUIRE(simplifier.tag(3).predecessor == 0);

    WHEN("The path turns back") {
        path.append(5., 1.);
        THEN("The projection of the last point is not extremal and the scan stops") {
            REQUIRE(simplifier.trace() == std::vector<Verdict>{ Verdict::Accept, Verdict::Accept, Verdict::PioneerStrong });
        }
        THEN("Points behind the stop are not considered as predecessors") {
            // Point 0 would give a shorter route, but it is never reached.
            REQUIRE(simplifier.tag(4).predecessor == 3);
            REQUIRE(simplifier.tag(4).distance == 2);
            REQUIRE(simplifier.simplified_points().size() == 3);
        }
    }
}

TEST_CASE("Noisy line is simplified to a single segment", "[PathSimplifier]") {
    Path           path;
    PathSimplifier simplifier(path, 1.);
    for (int i = 0; i <= 20; ++ i)
        path.append(double(i), (i % 2) ? 0.1 : -0.1);
    Pointfs simplified = simplifier.simplified_points();
    REQUIRE(simplified.size() == 2);
    REQUIRE(simplified.front().x() == Approx(0.).margin(0.2));
    REQUIRE(simplified.back().x() == Approx(20.).margin(0.2));
}

TEST_CASE("Self intersecting path", "[PathSimplifier]") {
    Path           path;
    PathSimplifier simplifier(path, 1000.);
    for (const Vec2d &p : { Vec2d(0., 0.), Vec2d(100., 0.), Vec2d(100., 10.) })
        path.append(p);
    REQUIRE(! simplifier.tag(0).cut);

    WHEN("The last segment crosses the first one") {
        path.append(50., -10.);
        THEN("The start of the first segment is cut") {
            REQUIRE(simplifier.tag(0).cut);
            REQUIRE(simplifier.trace() == std::vector<Verdict>{ Verdict::Accept, Verdict::Accept, Verdict::PioneerWeak, Verdict::Cut });
            REQUIRE(simplifier.tag(3).predecessor == 2);
        }
        THEN("No later route starts at the cut point") {
            for (const Vec2d &p : { Vec2d(40., -20.), Vec2d(30., -30.), Vec2d(20., -35.), Vec2d(0., -40.) }) {
                path.append(p);
                REQUIRE(simplifier.tag(0).cut);
                REQUIRE(simplifier.tag(simplifier.size() - 1).predecessor != 0);
                REQUIRE(simplifier.trace().back() == Verdict::Cut);
            }
            for (size_t j = 3; j < simplifier.size(); ++ j)
                REQUIRE(simplifier.tag(j).predecessor != 0);
        }
    }
}

TEST_CASE("Points appended before attaching are replayed", "[PathSimplifier]") {
    Pointfs pts = random_walk(40, 5.);
    Path    live;
    PathSimplifier live_simplifier(live, 2.);
    for (const Vec2d &p : pts)
        live.append(p);

    Path           replayed(pts);
    PathSimplifier replayed_simplifier(replayed, 2.);
    REQUIRE(replayed.num_listeners() == 1);
    REQUIRE(replayed_simplifier.size() == pts.size());
    REQUIRE(replayed_simplifier.simplified_points() == live_simplifier.simplified_points());
    for (size_t i = 0; i < pts.size(); ++ i) {
        REQUIRE(replayed_simplifier.tag(i).distance == live_simplifier.tag(i).distance);
        REQUIRE(replayed_simplifier.tag(i).predecessor == live_simplifier.tag(i).predecessor);
        REQUIRE(replayed_simplifier.tag(i).cut == live_simplifier.tag(i).cut);
    }
}

TEST_CASE("Clear and replay", "[PathSimplifier]") {
    Pointfs        pts = random_walk(50, 3.);
    Path           path;
    PathSimplifier simplifier(path, 1.5);
    for (const Vec2d &p : pts)
        path.append(p);
    Pointfs first = simplifier.simplified_points();

    path.clear();
    REQUIRE(simplifier.size() == 0);
    REQUIRE(simplifier.fitter().empty());
    REQUIRE(simplifier.simplified_points().empty());

    for (const Vec2d &p : pts)
        path.append(p);
    REQUIRE(simplifier.simplified_points() == first);
}

TEST_CASE("Simplified path is never longer", "[PathSimplifier]") {
    auto pts = GENERATE(take(5, random(10, 80)));
    Path           path;
    PathSimplifier simplifier(path, 2.);
    for (const Vec2d &p : random_walk(size_t(pts), 4.)) {
        path.append(p);
        REQUIRE(simplifier.simplified_points().size() <= path.size());
    }
    for (size_t j = 1; j < simplifier.size(); ++ j) {
        const auto &tag = simplifier.tag(j);
        REQUIRE(tag.predecessor < j);
        REQUIRE(tag.distance == simplifier.tag(tag.predecessor).distance + 1);
        // Consecutive points are always connected.
        REQUIRE(tag.distance <= simplifier.tag(j - 1).distance + 1);
    }
    REQUIRE(simplifier.simplified_points().size() == simplifier.tag(simplifier.size() - 1).distance + 1);
}

TEST_CASE("Original points stay close to the simplified path", "[PathSimplifier]") {
    // Intersections of the edge lines are replaced by the original point if they are too far,
    // which keeps the deviation within twice the threshold.
    const double threshold = 2.;
    for (int walk = 0; walk < 30; ++ walk) {
        Path           path;
        PathSimplifier simplifier(path, threshold);
        for (const Vec2d &p : random_walk(80, 4.))
            path.append(p);
        Pointfs simplified = simplifier.simplified_points();
        for (const Vec2d &p : path)
            REQUIRE(distance_to_polyline(p, simplified) <= 2. * threshold * (1. + 1e-9));
    }
}

TEST_CASE("Assigning to an observed path restarts the simplification", "[PathSimplifier]") {
    Path           path;
    PathSimplifier simplifier(path, 1.);
    for (const Vec2d &p : { Vec2d(0., 0.), Vec2d(10., 0.), Vec2d(10., 10.), Vec2d(0., 10.), Vec2d(0., 20.) })
        path.append(p);
    REQUIRE(simplifier.size() == 5);

    path = Path{ { 0., 0. } };
    REQUIRE(simplifier.size() == 1);
    REQUIRE(simplifier.simplified_points() == Pointfs{ { 0., 0. } });

    path.append(5., 0.);
    path.append(10., 0.);
    REQUIRE(simplifier.size() == 3);
    REQUIRE(simplifier.simplified_points() == Pointfs{ { 0., 0. }, { 10., 0. } });

    const Path other{ { 0., 0. }, { 10., 0. }, { 10., 10. } };
    path = other;
    REQUIRE(simplifier.size() == 3);
    check_points(simplifier.simplified_points(), other.points());
}

TEST_CASE("Simplifier detaches on destruction", "[PathSimplifier]") {
    Path path{ { 0., 0. }, { 1., 1. } };
    {
        PathSimplifier simplifier(path, 1.);
        REQUIRE(path.num_listeners() == 1);
    }
    REQUIRE(path.num_listeners() == 0);
    path.append(2., 2.);
    REQUIRE(path.size() == 3);
}

TEST_CASE("Verdict names", "[PathSimplifier]") {
    REQUIRE(std::string(verdict_name(Verdict::Accept)) == "accept");
    REQUIRE(std::string(verdict_name(Verdict::Cut)) == "cut");
    REQUIRE(std::string(verdict_name(Verdict::Threshold)) == "threshold");
    REQUIRE(std::string(verdict_name(Verdict::PioneerWeak)) == "pioneer_weak");
    REQUIRE(std::string(verdict_name(Verdict::PioneerStrong)) == "pioneer_strong");
}
