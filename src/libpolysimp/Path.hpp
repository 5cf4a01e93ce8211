#ifndef polysimp_Path_hpp_
#define polysimp_Path_hpp_

#include <initializer_list>
#include <vector>

#include "libpolysimp.h"
#include "Point.hpp"

namespace PolySimp {

class Path;

// Observer of Path modifications.
class PathListener
{
public:
    virtual ~PathListener() = default;
    // Invoked after point p was appended to the end of sender.
    virtual void on_append(const Path &sender, const Vec2d &p) = 0;
    // Invoked after sender was cleared.
    virtual void on_clear(const Path &sender) = 0;
};

// Append only polygonal line, informing its listeners about modifications.
// Listeners are not owned by the path and they are invoked synchronously in the order of subscription.
// A listener may unsubscribe itself or another listener from within a callback.
// Copying a path copies its points only, the copy has no listeners. Assigning to a path keeps its listeners,
// they are informed as if the path was cleared and the new points were appended.
class Path
{
public:
    Path() = default;
    Path(std::initializer_list<Vec2d> list) : m_points(list) {}
    explicit Path(const Pointfs &points) : m_points(points) {}
    explicit Path(Pointfs &&points) : m_points(std::move(points)) {}
    Path(const Path &other) : m_points(other.m_points) {}
    Path(Path &&other) : m_points(std::move(other.m_points)) {}
    Path& operator=(const Path &other) { if (this != &other) this->assign(other.m_points); return *this; }
    Path& operator=(Path &&other) { if (this != &other) this->assign(std::move(other.m_points)); return *this; }

    void            append(const Vec2d &p);
    void            append(double x, double y) { this->append(Vec2d(x, y)); }
    void            clear();
    // Replace all points, informing the listeners by on_clear() followed by on_append() for each point.
    void            assign(Pointfs points);

    size_t          size() const { return m_points.size(); }
    bool            empty() const { return m_points.empty(); }
    // Throws OutOfRange if idx is not a valid point index.
    const Vec2d&    point(size_t idx) const;
    // Throws OutOfRange if the path is empty.
    const Vec2d&    last_point() const;
    const Pointfs&  points() const { return m_points; }

    // Register a listener, it will be informed about all the following modifications.
    // Returns false if the listener was already subscribed.
    bool            subscribe(PathListener *listener);
    // Returns false if the listener was not subscribed.
    bool            unsubscribe(PathListener *listener);
    size_t          num_listeners() const { return m_listeners.size(); }

    auto            begin() const { return m_points.begin(); }
    auto            end()   const { return m_points.end(); }

    bool operator==(const Path &rhs) const { return m_points == rhs.m_points; }
    bool operator!=(const Path &rhs) const { return m_points != rhs.m_points; }

private:
    bool            is_subscribed(const PathListener *listener) const;

    Pointfs                     m_points;
    std::vector<PathListener*>  m_listeners;
};

} // namespace PolySimp

#endif // polysimp_Path_hpp_
