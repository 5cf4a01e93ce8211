#include "Path.hpp"
#include "Exception.hpp"

#include <algorithm>
#include <string>

namespace PolySimp {

void Path::append(const Vec2d &p)
{
    m_points.emplace_back(p);
    // Pass the stored point, the argument may alias a point of this path.
    const Vec2d &stored = m_points.back();
    // Listeners may unsubscribe while being notified.
    const std::vector<PathListener*> listeners = m_listeners;
    for (PathListener *listener : listeners)
        if (this->is_subscribed(listener))
            listener->on_append(*this, stored);
}

void Path::clear()
{
    m_points.clear();
    const std::vector<PathListener*> listeners = m_listeners;
    for (PathListener *listener : listeners)
        if (this->is_subscribed(listener))
            listener->on_clear(*this);
}

void Path::assign(Pointfs points)
{
    this->clear();
    m_points.reserve(points.size());
    for (const Vec2d &p : points)
        this->append(p);
}

const Vec2d& Path::point(size_t idx) const
{
    if (idx >= m_points.size())
        throw OutOfRange("Path::point(): index " + std::to_string(idx) + " out of range, the path has " +
                         std::to_string(m_points.size()) + " points");
    return m_points[idx];
}

const Vec2d& Path::last_point() const
{
    if (m_points.empty())
        throw OutOfRange("Path::last_point(): the path is empty");
    return m_points.back();
}

bool Path::subscribe(PathListener *listener)
{
    assert(listener != nullptr);
    if (this->is_subscribed(listener))
        return false;
    m_listeners.emplace_back(listener);
    return true;
}

bool Path::unsubscribe(PathListener *listener)
{
    auto it = std::find(m_listeners.begin(), m_listeners.end(), listener);
    if (it == m_listeners.end())
        return false;
    m_listeners.erase(it);
    return true;
}

bool Path::is_subscribed(const PathListener *listener) const
{
    return std::find(m_listeners.begin(), m_listeners.end(), listener) != m_listeners.end();
}

} // namespace PolySimp
