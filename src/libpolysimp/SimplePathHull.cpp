#include "SimplePathHull.hpp"
#include "Geometry.hpp"

namespace PolySimp {

size_t SimplePathHull::make_node(const Vec2d &pos, size_t prev, size_t next)
{
    const size_t idx = m_nodes.size();
    Node node;
    node.pos  = pos;
    node.prev = prev == NO_INDEX ? idx : prev;
    node.next = next == NO_INDEX ? idx : next;
    m_nodes.emplace_back(node);
    m_nodes[node.prev].next = idx;
    m_nodes[node.next].prev = idx;
    return idx;
}

std::optional<size_t> SimplePathHull::offer(const Vec2d &p)
{
    bool accepted = true;
    if (m_size >= 3) {
        // Find the tangents from p by skipping the edges, which turn interior once p is added.
        // Because the offered points form a simple polyline, it is sufficient to look around first.
        const size_t first = m_first;
        size_t n0 = first;
        while (m_nodes[n0].prev != first && Geometry::side(m_nodes[n0].pos, m_nodes[m_nodes[n0].prev].pos, p) >= 0)
            n0 = m_nodes[n0].prev;
        size_t n1 = first;
        while (m_nodes[n1].next != first && Geometry::side(m_nodes[n1].pos, m_nodes[m_nodes[n1].next].pos, p) <= 0)
            n1 = m_nodes[n1].next;
        if (n0 != n1) {
            // Some edges were skipped, p is exterior. Evict everything strictly between the tangent nodes.
            for (size_t n = m_nodes[n0].next; n != n1; n = m_nodes[n].next) {
                m_nodes[n].valid = false;
                -- m_size;
            }
            m_first = this->make_node(p, n0, n1);
        } else
            accepted = false;
    } else if (m_size == 0) {
        m_first = this->make_node(p);
    } else if (m_size == 1) {
        m_first = this->make_node(p, m_first, m_first);
    } else {
        // Two points, about to form a triangle. Keep it CCW. If the triangle would be degenerate,
        // stay with a 2-gon and drop the current first node.
        const size_t first = m_first;
        const size_t prev  = m_nodes[first].prev;
        const size_t next  = m_nodes[first].next;
        const double s     = Geometry::side(m_nodes[first].pos, m_nodes[next].pos, p);
        if (s < 0) {
            m_first = this->make_node(p, first, next);
        } else if (s > 0) {
            m_first = this->make_node(p, prev, first);
        } else {
            m_nodes[first].valid = false;
            -- m_size;
            m_first = this->make_node(p, prev, next);
        }
    }

    if (! accepted)
        return std::nullopt;
    ++ m_size;
    return std::make_optional(m_first);
}

Pointfs SimplePathHull::polygon() const
{
    Pointfs out;
    if (m_first == NO_INDEX)
        return out;
    out.reserve(m_size);
    size_t n = m_first;
    do {
        out.emplace_back(m_nodes[n].pos);
        n = m_nodes[n].next;
    } while (n != m_first);
    return out;
}

} // namespace PolySimp
