#ifndef polysimp_SimplePathHull_hpp_
#define polysimp_SimplePathHull_hpp_

#include <optional>
#include <vector>

#include "libpolysimp.h"
#include "Point.hpp"

namespace PolySimp {

// Online convex hull of a simple (non self intersecting) polyline, following Melkman '87.
// Points are offered one by one in the order along the polyline. Thanks to the polyline
// being simple, only the vicinity of the last accepted point needs to be examined,
// thus each offered point costs an amortized constant time.
//
// The hull boundary is a circular doubly linked list of nodes in CCW order. The nodes
// are stored in an arena and addressed by their index, which stays valid for the life time
// of the hull. Nodes evicted from the hull are not reclaimed, they are only marked invalid.
class SimplePathHull
{
public:
    struct Node {
        Vec2d   pos;
        // Previous and next node in CCW order.
        size_t  prev  { NO_INDEX };
        size_t  next  { NO_INDEX };
        // False once the node was evicted from the hull.
        bool    valid { true };
    };

    // Extend the hull by a point, which is the newest point of the polyline.
    // If the point is outside of the current hull, it is accepted, the hull is adjusted
    // and the point becomes the new first node. Returns the index of the new node.
    // If the point is inside the current hull, the hull is left intact and no value is returned.
    std::optional<size_t> offer(const Vec2d &p);

    // Index of the node of the last accepted point, NO_INDEX if the hull is empty.
    size_t          first() const { return m_first; }
    const Node&     node(size_t idx) const { assert(idx < m_nodes.size()); return m_nodes[idx]; }
    // Number of nodes forming the hull.
    size_t          size() const { return m_size; }
    bool            empty() const { return m_size == 0; }
    void            clear() { m_nodes.clear(); m_first = NO_INDEX; m_size = 0; }

    // Hull vertices starting with first() in CCW order.
    Pointfs         polygon() const;

private:
    // Create a node linked between prev and next. Without neighbors, the node links to itself.
    size_t          make_node(const Vec2d &pos, size_t prev = NO_INDEX, size_t next = NO_INDEX);

    std::vector<Node>   m_nodes;
    size_t              m_first { NO_INDEX };
    size_t              m_size  { 0 };
};

} // namespace PolySimp

#endif // polysimp_SimplePathHull_hpp_
