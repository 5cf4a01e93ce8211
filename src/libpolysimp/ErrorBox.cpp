#include "ErrorBox.hpp"

#include <algorithm>

namespace PolySimp {

ErrorBox::ErrorBox(const Line &line, const Vec2d &p) : m_line(line)
{
    const LineCoord l = line.map(p);
    m_s0 = m_s1 = l.s;
    m_t0 = m_t1 = l.t;
}

void ErrorBox::extend(const Line &line, const Vec2d &p)
{
    const LineCoord l   = line.map(p);
    const LineCoord l00 = m_line.remap(line, m_s0, m_t0);
    const LineCoord l01 = m_line.remap(line, m_s0, m_t1);
    const LineCoord l10 = m_line.remap(line, m_s1, m_t0);
    const LineCoord l11 = m_line.remap(line, m_s1, m_t1);

    m_line = line;
    m_s0 = std::min({ l.s, l00.s, l01.s, l10.s, l11.s });
    m_s1 = std::max({ l.s, l00.s, l01.s, l10.s, l11.s });
    m_t0 = std::min({ l.t, l00.t, l01.t, l10.t, l11.t });
    m_t1 = std::max({ l.t, l00.t, l01.t, l10.t, l11.t });
}

double ErrorBox::error() const
{
    // t is measured in multiples of the normal, which is not a unit vector.
    return std::max(sqr(m_t0), sqr(m_t1)) * m_line.normal_sq();
}

std::array<Vec2d, 4> ErrorBox::cartesian_corners() const
{
    return {
        m_line.unmap(m_s0, m_t0),
        m_line.unmap(m_s0, m_t1),
        m_line.unmap(m_s1, m_t1),
        m_line.unmap(m_s1, m_t0)
    };
}

} // namespace PolySimp
