#pragma once

#include <typed-geometry/tg-lean.hh>

namespace ri::detail
{
/// p expressed in a space whose origin sits at the given point
inline tg::pos2 translate(tg::pos2 p, tg::pos2 origin) { return {p.x - origin.x, p.y - origin.y}; }

/// local origin of a widget
inline tg::pos2 center_of(tg::aabb2 const& r) { return {(r.min.x + r.max.x) * 0.5f, (r.min.y + r.max.y) * 0.5f}; }
}
