#ifndef _libpolysimp_h_
#define _libpolysimp_h_

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <limits>
#include <memory>
#include <type_traits>
#include <vector>

#define POLYSIMP_APP_NAME "PolySimp"
#define POLYSIMP_VERSION  "1.0.0"

#ifndef UNUSED
#define UNUSED(x) (void)(x)
#endif /* UNUSED */

namespace PolySimp {

// Sentinel of an index, which does not point anywhere.
static constexpr size_t NO_INDEX = std::numeric_limits<size_t>::max();

// Default maximum deviation of the simplified path from the original path.
static constexpr double DEFAULT_THRESHOLD = 2.;

template<typename T>
constexpr inline T sqr(T x)
{
    return x * x;
}

// SFINAE helpers for templates restricted to floating point or integral types.
template<class T>
using FloatingOnly = std::enable_if_t<std::is_floating_point<T>::value, T>;

template<class T>
using IntegerOnly = std::enable_if_t<std::is_integral<T>::value, T>;

} // namespace PolySimp

#endif // _libpolysimp_h_
