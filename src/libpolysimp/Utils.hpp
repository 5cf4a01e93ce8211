#ifndef polysimp_Utils_hpp_
#define polysimp_Utils_hpp_

#include <string>

#include "libpolysimp.h"

namespace PolySimp {

// Set the logging level of the Boost.Log core.
// 0 fatal, 1 error, 2 warning, 3 info, 4 debug, 5 trace.
// Levels above 5 are treated as trace.
extern void set_logging_level(unsigned int level);
extern unsigned get_logging_level();
// Parse the logging level from a single digit string ("0" to "9").
// Returns false and leaves the level untouched if the string is malformed.
extern bool set_logging_level_from_string(const char *level);

// Ratio of the simplified path length to the original path length,
// both clamped from below to 1, rounded to whole percents.
extern int simplification_ratio_percent(size_t original_length, size_t simplified_length);

// Format a floating point value the way the command line front end prints coordinates.
extern std::string float_to_string(double value);

} // namespace PolySimp

#endif // polysimp_Utils_hpp_
