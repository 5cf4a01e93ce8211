#ifndef polysimp_Format_PointList_hpp_
#define polysimp_Format_PointList_hpp_

#include <istream>
#include <ostream>
#include <string>

#include "../Path.hpp"
#include "../Point.hpp"

namespace PolySimp {

// Plain text list of points, one "x y" pair per line. The coordinates may be separated by white space
// or a comma. Empty lines and lines starting with '#' are ignored.

// Read points from a stream. source_name is used in error messages only.
// Throws FileIOError naming the line number on a malformed line.
extern Pointfs read_point_list(std::istream &in, const std::string &source_name);
// Read points from a file. Throws FileIOError if the file cannot be opened or parsed.
extern Pointfs load_point_list(const std::string &path);

// Append points to a path. If skip_duplicates is set, a point equal to the last point of the path is skipped.
// Returns the number of points appended.
extern size_t append_points(Path &path, const Pointfs &points, bool skip_duplicates);

extern void write_point_list(std::ostream &out, const Pointfs &points);
// Throws FileIOError if the file cannot be written.
extern void store_point_list(const std::string &path, const Pointfs &points);

} // namespace PolySimp

#endif /* polysimp_Format_PointList_hpp_ */
