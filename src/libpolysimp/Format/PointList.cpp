#include "PointList.hpp"

#include <cmath>
#include <string>
#include <system_error>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/log/trivial.hpp>
#include <boost/nowide/fstream.hpp>
#include <fast_float/fast_float.h>

#include "libpolysimp/Exception.hpp"
#include "libpolysimp/Utils.hpp"

namespace PolySimp {

namespace {
bool parse_double(const std::string &from, double &out)
{
    auto answer = fast_float::from_chars(from.data(), from.data() + from.size(), out);
    // fast_float accepts nan and inf, which have no place in a path.
    return answer.ec == std::errc() && answer.ptr == from.data() + from.size() && std::isfinite(out);
}
}

Pointfs read_point_list(std::istream &in, const std::string &source_name)
{
    Pointfs                  out;
    std::string              line;
    std::vector<std::string> elements;
    for (size_t line_no = 1; std::getline(in, line); ++ line_no) {
        boost::trim(line);
        if (line.empty() || line.front() == '#')
            continue;
        boost::split(elements, line, boost::is_any_of(" \t,"), boost::token_compress_on);
        double x, y;
        if (elements.size() != 2 || ! parse_double(elements[0], x) || ! parse_double(elements[1], y))
            throw FileIOError("Failed reading " + source_name + ", line " + std::to_string(line_no) + ": expected a pair of coordinates, got \"" + line + "\"");
        out.emplace_back(x, y);
    }
    if (in.bad())
        throw FileIOError("Failed reading " + source_name + ": read error");
    BOOST_LOG_TRIVIAL(debug) << "Read " << out.size() << " points from " << source_name;
    return out;
}

Pointfs load_point_list(const std::string &path)
{
    boost::filesystem::path fpath(path);
    if (! boost::filesystem::exists(fpath))
        throw FileIOError("Failed reading point list. Path doesn't exist. " + path);
    boost::nowide::ifstream ifs(fpath.string());
    if (! ifs)
        throw FileIOError("Failed reading point list. Cannot open " + path);
    return read_point_list(ifs, path);
}

size_t append_points(Path &path, const Pointfs &points, bool skip_duplicates)
{
    size_t num_appended = 0;
    for (const Vec2d &p : points) {
        if (skip_duplicates && ! path.empty() && path.last_point() == p)
            continue;
        path.append(p);
        ++ num_appended;
    }
    if (num_appended < points.size())
        BOOST_LOG_TRIVIAL(info) << "Skipped " << points.size() - num_appended << " duplicate points";
    return num_appended;
}

void write_point_list(std::ostream &out, const Pointfs &points)
{
    for (const Vec2d &p : points)
        out << float_to_string(p.x()) << " " << float_to_string(p.y()) << "\n";
}

void store_point_list(const std::string &path, const Pointfs &points)
{
    boost::nowide::ofstream ofs(path);
    if (! ofs)
        throw FileIOError("Failed writing point list. Cannot open " + path);
    write_point_list(ofs, points);
    ofs.close();
    if (ofs.fail())
        throw FileIOError("Failed writing point list to " + path);
}

} // namespace PolySimp
