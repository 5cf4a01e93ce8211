#include <string>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>
#include <boost/nowide/iostream.hpp>

#include "libpolysimp/libpolysimp.h"
#include "libpolysimp/Path.hpp"
#include "libpolysimp/PathSimplifier.hpp"
#include "libpolysimp/Utils.hpp"
#include "libpolysimp/Format/PointList.hpp"

#include "CLI.hpp"

namespace PolySimp::CLI {

static Pointfs load_input(const Data& cli)
{
    if (cli.input_files.empty() || cli.input_files.front() == "-")
        return read_point_list(boost::nowide::cin, "<stdin>");
    return load_point_list(cli.input_files.front());
}

static void print_trace(const PathSimplifier& simplifier)
{
    const auto& trace = simplifier.trace();
    const size_t j = simplifier.size() - 1;
    boost::nowide::cerr << "Trace of point " << j << ":" << std::endl;
    // The first entry is a sentinel, the following ones belong to i = j - 1, j - 2, ...
    for (size_t k = 1; k < trace.size(); ++ k)
        boost::nowide::cerr << "  " << j - k << " " << verdict_name(trace[k]) << std::endl;
}

bool process_actions(const Data& cli)
{
    Path           path;
    PathSimplifier simplifier(path, cli.config.threshold);

    const Pointfs points = load_input(cli);
    append_points(path, points, cli.config.skip_duplicates);

    const Pointfs simplified = simplifier.simplified_points();
    BOOST_LOG_TRIVIAL(info) << boost::format("Simplified %1% points to %2% points with threshold %3%")
        % path.size() % simplified.size() % cli.config.threshold;

    if (cli.output_file.empty())
        write_point_list(boost::nowide::cout, simplified);
    else
        store_point_list(cli.output_file, simplified);

    if (cli.print_stats)
        boost::nowide::cerr << "Original length: " << path.size() << std::endl
                            << "Simplified length: " << simplified.size() << std::endl
                            << "Ratio: " << simplification_ratio_percent(path.size(), simplified.size()) << "%" << std::endl;

    if (cli.print_trace && ! path.empty())
        print_trace(simplifier);

    return true;
}

}
