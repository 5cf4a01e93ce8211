#include <string>

#include <boost/nowide/iostream.hpp>

#include "libpolysimp/libpolysimp.h"

#include "CLI.hpp"

namespace PolySimp::CLI {

void print_help()
{
    boost::nowide::cout
        << POLYSIMP_APP_NAME << "-" << POLYSIMP_VERSION << std::endl
        << "Online polyline simplification with a bounded deviation." << std::endl
        << std::endl
        << "Usage: polysimp [ OPTIONS ] [ file.txt ]" << std::endl
        << std::endl
        << "The input lists one point per line as a pair of coordinates separated by white space or a comma." << std::endl
        << "Empty lines and lines starting with # are ignored. Without an input file, points are read from the standard input." << std::endl
        << std::endl
        << "Options:" << std::endl
        << " --threshold, -t D   Maximum distance of the original points from the simplified path (default: " << DEFAULT_THRESHOLD << ")" << std::endl
        << " --keep-duplicates   Do not skip a point identical to the preceding point" << std::endl
        << " --stats             Print the original and the simplified lengths and their ratio to the standard error" << std::endl
        << " --trace             Print verdicts of the last point's admissibility scan to the standard error" << std::endl
        << " --output, -o FILE   Write the simplified path to FILE instead of the standard output" << std::endl
        << " --loglevel N        Messages with severity >= N are printed (0 fatal .. 5 trace, default 1)." << std::endl
        << "                     Overrides the POLYSIMP_LOGLEVEL environment variable." << std::endl
        << " --help, -h          Print this help" << std::endl;
}

}
