#include <boost/nowide/args.hpp>

#include "CLI/CLI.hpp"

int main(int argc, char **argv)
{
    // Replaces argv with UTF-8 on Windows, no-op elsewhere.
    boost::nowide::args nowide_args(argc, argv);
    return PolySimp::CLI::run(argc, argv);
}
