#include <exception>

#include <boost/log/trivial.hpp>
#include <boost/nowide/iostream.hpp>

#include "libpolysimp/Exception.hpp"

#include "CLI.hpp"

namespace PolySimp::CLI {

int run(int argc, char** argv)
{
    Data cli;
    if (!setup(cli, argc, argv))
        return 1;

    if (cli.show_help) {
        print_help();
        return 0;
    }

    try {
        cli.config.validate();
        if (!process_actions(cli))
            return 1;
    } catch (const PolySimp::Exception &ex) {
        BOOST_LOG_TRIVIAL(error) << ex.what();
        boost::nowide::cerr << ex.what() << std::endl;
        return 1;
    } catch (const std::exception &ex) {
        BOOST_LOG_TRIVIAL(fatal) << "Unexpected failure: " << ex.what();
        boost::nowide::cerr << "Unexpected failure: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}

}
