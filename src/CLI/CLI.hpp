#pragma once

#include <string>
#include <vector>

#include "libpolysimp/Config.hpp"

namespace PolySimp::CLI
{
    // struct which is filled from comand line input
    struct Data
    {
        SimplifierConfig            config;

        std::vector<std::string>    input_files;
        std::string                 output_file;

        bool                        print_stats { false };
        bool                        print_trace { false };
        bool                        show_help   { false };
    };

    // Implemented in PrintHelp.cpp

    void    print_help();

    // Implemented in Setup.cpp

    bool    setup(Data& cli, int argc, char** argv);

    // Implemented in ProcessActions.cpp

    bool    process_actions(const Data& cli);

    // Implemented in Run.cpp

    int     run(int argc, char** argv);
}
