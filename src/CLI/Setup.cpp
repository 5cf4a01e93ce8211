#include <string>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/nowide/cstdlib.hpp>
#include <boost/nowide/iostream.hpp>

#include "libpolysimp/libpolysimp.h"
#include "libpolysimp/Utils.hpp"

#include "CLI.hpp"

namespace PolySimp::CLI {

enum class OptionKey {
    Threshold,
    KeepDuplicates,
    Stats,
    Trace,
    Output,
    LogLevel,
    Help,
};

struct OptionDef {
    const char *cli;
    const char *cli_short;
    OptionKey   key;
    bool        has_value;
};

static const OptionDef option_defs[] = {
    { "threshold",          "t", OptionKey::Threshold,      true  },
    { "keep-duplicates",    "",  OptionKey::KeepDuplicates, false },
    { "stats",              "",  OptionKey::Stats,          false },
    { "trace",              "",  OptionKey::Trace,          false },
    { "output",             "o", OptionKey::Output,         true  },
    { "loglevel",           "",  OptionKey::LogLevel,       true  },
    { "help",               "h", OptionKey::Help,           false },
};

static const OptionDef* find_option(const std::string &token, bool short_form)
{
    for (const OptionDef &def : option_defs)
        if (token == (short_form ? def.cli_short : def.cli))
            return &def;
    return nullptr;
}

static bool apply_option(Data& data, const OptionDef &def, const std::string &value)
{
    try {
        switch (def.key) {
        case OptionKey::Threshold:      data.config.threshold = boost::lexical_cast<double>(value); break;
        case OptionKey::KeepDuplicates: data.config.skip_duplicates = false; break;
        case OptionKey::Stats:          data.print_stats = true; break;
        case OptionKey::Trace:          data.print_trace = true; break;
        case OptionKey::Output:         data.output_file = value; break;
        case OptionKey::LogLevel:       data.config.loglevel = boost::lexical_cast<unsigned>(value); break;
        case OptionKey::Help:           data.show_help = true; break;
        }
    } catch (const boost::bad_lexical_cast &) {
        boost::nowide::cerr << "Invalid value \"" << value << "\" of option --" << def.cli << std::endl;
        return false;
    }
    return true;
}

static bool read(Data& data, int argc, const char* const argv[])
{
    bool parse_options = true;
    for (int i = 1; i < argc; ++i) {
        std::string token = argv[i];
        // Store non-option arguments in the provided vector.
        if (!parse_options || !boost::starts_with(token, "-") || token == "-") {
            data.input_files.push_back(token);
            continue;
        }
        // Stop parsing tokens as options when -- is supplied.
        if (token == "--") {
            parse_options = false;
            continue;
        }
        // Remove leading dashes (one or two).
        const bool short_form = !boost::starts_with(token, "--");
        token.erase(token.begin(), token.begin() + (short_form ? 1 : 2));
        // Read value when supplied in the --key=value form.
        std::string value;
        bool        has_value = false;
        {
            size_t equals_pos = token.find("=");
            if (equals_pos != std::string::npos) {
                value = token.substr(equals_pos + 1);
                token.erase(equals_pos);
                has_value = true;
            }
        }
        const OptionDef *def = token.empty() ? nullptr : find_option(token, short_form);
        if (def == nullptr) {
            boost::nowide::cerr << "Unknown option " << (short_form ? "-" : "--") << token.c_str() << std::endl;
            return false;
        }
        if (def->has_value && !has_value) {
            // Read the value from the following token.
            if (i + 1 == argc) {
                boost::nowide::cerr << "No value supplied for --" << def->cli << std::endl;
                return false;
            }
            value = argv[++i];
        } else if (!def->has_value && has_value) {
            boost::nowide::cerr << "Option --" << def->cli << " does not take a value" << std::endl;
            return false;
        }
        if (!apply_option(data, *def, value))
            return false;
    }
    return true;
}

static void setup_logging(Data& data)
{
    PolySimp::set_logging_level(1);
    const char* loglevel = boost::nowide::getenv("POLYSIMP_LOGLEVEL");
    if (loglevel != nullptr) {
        if (set_logging_level_from_string(loglevel))
            data.config.loglevel = get_logging_level();
        else
            boost::nowide::cerr << "Invalid POLYSIMP_LOGLEVEL environment variable: " << loglevel << std::endl;
    }
}

bool setup(Data& cli, int argc, char** argv)
{
    setup_logging(cli);
    const unsigned env_loglevel = cli.config.loglevel;

    if (!read(cli, argc, argv)) {
        // Separate error message reported by the CLI parser from the help.
        boost::nowide::cerr << std::endl;
        print_help();
        return false;
    }

    if (cli.config.loglevel != env_loglevel)
        set_logging_level(cli.config.loglevel);

    if (cli.input_files.size() > 1) {
        boost::nowide::cerr << "Only a single input file is supported, got " << cli.input_files.size() << std::endl;
        return false;
    }

    return true;
}

}
