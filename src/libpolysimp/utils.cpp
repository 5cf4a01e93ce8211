#include "Utils.hpp"

#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace PolySimp {

static boost::log::trivial::severity_level logSeverity = boost::log::trivial::error;

static boost::log::trivial::severity_level level_to_boost(unsigned level)
{
    switch (level) {
    // Report fatal errors only.
    case 0: return boost::log::trivial::fatal;
    // Report fatal errors and errors.
    case 1: return boost::log::trivial::error;
    // Report fatal errors, errors and warnings.
    case 2: return boost::log::trivial::warning;
    // Report all errors, warnings and infos.
    case 3: return boost::log::trivial::info;
    // Report all errors, warnings, infos and debugging.
    case 4: return boost::log::trivial::debug;
    // Report everyting including fine level tracing information.
    default: return boost::log::trivial::trace;
    }
}

void set_logging_level(unsigned int level)
{
    logSeverity = level_to_boost(level);

    boost::log::core::get()->set_filter
    (
        boost::log::trivial::severity >= logSeverity
    );
}

unsigned get_logging_level()
{
    switch (logSeverity) {
    case boost::log::trivial::fatal : return 0;
    case boost::log::trivial::error : return 1;
    case boost::log::trivial::warning : return 2;
    case boost::log::trivial::info : return 3;
    case boost::log::trivial::debug : return 4;
    case boost::log::trivial::trace : return 5;
    default: return 1;
    }
}

bool set_logging_level_from_string(const char *level)
{
    if (level == nullptr || level[0] < '0' || level[0] > '9' || level[1] != 0)
        return false;
    set_logging_level(unsigned(level[0] - '0'));
    return true;
}

// Force set_logging_level(<=error) after loading of the library.
static struct RunOnInit {
    RunOnInit() {
        set_logging_level(1);
    }
} g_RunOnInit;

int simplification_ratio_percent(size_t original_length, size_t simplified_length)
{
    double ratio = double(std::max<size_t>(1, simplified_length)) / double(std::max<size_t>(1, original_length));
    return int(std::round(ratio * 100.));
}

std::string float_to_string(double value)
{
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::setprecision(std::numeric_limits<double>::max_digits10 - 2) << value;
    return ss.str();
}

} // namespace PolySimp
