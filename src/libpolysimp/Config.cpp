#include "Config.hpp"
#include "Exception.hpp"

#include <cmath>

#include <boost/format.hpp>

namespace PolySimp {

void SimplifierConfig::validate() const
{
    if (! (this->threshold > 0.) || ! std::isfinite(this->threshold))
        throw InvalidArgument((boost::format("Invalid threshold %1%, a positive number is expected") % this->threshold).str());
    if (this->loglevel > 9)
        throw InvalidArgument((boost::format("Invalid logging level %1%, a value from 0 to 9 is expected") % this->loglevel).str());
}

} // namespace PolySimp
