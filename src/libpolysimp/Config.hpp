#ifndef polysimp_Config_hpp_
#define polysimp_Config_hpp_

#include <string>

#include "libpolysimp.h"

namespace PolySimp {

// Parameters of a simplification run.
struct SimplifierConfig
{
    // Maximum distance between the original points and the simplified path.
    double      threshold       { DEFAULT_THRESHOLD };
    // Ignore an appended point identical to the last point of the path.
    bool        skip_duplicates { true };
    // Logging level, see set_logging_level().
    unsigned    loglevel        { 1 };

    // Throws InvalidArgument if the configuration is not usable.
    void        validate() const;
};

} // namespace PolySimp

#endif // polysimp_Config_hpp_
