#ifndef _libpolysimp_Exception_h_
#define _libpolysimp_Exception_h_

#include <stdexcept>

namespace PolySimp {

// PolySimp's own exception hierarchy is derived from std::runtime_error.
// Base for PolySimp's own exceptions.
class Exception : public std::runtime_error { using std::runtime_error::runtime_error; };
#define POLYSIMP_DERIVE_EXCEPTION(DERIVED_EXCEPTION, PARENT_EXCEPTION) \
    class DERIVED_EXCEPTION : public PARENT_EXCEPTION { using PARENT_EXCEPTION::PARENT_EXCEPTION; }
// Critical exception produced by the library, such exception shall never leave the front end unreported.
POLYSIMP_DERIVE_EXCEPTION(CriticalException,    Exception);
POLYSIMP_DERIVE_EXCEPTION(RuntimeError,         CriticalException);
POLYSIMP_DERIVE_EXCEPTION(LogicError,           CriticalException);
POLYSIMP_DERIVE_EXCEPTION(InvalidArgument,      LogicError);
POLYSIMP_DERIVE_EXCEPTION(OutOfRange,           LogicError);
POLYSIMP_DERIVE_EXCEPTION(FileIOError,          RuntimeError);
#undef POLYSIMP_DERIVE_EXCEPTION

} // namespace PolySimp

#endif // _libpolysimp_Exception_h_
