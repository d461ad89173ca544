#ifndef INDEXGEN_BITS_CONTRACTS_HH
#define INDEXGEN_BITS_CONTRACTS_HH

// Checked only in debug builds (IXG_DEBUG), compiled out otherwise.
#if defined(IXG_DEBUG)
#include <unistdx/base/contracts>
#define IXG_EXPECTS(cond) UNISTDX_PRECONDITION(cond)
#define IXG_ENSURES(cond) UNISTDX_POSTCONDITION(cond)
#else
#define IXG_EXPECTS(cond) static_cast<void>(0)
#define IXG_ENSURES(cond) static_cast<void>(0)
#endif

#define Expects(cond) IXG_EXPECTS(cond)
#define Ensures(cond) IXG_ENSURES(cond)

#endif // vim:filetype=cpp
