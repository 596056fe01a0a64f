#ifndef GREP_DEBUG_HPP
#define GREP_DEBUG_HPP

#include <iostream>

// build with -DGREP_ENABLE_DEBUG=ON (defines GREP_DEBUG) to get traces on stderr
#ifdef GREP_DEBUG
    #define GREP_DBG_PRINT(x) do { std::cerr << x << std::endl; } while(0)
#else
    #define GREP_DBG_PRINT(x) do {} while(0)
#endif

#endif // GREP_DEBUG_HPP
