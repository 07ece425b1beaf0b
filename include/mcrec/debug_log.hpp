#pragma once

// Debug tracing for control paths only; never use from the audio callback.
// Warnings and errors go straight to std::cerr and stay in release builds.

#ifndef NDEBUG
    #include <iostream>
    #define MCREC_DEBUG_LOG(x) (std::cout << "[mcrec] " << x)
    #define MCREC_DEBUG_LOG_ENDL std::endl
#else
    #define MCREC_DEBUG_LOG(x) ((void)0)
    #define MCREC_DEBUG_LOG_ENDL ((void)0)
#endif
