#pragma once

#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef COINPUSHER_ENABLE_DEBUG
#define COINPUSHER_ENABLE_DEBUG 0
#endif

// Debug levels
#define COINPUSHER_DEBUG_LEVEL_NONE 0
#define COINPUSHER_DEBUG_LEVEL_BASIC 1
#define COINPUSHER_DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef COINPUSHER_CURRENT_DEBUG_LEVEL
#define COINPUSHER_CURRENT_DEBUG_LEVEL COINPUSHER_DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define COINPUSHER_DEBUG_MSG(level, x) do { \
    if (COINPUSHER_ENABLE_DEBUG && level <= COINPUSHER_CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Collaborator misuse that the core survives but someone should see
#define COINPUSHER_WARN(x) do { \
    std::cerr << "Warning: " << x << std::endl; \
} while(0)
