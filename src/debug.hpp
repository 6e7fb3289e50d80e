#pragma once

#include <iostream>
#include <sstream>

// Compile with -DDEBUG to enable debug logging
#if DEBUG
    #define DBG(x) do { std::cerr << x << std::endl; } while (0)
#else
    #define DBG(x) do {} while (0)
#endif

// Always-on tagged log line. The line is assembled first so that
// concurrent requests don't interleave their output.
#define LOG(tag, x) do { \
        std::ostringstream logLine_; \
        logLine_ << "[" << tag << "] " << x << "\n"; \
        std::cerr << logLine_.str(); \
    } while (0)
