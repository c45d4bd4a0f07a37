#pragma once

#include <cstdio>

#ifndef PLOTINDEX_ENABLE_LOGGING
#define PLOTINDEX_ENABLE_LOGGING 0
#endif

#if PLOTINDEX_ENABLE_LOGGING
#define PLOTINDEX_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[plotindex] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define PLOTINDEX_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[plotindex] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define PLOTINDEX_LOG_DEBUG(...) do { } while (0)
#define PLOTINDEX_LOG_WARN(...) do { } while (0)
#endif
