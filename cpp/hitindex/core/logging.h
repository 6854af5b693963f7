#pragma once

#include <cstdio>

#ifndef HITINDEX_ENABLE_LOGGING
#define HITINDEX_ENABLE_LOGGING 0
#endif

#if HITINDEX_ENABLE_LOGGING
#define HITINDEX_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[hitindex] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define HITINDEX_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[hitindex] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define HITINDEX_LOG_DEBUG(...) do { } while (0)
#define HITINDEX_LOG_WARN(...) do { } while (0)
#endif
