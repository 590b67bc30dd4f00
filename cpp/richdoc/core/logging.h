#pragma once

#include <cstdio>

#ifndef RICHDOC_ENABLE_LOGGING
#define RICHDOC_ENABLE_LOGGING 0
#endif

#if RICHDOC_ENABLE_LOGGING
#define RICHDOC_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[richdoc] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define RICHDOC_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[richdoc][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define RICHDOC_LOG_DEBUG(...) do { } while (0)
#define RICHDOC_LOG_WARN(...) do { } while (0)
#endif
