#pragma once

#include <cstdio>

#ifndef NODEGRAPH_ENABLE_LOGGING
#define NODEGRAPH_ENABLE_LOGGING 0
#endif

#if NODEGRAPH_ENABLE_LOGGING
#define NODEGRAPH_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[nodegraph] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define NODEGRAPH_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[nodegraph][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define NODEGRAPH_LOG_DEBUG(...) do { } while (0)
#define NODEGRAPH_LOG_WARN(...) do { } while (0)
#endif
