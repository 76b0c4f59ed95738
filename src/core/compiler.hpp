#pragma once

/**
 * FUSE Compiler Hints
 * Branch hints and function attributes shared by the control plane
 */

#include <cassert>

// Branch prediction hints
#define FUSE_LIKELY(x)   (__builtin_expect(!!(x), 1))
#define FUSE_UNLIKELY(x) (__builtin_expect(!!(x), 0))

// Function attributes
#if defined(__GNUC__) || defined(__clang__)
    #define FUSE_HOT       [[gnu::hot]]
    #define FUSE_COLD      [[gnu::cold]]
    #define FUSE_ALWAYS_INLINE [[gnu::always_inline]] inline
#else
    #define FUSE_HOT
    #define FUSE_COLD
    #define FUSE_ALWAYS_INLINE inline
#endif

// Programmer error: a switch over a closed enum fell through
#if defined(__GNUC__) || defined(__clang__)
    #define FUSE_UNREACHABLE() \
        do { assert(false && "unreachable enum case"); __builtin_unreachable(); } while (0)
#else
    #define FUSE_UNREACHABLE() \
        do { assert(false && "unreachable enum case"); } while (0)
#endif
