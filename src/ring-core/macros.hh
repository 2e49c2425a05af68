#pragma once

// Toolchain, platform and build-mode switches used by ring-core.
//
// Toolchain (exactly one is defined):
//   RC_COMPILER_MSVC   - cl.exe
//   RC_COMPILER_POSIX  - gcc, clang and mingw, which share the GNU attribute syntax
//
// Platform:
//   RC_OS_WINDOWS      - selects _aligned_malloc / IsDebuggerPresent over their posix counterparts
//
// Build mode (set by CMake per configuration):
//   RC_DEBUG, RC_RELEASE, RC_RELWITHDEBINFO, RC_ENABLE_ASSERT_IN_RELEASE
//   RC_ASSERT_ENABLED is derived from them and is always 0 or 1

#if defined(_MSC_VER) && !defined(__clang__)
#define RC_COMPILER_MSVC
#elif defined(__GNUC__) || defined(__clang__)
#define RC_COMPILER_POSIX
#else
#error "ring-core supports msvc, gcc and clang"
#endif

#if defined(_WIN32)
#define RC_OS_WINDOWS
#endif

#if defined(RC_DEBUG) || defined(RC_RELWITHDEBINFO) || defined(RC_ENABLE_ASSERT_IN_RELEASE)
#define RC_ASSERT_ENABLED 1
#else
#define RC_ASSERT_ENABLED 0
#endif

#ifdef RC_COMPILER_MSVC

// RC_FORCE_INLINE - for the one-line casts in <ring-core/utility.hh> that must vanish in debug builds
#define RC_FORCE_INLINE __forceinline
// RC_COLD_FUNC - for paths taken rarely (queue growth, assertion failures)
#define RC_COLD_FUNC

#else

// gcc additionally requires 'inline' next to always_inline
#define RC_FORCE_INLINE __attribute__((always_inline)) inline
#define RC_COLD_FUNC __attribute__((cold))

#endif

// RC_UNUSED(expr) - names expr without evaluating it (sizeof is an unevaluated context)
#define RC_UNUSED(expr) (void)(sizeof((expr)))
