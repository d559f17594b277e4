#pragma once

#if defined(__GNUC__)
#define MDIST_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define MDIST_UNLIKELY(x) (!!(x))
#endif

#define MDIST_STRINGIFY(x) #x
#define MDIST_VERSION_TRIPLET(major, minor, patch) \
  MDIST_STRINGIFY(major) "." MDIST_STRINGIFY(minor) "." MDIST_STRINGIFY(patch)

// Name and version of the compiler, printed by --version
#if defined(__clang__)
#define MDIST_COMPILER_VERSION "clang " MDIST_VERSION_TRIPLET(__clang_major__, __clang_minor__, __clang_patchlevel__)
#elif defined(__GNUC__)
#define MDIST_COMPILER_VERSION "g++ " MDIST_VERSION_TRIPLET(__GNUC__, __GNUC_MINOR__, __GNUC_PATCHLEVEL__)
#elif defined(_MSC_VER)
#define MDIST_COMPILER_VERSION "MSVC " MDIST_STRINGIFY(_MSC_FULL_VER)
#else
#define MDIST_COMPILER_VERSION "unknown compiler"
#endif
