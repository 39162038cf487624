/*****************************************************************/ /**
 * @file   compiler.h
 * @brief  Contains macros to abstract compiler differences.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_SLIM_MACROS_COMPILER
#define __HG_SLIM_MACROS_COMPILER

#if defined(_MSC_VER)
  #define SLIM_MSVC 1
#else
  #define SLIM_MSVC 0
#endif

#if defined(__clang__)
  #define SLIM_CLANG 1
#else
  #define SLIM_CLANG 0
#endif

#if defined(__GNUC__) && !SLIM_CLANG
  #define SLIM_GCC 1
#else
  #define SLIM_GCC 0
#endif

#if SLIM_MSVC
  /// @brief Forces inlining of a function
  #define SLIM_FORCE_INLINE __forceinline
#elif SLIM_GCC || SLIM_CLANG
  /// @brief Forces inlining of a function
  #define SLIM_FORCE_INLINE inline __attribute__((always_inline))
#else
  /// @brief Forces inlining of a function
  #define SLIM_FORCE_INLINE inline
#endif

#if SLIM_GCC || SLIM_CLANG
  /// @brief Hints that `x` is usually true
  #define SLIM_LIKELY(x) __builtin_expect(!!(x), 1)
  /// @brief Hints that `x` is usually false
  #define SLIM_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
  #define SLIM_LIKELY(x)   (x)
  #define SLIM_UNLIKELY(x) (x)
#endif

#endif // !__HG_SLIM_MACROS_COMPILER
