/*****************************************************************/ /**
 * @file   for_each.h
 * @brief  Contains `SLIM_FOR_EACH_*` macros.
 * The `*2` variants use a distinct set of helpers, so that they can
 * be expanded from inside the macro given to a non-`2` variant.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_SLIM_MACROS_FOR_EACH
#define __HG_SLIM_MACROS_FOR_EACH

#include <slim_macros/compiler.h>

#define __DETAILS__SLIM_CC2(x, y) x##y
/// @brief Concatenate two values (after expansion)
#define SLIM_CC(x, y) __DETAILS__SLIM_CC2(x, y)
#define __DETAILS__SLIM_PARENS ()

///////////////////////////////////////////////////
// Rescanning: 4 * 4 * 4 * 4 = 256 iterations.
///////////////////////////////////////////////////

#define __DETAILS__SLIM_EXPAND(...) \
  __DETAILS__SLIM_EXPAND3(          \
      __DETAILS__SLIM_EXPAND3(__DETAILS__SLIM_EXPAND3(__DETAILS__SLIM_EXPAND3(__VA_ARGS__))))
#define __DETAILS__SLIM_EXPAND3(...) \
  __DETAILS__SLIM_EXPAND2(           \
      __DETAILS__SLIM_EXPAND2(__DETAILS__SLIM_EXPAND2(__DETAILS__SLIM_EXPAND2(__VA_ARGS__))))
#define __DETAILS__SLIM_EXPAND2(...) \
  __DETAILS__SLIM_EXPAND1(           \
      __DETAILS__SLIM_EXPAND1(__DETAILS__SLIM_EXPAND1(__DETAILS__SLIM_EXPAND1(__VA_ARGS__))))
#define __DETAILS__SLIM_EXPAND1(...) __VA_ARGS__

#define __DETAILS__SLIM_EXPAND_2(...)                 \
  __DETAILS__SLIM_EXPAND3_2(__DETAILS__SLIM_EXPAND3_2( \
      __DETAILS__SLIM_EXPAND3_2(__DETAILS__SLIM_EXPAND3_2(__VA_ARGS__))))
#define __DETAILS__SLIM_EXPAND3_2(...)                \
  __DETAILS__SLIM_EXPAND2_2(__DETAILS__SLIM_EXPAND2_2( \
      __DETAILS__SLIM_EXPAND2_2(__DETAILS__SLIM_EXPAND2_2(__VA_ARGS__))))
#define __DETAILS__SLIM_EXPAND2_2(...)                \
  __DETAILS__SLIM_EXPAND1_2(__DETAILS__SLIM_EXPAND1_2( \
      __DETAILS__SLIM_EXPAND1_2(__DETAILS__SLIM_EXPAND1_2(__VA_ARGS__))))
#define __DETAILS__SLIM_EXPAND1_2(...) __VA_ARGS__

///////////////////////////////////////////////////
// Outer loops
///////////////////////////////////////////////////

#define __DETAILS__SLIM_FOR_EACH_HELPER(macro, a1, ...) \
  macro(a1) __VA_OPT__(                                 \
      __DETAILS__SLIM_FOR_EACH_AGAIN __DETAILS__SLIM_PARENS(macro, __VA_ARGS__))
#define __DETAILS__SLIM_FOR_EACH_AGAIN() __DETAILS__SLIM_FOR_EACH_HELPER

#define __DETAILS__SLIM_FOR_EACH_HELPER_COMMA(macro, a1, ...) \
  macro(a1) __VA_OPT__(, ) __VA_OPT__(                        \
      __DETAILS__SLIM_FOR_EACH_AGAIN_COMMA __DETAILS__SLIM_PARENS(macro, __VA_ARGS__))
#define __DETAILS__SLIM_FOR_EACH_AGAIN_COMMA() __DETAILS__SLIM_FOR_EACH_HELPER_COMMA

#define __DETAILS__SLIM_FOR_EACH_HELPER_SYMBOL(macro, symbol, a1, ...) \
  macro(a1) __VA_OPT__(symbol) __VA_OPT__(                             \
      __DETAILS__SLIM_FOR_EACH_AGAIN_SYMBOL __DETAILS__SLIM_PARENS(     \
          macro, symbol, __VA_ARGS__))
#define __DETAILS__SLIM_FOR_EACH_AGAIN_SYMBOL() __DETAILS__SLIM_FOR_EACH_HELPER_SYMBOL

/// @brief Applies 'macro' on each arguments
#define SLIM_FOR_EACH(macro, ...) \
  __VA_OPT__(__DETAILS__SLIM_EXPAND(__DETAILS__SLIM_FOR_EACH_HELPER(macro, __VA_ARGS__)))

/// @brief Applies 'macro' on each arguments, separating all by ',' (without ending with it).
#define SLIM_FOR_EACH_COMMA(macro, ...) \
  __VA_OPT__(__DETAILS__SLIM_EXPAND(    \
      __DETAILS__SLIM_FOR_EACH_HELPER_COMMA(macro, __VA_ARGS__)))

/// @brief Applies 'macro' on each arguments, separating all by 'symbol' (without ending with it).
#define SLIM_FOR_EACH_SYMBOL(macro, symbol, ...) \
  __VA_OPT__(__DETAILS__SLIM_EXPAND(             \
      __DETAILS__SLIM_FOR_EACH_HELPER_SYMBOL(macro, symbol, __VA_ARGS__)))

///////////////////////////////////////////////////
// Inner loops (usable from an outer loop)
///////////////////////////////////////////////////

#define __DETAILS__SLIM_FOR_EACH_HELPER_COMMA2(macro, a1, ...) \
  macro(a1) __VA_OPT__(, ) __VA_OPT__(                         \
      __DETAILS__SLIM_FOR_EACH_AGAIN_COMMA2 __DETAILS__SLIM_PARENS(macro, __VA_ARGS__))
#define __DETAILS__SLIM_FOR_EACH_AGAIN_COMMA2() __DETAILS__SLIM_FOR_EACH_HELPER_COMMA2

/// @brief Same as `SLIM_FOR_EACH_COMMA`, for nested loops.
#define SLIM_FOR_EACH_COMMA2(macro, ...) \
  __VA_OPT__(__DETAILS__SLIM_EXPAND_2(   \
      __DETAILS__SLIM_FOR_EACH_HELPER_COMMA2(macro, __VA_ARGS__)))

///////////////////////////////////////////////////
// SLIM_DEPAREN
///////////////////////////////////////////////////

#define __SLIM_ISH(...)  __SLIM_ISH __VA_ARGS__
#define __SLIM_ESC(...)  __SLIM_ESC_(__VA_ARGS__)
#define __SLIM_ESC_(...) __SLIM_VAN##__VA_ARGS__
#define __SLIM_VAN__SLIM_ISH

/// @brief If x is wrapped in parenthesis, removes them
#define SLIM_DEPAREN(x) __SLIM_ESC(__SLIM_ISH x)

#endif // !__HG_SLIM_MACROS_FOR_EACH
