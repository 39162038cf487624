/*****************************************************************/ /**
 * @file   tuple.h
 * @brief  Contains `SLIM_*D_*` macros to unpack macro tuples.
 * A macro tuple is a parenthesized list: `(double, radius)`.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_SLIM_MACROS_TUPLE
#define __HG_SLIM_MACROS_TUPLE

#define __SLIM_2D_1(X, Y) X
#define __SLIM_2D_2(X, Y) Y
/// @brief (A, B) -> A
#define SLIM_2D_1(TUPLE) __SLIM_2D_1 TUPLE
/// @brief (A, B) -> B
#define SLIM_2D_2(TUPLE) __SLIM_2D_2 TUPLE

#define __SLIM_4D_1(X, Y, Z, A) X
#define __SLIM_4D_2(X, Y, Z, A) Y
#define __SLIM_4D_3(X, Y, Z, A) Z
#define __SLIM_4D_4(X, Y, Z, A) A
/// @brief (A, B, C, D) -> A
#define SLIM_4D_1(TUPLE) __SLIM_4D_1 TUPLE
/// @brief (A, B, C, D) -> B
#define SLIM_4D_2(TUPLE) __SLIM_4D_2 TUPLE
/// @brief (A, B, C, D) -> C
#define SLIM_4D_3(TUPLE) __SLIM_4D_3 TUPLE
/// @brief (A, B, C, D) -> D
#define SLIM_4D_4(TUPLE) __SLIM_4D_4 TUPLE

#endif // !__HG_SLIM_MACROS_TUPLE
