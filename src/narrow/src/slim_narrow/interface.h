/*****************************************************************/ /**
 * @file   interface.h
 * @brief  Contains `SLIM_NARROW_DECLARE_INTERFACE` and the handle
 *         declaration macros.
 * An interface is declared once, as a list of methods:
 * @code{.cpp}
 * SLIM_NARROW_DECLARE_INTERFACE(
 *   geo, IsShape, Shape,
 *   SLIM_NARROW_CONST_METHOD(double, area),
 *   SLIM_NARROW_METHOD(void, scale, (double, factor)));
 * SLIM_NARROW_HANDLE(geo, Shape, ShapeBox);
 * @endcode
 * Any type providing the methods (with the same signatures and
 * const-ness) can then be stored in a `geo::ShapeBox`, without
 * inheriting from anything.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_SLIM_NARROW_INTERFACE
#define __HG_SLIM_NARROW_INTERFACE

#include <concepts>
#include <type_traits>
#include <utility>
#include <slim_macros/for_each.h>
#include <slim_macros/tuple.h>
#include <slim_narrow/descriptor.h>
#include <slim_narrow/narrow_box.h>
#include <slim_narrow/gc_narrow.h>

/// @brief (int, x) -> int x
#define __SLIM_NARROW_MAKE_PARAM(FN_2D) \
  SLIM_2D_1(FN_2D)                      \
  SLIM_2D_2(FN_2D)
/// @brief (int, x) -> std::forward<int>(x)
#define __SLIM_NARROW_MAKE_FORWARD(FN_2D) \
  std::forward<SLIM_2D_1(FN_2D)>(SLIM_2D_2(FN_2D))
/// @brief (int, x) -> int
#define __SLIM_NARROW_MAKE_TYPE(FN_2D) SLIM_2D_1(FN_2D)

/// @brief ((int, x), (int, y)) -> int x, int y
#define __SLIM_NARROW_MAKE_PARAMS(...) \
  SLIM_FOR_EACH_COMMA2(__SLIM_NARROW_MAKE_PARAM, __VA_ARGS__)
/// @brief ((int, x), (int, y)) -> , int x, int y
#define __SLIM_NARROW_MAKE_PARAMS_WITH_COMMA(...) \
  __VA_OPT__(, ) SLIM_FOR_EACH_COMMA2(__SLIM_NARROW_MAKE_PARAM, __VA_ARGS__)
/// @brief ((int, x), (int, y)) -> x, y
#define __SLIM_NARROW_MAKE_ARGS(...) SLIM_FOR_EACH_COMMA2(SLIM_2D_2, __VA_ARGS__)
/// @brief ((int, x), (int, y)) -> , std::forward<int>(x), std::forward<int>(y)
#define __SLIM_NARROW_MAKE_FORWARDS_WITH_COMMA(...) \
  __VA_OPT__(, ) SLIM_FOR_EACH_COMMA2(__SLIM_NARROW_MAKE_FORWARD, __VA_ARGS__)
/// @brief ((int, x), (int, y)) -> , int, int
#define __SLIM_NARROW_MAKE_TYPES_WITH_COMMA(...) \
  __VA_OPT__(, ) SLIM_FOR_EACH_COMMA2(__SLIM_NARROW_MAKE_TYPE, __VA_ARGS__)

/// @brief (ret, name, params, (qual, suffix)) -> nested requirement
#define __SLIM_NARROW_MAKE_REQUIRE_CLAUSE(FN_4D)                                 \
  requires(SLIM_2D_1(SLIM_4D_4(FN_4D)) __SLIM_T & __slim_arg                  \
               __SLIM_NARROW_MAKE_PARAMS_WITH_COMMA(                             \
                   SLIM_DEPAREN(SLIM_4D_3(FN_4D)))) {                            \
    {                                                                            \
      __slim_arg.SLIM_4D_2(FN_4D)(                                               \
          __SLIM_NARROW_MAKE_ARGS(SLIM_DEPAREN(SLIM_4D_3(FN_4D))))               \
    } -> std::same_as<SLIM_4D_1(FN_4D)>;                                         \
  }

/// @brief (ret, name, params, (qual, suffix)) -> function pointer member
#define __SLIM_NARROW_MAKE_FN_PTR(FN_4D)                                       \
  SLIM_4D_1(FN_4D) (*SLIM_CC(SLIM_4D_2(FN_4D), SLIM_2D_2(SLIM_4D_4(FN_4D))))( \
      SLIM_2D_1(SLIM_4D_4(FN_4D)) void* __SLIM_NARROW_MAKE_TYPES_WITH_COMMA(  \
          SLIM_DEPAREN(SLIM_4D_3(FN_4D))));

/// @brief (ret, name, params, (qual, suffix)) -> type erased call of `__SLIM_T`
#define __SLIM_NARROW_MAKE_LAMBDA(FN_4D)                                           \
  +[](__SLIM_NARROW_MAKE_PARAMS(                                                   \
       (SLIM_2D_1(SLIM_4D_4(FN_4D)) void*, __slim_self),                           \
       SLIM_DEPAREN(SLIM_4D_3(FN_4D)))) -> SLIM_4D_1(FN_4D)                        \
  {                                                                                \
    return static_cast<SLIM_2D_1(SLIM_4D_4(FN_4D)) __SLIM_T*>(__slim_self)         \
        ->SLIM_4D_2(FN_4D)(                                                        \
            SLIM_FOR_EACH_COMMA2(                                                  \
                __SLIM_NARROW_MAKE_FORWARD, SLIM_DEPAREN(SLIM_4D_3(FN_4D))));      \
  }

/// @brief (ret, name, params, (qual, suffix)) -> true if `__SLIM_NAMES` has a member `name`
#define __SLIM_NARROW_MAKE_NAME_LOOKUP(FN_4D) \
  requires { &__SLIM_NAMES::SLIM_4D_2(FN_4D); }

/// @brief Non-const methods are only callable from mutable references
#define __SLIM_NARROW_METHOD_REQUIRE__ requires(!__SLIM_SELF::is_const)
#define __SLIM_NARROW_METHOD_REQUIRE__const_

/// @brief (ret, name, params, (qual, suffix)) -> member function of `Methods`
#define __SLIM_NARROW_MAKE_METHOD(FN_4D)                                          \
  SLIM_4D_1(FN_4D)                                                                \
  SLIM_4D_2(FN_4D)(__SLIM_NARROW_MAKE_PARAMS(SLIM_DEPAREN(SLIM_4D_3(FN_4D))))     \
      const SLIM_CC(__SLIM_NARROW_METHOD_REQUIRE_, SLIM_2D_2(SLIM_4D_4(FN_4D)))   \
  {                                                                               \
    const auto& __slim_self = static_cast<const __SLIM_SELF&>(*this);             \
    return __slim_self.descriptor()->SLIM_CC(                                     \
        SLIM_4D_2(FN_4D), SLIM_2D_2(SLIM_4D_4(FN_4D)))(                           \
        __slim_self.address() __SLIM_NARROW_MAKE_FORWARDS_WITH_COMMA(             \
            SLIM_DEPAREN(SLIM_4D_3(FN_4D))));                                     \
  }

/// @brief Declares an interface usable by the narrow handles.
/// Generates, in `NAMESPACE`:
/// - `CONCEPT_NAME<T>`: true if `T` provides every method
/// - `INTERFACE`: the interface description (see `slim::narrow::IsInterface`)
/// The methods cannot be named like the members of the references
/// (see `slim::narrow::ReservedMethodNames`).
/// @code{.cpp}
/// SLIM_NARROW_DECLARE_INTERFACE(
///   geo, IsShape, Shape,
///   SLIM_NARROW_CONST_METHOD(double, area));
/// @endcode
#define SLIM_NARROW_DECLARE_INTERFACE(NAMESPACE, CONCEPT_NAME, INTERFACE, FN1, ...) \
  namespace NAMESPACE                                                               \
  {                                                                                 \
    /* concept */                                                                   \
    template<typename __SLIM_T>                                                     \
    concept CONCEPT_NAME = SLIM_FOR_EACH_SYMBOL(                                    \
        __SLIM_NARROW_MAKE_REQUIRE_CLAUSE, &&, FN1 __VA_OPT__(, ) __VA_ARGS__);     \
                                                                                    \
    struct INTERFACE                                                                \
    {                                                                               \
      template<typename __SLIM_T>                                                   \
      static constexpr bool implemented_by = ::NAMESPACE::CONCEPT_NAME<__SLIM_T>;   \
                                                                                    \
      /* VTable */                                                                  \
      struct VTable : public slim::narrow::Descriptor                               \
      {                                                                             \
        SLIM_FOR_EACH(__SLIM_NARROW_MAKE_FN_PTR, FN1 __VA_OPT__(, ) __VA_ARGS__)    \
      };                                                                            \
                                                                                    \
      template<::NAMESPACE::CONCEPT_NAME __SLIM_T>                                  \
      static constexpr VTable make_vtable() noexcept                                \
      {                                                                             \
        return VTable{                                                              \
            slim::narrow::Descriptor::make_for<__SLIM_T>(),                         \
            SLIM_FOR_EACH_COMMA(                                                    \
                __SLIM_NARROW_MAKE_LAMBDA, FN1 __VA_OPT__(, ) __VA_ARGS__)};        \
      }                                                                             \
                                                                                    \
      /* one table per type: its address identifies the type */                     \
      /* (identical data folding breaks this, see narrow::descriptor_for) */        \
      template<::NAMESPACE::CONCEPT_NAME __SLIM_T>                                  \
      static const VTable* descriptor_for() noexcept                                \
      {                                                                             \
        static constexpr VTable table = make_vtable<__SLIM_T>();                    \
        return &table;                                                              \
      }                                                                             \
                                                                                    \
      /* true if a method has the name of a member of __SLIM_NAMES */               \
      template<typename __SLIM_NAMES>                                               \
      static constexpr bool declares_any_of = SLIM_FOR_EACH_SYMBOL(                 \
          __SLIM_NARROW_MAKE_NAME_LOOKUP, ||, FN1 __VA_OPT__(, ) __VA_ARGS__);      \
                                                                                    \
      /* methods of the widened references */                                       \
      template<typename __SLIM_SELF>                                                \
      struct Methods                                                                \
      {                                                                             \
        SLIM_FOR_EACH(__SLIM_NARROW_MAKE_METHOD, FN1 __VA_OPT__(, ) __VA_ARGS__)    \
      };                                                                            \
    };                                                                              \
    static_assert(slim::narrow::IsInterface<INTERFACE>);                            \
    static_assert(                                                                  \
        !INTERFACE::declares_any_of<slim::narrow::ReservedMethodNames>,             \
        "a method of " #INTERFACE " is named like a member of the references");     \
  }                                                                                 \
  static_assert(true)

/// @brief Defines a method for `SLIM_NARROW_DECLARE_INTERFACE`
/// @warning Arguments should be provided as (TYPE, NAME) IN PARENTHESIS
/// @code{.cpp}
/// SLIM_NARROW_METHOD(void, scale, (double, factor))
/// @endcode
#define SLIM_NARROW_METHOD(ret, name, ...) (ret, name, (__VA_ARGS__), (, _))
/// @brief Defines a method marked `const` for `SLIM_NARROW_DECLARE_INTERFACE`
/// @warning Arguments should be provided as (TYPE, NAME) IN PARENTHESIS
/// @code{.cpp}
/// SLIM_NARROW_CONST_METHOD(double, distance, (double, x), (double, y))
/// @endcode
#define SLIM_NARROW_CONST_METHOD(ret, name, ...) \
  (ret, name, (__VA_ARGS__), (const, _const_))

/// @brief Declares `NAMESPACE::HANDLE`, the owning narrow handle of `INTERFACE`
#define SLIM_NARROW_HANDLE(NAMESPACE, INTERFACE, HANDLE)               \
  namespace NAMESPACE                                                  \
  {                                                                    \
    using HANDLE = slim::narrow::NarrowBox<::NAMESPACE::INTERFACE>;    \
  }                                                                    \
  static_assert(true)

/// @brief Declares `NAMESPACE::HANDLE`, the garbage collected narrow handle
/// of `INTERFACE`, whose blocks are allocated by `COLLECTOR`
#define SLIM_NARROW_GC_HANDLE(NAMESPACE, INTERFACE, HANDLE, COLLECTOR)          \
  namespace NAMESPACE                                                           \
  {                                                                             \
    using HANDLE = slim::narrow::GcNarrow<::NAMESPACE::INTERFACE, COLLECTOR>;   \
  }                                                                             \
  static_assert(true)

#endif // !__HG_SLIM_NARROW_INTERFACE
