/*****************************************************************/ /**
 * @file   contracts.h
 * @brief  Contains macros for assertions, pre/post conditions.
 * A contract violation is a programming error: the registered handler
 * is called, and the default handler reports the violation and aborts.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_SLIM_CONTRACTS_CONTRACTS
#define __HG_SLIM_CONTRACTS_CONTRACTS

#include "slim_contracts_export.h"
#include "slim_contracts_config.h"
#include <source_location>
#include <type_traits>
#include <optional>

#ifdef SLIM_NO_SOURCE_LOCATION
  /// @brief The current source location
  #define SLIM_CURRENT_SOURCE_LOCATION std::source_location()
#else
  /// @brief The current source location
  #define SLIM_CURRENT_SOURCE_LOCATION std::source_location::current()
#endif // SLIM_NO_SOURCE_LOCATION

namespace slim::contracts
{
  /// @brief The contract kind
  enum class Kind : unsigned char
  {
    /// @brief Precondition
    Pre,
    /// @brief Postcondition
    Post,
    /// @brief Assertion
    Assert,
  };

  /// @brief Returns a readable name for a contract kind
  /// @param kind The kind
  /// @return "precondition", "postcondition" or "assertion"
  constexpr const char* to_string(Kind kind) noexcept
  {
    switch (kind)
    {
    case Kind::Pre:
      return "precondition";
    case Kind::Post:
      return "postcondition";
    case Kind::Assert:
      return "assertion";
    }
    return "assertion";
  }

  // Calling any of these from a constant evaluation stops compilation,
  // and the name shows up in the diagnostic.
  inline void precondition_failed_in_constexpr() {}
  inline void postcondition_failed_in_constexpr() {}
  inline void assertion_failed_in_constexpr() {}

  /// @brief The type of a violation handler function
  using violation_handler_fn_t = void(
      const char*, const char*, Kind,
      const std::optional<std::source_location>&) noexcept;

  [[noreturn]] SLIM_CONTRACTS_EXPORT
      /// @brief The default runtime contract violation handler.
      /// Prints the violated contract and a stack trace, then aborts.
      /// @param expr The expression as a string
      /// @param explanation The explanation
      /// @param kind The kind of the violation
      /// @param loc The source location
      void
      default_runtime_violation_handler(
          const char* expr, const char* explanation, Kind kind,
          const std::optional<std::source_location>& loc) noexcept;

  SLIM_CONTRACTS_EXPORT
  /// @brief Calls the registered violation handler, or the default one.
  /// @param expr The expression as a string
  /// @param explanation The explanation
  /// @param kind The kind of the violation
  /// @param loc The source location
  void runtime_violation_handler(
      const char* expr, const char* explanation, Kind kind,
      const std::optional<std::source_location>& loc) noexcept;

  /// @brief The contract violation handler.
  /// In a constant evaluation, a violation is a compilation error.
  /// At runtime, calls the runtime violation handler.
  /// @param expr The expression as a string
  /// @param explanation The explanation
  /// @param kind The violation kind
  /// @param loc The source code location
  constexpr void violation_handler(
      const char* expr, const char* explanation, Kind kind,
      const std::optional<std::source_location>& loc =
          SLIM_CURRENT_SOURCE_LOCATION) noexcept
  {
    if (std::is_constant_evaluated())
    {
      switch (kind)
      {
      case Kind::Pre:
        precondition_failed_in_constexpr();
        break;
      case Kind::Post:
        postcondition_failed_in_constexpr();
        break;
      case Kind::Assert:
        assertion_failed_in_constexpr();
        break;
      }
    }
    else
    {
      runtime_violation_handler(expr, explanation, kind, loc);
    }
  }

  SLIM_CONTRACTS_EXPORT
  /// @brief Replaces the current violation handler with a new one.
  /// The registered function should not return: if it does, execution
  /// continues past a violated contract.
  /// If `fn` is `nullptr`, the default handler is restored.
  /// @param fn The new violation handler
  /// @return The previously registered handler (nullptr for the default one)
  /// @note This function is thread safe without synchronicity.
  violation_handler_fn_t* register_violation_handler(
      violation_handler_fn_t* fn) noexcept;
} // namespace slim::contracts

/// @brief Precondition (checks that `cond` evaluates to true)
#define SLIM_pre(cond, explanation)                        \
  do                                                       \
  {                                                        \
    if (!static_cast<bool>(cond))                          \
      slim::contracts::violation_handler(                  \
          #cond, explanation, slim::contracts::Kind::Pre); \
  } while (false)
/// @brief Postcondition (checks that `cond` evaluates to true)
#define SLIM_post(cond, explanation)                        \
  do                                                        \
  {                                                         \
    if (!static_cast<bool>(cond))                           \
      slim::contracts::violation_handler(                   \
          #cond, explanation, slim::contracts::Kind::Post); \
  } while (false)
/// @brief Assertion (checks that `cond` evaluates to true)
#define SLIM_assert(cond, explanation)                        \
  do                                                          \
  {                                                           \
    if (!static_cast<bool>(cond))                             \
      slim::contracts::violation_handler(                     \
          #cond, explanation, slim::contracts::Kind::Assert); \
  } while (false)

#ifdef SLIM_DEBUG
  /// @brief Precondition that is only evaluated on Debug config
  #define SLIM_debug_pre(cond, explanation) SLIM_pre(cond, explanation)
  /// @brief Postcondition that is only evaluated on Debug config
  #define SLIM_debug_post(cond, explanation) SLIM_post(cond, explanation)
  /// @brief Assertion that is only evaluated on Debug config
  #define SLIM_debug_assert(cond, explanation) SLIM_assert(cond, explanation)
#else
  /// @brief Precondition that is only evaluated on Debug config
  #define SLIM_debug_pre(cond, explanation) \
    do                                      \
    {                                       \
    } while (false)
  /// @brief Postcondition that is only evaluated on Debug config
  #define SLIM_debug_post(cond, explanation) \
    do                                       \
    {                                        \
    } while (false)
  /// @brief Assertion that is only evaluated on Debug config
  #define SLIM_debug_assert(cond, explanation) \
    do                                         \
    {                                          \
    } while (false)
#endif // SLIM_DEBUG

namespace slim::contracts
{
  /// @brief Check if the debug contracts (`SLIM_debug_*`) are evaluated
  /// @return True if `SLIM_DEBUG` is defined
  consteval bool are_debug_contracts_enabled() noexcept
  {
#ifdef SLIM_DEBUG
    return true;
#else
    return false;
#endif
  }
} // namespace slim::contracts

#endif // !__HG_SLIM_CONTRACTS_CONTRACTS
