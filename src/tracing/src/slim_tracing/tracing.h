/*****************************************************************/ /**
 * @file   tracing.h
 * @brief  Contains tracing macros.
 * Tracing is backed by Tracy, and only compiled in when
 * `SLIM_ENABLE_TRACING` is defined (CMake option of the same name).
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_SLIM_TRACING_TRACING
#define __HG_SLIM_TRACING_TRACING

#ifdef SLIM_ENABLE_TRACING
  #include <tracy/Tracy.hpp>

  /// @brief Traces the current function
  #define SLIM_TRACE_FN() ZoneScoped
  /// @brief Traces a block (which is named)
  /// @code{.cpp}
  /// {
  ///   SLIM_TRACE_BLOCK("sweep");
  ///   for (auto& block : blocks)
  ///     sweep(block);
  /// }
  /// @endcode
  #define SLIM_TRACE_BLOCK(name) ZoneScopedN(name)
  /// @brief Plots a numeric value over time (`name` is a string literal)
  #define SLIM_TRACE_PLOT(name, value) TracyPlot(name, static_cast<int64_t>(value))
  /// @brief Reports an allocation to the memory profiler
  #define SLIM_TRACE_ALLOC(ptr, size) TracyAlloc(ptr, size)
  /// @brief Reports a deallocation to the memory profiler
  #define SLIM_TRACE_FREE(ptr) TracyFree(ptr)

#else

  /// @brief Traces the current function
  #define SLIM_TRACE_FN() \
    do                    \
    {                     \
    } while (0)
  /// @brief Traces a block (which is named)
  #define SLIM_TRACE_BLOCK(name)       (void)0
  /// @brief Plots a numeric value over time (`name` is a string literal)
  #define SLIM_TRACE_PLOT(name, value) (void)0
  /// @brief Reports an allocation to the memory profiler
  #define SLIM_TRACE_ALLOC(ptr, size)  (void)0
  /// @brief Reports a deallocation to the memory profiler
  #define SLIM_TRACE_FREE(ptr)         (void)0
#endif // SLIM_ENABLE_TRACING

#endif // !__HG_SLIM_TRACING_TRACING
