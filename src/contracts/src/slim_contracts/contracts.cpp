/*****************************************************************/ /**
 * @file   contracts.cpp
 * @brief  Implementation of `contracts.h`
 *
 * @date   October 2026
 *********************************************************************/
#include <atomic>
#include <exception>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <cpptrace/cpptrace.hpp>

#include "contracts.h"

namespace slim::contracts
{
  static std::atomic<violation_handler_fn_t*> global_handler = nullptr;

  void default_runtime_violation_handler(
      const char* expr, const char* explanation, Kind kind,
      const std::optional<std::source_location>& loc_opt) noexcept
  {
    const char* kind_str = to_string(kind);

    bool with_color = false;
    std::string trace = {};
    try
    {
      with_color = cpptrace::isatty(cpptrace::stderr_fileno);
      // skip `default_runtime_violation_handler`, `runtime_violation_handler`
      // and `violation_handler`
      trace = cpptrace::generate_trace(3).to_string(with_color);
    }
    catch (const std::exception&)
    {
      // no trace if it can't be generated (allocation failure)
      with_color = false;
      trace.clear();
    }

    const char* header = with_color ? "\x1b[41mFATAL ERROR:\x1b[0m" : "FATAL ERROR:";
    if (loc_opt.has_value())
    {
      auto& loc = *loc_opt;
      std::fprintf(
          stderr, "%s\n  %s:%u:%u: in %s\n  %s: %s\n  explanation: %s\n", header,
          loc.file_name(), static_cast<unsigned>(loc.line()),
          static_cast<unsigned>(loc.column()), loc.function_name(), kind_str, expr,
          explanation);
    }
    else
    {
      std::fprintf(
          stderr, "%s\n  %s: %s\n  explanation: %s\n", header, kind_str, expr,
          explanation);
    }
    if (!trace.empty())
      std::fprintf(stderr, "\n  %s", trace.c_str());

    std::fflush(stderr);
    std::abort();
  }

  void runtime_violation_handler(
      const char* expr, const char* explanation, Kind kind,
      const std::optional<std::source_location>& loc) noexcept
  {
    auto handler = global_handler.load(std::memory_order_relaxed);
    if (handler)
      handler(expr, explanation, kind, loc);
    else
      default_runtime_violation_handler(expr, explanation, kind, loc);
  }

  violation_handler_fn_t* register_violation_handler(
      violation_handler_fn_t* fn) noexcept
  {
    return global_handler.exchange(fn, std::memory_order_relaxed);
  }
} // namespace slim::contracts
