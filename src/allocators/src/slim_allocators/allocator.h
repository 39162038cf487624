/*****************************************************************/ /**
 * @file   allocator.h
 * @brief  Contains `Layout`, the `IsAllocator` concept and allocator
 *         failure utilities.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_SLIM_ALLOCATORS_ALLOCATOR
#define __HG_SLIM_ALLOCATORS_ALLOCATOR

#include <source_location>
#include <concepts>
#include <cstddef>

#include <slim_allocators_export.h>
#include <slim_allocators/block.h>
#include <slim_contracts/contracts.h>

/// @brief Everything related to memory allocation
namespace slim::alloc
{
  /// @brief The alignment `malloc` guarantees.
  inline constexpr std::size_t PREFERRED_ALIGNMENT =
#ifdef __STDCPP_DEFAULT_NEW_ALIGNMENT__
      __STDCPP_DEFAULT_NEW_ALIGNMENT__;
#else
      alignof(std::max_align_t);
#endif

  /// @brief Check if an integer is a (non-zero) power of two
  /// @tparam T The integer type
  /// @param n The integer
  /// @return True if power of two
  template<std::integral T>
  constexpr bool is_power_of_2(T n) noexcept
  {
    return n != 0 && (n & (n - 1)) == 0;
  }

  /// @brief Aligns a value up to a multiple of `align`
  /// @param n The value to align
  /// @param align The alignment (a power of two)
  /// @return Aligned value
  constexpr size_t align_up(size_t n, size_t align) noexcept
  {
    SLIM_debug_pre(is_power_of_2(align), "alignment must be a power of two");
    return (n + align - 1) & ~(align - 1);
  }

  /// @brief Allocator information
  struct AllocatorInfo
  {
    /// @brief Is the allocator thread safe?
    bool is_thread_safe = false;
    /// @brief Is the allocator fallible?
    /// If it isn't, then the allocator must terminate on failure.
    bool is_fallible = true;
    /// @brief Is the allocator nothrow fallible?
    /// If it is, then nullblock is returned on failure.
    /// If not, `std::bad_alloc` is thrown on failure.
    bool is_nothrow_fallible = false;
    /// @brief Does the allocator always return an allocation of the exact size requested?
    bool returns_exact_size = false;
    /// @brief The minimum alignment guaranteed by the allocator
    size_t alignment = 1;
  };

  /// @brief Size and alignment of an allocation request.
  class Layout
  {
    size_t _size;
    size_t _align;

  public:
    constexpr Layout(size_t size, size_t align) noexcept
        : _size(size)
        , _align(align)
    {
    }

    /// @brief Returns the layout of `T`
    /// @tparam T The type
    /// @return Layout{sizeof(T), alignof(T)}
    template<typename T>
    static constexpr Layout of() noexcept
    {
      return {sizeof(T), alignof(T)};
    }

    constexpr size_t size() const noexcept { return _size; }
    constexpr size_t align() const noexcept { return _align; }

    constexpr bool operator==(const Layout&) const noexcept = default;
  };

  template<typename T>
  concept IsAllocator = requires(T alloc, Layout alloc_req, Block block) {
    { T::allocator_info } -> std::convertible_to<AllocatorInfo>;

    { alloc.allocate(alloc_req) } -> std::same_as<Block>;
    { alloc.deallocate(block) } noexcept -> std::same_as<void>;

    //  - not fallible          -> must be noexcept (terminates on failure)
    //  - fallible & nothrow    -> must be noexcept (returns nullblock)
    //  - fallible & may throw  -> must NOT be noexcept
    requires(
        T::allocator_info.is_fallible ? (noexcept(alloc.allocate(alloc_req))
                                         == T::allocator_info.is_nothrow_fallible)
                                      : noexcept(alloc.allocate(alloc_req)));
    requires(
        !T::allocator_info.is_nothrow_fallible || T::allocator_info.is_fallible);
    requires(T::allocator_info.alignment != 0);
  };

  /// @brief The function to call on allocation failure.
  /// The function receives the attempted allocation, and
  /// the source location of the allocation.
  using alloc_fail_fn_t = void (*)(Layout, const std::source_location&) noexcept;

  /// @brief Register a function to call on infallible allocation failure.
  /// @param fn The function to call on infallible allocation failure.
  /// @return The old registered function
  /// @note This function is thread safe.
  /// @pre `fn` must not be nullptr
  SLIM_ALLOCATORS_EXPORT
  alloc_fail_fn_t register_on_alloc_fail(alloc_fail_fn_t fn) noexcept;

  [[noreturn]]
  SLIM_ALLOCATORS_EXPORT
      /// @brief The default function that is called on allocation failure.
      /// Prints the failed request and aborts.
      /// @param request The failed request
      /// @param loc The source location of the allocation
      void default_on_alloc_fail(
          Layout request, const std::source_location& loc) noexcept;

  [[noreturn]]
  SLIM_ALLOCATORS_EXPORT
      /// @brief Function that MUST be called when an infallible allocation fails.
      /// Calls the registered hook, then aborts if the hook returned.
      /// @param request The failed request
      /// @param loc The source location
      void handle_alloc_fail(
          Layout request,
          const std::source_location& loc = SLIM_CURRENT_SOURCE_LOCATION) noexcept;
} // namespace slim::alloc

#endif // !__HG_SLIM_ALLOCATORS_ALLOCATOR
