/*****************************************************************/ /**
 * @file   collector.h
 * @brief  Contains the `IsCollector` concept and `Gc`, the managed
 *         reference handed out by collectors.
 * The narrow handles do not implement garbage collection: they only
 * rely on a collector able to allocate blocks and to run a finalizer
 * on a block before reclaiming it.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_SLIM_NARROW_COLLECTOR
#define __HG_SLIM_NARROW_COLLECTOR

#include <concepts>
#include <cstddef>
#include <slim_allocators/allocator.h>

namespace slim::narrow
{
  /// @brief Finalizer called by a collector with the address of a block
  using finalizer_fn_t = void (*)(void*) noexcept;

  /// @brief A garbage collector usable by `GcNarrow`.
  /// - `allocate(Layout)` returns a block of at least `Layout.size()` bytes
  ///   aligned on at least `Layout.align()`. It never returns nullptr.
  /// - `register_finalizer(block, fn)` makes the collector call `fn(block)`
  ///   exactly once before reclaiming `block`.
  /// A collector must consider an address pointing inside a block as
  /// keeping that block alive.
  template<typename C>
  concept IsCollector = requires(
      C& collector, alloc::Layout layout, void* block, finalizer_fn_t finalizer) {
    { collector.allocate(layout) } -> std::same_as<void*>;
    { collector.register_finalizer(block, finalizer) };
  };

  /// @brief Managed reference to a `T` living in a collector block.
  /// This is a plain pointer: the collector decides what keeps a block alive.
  /// @tparam T The referenced type
  template<typename T>
  class Gc
  {
    T* _ptr = nullptr;

    constexpr explicit Gc(T* ptr) noexcept
        : _ptr(ptr)
    {
    }

  public:
    using element_type = T;

    constexpr Gc() noexcept = default;
    constexpr Gc(std::nullptr_t) noexcept {}

    /// @brief Creates a managed reference from a raw pointer
    /// @param ptr The pointer (into a collector block, or nullptr)
    /// @return The managed reference
    static constexpr Gc from_raw(T* ptr) noexcept { return Gc(ptr); }
    /// @brief Returns the raw pointer
    constexpr T* into_raw() const noexcept { return _ptr; }
    /// @brief Returns the raw pointer
    constexpr T* get() const noexcept { return _ptr; }

    constexpr T& operator*() const noexcept { return *_ptr; }
    constexpr T* operator->() const noexcept { return _ptr; }
    constexpr explicit operator bool() const noexcept { return _ptr != nullptr; }

    constexpr bool operator==(const Gc&) const noexcept = default;
    constexpr bool operator==(std::nullptr_t) const noexcept { return _ptr == nullptr; }
  };
} // namespace slim::narrow

#endif // !__HG_SLIM_NARROW_COLLECTOR
