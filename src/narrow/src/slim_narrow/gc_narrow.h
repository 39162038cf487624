/*****************************************************************/ /**
 * @file   gc_narrow.h
 * @brief  Contains `GcNarrow`, the narrow handle of objects living in
 *         garbage collected blocks.
 * A `GcNarrow` is placed at the start of a collector block and only
 * contains the descriptor: the object directly follows it. The block is:
 * @code
 * [descriptor][object][trailing bytes (make_from_layout only)]
 * ^ Gc<GcNarrow>
 * @endcode
 * Only objects whose alignment does not exceed a word are supported,
 * which is what makes `recover` possible.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_SLIM_NARROW_GC_NARROW
#define __HG_SLIM_NARROW_GC_NARROW

#include <cstddef>
#include <functional>
#include <new>
#include <type_traits>
#include <utility>
#include <slim_contracts/contracts.h>
#include <slim_allocators/allocator.h>
#include <slim_narrow/collector.h>
#include <slim_narrow/descriptor.h>
#include <slim_narrow/layout.h>
#include <slim_narrow/dyn.h>

namespace slim::narrow
{
  /// @brief Dispatchable reference to an object in a collector block.
  /// The address points inside the block (one word after its start), so
  /// the collector must honor interior addresses for it to keep the block
  /// alive.
  /// @tparam INTERFACE The interface
  template<IsInterface INTERFACE>
  class GcDyn : public INTERFACE::template Methods<GcDyn<INTERFACE>>
  {
  public:
    using vtable_t    = const typename INTERFACE::VTable;
    using const_ref_t = DynRef<INTERFACE, true>;

    static constexpr bool is_const = true;

  private:
    const void* _object = nullptr;
    vtable_t* _vtable   = nullptr;

  public:
    constexpr GcDyn() noexcept = default;
    constexpr GcDyn(const void* object, vtable_t* vtable) noexcept
        : _object(object)
        , _vtable(vtable)
    {
    }

    constexpr const void* address() const noexcept { return _object; }
    constexpr vtable_t* descriptor() const noexcept { return _vtable; }

    /// @brief Widens to a (const) reference
    /// @pre Not null
    const_ref_t widen() const noexcept
    {
      SLIM_debug_pre(_object != nullptr, "reference is null");
      return const_ref_t{_object, _vtable};
    }

    template<Implements<INTERFACE> U>
    bool is() const noexcept
    {
      return _object != nullptr && widen().template is<U>();
    }

    explicit operator bool() const noexcept { return _object != nullptr; }
  };

  /// @brief Narrow handle of an object allocated by `COLLECTOR`.
  /// `GcNarrow` cannot be constructed directly: use `make` or
  /// `make_from_layout`, which return a `Gc<GcNarrow>` to the block.
  /// The interface methods can be called directly on the handle, and
  /// are limited to the const methods. Use `widen()` for the others.
  /// @tparam INTERFACE The interface
  /// @tparam COLLECTOR The collector owning the blocks
  template<IsInterface INTERFACE, IsCollector COLLECTOR>
  class GcNarrow
      : public INTERFACE::template Methods<GcNarrow<INTERFACE, COLLECTOR>>
  {
  public:
    using interface_t = INTERFACE;
    using vtable_t    = const typename INTERFACE::VTable;
    using ref_t       = DynRef<INTERFACE, false>;
    using const_ref_t = DynRef<INTERFACE, true>;

    static constexpr bool is_const = true;

  private:
    /// @brief The descriptor slot (first word of the block)
    descriptor_slot_t _descriptor;

    constexpr explicit GcNarrow(vtable_t* vtable) noexcept
        : _descriptor(vtable)
    {
    }

    void* object_storage() noexcept
    {
      return reinterpret_cast<std::byte*>(this) + WORD_SIZE;
    }

    /// @brief Finalizer registered to the collector
    /// @param block The block start (the `GcNarrow`)
    static void finalize(void* block) noexcept
    {
      static_cast<GcNarrow*>(block)->widen().destroy();
    }

    /// @brief Writes the descriptor at the start of `block`
    template<typename U>
    static GcNarrow* emplace_header(void* block) noexcept
    {
      static_assert(sizeof(GcNarrow) == WORD_SIZE);
      static_assert(std::is_standard_layout_v<GcNarrow>);
      SLIM_debug_pre(block != nullptr, "collector returned a null block");
      return new (block) GcNarrow(narrow::descriptor_for<INTERFACE, U>());
    }

  public:
    GcNarrow(const GcNarrow&)            = delete;
    GcNarrow& operator=(const GcNarrow&) = delete;

    /// @brief Allocates a block from `collector` and moves `value` in it.
    /// The finalizer is only registered if the type has a non-trivial
    /// destructor. If the constructor throws, the block is left to the
    /// collector without a finalizer.
    /// @param collector The collector
    /// @param value The value to move (or copy) in the block
    /// @return Managed reference to the handle
    template<typename U>
      requires Implements<std::remove_cvref_t<U>, INTERFACE>
    static Gc<GcNarrow> make(COLLECTOR& collector, U&& value)
    {
      using T = std::remove_cvref_t<U>;
      static_assert(
          alignof(T) <= WORD_ALIGN,
          "GcNarrow does not support types aligned on more than a word");

      constexpr CombinedLayout combined =
          combine_with_descriptor_word_aligned(alloc::Layout::of<T>());
      void* block      = collector.allocate(combined.layout);
      GcNarrow* header = emplace_header<T>(block);
      new (header->object_storage()) T(std::forward<U>(value));
      if constexpr (!std::is_trivially_destructible_v<T>)
        collector.register_finalizer(block, &finalize);
      return Gc<GcNarrow>::from_raw(header);
    }

    /// @brief Allocates a block of a runtime layout, whose prefix is a `U`.
    /// `init` receives the (uninitialized) storage and must construct the
    /// `U`. The bytes following the `U` are never read by the handle.
    /// The finalizer is registered after `init` returns.
    /// @param collector The collector
    /// @param layout The layout of the object (`U` and its trailing bytes)
    /// @param init Invocable with a `U*`, constructing the object
    /// @return Managed reference to the handle
    /// @pre `layout.size() >= sizeof(U)`
    /// @pre `alignof(U) <= layout.align() <= WORD_ALIGN`
    template<Implements<INTERFACE> U, typename F>
      requires std::invocable<F, U*>
    static Gc<GcNarrow> make_from_layout(
        COLLECTOR& collector, alloc::Layout layout, F&& init)
    {
      SLIM_debug_pre(
          layout.size() >= sizeof(U), "layout is too small for the object");
      SLIM_debug_pre(
          layout.align() >= alignof(U), "layout is less aligned than the object");
      SLIM_debug_pre(
          layout.align() <= WORD_ALIGN,
          "GcNarrow does not support layouts aligned on more than a word");

      const CombinedLayout combined = combine_with_descriptor_word_aligned(layout);
      void* block      = collector.allocate(combined.layout);
      GcNarrow* header = emplace_header<U>(block);
      std::invoke(std::forward<F>(init), static_cast<U*>(header->object_storage()));
      if constexpr (!std::is_trivially_destructible_v<U>)
        collector.register_finalizer(block, &finalize);
      return Gc<GcNarrow>::from_raw(header);
    }

    /// @brief Recovers the handle from a reference to its object.
    /// @param object Reference to an object created by `make` or `make_from_layout`
    /// @return Managed reference to the handle of `object`
    /// @pre `object` was obtained through `downcast` of a handle of this type.
    ///      Any other reference results in undefined behavior.
    template<Implements<INTERFACE> U>
    static Gc<GcNarrow> recover(Gc<U> object) noexcept
    {
      SLIM_debug_pre(static_cast<bool>(object), "cannot recover a null reference");
      auto bytes = reinterpret_cast<std::byte*>(object.get());
      return Gc<GcNarrow>::from_raw(
          std::launder(reinterpret_cast<GcNarrow*>(bytes - WORD_SIZE)));
    }

    /// @brief Returns the address of the object
    const void* address() const noexcept
    {
      return reinterpret_cast<const std::byte*>(this) + WORD_SIZE;
    }
    /// @brief Returns the descriptor of the object
    vtable_t* descriptor() const noexcept
    {
      return static_cast<vtable_t*>(_descriptor);
    }

    ref_t widen() noexcept { return ref_t{object_storage(), descriptor()}; }
    const_ref_t widen() const noexcept { return const_ref_t{address(), descriptor()}; }

    /// @brief Casts to the concrete type `U`
    /// @return Managed reference to the object, or null if it is not a `U`
    template<Implements<INTERFACE> U>
    Gc<U> downcast() noexcept
    {
      return Gc<U>::from_raw(widen().template downcast<U>());
    }

    template<Implements<INTERFACE> U>
    bool is() const noexcept
    {
      return widen().template is<U>();
    }

    /// @brief Returns a dispatchable reference tracked by the collector
    GcDyn<INTERFACE> as_gc() const noexcept
    {
      return GcDyn<INTERFACE>{address(), descriptor()};
    }
  };
} // namespace slim::narrow

#endif // !__HG_SLIM_NARROW_GC_NARROW
