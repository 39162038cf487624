/*****************************************************************/ /**
 * @file   narrow_box.h
 * @brief  Contains `NarrowBox`, an owning single-word handle to an
 *         object implementing an interface.
 * The block owned by a `NarrowBox` is laid out by `combine_with_descriptor`:
 * the handle points to the object, and the descriptor is the word before.
 * Widening (to call a method) costs one load; an idle handle costs one word.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_SLIM_NARROW_NARROW_BOX
#define __HG_SLIM_NARROW_NARROW_BOX

#include <cstddef>
#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>
#include <slim_macros/compiler.h>
#include <slim_contracts/contracts.h>
#include <slim_allocators/allocator.h>
#include <slim_allocators/allocators/mallocator.h>
#include <slim_narrow/descriptor.h>
#include <slim_narrow/layout.h>
#include <slim_narrow/dyn.h>

namespace slim::narrow
{
  /// @brief Owning narrow handle to an object implementing `INTERFACE`.
  /// The handle is move-only: moving transfers the ownership of the block,
  /// and the moved-from handle is empty.
  /// For a stateless `ALLOCATOR`, `sizeof(NarrowBox) == sizeof(void*)`.
  /// @tparam INTERFACE The interface
  /// @tparam ALLOCATOR The allocator of the blocks
  template<
      IsInterface INTERFACE, alloc::IsAllocator ALLOCATOR = alloc::MallocatorAligned>
  class NarrowBox : private ALLOCATOR
  {
    static_assert(
        ALLOCATOR::allocator_info.returns_exact_size,
        "the size of a block is recomputed on deallocation: the allocator must "
        "return blocks of the exact size requested");
    static_assert(std::is_nothrow_default_constructible_v<ALLOCATOR>);

    /// @brief The address of the object (nullptr if empty)
    void* _object = nullptr;

    struct adopt_t
    {
    };

    constexpr NarrowBox(adopt_t, void* object) noexcept
        : _object(object)
    {
    }

    /// @brief Allocates a block for a `U` and stores its descriptor.
    /// Aborts through `alloc::handle_alloc_fail` on allocation failure.
    /// @return The (uninitialized) object storage
    template<typename U>
    void* allocate_for()
    {
      constexpr CombinedLayout combined = combined_layout_of<U>;

      alloc::Block blk = ALLOCATOR::allocate(combined.layout);
      if (SLIM_UNLIKELY(blk == alloc::nullblock))
        alloc::handle_alloc_fail(combined.layout);
      SLIM_debug_assert(
          reinterpret_cast<std::uintptr_t>(blk.ptr()) % combined.layout.align() == 0,
          "allocator returned a misaligned block");

      void* object = blk.bytes() + combined.object_offset;
      store_descriptor(object, narrow::descriptor_for<INTERFACE, U>());
      return object;
    }

    /// @brief Frees the block containing `object`.
    /// @param object The object address
    /// @param object_layout The layout of the object (destroyed or never constructed)
    void deallocate_for(void* object, alloc::Layout object_layout) noexcept
    {
      // must mirror the computation done by `allocate_for`
      const CombinedLayout combined = combine_with_descriptor(object_layout);
      ALLOCATOR::deallocate(
          alloc::Block{
              static_cast<std::byte*>(object) - combined.object_offset,
              combined.layout.size()});
    }

  public:
    using interface_t = INTERFACE;
    using vtable_t    = const typename INTERFACE::VTable;
    using ref_t       = DynRef<INTERFACE, false>;
    using const_ref_t = DynRef<INTERFACE, true>;

    NarrowBox(const NarrowBox&)            = delete;
    NarrowBox& operator=(const NarrowBox&) = delete;

    /// @brief Moves `value` into a new block.
    /// @param value The value to move (or copy) in the handle
    template<typename U>
      requires Implements<std::remove_cvref_t<U>, INTERFACE>
                   && (!std::same_as<std::remove_cvref_t<U>, NarrowBox>)
    explicit NarrowBox(U&& value)
        : NarrowBox(std::in_place_type<std::remove_cvref_t<U>>, std::forward<U>(value))
    {
    }

    /// @brief Constructs a `U` in a new block.
    /// If the constructor of `U` throws, the block is freed and the exception
    /// is rethrown.
    /// @param args The arguments to forward to the constructor of `U`
    template<Implements<INTERFACE> U, typename... Args>
      requires std::constructible_from<U, Args...>
    explicit NarrowBox(std::in_place_type_t<U>, Args&&... args)
    {
      void* object = allocate_for<U>();
      if constexpr (std::is_nothrow_constructible_v<U, Args...>)
        new (object) U(std::forward<Args>(args)...);
      else
      {
        try
        {
          new (object) U(std::forward<Args>(args)...);
        }
        catch (...)
        {
          deallocate_for(object, alloc::Layout::of<U>());
          throw;
        }
      }
      _object = object;
    }

    constexpr NarrowBox(NarrowBox&& other) noexcept
        : ALLOCATOR(static_cast<ALLOCATOR&&>(other))
        , _object(std::exchange(other._object, nullptr))
    {
    }

    NarrowBox& operator=(NarrowBox&& other) noexcept
    {
      if (this == &other)
        return *this;
      reset();
      static_cast<ALLOCATOR&>(*this) = static_cast<ALLOCATOR&&>(other);
      _object = std::exchange(other._object, nullptr);
      return *this;
    }

    ~NarrowBox() { reset(); }

    /// @brief Destroys the object and frees its block. Does nothing if empty.
    /// The layout of the block is recomputed from the dynamic layout stored
    /// in the descriptor.
    void reset() noexcept
    {
      if (_object == nullptr)
        return;
      const ref_t ref = widen();
      ref.destroy();
      deallocate_for(std::exchange(_object, nullptr), ref.layout());
    }

    /// @brief Adopts an object previously returned by `release`.
    /// @param object The object address
    /// @return The handle owning `object`
    /// @pre `object` was returned by `release` of a `NarrowBox` with the same
    ///      interface and allocator, and was not adopted since.
    static NarrowBox from_raw(void* object) noexcept
    {
      SLIM_debug_pre(object != nullptr, "cannot adopt a null object");
      return NarrowBox(adopt_t{}, object);
    }

    /// @brief Releases the ownership of the block.
    /// The handle is empty after this call.
    /// @return The object address, to pass to `from_raw`
    [[nodiscard]] void* release() noexcept { return std::exchange(_object, nullptr); }

    /// @brief Widens the handle
    /// @return Reference to the object
    /// @pre The handle is not empty
    SLIM_FORCE_INLINE ref_t widen() noexcept
    {
      SLIM_debug_pre(_object != nullptr, "handle is empty");
      return ref_t{_object, load_descriptor<INTERFACE>(_object)};
    }

    /// @brief Widens the handle
    /// @return Reference to the (const) object
    /// @pre The handle is not empty
    SLIM_FORCE_INLINE const_ref_t widen() const noexcept
    {
      SLIM_debug_pre(_object != nullptr, "handle is empty");
      return const_ref_t{_object, load_descriptor<INTERFACE>(_object)};
    }

    ref_t operator*() noexcept { return widen(); }
    const_ref_t operator*() const noexcept { return widen(); }
    ArrowProxy<ref_t> operator->() noexcept { return ArrowProxy<ref_t>{widen()}; }
    ArrowProxy<const_ref_t> operator->() const noexcept
    {
      return ArrowProxy<const_ref_t>{widen()};
    }

    /// @brief Casts to the concrete type `U`
    /// @return Pointer to the object, or nullptr if it is not a `U`
    template<Implements<INTERFACE> U>
    U* downcast() noexcept
    {
      return widen().template downcast<U>();
    }
    /// @brief Casts to the concrete type `U`
    /// @return Pointer to the object, or nullptr if it is not a `U`
    template<Implements<INTERFACE> U>
    const U* downcast() const noexcept
    {
      return widen().template downcast<U>();
    }
    template<Implements<INTERFACE> U>
    bool is() const noexcept
    {
      return widen().template is<U>();
    }

    /// @brief Returns the descriptor stored before the object
    vtable_t* descriptor() const noexcept { return widen().descriptor(); }
    /// @brief Returns the address of the object (nullptr if empty)
    void* address() const noexcept { return _object; }

    explicit operator bool() const noexcept { return _object != nullptr; }

    friend void swap(NarrowBox& a, NarrowBox& b) noexcept
    {
      std::swap(static_cast<ALLOCATOR&>(a), static_cast<ALLOCATOR&>(b));
      std::swap(a._object, b._object);
    }
  };
} // namespace slim::narrow

#endif // !__HG_SLIM_NARROW_NARROW_BOX
