/*****************************************************************/ /**
 * @file   descriptor.h
 * @brief  Contains `Descriptor`, the common header of interface vtables,
 *         and the `IsInterface` concept.
 * A descriptor is a pointer to the (unique) vtable generated for a
 * (concrete type, interface) pair. Comparing descriptors is comparing
 * concrete types, which is what downcasting relies on.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_SLIM_NARROW_DESCRIPTOR
#define __HG_SLIM_NARROW_DESCRIPTOR

#include <cstddef>
#include <concepts>
#include <type_traits>
#include <slim_allocators/allocator.h>

namespace slim::narrow
{
  /// @brief Type erased destructor call
  using type_erased_destructor_t = void (*)(void*) noexcept;

  /// @brief The header of every interface vtable.
  /// Destroying a narrow handle only needs this header: the destructor
  /// to call, and the dynamic layout of the object to free its block.
  struct Descriptor
  {
    /// @brief Type erased destructor of the concrete type
    type_erased_destructor_t destroy;
    /// @brief `sizeof` the concrete type
    size_t size;
    /// @brief `alignof` the concrete type
    size_t align;

    /// @brief Returns the dynamic layout of the concrete type
    /// @return Layout{size, align}
    constexpr alloc::Layout layout() const noexcept { return {size, align}; }

    /// @brief Creates the descriptor header of `T`
    /// @tparam T The concrete type
    /// @return The header
    template<typename T>
    static constexpr Descriptor make_for() noexcept
    {
      static_assert(
          std::is_nothrow_destructible_v<T>,
          "types stored in narrow handles must have a noexcept destructor");
      return {
          +[](void* object) noexcept { static_cast<T*>(object)->~T(); },
          sizeof(T),
          alignof(T),
      };
    }
  };

  /// @brief An interface description, as generated by `SLIM_NARROW_DECLARE_INTERFACE`.
  /// It provides:
  /// - `VTable`: the vtable type, deriving from `Descriptor`
  /// - `implemented_by<T>`: true if `T` implements the interface
  /// - `descriptor_for<T>()`: the unique vtable of `T`
  /// - `Methods<Self>`: CRTP mixin providing the interface methods to
  ///   widened references (`Self` provides `descriptor()` and `address()`).
  template<typename I>
  concept IsInterface = requires {
    typename I::VTable;
    requires std::derived_from<typename I::VTable, Descriptor>;
    { I::template implemented_by<int> } -> std::convertible_to<bool>;
  };

  /// @brief True if `T` is a reference generated for `INTERFACE`.
  /// References (`DynRef`, `GcDyn`, `GcNarrow`) provide every method of
  /// the interface but do not own the object they refer to.
  template<typename T, typename INTERFACE>
  concept IsReferenceOf =
      std::derived_from<T, typename INTERFACE::template Methods<T>>;

  /// @brief True if `T` can be stored in a narrow handle of `INTERFACE`.
  /// References to objects implementing `INTERFACE` cannot be stored:
  /// the stored object must be moved into the block.
  template<typename T, typename INTERFACE>
  concept Implements =
      IsInterface<INTERFACE> && std::is_object_v<T> && !std::is_const_v<T>
      && INTERFACE::template implemented_by<T> && std::is_nothrow_destructible_v<T>
      && !IsReferenceOf<T, INTERFACE>;

  /// @brief Names of the members of the references.
  /// An interface method with one of these names would be hidden by the
  /// member: `SLIM_NARROW_DECLARE_INTERFACE` rejects them.
  struct ReservedMethodNames
  {
    int address;
    int descriptor;
    int layout;
    int destroy;
    int is;
    int downcast;
    int widen;
    int as_gc;
    int make;
    int make_from_layout;
    int recover;
    int object_storage;
    int finalize;
    int emplace_header;
    int is_const;
    int interface_t;
    int vtable_t;
    int address_t;
    int ref_t;
    int const_ref_t;
  };

  /// @brief Returns the descriptor of `T` as an implementation of `INTERFACE`.
  /// The address of the descriptor only depends on `T` and `INTERFACE`.
  /// @warning Identity relies on every table having its own address.
  /// Linking with identical data folding (`--icf=all`, `/OPT:ICF`) may
  /// merge the tables of two types with the same layout and the same
  /// method bodies, making `is`/`downcast` accept both types.
  /// `--icf=safe` keeps the tables apart.
  /// @tparam INTERFACE The interface
  /// @tparam T The concrete type
  /// @return Pointer to the vtable (never null)
  template<IsInterface INTERFACE, Implements<INTERFACE> T>
  inline const typename INTERFACE::VTable* descriptor_for() noexcept
  {
    return INTERFACE::template descriptor_for<T>();
  }
} // namespace slim::narrow

#endif // !__HG_SLIM_NARROW_DESCRIPTOR
