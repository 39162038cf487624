/*****************************************************************/ /**
 * @file   dyn.h
 * @brief  Contains `DynRef`, the widened (two words) reference to an
 *         object implementing an interface.
 * Narrow handles only store an address: widening one pairs that address
 * with the descriptor loaded from the word preceding the object.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_SLIM_NARROW_DYN
#define __HG_SLIM_NARROW_DYN

#include <type_traits>
#include <slim_macros/compiler.h>
#include <slim_contracts/contracts.h>
#include <slim_narrow/descriptor.h>
#include <slim_narrow/layout.h>

namespace slim::narrow
{
  /// @brief Loads the descriptor stored right before `object`.
  /// @param object The address of an object of a narrow block
  /// @return The descriptor
  template<IsInterface INTERFACE>
  SLIM_FORCE_INLINE const typename INTERFACE::VTable* load_descriptor(
      const void* object) noexcept
  {
    SLIM_debug_pre(object != nullptr, "expected non-null object");
    auto slot = static_cast<const descriptor_slot_t*>(object) - 1;
    return static_cast<const typename INTERFACE::VTable*>(*slot);
  }

  /// @brief Stores the descriptor right before `object`.
  /// @param object The address of an object of a narrow block
  /// @param vtable The descriptor to store
  SLIM_FORCE_INLINE void store_descriptor(void* object, const void* vtable) noexcept
  {
    SLIM_debug_pre(object != nullptr, "expected non-null object");
    auto slot = static_cast<descriptor_slot_t*>(object) - 1;
    *slot     = vtable;
  }

  /// @brief Reference to an object implementing `INTERFACE` (address + descriptor).
  /// The interface methods are provided by `INTERFACE::Methods`.
  /// @tparam INTERFACE The interface
  /// @tparam IS_CONST If true, only the const methods are callable
  template<IsInterface INTERFACE, bool IS_CONST>
  class DynRef
      : public INTERFACE::template Methods<DynRef<INTERFACE, IS_CONST>>
  {
  public:
    using vtable_t  = const typename INTERFACE::VTable;
    using address_t = std::conditional_t<IS_CONST, const void*, void*>;

    /// @brief True if only the const methods are callable
    static constexpr bool is_const = IS_CONST;

  private:
    address_t _object;
    vtable_t* _vtable;

  public:
    /// @brief Constructs a reference from an address and its descriptor
    /// @param object The address of the object
    /// @param vtable The descriptor of the object
    constexpr DynRef(address_t object, vtable_t* vtable) noexcept
        : _object(object)
        , _vtable(vtable)
    {
      SLIM_debug_pre(vtable != nullptr, "expected a descriptor");
    }

    /// @brief Converts a mutable reference to a const one
    template<bool OTHER_CONST>
      requires(IS_CONST && !OTHER_CONST)
    constexpr DynRef(const DynRef<INTERFACE, OTHER_CONST>& other) noexcept
        : _object(other.address())
        , _vtable(other.descriptor())
    {
    }

    constexpr DynRef(const DynRef&) noexcept            = default;
    constexpr DynRef& operator=(const DynRef&) noexcept = default;

    /// @brief Returns the address of the object
    constexpr address_t address() const noexcept { return _object; }
    /// @brief Returns the descriptor of the object
    constexpr vtable_t* descriptor() const noexcept { return _vtable; }
    /// @brief Returns the dynamic layout of the object
    constexpr alloc::Layout layout() const noexcept { return _vtable->layout(); }

    /// @brief Check if the object is a `U`
    /// @tparam U The concrete type
    /// @return True if the descriptor is the one of `U`
    template<Implements<INTERFACE> U>
    bool is() const noexcept
    {
      return _vtable == narrow::descriptor_for<INTERFACE, U>();
    }

    /// @brief Casts to the concrete type `U`
    /// @tparam U The concrete type
    /// @return Pointer to the object or nullptr if it is not a `U`
    template<Implements<INTERFACE> U>
    std::conditional_t<IS_CONST, const U*, U*> downcast() const noexcept
    {
      using result_t = std::conditional_t<IS_CONST, const U*, U*>;
      if (!is<U>())
        return nullptr;
      return static_cast<result_t>(_object);
    }

    /// @brief Destroys the object through its descriptor
    /// @pre The object is alive, and is not used after this call
    void destroy() const noexcept
      requires(!IS_CONST)
    {
      _vtable->destroy(_object);
    }
  };

  /// @brief Result of `operator->` of handles returning a reference by value
  /// @tparam REF The reference type
  template<typename REF>
  class ArrowProxy
  {
    REF _ref;

  public:
    constexpr explicit ArrowProxy(REF ref) noexcept
        : _ref(ref)
    {
    }
    constexpr const REF* operator->() const noexcept { return &_ref; }
  };
} // namespace slim::narrow

#endif // !__HG_SLIM_NARROW_DYN
