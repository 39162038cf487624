/*****************************************************************/ /**
 * @file   block.h
 * @brief  Contains `Block`, the allocation unit of all allocators.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_SLIM_ALLOCATORS_BLOCK
#define __HG_SLIM_ALLOCATORS_BLOCK

#include <cstddef>

namespace slim::alloc
{
  /// @brief Allocation unit, a pointer and size.
  /// A null pointer always has a size of zero.
  class Block
  {
    void* _ptr   = nullptr;
    size_t _size = 0;

  public:
    constexpr Block() noexcept = default;
    /// @brief Constructs a block
    /// @param ptr The pointer
    /// @param size The size of the allocation
    constexpr Block(void* ptr, size_t size) noexcept
        : _ptr(ptr)
        , _size((size_t)(ptr != nullptr) * size)
    {
    }

    constexpr void* ptr() const noexcept { return _ptr; }
    /// @brief Returns the start of the block as bytes, for offset computations
    /// @return The pointer
    std::byte* bytes() const noexcept { return static_cast<std::byte*>(_ptr); }
    constexpr size_t size() const noexcept { return _size; }

    constexpr bool operator==(const Block&) const = default;
  };

  /// @brief Null block
  static inline constexpr Block nullblock = {};
} // namespace slim::alloc

#endif // !__HG_SLIM_ALLOCATORS_BLOCK
