/*****************************************************************/ /**
 * @file   layout.h
 * @brief  Contains the layout combiner of narrow handles.
 * A narrow handle stores a single address: the interface descriptor
 * lives in the word right before the object. The combined block is:
 * @code
 * [padding (only if alignof(object) > word)][descriptor][object]
 *                                                       ^ offset
 * @endcode
 * All the offset/alignment arithmetic of the narrow handles lives here.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_SLIM_NARROW_LAYOUT
#define __HG_SLIM_NARROW_LAYOUT

#include <cstddef>
#include <limits>
#include <slim_allocators/allocator.h>
#include <slim_contracts/contracts.h>

namespace slim::narrow
{
  /// @brief The type stored in the descriptor slot (a pointer to a vtable)
  using descriptor_slot_t = const void*;

  /// @brief Size of the descriptor slot
  inline constexpr size_t WORD_SIZE = sizeof(descriptor_slot_t);
  /// @brief Alignment of the descriptor slot
  inline constexpr size_t WORD_ALIGN = alignof(descriptor_slot_t);

  /// @brief Result of combining the descriptor slot with an object layout
  struct CombinedLayout
  {
    /// @brief The layout of the whole block (descriptor + object)
    alloc::Layout layout;
    /// @brief The offset in bytes from the start of the block to the object
    size_t object_offset;

    /// @brief Returns the offset of the descriptor slot from the start of the block
    /// @return `object_offset - WORD_SIZE`
    constexpr size_t descriptor_offset() const noexcept
    {
      return object_offset - WORD_SIZE;
    }

    constexpr bool operator==(const CombinedLayout&) const noexcept = default;
  };

  /// @brief Combines the descriptor slot with the layout of an object.
  /// If `alignof(object) <= WORD_ALIGN`, the object directly follows the
  /// descriptor (offset == WORD_SIZE). Otherwise the object is placed at
  /// its alignment, and the padding before the descriptor is a multiple
  /// of the word size: alignments are powers of two.
  /// The object may be zero sized, in which case the object offset is
  /// the end of the block.
  /// @param object The layout of the object
  /// @return The combined layout
  /// @pre `object.align()` is a power of two
  /// @post `(object_offset - WORD_SIZE) % WORD_ALIGN == 0`
  constexpr CombinedLayout combine_with_descriptor(alloc::Layout object) noexcept
  {
    SLIM_debug_pre(
        alloc::is_power_of_2(object.align()), "alignment must be a power of two");

    const size_t align = object.align() > WORD_ALIGN ? object.align() : WORD_ALIGN;
    const size_t offset = alloc::align_up(WORD_SIZE, object.align());
    SLIM_debug_pre(
        object.size() <= std::numeric_limits<size_t>::max() - offset,
        "combined layout overflows");

    SLIM_debug_assert(
        (offset - WORD_SIZE) % WORD_ALIGN == 0,
        "the descriptor slot must be word aligned");
    return {alloc::Layout{offset + object.size(), align}, offset};
  }

  /// @brief Combines the descriptor slot with the layout of an object
  /// whose alignment does not exceed the word.
  /// The object always starts exactly one word after the block start,
  /// and the block is word aligned.
  /// @param object The layout of the object
  /// @return The combined layout
  /// @pre `object.align() <= WORD_ALIGN`
  constexpr CombinedLayout combine_with_descriptor_word_aligned(
      alloc::Layout object) noexcept
  {
    SLIM_debug_pre(
        object.align() <= WORD_ALIGN,
        "alignment greater than a word is not supported");
    auto combined = combine_with_descriptor(object);
    SLIM_debug_assert(
        combined.object_offset == WORD_SIZE,
        "the object must directly follow the descriptor");
    return combined;
  }

  /// @brief Combined layout of a descriptor and a `T`
  /// @tparam T The object type
  template<typename T>
  inline constexpr CombinedLayout combined_layout_of =
      combine_with_descriptor(alloc::Layout::of<T>());
} // namespace slim::narrow

#endif // !__HG_SLIM_NARROW_LAYOUT
