/*****************************************************************/ /**
 * @file   mallocator.h
 * @brief  Contains `Mallocator` and `MallocatorAligned`.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_SLIM_ALLOCATORS_MALLOCATOR
#define __HG_SLIM_ALLOCATORS_MALLOCATOR

#include <slim_allocators_export.h>
#include <slim_allocators/allocator.h>

namespace slim::alloc
{
  /// @brief Allocator wrapper over `malloc` and `free`.
  /// Requests with an alignment greater than `PREFERRED_ALIGNMENT`
  /// fail with `nullblock`: use `MallocatorAligned` for those.
  /// This allocator is stateless.
  struct Mallocator
  {
    static constexpr AllocatorInfo allocator_info = {
        .is_thread_safe      = true,
        .is_fallible         = true,
        .is_nothrow_fallible = true,
        .returns_exact_size  = true,
        .alignment           = PREFERRED_ALIGNMENT,
    };

    SLIM_ALLOCATORS_EXPORT
    /// @brief Allocates a block using `malloc`
    /// @param request The allocation request
    /// @return The block or nullblock on failure
    Block allocate(Layout request) const noexcept;

    SLIM_ALLOCATORS_EXPORT
    void deallocate(Block blk) const noexcept;
  };
  static_assert(IsAllocator<Mallocator>);

  /// @brief Allocator supporting extended alignment.
  /// Uses `posix_memalign` (`_aligned_malloc` on Windows). If the
  /// alignment cannot be satisfied, `nullblock` is returned.
  /// This allocator is stateless.
  struct MallocatorAligned
  {
    static constexpr AllocatorInfo allocator_info = {
        .is_thread_safe      = true,
        .is_fallible         = true,
        .is_nothrow_fallible = true,
        .returns_exact_size  = true,
        .alignment           = PREFERRED_ALIGNMENT,
    };

    SLIM_ALLOCATORS_EXPORT
    /// @brief Allocates a block aligned to `request.align()`
    /// @param request The allocation request
    /// @return The block or nullblock on failure
    Block allocate(Layout request) const noexcept;

    SLIM_ALLOCATORS_EXPORT
    void deallocate(Block blk) const noexcept;
  };
  static_assert(IsAllocator<MallocatorAligned>);
} // namespace slim::alloc

#endif // !__HG_SLIM_ALLOCATORS_MALLOCATOR
