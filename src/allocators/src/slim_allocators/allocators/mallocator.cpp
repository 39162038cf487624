/*****************************************************************/ /**
 * @file   mallocator.cpp
 * @brief  Contains the implementation of `mallocator.h`.
 *
 * @date   October 2026
 *********************************************************************/
#include <slim_allocators/allocators/mallocator.h>
#include <cstddef>
#include <cstdlib>

#if defined(_WIN32)
  #include <malloc.h> // _aligned_malloc, _aligned_free
#else
  #include <stdlib.h> // posix_memalign
#endif

namespace slim::alloc
{
  Block Mallocator::allocate(Layout request) const noexcept
  {
    if (request.align() > PREFERRED_ALIGNMENT)
      return nullblock;
    // malloc(0) may return nullptr: always ask for at least a byte
    return {std::malloc(request.size() == 0 ? 1 : request.size()), request.size()};
  }

  void Mallocator::deallocate(Block blk) const noexcept
  {
    std::free(blk.ptr());
  }

  Block MallocatorAligned::allocate(Layout request) const noexcept
  {
    SLIM_debug_pre(is_power_of_2(request.align()), "invalid alignment");
    // posix_memalign requires a multiple of sizeof(void*)
    const size_t align = request.align() < PREFERRED_ALIGNMENT ? PREFERRED_ALIGNMENT
                                                               : request.align();
    const size_t size = request.size() == 0 ? 1 : request.size();

#if defined(_WIN32)
    return {_aligned_malloc(size, align), request.size()};
#else
    void* ptr = nullptr;
    if (posix_memalign(&ptr, align, size) != 0)
      return nullblock;
    return {ptr, request.size()};
#endif
  }

  void MallocatorAligned::deallocate(Block blk) const noexcept
  {
    if (blk.ptr() == nullptr)
      return;
#if defined(_WIN32)
    _aligned_free(blk.ptr());
#else
    std::free(blk.ptr());
#endif
  }
} // namespace slim::alloc
