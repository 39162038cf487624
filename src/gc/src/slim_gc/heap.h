/*****************************************************************/ /**
 * @file   heap.h
 * @brief  Contains `Heap`, a non-moving mark-sweep collector.
 * Marking is conservative: any word (in the roots, or in a reachable
 * block) whose value is an address inside a block keeps that block
 * alive. Interior addresses are supported, which is what the narrow
 * handles need (they point one word after the start of their block).
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_SLIM_GC_HEAP
#define __HG_SLIM_GC_HEAP

#include <cstddef>
#include <functional>
#include <map>
#include <span>
#include <vector>
#include <slim_gc_export.h>
#include <slim_allocators/allocator.h>
#include <slim_allocators/allocators/mallocator.h>
#include <slim_narrow/collector.h>

namespace slim::gc
{
  /// @brief Garbage collected heap.
  /// The heap does not know about the stack: collections are explicit, and
  /// receive the roots. Blocks are never moved.
  /// This class is not thread safe.
  class Heap
  {
    /// @brief Bookkeeping of a block
    struct BlockInfo
    {
      /// @brief The size requested for the block
      size_t size;
      /// @brief The finalizer to run before freeing (or nullptr)
      narrow::finalizer_fn_t finalizer = nullptr;
      /// @brief Mark bit, only meaningful during a collection
      bool marked = false;
    };

    using block_map_t = std::map<std::byte*, BlockInfo, std::less<>>;

    /// @brief Blocks ordered by address (for interior address lookup)
    block_map_t _blocks;
    /// @brief Sum of the sizes of the live blocks
    size_t _live_bytes = 0;
    /// @brief The allocator of the blocks
    [[no_unique_address]] alloc::MallocatorAligned _allocator{};

    /// @brief Marks the blocks containing `address`, and pushes them on `worklist`
    void mark_address(const void* address, std::vector<block_map_t::iterator>& worklist);

    /// @brief Frees a block (without running its finalizer)
    void free_block(block_map_t::iterator it) noexcept;

  public:
    Heap() noexcept = default;
    Heap(const Heap&)            = delete;
    Heap& operator=(const Heap&) = delete;
    Heap(Heap&&)                 = delete;
    Heap& operator=(Heap&&)      = delete;

    /// @brief Runs the finalizers of all the remaining blocks, and frees them
    SLIM_GC_EXPORT ~Heap();

    /// @brief Allocates a zero-initialized block.
    /// Aborts through `alloc::handle_alloc_fail` on failure.
    /// @param layout The layout of the block
    /// @return The block start (never nullptr)
    SLIM_GC_EXPORT void* allocate(alloc::Layout layout);

    /// @brief Registers the finalizer of a block.
    /// The finalizer is called exactly once, before the block is freed.
    /// @param block The block start
    /// @param finalizer The finalizer
    /// @pre `block` was returned by `allocate` and is still alive
    SLIM_GC_EXPORT void register_finalizer(
        void* block, narrow::finalizer_fn_t finalizer) noexcept;

    /// @brief Collects all the blocks that are not reachable from `roots`.
    /// The finalizers of the unreachable blocks all run before any of
    /// them is freed. Finalizers must not allocate from this heap.
    /// @param roots The root addresses (interior addresses are accepted)
    /// @return The number of reclaimed blocks
    SLIM_GC_EXPORT size_t collect(std::span<const void* const> roots);

    /// @brief Collects every block (no roots)
    /// @return The number of reclaimed blocks
    size_t collect() { return collect(std::span<const void* const>{}); }

    /// @brief Check if an address points inside a live block
    /// @param address The address
    /// @return True if a block contains `address`
    SLIM_GC_EXPORT bool owns(const void* address) const noexcept;

    /// @brief Returns the number of live blocks
    size_t live_blocks() const noexcept { return _blocks.size(); }
    /// @brief Returns the sum of the sizes of the live blocks
    size_t live_bytes() const noexcept { return _live_bytes; }
  };

  static_assert(narrow::IsCollector<Heap>);
} // namespace slim::gc

#endif // !__HG_SLIM_GC_HEAP
