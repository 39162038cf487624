/*****************************************************************/ /**
 * @file   heap.cpp
 * @brief  Contains the implementation of `heap.h`.
 *
 * @date   October 2026
 *********************************************************************/
#include <slim_gc/heap.h>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <utility>
#include <slim_macros/compiler.h>
#include <slim_contracts/contracts.h>
#include <slim_tracing/tracing.h>

namespace slim::gc
{
  namespace
  {
    /// @brief Check if `address` is in [start, start + size].
    /// The end is included: a zero sized object lives there.
    bool block_contains(
        const std::byte* start, size_t size, const std::byte* address) noexcept
    {
      const auto begin = reinterpret_cast<std::uintptr_t>(start);
      const auto addr  = reinterpret_cast<std::uintptr_t>(address);
      return begin <= addr && addr - begin <= size;
    }

    /// @brief Calls `fn` on each block containing `address` (at most 2:
    /// the block starting at `address`, and the one ending there).
    template<typename MAP, typename FN>
    void for_each_containing(MAP& blocks, const void* address, FN&& fn)
    {
      const auto bytes = static_cast<const std::byte*>(address);
      auto it          = blocks.upper_bound(bytes);
      if (it == blocks.begin())
        return;
      --it;
      if (block_contains(it->first, it->second.size, bytes))
        fn(it);
      if (it->first == bytes && it != blocks.begin())
      {
        auto before = std::prev(it);
        if (block_contains(before->first, before->second.size, bytes))
          fn(before);
      }
    }
  } // namespace

  Heap::~Heap()
  {
    SLIM_TRACE_FN();
    for (auto& [start, info] : _blocks)
    {
      if (auto finalizer = std::exchange(info.finalizer, nullptr))
        finalizer(start);
    }
    while (!_blocks.empty())
      free_block(_blocks.begin());
  }

  void* Heap::allocate(alloc::Layout layout)
  {
    SLIM_TRACE_FN();
    alloc::Block blk = _allocator.allocate(layout);
    if (SLIM_UNLIKELY(blk.ptr() == nullptr))
      alloc::handle_alloc_fail(layout);
    // blocks are scanned word by word when marking
    std::memset(blk.ptr(), 0, layout.size());

    try
    {
      _blocks.emplace(blk.bytes(), BlockInfo{layout.size()});
    }
    catch (...)
    {
      _allocator.deallocate(blk);
      throw;
    }
    _live_bytes += layout.size();
    SLIM_TRACE_ALLOC(blk.ptr(), layout.size());
    SLIM_TRACE_PLOT("slim::gc live bytes", _live_bytes);
    return blk.ptr();
  }

  void Heap::register_finalizer(void* block, narrow::finalizer_fn_t finalizer) noexcept
  {
    auto it = _blocks.find(static_cast<std::byte*>(block));
    SLIM_pre(it != _blocks.end(), "address is not the start of a block of this heap");
    if (it == _blocks.end())
      return;
    SLIM_debug_pre(it->second.finalizer == nullptr, "finalizer already registered");
    it->second.finalizer = finalizer;
  }

  void Heap::mark_address(
      const void* address, std::vector<block_map_t::iterator>& worklist)
  {
    for_each_containing(
        _blocks, address,
        [&](block_map_t::iterator it)
        {
          if (it->second.marked)
            return;
          it->second.marked = true;
          worklist.push_back(it);
        });
  }

  void Heap::free_block(block_map_t::iterator it) noexcept
  {
    SLIM_debug_pre(it->second.finalizer == nullptr, "finalizer was not run");
    _live_bytes -= it->second.size;
    SLIM_TRACE_FREE(it->first);
    _allocator.deallocate(alloc::Block{it->first, it->second.size});
    _blocks.erase(it);
  }

  size_t Heap::collect(std::span<const void* const> roots)
  {
    SLIM_TRACE_FN();
    for (auto& [start, info] : _blocks)
      info.marked = false;

    std::vector<block_map_t::iterator> worklist;
    {
      SLIM_TRACE_BLOCK("mark");
      for (const void* root : roots)
      {
        if (root != nullptr)
          mark_address(root, worklist);
      }
      while (!worklist.empty())
      {
        auto it = worklist.back();
        worklist.pop_back();
        for (size_t offset = 0; offset + sizeof(void*) <= it->second.size;
             offset += sizeof(void*))
        {
          const void* word;
          std::memcpy(&word, it->first + offset, sizeof(word));
          if (word != nullptr)
            mark_address(word, worklist);
        }
      }
    }

    std::vector<block_map_t::iterator> garbage;
    for (auto it = _blocks.begin(); it != _blocks.end(); ++it)
    {
      if (!it->second.marked)
        garbage.push_back(it);
    }

    {
      SLIM_TRACE_BLOCK("sweep");
      for (auto it : garbage)
      {
        if (auto finalizer = std::exchange(it->second.finalizer, nullptr))
          finalizer(it->first);
      }
      for (auto it : garbage)
        free_block(it);
    }
    SLIM_TRACE_PLOT("slim::gc live bytes", _live_bytes);
    return garbage.size();
  }

  bool Heap::owns(const void* address) const noexcept
  {
    bool found = false;
    for_each_containing(
        _blocks, address, [&](block_map_t::const_iterator) { found = true; });
    return found;
  }
} // namespace slim::gc
