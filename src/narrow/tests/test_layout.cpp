#include <doctest/doctest.h>
#include <slim_narrow/layout.h>
#include <utility>

using namespace slim::narrow;
using slim::alloc::Layout;

template<size_t ALIGN>
static constexpr bool check_combined_for()
{
  constexpr auto combined = combine_with_descriptor(Layout{ALIGN * 3, ALIGN});
  return (combined.object_offset - WORD_SIZE) % WORD_ALIGN == 0
         && combined.object_offset % ALIGN == 0
         && combined.object_offset >= WORD_SIZE
         && combined.layout.size() == combined.object_offset + ALIGN * 3
         && combined.layout.align() == (ALIGN > WORD_ALIGN ? ALIGN : WORD_ALIGN);
}

template<size_t... ALIGNS>
static constexpr bool check_all_alignments(std::index_sequence<ALIGNS...>)
{
  return (check_combined_for<(size_t(1) << ALIGNS)>() && ...);
}

// 1 to 4096
static_assert(check_all_alignments(std::make_index_sequence<13>{}));

static unsigned violation_counts = 0;

static void count_violation(
    const char*, const char*, slim::contracts::Kind,
    const std::optional<std::source_location>&) noexcept
{
  ++violation_counts;
}

TEST_CASE("slim/narrow/layout")
{
  SUBCASE("descriptor slot is one word")
  {
    CHECK(WORD_SIZE == sizeof(void*));
    CHECK(WORD_ALIGN == alignof(void*));
  }

  SUBCASE("word aligned objects directly follow the descriptor")
  {
    for (size_t align = 1; align <= WORD_ALIGN; align *= 2)
    {
      const auto combined = combine_with_descriptor(Layout{24, align});
      CHECK(combined.object_offset == WORD_SIZE);
      CHECK(combined.descriptor_offset() == 0);
      CHECK(combined.layout.size() == WORD_SIZE + 24);
      CHECK(combined.layout.align() == WORD_ALIGN);
    }
  }

  SUBCASE("over-aligned objects are placed at their alignment")
  {
    for (size_t align = WORD_ALIGN * 2; align <= 4096; align *= 2)
    {
      const auto combined = combine_with_descriptor(Layout{align, align});
      CHECK(combined.object_offset == align);
      CHECK(combined.descriptor_offset() == align - WORD_SIZE);
      CHECK(combined.layout.size() == 2 * align);
      CHECK(combined.layout.align() == align);
      CHECK((combined.object_offset - WORD_SIZE) % WORD_ALIGN == 0);
    }
  }

  SUBCASE("32 bytes over-aligned payload")
  {
    struct alignas(32) Payload
    {
      char data[32];
    };
    constexpr auto combined = combined_layout_of<Payload>;
    static_assert(combined.object_offset == 32);
    static_assert(combined.layout.size() == 64);
    static_assert(combined.layout.align() == 32);
  }

  SUBCASE("zero sized object")
  {
    const auto combined = combine_with_descriptor(Layout{0, 1});
    CHECK(combined.object_offset == WORD_SIZE);
    CHECK(combined.layout.size() == WORD_SIZE);
    CHECK(combined.layout.align() == WORD_ALIGN);
  }

  SUBCASE("word aligned combiner")
  {
    const auto combined = combine_with_descriptor_word_aligned(Layout{13, 1});
    CHECK(combined.object_offset == WORD_SIZE);
    CHECK(combined.layout.size() == WORD_SIZE + 13);
    CHECK(combined == combine_with_descriptor(Layout{13, 1}));
  }

  SUBCASE("word aligned combiner rejects over-aligned objects")
  {
    auto previous    = slim::contracts::register_violation_handler(&count_violation);
    violation_counts = 0;

    (void)combine_with_descriptor_word_aligned(Layout{16, WORD_ALIGN * 2});
    if constexpr (slim::contracts::are_debug_contracts_enabled())
      CHECK(violation_counts >= 1);
    else
      CHECK(violation_counts == 0);

    slim::contracts::register_violation_handler(previous);
  }
}
