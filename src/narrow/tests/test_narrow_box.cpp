#include <doctest/doctest.h>
#include <slim_narrow/interface.h>
#include <cstdint>
#include <stdexcept>
#include <utility>

SLIM_NARROW_DECLARE_INTERFACE(
    test_box, IsShape, Shape, SLIM_NARROW_CONST_METHOD(double, area),
    SLIM_NARROW_METHOD(void, scale, (double, factor)));
SLIM_NARROW_HANDLE(test_box, Shape, ShapeBox);

SLIM_NARROW_DECLARE_INTERFACE(
    test_box, IsMarker, Marker, SLIM_NARROW_CONST_METHOD(int, tag));
SLIM_NARROW_HANDLE(test_box, Marker, MarkerBox);

/// @brief Records the blocks going through `MallocatorAligned`
struct RecordingAllocator
{
  static constexpr slim::alloc::AllocatorInfo allocator_info = {
      .is_thread_safe      = false,
      .is_fallible         = true,
      .is_nothrow_fallible = true,
      .returns_exact_size  = true,
      .alignment           = slim::alloc::PREFERRED_ALIGNMENT,
  };

  static inline slim::alloc::Block last_allocated   = slim::alloc::nullblock;
  static inline slim::alloc::Block last_deallocated = slim::alloc::nullblock;
  static inline unsigned allocations                = 0;
  static inline unsigned deallocations              = 0;

  static void clear() noexcept
  {
    last_allocated   = slim::alloc::nullblock;
    last_deallocated = slim::alloc::nullblock;
    allocations      = 0;
    deallocations    = 0;
  }

  slim::alloc::Block allocate(slim::alloc::Layout request) const noexcept
  {
    auto blk       = slim::alloc::MallocatorAligned{}.allocate(request);
    last_allocated = blk;
    ++allocations;
    return blk;
  }

  void deallocate(slim::alloc::Block blk) const noexcept
  {
    last_deallocated = blk;
    ++deallocations;
    slim::alloc::MallocatorAligned{}.deallocate(blk);
  }
};
static_assert(slim::alloc::IsAllocator<RecordingAllocator>);

namespace test_box
{
  using RecordedShapeBox = slim::narrow::NarrowBox<Shape, RecordingAllocator>;

  struct Circle
  {
    double radius;

    double area() const { return 3.14159265358979323846 * radius * radius; }
    void scale(double factor) { radius *= factor; }
  };

  struct Square
  {
    double side;

    double area() const { return side * side; }
    void scale(double factor) { side *= factor; }
  };

  struct alignas(32) Wide
  {
    double values[4];

    double area() const { return values[0] + values[1] + values[2] + values[3]; }
    void scale(double factor)
    {
      for (auto& value : values)
        value *= factor;
    }
  };

  /// @brief Counts the destructions of the instances that were not moved from
  struct Counted
  {
    static inline unsigned destroyed = 0;

    double value;
    bool live = true;

    explicit Counted(double value) noexcept
        : value(value)
    {
    }
    Counted(Counted&& other) noexcept
        : value(other.value)
        , live(std::exchange(other.live, false))
    {
    }
    ~Counted()
    {
      if (live)
        ++destroyed;
    }

    double area() const { return value; }
    void scale(double factor) { value *= factor; }
  };

  struct Throwing
  {
    explicit Throwing(int) { throw std::runtime_error("constructor failure"); }

    double area() const { return 0.0; }
    void scale(double) {}
  };

  struct Label
  {
    int tag() const { return 1; }
  };
  struct Tag
  {
    int tag() const { return 2; }
  };

  struct EmptyCounted
  {
    static inline unsigned destroyed = 0;
    ~EmptyCounted() { ++destroyed; }
    int tag() const { return 3; }
  };

  struct NotAShape
  {
    int area() const { return 0; }
  };

  /// @brief Same layout and same method body as `Right`
  struct Left
  {
    int tag() const { return 0; }
  };
  struct Right
  {
    int tag() const { return 0; }
  };

  struct DeclaresScale
  {
    int scale;
  };
} // namespace test_box

template<typename H>
concept CanScale = requires(H& handle) { handle->scale(2.0); };

static_assert(test_box::IsShape<test_box::Circle>);
static_assert(!test_box::IsShape<test_box::NotAShape>);
static_assert(!test_box::IsShape<int>);
static_assert(sizeof(test_box::ShapeBox) == sizeof(void*));
static_assert(sizeof(test_box::MarkerBox) == sizeof(void*));
static_assert(sizeof(test_box::RecordedShapeBox) == sizeof(void*));
static_assert(CanScale<test_box::ShapeBox>);
static_assert(!CanScale<const test_box::ShapeBox>);
static_assert(!std::is_copy_constructible_v<test_box::ShapeBox>);
static_assert(std::is_nothrow_move_constructible_v<test_box::ShapeBox>);

// references provide the methods but cannot be stored in a handle
static_assert(test_box::IsShape<test_box::ShapeBox::ref_t>);
static_assert(!slim::narrow::Implements<test_box::ShapeBox::ref_t, test_box::Shape>);
static_assert(!slim::narrow::Implements<test_box::ShapeBox::const_ref_t, test_box::Shape>);
static_assert(!std::is_constructible_v<test_box::ShapeBox, test_box::ShapeBox::ref_t>);
static_assert(
    !std::is_constructible_v<test_box::ShapeBox, test_box::ShapeBox::const_ref_t>);
static_assert(slim::narrow::Implements<test_box::Circle, test_box::Shape>);

// methods named like a member of the references are rejected
static_assert(test_box::Shape::declares_any_of<test_box::DeclaresScale>);
static_assert(!test_box::Shape::declares_any_of<slim::narrow::ReservedMethodNames>);
static_assert(!test_box::Marker::declares_any_of<slim::narrow::ReservedMethodNames>);

TEST_CASE("slim/narrow/box")
{
  using namespace test_box;

  SUBCASE("dispatch and downcast")
  {
    ShapeBox box{Circle{2.0}};
    REQUIRE(box);
    CHECK(box->area() == doctest::Approx(12.566).epsilon(0.001));
    CHECK(box.is<Circle>());
    CHECK_FALSE(box.is<Square>());
    CHECK(box.downcast<Square>() == nullptr);

    Circle* circle = box.downcast<Circle>();
    REQUIRE(circle != nullptr);
    CHECK(circle->radius == 2.0);
    CHECK(static_cast<void*>(circle) == box.address());

    box->scale(0.5);
    CHECK(circle->radius == 1.0);

    const ShapeBox& const_box = box;
    const Circle* const_circle = const_box.downcast<Circle>();
    CHECK(const_circle == circle);
    CHECK(const_box->area() == doctest::Approx(3.14159));
  }

  SUBCASE("descriptor identity")
  {
    ShapeBox a{Circle{1.0}};
    ShapeBox b{Circle{3.0}};
    ShapeBox c{Square{2.0}};
    CHECK(a.descriptor() == b.descriptor());
    CHECK(a.descriptor() != c.descriptor());
    CHECK(a.descriptor() == slim::narrow::descriptor_for<Shape, Circle>());
    CHECK(c->area() == 4.0);

    // the descriptor is the word preceding the object
    auto slot = static_cast<const void* const*>(a.address()) - 1;
    CHECK(*slot == static_cast<const void*>(a.descriptor()));
  }

  SUBCASE("descriptor records the dynamic layout")
  {
    ShapeBox box{Wide{{1.0, 2.0, 3.0, 4.0}}};
    CHECK(box.descriptor()->size == sizeof(Wide));
    CHECK(box.descriptor()->align == alignof(Wide));
    CHECK(box.descriptor()->layout() == slim::alloc::Layout::of<Wide>());
    CHECK(reinterpret_cast<std::uintptr_t>(box.address()) % 32 == 0);
    CHECK(box->area() == 10.0);
  }

  SUBCASE("widened references")
  {
    ShapeBox box{Square{3.0}};
    ShapeBox::ref_t ref = box.widen();
    ref.scale(2.0);
    ShapeBox::const_ref_t const_ref = ref;
    CHECK(const_ref.area() == 36.0);
    CHECK(const_ref.address() == box.address());
    CHECK(const_ref.descriptor() == box.descriptor());
    CHECK(const_ref.downcast<Square>()->side == 6.0);
    CHECK(const_ref.downcast<Circle>() == nullptr);
    static_assert(!CanScale<slim::narrow::ArrowProxy<ShapeBox::const_ref_t>>);
  }

  SUBCASE("zero sized types")
  {
    MarkerBox label{Label{}};
    CHECK(label->tag() == 1);
    CHECK(label.downcast<Label>() != nullptr);
    CHECK(label.downcast<Tag>() == nullptr);
    CHECK(label.descriptor()->size == sizeof(Label));

    MarkerBox tag{Tag{}};
    CHECK(tag->tag() == 2);
    CHECK(tag.descriptor() != label.descriptor());
  }

  SUBCASE("types with identical implementations have distinct descriptors")
  {
    MarkerBox left{Left{}};
    MarkerBox right{Right{}};
    CHECK(left.descriptor() != right.descriptor());
    CHECK(left.is<Left>());
    CHECK_FALSE(left.is<Right>());
    CHECK(right.downcast<Left>() == nullptr);
    CHECK(right.downcast<Right>() != nullptr);
  }

  SUBCASE("destruction happens exactly once")
  {
    Counted::destroyed = 0;
    {
      ShapeBox box{Counted{1.0}};
      CHECK(Counted::destroyed == 0);
      ShapeBox moved = std::move(box);
      CHECK_FALSE(box);
      CHECK(moved->area() == 1.0);
      CHECK(Counted::destroyed == 0);
    }
    CHECK(Counted::destroyed == 1);

    EmptyCounted::destroyed = 0;
    {
      MarkerBox box{std::in_place_type<EmptyCounted>};
      CHECK(box->tag() == 3);
    }
    CHECK(EmptyCounted::destroyed == 1);
  }

  SUBCASE("move assignment destroys the previous object")
  {
    Counted::destroyed = 0;
    ShapeBox a{std::in_place_type<Counted>, 1.0};
    ShapeBox b{std::in_place_type<Counted>, 2.0};
    a = std::move(b);
    CHECK(Counted::destroyed == 1);
    CHECK(a->area() == 2.0);
    CHECK_FALSE(b);
    a.reset();
    CHECK(Counted::destroyed == 2);
    CHECK_FALSE(a);
    a.reset();
    CHECK(Counted::destroyed == 2);
  }

  SUBCASE("swap")
  {
    ShapeBox a{Circle{1.0}};
    ShapeBox b{Square{1.0}};
    swap(a, b);
    CHECK(a.is<Square>());
    CHECK(b.is<Circle>());
  }

  SUBCASE("release and from_raw")
  {
    Counted::destroyed = 0;
    ShapeBox box{std::in_place_type<Counted>, 5.0};
    void* raw = box.release();
    CHECK_FALSE(box);
    CHECK(Counted::destroyed == 0);
    {
      auto adopted = ShapeBox::from_raw(raw);
      CHECK(adopted.address() == raw);
      CHECK(adopted->area() == 5.0);
    }
    CHECK(Counted::destroyed == 1);
  }

  SUBCASE("over-aligned payload is freed with the block it was allocated with")
  {
    RecordingAllocator::clear();
    {
      RecordedShapeBox box{Wide{{1.0, 1.0, 1.0, 1.0}}};
      REQUIRE(RecordingAllocator::allocations == 1);
      const auto allocated = RecordingAllocator::last_allocated;
      CHECK(allocated.size() == 64);
      CHECK(reinterpret_cast<std::uintptr_t>(allocated.ptr()) % 32 == 0);
      CHECK(static_cast<std::byte*>(box.address()) == allocated.bytes() + 32);
      CHECK(box->area() == 4.0);
    }
    CHECK(RecordingAllocator::deallocations == 1);
    CHECK(RecordingAllocator::last_deallocated == RecordingAllocator::last_allocated);
  }

  SUBCASE("a throwing constructor frees the block")
  {
    RecordingAllocator::clear();
    CHECK_THROWS_AS(
        RecordedShapeBox(std::in_place_type<Throwing>, 1), std::runtime_error);
    CHECK(RecordingAllocator::allocations == 1);
    CHECK(RecordingAllocator::deallocations == 1);
    CHECK(RecordingAllocator::last_deallocated == RecordingAllocator::last_allocated);
  }
}
