#include <doctest/doctest.h>
#include <slim_contracts/contracts.h>
#include <string_view>

static unsigned violation_counts = 0;
static slim::contracts::Kind last_kind = slim::contracts::Kind::Assert;

static void count_violation(
    const char*, const char*, slim::contracts::Kind kind,
    const std::optional<std::source_location>&) noexcept
{
  ++violation_counts;
  last_kind = kind;
}

TEST_CASE("slim/contracts")
{
  using namespace slim::contracts;

  // rather than aborting, count the violations.
  auto previous = register_violation_handler(&count_violation);
  violation_counts = 0;

  SUBCASE("satisfied contracts do not call the handler")
  {
    SLIM_pre("evaluates to true", "");
    SLIM_post(10, "");
    SLIM_assert(1.0f, "");
    CHECK(violation_counts == 0);
  }

  SUBCASE("violations report their kind")
  {
    SLIM_pre(nullptr, "");
    CHECK(violation_counts == 1);
    CHECK(last_kind == Kind::Pre);

    SLIM_post(false, "");
    CHECK(violation_counts == 2);
    CHECK(last_kind == Kind::Post);

    SLIM_assert(0, "");
    CHECK(violation_counts == 3);
    CHECK(last_kind == Kind::Assert);
  }

  SUBCASE("debug contracts follow SLIM_DEBUG")
  {
    SLIM_debug_pre(false, "");
    SLIM_debug_post(false, "");
    SLIM_debug_assert(false, "");
    if constexpr (are_debug_contracts_enabled())
      CHECK(violation_counts == 3);
    else
      CHECK(violation_counts == 0);
  }

  SUBCASE("kind names")
  {
    CHECK(std::string_view{to_string(Kind::Pre)} == "precondition");
    CHECK(std::string_view{to_string(Kind::Post)} == "postcondition");
    CHECK(std::string_view{to_string(Kind::Assert)} == "assertion");
  }

  CHECK(register_violation_handler(previous) == &count_violation);
}
