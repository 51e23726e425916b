#include <doctest/doctest.h>

#include "c3rt/engine/plan_builder.hpp"
#include "c3rt/engine/types.hpp"

#include <vector>

namespace {

using c3rt::engine::bundle;
using c3rt::engine::error_code;
using c3rt::engine::patch_options;
using c3rt::engine::plan_builder;
using c3rt::engine::reconcile_outcome;

std::vector<bundle> make_bundles() {
  return {
      bundle{16, 116, 1},
      bundle{200, 280, 1},
      bundle{300, 420, 2},
  };
}

} // namespace

TEST_CASE("plan builder records exact fits and padding") {
  auto bundles = make_bundles();
  plan_builder builder(bundles, patch_options{});

  auto plan = builder.build({0, 1}, 80);
  REQUIRE(plan.ok());
  REQUIRE(plan.value.entries.size() == 2);
  CHECK(plan.value.bundle_count == 3);
  CHECK(plan.value.replacement_size == 80);
  CHECK_FALSE(plan.value.strict);
  CHECK(plan.value.accepted());

  const auto& padded = plan.value.entries[0];
  CHECK(padded.plan_index == 0);
  CHECK(padded.bundle_index == 0);
  CHECK(padded.outcome == reconcile_outcome::padded);
  CHECK(padded.padding() == 20);

  const auto& exact = plan.value.entries[1];
  CHECK(exact.plan_index == 1);
  CHECK(exact.bundle_index == 1);
  CHECK(exact.outcome == reconcile_outcome::exact_fit);
  CHECK(exact.padding() == 0);
}

TEST_CASE("plan builder follows target order") {
  auto bundles = make_bundles();
  plan_builder builder(bundles, patch_options{});

  auto plan = builder.build({2, 0}, 50);
  REQUIRE(plan.ok());
  REQUIRE(plan.value.entries.size() == 2);
  CHECK(plan.value.entries[0].plan_index == 0);
  CHECK(plan.value.entries[0].bundle_index == 2);
  CHECK(plan.value.entries[0].target.start == 300);
  CHECK(plan.value.entries[1].plan_index == 1);
  CHECK(plan.value.entries[1].bundle_index == 0);
  CHECK(plan.value.entries[1].target.start == 16);
}

TEST_CASE("plan builder rejects oversize replacements in both modes") {
  auto bundles = make_bundles();

  for (bool strict : {false, true}) {
    CAPTURE(strict);
    plan_builder builder(bundles, patch_options{strict});

    auto plan = builder.build({2, 0}, 120);
    REQUIRE(plan.ok());
    CHECK_FALSE(plan.value.accepted());
    CHECK(plan.value.entries[0].outcome == reconcile_outcome::exact_fit);

    const auto& rejected = plan.value.entries[1];
    CHECK(rejected.outcome == reconcile_outcome::rejected);
    CHECK(rejected.rejection.code == error_code::oversize_replacement);
    CHECK(*rejected.rejection.context.plan_index == 1);
    CHECK(*rejected.rejection.context.offset == 16);
    CHECK(*rejected.rejection.context.original_size == 100);
    CHECK(*rejected.rejection.context.replacement_size == 120);
  }
}

TEST_CASE("plan builder rejects undersize replacements in strict mode") {
  auto bundles = make_bundles();
  plan_builder builder(bundles, patch_options{true});

  auto plan = builder.build({0}, 80);
  REQUIRE(plan.ok());
  CHECK(plan.value.strict);
  REQUIRE(plan.value.entries.size() == 1);
  CHECK(plan.value.entries[0].outcome == reconcile_outcome::rejected);
  CHECK(plan.value.entries[0].rejection.code == error_code::undersize_replacement);
  CHECK(*plan.value.entries[0].rejection.context.original_size == 100);
  CHECK(*plan.value.entries[0].rejection.context.replacement_size == 80);
  CHECK(plan.value.entries[0].padding() == 0);
}

TEST_CASE("plan builder fails on targets outside the scan") {
  auto bundles = make_bundles();
  plan_builder builder(bundles, patch_options{});

  auto plan = builder.build({1, 3}, 80);
  CHECK_FALSE(plan.ok());
  CHECK(plan.status.code == error_code::invalid_argument);
  CHECK(plan.value.entries.empty());
}
