#include <revreg/registry/result.hpp>
#include <revreg/registry/status_list_resolver.hpp>
#include <revreg/testing/common.hpp>
#include <revreg/testing/memory_event_log.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <vector>

namespace {

using revreg::schema::registry_error_code;
using revreg::schema::to_code;

revreg::schema::revocation_registry_definition_t make_definition(
    const revreg::schema::hash32_t& id) {
  auto definition = revreg::schema::revocation_registry_definition_t{};
  definition.id = id;
  definition.issuer_id = "did:example:issuer";
  definition.created_at = 1;
  return definition;
}

struct status_fixture_t final {
  revreg::schema::hash32_t id = revreg::testing::make_hash(1);
  revreg::testing::memory_event_log log;
  revreg::registry::history_reconstructor history{log.make_tail_resolver(),
                                                  log.make_event_source()};
  revreg::registry::status_list_resolver resolver{
      [this](const revreg::schema::hash32_t& definition_id) {
        if (definition_id != id) {
          return revreg::registry::make_read_error<
              revreg::schema::revocation_registry_definition_t>(
              registry_error_code::not_found, "revreg.resolve_definition",
              "revocation registry definition not found", "");
        }
        return revreg::registry::make_read_ok(make_definition(id));
      },
      history};

  status_fixture_t() { log.create_definition(id); }

  std::vector<uint32_t> revoked_at(
      const revreg::schema::timestamp_seconds_t timestamp) const {
    auto result = resolver.resolve_at(id, timestamp);
    EXPECT_TRUE(result.ok()) << result.log;
    if (!result.ok()) {
      return {};
    }
    return result.value->revoked;
  }
};

}  // namespace

TEST(status_list_resolver, empty_history_yields_empty_list) {
  auto fixture = status_fixture_t{};
  auto result = fixture.resolver.resolve_at(fixture.id, 1000);
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.value->revoked.empty());
  EXPECT_FALSE(result.value->current_accumulator.has_value());
  EXPECT_EQ(result.value->issuer_id, "did:example:issuer");
  EXPECT_EQ(result.value->definition_id, fixture.id);
}

TEST(status_list_resolver, revocations_and_reissues_fold_in_order) {
  auto fixture = status_fixture_t{};
  fixture.log.append(fixture.id, 10, 100, {}, {2, 3}, 0x01);
  fixture.log.append(fixture.id, 20, 200, {2}, {11, 12, 13}, 0x02);

  EXPECT_TRUE(fixture.revoked_at(99).empty());
  EXPECT_EQ(fixture.revoked_at(100), (std::vector<uint32_t>{2, 3}));
  EXPECT_EQ(fixture.revoked_at(199), (std::vector<uint32_t>{2, 3}));
  EXPECT_EQ(fixture.revoked_at(200), (std::vector<uint32_t>{3, 11, 12, 13}));

  auto result = fixture.resolver.resolve_at(fixture.id, 500);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value->timestamp, 200u);
  EXPECT_EQ(result.value->current_accumulator,
            (revreg::schema::bytes_t{0x02}));
}

TEST(status_list_resolver, equal_timestamps_apply_in_chain_order) {
  auto fixture = status_fixture_t{};
  fixture.log.append(fixture.id, 10, 100, {}, {5}, 0x01);
  fixture.log.append(fixture.id, 11, 100, {5}, {}, 0x02);

  EXPECT_TRUE(fixture.revoked_at(100).empty());
  auto result = fixture.resolver.resolve_at(fixture.id, 100);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value->current_accumulator,
            (revreg::schema::bytes_t{0x02}));
}

TEST(status_list_resolver, later_timestamps_are_skipped_not_terminal) {
  auto fixture = status_fixture_t{};
  fixture.log.append(fixture.id, 10, 300, {}, {1}, 0x01);
  fixture.log.append(fixture.id, 20, 200, {}, {2}, 0x02);

  EXPECT_EQ(fixture.revoked_at(250), (std::vector<uint32_t>{2}));
  EXPECT_EQ(fixture.revoked_at(300), (std::vector<uint32_t>{1, 2}));
}

TEST(status_list_resolver, revoked_set_grows_only_through_revocations) {
  auto fixture = status_fixture_t{};
  fixture.log.append(fixture.id, 1, 10, {}, {1, 2}, 0x01);
  fixture.log.append(fixture.id, 2, 20, {}, {3}, 0x02);
  fixture.log.append(fixture.id, 3, 30, {}, {2, 4}, 0x03);

  auto previous = std::vector<uint32_t>{};
  for (auto timestamp : {10u, 20u, 30u}) {
    auto current = fixture.revoked_at(timestamp);
    for (auto index : previous) {
      EXPECT_TRUE(std::binary_search(std::begin(current), std::end(current),
                                     index));
    }
    previous = current;
  }
  EXPECT_EQ(previous, (std::vector<uint32_t>{1, 2, 3, 4}));
}

TEST(status_list_resolver, unknown_definition_is_not_found) {
  auto fixture = status_fixture_t{};
  auto result =
      fixture.resolver.resolve_at(revreg::testing::make_hash(9), 1000);
  EXPECT_EQ(result.code, to_code(registry_error_code::not_found));
  EXPECT_EQ(result.codespace, revreg::registry::kResolveStatusListCodespace);
}

TEST(status_list_resolver, unavailable_history_is_reported) {
  auto fixture = status_fixture_t{};
  fixture.log.append(fixture.id, 10, 100, {}, {1}, 0x01);
  fixture.log.available = false;
  auto result = fixture.resolver.resolve_at(fixture.id, 1000);
  EXPECT_EQ(result.code,
            to_code(registry_error_code::history_source_unavailable));
}

TEST(status_list_resolver, failure_mid_walk_yields_no_status_list) {
  auto fixture = status_fixture_t{};
  fixture.log.append(fixture.id, 10, 100, {}, {1}, 0x01);
  fixture.log.append(fixture.id, 20, 200, {}, {2}, 0x02);
  fixture.log.append(fixture.id, 30, 300, {}, {3}, 0x03);
  fixture.log.failing_positions.insert(20);

  auto result = fixture.resolver.resolve_at(fixture.id, 1000);
  EXPECT_EQ(result.code,
            to_code(registry_error_code::history_source_unavailable));
  EXPECT_EQ(result.codespace, revreg::registry::kResolveStatusListCodespace);
  EXPECT_FALSE(result.value.has_value());
}

TEST(status_list_resolver, later_fold_over_earlier_prefix_matches_earlier_read) {
  auto fixture = status_fixture_t{};
  fixture.log.append(fixture.id, 10, 100, {}, {1, 2}, 0x01);
  fixture.log.append(fixture.id, 20, 400, {}, {3}, 0x02);
  fixture.log.append(fixture.id, 30, 250, {1}, {4}, 0x03);
  fixture.log.append(fixture.id, 40, 500, {}, {5}, 0x04);

  auto history = fixture.history.reconstruct(fixture.id);
  ASSERT_TRUE(history.ok());
  auto definition = make_definition(fixture.id);

  for (auto earlier : {100u, 250u, 300u, 400u}) {
    auto expected = fixture.resolver.resolve_at(fixture.id, earlier);
    ASSERT_TRUE(expected.ok());

    auto prefix = std::vector<revreg::schema::entry_created_event_t>{};
    std::copy_if(std::begin(*history.value), std::end(*history.value),
                 std::back_inserter(prefix), [earlier](const auto& event) {
                   return event.created_at <= earlier;
                 });

    for (auto later : {earlier, earlier + 50u, 1000u}) {
      auto folded =
          revreg::registry::fold_status_list(definition, prefix, later);
      EXPECT_EQ(folded.revoked, expected.value->revoked)
          << "earlier=" << earlier << " later=" << later;
      EXPECT_EQ(folded.current_accumulator,
                expected.value->current_accumulator);
      EXPECT_EQ(folded.timestamp, expected.value->timestamp);
    }
  }
}
