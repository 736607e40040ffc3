#include <revreg/registry/history_reconstructor.hpp>
#include <revreg/schema/registry_error_code.hpp>
#include <revreg/testing/common.hpp>
#include <revreg/testing/memory_event_log.hpp>
#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

namespace {

using revreg::schema::registry_error_code;
using revreg::schema::to_code;

revreg::registry::history_reconstructor make_reconstructor(
    const revreg::testing::memory_event_log& log) {
  return revreg::registry::history_reconstructor{log.make_tail_resolver(),
                                                 log.make_event_source()};
}

std::vector<std::pair<uint64_t, uint64_t>> coordinates(
    const std::vector<revreg::schema::entry_created_event_t>& events) {
  auto out = std::vector<std::pair<uint64_t, uint64_t>>{};
  for (const auto& event : events) {
    out.emplace_back(event.position, event.log_index);
  }
  return out;
}

}  // namespace

TEST(history_reconstructor, unknown_definition_is_not_found) {
  auto log = revreg::testing::memory_event_log{};
  auto result = make_reconstructor(log).reconstruct(
      revreg::testing::make_hash(1));
  EXPECT_EQ(result.code, to_code(registry_error_code::not_found));
  EXPECT_EQ(result.codespace, revreg::registry::kReconstructHistoryCodespace);
  EXPECT_FALSE(result.value.has_value());
}

TEST(history_reconstructor, definition_without_entries_is_empty) {
  auto log = revreg::testing::memory_event_log{};
  auto id = revreg::testing::make_hash(1);
  log.create_definition(id);
  auto result = make_reconstructor(log).reconstruct(id);
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.value->empty());
}

TEST(history_reconstructor, chain_is_returned_oldest_first) {
  auto log = revreg::testing::memory_event_log{};
  auto id = revreg::testing::make_hash(1);
  log.create_definition(id);
  log.append(id, 10, 100, {}, {2, 3}, 0x01);
  log.append(id, 15, 150, {}, {4}, 0x02);
  log.append(id, 30, 300, {3}, {11}, 0x03);

  auto result = make_reconstructor(log).reconstruct(id);
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.value->size(), 3u);
  EXPECT_EQ((*result.value)[0].position, 10u);
  EXPECT_EQ((*result.value)[0].previous_position, revreg::schema::kNoPosition);
  EXPECT_EQ((*result.value)[1].previous_position, 10u);
  EXPECT_EQ((*result.value)[2].position, 30u);
  EXPECT_EQ((*result.value)[2].previous_position, 15u);
}

TEST(history_reconstructor, entries_in_one_block_are_all_recovered) {
  auto log = revreg::testing::memory_event_log{};
  auto id = revreg::testing::make_hash(1);
  log.create_definition(id);
  log.append(id, 5, 50, {}, {1}, 0x01);
  log.append(id, 8, 80, {}, {2}, 0x02);
  log.append(id, 8, 80, {}, {3}, 0x03);
  log.append(id, 8, 80, {}, {4}, 0x04);

  auto result = make_reconstructor(log).reconstruct(id);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(coordinates(*result.value),
            (std::vector<std::pair<uint64_t, uint64_t>>{
                {5, 1}, {8, 2}, {8, 3}, {8, 4}}));
}

TEST(history_reconstructor, other_definitions_are_ignored) {
  auto log = revreg::testing::memory_event_log{};
  auto first = revreg::testing::make_hash(1);
  auto second = revreg::testing::make_hash(2);
  log.create_definition(first);
  log.create_definition(second);
  log.append(first, 3, 30, {}, {1}, 0x01);
  log.append(second, 3, 30, {}, {2}, 0x02);
  log.append(second, 4, 40, {}, {3}, 0x03);
  log.append(first, 6, 60, {}, {4}, 0x04);

  auto result = make_reconstructor(log).reconstruct(first);
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.value->size(), 2u);
  for (const auto& event : *result.value) {
    EXPECT_EQ(event.definition_id, first);
  }
}

TEST(history_reconstructor, unavailable_source_is_reported) {
  auto log = revreg::testing::memory_event_log{};
  auto id = revreg::testing::make_hash(1);
  log.create_definition(id);
  log.append(id, 2, 20, {}, {1}, 0x01);
  log.available = false;

  auto result = make_reconstructor(log).reconstruct(id);
  EXPECT_EQ(result.code,
            to_code(registry_error_code::history_source_unavailable));
  EXPECT_FALSE(result.value.has_value());
}

TEST(history_reconstructor, repeated_reads_agree) {
  auto log = revreg::testing::memory_event_log{};
  auto id = revreg::testing::make_hash(1);
  log.create_definition(id);
  log.append(id, 2, 20, {}, {1}, 0x01);
  log.append(id, 9, 90, {1}, {}, 0x02);

  auto reconstructor = make_reconstructor(log);
  auto first = reconstructor.reconstruct(id);
  auto second = reconstructor.reconstruct(id);
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(coordinates(*first.value), coordinates(*second.value));
}

TEST(history_reconstructor, missing_linked_notification_fails) {
  auto log = revreg::testing::memory_event_log{};
  auto id = revreg::testing::make_hash(1);
  log.create_definition(id);
  log.append(id, 10, 100, {}, {1}, 0x01);
  log.append(id, 20, 200, {}, {2}, 0x02);
  log.append(id, 30, 300, {}, {3}, 0x03);
  log.dropped_positions.insert(20);

  auto result = make_reconstructor(log).reconstruct(id);
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.code,
            to_code(registry_error_code::history_source_unavailable));
  EXPECT_EQ(result.codespace, revreg::registry::kReconstructHistoryCodespace);
  EXPECT_NE(result.info.find("position=20"), std::string::npos);
  EXPECT_FALSE(result.value.has_value());
}

TEST(history_reconstructor, failure_after_tail_returns_no_partial_chain) {
  auto log = revreg::testing::memory_event_log{};
  auto id = revreg::testing::make_hash(1);
  log.create_definition(id);
  log.append(id, 10, 100, {}, {1}, 0x01);
  log.append(id, 20, 200, {}, {2}, 0x02);
  log.append(id, 30, 300, {}, {3}, 0x03);
  log.failing_positions.insert(10);

  auto result = make_reconstructor(log).reconstruct(id);
  EXPECT_EQ(result.code,
            to_code(registry_error_code::history_source_unavailable));
  EXPECT_NE(result.info.find("position=10"), std::string::npos);
  EXPECT_FALSE(result.value.has_value());
}

TEST(history_reconstructor, chain_without_first_entry_fails) {
  auto log = revreg::testing::memory_event_log{};
  auto id = revreg::testing::make_hash(1);
  log.create_definition(id);
  log.append(id, 10, 100, {}, {1}, 0x01);
  log.append(id, 20, 200, {}, {2}, 0x02);
  // Point the first entry at a block that holds the second one.
  log.events.front().previous_position = 20;

  auto result = make_reconstructor(log).reconstruct(id);
  EXPECT_EQ(result.code,
            to_code(registry_error_code::history_source_unavailable));
  EXPECT_FALSE(result.value.has_value());
}
