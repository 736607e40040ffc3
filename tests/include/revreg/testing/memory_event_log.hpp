#pragma once

#include <revreg/registry/collaborators.hpp>
#include <revreg/schema/entry_created_event.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace revreg::testing {

/// In-memory notification log that links entries the way the registry does.
struct memory_event_log final {
  std::map<revreg::schema::hash32_t, revreg::schema::position_t> tails;
  std::vector<revreg::schema::entry_created_event_t> events;
  bool available{true};
  // Positions whose notifications are silently missing from query results.
  std::set<revreg::schema::position_t> dropped_positions;
  // Positions whose queries fail.
  std::set<revreg::schema::position_t> failing_positions;
  uint64_t next_log_index{1};

  void create_definition(const revreg::schema::hash32_t& definition_id) {
    tails[definition_id] = revreg::schema::kNoPosition;
  }

  void append(
      const revreg::schema::hash32_t& definition_id,
      const revreg::schema::position_t position,
      const revreg::schema::timestamp_seconds_t created_at,
      std::vector<uint32_t> issued,
      std::vector<uint32_t> revoked,
      const uint8_t accumulator) {
    auto event = revreg::schema::entry_created_event_t{};
    event.definition_id = definition_id;
    event.created_at = created_at;
    event.previous_position = tails[definition_id];
    event.entry.definition_id = definition_id;
    event.entry.issuer_id = "did:example:issuer";
    event.entry.data.current_accumulator = revreg::schema::bytes_t{accumulator};
    event.entry.data.issued = std::move(issued);
    event.entry.data.revoked = std::move(revoked);
    event.position = position;
    event.log_index = next_log_index++;
    tails[definition_id] = position;
    events.push_back(std::move(event));
  }

  revreg::registry::tail_resolver_t make_tail_resolver() const {
    return [this](const revreg::schema::hash32_t& definition_id)
               -> std::optional<revreg::schema::position_t> {
      auto it = tails.find(definition_id);
      if (it == std::end(tails)) {
        return std::nullopt;
      }
      return it->second;
    };
  }

  revreg::registry::event_source_t make_event_source() const {
    return [this](const revreg::schema::hash32_t& definition_id,
                  const revreg::schema::position_t from,
                  const revreg::schema::position_t to)
               -> std::optional<
                   std::vector<revreg::schema::entry_created_event_t>> {
      if (!available) {
        return std::nullopt;
      }
      auto failing = failing_positions.lower_bound(from);
      if (failing != std::end(failing_positions) && *failing <= to) {
        return std::nullopt;
      }
      auto matched = std::vector<revreg::schema::entry_created_event_t>{};
      for (const auto& event : events) {
        if (event.definition_id == definition_id && event.position >= from &&
            event.position <= to &&
            !dropped_positions.contains(event.position)) {
          matched.push_back(event);
        }
      }
      return matched;
    };
  }
};

}  // namespace revreg::testing
