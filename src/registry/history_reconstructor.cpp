#include <revreg/registry/history_reconstructor.hpp>
#include <revreg/registry/result.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <map>
#include <set>
#include <utility>

using namespace revreg::schema;

namespace revreg::registry {

history_reconstructor::history_reconstructor(tail_resolver_t tails,
                                             event_source_t events)
    : tails_{std::move(tails)}, events_{std::move(events)} {}

read_result<std::vector<entry_created_event_t>>
history_reconstructor::reconstruct(const hash32_t& definition_id) const {
  using events_t = std::vector<entry_created_event_t>;
  auto id_hex = to_hex(definition_id);

  auto tail = tails_(definition_id);
  if (!tail) {
    return make_read_error<events_t>(
        registry_error_code::not_found, kReconstructHistoryCodespace,
        "revocation registry definition not found",
        fmt::format("id={}", id_hex));
  }
  if (*tail == kNoPosition) {
    return make_read_ok(events_t{});
  }

  auto found = std::map<std::pair<position_t, uint64_t>, entry_created_event_t>{};
  auto visited = std::set<position_t>{};
  auto pending = std::vector<position_t>{*tail};
  auto roots = size_t{0};

  while (!pending.empty()) {
    auto position = pending.back();
    pending.pop_back();
    if (!visited.insert(position).second) {
      continue;
    }

    auto batch = events_(definition_id, position, position);
    if (!batch) {
      spdlog::warn("Event source unavailable while reconstructing {} at {}",
                   id_hex, position);
      return make_read_error<events_t>(
          registry_error_code::history_source_unavailable,
          kReconstructHistoryCodespace, "event source unavailable",
          fmt::format("id={} position={}", id_hex, position));
    }

    auto linked = size_t{0};
    for (auto& event : *batch) {
      if (event.definition_id != definition_id) {
        continue;
      }
      ++linked;
      auto previous = event.previous_position;
      found.insert_or_assign(std::pair{event.position, event.log_index},
                             std::move(event));
      if (previous == kNoPosition) {
        ++roots;
      } else if (!visited.contains(previous)) {
        pending.push_back(previous);
      }
    }
    // A linked position must hold at least one notification for the chain.
    if (linked == 0) {
      spdlog::warn("Missing notification while reconstructing {} at {}",
                   id_hex, position);
      return make_read_error<events_t>(
          registry_error_code::history_source_unavailable,
          kReconstructHistoryCodespace, "linked notification missing",
          fmt::format("id={} position={}", id_hex, position));
    }
  }

  if (roots != 1) {
    spdlog::warn("Chain for {} has {} first entries", id_hex, roots);
    return make_read_error<events_t>(
        registry_error_code::history_source_unavailable,
        kReconstructHistoryCodespace, "entry chain is not rooted",
        fmt::format("id={} position={} roots={}", id_hex, *tail, roots));
  }

  auto history = events_t{};
  history.reserve(found.size());
  for (auto& [coordinate, event] : found) {
    history.push_back(std::move(event));
  }
  return make_read_ok(std::move(history));
}

}  // namespace revreg::registry
