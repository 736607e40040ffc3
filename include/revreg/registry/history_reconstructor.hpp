#pragma once

#include <revreg/registry/collaborators.hpp>
#include <revreg/schema/entry_created_event.hpp>
#include <revreg/schema/read_result.hpp>
#include <vector>

namespace revreg::registry {

inline constexpr auto kReconstructHistoryCodespace =
    std::string_view{"revreg.reconstruct_history"};

/// Recovers a definition's full entry chain by walking the notification log
/// backwards from the tail pointer.
///
/// The walk is an iterative worklist over positions. Every notification found
/// at a position is kept and its previous position followed, so several
/// entries recorded in the same block are all recovered. Results are returned
/// oldest first, ordered by (position, log index).
///
/// A linked position with no notification for the definition, or a walk that
/// does not end at exactly one first entry, fails with
/// history_source_unavailable. A partial chain is never returned.
class history_reconstructor final {
 public:
  history_reconstructor(tail_resolver_t tails, event_source_t events);

  revreg::schema::read_result<std::vector<revreg::schema::entry_created_event_t>>
  reconstruct(const revreg::schema::hash32_t& definition_id) const;

 private:
  tail_resolver_t tails_;
  event_source_t events_;
};

}  // namespace revreg::registry
