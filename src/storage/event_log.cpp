#include <revreg/schema/key/registry_keys.hpp>
#include <revreg/storage/event_log.hpp>
#include <spdlog/spdlog.h>
#include <limits>
#include <utility>

namespace revreg::storage {

event_log::event_log(revreg::schema::encoding::scale_encoder_t& encoder,
                     rocksdb_storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

uint64_t event_log::next_log_index() const {
  auto key = revreg::schema::key::make_event_sequence_key(encoder_);
  auto next = storage_.get<revreg::schema::encoding::scale_encoder_t, uint64_t>(
      encoder_, revreg::schema::make_bytes_view(key));
  return next.value_or(1);
}

void event_log::stage_entry(const revreg::schema::entry_created_event_t& event,
                            std::vector<key_value_entry_t>& batch) const {
  batch.emplace_back(
      revreg::schema::key::make_entry_event_key(event.definition_id,
                                                event.position, event.log_index),
      encoder_.encode(event));
  batch.emplace_back(revreg::schema::key::make_event_sequence_key(encoder_),
                     encoder_.encode(uint64_t{event.log_index + 1}));
}

void event_log::stage_definition_created(
    const revreg::schema::definition_created_event_t& event,
    std::vector<key_value_entry_t>& batch) const {
  batch.emplace_back(revreg::schema::key::make_definition_event_key(
                         event.position, event.log_index),
                     encoder_.encode(event));
  batch.emplace_back(revreg::schema::key::make_event_sequence_key(encoder_),
                     encoder_.encode(uint64_t{event.log_index + 1}));
}

std::optional<std::vector<revreg::schema::entry_created_event_t>>
event_log::query(const revreg::schema::hash32_t& definition_id,
                 const revreg::schema::position_t from,
                 const revreg::schema::position_t to) const {
  auto events = std::vector<revreg::schema::entry_created_event_t>{};
  if (from > to) {
    return events;
  }
  auto first = revreg::schema::key::make_entry_event_key(definition_id, from, 0);
  auto last = revreg::schema::key::make_entry_event_key(
      definition_id, to, std::numeric_limits<uint64_t>::max());
  auto rows = storage_.try_list_range(revreg::schema::make_bytes_view(first),
                                      revreg::schema::make_bytes_view(last));
  if (!rows) {
    return std::nullopt;
  }
  events.reserve(rows->size());
  for (const auto& [key, value] : *rows) {
    auto decoded =
        encoder_.try_decode<revreg::schema::entry_created_event_t>(
            revreg::schema::make_bytes_view(value));
    if (!decoded) {
      spdlog::error("Undecodable entry notification for definition {}",
                    revreg::schema::to_hex(definition_id));
      return std::nullopt;
    }
    events.push_back(std::move(*decoded));
  }
  return events;
}

std::vector<revreg::schema::definition_created_event_t>
event_log::definitions_created() const {
  auto prefix = revreg::schema::make_bytes(
      revreg::schema::key::kDefinitionEventPrefix);
  auto rows = storage_.list_by_prefix(revreg::schema::make_bytes_view(prefix));
  auto events = std::vector<revreg::schema::definition_created_event_t>{};
  events.reserve(rows.size());
  for (const auto& [key, value] : rows) {
    events.push_back(
        encoder_.decode<revreg::schema::definition_created_event_t>(
            revreg::schema::make_bytes_view(value)));
  }
  return events;
}

}  // namespace revreg::storage
