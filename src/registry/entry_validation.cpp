#include <revreg/registry/entry_validation.hpp>
#include <revreg/registry/result.hpp>
#include <fmt/format.h>
#include <string>
#include <utility>

using namespace revreg::schema;

namespace revreg::registry {

namespace {

registry_result_t invalid_entry(std::string log, std::string info = {}) {
  return make_write_error(registry_error_code::invalid_entry,
                          kValidateEntryCodespace, std::move(log),
                          std::move(info));
}

}  // namespace

registry_result_t validate_entry(const revocation_registry_entry_t& entry) {
  if (entry.data.current_accumulator.empty()) {
    return invalid_entry("Incorrect Accumulator", "current accumulator is empty");
  }
  if (entry.data.previous_accumulator &&
      entry.data.previous_accumulator->empty()) {
    return invalid_entry("Incorrect Accumulator",
                         "previous accumulator is empty");
  }
  return registry_result_t{};
}

registry_result_t validate_entry_with_status_list(
    const revocation_registry_entry_t& entry,
    const std::optional<revocation_status_list_t>& status_list) {
  if (auto local = validate_entry(entry); local.code != 0) {
    return local;
  }
  if (status_list && entry.issuer_id != status_list->issuer_id) {
    return invalid_entry(
        "issuer mismatch",
        fmt::format("entry issuer {} != status list issuer {}",
                    entry.issuer_id, status_list->issuer_id));
  }

  auto ledger = std::optional<bytes_t>{};
  if (status_list && status_list->current_accumulator &&
      !status_list->current_accumulator->empty()) {
    ledger = status_list->current_accumulator;
  }
  const auto& previous = entry.data.previous_accumulator;

  if (previous && ledger) {
    if (*previous != *ledger) {
      return invalid_entry("prev_accum mismatch",
                           fmt::format("expected {}, found {}",
                                       to_hex(make_bytes_view(*ledger)),
                                       to_hex(make_bytes_view(*previous))));
    }
  } else if (!previous && ledger) {
    return invalid_entry(
        "prev_accum not provided locally, but exists on the ledger");
  } else if (previous && !ledger) {
    return invalid_entry(
        "prev_accum provided locally, but does not exist on the ledger");
  }
  return registry_result_t{};
}

}  // namespace revreg::registry
