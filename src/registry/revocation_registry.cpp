#include <revreg/crypto/recover.hpp>
#include <revreg/registry/result.hpp>
#include <revreg/registry/revocation_registry.hpp>
#include <revreg/schema/endorsement.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <utility>

using namespace revreg::schema;

namespace {

revreg::registry::address_recoverer_t default_recoverer(
    revreg::registry::address_recoverer_t recoverer) {
  if (recoverer) {
    return recoverer;
  }
  return [](const hash32_t& digest, const signature_t& signature) {
    return revreg::crypto::recover_address(digest, signature);
  };
}

void log_write(const registry_result_t& result) {
  if (result.code == 0) {
    spdlog::info("{} accepted at position {} ({})", result.codespace,
                 result.position, result.info);
  } else {
    spdlog::warn("{} rejected: {} ({}) [{}]", result.codespace, result.log,
                 to_string(static_cast<registry_error_code>(result.code)),
                 result.info);
  }
}

}  // namespace

namespace revreg::registry {

revocation_registry::revocation_registry(
    encoding::scale_encoder_t& encoder,
    revreg::storage::rocksdb_storage_t& storage,
    address_t address,
    registry_collaborators collaborators)
    : storage_{storage},
      address_{std::move(address)},
      events_{encoder, storage},
      authorizer_{std::move(collaborators.roles),
                  std::move(collaborators.did_controllers)},
      verifier_{address_, default_recoverer(std::move(collaborators.recoverer))},
      definitions_{encoder, storage, events_, authorizer_,
                   std::move(collaborators.credential_definitions)},
      entries_{encoder, storage, events_, definitions_, authorizer_},
      history_{[this](const hash32_t& id) -> std::optional<position_t> {
                 auto tail = definitions_.last_entry_position(id);
                 if (!tail.ok()) {
                   return std::nullopt;
                 }
                 return *tail.value;
               },
               [this](const hash32_t& id, position_t from, position_t to) {
                 return events_.query(id, from, to);
               }},
      status_lists_{[this](const hash32_t& id) {
                      return definitions_.resolve(id);
                    },
                    history_} {
  if (auto persisted = storage_.load_ledger_clock()) {
    clock_ = *persisted;
  }
  spdlog::info("Revocation registry {} ready at block {} (timestamp {})",
               to_hex(address_), clock_.height, clock_.timestamp);
}

registry_result_t revocation_registry::begin_block(
    const position_t height,
    const timestamp_seconds_t timestamp) {
  auto lock = std::scoped_lock{write_mutex_};
  if (height <= clock_.height) {
    auto result = make_write_error(
        registry_error_code::invalid_block, kBeginBlockCodespace,
        "block height must increase",
        fmt::format("height={} current={}", height, clock_.height));
    log_write(result);
    return result;
  }
  if (timestamp == 0) {
    auto result =
        make_write_error(registry_error_code::invalid_block,
                         kBeginBlockCodespace, "block timestamp must be set",
                         fmt::format("height={}", height));
    log_write(result);
    return result;
  }
  if (timestamp < clock_.timestamp) {
    spdlog::warn("Block {} timestamp {} precedes previous block timestamp {}",
                 height, timestamp, clock_.timestamp);
  }

  clock_.height = height;
  clock_.timestamp = timestamp;
  storage_.save_ledger_clock(clock_);
  spdlog::debug("Began block {} at {}", height, timestamp);

  auto result = registry_result_t{};
  result.codespace = std::string{kBeginBlockCodespace};
  result.position = height;
  return result;
}

ledger_clock_t revocation_registry::clock() const {
  auto lock = std::scoped_lock{write_mutex_};
  return clock_;
}

const address_t& revocation_registry::address() const {
  return address_;
}

registry_result_t revocation_registry::create_definition(
    const create_definition_t& operation,
    const direct_request& request) {
  return submit_definition(operation, request);
}

registry_result_t revocation_registry::create_definition_delegated(
    const create_definition_t& operation,
    const delegated_request& request) {
  return submit_definition(operation, request);
}

registry_result_t revocation_registry::create_entry(
    const create_entry_t& operation,
    const direct_request& request) {
  return submit_entry(operation, request);
}

registry_result_t revocation_registry::create_entry_delegated(
    const create_entry_t& operation,
    const delegated_request& request) {
  return submit_entry(operation, request);
}

registry_result_t revocation_registry::submit_definition(
    const create_definition_t& operation,
    const write_request_t& request) {
  auto lock = std::scoped_lock{write_mutex_};
  if (auto failed = require_block(kCreateDefinitionCodespace)) {
    log_write(*failed);
    return *failed;
  }

  auto identity = std::visit(
      [](const auto& value) { return value.identity; }, request);
  auto payload = make_author_payload(address_, identity, operation);
  auto resolved = resolved_writer{};
  auto verified =
      verifier_.verify(request, payload, kCreateDefinitionCodespace, resolved);
  if (verified.code != 0) {
    log_write(verified);
    return verified;
  }

  auto result = definitions_.create(operation, resolved.identity,
                                    resolved.acting_party, clock_);
  log_write(result);
  return result;
}

registry_result_t revocation_registry::submit_entry(
    const create_entry_t& operation,
    const write_request_t& request) {
  auto lock = std::scoped_lock{write_mutex_};
  if (auto failed = require_block(kCreateEntryCodespace)) {
    log_write(*failed);
    return *failed;
  }

  auto identity = std::visit(
      [](const auto& value) { return value.identity; }, request);
  auto payload = make_author_payload(address_, identity, operation);
  auto resolved = resolved_writer{};
  auto verified =
      verifier_.verify(request, payload, kCreateEntryCodespace, resolved);
  if (verified.code != 0) {
    log_write(verified);
    return verified;
  }

  auto result = entries_.append(operation, resolved.identity,
                                resolved.acting_party, clock_);
  log_write(result);
  return result;
}

std::optional<registry_result_t> revocation_registry::require_block(
    const std::string_view codespace) const {
  if (clock_.height != kNoPosition) {
    return std::nullopt;
  }
  return make_write_error(registry_error_code::no_active_block, codespace,
                          "no block has begun", "");
}

read_result<revocation_registry_definition_t>
revocation_registry::resolve_definition(const hash32_t& id) const {
  return definitions_.resolve(id);
}

read_result<position_t> revocation_registry::last_entry_position(
    const hash32_t& id) const {
  return definitions_.last_entry_position(id);
}

read_result<std::vector<entry_created_event_t>>
revocation_registry::reconstruct_history(const hash32_t& id) const {
  return history_.reconstruct(id);
}

read_result<revocation_status_list_t>
revocation_registry::resolve_status_list_at(
    const hash32_t& id,
    const timestamp_seconds_t timestamp) const {
  return status_lists_.resolve_at(id, timestamp);
}

std::vector<definition_created_event_t>
revocation_registry::definitions_created() const {
  return events_.definitions_created();
}

}  // namespace revreg::registry
