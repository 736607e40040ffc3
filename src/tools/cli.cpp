#include <fmt/format.h>
#include <revreg/common/critical.hpp>
#include <revreg/schema/identifier.hpp>
#include <revreg/tools/cli.hpp>
#include <fstream>

namespace po = boost::program_options;

namespace revreg::tools {

void add_operation_options(po::options_description& options) {
  options.add_options()("issuer", po::value<std::string>(), "issuer DID")(
      "credential-definition-id", po::value<std::string>(),
      "credential definition id (text or 0x hash)")(
      "definition-id", po::value<std::string>(),
      "revocation registry definition id (text or 0x hash)")(
      "definition", po::value<std::string>(), "definition payload hex")(
      "current-accumulator", po::value<std::string>(), "accumulator hex")(
      "previous-accumulator", po::value<std::string>(),
      "previous accumulator hex")(
      "issued", po::value<std::vector<uint32_t>>()->multitoken(),
      "issued indices")("revoked",
                        po::value<std::vector<uint32_t>>()->multitoken(),
                        "revoked indices");
}

std::string require_string(const po::variables_map& vm,
                           const std::string& name) {
  if (!vm.contains(name)) {
    revreg::common::critical(fmt::format("missing --{}", name));
  }
  return vm[name].as<std::string>();
}

revreg::schema::hash32_t get_id(const po::variables_map& vm,
                                const std::string& name) {
  auto value = require_string(vm, name);
  if (value.starts_with("0x") && value.size() == 66) {
    if (auto parsed = revreg::schema::try_make_hash32(value)) {
      return *parsed;
    }
  }
  return revreg::schema::make_identifier(value);
}

revreg::schema::address_t get_address(const po::variables_map& vm,
                                      const std::string& name) {
  auto parsed = revreg::schema::try_make_address(require_string(vm, name));
  if (!parsed) {
    revreg::common::critical(fmt::format("--{} must be 20 bytes hex", name));
  }
  return *parsed;
}

revreg::schema::private_key_t get_private_key(const po::variables_map& vm,
                                              const std::string& name) {
  auto parsed = revreg::schema::try_make_array<32>(require_string(vm, name));
  if (!parsed) {
    revreg::common::critical(fmt::format("--{} must be 32 bytes hex", name));
  }
  return *parsed;
}

revreg::schema::signature_t get_signature(const po::variables_map& vm,
                                          const std::string& name) {
  auto parsed = revreg::schema::try_make_array<65>(require_string(vm, name));
  if (!parsed) {
    revreg::common::critical(fmt::format("--{} must be 65 bytes hex", name));
  }
  return *parsed;
}

revreg::schema::bytes_t get_bytes(const po::variables_map& vm,
                                  const std::string& name) {
  auto parsed = revreg::schema::try_from_hex(require_string(vm, name));
  if (!parsed) {
    revreg::common::critical(fmt::format("--{} must be hex", name));
  }
  return *parsed;
}

std::vector<uint32_t> get_indices(const po::variables_map& vm,
                                  const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  return vm[name].as<std::vector<uint32_t>>();
}

revreg::schema::create_definition_t make_create_definition(
    const po::variables_map& vm) {
  auto operation = revreg::schema::create_definition_t{};
  operation.id = get_id(vm, "definition-id");
  operation.credential_definition_id = get_id(vm, "credential-definition-id");
  operation.issuer_id = require_string(vm, "issuer");
  operation.definition = get_bytes(vm, "definition");
  return operation;
}

revreg::schema::create_entry_t make_create_entry(const po::variables_map& vm) {
  auto operation = revreg::schema::create_entry_t{};
  operation.definition_id = get_id(vm, "definition-id");
  operation.issuer_id = require_string(vm, "issuer");
  operation.data.current_accumulator = get_bytes(vm, "current-accumulator");
  if (vm.contains("previous-accumulator")) {
    operation.data.previous_accumulator = get_bytes(vm, "previous-accumulator");
  }
  operation.data.issued = get_indices(vm, "issued");
  operation.data.revoked = get_indices(vm, "revoked");
  return operation;
}

void load_config_file(const po::options_description& options,
                      po::variables_map& vm) {
  if (!vm.contains("config")) {
    return;
  }
  auto path = vm["config"].as<std::string>();
  auto config_file = std::ifstream{path};
  if (!config_file) {
    revreg::common::critical(fmt::format("cannot open config file {}", path));
  }
  po::store(po::parse_config_file(config_file, options), vm);
}

}  // namespace revreg::tools
