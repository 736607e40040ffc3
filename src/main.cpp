#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <revreg/common/critical.hpp>
#include <revreg/registry/entry_validation.hpp>
#include <revreg/registry/local_directory.hpp>
#include <revreg/registry/revocation_registry.hpp>
#include <revreg/schema/encoding/scale/encoder.hpp>
#include <revreg/schema/identifier.hpp>
#include <revreg/schema/revocation_status_list.hpp>
#include <revreg/storage/rocksdb/storage.hpp>
#include <revreg/tools/cli.hpp>

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

using namespace revreg::tools;

namespace {

namespace po = boost::program_options;
using encoder_t = revreg::schema::encoding::scale_encoder_t;

void configure_logging(const std::string& log_file, bool verbose) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "revreg", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

int report(const revreg::schema::registry_result_t& result) {
  if (result.code != 0) {
    std::cerr << result.codespace << ": " << result.log << " (" << result.info
              << ")\n";
    return static_cast<int>(result.code);
  }
  std::cout << "position " << result.position << '\n';
  for (const auto& event : result.events) {
    std::cout << event.type << '\n';
    for (const auto& attribute : event.attributes) {
      std::cout << "  " << attribute.key << '=' << attribute.value << '\n';
    }
  }
  return 0;
}

template <typename T>
int report_error(const revreg::schema::read_result<T>& result) {
  std::cerr << result.codespace << ": " << result.log << " (" << result.info
            << ")\n";
  return static_cast<int>(result.code);
}

void print_indices(const std::string_view label,
                   const std::vector<uint32_t>& indices) {
  std::cout << label << ':';
  for (const auto index : indices) {
    std::cout << ' ' << index;
  }
  std::cout << '\n';
}

void print_help(const po::options_description& options) {
  std::cout
      << "Usage:\n"
      << "  revreg_node begin-block --height N --timestamp T\n"
      << "  revreg_node grant-role --party ADDR --role trustee|endorser|steward\n"
      << "  revreg_node set-did-controller --did DID --controller ADDR\n"
      << "  revreg_node register-credential-definition "
         "--credential-definition-id ID --issuer DID\n"
      << "  revreg_node create-definition --sender ADDR [definition options]\n"
      << "  revreg_node create-entry --sender ADDR [entry options]\n"
      << "  revreg_node submit-endorsement --operation definition|entry "
         "--identity ADDR --endorser ADDR --author-signature SIG "
         "--endorser-signature SIG [operation options]\n"
      << "  revreg_node resolve-definition --definition-id ID\n"
      << "  revreg_node history --definition-id ID\n"
      << "  revreg_node status-list --definition-id ID --at T "
         "[--max-cred-num N]\n"
      << "  revreg_node make-id --issuer DID --credential-definition-id ID "
         "--tag TAG\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto config_path = std::string{};
  auto db_path = std::string{};
  auto registry_address = std::string{};
  auto log_file = std::string{};

  auto options = po::options_description{"revreg_node options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "command to run")(
      "config,c", po::value<std::string>(&config_path), "INI config file")(
      "db-path", po::value<std::string>(&db_path)->default_value("revreg-db"),
      "RocksDB directory")(
      "registry-address",
      po::value<std::string>(&registry_address)
          ->default_value("0x0000000000000000000000000000000000003333"),
      "registry address bound into signed payloads")(
      "log-file", po::value<std::string>(&log_file)->default_value("revreg.log"),
      "log file path")("verbose,v", "enable debug logging")(
      "height", po::value<uint64_t>(), "block height")(
      "timestamp", po::value<uint64_t>(), "block timestamp (epoch seconds)")(
      "party", po::value<std::string>(), "party address")(
      "role", po::value<std::string>(), "trustee|endorser|steward")(
      "did", po::value<std::string>(), "issuer DID")(
      "controller", po::value<std::string>(), "controller address")(
      "tag", po::value<std::string>(), "definition tag")(
      "sender", po::value<std::string>(), "direct sender address")(
      "identity", po::value<std::string>(), "author identity address")(
      "endorser", po::value<std::string>(), "endorser address")(
      "author-signature", po::value<std::string>(), "author signature hex")(
      "endorser-signature", po::value<std::string>(), "endorser signature hex")(
      "operation", po::value<std::string>(), "definition|entry")(
      "at", po::value<uint64_t>(), "status list timestamp")(
      "max-cred-num", po::value<uint32_t>(), "render a 0/1 revocation list");
  revreg::tools::add_operation_options(options);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  revreg::tools::load_config_file(options, vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "make-id") {
    auto text = revreg::schema::make_revocation_registry_definition_id(
        require_string(vm, "issuer"),
        require_string(vm, "credential-definition-id"),
        require_string(vm, "tag"));
    std::cout << text << '\n'
              << "0x"
              << revreg::schema::to_hex(revreg::schema::make_identifier(text))
              << '\n';
    return 0;
  }

  configure_logging(log_file, vm.contains("verbose"));

  auto address = revreg::schema::try_make_address(registry_address);
  if (!address) {
    revreg::common::critical("--registry-address must be 20 bytes hex");
  }

  auto encoder = encoder_t{};
  auto storage = revreg::storage::make_storage<
      revreg::storage::rocksdb_storage_tag>(db_path);
  auto directory = revreg::registry::local_directory{encoder, storage};
  auto registry = revreg::registry::revocation_registry{
      encoder, storage, *address,
      revreg::registry::registry_collaborators{
          .roles = directory.make_role_resolver(),
          .did_controllers = directory.make_did_controller_resolver(),
          .credential_definitions =
              directory.make_credential_definition_resolver(),
          .recoverer = {}}};

  auto exit_code = 0;
  if (command == "begin-block") {
    if (!vm.contains("height") || !vm.contains("timestamp")) {
      revreg::common::critical("begin-block requires --height and --timestamp");
    }
    exit_code = report(registry.begin_block(vm["height"].as<uint64_t>(),
                                            vm["timestamp"].as<uint64_t>()));
  } else if (command == "grant-role") {
    auto role = revreg::schema::try_from_string<revreg::schema::role_id_t>(
        require_string(vm, "role"));
    if (!role) {
      revreg::common::critical("--role must be trustee|endorser|steward");
    }
    directory.grant_role(get_address(vm, "party"), *role);
  } else if (command == "set-did-controller") {
    directory.set_did_controller(require_string(vm, "did"),
                                 get_address(vm, "controller"));
  } else if (command == "register-credential-definition") {
    directory.register_credential_definition(
        revreg::schema::credential_definition_record_t{
            .id = get_id(vm, "credential-definition-id"),
            .issuer_id = require_string(vm, "issuer")});
  } else if (command == "create-definition") {
    auto sender = get_address(vm, "sender");
    exit_code = report(registry.create_definition(
        make_create_definition(vm),
        revreg::schema::direct_request{.sender = sender, .identity = sender}));
  } else if (command == "create-entry") {
    auto operation = make_create_entry(vm);
    auto status = registry.resolve_status_list_at(
        operation.definition_id, registry.clock().timestamp);
    if (!status.ok()) {
      exit_code = report_error(status);
    } else {
      auto entry = revreg::schema::revocation_registry_entry_t{};
      entry.definition_id = operation.definition_id;
      entry.issuer_id = operation.issuer_id;
      entry.data = operation.data;
      auto validated =
          revreg::registry::validate_entry_with_status_list(entry, status.value);
      if (validated.code != 0) {
        exit_code = report(validated);
      } else {
        auto sender = get_address(vm, "sender");
        exit_code = report(registry.create_entry(
            operation, revreg::schema::direct_request{.sender = sender,
                                                      .identity = sender}));
      }
    }
  } else if (command == "submit-endorsement") {
    auto request = revreg::schema::delegated_request{
        .identity = get_address(vm, "identity"),
        .endorser = get_address(vm, "endorser"),
        .author_signature = get_signature(vm, "author-signature"),
        .endorser_signature = get_signature(vm, "endorser-signature")};
    auto operation = require_string(vm, "operation");
    if (operation == "definition") {
      exit_code = report(registry.create_definition_delegated(
          make_create_definition(vm), request));
    } else if (operation == "entry") {
      exit_code = report(
          registry.create_entry_delegated(make_create_entry(vm), request));
    } else {
      revreg::common::critical("--operation must be definition|entry");
    }
  } else if (command == "resolve-definition") {
    auto resolved = registry.resolve_definition(get_id(vm, "definition-id"));
    if (!resolved.ok()) {
      exit_code = report_error(resolved);
    } else {
      const auto& definition = *resolved.value;
      std::cout << "id " << revreg::schema::to_hex(definition.id) << '\n'
                << "credential_definition_id "
                << revreg::schema::to_hex(definition.credential_definition_id)
                << '\n'
                << "issuer " << definition.issuer_id << '\n'
                << "created_at " << definition.created_at << '\n'
                << "definition "
                << revreg::schema::to_hex(
                       revreg::schema::make_bytes_view(definition.definition))
                << '\n';
    }
  } else if (command == "history") {
    auto history = registry.reconstruct_history(get_id(vm, "definition-id"));
    if (!history.ok()) {
      exit_code = report_error(history);
    } else {
      for (const auto& event : *history.value) {
        std::cout << "position " << event.position << " log_index "
                  << event.log_index << " created_at " << event.created_at
                  << " previous " << event.previous_position << '\n';
        print_indices("  issued", event.entry.data.issued);
        print_indices("  revoked", event.entry.data.revoked);
      }
    }
  } else if (command == "status-list") {
    if (!vm.contains("at")) {
      revreg::common::critical("status-list requires --at");
    }
    auto status = registry.resolve_status_list_at(get_id(vm, "definition-id"),
                                                  vm["at"].as<uint64_t>());
    if (!status.ok()) {
      exit_code = report_error(status);
    } else {
      std::cout << "issuer " << status.value->issuer_id << '\n'
                << "timestamp " << status.value->timestamp << '\n'
                << "accumulator "
                << (status.value->current_accumulator
                        ? revreg::schema::to_hex(revreg::schema::make_bytes_view(
                              *status.value->current_accumulator))
                        : std::string{"none"})
                << '\n';
      print_indices("revoked", status.value->revoked);
      if (vm.contains("max-cred-num")) {
        print_indices("list", revreg::schema::make_revocation_list(
                                  *status.value,
                                  vm["max-cred-num"].as<uint32_t>()));
      }
    }
  } else {
    spdlog::error("Unknown command '{}'", command);
    exit_code = 1;
  }

  spdlog::shutdown();
  return exit_code;
}
