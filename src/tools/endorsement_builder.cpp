#include <boost/program_options.hpp>
#include <revreg/common/critical.hpp>
#include <revreg/crypto/recover.hpp>
#include <revreg/registry/endorsement.hpp>
#include <revreg/schema/endorsement.hpp>
#include <revreg/tools/cli.hpp>

#include <iostream>
#include <string>

namespace {

namespace po = boost::program_options;
using namespace revreg::tools;

revreg::schema::bytes_t make_author_payload(
    const po::variables_map& vm,
    const revreg::schema::address_t& registry,
    const revreg::schema::address_t& identity) {
  auto operation = require_string(vm, "operation");
  if (operation == "definition") {
    return revreg::schema::make_author_payload(registry, identity,
                                               make_create_definition(vm));
  }
  if (operation == "entry") {
    return revreg::schema::make_author_payload(registry, identity,
                                               make_create_entry(vm));
  }
  revreg::common::critical("--operation must be definition|entry");
}

revreg::schema::address_t derive_address(
    const revreg::schema::private_key_t& private_key) {
  auto address = revreg::crypto::derive_address(private_key);
  if (!address) {
    revreg::common::critical("private key is not a valid secp256k1 scalar");
  }
  return *address;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  revreg_endorse keygen\n"
            << "  revreg_endorse address --private-key KEY\n"
            << "  revreg_endorse sign --operation definition|entry "
               "--private-key KEY [operation options]\n"
            << "  revreg_endorse endorse --operation definition|entry "
               "--private-key KEY --identity ADDR --author-signature SIG "
               "[operation options]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto registry_address = std::string{};

  auto options = po::options_description{"revreg_endorse options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "keygen|address|sign|endorse")(
      "config,c", po::value<std::string>(), "INI config file")(
      "registry-address",
      po::value<std::string>(&registry_address)
          ->default_value("0x0000000000000000000000000000000000003333"),
      "registry address bound into signed payloads")(
      "private-key", po::value<std::string>(), "secp256k1 private key hex")(
      "operation", po::value<std::string>(), "definition|entry")(
      "identity", po::value<std::string>(), "author identity address")(
      "author-signature", po::value<std::string>(), "author signature hex");
  add_operation_options(options);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  load_config_file(options, vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "keygen") {
    auto private_key = revreg::crypto::generate_private_key();
    if (!private_key) {
      revreg::common::critical("failed to generate private key");
    }
    std::cout << "private_key " << revreg::schema::to_hex(*private_key) << '\n'
              << "address "
              << revreg::schema::to_hex(derive_address(*private_key)) << '\n';
    return 0;
  }

  if (command == "address") {
    std::cout << revreg::schema::to_hex(
                     derive_address(get_private_key(vm, "private-key")))
              << '\n';
    return 0;
  }

  auto registry = revreg::schema::try_make_address(registry_address);
  if (!registry) {
    revreg::common::critical("--registry-address must be 20 bytes hex");
  }

  if (command == "sign") {
    auto private_key = get_private_key(vm, "private-key");
    auto identity = derive_address(private_key);
    auto payload = make_author_payload(vm, *registry, identity);
    auto signature = revreg::registry::sign_payload(payload, private_key);
    if (!signature) {
      revreg::common::critical("failed to sign author payload");
    }
    std::cout << "identity " << revreg::schema::to_hex(identity) << '\n'
              << "author_signature " << revreg::schema::to_hex(*signature)
              << '\n';
    return 0;
  }

  if (command == "endorse") {
    auto identity = get_address(vm, "identity");
    auto payload = make_author_payload(vm, *registry, identity);
    auto request = revreg::registry::endorse(
        *registry, identity, payload, get_signature(vm, "author-signature"),
        get_private_key(vm, "private-key"));
    if (!request) {
      revreg::common::critical("failed to endorse author signature");
    }
    std::cout << "endorser " << revreg::schema::to_hex(request->endorser)
              << '\n'
              << "endorser_signature "
              << revreg::schema::to_hex(request->endorser_signature) << '\n';
    return 0;
  }

  revreg::common::critical("command must be keygen|address|sign|endorse");
}
