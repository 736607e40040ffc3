#pragma once

#include <boost/program_options.hpp>
#include <revreg/schema/create_definition.hpp>
#include <revreg/schema/create_entry.hpp>
#include <revreg/schema/primitives.hpp>
#include <string>
#include <vector>

// Option parsing shared by revreg_node and revreg_endorse. Malformed input is
// fatal.
namespace revreg::tools {

/// Options describing a create_definition or create_entry operation.
void add_operation_options(boost::program_options::options_description& options);

std::string require_string(const boost::program_options::variables_map& vm,
                           const std::string& name);

/// Accepts a 0x-prefixed 32-byte hex id, or a human-readable id to hash.
revreg::schema::hash32_t get_id(const boost::program_options::variables_map& vm,
                                const std::string& name);

revreg::schema::address_t get_address(
    const boost::program_options::variables_map& vm,
    const std::string& name);

revreg::schema::private_key_t get_private_key(
    const boost::program_options::variables_map& vm,
    const std::string& name);

revreg::schema::signature_t get_signature(
    const boost::program_options::variables_map& vm,
    const std::string& name);

revreg::schema::bytes_t get_bytes(
    const boost::program_options::variables_map& vm,
    const std::string& name);

std::vector<uint32_t> get_indices(
    const boost::program_options::variables_map& vm,
    const std::string& name);

revreg::schema::create_definition_t make_create_definition(
    const boost::program_options::variables_map& vm);

revreg::schema::create_entry_t make_create_entry(
    const boost::program_options::variables_map& vm);

/// Merge an INI file named by --config under the command line values.
void load_config_file(const boost::program_options::options_description& options,
                      boost::program_options::variables_map& vm);

}  // namespace revreg::tools
