#pragma once

#include <gateway/execution/minter.hpp>
#include <gateway/execution/wallet.hpp>
#include <gateway/schema/primitives.hpp>

#include <boost/program_options.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace gateway::config {

/// Everything the gateway executable needs, from the command line and,
/// with --config, an INI file using the same option names.
struct config final {
  std::string db_path{"gateway-state"};
  std::string log_level{"info"};
  std::string log_file{"gateway.log"};
  gateway::schema::block_height_t block_height{};
  gateway::schema::address_t sender{};
  gateway::execution::wallet_options wallet;
  gateway::execution::minter_options minter;
  /// First positional argument and the ones following it.
  std::string command;
  std::vector<std::string> arguments;
};

boost::program_options::options_description make_options_description();

/// Parse argv (and the --config file when given). Returns std::nullopt after
/// printing usage to `help` when --help was requested. Malformed values throw
/// boost::program_options::error.
std::optional<config> load(int argc,
                           const char* const argv[],
                           std::ostream& help);

/// Parse an address option value, 20 or 32 bytes of hex.
gateway::schema::address_t parse_address(const std::string& option,
                                         const std::string& value);

}  // namespace gateway::config
