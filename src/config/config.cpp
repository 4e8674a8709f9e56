#include <gateway/config/config.hpp>

#include <spdlog/spdlog.h>

#include <fstream>

namespace gateway::config {

namespace po = boost::program_options;

namespace {

std::vector<gateway::schema::address_t> parse_addresses(
    const po::variables_map& vm,
    const std::string& option) {
  auto out = std::vector<gateway::schema::address_t>{};
  if (!vm.contains(option)) {
    return out;
  }
  for (const auto& value : vm[option].as<std::vector<std::string>>()) {
    out.push_back(parse_address(option, value));
  }
  return out;
}

std::optional<gateway::schema::address_t> parse_optional_address(
    const po::variables_map& vm,
    const std::string& option) {
  if (!vm.contains(option)) {
    return std::nullopt;
  }
  return parse_address(option, vm[option].as<std::string>());
}

}  // namespace

gateway::schema::address_t parse_address(const std::string& option,
                                         const std::string& value) {
  auto address = gateway::schema::try_make_address(value);
  if (!address.has_value()) {
    throw po::validation_error{po::validation_error::invalid_option_value,
                               option, value};
  }
  return *address;
}

po::options_description make_options_description() {
  auto general = po::options_description{"Gateway"};
  general.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(), "INI file with the options below")(
      "db-path", po::value<std::string>()->default_value("gateway-state"),
      "RocksDB state directory")(
      "log-level", po::value<std::string>()->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>()->default_value("gateway.log"),
      "Log file")("block-height", po::value<uint64_t>()->default_value(0),
                  "Current block height")(
      "sender", po::value<std::string>()->default_value(""),
      "Caller address");

  auto wallet = po::options_description{"Wallet"};
  wallet.add_options()("wallet.domain", po::value<uint32_t>()->default_value(0),
                       "Local domain of the wallet")(
      "wallet.contract", po::value<std::string>(), "Wallet contract address")(
      "wallet.eip712-name",
      po::value<std::string>()->default_value("GatewayWallet"),
      "EIP-712 domain name")(
      "wallet.eip712-version", po::value<std::string>()->default_value("1"),
      "EIP-712 domain version")("wallet.withdrawal-delay",
                                po::value<uint64_t>(),
                                "Withdrawal delay in blocks")(
      "wallet.fee-recipient", po::value<std::string>(), "Fee recipient")(
      "wallet.burn-signer",
      po::value<std::vector<std::string>>()->composing()->multitoken(),
      "Burn signer address (repeatable)")(
      "wallet.token",
      po::value<std::vector<std::string>>()->composing()->multitoken(),
      "Supported token (repeatable)");

  auto minter = po::options_description{"Minter"};
  minter.add_options()("minter.domain", po::value<uint32_t>()->default_value(0),
                       "Local domain of the minter")(
      "minter.contract", po::value<std::string>(), "Minter contract address")(
      "minter.eip712-name",
      po::value<std::string>()->default_value("GatewayMinter"),
      "EIP-712 domain name")(
      "minter.eip712-version", po::value<std::string>()->default_value("1"),
      "EIP-712 domain version")(
      "minter.attestation-signer",
      po::value<std::vector<std::string>>()->composing()->multitoken(),
      "Attestation signer address (repeatable)")(
      "minter.token",
      po::value<std::vector<std::string>>()->composing()->multitoken(),
      "Supported token (repeatable)");

  auto hidden = po::options_description{};
  hidden.add_options()("command", po::value<std::string>(), "command")(
      "args", po::value<std::vector<std::string>>(), "command arguments");

  auto all = po::options_description{};
  all.add(general).add(wallet).add(minter).add(hidden);
  return all;
}

std::optional<config> load(const int argc,
                           const char* const argv[],
                           std::ostream& help) {
  auto description = make_options_description();
  auto positional = po::positional_options_description{};
  positional.add("command", 1).add("args", -1);

  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(description)
                .positional(positional)
                .run(),
            vm);
  if (vm.contains("config")) {
    auto path = vm["config"].as<std::string>();
    auto file = std::ifstream{path};
    if (!file) {
      throw po::reading_file{path.c_str()};
    }
    po::store(po::parse_config_file(file, description), vm);
    spdlog::debug("Loaded configuration file {}", path);
  }
  po::notify(vm);

  if (vm.contains("help")) {
    help << description << std::endl;
    return std::nullopt;
  }

  auto out = config{};
  out.db_path = vm["db-path"].as<std::string>();
  out.log_level = vm["log-level"].as<std::string>();
  out.log_file = vm["log-file"].as<std::string>();
  out.block_height = vm["block-height"].as<uint64_t>();
  auto sender = vm["sender"].as<std::string>();
  if (!sender.empty()) {
    out.sender = parse_address("sender", sender);
  }

  out.wallet.domain = vm["wallet.domain"].as<uint32_t>();
  out.wallet.contract = parse_optional_address(vm, "wallet.contract")
                            .value_or(gateway::schema::address_t{});
  out.wallet.eip712 = gateway::transfer::typed_data::domain{
      .name = vm["wallet.eip712-name"].as<std::string>(),
      .version = vm["wallet.eip712-version"].as<std::string>()};
  out.wallet.tokens = parse_addresses(vm, "wallet.token");
  out.wallet.burn_signers = parse_addresses(vm, "wallet.burn-signer");
  out.wallet.fee_recipient = parse_optional_address(vm, "wallet.fee-recipient");
  if (vm.contains("wallet.withdrawal-delay")) {
    out.wallet.withdrawal_delay = vm["wallet.withdrawal-delay"].as<uint64_t>();
  }

  out.minter.domain = vm["minter.domain"].as<uint32_t>();
  out.minter.contract = parse_optional_address(vm, "minter.contract")
                            .value_or(gateway::schema::address_t{});
  out.minter.eip712 = gateway::transfer::typed_data::domain{
      .name = vm["minter.eip712-name"].as<std::string>(),
      .version = vm["minter.eip712-version"].as<std::string>()};
  out.minter.tokens = parse_addresses(vm, "minter.token");
  out.minter.attestation_signers =
      parse_addresses(vm, "minter.attestation-signer");

  if (vm.contains("command")) {
    out.command = vm["command"].as<std::string>();
  }
  if (vm.contains("args")) {
    out.arguments = vm["args"].as<std::vector<std::string>>();
  }
  return out;
}

}  // namespace gateway::config
