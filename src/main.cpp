#include <gateway/common/critical.hpp>
#include <gateway/common/logging.hpp>
#include <gateway/config/config.hpp>
#include <gateway/execution/minter.hpp>
#include <gateway/execution/token_operations.hpp>
#include <gateway/execution/wallet.hpp>
#include <gateway/schema/encoding/scale/encoder.hpp>
#include <gateway/storage/rocksdb/storage.hpp>

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using gateway::schema::address_t;
using gateway::schema::amount_t;
using gateway::schema::transaction_result_t;

const std::string& argument(const std::vector<std::string>& args,
                            const std::size_t index,
                            const std::string_view name) {
  if (index >= args.size()) {
    gateway::common::critical(fmt::format("missing argument <{}>", name));
  }
  return args[index];
}

address_t address_argument(const std::vector<std::string>& args,
                           const std::size_t index,
                           const std::string_view name) {
  auto address = gateway::schema::try_make_address(argument(args, index, name));
  if (!address.has_value()) {
    gateway::common::critical(
        fmt::format("<{}> must be a 20 or 32 byte hex address", name));
  }
  return *address;
}

amount_t amount_argument(const std::vector<std::string>& args,
                         const std::size_t index,
                         const std::string_view name) {
  auto amount = gateway::schema::try_make_amount(argument(args, index, name));
  if (!amount.has_value()) {
    gateway::common::critical(
        fmt::format("<{}> must be a decimal uint256", name));
  }
  return *amount;
}

gateway::schema::bytes_t bytes_argument(const std::vector<std::string>& args,
                                        const std::size_t index,
                                        const std::string_view name) {
  auto bytes = gateway::schema::try_from_hex(argument(args, index, name));
  if (!bytes.has_value()) {
    gateway::common::critical(fmt::format("<{}> must be hex", name));
  }
  return *bytes;
}

gateway::schema::signature_t signature_argument(
    const std::vector<std::string>& args,
    const std::size_t index,
    const std::string_view name) {
  auto signature =
      gateway::schema::try_make_signature(argument(args, index, name));
  if (!signature.has_value()) {
    gateway::common::critical(
        fmt::format("<{}> must be a 65 byte hex signature", name));
  }
  return *signature;
}

int print_result(const transaction_result_t& result) {
  std::cout << "code: " << result.code << '\n';
  if (result.code != 0) {
    std::cout << "codespace: " << result.codespace << '\n'
              << "log: " << result.log << '\n';
    if (!result.info.empty()) {
      std::cout << "info: " << result.info << '\n';
    }
  }
  for (const auto& event : result.events) {
    std::cout << "event: " << event.type;
    for (const auto& attribute : event.attributes) {
      std::cout << ' ' << attribute.key << '=' << attribute.value;
    }
    std::cout << '\n';
  }
  std::cout.flush();
  return result.code == 0 ? 0 : 1;
}

constexpr auto kUsage = std::string_view{
    "usage: gateway [options] <command> [args]\n"
    "  deposit <token> <value> [depositor]\n"
    "  initiate-withdrawal <token> <value>\n"
    "  withdraw <token>\n"
    "  burn <batch-hex> <signature-hex>\n"
    "  mint <attestation-hex> <signature-hex>\n"
    "  balance <token> <depositor>\n"
    "  add-delegate <token> <delegate>\n"
    "  remove-delegate <token> <delegate>\n"};

}  // namespace

int main(int argc, char* argv[]) {
  auto loaded = std::optional<gateway::config::config>{};
  try {
    loaded = gateway::config::load(argc, argv, std::cout);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << '\n' << kUsage;
    return 2;
  }
  if (!loaded.has_value()) {
    std::cout << kUsage;
    return 0;
  }
  auto& config = *loaded;
  if (config.command.empty()) {
    std::cerr << kUsage;
    return 2;
  }

  gateway::common::install_logger("gateway", config.log_level,
                                  config.log_file);

  auto encoder = gateway::schema::encoding::scale_encoder_t{};
  auto storage = gateway::storage::make_storage<
      gateway::storage::rocksdb_storage_tag>(config.db_path);
  auto ctx = gateway::execution::call_context{
      .block_height = config.block_height, .sender = config.sender};
  const auto& args = config.arguments;
  const auto& command = config.command;

  auto status = 0;
  if (command == "mint") {
    auto minter = gateway::execution::minter{
        encoder, storage, config.minter,
        gateway::execution::make_logging_token_operations()};
    status = print_result(
        minter.mint(ctx, bytes_argument(args, 0, "attestation"),
                    signature_argument(args, 1, "signature")));
  } else {
    auto wallet = gateway::execution::wallet{
        encoder, storage, config.wallet,
        gateway::execution::make_logging_token_operations()};
    if (command == "deposit") {
      auto token = address_argument(args, 0, "token");
      auto value = amount_argument(args, 1, "value");
      status = print_result(
          args.size() > 2
              ? wallet.deposit_for(ctx, token,
                                   address_argument(args, 2, "depositor"),
                                   value)
              : wallet.deposit(ctx, token, value));
    } else if (command == "initiate-withdrawal") {
      status = print_result(wallet.initiate_withdrawal(
          ctx, address_argument(args, 0, "token"),
          amount_argument(args, 1, "value")));
    } else if (command == "withdraw") {
      status = print_result(
          wallet.withdraw(ctx, address_argument(args, 0, "token")));
    } else if (command == "burn") {
      status = print_result(
          wallet.burn(ctx, bytes_argument(args, 0, "batch"),
                      signature_argument(args, 1, "signature")));
    } else if (command == "add-delegate") {
      status = print_result(
          wallet.add_delegate(ctx, address_argument(args, 0, "token"),
                              address_argument(args, 1, "delegate")));
    } else if (command == "remove-delegate") {
      status = print_result(
          wallet.remove_delegate(ctx, address_argument(args, 0, "token"),
                                 address_argument(args, 1, "delegate")));
    } else if (command == "balance") {
      auto token = address_argument(args, 0, "token");
      auto depositor = address_argument(args, 1, "depositor");
      std::cout << "total: " << wallet.total_balance(token, depositor).str()
                << '\n'
                << "available: "
                << wallet.available_balance(token, depositor).str() << '\n'
                << "withdrawing: "
                << wallet.withdrawing_balance(token, depositor).str() << '\n'
                << "withdrawable: "
                << wallet
                       .withdrawable_balance(token, depositor,
                                             config.block_height)
                       .str()
                << '\n'
                << "withdrawal_block: "
                << wallet.withdrawal_block(token, depositor) << std::endl;
    } else {
      spdlog::error("Unknown command {}", command);
      std::cerr << kUsage;
      status = 2;
    }
  }

  spdlog::shutdown();
  return status;
}
