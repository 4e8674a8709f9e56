#include <boost/program_options.hpp>
#include <gateway/common/critical.hpp>
#include <gateway/crypto/keccak.hpp>
#include <gateway/crypto/secp256k1.hpp>
#include <gateway/execution/burn_batch.hpp>
#include <gateway/schema/error.hpp>
#include <gateway/schema/primitives.hpp>
#include <gateway/transfer/cursor.hpp>
#include <gateway/transfer/payload_set.hpp>
#include <gateway/transfer/transfer_spec.hpp>
#include <gateway/transfer/typed_data.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;
namespace transfer = gateway::transfer;
using gateway::schema::address_t;
using gateway::schema::amount_t;
using gateway::schema::bytes_t;
using gateway::schema::bytes_view_t;
using gateway::schema::hash32_t;

std::string prefixed(const bytes_view_t& bytes) {
  return "0x" + gateway::schema::to_hex(bytes);
}

std::string prefixed(const hash32_t& hash) {
  return "0x" + gateway::schema::to_hex(hash);
}

/// Addresses are printed in their 20-byte EVM form when the upper 12 bytes
/// are zero.
std::string address_string(const address_t& address) {
  auto upper_zero = std::all_of(std::begin(address), std::begin(address) + 12,
                                [](const uint8_t b) { return b == 0; });
  if (upper_zero) {
    return prefixed(bytes_view_t{address.data() + 12, 20});
  }
  return prefixed(address);
}

address_t get_address(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    return address_t{};
  }
  auto address = gateway::schema::try_make_address(vm[name].as<std::string>());
  if (!address.has_value()) {
    gateway::common::critical(name + " must be a 20 or 32 byte hex address");
  }
  return *address;
}

amount_t get_amount(const po::variables_map& vm, const std::string& name) {
  auto amount = gateway::schema::try_make_amount(vm[name].as<std::string>());
  if (!amount.has_value()) {
    gateway::common::critical(name + " must be a decimal uint256");
  }
  return *amount;
}

hash32_t get_hash32(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    gateway::common::critical("missing required --" + name);
  }
  auto hash = gateway::schema::try_make_hash32(vm[name].as<std::string>());
  if (!hash.has_value()) {
    gateway::common::critical(name + " must be 32 bytes of hex");
  }
  return *hash;
}

bytes_t get_bytes(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    gateway::common::critical("missing required --" + name);
  }
  auto bytes = gateway::schema::try_from_hex(vm[name].as<std::string>());
  if (!bytes.has_value()) {
    gateway::common::critical(name + " must be hex");
  }
  return *bytes;
}

bytes_t decode_hex(const std::string& value) {
  auto bytes = gateway::schema::try_from_hex(value);
  if (!bytes.has_value()) {
    gateway::common::critical("invalid hex input");
  }
  return *bytes;
}

/// Either --spec (an encoded TransferSpec) or the individual field options.
transfer::transfer_spec build_spec(const po::variables_map& vm) {
  if (vm.contains("spec")) {
    auto encoded = get_bytes(vm, "spec");
    auto view = transfer::transfer_spec_view::cast(encoded);
    view.validate();
    return view.decode();
  }
  auto salt = vm.contains("salt") ? get_hash32(vm, "salt") : hash32_t{};
  auto hook_data = vm.contains("hook-data") ? get_bytes(vm, "hook-data")
                                            : bytes_t{};
  return transfer::transfer_spec{
      .source_domain = vm["source-domain"].as<uint32_t>(),
      .destination_domain = vm["destination-domain"].as<uint32_t>(),
      .source_contract = get_address(vm, "source-contract"),
      .destination_contract = get_address(vm, "destination-contract"),
      .source_token = get_address(vm, "source-token"),
      .destination_token = get_address(vm, "destination-token"),
      .source_depositor = get_address(vm, "source-depositor"),
      .destination_recipient = get_address(vm, "destination-recipient"),
      .source_signer = get_address(vm, "source-signer"),
      .destination_caller = get_address(vm, "destination-caller"),
      .value = get_amount(vm, "value"),
      .salt = salt,
      .hook_data = std::move(hook_data),
  };
}

void print_spec(const std::string& prefix,
                const transfer::transfer_spec_view& spec) {
  std::cout << prefix << "version: " << spec.version() << '\n'
            << prefix << "source_domain: " << spec.source_domain() << '\n'
            << prefix << "destination_domain: " << spec.destination_domain()
            << '\n'
            << prefix << "source_contract: "
            << address_string(spec.source_contract()) << '\n'
            << prefix << "destination_contract: "
            << address_string(spec.destination_contract()) << '\n'
            << prefix << "source_token: " << address_string(spec.source_token())
            << '\n'
            << prefix << "destination_token: "
            << address_string(spec.destination_token()) << '\n'
            << prefix << "source_depositor: "
            << address_string(spec.source_depositor()) << '\n'
            << prefix << "destination_recipient: "
            << address_string(spec.destination_recipient()) << '\n'
            << prefix << "source_signer: "
            << address_string(spec.source_signer()) << '\n'
            << prefix << "destination_caller: "
            << address_string(spec.destination_caller()) << '\n'
            << prefix << "value: " << spec.value().str() << '\n'
            << prefix << "salt: " << prefixed(spec.salt()) << '\n'
            << prefix << "hook_data: " << prefixed(spec.hook_data()) << '\n'
            << prefix << "hash: " << prefixed(spec.hash()) << '\n';
}

void print_element(const std::string& prefix,
                   const transfer::burn_intent_view& intent) {
  std::cout << prefix << "max_block_height: "
            << intent.max_block_height().str() << '\n'
            << prefix << "max_fee: " << intent.max_fee().str() << '\n';
  print_spec(prefix + "spec.", intent.spec());
}

void print_element(const std::string& prefix,
                   const transfer::attestation_view& attestation) {
  print_spec(prefix + "spec.", attestation.spec());
}

template <typename Traits>
void inspect_payload(const std::string_view kind, const bytes_view_t& data) {
  auto payload = transfer::payload<Traits>::parse(data);
  std::cout << "kind: " << kind << (payload.is_set() ? "-set" : "") << '\n';
  auto elements = payload.elements();
  std::cout << "elements: " << elements.size() << '\n';
  while (!elements.done()) {
    auto prefix = payload.is_set()
                      ? "[" + std::to_string(elements.index()) + "]."
                      : std::string{};
    print_element(prefix, elements.next());
  }
}

template <typename Traits>
void hash_payload(const bytes_view_t& data,
                  const transfer::typed_data::domain& domain) {
  auto payload = transfer::payload<Traits>::parse(data);
  auto struct_hash = payload.typed_data_hash();
  std::cout << "typed_data_hash: " << prefixed(struct_hash) << '\n'
            << "digest: "
            << prefixed(transfer::typed_data::digest(
                   transfer::typed_data::domain_separator(domain), struct_hash))
            << '\n';
}

transfer::typed_data::domain make_domain(
    const po::variables_map& vm,
    transfer::typed_data::domain fallback) {
  if (vm.contains("domain-name")) {
    fallback.name = vm["domain-name"].as<std::string>();
  }
  if (vm.contains("domain-version")) {
    fallback.version = vm["domain-version"].as<std::string>();
  }
  return fallback;
}

/// PAYLOAD:SIGNATURE[:FEE,FEE,...]
gateway::execution::burn_batch_entry_t parse_batch_entry(
    const std::string& entry) {
  auto first = entry.find(':');
  if (first == std::string::npos) {
    gateway::common::critical("--entry must be PAYLOAD:SIGNATURE[:FEES]");
  }
  auto second = entry.find(':', first + 1);
  auto payload = decode_hex(entry.substr(0, first));
  auto signature = decode_hex(entry.substr(
      first + 1,
      second == std::string::npos ? std::string::npos : second - first - 1));
  auto fees = std::vector<gateway::schema::word_t>{};
  if (second != std::string::npos) {
    auto list = std::string_view{entry}.substr(second + 1);
    while (!list.empty()) {
      auto comma = list.find(',');
      auto fee = gateway::schema::try_make_amount(list.substr(0, comma));
      if (!fee.has_value()) {
        gateway::common::critical("fees must be decimal uint256 values");
      }
      fees.push_back(gateway::schema::make_word(*fee));
      if (comma == std::string_view::npos) {
        break;
      }
      list.remove_prefix(comma + 1);
    }
  }
  return {std::move(payload), std::move(signature), std::move(fees)};
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  payload_builder <command> [options]\n\n"
            << "Commands: transfer-spec | burn-intent | attestation | set |\n"
            << "          inspect | hash | sign | address | burn-batch\n\n";
  std::cout << options << '\n';
}

int run(const std::string& command, const po::variables_map& vm) {
  if (command == "transfer-spec") {
    std::cout << prefixed(transfer::encode(build_spec(vm))) << '\n';
    return 0;
  }

  if (command == "burn-intent") {
    auto intent = transfer::burn_intent{
        .max_block_height = get_amount(vm, "max-block-height"),
        .max_fee = get_amount(vm, "max-fee"),
        .spec = build_spec(vm)};
    std::cout << prefixed(transfer::encode(intent)) << '\n';
    return 0;
  }

  if (command == "attestation") {
    auto attestation = transfer::attestation{.spec = build_spec(vm)};
    std::cout << prefixed(transfer::encode(attestation)) << '\n';
    return 0;
  }

  if (command == "set") {
    auto elements = std::vector<bytes_t>{};
    if (vm.contains("element")) {
      for (const auto& element : vm["element"].as<std::vector<std::string>>()) {
        elements.push_back(decode_hex(element));
      }
    }
    auto kind = vm["kind"].as<std::string>();
    if (kind == "burn-intent") {
      std::cout << prefixed(
                       transfer::encode_set<transfer::burn_intent_set_traits>(
                           elements))
                << '\n';
      return 0;
    }
    if (kind == "attestation") {
      std::cout << prefixed(
                       transfer::encode_set<transfer::attestation_set_traits>(
                           elements))
                << '\n';
      return 0;
    }
    gateway::common::critical("--kind must be burn-intent|attestation");
  }

  if (command == "inspect" || command == "hash") {
    auto payload = get_bytes(vm, "payload");
    auto magic = transfer::detail::peek_magic(payload);
    if (magic == transfer::layout::kTransferSpecMagic) {
      auto spec = transfer::transfer_spec_view::cast(payload);
      spec.validate();
      if (command == "inspect") {
        std::cout << "kind: transfer-spec\n";
        print_spec({}, spec);
      } else {
        std::cout << "hash: " << prefixed(spec.hash()) << '\n'
                  << "typed_data_hash: " << prefixed(spec.typed_data_hash())
                  << '\n';
      }
      return 0;
    }
    if (magic == transfer::layout::kBurnIntentMagic ||
        magic == transfer::layout::kBurnIntentSetMagic) {
      if (command == "inspect") {
        inspect_payload<transfer::burn_intent_set_traits>("burn-intent",
                                                          payload);
      } else {
        hash_payload<transfer::burn_intent_set_traits>(
            payload, make_domain(vm, transfer::typed_data::wallet_domain()));
      }
      return 0;
    }
    if (command == "inspect") {
      inspect_payload<transfer::attestation_set_traits>("attestation",
                                                        payload);
    } else {
      hash_payload<transfer::attestation_set_traits>(
          payload, make_domain(vm, transfer::typed_data::minter_domain()));
    }
    return 0;
  }

  if (command == "sign") {
    auto signature = gateway::crypto::sign_digest(
        get_hash32(vm, "digest"), get_hash32(vm, "private-key"));
    if (!signature.has_value()) {
      gateway::common::critical("failed to sign digest");
    }
    std::cout << prefixed(bytes_view_t{signature->data(), signature->size()})
              << '\n';
    return 0;
  }

  if (command == "address") {
    auto address = gateway::crypto::address_from_private_key(
        get_hash32(vm, "private-key"));
    if (!address.has_value()) {
      gateway::common::critical("invalid private key");
    }
    std::cout << address_string(*address) << '\n';
    return 0;
  }

  if (command == "burn-batch") {
    auto batch = gateway::execution::burn_batch_t{};
    if (vm.contains("entry")) {
      for (const auto& entry : vm["entry"].as<std::vector<std::string>>()) {
        batch.push_back(parse_batch_entry(entry));
      }
    }
    auto encoded = gateway::execution::encode_burn_batch(batch);
    std::cout << "batch: " << prefixed(encoded) << '\n'
              << "digest: "
              << prefixed(gateway::execution::burn_batch_digest(encoded))
              << '\n';
    return 0;
  }

  gateway::common::critical(
      "command must be transfer-spec|burn-intent|attestation|set|inspect|"
      "hash|sign|address|burn-batch");
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"payload_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transfer-spec|burn-intent|attestation|set|inspect|hash|sign|address|"
      "burn-batch")("source-domain", po::value<uint32_t>()->default_value(0),
                    "source domain")(
      "destination-domain", po::value<uint32_t>()->default_value(0),
      "destination domain")("source-contract", po::value<std::string>(),
                            "source contract address")(
      "destination-contract", po::value<std::string>(),
      "destination contract address")("source-token", po::value<std::string>(),
                                      "source token address")(
      "destination-token", po::value<std::string>(),
      "destination token address")("source-depositor",
                                   po::value<std::string>(),
                                   "source depositor address")(
      "destination-recipient", po::value<std::string>(),
      "destination recipient address")("source-signer",
                                       po::value<std::string>(),
                                       "source signer address")(
      "destination-caller", po::value<std::string>(),
      "destination caller address, zero for anyone")(
      "value", po::value<std::string>()->default_value("0"),
      "decimal transfer value")("salt", po::value<std::string>(),
                                "32-byte salt hex")(
      "hook-data", po::value<std::string>(), "hook data hex")(
      "spec", po::value<std::string>(),
      "encoded TransferSpec hex, instead of the field options")(
      "max-block-height", po::value<std::string>()->default_value("0"),
      "burn intent expiry block")(
      "max-fee", po::value<std::string>()->default_value("0"),
      "burn intent fee cap")("kind",
                             po::value<std::string>()->default_value(
                                 "burn-intent"),
                             "burn-intent|attestation")(
      "element", po::value<std::vector<std::string>>()->multitoken(),
      "encoded set element hex values")(
      "payload", po::value<std::string>(), "encoded payload hex")(
      "domain-name", po::value<std::string>(), "EIP-712 domain name")(
      "domain-version", po::value<std::string>(), "EIP-712 domain version")(
      "digest", po::value<std::string>(), "32-byte digest hex")(
      "private-key", po::value<std::string>(), "32-byte secp256k1 key hex")(
      "entry", po::value<std::vector<std::string>>()->multitoken(),
      "burn batch entry PAYLOAD:SIGNATURE[:FEE,FEE,...]");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  try {
    return run(command, vm);
  } catch (const gateway::schema::error& e) {
    std::cerr << "error: " << gateway::schema::to_string(e.code());
    if (!e.info().empty()) {
      std::cerr << " " << e.info();
    }
    std::cerr << '\n';
    return 1;
  }
}
