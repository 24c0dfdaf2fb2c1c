#include <boost/program_options.hpp>
#include <json/json.h>
#include <spdlog/spdlog.h>
#include <keyward/common/config.hpp>
#include <keyward/common/critical.hpp>
#include <keyward/common/logging.hpp>
#include <keyward/common/signer_error.hpp>
#include <keyward/crypto/random_source.hpp>
#include <keyward/evm/abi.hpp>
#include <keyward/evm/transaction_signer.hpp>
#include <keyward/intent/canonical_json.hpp>
#include <keyward/intent/intent_verifier.hpp>
#include <keyward/signer/key_store.hpp>
#include <keyward/signer/signer_factory.hpp>
#include <keyward/storage/rocksdb/storage.hpp>
#include <keyward/wallet/nonce_allocator.hpp>
#include <keyward/wallet/wallet_registry.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

namespace {

namespace po = boost::program_options;
using namespace keyward::schema;

struct services final {
  keyward::wallet::wallet_registry& registry;
  keyward::wallet::nonce_allocator& nonces;
  keyward::intent::intent_verifier& verifier;
};

void print_json(const Json::Value& value) {
  auto builder = Json::StreamWriterBuilder{};
  builder["indentation"] = "  ";
  std::cout << Json::writeString(builder, value) << '\n';
}

std::string require_string(const po::variables_map& vm,
                           const std::string& name) {
  if (!vm.contains(name)) {
    keyward::common::critical("missing required --" + name);
  }
  return vm[name].as<std::string>();
}

chain_id_t require_chain_id(const po::variables_map& vm) {
  if (!vm.contains("chain-id")) {
    keyward::common::critical("missing required --chain-id");
  }
  return vm["chain-id"].as<uint64_t>();
}

amount_t parse_amount(const std::string& text) {
  if (text.empty() || text.size() > 78 ||
      !std::ranges::all_of(text, [](const unsigned char c) {
        return std::isdigit(c) != 0;
      })) {
    keyward::common::critical("amount must be a decimal integer");
  }
  return amount_t{text.c_str()};
}

address_t parse_address(const std::string& text) {
  auto address = try_make_address(text);
  if (!address) {
    keyward::common::critical("invalid address " + text);
  }
  return *address;
}

wallet_purpose_t make_purpose(const po::variables_map& vm) {
  if (vm.contains("strategy")) {
    return strategy_purpose{.strategy_id = vm["strategy"].as<std::string>()};
  }
  return automation_purpose{};
}

Json::Value read_json_file(const std::string& path) {
  auto file = std::ifstream{path};
  if (!file) {
    keyward::common::critical("cannot open " + path);
  }
  auto text = std::string{std::istreambuf_iterator<char>{file},
                          std::istreambuf_iterator<char>{}};
  auto error = std::string{};
  auto value = keyward::intent::parse_json(text, error);
  if (!value) {
    keyward::common::critical("invalid JSON in " + path + ": " + error);
  }
  return *value;
}

Json::Value to_json(const automation_wallet_t& wallet) {
  auto out = Json::Value{Json::objectValue};
  out["walletId"] = "0x" + to_hex(wallet.wallet_id);
  out["owner"] = wallet.owner;
  out["purpose"] = std::string{purpose_name(wallet.purpose)};
  if (const auto* strategy = std::get_if<strategy_purpose>(&wallet.purpose)) {
    out["strategyId"] = strategy->strategy_id;
  }
  out["label"] = wallet.label;
  out["address"] = to_address_string(wallet.signing_key.wallet_address);
  out["keyId"] = wallet.signing_key.key_id;
  out["provider"] = std::string{to_string(wallet.signing_key.provider)};
  out["isActive"] = wallet.is_active;
  out["createdAt"] = Json::UInt64{wallet.created_at};
  if (wallet.last_used_at) {
    out["lastUsedAt"] = Json::UInt64{*wallet.last_used_at};
  }
  return out;
}

Json::Value to_json(const signature_result_t& signature) {
  auto out = Json::Value{Json::objectValue};
  out["r"] = "0x" + to_hex(signature.r);
  out["s"] = "0x" + to_hex(signature.s);
  out["v"] = signature.v;
  out["signature"] = "0x" + to_hex(signature.signature);
  return out;
}

template <typename Intent>
Json::Value to_json(const keyward::intent::verification_result<Intent>& result) {
  auto out = Json::Value{Json::objectValue};
  out["valid"] = result.valid;
  if (result.error_code) {
    out["errorCode"] = std::string{to_string(*result.error_code)};
    out["error"] = result.error;
  }
  if (result.recovered_address) {
    out["recoveredAddress"] = to_address_string(*result.recovered_address);
  }
  return out;
}

int run_command(const std::string& command,
                const po::variables_map& vm,
                services& svc) {
  if (command == "create-wallet") {
    auto wallet = svc.registry.create(require_string(vm, "owner"),
                                      make_purpose(vm),
                                      vm["label"].as<std::string>());
    print_json(to_json(wallet));
    return 0;
  }

  if (command == "get-wallet") {
    auto wallet = vm.contains("address")
                      ? svc.registry.get_by_address(
                            parse_address(vm["address"].as<std::string>()))
                      : svc.registry.get_by_owner(require_string(vm, "owner"),
                                                  make_purpose(vm));
    if (!wallet) {
      throw keyward::common::signer_error{signer_error_code_t::wallet_not_found,
                                          "wallet not found"};
    }
    print_json(to_json(*wallet));
    return 0;
  }

  if (command == "list-wallets") {
    auto out = Json::Value{Json::arrayValue};
    for (const auto& wallet :
         svc.registry.list_by_owner(require_string(vm, "owner"))) {
      out.append(to_json(wallet));
    }
    print_json(out);
    return 0;
  }

  if (command == "deactivate-wallet") {
    auto out = Json::Value{Json::objectValue};
    out["deactivated"] =
        svc.registry.deactivate(require_string(vm, "owner"), make_purpose(vm));
    print_json(out);
    return 0;
  }

  if (command == "sign-hash") {
    auto digest = try_make_hash32(require_string(vm, "hash"));
    if (!digest) {
      keyward::common::critical("--hash must be 32 bytes of hex");
    }
    auto signature = svc.registry.sign_hash_for(require_string(vm, "owner"),
                                                make_purpose(vm), *digest);
    print_json(to_json(signature));
    return 0;
  }

  if (command == "sign-tx") {
    auto owner = require_string(vm, "owner");
    auto purpose = make_purpose(vm);
    auto wallet = svc.registry.get_by_owner(owner, purpose);
    if (!wallet) {
      throw keyward::common::signer_error{signer_error_code_t::wallet_not_found,
                                          "no active wallet for " + owner};
    }
    auto chain_id = require_chain_id(vm);

    auto tx = keyward::evm::legacy_transaction_t{};
    tx.chain_id = chain_id;
    tx.nonce = vm.contains("nonce")
                   ? vm["nonce"].as<uint64_t>()
                   : svc.nonces.allocate_and_increment(wallet->wallet_id,
                                                       chain_id);
    tx.gas_price = parse_amount(require_string(vm, "gas-price"));
    tx.gas = vm["gas"].as<uint64_t>();
    if (vm.contains("to")) {
      tx.to = parse_address(vm["to"].as<std::string>());
    }
    tx.value = parse_amount(vm["value"].as<std::string>());
    if (vm.contains("data")) {
      auto data = try_from_hex(vm["data"].as<std::string>());
      if (!data) {
        keyward::common::critical("--data must be hex");
      }
      tx.data = *data;
    }

    auto signed_tx = keyward::evm::sign_legacy_transaction(
        tx, svc.registry.backend(), wallet->signing_key.key_id);
    svc.registry.touch(wallet->wallet_id);

    auto out = Json::Value{Json::objectValue};
    out["raw"] = "0x" + to_hex(signed_tx.raw);
    out["hash"] = "0x" + to_hex(signed_tx.hash);
    out["nonce"] = Json::UInt64{*tx.nonce};
    out["v"] = Json::UInt64{signed_tx.v};
    out["r"] = "0x" + to_hex(signed_tx.r);
    out["s"] = "0x" + to_hex(signed_tx.s);
    print_json(out);
    return 0;
  }

  if (command == "allocate-nonce" || command == "peek-nonce" ||
      command == "reset-nonce") {
    auto owner = require_string(vm, "owner");
    auto chain_id = require_chain_id(vm);
    auto out = Json::Value{Json::objectValue};
    if (command == "allocate-nonce") {
      out["nonce"] = Json::UInt64{svc.nonces.allocate_for_owner(owner, chain_id)};
    } else if (command == "peek-nonce") {
      out["nonce"] = Json::UInt64{svc.nonces.peek_for_owner(owner, chain_id)};
    } else {
      if (!vm.contains("nonce")) {
        keyward::common::critical("reset-nonce requires --nonce");
      }
      auto nonce = vm["nonce"].as<uint64_t>();
      svc.nonces.reset_for_owner(owner, chain_id, nonce);
      out["nonce"] = Json::UInt64{nonce};
    }
    print_json(out);
    return 0;
  }

  if (command == "verify-intent") {
    auto document = read_json_file(require_string(vm, "file"));
    if (!document.isObject() || !document["signature"].isString()) {
      keyward::common::critical(
          "verify-intent expects {\"intent\": ..., \"signature\": ...}");
    }
    auto signed_intent = keyward::intent::signed_generic_intent_t{
        .intent = document["intent"],
        .signature = document["signature"].asString()};
    auto result = svc.verifier.verify(
        signed_intent, {.skip_nonce_check = vm.contains("skip-nonce-check")});
    auto out = to_json(result);
    if (result.valid && vm.contains("record")) {
      out["recorded"] = svc.verifier.record_nonce_used(*result.intent);
    }
    print_json(out);
    return result.valid ? 0 : 2;
  }

  if (command == "verify-permission") {
    auto document = read_json_file(require_string(vm, "file"));
    auto error = std::string{};
    auto signed_intent =
        keyward::intent::parse_signed_permission_intent(document, error);
    if (!signed_intent) {
      auto out = Json::Value{Json::objectValue};
      out["valid"] = false;
      out["errorCode"] =
          std::string{to_string(intent_error_code_t::invalid_schema)};
      out["error"] = error;
      print_json(out);
      return 2;
    }
    auto result = svc.verifier.verify_permission(*signed_intent);
    auto out = to_json(result);
    if (result.valid && vm.contains("token")) {
      auto compliance = keyward::intent::check_erc20_approve_compliance(
          *result.intent, require_chain_id(vm),
          parse_address(vm["token"].as<std::string>()));
      out["approveCompliant"] = compliance.compliant;
      if (!compliance.compliant) {
        out["complianceError"] = compliance.reason;
      }
    }
    print_json(out);
    return result.valid ? 0 : 2;
  }

  if (command == "approve-calldata") {
    auto calldata = keyward::evm::abi::encode_erc20_approve(
        parse_address(require_string(vm, "spender")),
        parse_amount(require_string(vm, "amount")));
    std::cout << "0x" << to_hex(calldata) << '\n';
    return 0;
  }

  keyward::common::critical(
      "command must be create-wallet|get-wallet|list-wallets|"
      "deactivate-wallet|sign-hash|sign-tx|allocate-nonce|peek-nonce|"
      "reset-nonce|verify-intent|verify-permission|approve-calldata");
}

}  // namespace

int main(int argc, char* argv[]) {
  auto command = std::string{};

  auto options = po::options_description{"Keyward CLI"};
  options.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(&command), "command to run")(
      "owner", po::value<std::string>(), "wallet owner id")(
      "strategy", po::value<std::string>(),
      "strategy id; selects the strategy wallet of owner")(
      "label",
      po::value<std::string>()->default_value(
          std::string{keyward::schema::kDefaultWalletLabel}),
      "wallet label")("address", po::value<std::string>(),
                      "wallet address")("hash", po::value<std::string>(),
                                        "32 byte digest hex")(
      "chain-id", po::value<uint64_t>(), "EVM chain id")(
      "nonce", po::value<uint64_t>(), "transaction nonce")(
      "gas-price", po::value<std::string>(), "gas price in wei")(
      "gas", po::value<uint64_t>()->default_value(21000), "gas limit")(
      "to", po::value<std::string>(), "recipient address")(
      "value", po::value<std::string>()->default_value("0"), "value in wei")(
      "data", po::value<std::string>(), "call data hex")(
      "file", po::value<std::string>(), "signed intent JSON file")(
      "skip-nonce-check", "verify-intent without the replay check")(
      "record", "record the intent nonce after a successful verification")(
      "token", po::value<std::string>(), "ERC-20 token address")(
      "spender", po::value<std::string>(), "approval spender address")(
      "amount", po::value<std::string>(), "approval amount");
  options.add(keyward::common::make_config_options());

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  auto config = keyward::common::config{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    keyward::common::store_environment(options, vm);
    po::notify(vm);
    config = keyward::common::make_config(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n';
    return 1;
  } catch (const keyward::common::signer_error& e) {
    std::cerr << to_string(e.code()) << ": " << e.what() << '\n';
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << options << std::endl;
    return 0;
  }

  keyward::common::setup_logging(config.logging);

  auto exit_code = 0;
  try {
    auto storage = keyward::storage::make_storage<
        keyward::storage::rocksdb_storage_tag>(config.db_path);
    auto key_store = keyward::signer::storage_key_store{storage};
    auto random = keyward::crypto::openssl_random_source{};
    auto backend =
        keyward::signer::make_signing_backend(config, key_store, random);

    auto registry = keyward::wallet::wallet_registry{storage, *backend};
    auto nonces = keyward::wallet::nonce_allocator{storage, registry};
    auto verifier = keyward::intent::intent_verifier{storage};
    auto svc = services{registry, nonces, verifier};

    exit_code = run_command(command, vm, svc);
  } catch (const keyward::common::signer_error& e) {
    spdlog::error("{} failed with {}: {}", command, to_string(e.code()),
                  e.what());
    auto out = Json::Value{Json::objectValue};
    out["errorCode"] = std::string{to_string(e.code())};
    out["error"] = e.what();
    print_json(out);
    exit_code = 1;
  }

  spdlog::shutdown();
  return exit_code;
}
