#include <keyward/evm/abi.hpp>
#include <keyward/keccak/hash.hpp>

#include <algorithm>
#include <iterator>

namespace keyward::evm::abi {

using namespace keyward::schema;

selector_t make_selector(const std::string_view& signature) {
  auto digest = keyward::keccak::hash(signature);
  auto selector = selector_t{};
  std::copy_n(digest.begin(), selector.size(), selector.begin());
  return selector;
}

hash32_t encode_address(const address_t& address) {
  auto word = hash32_t{};
  std::ranges::copy(address, word.begin() + (word.size() - address.size()));
  return word;
}

bytes_t encode_erc20_approve(const address_t& spender, const amount_t& amount) {
  auto calldata = bytes_t{};
  calldata.reserve(4 + 32 + 32);
  std::ranges::copy(kErc20ApproveSelector, std::back_inserter(calldata));
  std::ranges::copy(encode_address(spender), std::back_inserter(calldata));
  std::ranges::copy(to_word(amount), std::back_inserter(calldata));
  return calldata;
}

}  // namespace keyward::evm::abi
