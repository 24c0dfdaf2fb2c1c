#pragma once
#include <keyward/schema/primitives.hpp>
#include <string_view>

// Contract call encoding for the approval flow.
namespace keyward::evm::abi {

/// approve(address,uint256)
inline constexpr auto kErc20ApproveSelector =
    keyward::schema::selector_t{0x09, 0x5e, 0xa7, 0xb3};

/// First four bytes of keccak(signature), e.g. "transfer(address,uint256)".
keyward::schema::selector_t make_selector(const std::string_view& signature);

/// Left padded 32 byte word holding address.
keyward::schema::hash32_t encode_address(
    const keyward::schema::address_t& address);

keyward::schema::bytes_t encode_erc20_approve(
    const keyward::schema::address_t& spender,
    const keyward::schema::amount_t& amount);

}  // namespace keyward::evm::abi
