#include <keyward/schema/key/automation_wallet.hpp>
#include <keyward/schema/key/builder.hpp>

namespace keyward::schema::key {

bytes_t make_wallet_key(const hash32_t& wallet_id) {
  auto b = builder{};
  b.write("WALLET|");
  b.write(wallet_id);
  return b.data;
}

bytes_t make_owner_key(const std::string_view& owner,
                       const wallet_purpose_t& purpose) {
  auto b = builder{};
  b.write("WALLET_OWNER|");
  b.hash(owner);
  b.write(purpose);
  return b.data;
}

bytes_t make_address_key(const address_t& address) {
  auto b = builder{};
  b.write("WALLET_ADDR|");
  b.write(address);
  return b.data;
}

}  // namespace keyward::schema::key
