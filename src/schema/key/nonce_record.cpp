#include <keyward/schema/key/builder.hpp>
#include <keyward/schema/key/nonce_record.hpp>

namespace keyward::schema::key {

bytes_t make_key(const hash32_t& wallet_id, const chain_id_t chain_id) {
  auto b = builder{};
  b.write("NONCE|");
  b.write(wallet_id);
  b.write(chain_id);
  return b.data;
}

}  // namespace keyward::schema::key
