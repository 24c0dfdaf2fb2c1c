#include <keyward/schema/key/builder.hpp>
#include <keyward/schema/key/intent_nonce_record.hpp>

namespace keyward::schema::key {

bytes_t make_intent_nonce_key(const address_t& signer,
                              const chain_id_t chain_id,
                              const std::string_view& nonce) {
  auto b = builder{};
  b.write("INTENT_NONCE|");
  b.write(signer);
  b.write(chain_id);
  b.hash(nonce);
  return b.data;
}

}  // namespace keyward::schema::key
