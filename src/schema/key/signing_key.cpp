#include <keyward/schema/key/builder.hpp>
#include <keyward/schema/key/signing_key.hpp>

namespace keyward::schema::key {

bytes_t make_local_key_key(const std::string_view& key_id) {
  auto b = builder{};
  b.write("LOCAL_KEY|");
  b.hash(key_id);
  return b.data;
}

}  // namespace keyward::schema::key
