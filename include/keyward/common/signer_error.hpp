#pragma once

#include <keyward/schema/signer_error_code.hpp>

#include <stdexcept>
#include <string>

namespace keyward::common {

/// Infrastructure failure raised by backends, the registry and the nonce
/// allocator. Intent rejections are returned, never thrown.
class signer_error : public std::runtime_error {
 public:
  signer_error(keyward::schema::signer_error_code_t code,
               const std::string& message)
      : std::runtime_error(message), code_(code) {}

  keyward::schema::signer_error_code_t code() const noexcept { return code_; }

 private:
  keyward::schema::signer_error_code_t code_;
};

}  // namespace keyward::common
