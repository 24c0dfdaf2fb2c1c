#pragma once
#include <string>
#include <string_view>
#include <variant>

// Schema type: wallet purpose.
// Automation class of a wallet. One active wallet exists per owner and
// purpose.
namespace keyward::schema {

/// One per user, used by position automation.
struct automation_purpose final {
  bool operator==(const automation_purpose&) const = default;
};

/// One per strategy owned by the user.
struct strategy_purpose final {
  std::string strategy_id;

  bool operator==(const strategy_purpose&) const = default;
};

using wallet_purpose_t = std::variant<automation_purpose, strategy_purpose>;

inline std::string_view purpose_name(const wallet_purpose_t& purpose) {
  return std::holds_alternative<automation_purpose>(purpose) ? "automation"
                                                             : "strategy";
}

}  // namespace keyward::schema
