#include <keyward/common/config.hpp>
#include <keyward/common/signer_error.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace keyward::common {

namespace po = boost::program_options;

namespace {

constexpr auto kLogLevels = std::array<std::string_view, 7>{
    "trace", "debug", "info", "warn", "error", "critical", "off"};

std::string environment_to_option(const std::string& variable) {
  if (!std::string_view{variable}.starts_with(kEnvironmentPrefix)) {
    return {};
  }
  auto option = variable.substr(kEnvironmentPrefix.size());
  std::ranges::transform(option, option.begin(), [](const unsigned char c) {
    return c == '_' ? '-' : static_cast<char>(std::tolower(c));
  });
  return option;
}

template <typename T>
T value_or(const po::variables_map& variables,
           const std::string& name,
           T fallback) {
  if (!variables.contains(name)) {
    return fallback;
  }
  return variables[name].as<T>();
}

}  // namespace

po::options_description make_config_options() {
  auto description = po::options_description{"Keyward"};
  description.add_options()(
      "signer-backend", po::value<std::string>()->default_value("local"),
      "Signing backend: local, or managed-hsm when embedded with an hsm_client")(
      "local-encryption-key", po::value<std::string>(),
      "64 hex character master secret for the local backend")(
      "hsm-region", po::value<std::string>()->default_value("us-east-1"),
      "Managed HSM region")(
      "hsm-key-alias-prefix",
      po::value<std::string>()->default_value("keyward"),
      "Description and tag prefix for created HSM keys")(
      "db-path", po::value<std::string>()->default_value("keyward.db"),
      "RocksDB directory")(
      "log-level", po::value<std::string>()->default_value("info"),
      "trace, debug, info, warn, error, critical or off")(
      "log-file", po::value<std::string>()->default_value("keyward.log"),
      "Log file path");
  return description;
}

void store_environment(const po::options_description& description,
                       po::variables_map& variables) {
  auto known = [&](const std::string& variable) -> std::string {
    auto option = environment_to_option(variable);
    if (option.empty() || description.find_nothrow(option, false) == nullptr) {
      return {};
    }
    return option;
  };
  po::store(po::parse_environment(description, known), variables);
}

config make_config(const po::variables_map& variables) {
  auto out = config{};

  auto backend =
      value_or<std::string>(variables, "signer-backend", "local");
  auto provider =
      keyward::schema::try_from_string<keyward::schema::key_provider_t>(
          backend);
  if (!provider) {
    throw signer_error{keyward::schema::signer_error_code_t::configuration_error,
                       "unknown signer backend '" + backend + "'"};
  }
  out.signer_backend = *provider;

  out.local_encryption_key =
      value_or<std::string>(variables, "local-encryption-key", "");
  out.hsm_region = value_or<std::string>(variables, "hsm-region", "us-east-1");
  out.hsm_key_alias_prefix =
      value_or<std::string>(variables, "hsm-key-alias-prefix", "keyward");
  out.db_path = value_or<std::string>(variables, "db-path", "keyward.db");

  out.logging.level = value_or<std::string>(variables, "log-level", "info");
  if (std::ranges::find(kLogLevels, out.logging.level) == kLogLevels.end()) {
    throw signer_error{keyward::schema::signer_error_code_t::configuration_error,
                       "unknown log level '" + out.logging.level + "'"};
  }
  out.logging.file = value_or<std::string>(variables, "log-file", "keyward.log");
  return out;
}

}  // namespace keyward::common
