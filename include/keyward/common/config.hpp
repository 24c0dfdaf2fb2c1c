#pragma once

#include <keyward/schema/key_provider.hpp>

#include <boost/program_options.hpp>

#include <string>
#include <string_view>

namespace keyward::common {

inline constexpr auto kEnvironmentPrefix = std::string_view{"KEYWARD_"};

struct logging_config final {
  std::string level{"info"};
  std::string file{"keyward.log"};
};

struct config final {
  keyward::schema::key_provider_t signer_backend{
      keyward::schema::key_provider_t::local};
  std::string local_encryption_key;
  std::string hsm_region{"us-east-1"};
  std::string hsm_key_alias_prefix{"keyward"};
  std::string db_path{"keyward.db"};
  logging_config logging;
};

/// Options understood by every keyward process.
boost::program_options::options_description make_config_options();

/// Map KEYWARD_SOME_OPTION to some-option for every option in description and
/// store the values present in the process environment. Values already stored
/// from the command line win.
void store_environment(
    const boost::program_options::options_description& description,
    boost::program_options::variables_map& variables);

/// Throws signer_error{configuration_error} on an unknown backend or level.
config make_config(const boost::program_options::variables_map& variables);

}  // namespace keyward::common
