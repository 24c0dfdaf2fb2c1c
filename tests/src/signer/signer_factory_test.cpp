#include <gtest/gtest.h>
#include <keyward/common/config.hpp>
#include <keyward/signer/signer_factory.hpp>
#include <keyward/testing/common.hpp>
#include <keyward/testing/errors.hpp>
#include <keyward/testing/fake_hsm_client.hpp>
#include <keyward/testing/random.hpp>

#include <cstdlib>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

using keyward::schema::signer_error_code_t;
using keyward::testing::signer_error_code_of;

/// Sets an environment variable for the lifetime of the guard.
struct scoped_env final {
  std::string name;

  scoped_env(std::string variable, const std::string& value)
      : name(std::move(variable)) {
    ::setenv(name.c_str(), value.c_str(), 1);
  }
  ~scoped_env() { ::unsetenv(name.c_str()); }
};

po::variables_map parse(const std::vector<std::string>& args) {
  auto description = keyward::common::make_config_options();
  auto variables = po::variables_map{};
  po::store(po::command_line_parser(args).options(description).run(),
            variables);
  keyward::common::store_environment(description, variables);
  po::notify(variables);
  return variables;
}

keyward::common::config local_config() {
  auto options = keyward::common::config{};
  options.local_encryption_key = std::string{keyward::testing::kMasterKeyHex};
  return options;
}

}  // namespace

TEST(config, defaults) {
  auto options = keyward::common::make_config(parse({}));
  EXPECT_EQ(options.signer_backend, keyward::schema::key_provider_t::local);
  EXPECT_TRUE(options.local_encryption_key.empty());
  EXPECT_EQ(options.hsm_region, "us-east-1");
  EXPECT_EQ(options.db_path, "keyward.db");
  EXPECT_EQ(options.logging.level, "info");
}

TEST(config, command_line_values) {
  auto options = keyward::common::make_config(
      parse({"--signer-backend", "managed-hsm", "--hsm-region", "eu-west-1",
             "--log-level", "debug"}));
  EXPECT_EQ(options.signer_backend,
            keyward::schema::key_provider_t::managed_hsm);
  EXPECT_EQ(options.hsm_region, "eu-west-1");
  EXPECT_EQ(options.logging.level, "debug");
}

TEST(config, hsm_credentials_are_not_options) {
  EXPECT_THROW(parse({"--hsm-access-key-id", "AKIDEXAMPLE"}), po::unknown_option);
  EXPECT_THROW(parse({"--hsm-secret-access-key", "secret"}), po::unknown_option);
}

TEST(config, environment_values) {
  auto key = scoped_env{"KEYWARD_LOCAL_ENCRYPTION_KEY",
                        std::string{keyward::testing::kMasterKeyHex}};
  auto path = scoped_env{"KEYWARD_DB_PATH", "/tmp/keyward-env.db"};
  auto unrelated = scoped_env{"KEYWARD_NOT_AN_OPTION", "ignored"};

  auto options = keyward::common::make_config(parse({}));
  EXPECT_EQ(options.local_encryption_key, keyward::testing::kMasterKeyHex);
  EXPECT_EQ(options.db_path, "/tmp/keyward-env.db");
}

TEST(config, command_line_wins_over_environment) {
  auto path = scoped_env{"KEYWARD_DB_PATH", "/tmp/from-env.db"};
  auto options =
      keyward::common::make_config(parse({"--db-path", "/tmp/from-args.db"}));
  EXPECT_EQ(options.db_path, "/tmp/from-args.db");
}

TEST(config, unknown_values_are_rejected) {
  EXPECT_EQ(signer_error_code_of([] {
              keyward::common::make_config(
                  parse({"--signer-backend", "cloud"}));
            }),
            signer_error_code_t::configuration_error);
  EXPECT_EQ(signer_error_code_of([] {
              keyward::common::make_config(parse({"--log-level", "loud"}));
            }),
            signer_error_code_t::configuration_error);
}

TEST(signer_factory, builds_local_backend) {
  auto store = keyward::signer::memory_key_store{};
  auto random = keyward::testing::scripted_random_source{};
  auto backend =
      keyward::signer::make_signing_backend(local_config(), store, random);
  ASSERT_NE(backend, nullptr);
  EXPECT_EQ(backend->provider(), keyward::schema::key_provider_t::local);
}

TEST(signer_factory, local_backend_needs_master_secret) {
  auto store = keyward::signer::memory_key_store{};
  auto random = keyward::testing::scripted_random_source{};
  auto options = keyward::common::config{};
  EXPECT_EQ(signer_error_code_of([&] {
              keyward::signer::make_signing_backend(options, store, random);
            }),
            signer_error_code_t::configuration_error);
}

TEST(signer_factory, builds_managed_hsm_backend) {
  auto store = keyward::signer::memory_key_store{};
  auto random = keyward::testing::scripted_random_source{};
  auto client = keyward::testing::fake_hsm_client{};
  auto options = keyward::common::config{};
  options.signer_backend = keyward::schema::key_provider_t::managed_hsm;
  options.hsm_key_alias_prefix = "desk";

  auto backend =
      keyward::signer::make_signing_backend(options, store, random, &client);
  ASSERT_NE(backend, nullptr);
  EXPECT_EQ(backend->provider(), keyward::schema::key_provider_t::managed_hsm);

  backend->create_key("label");
  ASSERT_TRUE(client.last_spec.has_value());
  EXPECT_EQ(client.last_spec->description, "desk automation wallet: label");
}

TEST(signer_factory, managed_hsm_needs_client_and_region) {
  auto store = keyward::signer::memory_key_store{};
  auto random = keyward::testing::scripted_random_source{};
  auto client = keyward::testing::fake_hsm_client{};
  auto options = keyward::common::make_config(
      parse({"--signer-backend", "managed-hsm", "--hsm-region", "eu-west-1"}));

  try {
    keyward::signer::make_signing_backend(options, store, random);
    FAIL() << "managed-hsm without a client must not build";
  } catch (const keyward::common::signer_error& e) {
    EXPECT_EQ(e.code(), signer_error_code_t::configuration_error);
    EXPECT_NE(std::string{e.what()}.find("hsm_client"), std::string::npos);
  }

  options.hsm_region.clear();
  EXPECT_EQ(signer_error_code_of([&] {
              keyward::signer::make_signing_backend(options, store, random,
                                                    &client);
            }),
            signer_error_code_t::configuration_error);
}
