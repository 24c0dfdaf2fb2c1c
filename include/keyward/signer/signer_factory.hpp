#pragma once

#include <keyward/common/config.hpp>
#include <keyward/crypto/random_source.hpp>
#include <keyward/signer/hsm_client.hpp>
#include <keyward/signer/key_store.hpp>
#include <keyward/signer/signing_backend.hpp>

#include <memory>

namespace keyward::signer {

/// Builds the backend named by configuration. Called once at start up; the
/// result is passed to every component that signs.
///
/// managed-hsm needs a caller supplied hsm_client. Credentials and transport
/// belong to that client, so the CLI, which passes none, can only run local.
///
/// Throws signer_error{configuration_error} when the local master secret is
/// missing or malformed, or when managed-hsm is selected without a client or
/// region.
std::unique_ptr<signing_backend> make_signing_backend(
    const keyward::common::config& options,
    key_store& store,
    keyward::crypto::random_source& random,
    hsm_client* client = nullptr);

}  // namespace keyward::signer
