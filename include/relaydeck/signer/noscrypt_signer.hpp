#pragma once

#include <memory>
#include <string>

#include <plog/Init.h>
#include <plog/Log.h>
#include <noscrypt.h>

#include "relaydeck/signer/signer.hpp"

namespace relaydeck
{
namespace signer
{
/**
 * @brief Signs events locally with a secret key, using the noscrypt library.
 */
class NoscryptSigner : public ISigner
{
public:
    /**
     * @brief Creates a signer with a freshly generated keypair.
     */
    NoscryptSigner(std::shared_ptr<plog::IAppender> appender);

    /**
     * @brief Creates a signer for the given hex-encoded secret key.
     * @throws `std::invalid_argument` if the key is not a valid secp256k1 secret key.
     */
    NoscryptSigner(std::shared_ptr<plog::IAppender> appender, const std::string& secretKey);

    ~NoscryptSigner();

    void sign(std::shared_ptr<data::Event> event) override;

    std::string publicKey() const override;

private:
    std::shared_ptr<NCContext> _noscryptContext;

    ///< Local nsec used to sign events.
    std::shared_ptr<NCSecretKey> _privateKey;

    ///< Local npub derived from the secret key.
    std::shared_ptr<NCPublicKey> _publicKey;

    /**
     * @brief Derives the public key from the current secret key.
     * @returns True if the derivation succeeded.
     */
    bool _derivePublicKey();
};

/**
 * @brief Verifies event signatures with the noscrypt library.
 */
class NoscryptVerifier : public ISignatureVerifier
{
public:
    NoscryptVerifier(std::shared_ptr<plog::IAppender> appender);

    bool verify(const std::string& id, const std::string& pubkey, const std::string& sig) const override;

private:
    std::shared_ptr<NCContext> _noscryptContext;
};
} // namespace signer
} // namespace relaydeck
