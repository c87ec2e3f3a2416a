#pragma once

#include <memory>
#include <string>

#include "relaydeck/data/data.hpp"

namespace relaydeck
{
namespace signer
{
/**
 * @brief An interface for Nostr event signing.
 */
class ISigner
{
public:
    virtual ~ISigner() = default;

    /**
     * @brief Signs the given Nostr event.
     * @param event The event to sign.
     * @remark The event's `pubkey`, `id`, and `sig` fields will be updated in-place.
     * @throws `std::invalid_argument` if the event cannot be serialized.
     * @throws `std::runtime_error` if the signature could not be produced.
     */
    virtual void sign(std::shared_ptr<data::Event> event) = 0;

    /**
     * @brief Returns the hex-encoded public key of the signing identity.
     */
    virtual std::string publicKey() const = 0;
};

/**
 * @brief An interface for verifying BIP-340 Schnorr signatures over Nostr event IDs.
 */
class ISignatureVerifier
{
public:
    virtual ~ISignatureVerifier() = default;

    /**
     * @brief Verifies a signature.
     * @param id The hex-encoded 32-byte event ID that was signed.
     * @param pubkey The hex-encoded 32-byte x-only public key of the claimed author.
     * @param sig The hex-encoded 64-byte signature.
     * @returns True if the signature is valid, false otherwise, including when any argument is
     * not valid hex of the expected length.
     * @remark Implementations must be safe to call from several connection threads at once.
     */
    virtual bool verify(const std::string& id, const std::string& pubkey, const std::string& sig) const = 0;
};
} // namespace signer
} // namespace relaydeck
