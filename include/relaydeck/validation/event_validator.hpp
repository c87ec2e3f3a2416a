#pragma once

#include <chrono>
#include <ctime>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "relaydeck/data/data.hpp"
#include "relaydeck/signer/signer.hpp"

namespace relaydeck
{
namespace validation
{
enum class ValidationFailure
{
    IdMismatch,
    BadSignature,
    FutureTimestamp
};

/**
 * @brief Thrown when an event fails validation.
 * @remark A failed event is dropped on its own.  A single invalid event is not taken as evidence
 * that the relay that sent it is misbehaving.
 */
class ValidationError : public std::invalid_argument
{
public:
    ValidationError(ValidationFailure failure, const std::string& message)
    : std::invalid_argument(message), _failure(failure) { };

    ValidationFailure failure() const { return this->_failure; };

private:
    ValidationFailure _failure;
};

/**
 * @brief An interface for the trust boundary between relay traffic and the rest of the client.
 */
class IEventValidator
{
public:
    virtual ~IEventValidator() = default;

    /**
     * @brief Validates the given event.
     * @throws `ValidationError` describing the first check the event failed.
     */
    virtual void validate(const data::Event& candidate) const = 0;
};

/**
 * @brief Checks event IDs, signatures, and timestamps.
 * @remark Checks run in order and stop at the first failure: the ID is recomputed from the
 * canonical serialization, then the signature is verified against the ID and pubkey, then
 * events dated too far in the future are rejected.
 */
class EventValidator : public IEventValidator
{
public:
    EventValidator(
        std::shared_ptr<signer::ISignatureVerifier> verifier,
        std::chrono::seconds futureSkewTolerance);

    /**
     * @param clock Returns the current unix time.  Tests use it to pin the present.
     */
    EventValidator(
        std::shared_ptr<signer::ISignatureVerifier> verifier,
        std::chrono::seconds futureSkewTolerance,
        std::function<std::time_t()> clock);

    void validate(const data::Event& candidate) const override;

private:
    std::shared_ptr<signer::ISignatureVerifier> _verifier;
    std::chrono::seconds _futureSkewTolerance;
    std::function<std::time_t()> _clock;
};
} // namespace validation
} // namespace relaydeck
