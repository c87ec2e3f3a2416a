#include <stdexcept>

#include <nlohmann/json.hpp>

#include "relaydeck/validation/event_validator.hpp"

using namespace relaydeck::data;
using namespace relaydeck::signer;
using namespace relaydeck::validation;
using namespace std;

EventValidator::EventValidator(
    shared_ptr<ISignatureVerifier> verifier,
    chrono::seconds futureSkewTolerance)
: EventValidator(verifier, futureSkewTolerance, []() { return time(nullptr); }) { };

EventValidator::EventValidator(
    shared_ptr<ISignatureVerifier> verifier,
    chrono::seconds futureSkewTolerance,
    function<time_t()> clock)
: _verifier(verifier), _futureSkewTolerance(futureSkewTolerance), _clock(clock)
{
    if (this->_verifier == nullptr)
    {
        throw invalid_argument("EventValidator: A signature verifier is required.");
    }
};

void EventValidator::validate(const Event& candidate) const
{
    string expectedId;
    try
    {
        expectedId = candidate.computeId();
    }
    catch (const nlohmann::json::exception& je)
    {
        // Content that cannot be canonically serialized cannot hash to the claimed ID.
        throw ValidationError(ValidationFailure::IdMismatch, string("Event cannot be serialized: ") + je.what());
    }

    if (expectedId != candidate.id)
    {
        throw ValidationError(
            ValidationFailure::IdMismatch,
            "Event ID " + candidate.id + " does not match its content hash " + expectedId);
    }

    if (!this->_verifier->verify(candidate.id, candidate.pubkey, candidate.sig))
    {
        throw ValidationError(
            ValidationFailure::BadSignature,
            "Signature of event " + candidate.id + " does not verify against pubkey " + candidate.pubkey);
    }

    time_t latestAccepted = this->_clock() + static_cast<time_t>(this->_futureSkewTolerance.count());
    if (candidate.createdAt > latestAccepted)
    {
        throw ValidationError(
            ValidationFailure::FutureTimestamp,
            "Event " + candidate.id + " is dated " + to_string(candidate.createdAt)
                + ", beyond the accepted skew of " + to_string(this->_futureSkewTolerance.count()) + "s");
    }
};
