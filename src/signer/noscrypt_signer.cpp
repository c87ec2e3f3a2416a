#include <memory>
#include <stdexcept>

#include "relaydeck/signer/noscrypt_signer.hpp"
#include "../cryptography/noscrypt_context.hpp"
#include "../cryptography/nostr_secure_rng.hpp"
#include "../internal/hex.hpp"
#include "../internal/logging.hpp"
#include "../internal/noscrypt_logger.hpp"

using namespace std;
using namespace relaydeck::cryptography;
using namespace relaydeck::data;
using namespace relaydeck::internal;
using namespace relaydeck::signer;

#pragma region Local Statics

/**
 * @brief Generates a secret key for local use.
 * @remarks Loop attempts to generate a secret key until a valid key is produced.  The number of
 * attempts is limited to prevent resource exhaustion in the event of a failure.
 */
static void createLocalSecretKey(const shared_ptr<const NCContext> ctx, shared_ptr<NCSecretKey> secret)
{
    NCResult secretValidationResult;
    int loopCount = 0;
    do
    {
        NostrSecureRng::fill(secret.get(), sizeof(NCSecretKey));

        secretValidationResult = NCValidateSecretKey(ctx.get(), secret.get());

    } while (secretValidationResult != NC_SUCCESS && ++loopCount < 64);

    if (secretValidationResult != NC_SUCCESS)
    {
        NC_LOG_ERROR(secretValidationResult);
        throw runtime_error("NoscryptSigner: Failed to generate a valid secret key.");
    }
};

#pragma endregion

#pragma region NoscryptSigner

NoscryptSigner::NoscryptSigner(shared_ptr<plog::IAppender> appender)
{
    initLogging(appender);

    this->_noscryptContext = createNoscryptContext();
    this->_privateKey = make_shared<NCSecretKey>();
    this->_publicKey = make_shared<NCPublicKey>();

    createLocalSecretKey(this->_noscryptContext, this->_privateKey);
    if (!this->_derivePublicKey())
    {
        throw runtime_error("NoscryptSigner: Failed to derive the public key.");
    }
};

NoscryptSigner::NoscryptSigner(shared_ptr<plog::IAppender> appender, const string& secretKey)
{
    initLogging(appender);

    this->_noscryptContext = createNoscryptContext();
    this->_privateKey = make_shared<NCSecretKey>();
    this->_publicKey = make_shared<NCPublicKey>();

    if (!fromHex(secretKey, this->_privateKey->key, sizeof(NCSecretKey)))
    {
        throw invalid_argument("NoscryptSigner: The secret key must be 32 bytes of hex.");
    }

    NCResult validationResult = NCValidateSecretKey(this->_noscryptContext.get(), this->_privateKey.get());
    if (validationResult != NC_SUCCESS || !this->_derivePublicKey())
    {
        NostrSecureRng::zero(this->_privateKey.get(), sizeof(NCSecretKey));
        throw invalid_argument("NoscryptSigner: The secret key is not a valid secp256k1 key.");
    }
};

NoscryptSigner::~NoscryptSigner()
{
    // The secret key should not outlive the signer in memory.
    NostrSecureRng::zero(this->_privateKey.get(), sizeof(NCSecretKey));
};

void NoscryptSigner::sign(shared_ptr<Event> event)
{
    if (event == nullptr)
    {
        throw invalid_argument("NoscryptSigner::sign: No event was provided.");
    }

    event->pubkey = this->publicKey();
    event->serialize(); // Generates the event ID.

    uint8_t digest[32];
    if (!fromHex(event->id, digest, sizeof(digest)))
    {
        throw runtime_error("NoscryptSigner::sign: The generated event ID is not valid hex.");
    }

    uint8_t schnorrSig[64];
    uint8_t random32[32];

    // Secure random signing entropy is required.
    NostrSecureRng::fill(random32, sizeof(random32));

    NCResult signatureResult = NCSignDigest(
        this->_noscryptContext.get(),
        this->_privateKey.get(),
        random32,
        digest,
        schnorrSig);

    // Random buffer could leak sensitive signing information.
    NostrSecureRng::zero(random32, sizeof(random32));

    if (signatureResult != NC_SUCCESS)
    {
        NC_LOG_ERROR(signatureResult);
        throw runtime_error("NoscryptSigner::sign: Failed to sign event " + event->id);
    }

    event->sig = toHex(schnorrSig, sizeof(schnorrSig));
    PLOG_VERBOSE << "Signed event " << event->id;
};

string NoscryptSigner::publicKey() const
{
    return toHex(this->_publicKey->key, sizeof(NCPublicKey));
};

bool NoscryptSigner::_derivePublicKey()
{
    // Use noscrypt to derive the public key from its private counterpart.
    NCResult pubkeyGenerationResult = NCGetPublicKey(
        this->_noscryptContext.get(),
        this->_privateKey.get(),
        this->_publicKey.get());

    if (pubkeyGenerationResult != NC_SUCCESS)
    {
        NC_LOG_ERROR(pubkeyGenerationResult);
        return false;
    }
    return true;
};

#pragma endregion

#pragma region NoscryptVerifier

NoscryptVerifier::NoscryptVerifier(shared_ptr<plog::IAppender> appender)
{
    initLogging(appender);
    this->_noscryptContext = createNoscryptContext();
};

bool NoscryptVerifier::verify(const string& id, const string& pubkey, const string& sig) const
{
    uint8_t digest[32];
    uint8_t schnorrSig[64];
    NCPublicKey publicKey;

    if (!fromHex(id, digest, sizeof(digest))
        || !fromHex(pubkey, publicKey.key, sizeof(NCPublicKey))
        || !fromHex(sig, schnorrSig, sizeof(schnorrSig)))
    {
        return false;
    }

    // Failures are reported by the caller; noscrypt errors are not logged here.
    NCResult verificationResult = NCVerifyDigest(
        this->_noscryptContext.get(),
        &publicKey,
        digest,
        schnorrSig);

    return verificationResult == NC_SUCCESS;
};

#pragma endregion
