#include <cstring>
#include <stdexcept>

#include "noscrypt_context.hpp"
#include "nostr_secure_rng.hpp"
#include "../internal/noscrypt_logger.hpp"

using namespace std;

namespace relaydeck
{
namespace cryptography
{
static void freeNoscryptContext(NCContext* ctx)
{
    NCDestroyContext(ctx);
    operator delete(ctx);
};

shared_ptr<NCContext> createNoscryptContext()
{
    /* Allocates a new unmanaged block that will
    * be freed manually with the above helper when the smart
    * pointer is destroyed
    */
    void* ctxMemory = operator new(NCGetContextStructSize());
    memset(ctxMemory, 0, NCGetContextStructSize());
    auto ctx = shared_ptr<NCContext>(static_cast<NCContext*>(ctxMemory), freeNoscryptContext);

    uint8_t randomEntropy[NC_CONTEXT_ENTROPY_SIZE];
    NostrSecureRng::fill(randomEntropy, sizeof(randomEntropy));

    NCResult initResult = NCInitContext(ctx.get(), randomEntropy);
    NostrSecureRng::zero(randomEntropy, sizeof(randomEntropy));

    if (initResult != NC_SUCCESS)
    {
        NC_LOG_ERROR(initResult);
        throw runtime_error("createNoscryptContext: Failed to initialize the noscrypt context.");
    }

    return ctx;
};
} // namespace cryptography
} // namespace relaydeck
