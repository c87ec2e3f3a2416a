#pragma once

#include <memory>

#include <noscrypt.h>

namespace relaydeck
{
namespace cryptography
{
/**
 * @brief Allocates and initializes a noscrypt context seeded from the secure RNG.
 * @returns A context that is destroyed and freed when the last owner releases it.
 * @throws `std::runtime_error` if the context could not be initialized.
 */
std::shared_ptr<NCContext> createNoscryptContext();
} // namespace cryptography
} // namespace relaydeck
