#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace relaydeck
{
namespace cryptography
{
class NostrSecureRng
{
public:
    /**
     * @brief Fills the given buffer with secure random bytes.
     * @param buffer The buffer to fill with random bytes.
     * @param length The number of bytes to fill.
     * @throws `std::runtime_error` if the system RNG could not produce the bytes.
     */
    static void fill(void* buffer, size_t length);

    /*
     * @brief Fills the given vector with secure random bytes.
     * @param buffer The vector to fill with random bytes.
     */
    static inline void fill(std::vector<uint8_t>& buffer)
    {
        fill(buffer.data(), buffer.size());
    }

    /*
     * @brief Securely zeroes out the given buffer.
     * @param buffer A pointer to the buffer to zero out.
     * @param length The number of bytes to zero out.
     */
    static void zero(void* buffer, size_t length);
};
} // namespace cryptography
} // namespace relaydeck
