#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace relaydeck
{
namespace internal
{
/**
 * @brief Encodes the given bytes as a lowercase hex string.
 */
std::string toHex(const uint8_t* bytes, size_t length);

/**
 * @brief Decodes a hex string into exactly `length` bytes.
 * @returns False if the string does not hold exactly `length` bytes of hex.
 */
bool fromHex(const std::string& hex, uint8_t* bytes, size_t length);

/**
 * @brief Indicates whether the string is lowercase hex with exactly `length` characters.
 */
bool isLowerHex(const std::string& value, size_t length);
} // namespace internal
} // namespace relaydeck
