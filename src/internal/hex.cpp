#include <iomanip>
#include <sstream>

#include "hex.hpp"

using namespace std;

namespace relaydeck
{
namespace internal
{
static int hexValue(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
};

string toHex(const uint8_t* bytes, size_t length)
{
    stringstream ss;
    for (size_t i = 0; i < length; i++)
    {
        ss << hex << setw(2) << setfill('0') << static_cast<int>(bytes[i]);
    }

    return ss.str();
};

bool fromHex(const string& hex, uint8_t* bytes, size_t length)
{
    if (hex.length() != length * 2)
    {
        return false;
    }

    for (size_t i = 0; i < length; i++)
    {
        int high = hexValue(hex[i * 2]);
        int low = hexValue(hex[i * 2 + 1]);
        if (high < 0 || low < 0)
        {
            return false;
        }
        bytes[i] = static_cast<uint8_t>((high << 4) | low);
    }

    return true;
};

bool isLowerHex(const string& value, size_t length)
{
    if (value.length() != length)
    {
        return false;
    }

    for (char c : value)
    {
        bool isDigit = c >= '0' && c <= '9';
        bool isLowerLetter = c >= 'a' && c <= 'f';
        if (!isDigit && !isLowerLetter)
        {
            return false;
        }
    }

    return true;
};
} // namespace internal
} // namespace relaydeck
