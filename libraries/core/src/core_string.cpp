// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "core_string.hpp"

namespace lanmeet {


//------------------------------------------------------------------------------
// String Conversion

static const char* HEX_ASCII = "0123456789abcdef";

std::string HexString(uint64_t value)
{
    char hex[16 + 1];
    hex[16] = '\0';

    char* hexWrite = &hex[14];
    for (unsigned i = 0; i < 8; ++i)
    {
        hexWrite[1] = HEX_ASCII[value & 15];
        hexWrite[0] = HEX_ASCII[(value >> 4) & 15];

        value >>= 8;
        if (value == 0)
            return hexWrite;
        hexWrite -= 2;
    }

    return hex;
}

std::string HexString(const uint8_t* data, int bytes)
{
    if (!data || bytes <= 0) {
        return std::string();
    }

    std::string result(static_cast<size_t>(bytes) * 2, '0');
    for (int i = 0; i < bytes; ++i)
    {
        const uint8_t value = data[i];
        result[i * 2] = HEX_ASCII[(value >> 4) & 15];
        result[i * 2 + 1] = HEX_ASCII[value & 15];
    }
    return result;
}

bool IsHexString(const std::string& str)
{
    if (str.empty()) {
        return false;
    }
    for (char ch : str) {
        const bool digit = (ch >= '0' && ch <= '9');
        const bool lower = (ch >= 'a' && ch <= 'f');
        const bool upper = (ch >= 'A' && ch <= 'F');
        if (!digit && !lower && !upper) {
            return false;
        }
    }
    return true;
}


} // namespace lanmeet
