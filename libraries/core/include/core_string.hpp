// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#pragma once

#include "core.hpp"

#include <string.h>
#include <string>

#if !defined(_WIN32)
    #include <strings.h> // strcasecmp
#endif // _WIN32

namespace lanmeet {


//------------------------------------------------------------------------------
// String Conversion

/// Convert value to hex string with leading zero bytes trimmed
std::string HexString(uint64_t value);

/// Convert buffer to a contiguous lowercase hex string
std::string HexString(const uint8_t* data, int bytes);

/// Returns true if the string is non-empty and only contains hex digits
bool IsHexString(const std::string& str);


//------------------------------------------------------------------------------
// Compare Strings

/// Case-insensitive string comparison
/// Returns < 0 if a < b (lexographically ignoring case)
/// Returns 0 if a == b (case-insensitive)
/// Returns > 0 if a > b (lexographically ignoring case)
LANMEET_INLINE int StrCaseCompare(const char* a, const char* b)
{
#if defined(_WIN32)
# if defined(_MSC_VER) && (_MSC_VER >= 1400)
    return ::_stricmp(a, b);
# else
    return ::stricmp(a, b);
# endif
#else
    return ::strcasecmp(a, b);
#endif
}


} // namespace lanmeet
