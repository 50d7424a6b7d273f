// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#pragma once

#include "core.hpp"
#include <string.h>

namespace lanmeet {


//------------------------------------------------------------------------------
// POD Serialization

/**
 * Wire integers are big-endian (network order):
 *
 * word = 0x0102
 * Big Endian:    array[2] = { 0x01, 0x02 }
 *
 * Byte-wise access keeps these safe on targets without unaligned loads.
**/

// Big-endian 16-bit read
LANMEET_INLINE uint16_t ReadU16_BE(const void* data)
{
    const uint8_t* u8p = reinterpret_cast<const uint8_t*>(data);
    return static_cast<uint16_t>( ((uint16_t)u8p[0] << 8) | u8p[1] );
}

// Big-endian 32-bit read
LANMEET_INLINE uint32_t ReadU32_BE(const void* data)
{
    const uint8_t* u8p = reinterpret_cast<const uint8_t*>(data);
    return ((uint32_t)u8p[0] << 24) | ((uint32_t)u8p[1] << 16) | ((uint32_t)u8p[2] << 8) | u8p[3];
}

// Big-endian 64-bit read
LANMEET_INLINE uint64_t ReadU64_BE(const void* data)
{
    const uint8_t* u8p = reinterpret_cast<const uint8_t*>(data);
    return ((uint64_t)ReadU32_BE(u8p) << 32) | ReadU32_BE(u8p + 4);
}

// Big-endian 16-bit write
LANMEET_INLINE void WriteU16_BE(void* data, uint16_t value)
{
    uint8_t* u8p = reinterpret_cast<uint8_t*>(data);
    u8p[0] = static_cast<uint8_t>(value >> 8);
    u8p[1] = static_cast<uint8_t>(value);
}

// Big-endian 32-bit write
LANMEET_INLINE void WriteU32_BE(void* data, uint32_t value)
{
    uint8_t* u8p = reinterpret_cast<uint8_t*>(data);
    u8p[0] = static_cast<uint8_t>(value >> 24);
    u8p[1] = static_cast<uint8_t>(value >> 16);
    u8p[2] = static_cast<uint8_t>(value >> 8);
    u8p[3] = static_cast<uint8_t>(value);
}

// Big-endian 64-bit write
LANMEET_INLINE void WriteU64_BE(void* data, uint64_t value)
{
    uint8_t* u8p = reinterpret_cast<uint8_t*>(data);
    WriteU32_BE(u8p, static_cast<uint32_t>(value >> 32));
    WriteU32_BE(u8p + 4, static_cast<uint32_t>(value));
}


//------------------------------------------------------------------------------
// WriteByteStream

/// Helper class to serialize POD types to a fixed byte buffer
struct WriteByteStream
{
    /// Wrapped data pointer
    uint8_t* Data = nullptr;

    /// Number of wrapped buffer bytes
    int BufferBytes = 0;

    /// Number of bytes written so far by Write*() functions
    int WrittenBytes = 0;

    LANMEET_INLINE WriteByteStream(void* data, int bytes)
        : Data(reinterpret_cast<uint8_t*>(data))
        , BufferBytes(bytes)
    {
        LANMEET_DEBUG_ASSERT(data != nullptr && bytes > 0);
    }

    LANMEET_INLINE int Remaining() const
    {
        return BufferBytes - WrittenBytes;
    }

    LANMEET_INLINE WriteByteStream& Write8(uint8_t value)
    {
        LANMEET_DEBUG_ASSERT(WrittenBytes + 1 <= BufferBytes);
        Data[WrittenBytes] = value;
        WrittenBytes++;
        return *this;
    }
    LANMEET_INLINE WriteByteStream& Write16_BE(uint16_t value)
    {
        LANMEET_DEBUG_ASSERT(WrittenBytes + 2 <= BufferBytes);
        WriteU16_BE(Data + WrittenBytes, value);
        WrittenBytes += 2;
        return *this;
    }
    LANMEET_INLINE WriteByteStream& Write32_BE(uint32_t value)
    {
        LANMEET_DEBUG_ASSERT(WrittenBytes + 4 <= BufferBytes);
        WriteU32_BE(Data + WrittenBytes, value);
        WrittenBytes += 4;
        return *this;
    }
    LANMEET_INLINE WriteByteStream& Write64_BE(uint64_t value)
    {
        LANMEET_DEBUG_ASSERT(WrittenBytes + 8 <= BufferBytes);
        WriteU64_BE(Data + WrittenBytes, value);
        WrittenBytes += 8;
        return *this;
    }
    LANMEET_INLINE WriteByteStream& WriteBuffer(const void* source, int bytes)
    {
        LANMEET_DEBUG_ASSERT(source != nullptr || bytes == 0);
        LANMEET_DEBUG_ASSERT(WrittenBytes + bytes <= BufferBytes);
        if (bytes > 0) {
            memcpy(Data + WrittenBytes, source, bytes);
        }
        WrittenBytes += bytes;
        return *this;
    }
};


//------------------------------------------------------------------------------
// ReadByteStream

/// Helper class to deserialize POD types from a byte buffer.
/// Callers check Remaining() before each read: the Read*() functions do not.
struct ReadByteStream
{
    /// Wrapped data pointer
    const uint8_t* const Data;

    /// Number of wrapped buffer bytes
    const int BufferBytes;

    /// Number of bytes read so far by Read*() functions
    int BytesRead = 0;


    ReadByteStream(const void* data, int bytes)
        : Data(reinterpret_cast<const uint8_t*>(data))
        , BufferBytes(bytes)
    {
        LANMEET_DEBUG_ASSERT(data != nullptr || bytes == 0);
    }

    LANMEET_INLINE const uint8_t* Peek() const
    {
        LANMEET_DEBUG_ASSERT(BytesRead <= BufferBytes);
        return Data + BytesRead;
    }
    LANMEET_INLINE int Remaining() const
    {
        LANMEET_DEBUG_ASSERT(BytesRead <= BufferBytes);
        return BufferBytes - BytesRead;
    }
    LANMEET_INLINE void Skip(int bytes)
    {
        LANMEET_DEBUG_ASSERT(BytesRead + bytes <= BufferBytes);
        BytesRead += bytes;
    }

    LANMEET_INLINE const uint8_t* Read(int bytes)
    {
        const uint8_t* data = Peek();
        Skip(bytes);
        return data;
    }
    LANMEET_INLINE uint8_t Read8()
    {
        LANMEET_DEBUG_ASSERT(BytesRead + 1 <= BufferBytes);
        uint8_t value = *Peek();
        BytesRead++;
        return value;
    }
    LANMEET_INLINE uint16_t Read16_BE()
    {
        LANMEET_DEBUG_ASSERT(BytesRead + 2 <= BufferBytes);
        uint16_t value = ReadU16_BE(Peek());
        BytesRead += 2;
        return value;
    }
    LANMEET_INLINE uint32_t Read32_BE()
    {
        LANMEET_DEBUG_ASSERT(BytesRead + 4 <= BufferBytes);
        uint32_t value = ReadU32_BE(Peek());
        BytesRead += 4;
        return value;
    }
    LANMEET_INLINE uint64_t Read64_BE()
    {
        LANMEET_DEBUG_ASSERT(BytesRead + 8 <= BufferBytes);
        uint64_t value = ReadU64_BE(Peek());
        BytesRead += 8;
        return value;
    }
};


} // namespace lanmeet
