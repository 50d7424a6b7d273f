// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

/*
    Wire Codec

    Converts Messages to and from framed bytes.

    EncodeMessage() produces exactly one frame.  DecodeMessage() parses one
    frame from the front of a buffer.  StreamDecoder accepts arbitrary slices
    of a byte stream and yields whole Messages as they become available.

    A CorruptFrame result means the stream is out of sync and cannot recover:
    the owning connection must be closed.
*/

#pragma once

#include "MeshProtocol.hpp"

#include <vector>

namespace protos {


//------------------------------------------------------------------------------
// Encoder

/// Append one frame holding the message to `frame`.
/// Returns false if the message is too large to encode (string over 64 KB,
/// payload over kMaxPayloadBytes).  On failure `frame` is left unchanged.
bool EncodeMessage(const Message& msg, std::vector<uint8_t>& frame);


//------------------------------------------------------------------------------
// Decoder

enum class DecodeResult
{
    Success,      ///< A message was produced
    NeedMoreData, ///< Frame is incomplete
    CorruptFrame  ///< Stream is desynchronized or the payload is malformed
};

const char* DecodeResultToString(DecodeResult result);

/// Decode one frame from the front of the buffer.
/// On Success, `frame_bytes` is set to the number of bytes consumed.
DecodeResult DecodeMessage(
    const uint8_t* data,
    int bytes,
    Message& msg,
    int& frame_bytes);


//------------------------------------------------------------------------------
// StreamDecoder

/// Incremental decoder for one ordered byte stream
class StreamDecoder
{
public:
    /// Append received bytes
    void Feed(const uint8_t* data, int bytes);

    /// Produce the next message if a whole frame is buffered.
    /// Once CorruptFrame is returned, every later call returns it too.
    DecodeResult Next(Message& msg);

    bool IsCorrupt() const
    {
        return Corrupt;
    }

    /// Bytes received but not yet decoded
    int GetBufferedBytes() const
    {
        return static_cast<int>(Buffer.size() - ReadOffset);
    }

    void Reset();

protected:
    std::vector<uint8_t> Buffer;
    size_t ReadOffset = 0;
    bool Corrupt = false;

    void Compact();
};


} // namespace protos
