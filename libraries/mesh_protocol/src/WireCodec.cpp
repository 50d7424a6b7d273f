// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "WireCodec.hpp"

#include <core_serializer.hpp> // core

#include <cstring>
#include <utility>

namespace protos {


//------------------------------------------------------------------------------
// Constants

// Longest string that fits in the 16-bit length prefix
static const size_t kMaxStringBytes = 0xffff;

// Largest list count that fits in the 16-bit count prefix
static const size_t kMaxListCount = 0xffff;

// Consumed bytes are discarded from the StreamDecoder buffer past this point
static const size_t kCompactThresholdBytes = 64 * 1024;


//------------------------------------------------------------------------------
// PayloadWriter

class PayloadWriter
{
public:
    explicit PayloadWriter(std::vector<uint8_t>& out)
        : Out(out)
    {
    }

    // Set if a field could not be represented on the wire
    bool Overflow = false;

    void U8(uint8_t value)
    {
        Out.push_back(value);
    }
    void U16(uint16_t value)
    {
        const size_t offset = Grow(2);
        lanmeet::WriteU16_BE(Out.data() + offset, value);
    }
    void U32(uint32_t value)
    {
        const size_t offset = Grow(4);
        lanmeet::WriteU32_BE(Out.data() + offset, value);
    }
    void U64(uint64_t value)
    {
        const size_t offset = Grow(8);
        lanmeet::WriteU64_BE(Out.data() + offset, value);
    }
    void Bool(bool value)
    {
        U8(value ? 1 : 0);
    }
    void F32(float value)
    {
        uint32_t bits;
        static_assert(sizeof(bits) == sizeof(value), "Unexpected float size");
        std::memcpy(&bits, &value, sizeof(bits));
        U32(bits);
    }
    void Bytes(const uint8_t* data, size_t bytes)
    {
        if (bytes > 0) {
            Out.insert(Out.end(), data, data + bytes);
        }
    }
    void String(const std::string& str)
    {
        if (str.size() > kMaxStringBytes) {
            Overflow = true;
            return;
        }
        U16(static_cast<uint16_t>(str.size()));
        Bytes(reinterpret_cast<const uint8_t*>(str.data()), str.size());
    }
    void Blob(const std::vector<uint8_t>& blob)
    {
        if (blob.size() > kMaxPayloadBytes) {
            Overflow = true;
            return;
        }
        U32(static_cast<uint32_t>(blob.size()));
        Bytes(blob.data(), blob.size());
    }
    void Count(size_t count)
    {
        if (count > kMaxListCount) {
            Overflow = true;
            return;
        }
        U16(static_cast<uint16_t>(count));
    }

protected:
    std::vector<uint8_t>& Out;

    size_t Grow(size_t bytes)
    {
        const size_t offset = Out.size();
        Out.resize(offset + bytes);
        return offset;
    }
};


//------------------------------------------------------------------------------
// PayloadReader

class PayloadReader
{
public:
    PayloadReader(const uint8_t* data, int bytes)
        : Stream(data, bytes)
    {
    }

    // Set if a field was truncated or held an invalid value
    bool Failed = false;

    // Payload was fully consumed without errors
    bool Complete() const
    {
        return !Failed && Stream.Remaining() == 0;
    }

    uint8_t U8()
    {
        if (!Need(1)) {
            return 0;
        }
        return Stream.Read8();
    }
    uint16_t U16()
    {
        if (!Need(2)) {
            return 0;
        }
        return Stream.Read16_BE();
    }
    uint32_t U32()
    {
        if (!Need(4)) {
            return 0;
        }
        return Stream.Read32_BE();
    }
    uint64_t U64()
    {
        if (!Need(8)) {
            return 0;
        }
        return Stream.Read64_BE();
    }
    bool Bool()
    {
        const uint8_t value = U8();
        if (value > 1) {
            Failed = true;
        }
        return value != 0;
    }
    float F32()
    {
        const uint32_t bits = U32();
        float value;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }
    std::string String()
    {
        const uint16_t length = U16();
        if (!Need(length)) {
            return std::string();
        }
        const uint8_t* data = Stream.Read(length);
        return std::string(reinterpret_cast<const char*>(data), length);
    }
    std::vector<uint8_t> Blob()
    {
        const uint32_t length = U32();
        if (length > kMaxPayloadBytes || !Need(static_cast<int>(length))) {
            Failed = true;
            return std::vector<uint8_t>();
        }
        const uint8_t* data = Stream.Read(static_cast<int>(length));
        return std::vector<uint8_t>(data, data + length);
    }
    void Bytes(uint8_t* dest, int bytes)
    {
        if (!Need(bytes)) {
            std::memset(dest, 0, bytes);
            return;
        }
        std::memcpy(dest, Stream.Read(bytes), bytes);
    }
    uint16_t Count()
    {
        return U16();
    }

protected:
    lanmeet::ReadByteStream Stream;

    bool Need(int bytes)
    {
        if (Failed || Stream.Remaining() < bytes) {
            Failed = true;
            return false;
        }
        return true;
    }
};


//------------------------------------------------------------------------------
// Payload Serialization

static void Write(PayloadWriter& w, const DisplayInfo& m)
{
    w.U32(m.DisplayId);
    w.String(m.Name);
    w.U32(m.Width);
    w.U32(m.Height);
    w.Bool(m.Primary);
}
static void Read(PayloadReader& r, DisplayInfo& m)
{
    m.DisplayId = r.U32();
    m.Name = r.String();
    m.Width = r.U32();
    m.Height = r.U32();
    m.Primary = r.Bool();
}

static void Write(PayloadWriter& w, const MessageHandshake& m)
{
    w.String(m.PeerId);
    w.String(m.Name);
    w.U8(m.ProtocolVersion);
    w.String(m.AppVersion);
    w.U32(m.Capabilities);
    w.Bytes(m.PublicKey.data(), m.PublicKey.size());
}
static void Read(PayloadReader& r, MessageHandshake& m)
{
    m.PeerId = r.String();
    m.Name = r.String();
    m.ProtocolVersion = r.U8();
    m.AppVersion = r.String();
    m.Capabilities = r.U32();
    r.Bytes(m.PublicKey.data(), static_cast<int>(m.PublicKey.size()));
}

static void Write(PayloadWriter& w, const MessageHandshakeAck& m)
{
    w.String(m.PeerId);
    w.String(m.Name);
    w.U8(m.ProtocolVersion);
    w.String(m.AppVersion);
    w.U32(m.Capabilities);
    w.Bool(m.Accepted);
    w.String(m.Reason);
    w.Bytes(m.PublicKey.data(), m.PublicKey.size());
}
static void Read(PayloadReader& r, MessageHandshakeAck& m)
{
    m.PeerId = r.String();
    m.Name = r.String();
    m.ProtocolVersion = r.U8();
    m.AppVersion = r.String();
    m.Capabilities = r.U32();
    m.Accepted = r.Bool();
    m.Reason = r.String();
    r.Bytes(m.PublicKey.data(), static_cast<int>(m.PublicKey.size()));
}

static void Write(PayloadWriter& w, const MessageDisconnect& m)
{
    w.U8(m.Reason);
    w.String(m.Detail);
}
static void Read(PayloadReader& r, MessageDisconnect& m)
{
    m.Reason = r.U8();
    m.Detail = r.String();
}

static void Write(PayloadWriter& w, const MessageHeartbeat& m)
{
    w.U32(m.Sequence);
    w.U64(m.TimestampUsec);
}
static void Read(PayloadReader& r, MessageHeartbeat& m)
{
    m.Sequence = r.U32();
    m.TimestampUsec = r.U64();
}

static void Write(PayloadWriter& w, const MessageHeartbeatAck& m)
{
    w.U32(m.Sequence);
    w.U64(m.EchoTimestampUsec);
}
static void Read(PayloadReader& r, MessageHeartbeatAck& m)
{
    m.Sequence = r.U32();
    m.EchoTimestampUsec = r.U64();
}

static void Write(PayloadWriter& w, const MessageScreenOffer& m)
{
    w.Count(m.Displays.size());
    for (const auto& display : m.Displays) {
        Write(w, display);
    }
}
static void Read(PayloadReader& r, MessageScreenOffer& m)
{
    const unsigned count = r.Count();
    for (unsigned i = 0; i < count && !r.Failed; ++i) {
        DisplayInfo display;
        Read(r, display);
        m.Displays.push_back(std::move(display));
    }
}

static void Write(PayloadWriter& w, const MessageScreenRequest& m)
{
    w.U32(m.DisplayId);
    w.U8(m.PreferredFps);
    w.U8(m.PreferredQuality);
}
static void Read(PayloadReader& r, MessageScreenRequest& m)
{
    m.DisplayId = r.U32();
    m.PreferredFps = r.U8();
    m.PreferredQuality = r.U8();
}

static void Write(PayloadWriter& w, const MessageScreenStart& m)
{
    w.U32(m.DisplayId);
    w.U32(m.Width);
    w.U32(m.Height);
    w.U8(m.Fps);
    w.String(m.Codec);
}
static void Read(PayloadReader& r, MessageScreenStart& m)
{
    m.DisplayId = r.U32();
    m.Width = r.U32();
    m.Height = r.U32();
    m.Fps = r.U8();
    m.Codec = r.String();
}

static void Write(PayloadWriter& w, const MessageScreenFrame& m)
{
    w.U32(m.DisplayId);
    w.U64(m.TimestampUsec);
    w.U8(m.FrameKind);
    w.U32(m.Sequence);
    w.Blob(m.Data);
}
static void Read(PayloadReader& r, MessageScreenFrame& m)
{
    m.DisplayId = r.U32();
    m.TimestampUsec = r.U64();
    m.FrameKind = r.U8();
    if (m.FrameKind >= FrameKind_Count) {
        r.Failed = true;
    }
    m.Sequence = r.U32();
    m.Data = r.Blob();
}

static void Write(PayloadWriter& w, const MessageScreenStop& m)
{
    w.U32(m.DisplayId);
    w.U8(m.Origin);
}
static void Read(PayloadReader& r, MessageScreenStop& m)
{
    m.DisplayId = r.U32();
    m.Origin = r.U8();
    if (m.Origin >= StopOrigin_Count) {
        r.Failed = true;
    }
}

static void Write(PayloadWriter& w, const MessageRequestKeyframe& m)
{
    w.U32(m.DisplayId);
    w.U32(m.LastSequence);
}
static void Read(PayloadReader& r, MessageRequestKeyframe& m)
{
    m.DisplayId = r.U32();
    m.LastSequence = r.U32();
}

static void Write(PayloadWriter& w, const MessageControlRequest& m)
{
    w.String(m.FromUser);
}
static void Read(PayloadReader& r, MessageControlRequest& m)
{
    m.FromUser = r.String();
}

static void Write(PayloadWriter& w, const MessageControlGrant& m)
{
    w.String(m.ToUser);
}
static void Read(PayloadReader& r, MessageControlGrant& m)
{
    m.ToUser = r.String();
}

static void Write(PayloadWriter& /*w*/, const MessageControlRevoke& /*m*/)
{
}
static void Read(PayloadReader& /*r*/, MessageControlRevoke& /*m*/)
{
}

static void Write(PayloadWriter& w, const MessageInputEvent& m)
{
    w.U8(m.EventType);
    w.F32(m.X);
    w.F32(m.Y);
    w.U8(m.Button);
    w.F32(m.ScrollX);
    w.F32(m.ScrollY);
    w.U32(m.KeyCode);
    w.U8(m.Modifiers);
}
static void Read(PayloadReader& r, MessageInputEvent& m)
{
    m.EventType = r.U8();
    m.X = r.F32();
    m.Y = r.F32();
    m.Button = r.U8();
    m.ScrollX = r.F32();
    m.ScrollY = r.F32();
    m.KeyCode = r.U32();
    m.Modifiers = r.U8();
}

static void Write(PayloadWriter& w, const MessageChat& m)
{
    w.String(m.From);
    w.String(m.Content);
    w.U64(m.TimestampMsec);
}
static void Read(PayloadReader& r, MessageChat& m)
{
    m.From = r.String();
    m.Content = r.String();
    m.TimestampMsec = r.U64();
}

static void Write(PayloadWriter& w, const MessageFileOffer& m)
{
    w.String(m.FileId);
    w.String(m.Name);
    w.U64(m.Size);
    w.String(m.Checksum);
}
static void Read(PayloadReader& r, MessageFileOffer& m)
{
    m.FileId = r.String();
    m.Name = r.String();
    m.Size = r.U64();
    m.Checksum = r.String();
}

static void Write(PayloadWriter& w, const MessageFileAccept& m)
{
    w.String(m.FileId);
}
static void Read(PayloadReader& r, MessageFileAccept& m)
{
    m.FileId = r.String();
}

static void Write(PayloadWriter& w, const MessageFileReject& m)
{
    w.String(m.FileId);
}
static void Read(PayloadReader& r, MessageFileReject& m)
{
    m.FileId = r.String();
}

static void Write(PayloadWriter& w, const MessageFileChunk& m)
{
    w.String(m.FileId);
    w.U64(m.Offset);
    w.Blob(m.Data);
}
static void Read(PayloadReader& r, MessageFileChunk& m)
{
    m.FileId = r.String();
    m.Offset = r.U64();
    m.Data = r.Blob();
}

static void Write(PayloadWriter& w, const MessageFileComplete& m)
{
    w.String(m.FileId);
}
static void Read(PayloadReader& r, MessageFileComplete& m)
{
    m.FileId = r.String();
}

static void Write(PayloadWriter& w, const MessageFileCancel& m)
{
    w.String(m.FileId);
}
static void Read(PayloadReader& r, MessageFileCancel& m)
{
    m.FileId = r.String();
}


//------------------------------------------------------------------------------
// Encoder

bool EncodeMessage(const Message& msg, std::vector<uint8_t>& frame)
{
    const size_t frame_start = frame.size();

    PayloadWriter writer(frame);
    writer.U8(kMagic0);
    writer.U8(kMagic1);
    writer.U8(kProtocolVersion);
    writer.U8(static_cast<uint8_t>( GetMessageType(msg) ));
    writer.U32(0); // Length is filled in below

    const size_t payload_start = frame.size();

    std::visit([&writer](const auto& m) {
        Write(writer, m);
    }, msg);

    const size_t payload_bytes = frame.size() - payload_start;
    if (writer.Overflow || payload_bytes > kMaxPayloadBytes) {
        frame.resize(frame_start);
        return false;
    }

    lanmeet::WriteU32_BE(frame.data() + frame_start + 4, static_cast<uint32_t>( payload_bytes ));
    return true;
}


//------------------------------------------------------------------------------
// Decoder

const char* DecodeResultToString(DecodeResult result)
{
    switch (result)
    {
    case DecodeResult::Success: return "Success";
    case DecodeResult::NeedMoreData: return "NeedMoreData";
    case DecodeResult::CorruptFrame: return "CorruptFrame";
    default: break;
    }
    return "Unknown";
}

template<typename T>
static DecodeResult ReadPayloadAs(PayloadReader& reader, Message& msg)
{
    T m;
    Read(reader, m);
    if (!reader.Complete()) {
        return DecodeResult::CorruptFrame;
    }
    msg = std::move(m);
    return DecodeResult::Success;
}

static DecodeResult ReadPayload(uint8_t type, PayloadReader& reader, Message& msg)
{
    switch (type)
    {
    case MessageType_Handshake: return ReadPayloadAs<MessageHandshake>(reader, msg);
    case MessageType_HandshakeAck: return ReadPayloadAs<MessageHandshakeAck>(reader, msg);
    case MessageType_Disconnect: return ReadPayloadAs<MessageDisconnect>(reader, msg);
    case MessageType_Heartbeat: return ReadPayloadAs<MessageHeartbeat>(reader, msg);
    case MessageType_HeartbeatAck: return ReadPayloadAs<MessageHeartbeatAck>(reader, msg);
    case MessageType_ScreenOffer: return ReadPayloadAs<MessageScreenOffer>(reader, msg);
    case MessageType_ScreenRequest: return ReadPayloadAs<MessageScreenRequest>(reader, msg);
    case MessageType_ScreenStart: return ReadPayloadAs<MessageScreenStart>(reader, msg);
    case MessageType_ScreenFrame: return ReadPayloadAs<MessageScreenFrame>(reader, msg);
    case MessageType_ScreenStop: return ReadPayloadAs<MessageScreenStop>(reader, msg);
    case MessageType_RequestKeyframe: return ReadPayloadAs<MessageRequestKeyframe>(reader, msg);
    case MessageType_ControlRequest: return ReadPayloadAs<MessageControlRequest>(reader, msg);
    case MessageType_ControlGrant: return ReadPayloadAs<MessageControlGrant>(reader, msg);
    case MessageType_ControlRevoke: return ReadPayloadAs<MessageControlRevoke>(reader, msg);
    case MessageType_InputEvent: return ReadPayloadAs<MessageInputEvent>(reader, msg);
    case MessageType_ChatMessage: return ReadPayloadAs<MessageChat>(reader, msg);
    case MessageType_FileOffer: return ReadPayloadAs<MessageFileOffer>(reader, msg);
    case MessageType_FileAccept: return ReadPayloadAs<MessageFileAccept>(reader, msg);
    case MessageType_FileReject: return ReadPayloadAs<MessageFileReject>(reader, msg);
    case MessageType_FileChunk: return ReadPayloadAs<MessageFileChunk>(reader, msg);
    case MessageType_FileComplete: return ReadPayloadAs<MessageFileComplete>(reader, msg);
    case MessageType_FileCancel: return ReadPayloadAs<MessageFileCancel>(reader, msg);
    default: break;
    }
    return DecodeResult::CorruptFrame;
}

DecodeResult DecodeMessage(
    const uint8_t* data,
    int bytes,
    Message& msg,
    int& frame_bytes)
{
    frame_bytes = 0;

    // Check each header field as soon as it arrives so that garbage is
    // rejected without waiting for a length that will never come
    if (bytes >= 1 && data[0] != kMagic0) {
        return DecodeResult::CorruptFrame;
    }
    if (bytes >= 2 && data[1] != kMagic1) {
        return DecodeResult::CorruptFrame;
    }
    if (bytes >= 4 && !IsKnownMessageType(data[3])) {
        return DecodeResult::CorruptFrame;
    }

    // Handshakes from any version decode so the peer can be told why it was rejected
    if (bytes >= 4 && data[2] != kProtocolVersion &&
        data[3] != MessageType_Handshake && data[3] != MessageType_HandshakeAck)
    {
        return DecodeResult::CorruptFrame;
    }
    if (bytes < kHeaderBytes) {
        return DecodeResult::NeedMoreData;
    }

    const uint32_t payload_bytes = lanmeet::ReadU32_BE(data + 4);
    if (payload_bytes > kMaxPayloadBytes) {
        return DecodeResult::CorruptFrame;
    }
    if (static_cast<uint32_t>(bytes - kHeaderBytes) < payload_bytes) {
        return DecodeResult::NeedMoreData;
    }

    PayloadReader reader(data + kHeaderBytes, static_cast<int>( payload_bytes ));
    const DecodeResult result = ReadPayload(data[3], reader, msg);
    if (result == DecodeResult::Success) {
        frame_bytes = kHeaderBytes + static_cast<int>( payload_bytes );
    }
    return result;
}


//------------------------------------------------------------------------------
// StreamDecoder

void StreamDecoder::Feed(const uint8_t* data, int bytes)
{
    if (Corrupt || bytes <= 0) {
        return;
    }
    Buffer.insert(Buffer.end(), data, data + bytes);
}

DecodeResult StreamDecoder::Next(Message& msg)
{
    if (Corrupt) {
        return DecodeResult::CorruptFrame;
    }

    const int available = GetBufferedBytes();
    if (available <= 0) {
        return DecodeResult::NeedMoreData;
    }

    int frame_bytes = 0;
    const DecodeResult result = DecodeMessage(
        Buffer.data() + ReadOffset,
        available,
        msg,
        frame_bytes);

    if (result == DecodeResult::Success) {
        ReadOffset += static_cast<size_t>( frame_bytes );
        Compact();
    } else if (result == DecodeResult::CorruptFrame) {
        Corrupt = true;
        Buffer.clear();
        ReadOffset = 0;
    }

    return result;
}

void StreamDecoder::Reset()
{
    Buffer.clear();
    ReadOffset = 0;
    Corrupt = false;
}

void StreamDecoder::Compact()
{
    if (ReadOffset >= Buffer.size()) {
        Buffer.clear();
        ReadOffset = 0;
        return;
    }

    if (ReadOffset >= kCompactThresholdBytes && ReadOffset * 2 >= Buffer.size()) {
        Buffer.erase(Buffer.begin(), Buffer.begin() + ReadOffset);
        ReadOffset = 0;
    }
}


} // namespace protos
