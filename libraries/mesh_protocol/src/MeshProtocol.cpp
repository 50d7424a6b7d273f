// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "MeshProtocol.hpp"

#include <cmath>
#include <type_traits>

namespace protos {


//------------------------------------------------------------------------------
// Message Types

bool IsKnownMessageType(uint8_t type)
{
    switch (type)
    {
    case MessageType_Handshake:
    case MessageType_HandshakeAck:
    case MessageType_Disconnect:
    case MessageType_Heartbeat:
    case MessageType_HeartbeatAck:
    case MessageType_ScreenOffer:
    case MessageType_ScreenRequest:
    case MessageType_ScreenStart:
    case MessageType_ScreenFrame:
    case MessageType_ScreenStop:
    case MessageType_RequestKeyframe:
    case MessageType_ControlRequest:
    case MessageType_ControlGrant:
    case MessageType_ControlRevoke:
    case MessageType_InputEvent:
    case MessageType_ChatMessage:
    case MessageType_FileOffer:
    case MessageType_FileAccept:
    case MessageType_FileReject:
    case MessageType_FileChunk:
    case MessageType_FileComplete:
    case MessageType_FileCancel:
        return true;
    default:
        break;
    }
    return false;
}

const char* MessageTypeToString(uint8_t type)
{
    switch (type)
    {
    case MessageType_Handshake: return "Handshake";
    case MessageType_HandshakeAck: return "HandshakeAck";
    case MessageType_Disconnect: return "Disconnect";
    case MessageType_Heartbeat: return "Heartbeat";
    case MessageType_HeartbeatAck: return "HeartbeatAck";
    case MessageType_ScreenOffer: return "ScreenOffer";
    case MessageType_ScreenRequest: return "ScreenRequest";
    case MessageType_ScreenStart: return "ScreenStart";
    case MessageType_ScreenFrame: return "ScreenFrame";
    case MessageType_ScreenStop: return "ScreenStop";
    case MessageType_RequestKeyframe: return "RequestKeyframe";
    case MessageType_ControlRequest: return "ControlRequest";
    case MessageType_ControlGrant: return "ControlGrant";
    case MessageType_ControlRevoke: return "ControlRevoke";
    case MessageType_InputEvent: return "InputEvent";
    case MessageType_ChatMessage: return "ChatMessage";
    case MessageType_FileOffer: return "FileOffer";
    case MessageType_FileAccept: return "FileAccept";
    case MessageType_FileReject: return "FileReject";
    case MessageType_FileChunk: return "FileChunk";
    case MessageType_FileComplete: return "FileComplete";
    case MessageType_FileCancel: return "FileCancel";
    default: break;
    }
    return "Unknown";
}

MessageTypes GetMessageType(const Message& msg)
{
    return std::visit([](const auto& m) -> MessageTypes {
        return std::decay_t<decltype(m)>::kType;
    }, msg);
}


//------------------------------------------------------------------------------
// Comparisons

static inline bool FloatsNotEqual(float a, float b, const float eps = 0.000001f)
{
    return std::fabs(a - b) > eps;
}

bool DisplayInfo::operator==(const DisplayInfo& rhs) const
{
    return DisplayId == rhs.DisplayId &&
        Name == rhs.Name &&
        Width == rhs.Width &&
        Height == rhs.Height &&
        Primary == rhs.Primary;
}

bool MessageHandshake::operator==(const MessageHandshake& rhs) const
{
    return PeerId == rhs.PeerId &&
        Name == rhs.Name &&
        ProtocolVersion == rhs.ProtocolVersion &&
        AppVersion == rhs.AppVersion &&
        Capabilities == rhs.Capabilities &&
        PublicKey == rhs.PublicKey;
}

bool MessageHandshakeAck::operator==(const MessageHandshakeAck& rhs) const
{
    return PeerId == rhs.PeerId &&
        Name == rhs.Name &&
        ProtocolVersion == rhs.ProtocolVersion &&
        AppVersion == rhs.AppVersion &&
        Capabilities == rhs.Capabilities &&
        Accepted == rhs.Accepted &&
        Reason == rhs.Reason &&
        PublicKey == rhs.PublicKey;
}

bool MessageDisconnect::operator==(const MessageDisconnect& rhs) const
{
    return Reason == rhs.Reason && Detail == rhs.Detail;
}

bool MessageHeartbeat::operator==(const MessageHeartbeat& rhs) const
{
    return Sequence == rhs.Sequence && TimestampUsec == rhs.TimestampUsec;
}

bool MessageHeartbeatAck::operator==(const MessageHeartbeatAck& rhs) const
{
    return Sequence == rhs.Sequence && EchoTimestampUsec == rhs.EchoTimestampUsec;
}

bool MessageScreenOffer::operator==(const MessageScreenOffer& rhs) const
{
    return Displays == rhs.Displays;
}

bool MessageScreenRequest::operator==(const MessageScreenRequest& rhs) const
{
    return DisplayId == rhs.DisplayId &&
        PreferredFps == rhs.PreferredFps &&
        PreferredQuality == rhs.PreferredQuality;
}

bool MessageScreenStart::operator==(const MessageScreenStart& rhs) const
{
    return DisplayId == rhs.DisplayId &&
        Width == rhs.Width &&
        Height == rhs.Height &&
        Fps == rhs.Fps &&
        Codec == rhs.Codec;
}

bool MessageScreenFrame::operator==(const MessageScreenFrame& rhs) const
{
    return DisplayId == rhs.DisplayId &&
        TimestampUsec == rhs.TimestampUsec &&
        FrameKind == rhs.FrameKind &&
        Sequence == rhs.Sequence &&
        Data == rhs.Data;
}

bool MessageScreenStop::operator==(const MessageScreenStop& rhs) const
{
    return DisplayId == rhs.DisplayId && Origin == rhs.Origin;
}

bool MessageRequestKeyframe::operator==(const MessageRequestKeyframe& rhs) const
{
    return DisplayId == rhs.DisplayId && LastSequence == rhs.LastSequence;
}

bool MessageControlRequest::operator==(const MessageControlRequest& rhs) const
{
    return FromUser == rhs.FromUser;
}

bool MessageControlGrant::operator==(const MessageControlGrant& rhs) const
{
    return ToUser == rhs.ToUser;
}

bool MessageControlRevoke::operator==(const MessageControlRevoke& /*rhs*/) const
{
    return true;
}

bool MessageInputEvent::operator==(const MessageInputEvent& rhs) const
{
    if (EventType != rhs.EventType ||
        Button != rhs.Button ||
        KeyCode != rhs.KeyCode ||
        Modifiers != rhs.Modifiers)
    {
        return false;
    }

    if (FloatsNotEqual(X, rhs.X) || FloatsNotEqual(Y, rhs.Y) ||
        FloatsNotEqual(ScrollX, rhs.ScrollX) || FloatsNotEqual(ScrollY, rhs.ScrollY))
    {
        return false;
    }

    return true;
}

bool MessageChat::operator==(const MessageChat& rhs) const
{
    return From == rhs.From &&
        Content == rhs.Content &&
        TimestampMsec == rhs.TimestampMsec;
}

bool MessageFileOffer::operator==(const MessageFileOffer& rhs) const
{
    return FileId == rhs.FileId &&
        Name == rhs.Name &&
        Size == rhs.Size &&
        Checksum == rhs.Checksum;
}

bool MessageFileAccept::operator==(const MessageFileAccept& rhs) const
{
    return FileId == rhs.FileId;
}

bool MessageFileReject::operator==(const MessageFileReject& rhs) const
{
    return FileId == rhs.FileId;
}

bool MessageFileChunk::operator==(const MessageFileChunk& rhs) const
{
    return FileId == rhs.FileId && Offset == rhs.Offset && Data == rhs.Data;
}

bool MessageFileComplete::operator==(const MessageFileComplete& rhs) const
{
    return FileId == rhs.FileId;
}

bool MessageFileCancel::operator==(const MessageFileCancel& rhs) const
{
    return FileId == rhs.FileId;
}


//------------------------------------------------------------------------------
// Tools

uint32_t QualityToBitrate(uint8_t quality)
{
    switch (quality)
    {
    case StreamQuality_Low: return 2 * 1000 * 1000;
    case StreamQuality_High: return 8 * 1000 * 1000;
    default: break;
    }
    return 4 * 1000 * 1000;
}

std::string SanitizeString(const std::string& input, size_t max_bytes)
{
    std::string result;
    result.reserve(input.size() < max_bytes ? input.size() : max_bytes);

    for (char ch : input) {
        if (result.size() >= max_bytes) {
            break;
        }
        if (ch == '\0') {
            break;
        }
        if (ch >= ' ' && ch <= '~') {
            result.push_back(ch);
        }
    }

    return result;
}


} // namespace protos
