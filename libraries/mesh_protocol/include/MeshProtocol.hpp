// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

/*
    Mesh Protocol

    Peer <-> Peer, full mesh over the LAN.

    Every message is one frame:

        Magic(2) "LM" | Version(1) | Type(1) | Length(4, big-endian) | Payload

    Payloads are compact big-endian binary.  Strings are a 16-bit length
    followed by UTF-8 bytes, blobs are a 32-bit length followed by bytes.

    Frames with a different Version are rejected, except Handshake and
    HandshakeAck: their layout is frozen so that mismatched peers still
    exchange an explicit rejection.

    Connection traffic is encrypted after an X25519 key exchange carried in
    the Handshake/HandshakeAck messages (unauthenticated, LAN only).
*/

#pragma once

#include <cstdint>
#include <string>
#include <array>
#include <vector>
#include <variant>

namespace protos {


//------------------------------------------------------------------------------
// Constants

// First two bytes of every frame: "LM"
static const uint8_t kMagic0 = 0x4C;
static const uint8_t kMagic1 = 0x4D;

// Wire format version.  Peers with a different version are rejected
static const uint8_t kProtocolVersion = 1;

// Bytes in the frame header
static const int kHeaderBytes = 8;

// Largest payload accepted by the decoder
static const uint32_t kMaxPayloadBytes = 16 * 1024 * 1024;

// Largest file chunk data carried in one FileChunk message
static const uint32_t kFileChunkBytes = 64 * 1024;

// Default UDP port for peers
static const uint16_t kDefaultPeerPort = 19876;

// Bytes per second max, per socket
static const int kDefaultBandwidthLimitBPS = 16 * 1000 * 1000;

// Size of X25519 public keys exchanged in the handshake (crypto_kx_PUBLICKEYBYTES)
static const unsigned kPublicKeyBytes = 32;

// Default capture rate for shared screens
static const uint8_t kDefaultFps = 30;


//------------------------------------------------------------------------------
// Enumerations

// Capability bits advertised in the handshake
enum CapabilityFlags
{
    Capability_ScreenShare   = 1,
    Capability_RemoteControl = 2,
    Capability_Chat          = 4,
    Capability_FileTransfer  = 8,

    Capability_All = 15
};

// Reason codes carried by the Disconnect message
enum DisconnectReasons
{
    DisconnectReason_Normal,
    DisconnectReason_ProtocolError,
    DisconnectReason_HeartbeatTimeout,
    DisconnectReason_Rejected,
    DisconnectReason_Shutdown,

    DisconnectReason_Count
};

// Kind of encoded video frame
enum FrameKinds
{
    FrameKind_Key,   ///< Self-contained keyframe
    FrameKind_Delta, ///< Depends on the previous frame

    FrameKind_Count
};

// Quality levels a viewer may request
enum StreamQualities
{
    StreamQuality_Low,
    StreamQuality_Medium,
    StreamQuality_High,

    StreamQuality_Count
};

// Which end of a stream sent a ScreenStop
enum StopOrigins
{
    StopOrigin_Sharer, ///< Sharer ended the stream
    StopOrigin_Viewer, ///< Viewer cancelled viewing

    StopOrigin_Count
};

// Remote input event types
enum InputEventTypes
{
    InputEventType_MouseMove,
    InputEventType_MouseDown,
    InputEventType_MouseUp,
    InputEventType_MouseScroll,
    InputEventType_KeyDown,
    InputEventType_KeyUp,

    InputEventType_Count
};

enum MouseButtons
{
    MouseButton_Left,
    MouseButton_Right,
    MouseButton_Middle,

    MouseButton_Count
};

// Modifier key bits for InputEvent
enum ModifierFlags
{
    Modifier_Shift = 1,
    Modifier_Ctrl  = 2,
    Modifier_Alt   = 4,
    Modifier_Meta  = 8
};


//------------------------------------------------------------------------------
// Message Types

// Message type tags (the Type byte of the frame header)
enum MessageTypes
{
    // Connection management
    MessageType_Handshake       = 0x00,
    MessageType_HandshakeAck    = 0x01,
    MessageType_Disconnect      = 0x02,
    MessageType_Heartbeat       = 0x03,
    MessageType_HeartbeatAck    = 0x04,

    // Screen sharing
    MessageType_ScreenOffer     = 0x10,
    MessageType_ScreenRequest   = 0x11,
    MessageType_ScreenStart     = 0x12,
    MessageType_ScreenFrame     = 0x13,
    MessageType_ScreenStop      = 0x14,
    MessageType_RequestKeyframe = 0x15,

    // Remote control
    MessageType_ControlRequest  = 0x20,
    MessageType_ControlGrant    = 0x21,
    MessageType_ControlRevoke   = 0x22,
    MessageType_InputEvent      = 0x23,

    // Chat
    MessageType_ChatMessage     = 0x30,

    // File transfer
    MessageType_FileOffer       = 0x40,
    MessageType_FileAccept      = 0x41,
    MessageType_FileReject      = 0x42,
    MessageType_FileChunk       = 0x43,
    MessageType_FileComplete    = 0x44,
    MessageType_FileCancel      = 0x45,
};

// Returns true if the type byte names a known message
bool IsKnownMessageType(uint8_t type);

// Name of the message type for logging
const char* MessageTypeToString(uint8_t type);


//------------------------------------------------------------------------------
// Messages

using PublicKeyBytes = std::array<uint8_t, kPublicKeyBytes>;

struct DisplayInfo
{
    uint32_t DisplayId = 0;
    std::string Name;
    uint32_t Width = 0;
    uint32_t Height = 0;
    bool Primary = false;

    bool operator==(const DisplayInfo& rhs) const;
};

struct MessageHandshake
{
    static const MessageTypes kType = MessageType_Handshake;

    std::string PeerId;
    std::string Name;
    uint8_t ProtocolVersion = kProtocolVersion;
    std::string AppVersion;
    uint32_t Capabilities = 0; // CapabilityFlags
    PublicKeyBytes PublicKey{};

    bool operator==(const MessageHandshake& rhs) const;
};

struct MessageHandshakeAck
{
    static const MessageTypes kType = MessageType_HandshakeAck;

    std::string PeerId;
    std::string Name;
    uint8_t ProtocolVersion = kProtocolVersion;
    std::string AppVersion;
    uint32_t Capabilities = 0; // CapabilityFlags
    bool Accepted = false;
    std::string Reason; // Empty when accepted
    PublicKeyBytes PublicKey{};

    bool operator==(const MessageHandshakeAck& rhs) const;
};

struct MessageDisconnect
{
    static const MessageTypes kType = MessageType_Disconnect;

    uint8_t Reason = DisconnectReason_Normal; // DisconnectReasons
    std::string Detail;

    bool operator==(const MessageDisconnect& rhs) const;
};

struct MessageHeartbeat
{
    static const MessageTypes kType = MessageType_Heartbeat;

    uint32_t Sequence = 0;
    uint64_t TimestampUsec = 0; // Sender clock

    bool operator==(const MessageHeartbeat& rhs) const;
};

struct MessageHeartbeatAck
{
    static const MessageTypes kType = MessageType_HeartbeatAck;

    uint32_t Sequence = 0;
    uint64_t EchoTimestampUsec = 0; // Copied from the Heartbeat

    bool operator==(const MessageHeartbeatAck& rhs) const;
};

// Lists the displays the sender is sharing.  An empty list means the
// sender is not sharing anything.
struct MessageScreenOffer
{
    static const MessageTypes kType = MessageType_ScreenOffer;

    std::vector<DisplayInfo> Displays;

    bool operator==(const MessageScreenOffer& rhs) const;
};

struct MessageScreenRequest
{
    static const MessageTypes kType = MessageType_ScreenRequest;

    uint32_t DisplayId = 0;
    uint8_t PreferredFps = kDefaultFps;
    uint8_t PreferredQuality = StreamQuality_Medium; // StreamQualities

    bool operator==(const MessageScreenRequest& rhs) const;
};

struct MessageScreenStart
{
    static const MessageTypes kType = MessageType_ScreenStart;

    uint32_t DisplayId = 0;
    uint32_t Width = 0;
    uint32_t Height = 0;
    uint8_t Fps = kDefaultFps;
    std::string Codec;

    bool operator==(const MessageScreenStart& rhs) const;
};

struct MessageScreenFrame
{
    static const MessageTypes kType = MessageType_ScreenFrame;

    uint32_t DisplayId = 0;
    uint64_t TimestampUsec = 0; // Capture time on the sharer clock
    uint8_t FrameKind = FrameKind_Delta; // FrameKinds
    uint32_t Sequence = 0; // Strictly increasing per (sharer, display)
    std::vector<uint8_t> Data;

    bool operator==(const MessageScreenFrame& rhs) const;
};

// Sent by the sharer to stop a stream, or by a viewer to cancel viewing
struct MessageScreenStop
{
    static const MessageTypes kType = MessageType_ScreenStop;

    uint32_t DisplayId = 0;
    uint8_t Origin = StopOrigin_Sharer; // StopOrigins

    bool operator==(const MessageScreenStop& rhs) const;
};

// Viewer lost its reference frame and needs a fresh keyframe
struct MessageRequestKeyframe
{
    static const MessageTypes kType = MessageType_RequestKeyframe;

    uint32_t DisplayId = 0;
    uint32_t LastSequence = 0; // Last sequence number the viewer received

    bool operator==(const MessageRequestKeyframe& rhs) const;
};

struct MessageControlRequest
{
    static const MessageTypes kType = MessageType_ControlRequest;

    std::string FromUser;

    bool operator==(const MessageControlRequest& rhs) const;
};

struct MessageControlGrant
{
    static const MessageTypes kType = MessageType_ControlGrant;

    std::string ToUser;

    bool operator==(const MessageControlGrant& rhs) const;
};

struct MessageControlRevoke
{
    static const MessageTypes kType = MessageType_ControlRevoke;

    bool operator==(const MessageControlRevoke& rhs) const;
};

struct MessageInputEvent
{
    static const MessageTypes kType = MessageType_InputEvent;

    uint8_t EventType = InputEventType_MouseMove; // InputEventTypes
    float X = 0.f; // Normalized 0..1 screen coordinates
    float Y = 0.f;
    uint8_t Button = MouseButton_Left; // MouseButtons
    float ScrollX = 0.f;
    float ScrollY = 0.f;
    uint32_t KeyCode = 0;
    uint8_t Modifiers = 0; // ModifierFlags

    bool operator==(const MessageInputEvent& rhs) const;
};

struct MessageChat
{
    static const MessageTypes kType = MessageType_ChatMessage;

    std::string From;
    std::string Content;
    uint64_t TimestampMsec = 0; // Unix time

    bool operator==(const MessageChat& rhs) const;
};

struct MessageFileOffer
{
    static const MessageTypes kType = MessageType_FileOffer;

    std::string FileId;
    std::string Name;
    uint64_t Size = 0;
    std::string Checksum;

    bool operator==(const MessageFileOffer& rhs) const;
};

struct MessageFileAccept
{
    static const MessageTypes kType = MessageType_FileAccept;

    std::string FileId;

    bool operator==(const MessageFileAccept& rhs) const;
};

struct MessageFileReject
{
    static const MessageTypes kType = MessageType_FileReject;

    std::string FileId;

    bool operator==(const MessageFileReject& rhs) const;
};

struct MessageFileChunk
{
    static const MessageTypes kType = MessageType_FileChunk;

    std::string FileId;
    uint64_t Offset = 0;
    std::vector<uint8_t> Data; // Up to kFileChunkBytes

    bool operator==(const MessageFileChunk& rhs) const;
};

struct MessageFileComplete
{
    static const MessageTypes kType = MessageType_FileComplete;

    std::string FileId;

    bool operator==(const MessageFileComplete& rhs) const;
};

struct MessageFileCancel
{
    static const MessageTypes kType = MessageType_FileCancel;

    std::string FileId;

    bool operator==(const MessageFileCancel& rhs) const;
};

// One alternative per message type
using Message = std::variant<
    MessageHandshake,
    MessageHandshakeAck,
    MessageDisconnect,
    MessageHeartbeat,
    MessageHeartbeatAck,
    MessageScreenOffer,
    MessageScreenRequest,
    MessageScreenStart,
    MessageScreenFrame,
    MessageScreenStop,
    MessageRequestKeyframe,
    MessageControlRequest,
    MessageControlGrant,
    MessageControlRevoke,
    MessageInputEvent,
    MessageChat,
    MessageFileOffer,
    MessageFileAccept,
    MessageFileReject,
    MessageFileChunk,
    MessageFileComplete,
    MessageFileCancel
>;

// Type tag for the message
MessageTypes GetMessageType(const Message& msg);


//------------------------------------------------------------------------------
// Tools

// Bitrate the encoder should target for a quality level
uint32_t QualityToBitrate(uint8_t quality);

// Returns a copy of the string with non-printable ASCII characters removed
std::string SanitizeString(const std::string& input, size_t max_bytes);


} // namespace protos
