// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

/*
    Peer Link

    Interfaces shared by the transport and session layers.

    A PeerLink is one established connection to a peer that completed the
    handshake.  The session layer only sees links through this interface,
    which lets tests substitute in-process links for network connections.
*/

#pragma once

#include <MeshProtocol.hpp> // mesh_protocol

#include <cstdint>
#include <string>
#include <memory>

namespace lanmeet {


//------------------------------------------------------------------------------
// PeerIdentity

/// Created at handshake and immutable for the lifetime of the connection
struct PeerIdentity
{
    std::string PeerId; // Stable unique hex id
    std::string Name; // Display name
    uint8_t ProtocolVersion = protos::kProtocolVersion;
    std::string AppVersion;
    uint32_t Capabilities = 0; // protos::CapabilityFlags

    bool HasCapability(protos::CapabilityFlags flag) const
    {
        return (Capabilities & flag) != 0;
    }

    // Short label for logs
    std::string ToString() const;
};


//------------------------------------------------------------------------------
// Enumerations

enum class ConnectionRole
{
    Initiator,
    Acceptor
};

enum class CloseReason
{
    LocalRequest,     ///< Closed by the application
    PeerLost,         ///< Transport reset or timeout
    ProtocolError,    ///< Malformed frame or unexpected handshake message
    HeartbeatTimeout, ///< Too many consecutive heartbeat acks missed
    Rejected,         ///< Handshake rejected (version mismatch or identity conflict)
    PeerRequest,      ///< Peer sent a Disconnect
    Shutdown,         ///< Local process is shutting down

    Count
};

const char* CloseReasonToString(CloseReason reason);

// Disconnect reason code to put on the wire for a local close
uint8_t CloseReasonToDisconnectCode(CloseReason reason);

enum class ConnectError
{
    None,        ///< Connection attempt started or succeeded
    Unreachable, ///< Address could not be resolved or the peer never answered
    TlsRejected, ///< Handshake or key exchange was refused
    Timeout,     ///< Handshake did not complete in time

    Count
};

const char* ConnectErrorToString(ConnectError error);

enum class SendResult
{
    Sent,            ///< Handed to the transport
    Dropped,         ///< Not sent (message could not be encoded, or no room)
    ConnectionClosed ///< Link is closed
};

const char* SendResultToString(SendResult result);

/// Hint for best-effort sends
enum class SendPriority
{
    Bulk,    ///< Video data on the low-priority channel
    Realtime ///< Small latency-sensitive messages (input events)
};


//------------------------------------------------------------------------------
// LinkStats

/// Snapshot of connection liveness
struct LinkStats
{
    // Last heartbeat round trip time, or 0 if none completed yet
    uint64_t RttUsec = 0;

    // Smoothed heartbeat round trip time
    uint64_t SmoothedRttUsec = 0;

    // Last round trip time was far above the smoothed value
    bool RttSpike = false;

    // Consecutive heartbeat acks missed
    unsigned MissedHeartbeats = 0;

    // Last successful send or receive
    uint64_t LastActivityUsec = 0;

    // Estimated delay for data queued on the outgoing path
    uint64_t QueueDelayUsec = 0;

    // Application bytes per second sent
    uint64_t AppBPS = 0;
};


//------------------------------------------------------------------------------
// PeerLink

class PeerLink
{
public:
    virtual ~PeerLink() = default;

    virtual PeerIdentity GetIdentity() const = 0;

    virtual bool IsOpen() const = 0;

    /// Send on the reliable in-order path.
    /// Screen frames use the video channel, everything else the control channel
    virtual SendResult SendReliable(const protos::Message& msg) = 0;

    /// Send without waiting on the peer.  Delivery is not guaranteed
    virtual SendResult SendUnreliable(const protos::Message& msg, SendPriority priority) = 0;

    /// Best-effort Disconnect notice then teardown
    virtual void CloseLink(CloseReason reason) = 0;

    virtual LinkStats GetStats() const = 0;
};


//------------------------------------------------------------------------------
// Fault Signals

enum class FaultKind
{
    ConnectError,     ///< Outgoing connection failed
    ProtocolError,    ///< Connection closed on a malformed frame
    StreamFault,      ///< Keyframe delivery exhausted its retry budget
    DeliveryMiss,     ///< Single delta frame dropped
    SessionStateError ///< Message for a stream not in the expected state
};

const char* FaultKindToString(FaultKind kind);

/// Structured fault report for the UI and logging layer
struct FaultSignal
{
    FaultKind Kind = FaultKind::ProtocolError;
    std::string PeerId;
    uint32_t DisplayId = 0;
    std::string Detail;
};

class FaultSink
{
public:
    virtual ~FaultSink() = default;

    virtual void OnFault(const FaultSignal& fault) = 0;
};


//------------------------------------------------------------------------------
// PeerEventSink

/// Receives connection events in order from one background thread
class PeerEventSink
{
public:
    virtual ~PeerEventSink() = default;

    virtual void OnPeerConnected(const PeerIdentity& peer) = 0;

    virtual void OnPeerMessage(const PeerIdentity& peer, const protos::Message& msg) = 0;

    virtual void OnPeerDisconnected(const PeerIdentity& peer, CloseReason reason) = 0;

    virtual void OnConnectFailed(const std::string& address, ConnectError error) = 0;
};


} // namespace lanmeet
