// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

/*
    Peer Connection

    One tonk connection to another peer, in either role.

    Channels:
        Control:   Reliable in-order.  Handshake and HandshakeAck travel in
                   plaintext, then everything else is encrypted: session
                   control, chat, file transfer, heartbeats.  Sharing one
                   channel keeps the first encrypted message behind the
                   HandshakeAck.
        Video:     Low-priority reliable, encrypted.  Screen frames.  Does
                   not hold up the control channel.  Stale delta frames are
                   dropped by the sender instead of queueing here.
        Datagram:  Unreliable, encrypted.  Small input events.

    The stream channels may split a frame into several tonk messages, so each
    has its own StreamDecoder.

    After the handshake both sides derive session keys from an X25519 key
    exchange (libsodium crypto_kx).  The peer is not authenticated: this is
    for LAN use only.
*/

#pragma once

#include "PeerLink.hpp"
#include "PeerHandshake.hpp"
#include "HeartbeatMonitor.hpp"

#include <WireCodec.hpp> // mesh_protocol
#include <TonkCppSDK.hpp> // tonk
#include <sodium.h> // sodium

#include <atomic>
#include <mutex>
#include <string>

namespace lanmeet {


//------------------------------------------------------------------------------
// Constants

// Tonk Reliable In-Order Channel for the handshake and control messages
static const uint32_t kChannelControl = TonkChannel_Reliable0;

// Tonk Low-Priority Reliable Channel for screen frames
static const uint32_t kChannelVideo = TonkChannel_LowPri0;

// Tonk Unreliable Channel for small realtime messages
static const uint32_t kChannelDatagram = TonkChannel_Unreliable;

// Largest tonk message sent on the stream channels
static const int kMaxChunkBytes = 16000;

// Realtime messages larger than this go on the video channel instead
static const int kMaxDatagramBytes = 1000;


//------------------------------------------------------------------------------
// PeerConnection

class PeerNode;

class PeerConnection
    : public tonk::SDKConnection
    , public PeerLink
{
public:
    PeerConnection(PeerNode* node, ConnectionRole role, const std::string& address)
        : Node(node)
        , Role(role)
        , Address(address)
    {
    }

    ConnectionRole GetRole() const
    {
        return Role;
    }

    /// Address this connection was opened to, or empty for accepted connections
    const std::string& GetAddress() const
    {
        return Address;
    }

    // PeerLink interface
    PeerIdentity GetIdentity() const override;
    bool IsOpen() const override;
    SendResult SendReliable(const protos::Message& msg) override;
    SendResult SendUnreliable(const protos::Message& msg, SendPriority priority) override;
    void CloseLink(CloseReason reason) override;
    LinkStats GetStats() const override;

protected:
    void OnConnect() override;
    void OnData(
        uint32_t          channel,  ///< Channel number attached to each message by sender
        const uint8_t*       data,  ///< Pointer to a buffer containing the message data
        uint32_t            bytes   ///< Number of bytes in the message
    ) override;
    void OnSecureData(
        uint32_t          channel,  ///< Channel number attached to each message by sender
        const uint8_t*       data,  ///< Pointer to a buffer containing the message data
        uint32_t            bytes   ///< Number of bytes in the message
    ) override;
    void OnTick(
        uint64_t          nowUsec   ///< Current timestamp in microseconds
    ) override;
    void OnClose(
        const tonk::SDKJsonResult& reason
    ) override;

    void OnHandshake(const protos::MessageHandshake& msg);
    void OnHandshakeAck(const protos::MessageHandshakeAck& msg);
    void OnHeartbeat(const protos::MessageHeartbeat& msg);
    void OnHeartbeatAck(const protos::MessageHeartbeatAck& msg);
    void OnDisconnect(const protos::MessageDisconnect& msg);
    void OnMessage(protos::Message& msg);

    // Drain whole messages from a stream channel decoder
    void DrainStream(protos::StreamDecoder& decoder, bool plaintext);

    // Encode and send in chunks on a stream channel
    SendResult SendOnChannel(const protos::Message& msg, uint32_t channel);

    void SendHeartbeat(const protos::MessageHeartbeat& msg);

    void FailProtocol(const std::string& detail);

    // Handshake completed: Register with the node
    void OnAccepted();

private:
    PeerNode* Node = nullptr;
    const ConnectionRole Role;
    const std::string Address;
    std::string NetLocalName;

    uint64_t CreatedUsec = 0;

    // Handshake and heartbeat state
    mutable std::mutex StateLock;
    PeerHandshake Handshake;
    HeartbeatMonitor Heartbeat;
    PeerIdentity Remote;

    // Key exchange
    uint8_t KxPublicKey[crypto_kx_PUBLICKEYBYTES] = {};
    uint8_t KxSecretKey[crypto_kx_SECRETKEYBYTES] = {};

    // Serializes chunked sends so frames do not interleave on a channel
    std::mutex SendLock;

    // Decoders are only touched from tonk callbacks for this connection
    protos::StreamDecoder HandshakeDecoder;
    protos::StreamDecoder ControlDecoder;
    protos::StreamDecoder VideoDecoder;

    std::atomic<bool> Accepted = ATOMIC_VAR_INIT(false);
    std::atomic<bool> Closing = ATOMIC_VAR_INIT(false);
    std::atomic<bool> HandshakeTimedOut = ATOMIC_VAR_INIT(false);
    std::atomic<bool> PeerRequestedClose = ATOMIC_VAR_INIT(false);
    std::atomic<uint64_t> LastActivityUsec = ATOMIC_VAR_INIT(0);

    // Reason recorded by CloseLink() for OnClose()
    std::atomic<CloseReason> LocalCloseReason = ATOMIC_VAR_INIT(CloseReason::PeerLost);
    std::atomic<bool> HasLocalCloseReason = ATOMIC_VAR_INIT(false);
};


} // namespace lanmeet
