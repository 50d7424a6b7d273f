// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

/*
    Peer Node

    Owns the UDP socket for this peer.  Accepts incoming connections, opens
    outgoing connections to the configured peer addresses (retrying every
    few seconds), and registers connections that complete the handshake.

    Connection events are delivered to the PeerEventSink in order from one
    background worker thread, so the session layer never runs on tonk
    threads and a slow handler for one peer cannot stall another peer's
    receive path.
*/

#pragma once

#include "PeerConnection.hpp"
#include "ConnectionRegistry.hpp"

#include <core.hpp> // core

#include <map>
#include <vector>

namespace lanmeet {


//------------------------------------------------------------------------------
// Constants

// Maximum number of screen frames waiting for the sink before dropping.
// Lifecycle and control events are never dropped
static const unsigned kMaxQueuedPeerEvents = 4096;


//------------------------------------------------------------------------------
// PeerNodeSettings

struct PeerNodeSettings
{
    uint16_t Port = protos::kDefaultPeerPort;

    // Mesh is small: Limit the number of connections
    unsigned MaximumPeers = 8;

    int BandwidthLimitBPS = protos::kDefaultBandwidthLimitBPS;

    HeartbeatSettings Heartbeat;

    // Time allowed for the handshake to complete
    uint64_t HandshakeTimeoutUsec = 5 * 1000 * 1000;

    // Interval between reconnect attempts to configured peers
    uint64_t ReconnectIntervalUsec = 2 * 1000 * 1000;

    // Peers to keep connected, as "host:port" or "host"
    std::vector<std::string> PeerAddresses;
};

/// Parse "host:port" or "host" (default port).  Returns false if invalid
bool ParsePeerAddress(const std::string& address, std::string& host, uint16_t& port);

/// Screen frames are the only peer messages that may be dropped when the
/// event queue is full.  The receiver recovers from a lost frame on its own
bool IsDroppablePeerEvent(const protos::Message& msg);


//------------------------------------------------------------------------------
// PeerNode

class PeerNode : public tonk::SDKSocket
{
public:
    bool Initialize(
        const PeerNodeSettings& settings,
        const PeerIdentity& self,
        ConnectionRegistry* registry,
        PeerEventSink* sink,
        FaultSink* faults);
    void Shutdown();

    /// Start a connection to a peer.  Completion is reported through the
    /// sink: OnPeerConnected on success or OnConnectFailed on error.
    /// Returns Unreachable if the attempt failed immediately
    ConnectError Open(const std::string& host, uint16_t port);

    const PeerIdentity& GetSelf() const
    {
        return Self;
    }
    const PeerNodeSettings& GetSettings() const
    {
        return Settings;
    }
    ConnectionRegistry* GetRegistry() const
    {
        return Registry;
    }

    tonk::SDKConnectionList<PeerConnection> Connections;

    // Callbacks from PeerConnection

    bool IsIdentityInUse(const std::string& peer_id) const;

    /// Returns false if the connection could not be registered
    bool OnHandshakeComplete(PeerConnection* connection);

    /// Remember who answered at an address even when the handshake failed,
    /// so an address that reaches an already connected peer is not retried
    void OnPeerIdentified(PeerConnection* connection, const std::string& peer_id);

    void OnPeerMessage(PeerConnection* connection, protos::Message& msg);

    void OnConnectionClosed(
        PeerConnection* connection,
        CloseReason reason,
        bool was_accepted,
        ConnectError connect_error);

    void ReportFault(const FaultSignal& fault);

protected:
    virtual tonk::SDKConnection* OnIncomingConnection(
        const TonkAddress& address ///< Address of the client requesting a connection
    );
    virtual tonk::SDKConnection* OnP2PConnectionStart(
        const TonkAddress& address ///< Address of the other peer we are to connect to
    );

private:
    PeerNodeSettings Settings;
    PeerIdentity Self;
    ConnectionRegistry* Registry = nullptr;
    PeerEventSink* Sink = nullptr;
    FaultSink* Faults = nullptr;

    // Delivers events to the sink in order
    WorkerQueue Events;

    mutable std::mutex AddressLock;

    // Outgoing attempts in progress by address
    std::map<std::string, std::shared_ptr<PeerConnection>> Pending;

    // Peer id learned for each configured address
    std::map<std::string, std::string> PeerIdByAddress;

    std::atomic<bool> Terminated = ATOMIC_VAR_INIT(true);
    std::shared_ptr<std::thread> Thread;

    void Loop();

    void ReconnectPeers();

    void PostEvent(WorkerCallback callback, const char* what, bool droppable = false);

    std::shared_ptr<PeerConnection> FindConnection(PeerConnection* connection);
};


} // namespace lanmeet
