// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "PeerNode.hpp"

#include <core_logging.hpp> // core

#include <cstdlib>

namespace lanmeet {


//------------------------------------------------------------------------------
// Tools

bool ParsePeerAddress(const std::string& address, std::string& host, uint16_t& port)
{
    host.clear();
    port = protos::kDefaultPeerPort;

    if (address.empty()) {
        return false;
    }

    const size_t colon = address.rfind(':');
    if (colon == std::string::npos) {
        host = address;
        return true;
    }

    host = address.substr(0, colon);
    const std::string port_str = address.substr(colon + 1);
    if (host.empty() || port_str.empty() || port_str.size() > 5) {
        return false;
    }
    for (char ch : port_str) {
        if (ch < '0' || ch > '9') {
            return false;
        }
    }

    const long value = std::strtol(port_str.c_str(), nullptr, 10);
    if (value <= 0 || value > 65535) {
        return false;
    }
    port = static_cast<uint16_t>( value );
    return true;
}

bool IsDroppablePeerEvent(const protos::Message& msg)
{
    return protos::GetMessageType(msg) == protos::MessageType_ScreenFrame;
}

static std::string FormatAddress(const std::string& host, uint16_t port)
{
    return fmt::format("{}:{}", host, port);
}


//------------------------------------------------------------------------------
// PeerNode

bool PeerNode::Initialize(
    const PeerNodeSettings& settings,
    const PeerIdentity& self,
    ConnectionRegistry* registry,
    PeerEventSink* sink,
    FaultSink* faults)
{
    Settings = settings;
    Self = self;
    Registry = registry;
    Sink = sink;
    Faults = faults;

    if (!Registry || !Sink) {
        spdlog::error("PeerNode requires a registry and an event sink");
        return false;
    }

    if (sodium_init() < 0) {
        spdlog::error("sodium_init failed");
        return false;
    }

    Events.Initialize(kMaxQueuedPeerEvents, "PeerEvents");

    // Removal from the registry is the only way a connected peer goes away
    Registry->SetListener([this](const PeerIdentity& peer, CloseReason reason) {
        PostEvent([this, peer, reason]() {
            Sink->OnPeerDisconnected(peer, reason);
        }, "OnPeerDisconnected");
    });

    // Set netcode configuration
    tonk::SDKSocket::Config.UDPListenPort = Settings.Port;
    tonk::SDKSocket::Config.MaximumClients = Settings.MaximumPeers;
    tonk::SDKSocket::Config.TimerIntervalUsec = 10000; // 10 msec
    tonk::SDKSocket::Config.Flags = \
        TONK_FLAGS_ENABLE_UPNP |
        TONK_FLAGS_DISABLE_COMPRESSION |
        TONK_FLAGS_DISABLE_FEC_BW_PROBES |
        TONK_FLAGS_DISABLE_BW_PROBES;
    tonk::SDKSocket::Config.BandwidthLimitBPS = Settings.BandwidthLimitBPS;

    tonk::SDKJsonResult result = tonk::SDKSocket::Create();
    if (!result) {
        spdlog::error("Unable to create socket: {}", result.ToString());
        Registry->SetListener(nullptr);
        Events.Shutdown();
        return false;
    }

    spdlog::info("Peer {} listening on UDP port {} with {} configured peers",
        Self.ToString(), Settings.Port, Settings.PeerAddresses.size());

    Terminated = false;
    Thread = std::make_shared<std::thread>(&PeerNode::Loop, this);
    return true;
}

void PeerNode::Shutdown()
{
    const uint64_t t0 = GetTimeUsec();

    spdlog::info("PeerNode::Shutdown started: Terminating background thread...");

    Terminated = true;
    JoinThread(Thread);

    if (Registry) {
        Registry->Clear(CloseReason::Shutdown);
    }

    spdlog::info("Destroying socket...");

    tonk::SDKSocket::BlockingDestroy();

    {
        std::lock_guard<std::mutex> locker(AddressLock);
        Pending.clear();
    }

    // Deliver remaining disconnect events before the sink goes away
    Events.Shutdown();

    if (Registry) {
        Registry->SetListener(nullptr);
    }

    const uint64_t t1 = GetTimeUsec();

    spdlog::info("PeerNode shutdown complete in {} msec", (t1 - t0) / 1000.f);
}

ConnectError PeerNode::Open(const std::string& host, uint16_t port)
{
    const std::string address = FormatAddress(host, port);

    auto connection = std::make_shared<PeerConnection>(this, ConnectionRole::Initiator, address);

    // Insert into connection list to prevent it from going out of scope
    Connections.Insert(connection.get());
    {
        std::lock_guard<std::mutex> locker(AddressLock);
        Pending[address] = connection;
    }

    tonk::SDKJsonResult result = tonk::SDKSocket::Connect(
        connection.get(),
        host,
        port);
    if (!result) {
        spdlog::error("Connect to {} failed fast: {}", address, result.ToString());
        {
            std::lock_guard<std::mutex> locker(AddressLock);
            auto it = Pending.find(address);
            if (it != Pending.end() && it->second == connection) {
                Pending.erase(it);
            }
        }
        Connections.Remove(connection.get());
        return ConnectError::Unreachable;
    }

    spdlog::info("Connection started with {}", address);
    return ConnectError::None;
}

bool PeerNode::IsIdentityInUse(const std::string& peer_id) const
{
    return Registry->Contains(peer_id);
}

bool PeerNode::OnHandshakeComplete(PeerConnection* connection)
{
    std::shared_ptr<PeerConnection> ptr = FindConnection(connection);
    if (!ptr) {
        spdlog::error("Handshake completed for an unknown connection");
        return false;
    }

    const PeerIdentity peer = connection->GetIdentity();

    // Registration is atomic: The loser of a simultaneous connect is closed
    if (!Registry->Register(peer, ptr)) {
        return false;
    }

    if (connection->GetRole() == ConnectionRole::Initiator)
    {
        std::lock_guard<std::mutex> locker(AddressLock);
        PeerIdByAddress[connection->GetAddress()] = peer.PeerId;
        auto it = Pending.find(connection->GetAddress());
        if (it != Pending.end() && it->second.get() == connection) {
            Pending.erase(it);
        }
    }

    PostEvent([this, peer]() {
        Sink->OnPeerConnected(peer);
    }, "OnPeerConnected");
    return true;
}

void PeerNode::OnPeerIdentified(PeerConnection* connection, const std::string& peer_id)
{
    if (connection->GetRole() != ConnectionRole::Initiator || peer_id.empty()) {
        return;
    }

    std::lock_guard<std::mutex> locker(AddressLock);
    PeerIdByAddress[connection->GetAddress()] = peer_id;
}

void PeerNode::OnPeerMessage(PeerConnection* connection, protos::Message& msg)
{
    const PeerIdentity peer = connection->GetIdentity();
    auto shared_msg = std::make_shared<protos::Message>(std::move(msg));

    const bool droppable = IsDroppablePeerEvent(*shared_msg);

    PostEvent([this, peer, shared_msg]() {
        Sink->OnPeerMessage(peer, *shared_msg);
    }, "OnPeerMessage", droppable);
}

void PeerNode::OnConnectionClosed(
    PeerConnection* connection,
    CloseReason reason,
    bool was_accepted,
    ConnectError connect_error)
{
    if (was_accepted) {
        Registry->UnregisterLink(connection, reason);
    }
    else if (connection->GetRole() == ConnectionRole::Initiator && connect_error != ConnectError::None)
    {
        const std::string address = connection->GetAddress();

        FaultSignal fault;
        fault.Kind = FaultKind::ConnectError;
        fault.Detail = fmt::format("{}: {}", address, ConnectErrorToString(connect_error));
        ReportFault(fault);

        PostEvent([this, address, connect_error]() {
            Sink->OnConnectFailed(address, connect_error);
        }, "OnConnectFailed");
    }

    if (connection->GetRole() == ConnectionRole::Initiator)
    {
        std::lock_guard<std::mutex> locker(AddressLock);
        auto it = Pending.find(connection->GetAddress());
        if (it != Pending.end() && it->second.get() == connection) {
            Pending.erase(it);
        }
    }

    Connections.Remove(connection);
}

void PeerNode::ReportFault(const FaultSignal& fault)
{
    if (Faults) {
        Faults->OnFault(fault);
    } else {
        spdlog::warn("Fault {}: peer={} {}", FaultKindToString(fault.Kind), fault.PeerId, fault.Detail);
    }
}

tonk::SDKConnection* PeerNode::OnIncomingConnection(
    const TonkAddress& address ///< Address of the client requesting a connection
)
{
    if (Terminated) {
        return nullptr;
    }

    spdlog::info("Incoming connection from {}:{}", address.NetworkString, address.UDPPort);

    auto ptr = std::make_shared<PeerConnection>(this, ConnectionRole::Acceptor, std::string());

    // Insert into connection list to prevent it from going out of scope
    Connections.Insert(ptr.get());

    return ptr.get();
}

tonk::SDKConnection* PeerNode::OnP2PConnectionStart(
    const TonkAddress& address ///< Address of the other peer we are to connect to
)
{
    return OnIncomingConnection(address);
}

std::shared_ptr<PeerConnection> PeerNode::FindConnection(PeerConnection* connection)
{
    auto connections = Connections.GetList();
    for (auto& ptr : connections) {
        if (ptr.get() == connection) {
            return ptr;
        }
    }
    return nullptr;
}

void PeerNode::PostEvent(WorkerCallback callback, const char* what, bool droppable)
{
    if (Events.SubmitWork(callback, droppable)) {
        return;
    }
    if (Events.IsTerminated()) {
        spdlog::debug("Peer event queue stopped: Dropped {}", what);
    } else {
        spdlog::warn("Peer event queue full: Dropped {}", what);
    }
}

void PeerNode::Loop()
{
    SetCurrentThreadName("PeerNode::Loop");

    uint64_t last_connect_usec = 0;

    while (!Terminated)
    {
        const uint64_t now_usec = GetTimeUsec();
        if (last_connect_usec != 0 && now_usec - last_connect_usec < Settings.ReconnectIntervalUsec) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }
        last_connect_usec = now_usec;

        ReconnectPeers();

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

void PeerNode::ReconnectPeers()
{
    for (const std::string& configured : Settings.PeerAddresses)
    {
        std::string host;
        uint16_t port = 0;
        if (!ParsePeerAddress(configured, host, port)) {
            spdlog::error("Ignoring invalid peer address: '{}'", configured);
            continue;
        }
        const std::string address = FormatAddress(host, port);

        {
            std::lock_guard<std::mutex> locker(AddressLock);
            if (Pending.find(address) != Pending.end()) {
                continue;
            }
            auto it = PeerIdByAddress.find(address);
            if (it != PeerIdByAddress.end())
            {
                if (it->second == Self.PeerId) {
                    continue; // Address loops back to this peer
                }
                if (Registry->Contains(it->second)) {
                    continue;
                }
            }
        }

        spdlog::debug("Connecting to peer at {}...", address);
        Open(host, port);
    }
}


} // namespace lanmeet
