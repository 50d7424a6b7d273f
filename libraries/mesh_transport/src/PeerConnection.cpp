// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "PeerConnection.hpp"
#include "PeerNode.hpp"

#include <core_string.hpp> // core
#include <core_logging.hpp> // core

#include <xxhash.h> // xxhash

#include <cstring>

namespace lanmeet {


//------------------------------------------------------------------------------
// Tools

static_assert(crypto_kx_PUBLICKEYBYTES == protos::kPublicKeyBytes, "Update kPublicKeyBytes");

static std::string KeyFingerprint(const uint8_t* key, size_t bytes)
{
    return HexString(XXH64(key, bytes, 0));
}


//------------------------------------------------------------------------------
// PeerConnection: PeerLink

PeerIdentity PeerConnection::GetIdentity() const
{
    std::lock_guard<std::mutex> locker(StateLock);
    return Remote;
}

bool PeerConnection::IsOpen() const
{
    return Accepted && !Closing;
}

SendResult PeerConnection::SendReliable(const protos::Message& msg)
{
    if (!IsOpen()) {
        return SendResult::ConnectionClosed;
    }

    // Frames of a stream stay on one channel so keyframes and deltas arrive in order
    const bool is_frame = std::holds_alternative<protos::MessageScreenFrame>(msg);
    return SendOnChannel(msg, is_frame ? kChannelVideo : kChannelControl);
}

SendResult PeerConnection::SendUnreliable(const protos::Message& msg, SendPriority priority)
{
    if (!IsOpen()) {
        return SendResult::ConnectionClosed;
    }

    if (priority == SendPriority::Realtime)
    {
        std::vector<uint8_t> frame;
        if (!protos::EncodeMessage(msg, frame)) {
            spdlog::error("{} Failed to encode realtime message", NetLocalName);
            return SendResult::Dropped;
        }

        if (static_cast<int>( frame.size() ) <= kMaxDatagramBytes)
        {
            tonk::SDKResult result = Send(frame.data(), frame.size(), kChannelDatagram);
            if (!result) {
                spdlog::warn("{} Datagram send failed: {}", NetLocalName, result.ToString());
                return SendResult::ConnectionClosed;
            }
            LastActivityUsec = GetTimeUsec();
            return SendResult::Sent;
        }
    }

    return SendOnChannel(msg, kChannelVideo);
}

void PeerConnection::CloseLink(CloseReason reason)
{
    if (Closing.exchange(true)) {
        return;
    }

    LocalCloseReason = reason;
    HasLocalCloseReason = true;

    spdlog::info("{} Closing connection: {}", NetLocalName, CloseReasonToString(reason));

    if (Accepted && reason != CloseReason::PeerRequest && reason != CloseReason::PeerLost)
    {
        protos::MessageDisconnect disconnect;
        disconnect.Reason = CloseReasonToDisconnectCode(reason);
        disconnect.Detail = CloseReasonToString(reason);

        // Best-effort: The peer will time out if this is lost
        const SendResult result = SendOnChannel(disconnect, kChannelControl);
        if (result != SendResult::Sent) {
            spdlog::debug("{} Disconnect notice not sent: {}", NetLocalName, SendResultToString(result));
        }
    }

    Close();
}

LinkStats PeerConnection::GetStats() const
{
    LinkStats stats;
    {
        std::lock_guard<std::mutex> locker(StateLock);
        stats.RttUsec = Heartbeat.GetLastRttUsec();
        stats.SmoothedRttUsec = Heartbeat.GetSmoothedRttUsec();
        stats.RttSpike = Heartbeat.IsRttSpike();
        stats.MissedHeartbeats = Heartbeat.GetMissedCount();
    }
    stats.LastActivityUsec = LastActivityUsec;

    // GetStatus() is not const in the SDK
    const TonkStatus status = const_cast<PeerConnection*>(this)->GetStatus();
    stats.QueueDelayUsec = static_cast<uint64_t>( status.ReliableQueueMsec ) * 1000;
    stats.AppBPS = status.AppBPS;
    return stats;
}


//------------------------------------------------------------------------------
// PeerConnection: Tonk callbacks

void PeerConnection::OnConnect()
{
    const TonkStatusEx status = GetStatusEx();
    NetLocalName = fmt::format("[Peer {}:{}]", status.Remote.NetworkString, status.Remote.UDPPort);
    spdlog::info("{} Connected as {}", NetLocalName,
        Role == ConnectionRole::Initiator ? "initiator" : "acceptor");

    CreatedUsec = GetTimeUsec();
    LastActivityUsec = CreatedUsec;

    PeerNode* node = Node;
    {
        std::lock_guard<std::mutex> locker(StateLock);
        Handshake.Initialize(Node->GetSelf(), [node](const std::string& peer_id) {
            return node->IsIdentityInUse(peer_id);
        });
        Heartbeat.Initialize(Node->GetSettings().Heartbeat);
    }

    if (0 != crypto_kx_keypair(KxPublicKey, KxSecretKey)) {
        spdlog::error("{} crypto_kx_keypair failed", NetLocalName);
        CloseLink(CloseReason::Rejected);
        return;
    }

    // Acceptor waits for the Handshake
    if (Role != ConnectionRole::Initiator) {
        return;
    }

    protos::PublicKeyBytes public_key;
    memcpy(public_key.data(), KxPublicKey, public_key.size());

    protos::MessageHandshake request;
    {
        std::lock_guard<std::mutex> locker(StateLock);
        request = Handshake.MakeRequest(public_key);
    }

    spdlog::info("{} Sending handshake: H(pk):{}", NetLocalName,
        KeyFingerprint(KxPublicKey, sizeof(KxPublicKey)));

    const SendResult result = SendOnChannel(request, kChannelControl);
    if (result != SendResult::Sent) {
        spdlog::error("{} Handshake send failed", NetLocalName);
        CloseLink(CloseReason::PeerLost);
    }
}

void PeerConnection::OnData(
    uint32_t          channel,  ///< Channel number attached to each message by sender
    const uint8_t*       data,  ///< Pointer to a buffer containing the message data
    uint32_t            bytes   ///< Number of bytes in the message
)
{
    if (bytes <= 0 || Closing) {
        return;
    }

    // Only the handshake is sent in plaintext
    if (channel != kChannelControl || Accepted) {
        FailProtocol(fmt::format("Unexpected plaintext data on channel {}", channel));
        return;
    }

    HandshakeDecoder.Feed(data, static_cast<int>( bytes ));
    DrainStream(HandshakeDecoder, true);
}

void PeerConnection::OnSecureData(
    uint32_t          channel,  ///< Channel number attached to each message by sender
    const uint8_t*       data,  ///< Pointer to a buffer containing the message data
    uint32_t            bytes   ///< Number of bytes in the message
)
{
    if (bytes <= 0 || Closing) {
        return;
    }

    if (channel == kChannelControl)
    {
        ControlDecoder.Feed(data, static_cast<int>( bytes ));
        DrainStream(ControlDecoder, false);
    }
    else if (channel == kChannelVideo)
    {
        VideoDecoder.Feed(data, static_cast<int>( bytes ));
        DrainStream(VideoDecoder, false);
    }
    else if (channel == kChannelDatagram)
    {
        // Each datagram holds exactly one frame
        protos::Message msg;
        int frame_bytes = 0;
        const protos::DecodeResult result = protos::DecodeMessage(data, static_cast<int>( bytes ), msg, frame_bytes);
        if (result != protos::DecodeResult::Success || frame_bytes != static_cast<int>( bytes )) {
            FailProtocol("Malformed datagram");
            return;
        }
        LastActivityUsec = GetTimeUsec();
        OnMessage(msg);
    }
    else
    {
        spdlog::error("{} Ignored data on unexpected channel {}", NetLocalName, channel);
    }
}

void PeerConnection::OnTick(
    uint64_t          nowUsec   ///< Current timestamp in microseconds
)
{
    // Heartbeat timestamps use our own clock so acks can be compared
    LANMEET_UNUSED(nowUsec);

    if (Closing || CreatedUsec == 0) {
        return;
    }

    if (!Accepted)
    {
        const uint64_t timeout_usec = Node->GetSettings().HandshakeTimeoutUsec;
        const uint64_t now_usec = GetTimeUsec();
        if (now_usec - CreatedUsec > timeout_usec) {
            spdlog::warn("{} Handshake timed out after {} msec", NetLocalName, (now_usec - CreatedUsec) / 1000);
            HandshakeTimedOut = true;
            CloseLink(CloseReason::PeerLost);
        }
        return;
    }

    bool send_heartbeat = false;
    bool timed_out = false;
    unsigned missed = 0;
    protos::MessageHeartbeat heartbeat;
    {
        std::lock_guard<std::mutex> locker(StateLock);
        send_heartbeat = Heartbeat.OnTick(GetTimeUsec(), heartbeat);
        timed_out = Heartbeat.IsTimedOut();
        missed = Heartbeat.GetMissedCount();
    }

    if (timed_out) {
        spdlog::warn("{} Peer missed {} heartbeats: Disconnecting", NetLocalName, missed);
        CloseLink(CloseReason::HeartbeatTimeout);
        return;
    }

    if (send_heartbeat) {
        SendHeartbeat(heartbeat);
    }
}

void PeerConnection::OnClose(
    const tonk::SDKJsonResult& reason
)
{
    const bool was_accepted = Accepted;

    CloseReason close_reason = CloseReason::PeerLost;
    if (HasLocalCloseReason) {
        close_reason = LocalCloseReason;
    } else if (PeerRequestedClose) {
        close_reason = CloseReason::PeerRequest;
    }

    ConnectError connect_error = ConnectError::None;
    if (!was_accepted && Role == ConnectionRole::Initiator)
    {
        if (HandshakeTimedOut) {
            connect_error = ConnectError::Timeout;
        } else if (close_reason == CloseReason::Rejected || close_reason == CloseReason::ProtocolError) {
            connect_error = ConnectError::TlsRejected;
        } else {
            connect_error = ConnectError::Unreachable;
        }
    }

    Closing = true;
    Accepted = false;

    spdlog::warn("{} Disconnected: reason={} tonk={}", NetLocalName,
        CloseReasonToString(close_reason), reason.ToString());

    sodium_memzero(KxSecretKey, sizeof(KxSecretKey));

    Node->OnConnectionClosed(this, close_reason, was_accepted, connect_error);
}


//------------------------------------------------------------------------------
// PeerConnection: Message handlers

void PeerConnection::DrainStream(protos::StreamDecoder& decoder, bool plaintext)
{
    protos::Message msg;

    while (!Closing)
    {
        const protos::DecodeResult result = decoder.Next(msg);
        if (result == protos::DecodeResult::NeedMoreData) {
            return;
        }
        if (result == protos::DecodeResult::CorruptFrame) {
            FailProtocol("Corrupt frame");
            return;
        }

        LastActivityUsec = GetTimeUsec();

        if (!plaintext) {
            OnMessage(msg);
            continue;
        }

        if (auto handshake = std::get_if<protos::MessageHandshake>(&msg)) {
            OnHandshake(*handshake);
        } else if (auto ack = std::get_if<protos::MessageHandshakeAck>(&msg)) {
            OnHandshakeAck(*ack);
        } else {
            FailProtocol(fmt::format("Unexpected plaintext {}",
                protos::MessageTypeToString(static_cast<uint8_t>( protos::GetMessageType(msg) ))));
            return;
        }
    }
}

void PeerConnection::OnMessage(protos::Message& msg)
{
    switch (protos::GetMessageType(msg))
    {
    case protos::MessageType_Heartbeat:
        OnHeartbeat(std::get<protos::MessageHeartbeat>(msg));
        break;
    case protos::MessageType_HeartbeatAck:
        OnHeartbeatAck(std::get<protos::MessageHeartbeatAck>(msg));
        break;
    case protos::MessageType_Disconnect:
        OnDisconnect(std::get<protos::MessageDisconnect>(msg));
        break;
    case protos::MessageType_Handshake:
    case protos::MessageType_HandshakeAck:
        FailProtocol("Handshake repeated after keys were set");
        break;
    default:
        if (!Accepted) {
            spdlog::warn("{} Ignored {} before handshake completed", NetLocalName,
                protos::MessageTypeToString(static_cast<uint8_t>( protos::GetMessageType(msg) )));
            break;
        }
        Node->OnPeerMessage(this, msg);
        break;
    }
}

void PeerConnection::OnHandshake(const protos::MessageHandshake& msg)
{
    if (Role != ConnectionRole::Acceptor) {
        FailProtocol("Initiator received a Handshake");
        return;
    }

    protos::PublicKeyBytes public_key;
    memcpy(public_key.data(), KxPublicKey, public_key.size());

    protos::MessageHandshakeAck ack;
    bool accepted = false;
    PeerIdentity remote;
    protos::PublicKeyBytes peer_key;
    {
        std::lock_guard<std::mutex> locker(StateLock);
        ack = Handshake.OnRequest(msg, public_key);
        accepted = Handshake.IsAccepted();
        remote = Handshake.GetRemote();
        peer_key = Handshake.GetRemotePublicKey();
    }

    spdlog::info("{} Handshake from {} version={} app={}: H(pk):{}", NetLocalName,
        remote.ToString(), (unsigned)remote.ProtocolVersion, remote.AppVersion,
        KeyFingerprint(peer_key.data(), peer_key.size()));

    uint8_t rx[crypto_kx_SESSIONKEYBYTES], tx[crypto_kx_SESSIONKEYBYTES];

    if (accepted && 0 != crypto_kx_server_session_keys(rx, tx, KxPublicKey, KxSecretKey, peer_key.data())) {
        spdlog::error("{} crypto_kx_server_session_keys rejected the peer public key", NetLocalName);
        accepted = false;
        ack.Accepted = false;
        ack.Reason = "Key exchange failed";
    }

    if (!accepted) {
        spdlog::warn("{} Rejecting peer {}: {}", NetLocalName, remote.ToString(), ack.Reason);
        const SendResult result = SendOnChannel(ack, kChannelControl);
        if (result != SendResult::Sent) {
            spdlog::debug("{} Reject notice not sent: {}", NetLocalName, SendResultToString(result));
        }
        CloseLink(CloseReason::Rejected);
        return;
    }

    // Ack goes out in plaintext before the keys are installed
    if (SendOnChannel(ack, kChannelControl) != SendResult::Sent) {
        CloseLink(CloseReason::PeerLost);
        return;
    }

    spdlog::info("{} Accepted peer: H(tx):{} H(rx):{}", NetLocalName,
        KeyFingerprint(tx, sizeof(tx)),
        KeyFingerprint(rx, sizeof(rx)));

    // Encrypt everything from here on
    SetKeys(crypto_kx_SESSIONKEYBYTES, tx, rx, TonkKeyBehavior_Immediate);

    sodium_memzero(rx, sizeof(rx));
    sodium_memzero(tx, sizeof(tx));
    sodium_memzero(KxSecretKey, sizeof(KxSecretKey));

    OnAccepted();
    if (!Accepted) {
        return;
    }

    // First encrypted message tells the initiator to switch keys
    protos::MessageHeartbeat heartbeat;
    bool send_heartbeat = false;
    {
        std::lock_guard<std::mutex> locker(StateLock);
        send_heartbeat = Heartbeat.OnTick(GetTimeUsec(), heartbeat);
    }
    if (send_heartbeat) {
        SendHeartbeat(heartbeat);
    }
}

void PeerConnection::OnHandshakeAck(const protos::MessageHandshakeAck& msg)
{
    if (Role != ConnectionRole::Initiator) {
        FailProtocol("Acceptor received a HandshakeAck");
        return;
    }

    bool accepted = false;
    PeerIdentity remote;
    protos::PublicKeyBytes peer_key;
    std::string reject_reason;
    {
        std::lock_guard<std::mutex> locker(StateLock);
        accepted = Handshake.OnAck(msg);
        remote = Handshake.GetRemote();
        peer_key = Handshake.GetRemotePublicKey();
        reject_reason = Handshake.GetRejectReason();
    }

    if (!accepted) {
        spdlog::warn("{} Handshake with {} rejected: {}", NetLocalName, remote.ToString(), reject_reason);
        if (IsHexString(remote.PeerId)) {
            Node->OnPeerIdentified(this, remote.PeerId);
        }
        CloseLink(CloseReason::Rejected);
        return;
    }

    uint8_t rx[crypto_kx_SESSIONKEYBYTES], tx[crypto_kx_SESSIONKEYBYTES];

    if (0 != crypto_kx_client_session_keys(rx, tx, KxPublicKey, KxSecretKey, peer_key.data())) {
        spdlog::error("{} crypto_kx_client_session_keys rejected the peer public key", NetLocalName);
        CloseLink(CloseReason::Rejected);
        return;
    }

    spdlog::info("{} Handshake accepted by {}: H(pk):{} H(tx):{} H(rx):{}", NetLocalName,
        remote.ToString(),
        KeyFingerprint(peer_key.data(), peer_key.size()),
        KeyFingerprint(tx, sizeof(tx)),
        KeyFingerprint(rx, sizeof(rx)));

    // Wait for peer to send us a valid encrypted message to start enabling encryption
    SetKeys(crypto_kx_SESSIONKEYBYTES, tx, rx, TonkKeyBehavior_WaitForPeer);

    sodium_memzero(rx, sizeof(rx));
    sodium_memzero(tx, sizeof(tx));
    sodium_memzero(KxSecretKey, sizeof(KxSecretKey));

    OnAccepted();
}

void PeerConnection::OnAccepted()
{
    {
        std::lock_guard<std::mutex> locker(StateLock);
        Remote = Handshake.GetRemote();
    }

    Accepted = true;

    if (!Node->OnHandshakeComplete(this)) {
        spdlog::warn("{} Registration failed: Closing duplicate connection", NetLocalName);
        CloseLink(CloseReason::Rejected);
        Accepted = false;
    }
}

void PeerConnection::OnHeartbeat(const protos::MessageHeartbeat& msg)
{
    protos::MessageHeartbeatAck ack;
    ack.Sequence = msg.Sequence;
    ack.EchoTimestampUsec = msg.TimestampUsec;

    const SendResult result = SendOnChannel(ack, kChannelControl);
    if (result != SendResult::Sent) {
        spdlog::warn("{} HeartbeatAck send failed: {}", NetLocalName, SendResultToString(result));
    }
}

void PeerConnection::OnHeartbeatAck(const protos::MessageHeartbeatAck& msg)
{
    bool matched = false;
    uint64_t rtt_usec = 0;
    bool spike = false;
    {
        std::lock_guard<std::mutex> locker(StateLock);
        matched = Heartbeat.OnAck(msg, GetTimeUsec());
        rtt_usec = Heartbeat.GetLastRttUsec();
        spike = Heartbeat.IsRttSpike();
    }

    if (!matched) {
        spdlog::debug("{} Ignored stale heartbeat ack seq={}", NetLocalName, msg.Sequence);
        return;
    }
    if (spike) {
        spdlog::warn("{} Heartbeat RTT spike: {} msec", NetLocalName, rtt_usec / 1000.f);
    }
}

void PeerConnection::OnDisconnect(const protos::MessageDisconnect& msg)
{
    spdlog::info("{} Peer disconnected: code={} detail={}", NetLocalName,
        (unsigned)msg.Reason, protos::SanitizeString(msg.Detail, 128));

    PeerRequestedClose = true;
    CloseLink(CloseReason::PeerRequest);
}

void PeerConnection::FailProtocol(const std::string& detail)
{
    spdlog::error("{} Protocol error: {}", NetLocalName, detail);

    FaultSignal fault;
    fault.Kind = FaultKind::ProtocolError;
    {
        std::lock_guard<std::mutex> locker(StateLock);
        fault.PeerId = Remote.PeerId;
    }
    fault.Detail = detail;
    Node->ReportFault(fault);

    CloseLink(CloseReason::ProtocolError);
}


//------------------------------------------------------------------------------
// PeerConnection: Send

SendResult PeerConnection::SendOnChannel(const protos::Message& msg, uint32_t channel)
{
    std::vector<uint8_t> frame;
    if (!protos::EncodeMessage(msg, frame)) {
        spdlog::error("{} Message too large to encode: {}", NetLocalName,
            protos::MessageTypeToString(static_cast<uint8_t>( protos::GetMessageType(msg) )));
        return SendResult::Dropped;
    }

    std::lock_guard<std::mutex> locker(SendLock);

    const uint8_t* data = frame.data();
    int bytes = static_cast<int>( frame.size() );

    while (bytes > 0) {
        int copy_bytes = bytes;
        if (copy_bytes > kMaxChunkBytes) {
            copy_bytes = kMaxChunkBytes;
        }

        tonk::SDKResult result = Send(data, copy_bytes, channel);
        if (!result) {
            spdlog::error("{} Send failed: {}", NetLocalName, result.ToString());
            return SendResult::ConnectionClosed;
        }

        data += copy_bytes;
        bytes -= copy_bytes;
    }

    LastActivityUsec = GetTimeUsec();
    return SendResult::Sent;
}

void PeerConnection::SendHeartbeat(const protos::MessageHeartbeat& msg)
{
    const SendResult result = SendOnChannel(msg, kChannelControl);
    if (result != SendResult::Sent) {
        spdlog::warn("{} Heartbeat send failed: {}", NetLocalName, SendResultToString(result));
    }
}


} // namespace lanmeet
