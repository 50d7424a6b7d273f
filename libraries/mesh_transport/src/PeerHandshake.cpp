// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "PeerHandshake.hpp"

#include <core_string.hpp> // core
#include <core_logging.hpp> // core

namespace lanmeet {


//------------------------------------------------------------------------------
// Tools

const char* HandshakeStateToString(HandshakeState state)
{
    switch (state)
    {
    case HandshakeState::Connecting: return "Connecting";
    case HandshakeState::HandshakeSent: return "HandshakeSent";
    case HandshakeState::Accepted: return "Accepted";
    case HandshakeState::Rejected: return "Rejected";
    default: break;
    }
    return "Unknown";
}


//------------------------------------------------------------------------------
// PeerHandshake

void PeerHandshake::Initialize(
    const PeerIdentity& self,
    IdentityInUseFunction identity_in_use)
{
    Self = self;
    IdentityInUse = identity_in_use;
    State = HandshakeState::Connecting;
    Remote = PeerIdentity();
    RemotePublicKey.fill(0);
    RejectReason.clear();
}

protos::MessageHandshake PeerHandshake::MakeRequest(const protos::PublicKeyBytes& public_key)
{
    protos::MessageHandshake msg;
    msg.PeerId = Self.PeerId;
    msg.Name = Self.Name;
    msg.ProtocolVersion = Self.ProtocolVersion;
    msg.AppVersion = Self.AppVersion;
    msg.Capabilities = Self.Capabilities;
    msg.PublicKey = public_key;

    if (State == HandshakeState::Connecting) {
        State = HandshakeState::HandshakeSent;
    }
    return msg;
}

protos::MessageHandshakeAck PeerHandshake::OnRequest(
    const protos::MessageHandshake& request,
    const protos::PublicKeyBytes& public_key)
{
    protos::MessageHandshakeAck ack;
    ack.PeerId = Self.PeerId;
    ack.Name = Self.Name;
    ack.ProtocolVersion = Self.ProtocolVersion;
    ack.AppVersion = Self.AppVersion;
    ack.Capabilities = Self.Capabilities;
    ack.PublicKey = public_key;

    if (State != HandshakeState::Connecting) {
        Reject("Unexpected handshake");
        ack.Accepted = false;
        ack.Reason = RejectReason;
        return ack;
    }

    Remote.PeerId = request.PeerId;
    Remote.Name = protos::SanitizeString(request.Name, kMaxPeerNameBytes);
    Remote.ProtocolVersion = request.ProtocolVersion;
    Remote.AppVersion = protos::SanitizeString(request.AppVersion, kMaxPeerNameBytes);
    Remote.Capabilities = request.Capabilities;
    RemotePublicKey = request.PublicKey;

    const std::string problem = CheckRemote();
    if (!problem.empty()) {
        Reject(problem);
        ack.Accepted = false;
        ack.Reason = RejectReason;
        return ack;
    }

    State = HandshakeState::Accepted;
    ack.Accepted = true;
    return ack;
}

bool PeerHandshake::OnAck(const protos::MessageHandshakeAck& ack)
{
    if (State != HandshakeState::HandshakeSent) {
        Reject("Unexpected handshake ack");
        return false;
    }

    Remote.PeerId = ack.PeerId;
    Remote.Name = protos::SanitizeString(ack.Name, kMaxPeerNameBytes);
    Remote.ProtocolVersion = ack.ProtocolVersion;
    Remote.AppVersion = protos::SanitizeString(ack.AppVersion, kMaxPeerNameBytes);
    Remote.Capabilities = ack.Capabilities;
    RemotePublicKey = ack.PublicKey;

    if (!ack.Accepted) {
        Reject(ack.Reason.empty() ? std::string("Rejected by peer") : ack.Reason);
        return false;
    }

    const std::string problem = CheckRemote();
    if (!problem.empty()) {
        Reject(problem);
        return false;
    }

    State = HandshakeState::Accepted;
    return true;
}

std::string PeerHandshake::CheckRemote() const
{
    if (Remote.ProtocolVersion != Self.ProtocolVersion) {
        return fmt::format("Protocol version mismatch: ours={} theirs={}",
            (unsigned)Self.ProtocolVersion, (unsigned)Remote.ProtocolVersion);
    }
    if (!IsHexString(Remote.PeerId)) {
        return "Invalid peer id";
    }
    if (0 == StrCaseCompare(Remote.PeerId.c_str(), Self.PeerId.c_str())) {
        return "Identity conflict: Peer id matches our own";
    }
    if (IdentityInUse && IdentityInUse(Remote.PeerId)) {
        return "Identity conflict: Peer already connected";
    }
    return std::string();
}

void PeerHandshake::Reject(const std::string& reason)
{
    State = HandshakeState::Rejected;
    RejectReason = reason;
}


} // namespace lanmeet
