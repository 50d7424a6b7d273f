// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

/*
    Connection handshake

        Connecting -> HandshakeSent -> Accepted | Rejected

    The initiator sends Handshake.  The acceptor validates it and replies
    with HandshakeAck.  A peer is rejected if its protocol version differs
    from ours, or if its identity conflicts with ours or with a peer that is
    already connected.

    This class only holds the state machine.  PeerConnection carries the
    messages and installs the encryption keys.
*/

#pragma once

#include "PeerLink.hpp"

#include <functional>

namespace lanmeet {


//------------------------------------------------------------------------------
// Constants

// Display names are cut to this length
static const size_t kMaxPeerNameBytes = 64;


//------------------------------------------------------------------------------
// PeerHandshake

enum class HandshakeState
{
    Connecting,
    HandshakeSent,
    Accepted,
    Rejected
};

const char* HandshakeStateToString(HandshakeState state);

/// Returns true if a peer with this id is already connected
using IdentityInUseFunction = std::function<bool(const std::string& peer_id)>;

class PeerHandshake
{
public:
    void Initialize(
        const PeerIdentity& self,
        IdentityInUseFunction identity_in_use);

    /// Initiator: Build the Handshake to send.
    /// Connecting -> HandshakeSent
    protos::MessageHandshake MakeRequest(const protos::PublicKeyBytes& public_key);

    /// Acceptor: Validate a received Handshake and build the reply.
    /// Connecting -> Accepted | Rejected
    protos::MessageHandshakeAck OnRequest(
        const protos::MessageHandshake& request,
        const protos::PublicKeyBytes& public_key);

    /// Initiator: Validate a received HandshakeAck.
    /// HandshakeSent -> Accepted | Rejected.  Returns true if accepted
    bool OnAck(const protos::MessageHandshakeAck& ack);

    HandshakeState GetState() const
    {
        return State;
    }
    bool IsAccepted() const
    {
        return State == HandshakeState::Accepted;
    }

    /// Identity of the remote peer, valid once a request or ack was received
    const PeerIdentity& GetRemote() const
    {
        return Remote;
    }

    /// Public key provided by the remote peer
    const protos::PublicKeyBytes& GetRemotePublicKey() const
    {
        return RemotePublicKey;
    }

    /// Reason for rejection, or empty
    const std::string& GetRejectReason() const
    {
        return RejectReason;
    }

protected:
    PeerIdentity Self;
    IdentityInUseFunction IdentityInUse;

    HandshakeState State = HandshakeState::Connecting;
    PeerIdentity Remote;
    protos::PublicKeyBytes RemotePublicKey{};
    std::string RejectReason;

    // Returns empty string if the remote identity is acceptable
    std::string CheckRemote() const;

    void Reject(const std::string& reason);
};


} // namespace lanmeet
