// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

/*
    Connection Registry

    Table of peers that completed the handshake, keyed by peer id.
    This is the single source of truth for which peers can be reached.

    Register/Unregister are serialized by one lock.  Lookup, List and
    Broadcast work on a snapshot copied under the lock, so they never see a
    half-updated entry and never send while holding the lock.
*/

#pragma once

#include "PeerLink.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace lanmeet {


//------------------------------------------------------------------------------
// DeliveryReport

struct PeerDelivery
{
    PeerIdentity Peer;
    SendResult Result = SendResult::Dropped;
};

/// Per-peer outcome of a broadcast
struct DeliveryReport
{
    std::vector<PeerDelivery> Deliveries;

    unsigned GetSentCount() const;
    unsigned GetFailedCount() const;

    // Returns nullptr if the peer was not part of the broadcast
    const PeerDelivery* Find(const std::string& peer_id) const;
};


//------------------------------------------------------------------------------
// ConnectionRegistry

/// Called after a peer is removed from the registry
using UnregisterListener = std::function<void(const PeerIdentity& peer, CloseReason reason)>;

class ConnectionRegistry
{
public:
    void SetListener(UnregisterListener listener);

    /// Returns false if the peer id is already registered
    bool Register(const PeerIdentity& peer, std::shared_ptr<PeerLink> link);

    /// Remove the peer, closing its link if still open.
    /// Returns false if the peer was not registered
    bool Unregister(const std::string& peer_id, CloseReason reason);

    /// Remove the peer only if it is registered with this exact link.
    /// Used by connections cleaning up after themselves
    bool UnregisterLink(const PeerLink* link, CloseReason reason);

    /// Returns nullptr if the peer is not registered
    std::shared_ptr<PeerLink> Lookup(const std::string& peer_id) const;

    bool Contains(const std::string& peer_id) const;

    /// Snapshot of registered identities
    std::vector<PeerIdentity> List() const;

    size_t GetCount() const;

    /// Reliable send to one peer
    SendResult SendTo(const std::string& peer_id, const protos::Message& msg);

    /// Reliable send to every registered peer.
    /// A failure for one peer does not stop delivery to the others
    DeliveryReport Broadcast(const protos::Message& msg);

    /// Unregister everything, for shutdown
    void Clear(CloseReason reason);

protected:
    struct Entry
    {
        PeerIdentity Peer;
        std::shared_ptr<PeerLink> Link;
    };

    mutable std::mutex Lock;
    std::map<std::string, Entry> Peers;
    UnregisterListener Listener;

    // Close the link and notify the listener, called without the lock
    void OnRemoved(const Entry& entry, const UnregisterListener& listener, CloseReason reason);
};


} // namespace lanmeet
