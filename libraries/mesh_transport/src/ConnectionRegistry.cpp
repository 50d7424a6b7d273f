// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "ConnectionRegistry.hpp"

#include <core_logging.hpp> // core

namespace lanmeet {


//------------------------------------------------------------------------------
// DeliveryReport

unsigned DeliveryReport::GetSentCount() const
{
    unsigned count = 0;
    for (const auto& delivery : Deliveries) {
        if (delivery.Result == SendResult::Sent) {
            ++count;
        }
    }
    return count;
}

unsigned DeliveryReport::GetFailedCount() const
{
    return static_cast<unsigned>( Deliveries.size() ) - GetSentCount();
}

const PeerDelivery* DeliveryReport::Find(const std::string& peer_id) const
{
    for (const auto& delivery : Deliveries) {
        if (delivery.Peer.PeerId == peer_id) {
            return &delivery;
        }
    }
    return nullptr;
}


//------------------------------------------------------------------------------
// ConnectionRegistry

void ConnectionRegistry::SetListener(UnregisterListener listener)
{
    std::lock_guard<std::mutex> locker(Lock);
    Listener = listener;
}

bool ConnectionRegistry::Register(const PeerIdentity& peer, std::shared_ptr<PeerLink> link)
{
    if (!link || peer.PeerId.empty()) {
        spdlog::error("Registry: Invalid registration");
        return false;
    }

    size_t count = 0;
    {
        std::lock_guard<std::mutex> locker(Lock);
        auto it = Peers.find(peer.PeerId);
        if (it != Peers.end()) {
            spdlog::warn("Registry: Peer {} is already registered", peer.ToString());
            return false;
        }

        Entry entry;
        entry.Peer = peer;
        entry.Link = link;
        Peers.emplace(peer.PeerId, std::move(entry));
        count = Peers.size();
    }

    spdlog::info("Registry: Registered peer {} ({} connected)", peer.ToString(), count);
    return true;
}

bool ConnectionRegistry::Unregister(const std::string& peer_id, CloseReason reason)
{
    Entry removed;
    UnregisterListener listener;
    {
        std::lock_guard<std::mutex> locker(Lock);
        auto it = Peers.find(peer_id);
        if (it == Peers.end()) {
            return false;
        }
        removed = std::move(it->second);
        Peers.erase(it);
        listener = Listener;
    }

    OnRemoved(removed, listener, reason);
    return true;
}

bool ConnectionRegistry::UnregisterLink(const PeerLink* link, CloseReason reason)
{
    Entry removed;
    UnregisterListener listener;
    {
        std::lock_guard<std::mutex> locker(Lock);
        auto it = Peers.begin();
        for (; it != Peers.end(); ++it) {
            if (it->second.Link.get() == link) {
                break;
            }
        }
        if (it == Peers.end()) {
            return false;
        }
        removed = std::move(it->second);
        Peers.erase(it);
        listener = Listener;
    }

    OnRemoved(removed, listener, reason);
    return true;
}

void ConnectionRegistry::OnRemoved(const Entry& entry, const UnregisterListener& listener, CloseReason reason)
{
    spdlog::info("Registry: Unregistered peer {} reason={}", entry.Peer.ToString(), CloseReasonToString(reason));

    if (entry.Link && entry.Link->IsOpen()) {
        entry.Link->CloseLink(reason);
    }

    if (listener) {
        listener(entry.Peer, reason);
    }
}

std::shared_ptr<PeerLink> ConnectionRegistry::Lookup(const std::string& peer_id) const
{
    std::lock_guard<std::mutex> locker(Lock);
    auto it = Peers.find(peer_id);
    if (it == Peers.end()) {
        return nullptr;
    }
    return it->second.Link;
}

bool ConnectionRegistry::Contains(const std::string& peer_id) const
{
    std::lock_guard<std::mutex> locker(Lock);
    return Peers.find(peer_id) != Peers.end();
}

std::vector<PeerIdentity> ConnectionRegistry::List() const
{
    std::vector<PeerIdentity> result;

    std::lock_guard<std::mutex> locker(Lock);
    result.reserve(Peers.size());
    for (const auto& pair : Peers) {
        result.push_back(pair.second.Peer);
    }
    return result;
}

size_t ConnectionRegistry::GetCount() const
{
    std::lock_guard<std::mutex> locker(Lock);
    return Peers.size();
}

SendResult ConnectionRegistry::SendTo(const std::string& peer_id, const protos::Message& msg)
{
    std::shared_ptr<PeerLink> link = Lookup(peer_id);
    if (!link) {
        return SendResult::ConnectionClosed;
    }
    return link->SendReliable(msg);
}

DeliveryReport ConnectionRegistry::Broadcast(const protos::Message& msg)
{
    std::vector<Entry> snapshot;
    {
        std::lock_guard<std::mutex> locker(Lock);
        snapshot.reserve(Peers.size());
        for (const auto& pair : Peers) {
            snapshot.push_back(pair.second);
        }
    }

    DeliveryReport report;
    report.Deliveries.reserve(snapshot.size());

    for (const auto& entry : snapshot)
    {
        PeerDelivery delivery;
        delivery.Peer = entry.Peer;
        delivery.Result = entry.Link->SendReliable(msg);
        if (delivery.Result != SendResult::Sent) {
            spdlog::warn("Registry: Broadcast of {} to {} failed: {}",
                protos::MessageTypeToString(static_cast<uint8_t>( protos::GetMessageType(msg) )),
                entry.Peer.ToString(),
                SendResultToString(delivery.Result));
        }
        report.Deliveries.push_back(std::move(delivery));
    }

    return report;
}

void ConnectionRegistry::Clear(CloseReason reason)
{
    std::vector<std::string> peer_ids;
    {
        std::lock_guard<std::mutex> locker(Lock);
        for (const auto& pair : Peers) {
            peer_ids.push_back(pair.first);
        }
    }

    for (const auto& peer_id : peer_ids) {
        Unregister(peer_id, reason);
    }
}


} // namespace lanmeet
