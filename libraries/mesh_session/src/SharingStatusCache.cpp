// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "SharingStatusCache.hpp"

namespace lanmeet {


//------------------------------------------------------------------------------
// SharingStatusCache

static bool ContainsDisplay(const std::vector<protos::DisplayInfo>& displays, uint32_t display_id)
{
    for (const auto& display : displays) {
        if (display.DisplayId == display_id) {
            return true;
        }
    }
    return false;
}

std::vector<uint32_t> SharingStatusCache::ApplyOffer(
    const std::string& peer_id,
    const protos::MessageScreenOffer& offer,
    uint64_t now_usec)
{
    std::vector<uint32_t> withdrawn;

    std::lock_guard<std::mutex> locker(Lock);

    auto it = Peers.find(peer_id);
    if (it != Peers.end()) {
        for (const auto& display : it->second.Displays) {
            if (!ContainsDisplay(offer.Displays, display.DisplayId)) {
                withdrawn.push_back(display.DisplayId);
            }
        }
    }

    // Empty offer: Peer is not sharing anything
    if (offer.Displays.empty()) {
        if (it != Peers.end()) {
            Peers.erase(it);
        }
        return withdrawn;
    }

    PeerEntry& entry = Peers[peer_id];
    entry.Displays = offer.Displays;
    entry.LastUpdatedUsec = now_usec;
    return withdrawn;
}

std::vector<uint32_t> SharingStatusCache::RemovePeer(const std::string& peer_id)
{
    std::vector<uint32_t> removed;

    std::lock_guard<std::mutex> locker(Lock);

    auto it = Peers.find(peer_id);
    if (it == Peers.end()) {
        return removed;
    }
    for (const auto& display : it->second.Displays) {
        removed.push_back(display.DisplayId);
    }
    Peers.erase(it);
    return removed;
}

bool SharingStatusCache::IsSharing(const std::string& peer_id, uint32_t display_id) const
{
    std::lock_guard<std::mutex> locker(Lock);
    auto it = Peers.find(peer_id);
    return it != Peers.end() && ContainsDisplay(it->second.Displays, display_id);
}

bool SharingStatusCache::Lookup(const std::string& peer_id, uint32_t display_id, protos::DisplayInfo& display) const
{
    std::lock_guard<std::mutex> locker(Lock);
    auto it = Peers.find(peer_id);
    if (it == Peers.end()) {
        return false;
    }
    for (const auto& offered : it->second.Displays) {
        if (offered.DisplayId == display_id) {
            display = offered;
            return true;
        }
    }
    return false;
}

uint64_t SharingStatusCache::GetLastUpdatedUsec(const std::string& peer_id) const
{
    std::lock_guard<std::mutex> locker(Lock);
    auto it = Peers.find(peer_id);
    return it != Peers.end() ? it->second.LastUpdatedUsec : 0;
}

std::vector<SharedDisplay> SharingStatusCache::Snapshot() const
{
    std::vector<SharedDisplay> result;

    std::lock_guard<std::mutex> locker(Lock);
    for (const auto& pair : Peers) {
        for (const auto& display : pair.second.Displays) {
            SharedDisplay shared;
            shared.PeerId = pair.first;
            shared.Display = display;
            shared.LastUpdatedUsec = pair.second.LastUpdatedUsec;
            result.push_back(shared);
        }
    }
    return result;
}


} // namespace lanmeet
