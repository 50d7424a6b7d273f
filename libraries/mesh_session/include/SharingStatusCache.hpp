// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

/*
    Sharing Status Cache

    Local view of which peers are sharing which displays, built from the
    ScreenOffer messages each sharer broadcasts.  There is no authority:
    peers converge as offers arrive, and a peer that disconnects drops out.
*/

#pragma once

#include <MeshProtocol.hpp> // mesh_protocol

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace lanmeet {


//------------------------------------------------------------------------------
// SharingStatusCache

struct SharedDisplay
{
    std::string PeerId;
    protos::DisplayInfo Display;
    uint64_t LastUpdatedUsec = 0;
};

class SharingStatusCache
{
public:
    /// Replace the peer's offered displays.
    /// Returns the display ids that were offered before and are now withdrawn
    std::vector<uint32_t> ApplyOffer(
        const std::string& peer_id,
        const protos::MessageScreenOffer& offer,
        uint64_t now_usec);

    /// Forget a peer.  Returns the display ids it was sharing
    std::vector<uint32_t> RemovePeer(const std::string& peer_id);

    bool IsSharing(const std::string& peer_id, uint32_t display_id) const;

    /// Returns false if the display is not offered
    bool Lookup(const std::string& peer_id, uint32_t display_id, protos::DisplayInfo& display) const;

    /// Time of the last offer from the peer, or 0 if none
    uint64_t GetLastUpdatedUsec(const std::string& peer_id) const;

    std::vector<SharedDisplay> Snapshot() const;

protected:
    struct PeerEntry
    {
        std::vector<protos::DisplayInfo> Displays;
        uint64_t LastUpdatedUsec = 0;
    };

    mutable std::mutex Lock;
    std::map<std::string, PeerEntry> Peers;
};


} // namespace lanmeet
