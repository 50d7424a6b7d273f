// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#pragma once

#include <PeerNode.hpp> // mesh_transport
#include <SessionManager.hpp> // mesh_session

#include <yaml-cpp/yaml.h>

namespace lanmeet {


//------------------------------------------------------------------------------
// Constants

#define LANMEET_PEER_DEFAULT_SETTINGS "PeerSettings.yaml"
#define LANMEET_PEER_APP_VERSION "1.0.0"

// Bytes of randomness in a generated peer id
static const int kPeerIdBytes = 16;


//------------------------------------------------------------------------------
// Peer Settings

struct PeerSettings
{
    std::string Name = "Peer";

    // Generated and saved on first run
    std::string PeerId;

    int Port = protos::kDefaultPeerPort;
    std::vector<std::string> Peers;

    unsigned HeartbeatIntervalMsec = 1000;
    unsigned HeartbeatTimeoutMsec = 1000;
    unsigned HeartbeatMaxMissed = 3;

    unsigned KeyframeRetryBudget = 3;
    unsigned DeltaDeadlineMsec = 16;
    unsigned KeyframeTimeoutMsec = 200;

    int BandwidthLimitBPS = protos::kDefaultBandwidthLimitBPS;

    unsigned DefaultFps = protos::kDefaultFps;
    std::string DefaultQuality = "medium";
    bool AutoView = true;

    // Displays shared at startup
    std::vector<uint32_t> ShareDisplays;

    std::string LogLevel = "info";
};

bool LoadFromFile(const std::string& file_path, PeerSettings& settings);
bool SaveToFile(const PeerSettings& settings, const std::string& file_path);

/// Returns false and logs the first invalid field
bool ValidateSettings(const PeerSettings& settings);

/// Random hex peer id from libsodium
std::string GeneratePeerId();

/// "low", "medium" or "high".  Returns false if unrecognized
bool ParseQuality(const std::string& name, uint8_t& quality);
const char* QualityToString(uint8_t quality);

void ApplySettings(
    const PeerSettings& settings,
    PeerNodeSettings& node,
    SessionSettings& session);


} // namespace lanmeet
