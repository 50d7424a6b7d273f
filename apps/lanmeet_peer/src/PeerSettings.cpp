// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "PeerSettings.hpp"

#include <core_mmap.hpp>
#include <core_string.hpp>
#include <core_logging.hpp>

#include <sodium.h>

namespace lanmeet {


//------------------------------------------------------------------------------
// Tools

bool ParseQuality(const std::string& name, uint8_t& quality)
{
    if (0 == StrCaseCompare(name.c_str(), "low")) {
        quality = protos::StreamQuality_Low;
    } else if (0 == StrCaseCompare(name.c_str(), "medium")) {
        quality = protos::StreamQuality_Medium;
    } else if (0 == StrCaseCompare(name.c_str(), "high")) {
        quality = protos::StreamQuality_High;
    } else {
        return false;
    }
    return true;
}

const char* QualityToString(uint8_t quality)
{
    static_assert(protos::StreamQuality_Count == 3, "Update this");
    switch (quality)
    {
    case protos::StreamQuality_Low: return "low";
    case protos::StreamQuality_Medium: return "medium";
    case protos::StreamQuality_High: return "high";
    default: break;
    }
    return "unknown";
}

std::string GeneratePeerId()
{
    uint8_t id[kPeerIdBytes];
    randombytes_buf(id, sizeof(id));
    return HexString(id, kPeerIdBytes);
}


//------------------------------------------------------------------------------
// Peer Settings

bool LoadFromFile(const std::string& file_path, PeerSettings& settings)
{
    MappedReadOnlySmallFile mmf;

    if (!mmf.Read(file_path.c_str())) {
        spdlog::error("Failed to load settings file: {}", file_path);
        return false;
    }

    std::string file_data(reinterpret_cast<const char*>(mmf.GetData()), mmf.GetDataBytes());

    const PeerSettings defaults;

    try {
        YAML::Node node = YAML::Load(file_data);

        settings.Name = node["name"].as<std::string>(defaults.Name);
        settings.PeerId = node["peer_id"].as<std::string>("");
        settings.Port = node["port"].as<int>(defaults.Port);

        settings.Peers.clear();
        const YAML::Node peers = node["peers"];
        if (peers && peers.IsSequence()) {
            for (const auto& peer : peers) {
                settings.Peers.push_back(peer.as<std::string>());
            }
        }

        settings.HeartbeatIntervalMsec = node["heartbeat_interval_msec"].as<unsigned>(defaults.HeartbeatIntervalMsec);
        settings.HeartbeatTimeoutMsec = node["heartbeat_timeout_msec"].as<unsigned>(defaults.HeartbeatTimeoutMsec);
        settings.HeartbeatMaxMissed = node["heartbeat_max_missed"].as<unsigned>(defaults.HeartbeatMaxMissed);

        settings.KeyframeRetryBudget = node["keyframe_retry_budget"].as<unsigned>(defaults.KeyframeRetryBudget);
        settings.DeltaDeadlineMsec = node["delta_deadline_msec"].as<unsigned>(defaults.DeltaDeadlineMsec);
        settings.KeyframeTimeoutMsec = node["keyframe_timeout_msec"].as<unsigned>(defaults.KeyframeTimeoutMsec);

        settings.BandwidthLimitBPS = node["bandwidth_limit_bps"].as<int>(defaults.BandwidthLimitBPS);

        settings.DefaultFps = node["fps"].as<unsigned>(defaults.DefaultFps);
        settings.DefaultQuality = node["quality"].as<std::string>(defaults.DefaultQuality);
        settings.AutoView = node["auto_view"].as<bool>(defaults.AutoView);

        settings.ShareDisplays.clear();
        const YAML::Node displays = node["share_displays"];
        if (displays && displays.IsSequence()) {
            for (const auto& display : displays) {
                settings.ShareDisplays.push_back(display.as<uint32_t>());
            }
        }

        settings.LogLevel = node["log_level"].as<std::string>(defaults.LogLevel);
    } catch (YAML::ParserException& ex) {
        spdlog::error("YAML parse failed: {}", ex.what());
        return false;
    } catch (YAML::BadConversion& ex) {
        spdlog::error("YAML settings field has the wrong type: {}", ex.what());
        return false;
    }

    return ValidateSettings(settings);
}

bool SaveToFile(const PeerSettings& settings, const std::string& file_path)
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "name";
    out << YAML::Value << settings.Name;
    out << YAML::Key << "peer_id";
    out << YAML::Value << settings.PeerId;
    out << YAML::Key << "port";
    out << YAML::Value << settings.Port;
    out << YAML::Key << "peers";
    out << YAML::Value << YAML::BeginSeq;
    for (const auto& peer : settings.Peers) {
        out << peer;
    }
    out << YAML::EndSeq;
    out << YAML::Key << "heartbeat_interval_msec";
    out << YAML::Value << settings.HeartbeatIntervalMsec;
    out << YAML::Key << "heartbeat_timeout_msec";
    out << YAML::Value << settings.HeartbeatTimeoutMsec;
    out << YAML::Key << "heartbeat_max_missed";
    out << YAML::Value << settings.HeartbeatMaxMissed;
    out << YAML::Key << "keyframe_retry_budget";
    out << YAML::Value << settings.KeyframeRetryBudget;
    out << YAML::Key << "delta_deadline_msec";
    out << YAML::Value << settings.DeltaDeadlineMsec;
    out << YAML::Key << "keyframe_timeout_msec";
    out << YAML::Value << settings.KeyframeTimeoutMsec;
    out << YAML::Key << "bandwidth_limit_bps";
    out << YAML::Value << settings.BandwidthLimitBPS;
    out << YAML::Key << "fps";
    out << YAML::Value << settings.DefaultFps;
    out << YAML::Key << "quality";
    out << YAML::Value << settings.DefaultQuality;
    out << YAML::Key << "auto_view";
    out << YAML::Value << settings.AutoView;
    out << YAML::Key << "share_displays";
    out << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (uint32_t display_id : settings.ShareDisplays) {
        out << display_id;
    }
    out << YAML::EndSeq;
    out << YAML::Key << "log_level";
    out << YAML::Value << settings.LogLevel;
    out << YAML::EndMap;

    if (!out.good()) {
        spdlog::error("Yaml emitter failed: {}", out.GetLastError());
        return false;
    }

    return WriteBufferToFile(file_path.c_str(), out.c_str(), out.size());
}

bool ValidateSettings(const PeerSettings& settings)
{
    if (settings.Port <= 0 || settings.Port > 65535) {
        spdlog::error("Invalid settings: port {} out of range", settings.Port);
        return false;
    }
    if (!settings.PeerId.empty() && !IsHexString(settings.PeerId)) {
        spdlog::error("Invalid settings: peer_id '{}' is not hex", settings.PeerId);
        return false;
    }
    if (settings.Name.empty()) {
        spdlog::error("Invalid settings: name is empty");
        return false;
    }
    for (const auto& peer : settings.Peers) {
        std::string host;
        uint16_t port = 0;
        if (!ParsePeerAddress(peer, host, port)) {
            spdlog::error("Invalid settings: peer address '{}'", peer);
            return false;
        }
    }
    if (settings.HeartbeatIntervalMsec == 0 || settings.HeartbeatTimeoutMsec == 0 || settings.HeartbeatMaxMissed == 0) {
        spdlog::error("Invalid settings: heartbeat values must be positive");
        return false;
    }
    if (settings.KeyframeRetryBudget == 0) {
        spdlog::error("Invalid settings: keyframe_retry_budget must be positive");
        return false;
    }
    if (settings.DefaultFps == 0 || settings.DefaultFps > 240) {
        spdlog::error("Invalid settings: fps {} out of range", settings.DefaultFps);
        return false;
    }
    uint8_t quality = 0;
    if (!ParseQuality(settings.DefaultQuality, quality)) {
        spdlog::error("Invalid settings: quality '{}' (expected low, medium or high)", settings.DefaultQuality);
        return false;
    }
    if (settings.BandwidthLimitBPS <= 0) {
        spdlog::error("Invalid settings: bandwidth_limit_bps must be positive");
        return false;
    }
    return true;
}

void ApplySettings(
    const PeerSettings& settings,
    PeerNodeSettings& node,
    SessionSettings& session)
{
    node.Port = static_cast<uint16_t>( settings.Port );
    node.PeerAddresses = settings.Peers;
    node.BandwidthLimitBPS = settings.BandwidthLimitBPS;
    node.Heartbeat.IntervalUsec = settings.HeartbeatIntervalMsec * 1000ULL;
    node.Heartbeat.TimeoutUsec = settings.HeartbeatTimeoutMsec * 1000ULL;
    node.Heartbeat.MaxMissed = settings.HeartbeatMaxMissed;

    session.Scheduler.KeyframeRetryBudget = settings.KeyframeRetryBudget;
    session.Scheduler.DeltaDeadlineUsec = settings.DeltaDeadlineMsec * 1000ULL;
    session.Scheduler.KeyframeTimeoutUsec = settings.KeyframeTimeoutMsec * 1000ULL;
    session.DefaultFps = settings.DefaultFps;
    session.AutoViewOffers = settings.AutoView;

    uint8_t quality = protos::StreamQuality_Medium;
    if (ParseQuality(settings.DefaultQuality, quality)) {
        session.DefaultQuality = quality;
    }
}


} // namespace lanmeet
