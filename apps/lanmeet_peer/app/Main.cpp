// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "PeerSettings.hpp"
#include "SyntheticMedia.hpp"

#include <core_logging.hpp>
#include <tonk.h>
#include <sodium.h>
using namespace lanmeet;


//------------------------------------------------------------------------------
// CTRL+C

#include <csignal>

std::atomic<bool> Terminated = ATOMIC_VAR_INIT(false);

void SignalHandler(int)
{
    Terminated = true;
}


//------------------------------------------------------------------------------
// LoggingFaultSink

class LoggingFaultSink : public FaultSink
{
public:
    void OnFault(const FaultSignal& fault) override
    {
        if (fault.Kind == FaultKind::DeliveryMiss) {
            spdlog::debug("Fault {}: peer={} display={} {}", FaultKindToString(fault.Kind),
                fault.PeerId, fault.DisplayId, fault.Detail);
            return;
        }
        spdlog::warn("Fault {}: peer={} display={} {}", FaultKindToString(fault.Kind),
            fault.PeerId, fault.DisplayId, fault.Detail);
    }
};


//------------------------------------------------------------------------------
// Status

static void LogStatus(ConnectionRegistry& registry, SessionManager& session)
{
    const std::vector<PeerIdentity> peers = registry.List();
    spdlog::info("Status: {} connected peers", peers.size());
    for (const auto& peer : peers) {
        const auto link = registry.Lookup(peer.PeerId);
        if (!link) {
            continue;
        }
        const LinkStats stats = link->GetStats();
        spdlog::info("    {} v{} rtt={} msec", peer.ToString(), peer.AppVersion, stats.RttUsec / 1000.f);
    }

    for (const auto& shared : session.GetSharingStatus()) {
        spdlog::info("    Offered: {} display {} '{}' {}x{}", shared.PeerId, shared.Display.DisplayId,
            shared.Display.Name, shared.Display.Width, shared.Display.Height);
    }

    for (const auto& view : session.ListViews()) {
        spdlog::info("    Viewing: {} display {} state={}", view.SharerId, view.DisplayId,
            StreamStateToString(view.State));
    }

    const SchedulerStats stats = session.GetSchedulerStats();
    spdlog::info("    Sent: keyframes={} deltas={} dropped={} retries={} faults={}",
        stats.KeyframesSent, stats.DeltasSent, stats.DeltasDropped,
        stats.KeyframeRetries, stats.StreamFaults);
}


//------------------------------------------------------------------------------
// Entrypoint

int main(int argc, char* argv[])
{
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    SetupAsyncDiskLog(GetLogFilePath("lanmeet", "lanmeet_peer"));

    SetTonkLogCallback([](const std::string& msg) {
        spdlog::debug("Tonk: {}", msg);
    });

    spdlog::info("App started: LanMeet peer v{}", LANMEET_PEER_APP_VERSION);

    std::string settings_path;
    if (argc >= 2) {
        settings_path = argv[1];
    } else {
        settings_path = GetSettingsFilePath("lanmeet", LANMEET_PEER_DEFAULT_SETTINGS);
    }

    if (sodium_init() < 0) {
        spdlog::error("sodium_init failed");
        return LANMEET_APP_FAILURE;
    }

    PeerSettings settings;
    bool save_settings = false;
    if (!LoadFromFile(settings_path, settings)) {
        spdlog::warn("Using default settings: Writing {}", settings_path);
        settings = PeerSettings();
        save_settings = true;
    }

    if (settings.PeerId.empty()) {
        settings.PeerId = GeneratePeerId();
        spdlog::info("Generated peer id: {}", settings.PeerId);
        save_settings = true;
    }

    if (save_settings && !SaveToFile(settings, settings_path)) {
        spdlog::warn("Failed to save settings: The peer id will change on restart");
    }

    spdlog::set_level(ParseLogLevel(settings.LogLevel));

    PeerIdentity self;
    self.PeerId = settings.PeerId;
    self.Name = settings.Name;
    self.AppVersion = LANMEET_PEER_APP_VERSION;
    self.Capabilities = protos::Capability_All;

    TonkAddress gateway, host;
    tonk_lan_info(&gateway, &host);

    spdlog::info("Peer {} address: {} : {}", self.ToString(), host.NetworkString, settings.Port);

    PeerNodeSettings node_settings;
    SessionSettings session_settings;
    ApplySettings(settings, node_settings, session_settings);

    LoggingFaultSink faults;
    ConnectionRegistry registry;
    SyntheticCapture capture;
    SyntheticMediaFactory media;
    LoggingCollaborators collaborators;

    SessionManager session;
    if (!session.Initialize(
        session_settings,
        self,
        &registry,
        &capture,
        &media,
        &collaborators,
        &faults))
    {
        spdlog::error("Session initialization failed");
        return LANMEET_APP_FAILURE;
    }

    PeerNode node;
    if (!node.Initialize(node_settings, self, &registry, &session, &faults)) {
        spdlog::error("Peer node initialization failed");
        session.Shutdown();
        return LANMEET_APP_FAILURE;
    }

    for (uint32_t display_id : settings.ShareDisplays) {
        if (!session.StartSharing(display_id)) {
            spdlog::warn("Unable to share display {}", display_id);
        }
    }

    spdlog::info("Peer started: Sharing {} displays with quality={} fps={}",
        settings.ShareDisplays.size(), QualityToString(session_settings.DefaultQuality), settings.DefaultFps);

    uint64_t last_status_usec = GetTimeUsec();

    while (!Terminated)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        const uint64_t now_usec = GetTimeUsec();
        if (now_usec - last_status_usec >= 10 * 1000 * 1000) {
            last_status_usec = now_usec;
            LogStatus(registry, session);
        }
    }

    spdlog::info("Peer shutting down...");

    node.Shutdown();
    session.Shutdown();

    return LANMEET_APP_SUCCESS;
}
