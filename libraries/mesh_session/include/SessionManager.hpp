// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

/*
    Session Manager

    Drives screen sharing across the mesh.  Each (sharer, viewer, display)
    stream moves through:

        Idle -> Offered -> Requested -> Streaming -> Stopped

    Sharer side:
    + StartSharing() creates a SharingSession for a display and broadcasts a
      ScreenOffer listing every display this peer shares.
    + A ScreenRequest for a shared display attaches the viewer, is answered
      with ScreenStart, and forces a keyframe.  Otherwise it is answered with
      a ScreenStop.
    + The capture thread of each session runs capture -> encode -> scheduler
      for the attached viewers at the session frame rate.

    Viewer side:
    + ScreenOffer refreshes the sharing status cache and moves each offered
      display to Offered.  Stopped streams start a new cycle.
    + RequestView() sends ScreenRequest.  ScreenStart starts the
      StreamReceiver.  ScreenStop, CancelView() or a peer disconnect end the
      stream.  Stopped is terminal until the next offer.

    Inbound events arrive in order on the PeerNode event thread.  Local calls
    may come from any thread.  State is guarded by one lock and no message
    is sent while holding it.
*/

#pragma once

#include "FrameScheduler.hpp"
#include "StreamReceiver.hpp"
#include "SharingStatusCache.hpp"

#include <ConnectionRegistry.hpp> // mesh_transport

#include <map>
#include <mutex>
#include <thread>

namespace lanmeet {


//------------------------------------------------------------------------------
// SessionSettings

struct SessionSettings
{
    SchedulerSettings Scheduler;

    unsigned DefaultFps = protos::kDefaultFps;
    uint8_t DefaultQuality = protos::StreamQuality_Medium;

    uint64_t KeyframeRequestIntervalUsec = kKeyframeRequestIntervalUsec;

    // Request every offered display automatically
    bool AutoViewOffers = false;

    // Run capture and decode on background threads.
    // When false, CaptureAndSend() and StreamReceiver::DecodeNext() are
    // driven by the caller
    bool RunCaptureThreads = true;
    bool RunDecodeThreads = true;
};


//------------------------------------------------------------------------------
// StreamState

enum class StreamState
{
    Idle,
    Offered,
    Requested,
    Streaming,
    Stopped,

    Count
};

const char* StreamStateToString(StreamState state);

struct StreamKey
{
    std::string PeerId;
    uint32_t DisplayId = 0;

    StreamKey() = default;
    StreamKey(const std::string& peer_id, uint32_t display_id)
        : PeerId(peer_id)
        , DisplayId(display_id)
    {
    }

    bool operator<(const StreamKey& rhs) const
    {
        if (PeerId != rhs.PeerId) {
            return PeerId < rhs.PeerId;
        }
        return DisplayId < rhs.DisplayId;
    }
};

/// Snapshot of one stream this peer is viewing
struct ViewInfo
{
    std::string SharerId;
    uint32_t DisplayId = 0;
    StreamState State = StreamState::Idle;
    protos::MessageScreenStart Start;
};


//------------------------------------------------------------------------------
// SessionManager

class SessionManager
    : public PeerEventSink
    , public SchedulerSink
{
public:
    ~SessionManager()
    {
        Shutdown();
    }

    bool Initialize(
        const SessionSettings& settings,
        const PeerIdentity& self,
        ConnectionRegistry* registry,
        CaptureSource* capture,
        MediaFactory* media,
        CollaboratorHandler* collaborators,
        FaultSink* faults);
    void Shutdown();

    // Sharer

    bool StartSharing(uint32_t display_id);
    bool StopSharing(uint32_t display_id);
    bool IsSharing(uint32_t display_id) const;

    /// Viewers attached to a shared display
    std::vector<std::string> GetViewers(uint32_t display_id) const;

    /// One capture tick: Capture, encode and schedule for each viewer.
    /// Returns false if nothing was sent
    bool CaptureAndSend(uint32_t display_id);

    // Viewer

    /// Offered -> Requested
    bool RequestView(const std::string& sharer_id, uint32_t display_id, unsigned fps, uint8_t quality);

    /// Offered | Requested | Streaming -> Stopped
    bool CancelView(const std::string& sharer_id, uint32_t display_id);

    /// Returns Idle for unknown streams
    StreamState GetViewState(const std::string& sharer_id, uint32_t display_id) const;

    std::shared_ptr<StreamReceiver> GetReceiver(const std::string& sharer_id, uint32_t display_id) const;

    std::vector<ViewInfo> ListViews() const;

    std::vector<SharedDisplay> GetSharingStatus() const
    {
        return StatusCache.Snapshot();
    }

    SchedulerStats GetSchedulerStats() const
    {
        return Scheduler.GetStats();
    }

    // PeerEventSink
    void OnPeerConnected(const PeerIdentity& peer) override;
    void OnPeerMessage(const PeerIdentity& peer, const protos::Message& msg) override;
    void OnPeerDisconnected(const PeerIdentity& peer, CloseReason reason) override;
    void OnConnectFailed(const std::string& address, ConnectError error) override;

    // SchedulerSink
    void OnFrameOutcome(
        const std::string& viewer_id,
        uint32_t display_id,
        const protos::MessageScreenFrame& frame,
        FrameOutcome outcome) override;
    void OnKeyframeRetry(const std::string& viewer_id, uint32_t display_id, unsigned attempt) override;
    void OnStreamFault(const std::string& viewer_id, uint32_t display_id) override;

protected:
    SessionSettings Settings;
    PeerIdentity Self;
    ConnectionRegistry* Registry = nullptr;
    CaptureSource* Capture = nullptr;
    MediaFactory* Media = nullptr;
    CollaboratorHandler* Collaborators = nullptr;
    FaultSink* Faults = nullptr;

    FrameScheduler Scheduler;
    SharingStatusCache StatusCache;

    struct AttachedViewer
    {
        // Set once ScreenStart went out.  Frames are only sent after that
        bool Started = false;
    };

    struct SharingSession
    {
        protos::DisplayInfo Display;
        unsigned Fps = protos::kDefaultFps;
        std::string Codec;
        std::shared_ptr<VideoEncoder> Encoder;

        // Guarded by SessionManager::Lock
        std::map<std::string, AttachedViewer> Viewers;

        // Serializes capture, encode and scheduling
        std::mutex CaptureLock;
        uint32_t NextSequence = 0;

        std::atomic<bool> KeyframeRequested = ATOMIC_VAR_INIT(true);

        std::atomic<bool> Terminated = ATOMIC_VAR_INIT(false);
        std::shared_ptr<std::thread> Thread;
        std::mutex WakeLock;
        std::condition_variable WakeCondition;
    };

    struct ViewerSubscription
    {
        std::string SharerId;
        uint32_t DisplayId = 0;
        StreamState State = StreamState::Idle;
        bool CancelledLocally = false;

        protos::DisplayInfo Offered;
        unsigned Fps = 0;
        uint8_t Quality = protos::StreamQuality_Medium;

        protos::MessageScreenStart Start;
        std::shared_ptr<StreamReceiver> Receiver;
    };

    mutable std::mutex Lock;
    bool Initialized = false;
    std::map<std::string, PeerIdentity> Peers;
    std::map<uint32_t, std::shared_ptr<SharingSession>> Sessions;
    std::map<StreamKey, std::shared_ptr<ViewerSubscription>> Subscriptions;

    // Sharer message handlers
    void OnScreenRequest(const PeerIdentity& peer, const protos::MessageScreenRequest& msg);
    void OnViewerStop(const PeerIdentity& peer, const protos::MessageScreenStop& msg);
    void OnRequestKeyframe(const PeerIdentity& peer, const protos::MessageRequestKeyframe& msg);

    // Viewer message handlers
    void OnScreenOffer(const PeerIdentity& peer, const protos::MessageScreenOffer& msg);
    void OnScreenStart(const PeerIdentity& peer, const protos::MessageScreenStart& msg);
    void OnScreenFrame(const PeerIdentity& peer, const protos::MessageScreenFrame& msg);
    void OnSharerStop(const PeerIdentity& peer, const protos::MessageScreenStop& msg);

    protos::MessageScreenOffer MakeOffer() const;
    void BroadcastOffer();

    void CaptureLoop(std::shared_ptr<SharingSession> session);
    void StopCaptureThread(const std::shared_ptr<SharingSession>& session);
    bool CaptureSession(const std::shared_ptr<SharingSession>& session);

    // Next capture of the display produces a keyframe
    void RequestEncoderKeyframe(uint32_t display_id);

    bool SendTo(const std::string& peer_id, const protos::Message& msg);

    void ReportSessionError(const PeerIdentity& peer, uint32_t display_id, const std::string& detail);
};


} // namespace lanmeet
