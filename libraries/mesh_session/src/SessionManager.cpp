// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "SessionManager.hpp"

#include <core_logging.hpp> // core

#include <algorithm>

namespace lanmeet {


//------------------------------------------------------------------------------
// Tools

const char* StreamStateToString(StreamState state)
{
    static_assert((int)StreamState::Count == 5, "Update this");
    switch (state)
    {
    case StreamState::Idle: return "Idle";
    case StreamState::Offered: return "Offered";
    case StreamState::Requested: return "Requested";
    case StreamState::Streaming: return "Streaming";
    case StreamState::Stopped: return "Stopped";
    default: break;
    }
    return "Unknown";
}

static bool IsActiveViewState(StreamState state)
{
    return state == StreamState::Offered ||
        state == StreamState::Requested ||
        state == StreamState::Streaming;
}


//------------------------------------------------------------------------------
// SessionManager

bool SessionManager::Initialize(
    const SessionSettings& settings,
    const PeerIdentity& self,
    ConnectionRegistry* registry,
    CaptureSource* capture,
    MediaFactory* media,
    CollaboratorHandler* collaborators,
    FaultSink* faults)
{
    if (!registry || !media) {
        spdlog::error("SessionManager requires a connection registry and a media factory");
        return false;
    }

    Settings = settings;
    Self = self;
    Registry = registry;
    Capture = capture;
    Media = media;
    Collaborators = collaborators;
    Faults = faults;

    Scheduler.Initialize(Settings.Scheduler, this);

    std::lock_guard<std::mutex> locker(Lock);
    Initialized = true;

    spdlog::info("Session manager ready: codec={} keyframe_retry_budget={} delta_deadline={} msec auto_view={}",
        Media->GetCodecName(), Settings.Scheduler.KeyframeRetryBudget,
        Settings.Scheduler.DeltaDeadlineUsec / 1000.f, Settings.AutoViewOffers);
    return true;
}

void SessionManager::Shutdown()
{
    std::vector<std::shared_ptr<SharingSession>> sessions;
    std::vector<std::shared_ptr<StreamReceiver>> receivers;
    {
        std::lock_guard<std::mutex> locker(Lock);
        if (!Initialized) {
            return;
        }
        Initialized = false;

        for (auto& pair : Sessions) {
            sessions.push_back(pair.second);
        }
        Sessions.clear();

        for (auto& pair : Subscriptions) {
            pair.second->State = StreamState::Stopped;
            if (pair.second->Receiver) {
                receivers.push_back(pair.second->Receiver);
            }
        }
        Subscriptions.clear();
        Peers.clear();
    }

    spdlog::info("Session manager shutdown: Stopping {} shared displays and {} views",
        sessions.size(), receivers.size());

    for (auto& session : sessions) {
        StopCaptureThread(session);
    }
    for (auto& receiver : receivers) {
        receiver->Stop();
    }
}


//------------------------------------------------------------------------------
// SessionManager: Sharer

bool SessionManager::StartSharing(uint32_t display_id)
{
    if (!Capture) {
        spdlog::error("Cannot share display {}: No capture source", display_id);
        return false;
    }

    {
        std::lock_guard<std::mutex> locker(Lock);
        if (!Initialized) {
            return false;
        }
        if (Sessions.find(display_id) != Sessions.end()) {
            spdlog::debug("Display {} is already shared", display_id);
            return true;
        }
    }

    protos::DisplayInfo display;
    bool found = false;
    for (const auto& available : Capture->GetDisplays()) {
        if (available.DisplayId == display_id) {
            display = available;
            found = true;
            break;
        }
    }
    if (!found) {
        spdlog::error("Cannot share display {}: Not found", display_id);
        return false;
    }

    EncoderParams params;
    params.DisplayId = display_id;
    params.Width = display.Width;
    params.Height = display.Height;
    params.Fps = Settings.DefaultFps;
    params.BitrateBPS = protos::QualityToBitrate(Settings.DefaultQuality);

    std::shared_ptr<VideoEncoder> encoder = Media->CreateEncoder(params);
    if (!encoder) {
        spdlog::error("Cannot share display {}: Encoder creation failed", display_id);
        return false;
    }

    auto session = std::make_shared<SharingSession>();
    session->Display = display;
    session->Fps = Settings.DefaultFps > 0 ? Settings.DefaultFps : protos::kDefaultFps;
    session->Codec = Media->GetCodecName();
    session->Encoder = encoder;

    {
        std::lock_guard<std::mutex> locker(Lock);
        if (!Initialized) {
            return false;
        }
        if (!Sessions.emplace(display_id, session).second) {
            // Lost a race with another StartSharing()
            return true;
        }
    }

    spdlog::info("Sharing display {} '{}': {}x{} @ {} FPS codec={}",
        display_id, display.Name, display.Width, display.Height, session->Fps, session->Codec);

    if (Settings.RunCaptureThreads) {
        session->Thread = std::make_shared<std::thread>(&SessionManager::CaptureLoop, this, session);
    }

    BroadcastOffer();
    return true;
}

bool SessionManager::StopSharing(uint32_t display_id)
{
    std::shared_ptr<SharingSession> session;
    std::vector<std::string> viewers;
    {
        std::lock_guard<std::mutex> locker(Lock);
        auto it = Sessions.find(display_id);
        if (it == Sessions.end()) {
            spdlog::warn("Cannot stop sharing display {}: Not shared", display_id);
            return false;
        }
        session = it->second;
        Sessions.erase(it);

        for (const auto& pair : session->Viewers) {
            viewers.push_back(pair.first);
        }
        session->Viewers.clear();
    }

    spdlog::info("Stopped sharing display {}: Notifying {} viewers", display_id, viewers.size());

    StopCaptureThread(session);

    protos::MessageScreenStop stop;
    stop.DisplayId = display_id;
    stop.Origin = protos::StopOrigin_Sharer;

    for (const auto& viewer_id : viewers) {
        SendTo(viewer_id, stop);
        Scheduler.ResetViewer(viewer_id, display_id);
    }

    BroadcastOffer();
    return true;
}

bool SessionManager::IsSharing(uint32_t display_id) const
{
    std::lock_guard<std::mutex> locker(Lock);
    return Sessions.find(display_id) != Sessions.end();
}

std::vector<std::string> SessionManager::GetViewers(uint32_t display_id) const
{
    std::vector<std::string> viewers;

    std::lock_guard<std::mutex> locker(Lock);
    auto it = Sessions.find(display_id);
    if (it != Sessions.end()) {
        for (const auto& pair : it->second->Viewers) {
            viewers.push_back(pair.first);
        }
    }
    return viewers;
}

protos::MessageScreenOffer SessionManager::MakeOffer() const
{
    protos::MessageScreenOffer offer;

    std::lock_guard<std::mutex> locker(Lock);
    for (const auto& pair : Sessions) {
        offer.Displays.push_back(pair.second->Display);
    }
    return offer;
}

void SessionManager::BroadcastOffer()
{
    const protos::MessageScreenOffer offer = MakeOffer();
    const DeliveryReport report = Registry->Broadcast(offer);

    spdlog::debug("Broadcast screen offer with {} displays: sent={} failed={}",
        offer.Displays.size(), report.GetSentCount(), report.GetFailedCount());
}

bool SessionManager::CaptureAndSend(uint32_t display_id)
{
    std::shared_ptr<SharingSession> session;
    {
        std::lock_guard<std::mutex> locker(Lock);
        auto it = Sessions.find(display_id);
        if (it == Sessions.end()) {
            return false;
        }
        session = it->second;
    }
    return CaptureSession(session);
}

bool SessionManager::CaptureSession(const std::shared_ptr<SharingSession>& session)
{
    const uint32_t display_id = session->Display.DisplayId;

    std::vector<std::string> viewers;
    {
        std::lock_guard<std::mutex> locker(Lock);
        for (const auto& pair : session->Viewers) {
            if (pair.second.Started) {
                viewers.push_back(pair.first);
            }
        }
    }

    // Idle without viewers
    if (viewers.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> capture_locker(session->CaptureLock);

    RawFrame raw;
    if (!Capture->NextFrame(display_id, raw)) {
        spdlog::warn("Capture failed for display {}", display_id);
        return false;
    }

    if (session->KeyframeRequested.exchange(false)) {
        session->Encoder->ForceKeyframe();
    }

    EncodedFrame encoded;
    if (!session->Encoder->Encode(raw, encoded)) {
        spdlog::error("Encode failed for display {}", display_id);
        // Decoders cannot continue from a skipped frame
        session->KeyframeRequested = true;
        return false;
    }

    encoded.Sequence = session->NextSequence++;
    encoded.TimestampUsec = raw.TimestampUsec != 0 ? raw.TimestampUsec : GetTimeUsec();

    const FramePriorityClass priority = Scheduler.Classify(encoded, GetTimeUsec());

    protos::MessageScreenFrame frame;
    frame.DisplayId = display_id;
    frame.TimestampUsec = encoded.TimestampUsec;
    frame.FrameKind = encoded.IsKeyframe ? protos::FrameKind_Key : protos::FrameKind_Delta;
    frame.Sequence = encoded.Sequence;
    frame.Data = std::move(encoded.Data);

    // Each viewer gets its own send-or-drop decision
    for (const auto& viewer_id : viewers)
    {
        std::shared_ptr<PeerLink> link = Registry->Lookup(viewer_id);
        Scheduler.Submit(link.get(), viewer_id, frame, priority, GetTimeUsec());
    }

    return true;
}

void SessionManager::CaptureLoop(std::shared_ptr<SharingSession> session)
{
    SetCurrentThreadName("ScreenCapture");

    const uint64_t interval_usec = 1000 * 1000 / session->Fps;
    uint64_t next_usec = GetTimeUsec();

    while (!session->Terminated)
    {
        CaptureSession(session);

        next_usec += interval_usec;
        const uint64_t now_usec = GetTimeUsec();

        // Running behind: Skip ahead instead of capturing a burst
        if (now_usec >= next_usec) {
            next_usec = now_usec;
            continue;
        }

        std::unique_lock<std::mutex> locker(session->WakeLock);
        session->WakeCondition.wait_for(locker, std::chrono::microseconds(next_usec - now_usec), [&session]() {
            return session->Terminated.load();
        });
    }
}

void SessionManager::StopCaptureThread(const std::shared_ptr<SharingSession>& session)
{
    {
        std::lock_guard<std::mutex> locker(session->WakeLock);
        session->Terminated = true;
    }
    session->WakeCondition.notify_all();
    JoinThread(session->Thread);
}

void SessionManager::RequestEncoderKeyframe(uint32_t display_id)
{
    std::lock_guard<std::mutex> locker(Lock);
    auto it = Sessions.find(display_id);
    if (it != Sessions.end()) {
        it->second->KeyframeRequested = true;
    }
}


//------------------------------------------------------------------------------
// SessionManager: Viewer

bool SessionManager::RequestView(const std::string& sharer_id, uint32_t display_id, unsigned fps, uint8_t quality)
{
    if (quality >= protos::StreamQuality_Count) {
        quality = protos::StreamQuality_High;
    }
    fps = std::min(fps, 255u);

    {
        std::lock_guard<std::mutex> locker(Lock);
        auto it = Subscriptions.find(StreamKey(sharer_id, display_id));
        if (it == Subscriptions.end() || it->second->State != StreamState::Offered) {
            const StreamState state = (it == Subscriptions.end()) ? StreamState::Idle : it->second->State;
            spdlog::warn("Cannot request display {} from {}: Stream is {}",
                display_id, sharer_id.substr(0, 8), StreamStateToString(state));
            return false;
        }

        ViewerSubscription* sub = it->second.get();
        sub->State = StreamState::Requested;
        sub->CancelledLocally = false;
        sub->Fps = fps;
        sub->Quality = quality;
    }

    spdlog::info("Requesting display {} from {}: fps={} quality={}",
        display_id, sharer_id.substr(0, 8), fps, static_cast<unsigned>( quality ));

    protos::MessageScreenRequest request;
    request.DisplayId = display_id;
    request.PreferredFps = static_cast<uint8_t>( fps );
    request.PreferredQuality = quality;
    return SendTo(sharer_id, request);
}

bool SessionManager::CancelView(const std::string& sharer_id, uint32_t display_id)
{
    StreamState prior_state = StreamState::Idle;
    std::shared_ptr<StreamReceiver> receiver;
    {
        std::lock_guard<std::mutex> locker(Lock);
        auto it = Subscriptions.find(StreamKey(sharer_id, display_id));
        if (it == Subscriptions.end() || !IsActiveViewState(it->second->State)) {
            return false;
        }

        ViewerSubscription* sub = it->second.get();
        prior_state = sub->State;
        sub->State = StreamState::Stopped;
        sub->CancelledLocally = true;
        receiver = sub->Receiver;
    }

    spdlog::info("Cancelled view of display {} from {} in state {}",
        display_id, sharer_id.substr(0, 8), StreamStateToString(prior_state));

    if (receiver) {
        receiver->Stop();
    }

    // The sharer only knows about requested streams
    if (prior_state == StreamState::Offered) {
        return true;
    }

    protos::MessageScreenStop stop;
    stop.DisplayId = display_id;
    stop.Origin = protos::StopOrigin_Viewer;
    SendTo(sharer_id, stop);
    return true;
}

StreamState SessionManager::GetViewState(const std::string& sharer_id, uint32_t display_id) const
{
    std::lock_guard<std::mutex> locker(Lock);
    auto it = Subscriptions.find(StreamKey(sharer_id, display_id));
    if (it == Subscriptions.end()) {
        return StreamState::Idle;
    }
    return it->second->State;
}

std::shared_ptr<StreamReceiver> SessionManager::GetReceiver(const std::string& sharer_id, uint32_t display_id) const
{
    std::lock_guard<std::mutex> locker(Lock);
    auto it = Subscriptions.find(StreamKey(sharer_id, display_id));
    if (it == Subscriptions.end()) {
        return nullptr;
    }
    return it->second->Receiver;
}

std::vector<ViewInfo> SessionManager::ListViews() const
{
    std::vector<ViewInfo> views;

    std::lock_guard<std::mutex> locker(Lock);
    for (const auto& pair : Subscriptions) {
        ViewInfo info;
        info.SharerId = pair.second->SharerId;
        info.DisplayId = pair.second->DisplayId;
        info.State = pair.second->State;
        info.Start = pair.second->Start;
        views.push_back(info);
    }
    return views;
}


//------------------------------------------------------------------------------
// SessionManager: PeerEventSink

void SessionManager::OnPeerConnected(const PeerIdentity& peer)
{
    {
        std::lock_guard<std::mutex> locker(Lock);
        Peers[peer.PeerId] = peer;
    }

    // Let the new peer know what we share
    const protos::MessageScreenOffer offer = MakeOffer();
    if (!offer.Displays.empty()) {
        SendTo(peer.PeerId, offer);
    }
}

void SessionManager::OnPeerMessage(const PeerIdentity& peer, const protos::Message& msg)
{
    switch (protos::GetMessageType(msg))
    {
    case protos::MessageType_ScreenOffer:
        OnScreenOffer(peer, std::get<protos::MessageScreenOffer>(msg));
        break;
    case protos::MessageType_ScreenRequest:
        OnScreenRequest(peer, std::get<protos::MessageScreenRequest>(msg));
        break;
    case protos::MessageType_ScreenStart:
        OnScreenStart(peer, std::get<protos::MessageScreenStart>(msg));
        break;
    case protos::MessageType_ScreenFrame:
        OnScreenFrame(peer, std::get<protos::MessageScreenFrame>(msg));
        break;
    case protos::MessageType_ScreenStop:
    {
        const auto& stop = std::get<protos::MessageScreenStop>(msg);
        if (stop.Origin == protos::StopOrigin_Viewer) {
            OnViewerStop(peer, stop);
        } else {
            OnSharerStop(peer, stop);
        }
        break;
    }
    case protos::MessageType_RequestKeyframe:
        OnRequestKeyframe(peer, std::get<protos::MessageRequestKeyframe>(msg));
        break;

    case protos::MessageType_ControlRequest:
    case protos::MessageType_ControlGrant:
    case protos::MessageType_ControlRevoke:
    case protos::MessageType_InputEvent:
    case protos::MessageType_ChatMessage:
    case protos::MessageType_FileOffer:
    case protos::MessageType_FileAccept:
    case protos::MessageType_FileReject:
    case protos::MessageType_FileChunk:
    case protos::MessageType_FileComplete:
    case protos::MessageType_FileCancel:
        if (Collaborators) {
            Collaborators->OnCollaboratorMessage(peer, msg);
        } else {
            spdlog::debug("Ignoring {} from {}: No handler",
                protos::MessageTypeToString(protos::GetMessageType(msg)), peer.ToString());
        }
        break;

    default:
        // Connection management is handled by the transport
        spdlog::warn("Unexpected {} from {} at session layer",
            protos::MessageTypeToString(protos::GetMessageType(msg)), peer.ToString());
        break;
    }
}

void SessionManager::OnPeerDisconnected(const PeerIdentity& peer, CloseReason reason)
{
    std::vector<std::shared_ptr<StreamReceiver>> receivers;
    unsigned stopped_views = 0, detached_views = 0;
    {
        std::lock_guard<std::mutex> locker(Lock);
        Peers.erase(peer.PeerId);

        // Streams we were viewing from the peer
        for (auto& pair : Subscriptions)
        {
            ViewerSubscription* sub = pair.second.get();
            if (sub->SharerId != peer.PeerId) {
                continue;
            }
            if (sub->State != StreamState::Stopped && sub->State != StreamState::Idle) {
                sub->State = StreamState::Stopped;
                ++stopped_views;
            }
            if (sub->Receiver) {
                receivers.push_back(sub->Receiver);
            }
        }

        // Streams the peer was viewing from us
        for (auto& pair : Sessions) {
            detached_views += static_cast<unsigned>( pair.second->Viewers.erase(peer.PeerId) );
        }
    }

    StatusCache.RemovePeer(peer.PeerId);
    Scheduler.RemoveViewer(peer.PeerId);

    for (auto& receiver : receivers) {
        receiver->Stop();
    }

    spdlog::info("Peer {} left ({}): Stopped {} views and detached {} viewers",
        peer.ToString(), CloseReasonToString(reason), stopped_views, detached_views);
}

void SessionManager::OnConnectFailed(const std::string& address, ConnectError error)
{
    spdlog::info("Connection to {} failed: {}", address, ConnectErrorToString(error));
}


//------------------------------------------------------------------------------
// SessionManager: Sharer message handlers

void SessionManager::OnScreenRequest(const PeerIdentity& peer, const protos::MessageScreenRequest& msg)
{
    protos::MessageScreenStart start;
    bool attached = false;
    {
        std::lock_guard<std::mutex> locker(Lock);
        auto it = Sessions.find(msg.DisplayId);
        if (it != Sessions.end())
        {
            SharingSession* session = it->second.get();

            // Not sent any frames until it has the ScreenStart
            session->Viewers[peer.PeerId].Started = false;

            // All viewers share one delta chain, so each gets every frame
            start.DisplayId = msg.DisplayId;
            start.Width = session->Display.Width;
            start.Height = session->Display.Height;
            start.Fps = static_cast<uint8_t>( std::min(session->Fps, 255u) );
            start.Codec = session->Codec;
            attached = true;
        }
    }

    if (!attached)
    {
        spdlog::warn("{} requested display {} which is not shared: Refusing", peer.ToString(), msg.DisplayId);

        protos::MessageScreenStop stop;
        stop.DisplayId = msg.DisplayId;
        stop.Origin = protos::StopOrigin_Sharer;
        SendTo(peer.PeerId, stop);
        return;
    }

    Scheduler.ResetViewer(peer.PeerId, msg.DisplayId);

    spdlog::info("{} is now viewing display {}: {}x{} @ {} FPS codec={} (asked for {} FPS quality={})",
        peer.ToString(), msg.DisplayId, start.Width, start.Height, start.Fps, start.Codec,
        static_cast<unsigned>( msg.PreferredFps ), static_cast<unsigned>( msg.PreferredQuality ));

    const bool sent = SendTo(peer.PeerId, start);

    std::lock_guard<std::mutex> locker(Lock);
    auto it = Sessions.find(msg.DisplayId);
    if (it == Sessions.end()) {
        return;
    }
    if (!sent) {
        it->second->Viewers.erase(peer.PeerId);
        return;
    }

    auto viewer = it->second->Viewers.find(peer.PeerId);
    if (viewer != it->second->Viewers.end()) {
        viewer->second.Started = true;

        // New viewer needs a reference frame
        it->second->KeyframeRequested = true;
    }
}

void SessionManager::OnViewerStop(const PeerIdentity& peer, const protos::MessageScreenStop& msg)
{
    bool detached = false;
    {
        std::lock_guard<std::mutex> locker(Lock);
        auto it = Sessions.find(msg.DisplayId);
        if (it != Sessions.end()) {
            detached = it->second->Viewers.erase(peer.PeerId) > 0;
        }
    }

    if (!detached) {
        spdlog::debug("{} stopped viewing display {} which it was not viewing", peer.ToString(), msg.DisplayId);
        return;
    }

    Scheduler.ResetViewer(peer.PeerId, msg.DisplayId);

    spdlog::info("{} stopped viewing display {}", peer.ToString(), msg.DisplayId);
}

void SessionManager::OnRequestKeyframe(const PeerIdentity& peer, const protos::MessageRequestKeyframe& msg)
{
    bool viewing = false;
    {
        std::lock_guard<std::mutex> locker(Lock);
        auto it = Sessions.find(msg.DisplayId);
        if (it != Sessions.end() && it->second->Viewers.count(peer.PeerId) > 0) {
            it->second->KeyframeRequested = true;
            viewing = true;
        }
    }

    if (!viewing) {
        ReportSessionError(peer, msg.DisplayId, "Keyframe requested for a stream that is not streaming");
        return;
    }

    spdlog::debug("{} requested a keyframe for display {} after seq={}",
        peer.ToString(), msg.DisplayId, msg.LastSequence);
}


//------------------------------------------------------------------------------
// SessionManager: Viewer message handlers

void SessionManager::OnScreenOffer(const PeerIdentity& peer, const protos::MessageScreenOffer& msg)
{
    const std::vector<uint32_t> withdrawn = StatusCache.ApplyOffer(peer.PeerId, msg, GetTimeUsec());

    std::vector<uint32_t> auto_requests;
    std::vector<std::shared_ptr<StreamReceiver>> receivers;
    {
        std::lock_guard<std::mutex> locker(Lock);

        for (const auto& display : msg.Displays)
        {
            std::shared_ptr<ViewerSubscription>& sub = Subscriptions[StreamKey(peer.PeerId, display.DisplayId)];
            if (!sub) {
                sub = std::make_shared<ViewerSubscription>();
                sub->SharerId = peer.PeerId;
                sub->DisplayId = display.DisplayId;
            }
            sub->Offered = display;

            // Stopped is terminal for a cycle: A new offer starts the next one
            if (sub->State == StreamState::Idle || sub->State == StreamState::Stopped)
            {
                sub->State = StreamState::Offered;
                sub->Start = protos::MessageScreenStart();
                sub->Receiver.reset();

                if (Settings.AutoViewOffers && !sub->CancelledLocally) {
                    auto_requests.push_back(display.DisplayId);
                }
            }
        }

        for (uint32_t display_id : withdrawn)
        {
            auto it = Subscriptions.find(StreamKey(peer.PeerId, display_id));
            if (it == Subscriptions.end()) {
                continue;
            }
            ViewerSubscription* sub = it->second.get();

            // Streaming views end with the sharer's ScreenStop
            if (sub->State == StreamState::Offered || sub->State == StreamState::Requested) {
                sub->State = StreamState::Stopped;
                if (sub->Receiver) {
                    receivers.push_back(sub->Receiver);
                }
            }
        }
    }

    for (auto& receiver : receivers) {
        receiver->Stop();
    }

    spdlog::debug("{} offers {} displays ({} withdrawn)", peer.ToString(), msg.Displays.size(), withdrawn.size());

    for (uint32_t display_id : auto_requests) {
        RequestView(peer.PeerId, display_id, Settings.DefaultFps, Settings.DefaultQuality);
    }
}

void SessionManager::OnScreenStart(const PeerIdentity& peer, const protos::MessageScreenStart& msg)
{
    const StreamKey key(peer.PeerId, msg.DisplayId);

    StreamState state = StreamState::Idle;
    {
        std::lock_guard<std::mutex> locker(Lock);
        auto it = Subscriptions.find(key);
        if (it != Subscriptions.end()) {
            state = it->second->State;
        }
    }

    if (state == StreamState::Stopped) {
        // Crossed with our ScreenStop
        spdlog::debug("Ignoring ScreenStart for cancelled display {} from {}", msg.DisplayId, peer.ToString());
        return;
    }
    if (state != StreamState::Requested) {
        ReportSessionError(peer, msg.DisplayId,
            fmt::format("ScreenStart received while stream is {}", StreamStateToString(state)));
        return;
    }

    std::shared_ptr<VideoDecoder> decoder = Media->CreateDecoder(msg);
    std::shared_ptr<FrameRenderer> renderer = Media->CreateRenderer(peer, msg);
    if (!decoder || !renderer) {
        spdlog::error("Cannot view display {} from {}: Decoder or renderer creation failed",
            msg.DisplayId, peer.ToString());
        CancelView(peer.PeerId, msg.DisplayId);
        return;
    }

    ConnectionRegistry* registry = Registry;
    const std::string sharer_id = peer.PeerId;

    auto receiver = std::make_shared<StreamReceiver>();
    receiver->Initialize(peer.ToString(), msg, decoder, renderer,
        [registry, sharer_id](uint32_t display_id, uint32_t last_sequence)
    {
        protos::MessageRequestKeyframe request;
        request.DisplayId = display_id;
        request.LastSequence = last_sequence;

        const SendResult result = registry->SendTo(sharer_id, request);
        if (result != SendResult::Sent) {
            spdlog::warn("Keyframe request for display {} to {} failed: {}",
                display_id, sharer_id.substr(0, 8), SendResultToString(result));
        }
    }, Settings.KeyframeRequestIntervalUsec);

    bool attached = false;
    {
        std::lock_guard<std::mutex> locker(Lock);
        auto it = Subscriptions.find(key);
        if (it != Subscriptions.end() && it->second->State == StreamState::Requested) {
            it->second->State = StreamState::Streaming;
            it->second->Start = msg;
            it->second->Receiver = receiver;
            attached = true;
        }
    }

    if (!attached) {
        // Cancelled while the decoder was being set up
        receiver->Stop();
        return;
    }

    spdlog::info("Streaming display {} from {}: {}x{} @ {} FPS codec={}",
        msg.DisplayId, peer.ToString(), msg.Width, msg.Height, msg.Fps, msg.Codec);

    if (Settings.RunDecodeThreads) {
        receiver->Start();
    }
}

void SessionManager::OnScreenFrame(const PeerIdentity& peer, const protos::MessageScreenFrame& msg)
{
    std::shared_ptr<StreamReceiver> receiver;
    StreamState state = StreamState::Idle;
    {
        std::lock_guard<std::mutex> locker(Lock);
        auto it = Subscriptions.find(StreamKey(peer.PeerId, msg.DisplayId));
        if (it != Subscriptions.end()) {
            state = it->second->State;
            receiver = it->second->Receiver;
        }
    }

    if (state == StreamState::Stopped) {
        // Frames still in flight after a stop
        return;
    }
    if (state != StreamState::Streaming || !receiver) {
        ReportSessionError(peer, msg.DisplayId,
            fmt::format("ScreenFrame seq={} received while stream is {}", msg.Sequence, StreamStateToString(state)));
        return;
    }

    receiver->OnFrame(msg, GetTimeUsec());
}

void SessionManager::OnSharerStop(const PeerIdentity& peer, const protos::MessageScreenStop& msg)
{
    std::shared_ptr<StreamReceiver> receiver;
    StreamState prior_state = StreamState::Idle;
    {
        std::lock_guard<std::mutex> locker(Lock);
        auto it = Subscriptions.find(StreamKey(peer.PeerId, msg.DisplayId));
        if (it != Subscriptions.end()) {
            prior_state = it->second->State;
            if (IsActiveViewState(prior_state)) {
                it->second->State = StreamState::Stopped;
                receiver = it->second->Receiver;
            }
        }
    }

    if (!IsActiveViewState(prior_state)) {
        spdlog::debug("Duplicate ScreenStop for display {} from {} in state {}",
            msg.DisplayId, peer.ToString(), StreamStateToString(prior_state));
        return;
    }

    if (receiver) {
        receiver->Stop();
    }

    spdlog::info("{} stopped sharing display {} (was {})",
        peer.ToString(), msg.DisplayId, StreamStateToString(prior_state));
}


//------------------------------------------------------------------------------
// SessionManager: SchedulerSink

void SessionManager::OnFrameOutcome(
    const std::string& viewer_id,
    uint32_t display_id,
    const protos::MessageScreenFrame& frame,
    FrameOutcome outcome)
{
    if (outcome == FrameOutcome::Dropped) {
        spdlog::trace("Frame seq={} key={} for display {} to {} dropped",
            frame.Sequence, frame.FrameKind == protos::FrameKind_Key, display_id, viewer_id.substr(0, 8));
    }
}

void SessionManager::OnKeyframeRetry(const std::string& viewer_id, uint32_t display_id, unsigned attempt)
{
    spdlog::debug("Re-submitting keyframe for display {} to {}: attempt {}",
        display_id, viewer_id.substr(0, 8), attempt);

    RequestEncoderKeyframe(display_id);
}

void SessionManager::OnStreamFault(const std::string& viewer_id, uint32_t display_id)
{
    spdlog::error("Stream fault: Keyframes for display {} to {} keep failing", display_id, viewer_id.substr(0, 8));

    // Keep trying to resynchronize the viewer
    RequestEncoderKeyframe(display_id);

    if (Faults) {
        FaultSignal fault;
        fault.Kind = FaultKind::StreamFault;
        fault.PeerId = viewer_id;
        fault.DisplayId = display_id;
        fault.Detail = fmt::format("Keyframe retry budget of {} exhausted",
            Scheduler.GetSettings().KeyframeRetryBudget);
        Faults->OnFault(fault);
    }
}


//------------------------------------------------------------------------------
// SessionManager: Tools

bool SessionManager::SendTo(const std::string& peer_id, const protos::Message& msg)
{
    const SendResult result = Registry->SendTo(peer_id, msg);
    if (result != SendResult::Sent) {
        spdlog::warn("Failed to send {} to {}: {}",
            protos::MessageTypeToString(protos::GetMessageType(msg)), peer_id.substr(0, 8),
            SendResultToString(result));
        return false;
    }
    return true;
}

void SessionManager::ReportSessionError(const PeerIdentity& peer, uint32_t display_id, const std::string& detail)
{
    spdlog::warn("Session state error from {} for display {}: {}", peer.ToString(), display_id, detail);

    if (Faults) {
        FaultSignal fault;
        fault.Kind = FaultKind::SessionStateError;
        fault.PeerId = peer.PeerId;
        fault.DisplayId = display_id;
        fault.Detail = detail;
        Faults->OnFault(fault);
    }
}


} // namespace lanmeet
