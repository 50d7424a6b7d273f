// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "FrameScheduler.hpp"

#include <core_logging.hpp> // core

namespace lanmeet {


//------------------------------------------------------------------------------
// Tools

const char* FrameOutcomeToString(FrameOutcome outcome)
{
    static_assert((int)FrameOutcome::Count == 4, "Update this");
    switch (outcome)
    {
    case FrameOutcome::Sent: return "Sent";
    case FrameOutcome::Dropped: return "Dropped";
    case FrameOutcome::Retried: return "Retried";
    case FrameOutcome::Faulted: return "Faulted";
    default: break;
    }
    return "Unknown";
}


//------------------------------------------------------------------------------
// FrameScheduler

void FrameScheduler::Initialize(const SchedulerSettings& settings, SchedulerSink* sink)
{
    Settings = settings;
    Sink = sink;

    std::lock_guard<std::mutex> locker(Lock);
    Retries.clear();
    Stats = SchedulerStats();
}

FramePriorityClass FrameScheduler::Classify(const EncodedFrame& frame, uint64_t now_usec) const
{
    if (frame.IsKeyframe) {
        KeyFramePriority key;
        key.RetryBudget = Settings.KeyframeRetryBudget;
        return key;
    }

    DeltaFramePriority delta;
    delta.DeadlineUsec = now_usec + Settings.DeltaDeadlineUsec;
    return delta;
}

FrameOutcome FrameScheduler::Submit(
    PeerLink* viewer,
    const std::string& viewer_id,
    const protos::MessageScreenFrame& frame,
    const FramePriorityClass& priority,
    uint64_t now_usec)
{
    FrameOutcome outcome;
    if (auto key = std::get_if<KeyFramePriority>(&priority)) {
        outcome = SubmitKeyframe(viewer, viewer_id, frame, *key);
    } else {
        outcome = SubmitDelta(viewer, viewer_id, frame, std::get<DeltaFramePriority>(priority), now_usec);
    }

    if (Sink) {
        Sink->OnFrameOutcome(viewer_id, frame.DisplayId, frame, outcome);
    }
    return outcome;
}

FrameOutcome FrameScheduler::SubmitKeyframe(
    PeerLink* viewer,
    const std::string& viewer_id,
    const protos::MessageScreenFrame& frame,
    const KeyFramePriority& priority)
{
    SendResult result = SendResult::ConnectionClosed;
    LinkStats stats;
    if (viewer) {
        result = viewer->SendReliable(frame);
        stats = viewer->GetStats();
    }

    const bool backed_up = stats.QueueDelayUsec > Settings.KeyframeTimeoutUsec;
    const bool suspected_loss = result != SendResult::Sent || backed_up || stats.RttSpike;

    StreamKey stream_key;
    stream_key.ViewerId = viewer_id;
    stream_key.DisplayId = frame.DisplayId;

    unsigned attempt = 0;
    bool report_fault = false;
    {
        std::lock_guard<std::mutex> locker(Lock);
        RetryState& state = Retries[stream_key];

        if (!suspected_loss) {
            state.Failures = 0;
            state.FaultReported = false;
            ++Stats.KeyframesSent;
            return FrameOutcome::Sent;
        }

        attempt = ++state.Failures;
        if (attempt < priority.RetryBudget) {
            ++Stats.KeyframeRetries;
        } else if (!state.FaultReported) {
            state.FaultReported = true;
            report_fault = true;
            ++Stats.StreamFaults;
        } else {
            // Already reported: Wait for the resynchronizing keyframe
            return FrameOutcome::Dropped;
        }
    }

    spdlog::warn("Keyframe seq={} display={} to {} suspected lost: send={} queue={} msec rtt_spike={} attempt {}/{}",
        frame.Sequence, frame.DisplayId, viewer_id.substr(0, 8), SendResultToString(result),
        stats.QueueDelayUsec / 1000.f, stats.RttSpike, attempt, priority.RetryBudget);

    if (report_fault) {
        if (Sink) {
            Sink->OnStreamFault(viewer_id, frame.DisplayId);
        }
        return FrameOutcome::Faulted;
    }

    if (Sink) {
        Sink->OnKeyframeRetry(viewer_id, frame.DisplayId, attempt);
    }
    return FrameOutcome::Retried;
}

FrameOutcome FrameScheduler::SubmitDelta(
    PeerLink* viewer,
    const std::string& viewer_id,
    const protos::MessageScreenFrame& frame,
    const DeltaFramePriority& priority,
    uint64_t now_usec)
{
    LANMEET_UNUSED(viewer_id);

    bool send = viewer != nullptr && now_usec < priority.DeadlineUsec;
    if (send)
    {
        const uint64_t remaining_usec = priority.DeadlineUsec - now_usec;
        const LinkStats stats = viewer->GetStats();
        if (stats.QueueDelayUsec > remaining_usec) {
            send = false;
        }
    }

    if (send && viewer->SendUnreliable(frame, SendPriority::Bulk) == SendResult::Sent) {
        std::lock_guard<std::mutex> locker(Lock);
        ++Stats.DeltasSent;
        return FrameOutcome::Sent;
    }

    std::lock_guard<std::mutex> locker(Lock);
    ++Stats.DeltasDropped;
    return FrameOutcome::Dropped;
}

void FrameScheduler::ResetViewer(const std::string& viewer_id, uint32_t display_id)
{
    StreamKey stream_key;
    stream_key.ViewerId = viewer_id;
    stream_key.DisplayId = display_id;

    std::lock_guard<std::mutex> locker(Lock);
    Retries.erase(stream_key);
}

void FrameScheduler::RemoveViewer(const std::string& viewer_id)
{
    std::lock_guard<std::mutex> locker(Lock);
    for (auto it = Retries.begin(); it != Retries.end();) {
        if (it->first.ViewerId == viewer_id) {
            it = Retries.erase(it);
        } else {
            ++it;
        }
    }
}

SchedulerStats FrameScheduler::GetStats() const
{
    std::lock_guard<std::mutex> locker(Lock);
    return Stats;
}


} // namespace lanmeet
