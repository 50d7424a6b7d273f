// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

/*
    Frame Priority Scheduler

    Decides for each (frame, viewer) pair whether to send or drop.

    Keyframes go out on the reliable video path.  A failed send, a backed up
    outbound queue or a heartbeat RTT spike counts as a suspected loss against
    a retry budget.  Below the budget the session is asked to re-submit a
    fresh keyframe.  When the budget runs out a StreamFault is reported once
    for the (viewer, display) stream until a keyframe gets through.

    Delta frames carry a deadline.  If the deadline has passed, or the
    viewer's outbound queue delay exceeds the time left, the frame is dropped
    instead of queued.

    Every viewer gets its own decision.  Nothing here blocks or throws.
*/

#pragma once

#include "MediaInterfaces.hpp"

#include <map>
#include <mutex>
#include <variant>

namespace lanmeet {


//------------------------------------------------------------------------------
// FramePriorityClass

struct KeyFramePriority
{
    unsigned RetryBudget = 0;
};

struct DeltaFramePriority
{
    // Absolute time after which the frame is not worth sending
    uint64_t DeadlineUsec = 0;
};

using FramePriorityClass = std::variant<KeyFramePriority, DeltaFramePriority>;


//------------------------------------------------------------------------------
// SchedulerSettings

struct SchedulerSettings
{
    unsigned KeyframeRetryBudget = 3;

    // About one frame interval at 60 FPS
    uint64_t DeltaDeadlineUsec = 16 * 1000;

    // Outbound queue delay above this is a suspected keyframe loss
    uint64_t KeyframeTimeoutUsec = 200 * 1000;
};


//------------------------------------------------------------------------------
// SchedulerSink

enum class FrameOutcome
{
    Sent,
    Dropped,
    Retried,
    Faulted,

    Count
};

const char* FrameOutcomeToString(FrameOutcome outcome);

class SchedulerSink
{
public:
    virtual ~SchedulerSink() = default;

    virtual void OnFrameOutcome(
        const std::string& viewer_id,
        uint32_t display_id,
        const protos::MessageScreenFrame& frame,
        FrameOutcome outcome) = 0;

    /// Keyframe suspected lost: Re-submit a fresh keyframe
    virtual void OnKeyframeRetry(const std::string& viewer_id, uint32_t display_id, unsigned attempt) = 0;

    /// Retry budget exhausted for this stream
    virtual void OnStreamFault(const std::string& viewer_id, uint32_t display_id) = 0;
};

struct SchedulerStats
{
    uint64_t KeyframesSent = 0;
    uint64_t DeltasSent = 0;

    // DeliveryMiss: Delta frames dropped by deadline, queue delay or send failure
    uint64_t DeltasDropped = 0;

    uint64_t KeyframeRetries = 0;
    uint64_t StreamFaults = 0;
};


//------------------------------------------------------------------------------
// FrameScheduler

class FrameScheduler
{
public:
    void Initialize(const SchedulerSettings& settings, SchedulerSink* sink);

    const SchedulerSettings& GetSettings() const
    {
        return Settings;
    }

    /// Tag an encoded frame captured at `now_usec`
    FramePriorityClass Classify(const EncodedFrame& frame, uint64_t now_usec) const;

    /// Send or drop one frame for one viewer
    FrameOutcome Submit(
        PeerLink* viewer,
        const std::string& viewer_id,
        const protos::MessageScreenFrame& frame,
        const FramePriorityClass& priority,
        uint64_t now_usec);

    /// Forget retry state for a stream, when a viewer attaches or detaches
    void ResetViewer(const std::string& viewer_id, uint32_t display_id);

    /// Forget retry state for every stream to a viewer
    void RemoveViewer(const std::string& viewer_id);

    SchedulerStats GetStats() const;

protected:
    SchedulerSettings Settings;
    SchedulerSink* Sink = nullptr;

    struct StreamKey
    {
        std::string ViewerId;
        uint32_t DisplayId = 0;

        bool operator<(const StreamKey& rhs) const
        {
            if (ViewerId != rhs.ViewerId) {
                return ViewerId < rhs.ViewerId;
            }
            return DisplayId < rhs.DisplayId;
        }
    };

    struct RetryState
    {
        unsigned Failures = 0;
        bool FaultReported = false;
    };

    mutable std::mutex Lock;
    std::map<StreamKey, RetryState> Retries;
    SchedulerStats Stats;

    FrameOutcome SubmitKeyframe(
        PeerLink* viewer,
        const std::string& viewer_id,
        const protos::MessageScreenFrame& frame,
        const KeyFramePriority& priority);

    FrameOutcome SubmitDelta(
        PeerLink* viewer,
        const std::string& viewer_id,
        const protos::MessageScreenFrame& frame,
        const DeltaFramePriority& priority,
        uint64_t now_usec);
};


} // namespace lanmeet
