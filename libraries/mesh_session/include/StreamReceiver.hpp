// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

/*
    Stream Receiver

    Receive side of one (sharer, display) stream.  Every frame that arrives
    while the decoder is busy is queued behind the current reference, and
    each decode pass runs the whole queue in order but presents only the
    newest picture, so the display never falls more than one frame behind.

    Rules:
    + Frames at or below the newest accepted sequence are stale and dropped.
    + Deltas are decoded in sequence order and never skipped.  A delta that
      is superseded before presentation is still decoded.
    + A keyframe is always decoded.  A newer keyframe replaces an undecoded
      older keyframe along with any pending deltas.
    + A sequence gap, a mid-stream join, a decode failure or a delta queue
      overflow breaks the reference.  Deltas are then discarded and a
      keyframe is requested (rate limited) until the next keyframe arrives.

    The decode thread sleeps at most one frame interval, so Stop() returns
    within about one frame interval plus the decode in progress.
*/

#pragma once

#include "MediaInterfaces.hpp"

#include <core.hpp> // core

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace lanmeet {


//------------------------------------------------------------------------------
// Constants

// Minimum time between keyframe requests for one stream
static const uint64_t kKeyframeRequestIntervalUsec = 250 * 1000;

// Deltas queued behind the reference before the decoder is considered lost
static const size_t kMaxPendingDeltas = 64;


//------------------------------------------------------------------------------
// StreamReceiver

enum class ReceiveResult
{
    Accepted,      ///< Queued for decode
    Stale,         ///< Sequence at or below the newest seen
    NeedKeyframe,  ///< Delta without a valid reference
    Stopped,       ///< Receiver is stopped

    Count
};

const char* ReceiveResultToString(ReceiveResult result);

/// Ask the sharer for a keyframe
using KeyframeRequestFunction = std::function<void(uint32_t display_id, uint32_t last_sequence)>;

struct ReceiverStats
{
    uint64_t Accepted = 0;
    uint64_t Stale = 0;
    uint64_t Replaced = 0; // Frames superseded for presentation by newer frames
    uint64_t DiscardedNoReference = 0;
    uint64_t Decoded = 0;
    uint64_t Presented = 0;
    uint64_t DecodeFailures = 0;
    uint64_t KeyframeRequests = 0;
};

class StreamReceiver
{
public:
    ~StreamReceiver()
    {
        Stop();
    }

    void Initialize(
        const std::string& sharer_name,
        const protos::MessageScreenStart& start,
        std::shared_ptr<VideoDecoder> decoder,
        std::shared_ptr<FrameRenderer> renderer,
        KeyframeRequestFunction request_keyframe,
        uint64_t keyframe_request_interval_usec = kKeyframeRequestIntervalUsec);

    /// Start the decode thread
    void Start();

    /// Stop the decode thread and discard pending frames.  Terminal
    void Stop();

    /// Offer a received frame to the decode queue
    ReceiveResult OnFrame(const protos::MessageScreenFrame& frame, uint64_t now_usec);

    /// Decode every pending frame in order and present the newest.
    /// Returns false if nothing was pending
    bool DecodeNext();

    bool IsStopped() const
    {
        return Stopped;
    }

    /// Newest sequence accepted or seen so far.  Returns false before any frame
    bool GetNewestSequence(uint32_t& sequence) const;

    /// Sequence of the newest frame waiting for decode.  Returns false if empty
    bool GetPendingSequence(uint32_t& sequence) const;

    /// Sequence of the last frame handed to the renderer.  Returns false if none
    bool GetPresentedSequence(uint32_t& sequence) const;

    bool IsReferenceValid() const
    {
        std::lock_guard<std::mutex> locker(Lock);
        return ReferenceValid;
    }

    ReceiverStats GetStats() const
    {
        std::lock_guard<std::mutex> locker(Lock);
        return Stats;
    }

protected:
    std::string LogName;
    uint32_t DisplayId = 0;
    uint32_t Width = 0, Height = 0;
    uint64_t FrameIntervalUsec = 33333;
    uint64_t KeyframeRequestIntervalUsec = kKeyframeRequestIntervalUsec;

    std::shared_ptr<VideoDecoder> Decoder;
    std::shared_ptr<FrameRenderer> Renderer;
    KeyframeRequestFunction RequestKeyframe;

    mutable std::mutex Lock;
    std::condition_variable Condition;

    // A keyframe that must be decoded, and the deltas that follow it in order
    std::shared_ptr<protos::MessageScreenFrame> PendingKey;
    std::vector<std::shared_ptr<protos::MessageScreenFrame>> PendingDeltas;

    bool HasNewest = false;
    uint32_t NewestSequence = 0;

    bool ReferenceValid = false;
    uint64_t LastKeyframeRequestUsec = 0;
    bool EverRequestedKeyframe = false;

    bool HasPresented = false;
    uint32_t PresentedSequence = 0;

    ReceiverStats Stats;

    std::atomic<bool> Stopped = ATOMIC_VAR_INIT(false);
    std::atomic<bool> Terminated = ATOMIC_VAR_INIT(true);
    std::shared_ptr<std::thread> Thread;

    // Serializes decoder access between the thread and DecodeNext() callers
    std::mutex DecodeLock;

    void Loop();

    // Called with Lock held.  Returns true if a request should be sent
    bool ShouldRequestKeyframe(uint64_t now_usec);

    void SendKeyframeRequest(uint32_t last_sequence);

    // Called with Lock held.  Drops queued deltas that can no longer decode
    void DiscardPendingDeltas();
};


} // namespace lanmeet
