// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "StreamReceiver.hpp"

#include <core_logging.hpp> // core

namespace lanmeet {


//------------------------------------------------------------------------------
// Tools

const char* ReceiveResultToString(ReceiveResult result)
{
    static_assert((int)ReceiveResult::Count == 4, "Update this");
    switch (result)
    {
    case ReceiveResult::Accepted: return "Accepted";
    case ReceiveResult::Stale: return "Stale";
    case ReceiveResult::NeedKeyframe: return "NeedKeyframe";
    case ReceiveResult::Stopped: return "Stopped";
    default: break;
    }
    return "Unknown";
}


//------------------------------------------------------------------------------
// StreamReceiver

void StreamReceiver::Initialize(
    const std::string& sharer_name,
    const protos::MessageScreenStart& start,
    std::shared_ptr<VideoDecoder> decoder,
    std::shared_ptr<FrameRenderer> renderer,
    KeyframeRequestFunction request_keyframe,
    uint64_t keyframe_request_interval_usec)
{
    LogName = fmt::format("[Stream {} display {}]", sharer_name, start.DisplayId);
    DisplayId = start.DisplayId;
    Width = start.Width;
    Height = start.Height;

    const unsigned fps = start.Fps > 0 ? start.Fps : protos::kDefaultFps;
    FrameIntervalUsec = 1000 * 1000 / fps;
    KeyframeRequestIntervalUsec = keyframe_request_interval_usec;

    Decoder = decoder;
    Renderer = renderer;
    RequestKeyframe = request_keyframe;

    std::lock_guard<std::mutex> locker(Lock);
    PendingKey.reset();
    PendingDeltas.clear();
    HasNewest = false;
    NewestSequence = 0;
    ReferenceValid = false;
    LastKeyframeRequestUsec = 0;
    EverRequestedKeyframe = false;
    HasPresented = false;
    PresentedSequence = 0;
    Stats = ReceiverStats();
    Stopped = false;
}

void StreamReceiver::Start()
{
    if (Stopped || Thread) {
        return;
    }

    spdlog::info("{} Starting decode thread: {}x{} @ {} FPS", LogName,
        Width, Height, 1000 * 1000 / FrameIntervalUsec);

    Terminated = false;
    Thread = std::make_shared<std::thread>(&StreamReceiver::Loop, this);
}

void StreamReceiver::Stop()
{
    if (Stopped.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> locker(Lock);
        PendingKey.reset();
        PendingDeltas.clear();
        Terminated = true;
    }
    Condition.notify_all();

    JoinThread(Thread);

    const ReceiverStats stats = GetStats();
    spdlog::info("{} Stopped: accepted={} stale={} replaced={} no_reference={} decoded={} presented={} keyframe_requests={}",
        LogName, stats.Accepted, stats.Stale, stats.Replaced,
        stats.DiscardedNoReference, stats.Decoded, stats.Presented, stats.KeyframeRequests);
}

ReceiveResult StreamReceiver::OnFrame(const protos::MessageScreenFrame& frame, uint64_t now_usec)
{
    bool send_request = false;
    uint32_t last_sequence = 0;
    ReceiveResult result = ReceiveResult::Accepted;
    {
        std::lock_guard<std::mutex> locker(Lock);

        if (Stopped) {
            return ReceiveResult::Stopped;
        }

        if (HasNewest && static_cast<int32_t>( frame.Sequence - NewestSequence ) <= 0) {
            ++Stats.Stale;
            return ReceiveResult::Stale;
        }

        const bool gap = HasNewest && frame.Sequence != NewestSequence + 1;
        HasNewest = true;
        NewestSequence = frame.Sequence;

        if (frame.FrameKind == protos::FrameKind_Key)
        {
            if (PendingKey) {
                ++Stats.Replaced;
            }
            Stats.Replaced += PendingDeltas.size();
            PendingKey = std::make_shared<protos::MessageScreenFrame>(frame);
            PendingDeltas.clear();
            ReferenceValid = true;
            ++Stats.Accepted;
        }
        else
        {
            if (gap && ReferenceValid) {
                spdlog::debug("{} Sequence gap before {}: Reference lost", LogName, frame.Sequence);
                ReferenceValid = false;
            }

            if (ReferenceValid && PendingDeltas.size() >= kMaxPendingDeltas) {
                spdlog::warn("{} Decoder is {} deltas behind: Reference dropped", LogName, PendingDeltas.size());
                ReferenceValid = false;
                DiscardPendingDeltas();
            }

            if (!ReferenceValid)
            {
                ++Stats.DiscardedNoReference;
                send_request = ShouldRequestKeyframe(now_usec);
                last_sequence = frame.Sequence;
                result = ReceiveResult::NeedKeyframe;
            }
            else
            {
                if (!PendingDeltas.empty()) {
                    ++Stats.Replaced;
                }
                PendingDeltas.push_back(std::make_shared<protos::MessageScreenFrame>(frame));
                ++Stats.Accepted;
            }
        }
    }

    if (result == ReceiveResult::Accepted) {
        Condition.notify_all();
    }
    if (send_request) {
        SendKeyframeRequest(last_sequence);
    }
    return result;
}

bool StreamReceiver::ShouldRequestKeyframe(uint64_t now_usec)
{
    if (EverRequestedKeyframe && now_usec - LastKeyframeRequestUsec < KeyframeRequestIntervalUsec) {
        return false;
    }
    EverRequestedKeyframe = true;
    LastKeyframeRequestUsec = now_usec;
    ++Stats.KeyframeRequests;
    return true;
}

void StreamReceiver::DiscardPendingDeltas()
{
    Stats.DiscardedNoReference += PendingDeltas.size();
    PendingDeltas.clear();
}

void StreamReceiver::SendKeyframeRequest(uint32_t last_sequence)
{
    spdlog::debug("{} Requesting keyframe after seq={}", LogName, last_sequence);

    if (RequestKeyframe) {
        RequestKeyframe(DisplayId, last_sequence);
    }
}

bool StreamReceiver::DecodeNext()
{
    std::lock_guard<std::mutex> decode_locker(DecodeLock);

    std::vector<std::shared_ptr<protos::MessageScreenFrame>> batch;
    {
        std::lock_guard<std::mutex> locker(Lock);
        if (Stopped) {
            return false;
        }
        if (PendingKey) {
            batch.push_back(PendingKey);
            PendingKey.reset();
        }
        batch.insert(batch.end(), PendingDeltas.begin(), PendingDeltas.end());
        PendingDeltas.clear();
    }
    if (batch.empty()) {
        return false;
    }

    // Each delta references the one before it, so all are decoded in order
    DecodedFrame newest;
    bool has_newest = false;
    uint64_t decoded_count = 0;
    bool failed = false;
    uint32_t failed_sequence = 0;
    size_t skipped = 0;

    for (size_t i = 0; i < batch.size(); ++i)
    {
        if (Stopped) {
            return false;
        }

        protos::MessageScreenFrame& frame = *batch[i];

        EncodedFrame encoded;
        encoded.IsKeyframe = (frame.FrameKind == protos::FrameKind_Key);
        encoded.Sequence = frame.Sequence;
        encoded.TimestampUsec = frame.TimestampUsec;
        encoded.Data = std::move(frame.Data);

        DecodedFrame decoded;
        if (!Decoder || !Decoder->Decode(encoded, decoded))
        {
            spdlog::warn("{} Decode failed for seq={} key={}", LogName, encoded.Sequence, encoded.IsKeyframe);
            failed = true;
            failed_sequence = encoded.Sequence;
            skipped = batch.size() - i - 1;
            break;
        }

        decoded.Sequence = encoded.Sequence;
        decoded.TimestampUsec = encoded.TimestampUsec;
        newest = std::move(decoded);
        has_newest = true;
        ++decoded_count;
    }

    bool send_request = false;
    {
        std::lock_guard<std::mutex> locker(Lock);
        Stats.Decoded += decoded_count;

        if (failed)
        {
            ++Stats.DecodeFailures;
            Stats.DiscardedNoReference += skipped;

            // A pending keyframe will restore the reference on its own
            if (!PendingKey) {
                ReferenceValid = false;
                DiscardPendingDeltas();
                send_request = ShouldRequestKeyframe(GetTimeUsec());
            }
        }
    }
    if (send_request) {
        SendKeyframeRequest(failed_sequence);
    }

    if (!has_newest) {
        return true;
    }
    if (Stopped) {
        return false;
    }

    if (Renderer) {
        Renderer->Present(newest);
    }

    std::lock_guard<std::mutex> locker(Lock);
    ++Stats.Presented;
    HasPresented = true;
    PresentedSequence = newest.Sequence;
    return true;
}

void StreamReceiver::Loop()
{
    SetCurrentThreadName("StreamDecode");

    while (!Terminated)
    {
        if (DecodeNext()) {
            continue;
        }

        std::unique_lock<std::mutex> locker(Lock);
        Condition.wait_for(locker, std::chrono::microseconds(FrameIntervalUsec), [this]() {
            return Terminated || PendingKey || !PendingDeltas.empty();
        });
    }
}

bool StreamReceiver::GetNewestSequence(uint32_t& sequence) const
{
    std::lock_guard<std::mutex> locker(Lock);
    sequence = NewestSequence;
    return HasNewest;
}

bool StreamReceiver::GetPendingSequence(uint32_t& sequence) const
{
    std::lock_guard<std::mutex> locker(Lock);
    if (!PendingDeltas.empty()) {
        sequence = PendingDeltas.back()->Sequence;
        return true;
    }
    if (PendingKey) {
        sequence = PendingKey->Sequence;
        return true;
    }
    return false;
}

bool StreamReceiver::GetPresentedSequence(uint32_t& sequence) const
{
    std::lock_guard<std::mutex> locker(Lock);
    sequence = PresentedSequence;
    return HasPresented;
}


} // namespace lanmeet
