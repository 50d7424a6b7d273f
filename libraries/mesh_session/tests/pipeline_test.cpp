// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "FrameScheduler.hpp"
#include "StreamReceiver.hpp"
#include "SharingStatusCache.hpp"

#include <core_logging.hpp>

#include <algorithm>
#include <random>

using namespace lanmeet;

#define CHECK(cond) \
    if (!(cond)) { \
        spdlog::error("Check failed: {} ({}:{})", #cond, __FILE__, __LINE__); \
        return false; \
    }


//------------------------------------------------------------------------------
// Fixtures

class FakeLink : public PeerLink
{
public:
    PeerIdentity GetIdentity() const override
    {
        PeerIdentity identity;
        identity.PeerId = "cccc0003";
        identity.Name = "Viewer";
        return identity;
    }
    bool IsOpen() const override
    {
        return true;
    }
    SendResult SendReliable(const protos::Message& msg) override
    {
        LANMEET_UNUSED(msg);
        ++ReliableCount;
        return Result;
    }
    SendResult SendUnreliable(const protos::Message& msg, SendPriority priority) override
    {
        LANMEET_UNUSED(msg);
        LANMEET_UNUSED(priority);
        ++UnreliableCount;
        return Result;
    }
    void CloseLink(CloseReason reason) override
    {
        LANMEET_UNUSED(reason);
    }
    LinkStats GetStats() const override
    {
        LinkStats stats;
        stats.QueueDelayUsec = QueueDelayUsec;
        stats.RttSpike = RttSpike;
        return stats;
    }

    SendResult Result = SendResult::Sent;
    uint64_t QueueDelayUsec = 0;
    bool RttSpike = false;
    unsigned ReliableCount = 0;
    unsigned UnreliableCount = 0;
};

class RecordingSchedulerSink : public SchedulerSink
{
public:
    void OnFrameOutcome(
        const std::string& viewer_id,
        uint32_t display_id,
        const protos::MessageScreenFrame& frame,
        FrameOutcome outcome) override
    {
        LANMEET_UNUSED2(viewer_id, display_id);
        LANMEET_UNUSED(frame);
        Outcomes.push_back(outcome);
    }
    void OnKeyframeRetry(const std::string& viewer_id, uint32_t display_id, unsigned attempt) override
    {
        LANMEET_UNUSED2(viewer_id, display_id);
        LastAttempt = attempt;
        ++Retries;
    }
    void OnStreamFault(const std::string& viewer_id, uint32_t display_id) override
    {
        LANMEET_UNUSED(display_id);
        FaultedViewers.push_back(viewer_id);
    }

    std::vector<FrameOutcome> Outcomes;
    unsigned Retries = 0;
    unsigned LastAttempt = 0;
    std::vector<std::string> FaultedViewers;
};

class TestDecoder : public VideoDecoder
{
public:
    bool Decode(const EncodedFrame& encoded, DecodedFrame& decoded) override
    {
        if (FailDeltas && !encoded.IsKeyframe) {
            return false;
        }
        decoded.Width = 64;
        decoded.Height = 32;
        decoded.Pixels = encoded.Data;
        return true;
    }

    bool FailDeltas = false;
};

// Deltas carry the XOR against the previous picture
class XorDecoder : public VideoDecoder
{
public:
    bool Decode(const EncodedFrame& encoded, DecodedFrame& decoded) override
    {
        if (encoded.IsKeyframe) {
            Reference = encoded.Data;
        } else {
            if (Reference.size() != encoded.Data.size()) {
                return false;
            }
            for (size_t i = 0; i < Reference.size(); ++i) {
                Reference[i] ^= encoded.Data[i];
            }
        }
        Sequences.push_back(encoded.Sequence);
        decoded.Width = 64;
        decoded.Height = 32;
        decoded.Pixels = Reference;
        return true;
    }

    std::vector<uint8_t> Reference;
    std::vector<uint32_t> Sequences;
};

class TestRenderer : public FrameRenderer
{
public:
    void Present(const DecodedFrame& frame) override
    {
        Presented.push_back(frame.Sequence);
        LastPixels = frame.Pixels;
    }

    std::vector<uint32_t> Presented;
    std::vector<uint8_t> LastPixels;
};

struct KeyframeRequests
{
    unsigned Count = 0;
    uint32_t LastSequence = 0;
};

static protos::MessageScreenFrame MakeFrame(uint32_t sequence, bool keyframe)
{
    protos::MessageScreenFrame frame;
    frame.DisplayId = 1;
    frame.Sequence = sequence;
    frame.FrameKind = keyframe ? protos::FrameKind_Key : protos::FrameKind_Delta;
    frame.TimestampUsec = 1000 + sequence;
    frame.Data.assign(16, static_cast<uint8_t>( sequence ));
    return frame;
}

// Picture `sequence` is 16 bytes of value `sequence`
static protos::MessageScreenFrame MakeXorDelta(uint32_t sequence)
{
    protos::MessageScreenFrame frame = MakeFrame(sequence, false);
    frame.Data.assign(16, static_cast<uint8_t>( sequence ^ (sequence - 1) ));
    return frame;
}

static protos::MessageScreenStart MakeStart()
{
    protos::MessageScreenStart start;
    start.DisplayId = 1;
    start.Width = 64;
    start.Height = 32;
    start.Fps = 30;
    start.Codec = "test";
    return start;
}

static void InitializeReceiver(
    StreamReceiver& receiver,
    std::shared_ptr<VideoDecoder> decoder,
    std::shared_ptr<TestRenderer> renderer,
    KeyframeRequests& requests)
{
    receiver.Initialize("Sharer", MakeStart(), decoder, renderer,
        [&requests](uint32_t display_id, uint32_t last_sequence)
    {
        LANMEET_UNUSED(display_id);
        ++requests.Count;
        requests.LastSequence = last_sequence;
    });
}


//------------------------------------------------------------------------------
// FrameScheduler

static bool TestSchedulerDeltaDeadline()
{
    spdlog::info("Scheduler delta deadline test");

    FakeLink link;
    RecordingSchedulerSink sink;
    FrameScheduler scheduler;
    scheduler.Initialize(SchedulerSettings(), &sink);

    const uint64_t now_usec = 1000 * 1000;
    const protos::MessageScreenFrame frame = MakeFrame(5, false);

    EncodedFrame encoded;
    encoded.IsKeyframe = false;
    FramePriorityClass priority = scheduler.Classify(encoded, now_usec);
    CHECK(std::holds_alternative<DeltaFramePriority>(priority));
    CHECK(std::get<DeltaFramePriority>(priority).DeadlineUsec == now_usec + 16000);

    encoded.IsKeyframe = true;
    FramePriorityClass key_priority = scheduler.Classify(encoded, now_usec);
    CHECK(std::holds_alternative<KeyFramePriority>(key_priority));
    CHECK(std::get<KeyFramePriority>(key_priority).RetryBudget == 3);

    // Deadline at or before now: Dropped without touching the link
    DeltaFramePriority expired;
    expired.DeadlineUsec = now_usec;
    CHECK(scheduler.Submit(&link, "v1", frame, expired, now_usec) == FrameOutcome::Dropped);
    CHECK(link.UnreliableCount == 0);

    // One microsecond before the deadline is still sendable
    CHECK(scheduler.Submit(&link, "v1", frame, priority, now_usec + 15999) == FrameOutcome::Sent);
    CHECK(scheduler.Submit(&link, "v1", frame, priority, now_usec + 16000) == FrameOutcome::Dropped);
    CHECK(link.UnreliableCount == 1);

    // Queue delay beyond the time left: Dropped instead of queued
    link.QueueDelayUsec = 20000;
    CHECK(scheduler.Submit(&link, "v1", frame, priority, now_usec) == FrameOutcome::Dropped);
    CHECK(link.UnreliableCount == 1);

    // Queue delay equal to the time left still fits
    link.QueueDelayUsec = 16000;
    CHECK(scheduler.Submit(&link, "v1", frame, priority, now_usec) == FrameOutcome::Sent);
    CHECK(link.UnreliableCount == 2);

    // Send failure counts as a drop
    link.QueueDelayUsec = 0;
    link.Result = SendResult::Dropped;
    CHECK(scheduler.Submit(&link, "v1", frame, priority, now_usec) == FrameOutcome::Dropped);

    // No link at all
    CHECK(scheduler.Submit(nullptr, "v2", frame, priority, now_usec) == FrameOutcome::Dropped);

    const SchedulerStats stats = scheduler.GetStats();
    CHECK(stats.DeltasSent == 2);
    CHECK(stats.DeltasDropped == 5);
    CHECK(stats.KeyframeRetries == 0);
    CHECK(stats.StreamFaults == 0);
    CHECK(sink.Outcomes.size() == 7);
    CHECK(sink.Retries == 0);
    CHECK(sink.FaultedViewers.empty());
    return true;
}

static bool TestSchedulerKeyframeRetry()
{
    spdlog::info("Scheduler keyframe retry test");

    FakeLink slow_link, good_link;
    RecordingSchedulerSink sink;
    FrameScheduler scheduler;
    scheduler.Initialize(SchedulerSettings(), &sink);

    const uint64_t now_usec = 5 * 1000 * 1000;
    const protos::MessageScreenFrame key = MakeFrame(0, true);
    KeyFramePriority priority;
    priority.RetryBudget = 3;

    // Backed up beyond the keyframe timeout
    slow_link.QueueDelayUsec = 250 * 1000;

    CHECK(scheduler.Submit(&slow_link, "slow", key, priority, now_usec) == FrameOutcome::Retried);
    CHECK(sink.LastAttempt == 1);
    CHECK(scheduler.Submit(&good_link, "good", key, priority, now_usec) == FrameOutcome::Sent);

    CHECK(scheduler.Submit(&slow_link, "slow", key, priority, now_usec) == FrameOutcome::Retried);
    CHECK(sink.LastAttempt == 2);
    CHECK(scheduler.Submit(&good_link, "good", key, priority, now_usec) == FrameOutcome::Sent);

    // Budget exhausted: Exactly one fault for the stream
    CHECK(scheduler.Submit(&slow_link, "slow", key, priority, now_usec) == FrameOutcome::Faulted);
    CHECK(sink.FaultedViewers.size() == 1);
    CHECK(sink.FaultedViewers[0] == "slow");
    CHECK(scheduler.Submit(&slow_link, "slow", key, priority, now_usec) == FrameOutcome::Dropped);
    CHECK(scheduler.Submit(&slow_link, "slow", key, priority, now_usec) == FrameOutcome::Dropped);
    CHECK(sink.FaultedViewers.size() == 1);
    CHECK(sink.Retries == 2);

    // Healthy viewer never affected
    CHECK(scheduler.Submit(&good_link, "good", key, priority, now_usec) == FrameOutcome::Sent);

    // A keyframe getting through re-arms the budget
    slow_link.QueueDelayUsec = 0;
    CHECK(scheduler.Submit(&slow_link, "slow", key, priority, now_usec) == FrameOutcome::Sent);
    slow_link.RttSpike = true;
    CHECK(scheduler.Submit(&slow_link, "slow", key, priority, now_usec) == FrameOutcome::Retried);
    CHECK(sink.LastAttempt == 1);

    // Viewer re-attaching starts over
    slow_link.RttSpike = false;
    slow_link.Result = SendResult::ConnectionClosed;
    CHECK(scheduler.Submit(&slow_link, "slow", key, priority, now_usec) == FrameOutcome::Retried);
    CHECK(sink.LastAttempt == 2);
    scheduler.ResetViewer("slow", key.DisplayId);
    CHECK(scheduler.Submit(&slow_link, "slow", key, priority, now_usec) == FrameOutcome::Retried);
    CHECK(sink.LastAttempt == 1);

    const SchedulerStats stats = scheduler.GetStats();
    CHECK(stats.StreamFaults == 1);
    CHECK(stats.KeyframeRetries == 5);
    CHECK(stats.KeyframesSent == 4);
    return true;
}


//------------------------------------------------------------------------------
// StreamReceiver

static bool TestReceiverKeyframePreserved()
{
    spdlog::info("Receiver keyframe preservation test");

    auto decoder = std::make_shared<TestDecoder>();
    auto renderer = std::make_shared<TestRenderer>();
    KeyframeRequests requests;
    StreamReceiver receiver;
    InitializeReceiver(receiver, decoder, renderer, requests);

    const uint64_t now_usec = 1000 * 1000;
    CHECK(receiver.OnFrame(MakeFrame(0, true), now_usec) == ReceiveResult::Accepted);
    CHECK(receiver.OnFrame(MakeFrame(1, false), now_usec) == ReceiveResult::Accepted);
    CHECK(receiver.OnFrame(MakeFrame(2, false), now_usec) == ReceiveResult::Accepted);
    CHECK(receiver.OnFrame(MakeFrame(3, false), now_usec) == ReceiveResult::Accepted);

    uint32_t pending = 0;
    CHECK(receiver.GetPendingSequence(pending));
    CHECK(pending == 3);

    // Keyframe and every delta decode, only the newest is shown
    CHECK(receiver.DecodeNext());
    CHECK(!receiver.DecodeNext());
    CHECK(renderer->Presented.size() == 1);
    CHECK(renderer->Presented[0] == 3);

    // Newer keyframe replaces an undecoded one
    CHECK(receiver.OnFrame(MakeFrame(10, true), now_usec) == ReceiveResult::Accepted);
    CHECK(receiver.OnFrame(MakeFrame(11, true), now_usec) == ReceiveResult::Accepted);
    CHECK(receiver.DecodeNext());
    CHECK(!receiver.DecodeNext());
    CHECK(renderer->Presented.back() == 11);

    const ReceiverStats stats = receiver.GetStats();
    CHECK(stats.Replaced == 3);
    CHECK(stats.Decoded == 5);
    CHECK(stats.Presented == 2);
    CHECK(requests.Count == 0);
    return true;
}

static bool TestReceiverDeltaChain()
{
    spdlog::info("Receiver delta chain test");

    auto decoder = std::make_shared<XorDecoder>();
    auto renderer = std::make_shared<TestRenderer>();
    KeyframeRequests requests;
    StreamReceiver receiver;
    InitializeReceiver(receiver, decoder, renderer, requests);

    const uint64_t now_usec = 1000 * 1000;
    CHECK(receiver.OnFrame(MakeFrame(0, true), now_usec) == ReceiveResult::Accepted);
    CHECK(receiver.DecodeNext());
    CHECK(renderer->LastPixels == std::vector<uint8_t>(16, 0));

    // Two deltas arrive while the decoder is busy
    CHECK(receiver.OnFrame(MakeXorDelta(1), now_usec) == ReceiveResult::Accepted);
    CHECK(receiver.OnFrame(MakeXorDelta(2), now_usec) == ReceiveResult::Accepted);
    CHECK(receiver.DecodeNext());
    CHECK(!receiver.DecodeNext());

    CHECK(decoder->Sequences.size() == 3);
    CHECK(decoder->Sequences[1] == 1);
    CHECK(decoder->Sequences[2] == 2);
    CHECK(renderer->Presented.size() == 2);
    CHECK(renderer->Presented.back() == 2);
    CHECK(renderer->LastPixels == std::vector<uint8_t>(16, 2));

    ReceiverStats stats = receiver.GetStats();
    CHECK(stats.Replaced == 1);
    CHECK(stats.Decoded == 3);
    CHECK(stats.Presented == 2);
    CHECK(requests.Count == 0);

    // A decoder that stops draining loses the reference instead of queueing forever
    uint32_t sequence = 3;
    for (size_t i = 0; i < kMaxPendingDeltas; ++i, ++sequence) {
        CHECK(receiver.OnFrame(MakeXorDelta(sequence), now_usec) == ReceiveResult::Accepted);
    }
    CHECK(receiver.OnFrame(MakeXorDelta(sequence), now_usec) == ReceiveResult::NeedKeyframe);
    CHECK(!receiver.IsReferenceValid());
    CHECK(requests.Count == 1);
    CHECK(requests.LastSequence == sequence);
    CHECK(!receiver.DecodeNext());

    stats = receiver.GetStats();
    CHECK(stats.DiscardedNoReference == kMaxPendingDeltas + 1);

    // Keyframe recovers
    ++sequence;
    CHECK(receiver.OnFrame(MakeFrame(sequence, true), now_usec) == ReceiveResult::Accepted);
    CHECK(receiver.OnFrame(MakeXorDelta(sequence + 1), now_usec) == ReceiveResult::Accepted);
    CHECK(receiver.DecodeNext());
    CHECK(renderer->Presented.back() == sequence + 1);
    CHECK(renderer->LastPixels == std::vector<uint8_t>(16, static_cast<uint8_t>( sequence + 1 )));
    return true;
}

static bool TestReceiverFreshness()
{
    spdlog::info("Receiver freshness test");

    auto decoder = std::make_shared<TestDecoder>();
    auto renderer = std::make_shared<TestRenderer>();
    KeyframeRequests requests;
    StreamReceiver receiver;
    InitializeReceiver(receiver, decoder, renderer, requests);

    // Keyframe every 20 frames, deltas reordered within small windows
    std::vector<uint32_t> order;
    for (uint32_t i = 0; i < 200; ++i) {
        order.push_back(i);
    }
    std::mt19937 prng(1234);
    for (size_t i = 0; i + 4 <= order.size(); i += 4) {
        if (i % 20 != 0) {
            std::shuffle(order.begin() + i, order.begin() + i + 4, prng);
        }
    }

    uint64_t now_usec = 1000 * 1000;
    bool has_newest = false;
    uint32_t last_newest = 0;
    bool has_pending = false;
    uint32_t last_pending = 0;

    for (size_t i = 0; i < order.size(); ++i)
    {
        const uint32_t sequence = order[i];
        now_usec += 16000;
        receiver.OnFrame(MakeFrame(sequence, sequence % 20 == 0), now_usec);

        uint32_t newest = 0;
        if (receiver.GetNewestSequence(newest)) {
            CHECK(!has_newest || newest >= last_newest);
            has_newest = true;
            last_newest = newest;
        }

        uint32_t pending = 0;
        if (receiver.GetPendingSequence(pending)) {
            CHECK(!has_pending || pending >= last_pending);
            has_pending = true;
            last_pending = pending;
        }

        if (i % 3 == 2) {
            while (receiver.DecodeNext()) {
            }
        }
    }
    while (receiver.DecodeNext()) {
    }

    // Presented strictly newer each time
    CHECK(!renderer->Presented.empty());
    for (size_t i = 1; i < renderer->Presented.size(); ++i) {
        CHECK(renderer->Presented[i] > renderer->Presented[i - 1]);
    }

    const ReceiverStats stats = receiver.GetStats();
    CHECK(stats.Stale > 0);
    CHECK(stats.Presented == renderer->Presented.size());
    CHECK(stats.Decoded >= stats.Presented);
    return true;
}

static bool TestReceiverGap()
{
    spdlog::info("Receiver gap and keyframe request test");

    auto decoder = std::make_shared<TestDecoder>();
    auto renderer = std::make_shared<TestRenderer>();
    KeyframeRequests requests;
    StreamReceiver receiver;
    InitializeReceiver(receiver, decoder, renderer, requests);

    const uint64_t t0 = 10 * 1000 * 1000;

    // Joining mid-stream: No reference yet
    CHECK(receiver.OnFrame(MakeFrame(5, false), t0) == ReceiveResult::NeedKeyframe);
    CHECK(requests.Count == 1);
    CHECK(requests.LastSequence == 5);

    // Rate limited
    CHECK(receiver.OnFrame(MakeFrame(6, false), t0 + 100 * 1000) == ReceiveResult::NeedKeyframe);
    CHECK(requests.Count == 1);
    CHECK(receiver.OnFrame(MakeFrame(7, false), t0 + 260 * 1000) == ReceiveResult::NeedKeyframe);
    CHECK(requests.Count == 2);
    CHECK(!receiver.DecodeNext());

    // Keyframe restores the reference
    CHECK(receiver.OnFrame(MakeFrame(8, true), t0 + 300 * 1000) == ReceiveResult::Accepted);
    CHECK(receiver.IsReferenceValid());
    CHECK(receiver.OnFrame(MakeFrame(9, false), t0 + 310 * 1000) == ReceiveResult::Accepted);
    CHECK(receiver.OnFrame(MakeFrame(9, false), t0 + 320 * 1000) == ReceiveResult::Stale);

    // Gap breaks it again
    CHECK(receiver.OnFrame(MakeFrame(11, false), t0 + 600 * 1000) == ReceiveResult::NeedKeyframe);
    CHECK(!receiver.IsReferenceValid());
    CHECK(requests.Count == 3);
    CHECK(requests.LastSequence == 11);

    // Frames before the gap still decode, nothing after it
    CHECK(receiver.DecodeNext());
    CHECK(!receiver.DecodeNext());
    CHECK(renderer->Presented.size() == 1);
    CHECK(renderer->Presented[0] == 9);
    CHECK(receiver.GetStats().Decoded == 2);

    receiver.Stop();
    CHECK(receiver.IsStopped());
    CHECK(receiver.OnFrame(MakeFrame(20, true), t0 + 700 * 1000) == ReceiveResult::Stopped);
    CHECK(!receiver.DecodeNext());
    return true;
}

static bool TestReceiverDecodeFailure()
{
    spdlog::info("Receiver decode failure test");

    auto decoder = std::make_shared<TestDecoder>();
    auto renderer = std::make_shared<TestRenderer>();
    KeyframeRequests requests;
    StreamReceiver receiver;
    InitializeReceiver(receiver, decoder, renderer, requests);

    const uint64_t t0 = GetTimeUsec();
    CHECK(receiver.OnFrame(MakeFrame(0, true), t0) == ReceiveResult::Accepted);
    CHECK(receiver.DecodeNext());

    decoder->FailDeltas = true;
    CHECK(receiver.OnFrame(MakeFrame(1, false), t0 + 1000) == ReceiveResult::Accepted);
    CHECK(receiver.DecodeNext());
    CHECK(!receiver.IsReferenceValid());
    CHECK(requests.Count == 1);
    CHECK(requests.LastSequence == 1);

    // Deltas after a failure are discarded until the next keyframe
    CHECK(receiver.OnFrame(MakeFrame(2, false), t0 + 2000) == ReceiveResult::NeedKeyframe);

    decoder->FailDeltas = false;
    CHECK(receiver.OnFrame(MakeFrame(3, true), t0 + 3000) == ReceiveResult::Accepted);
    CHECK(receiver.OnFrame(MakeFrame(4, false), t0 + 4000) == ReceiveResult::Accepted);
    CHECK(receiver.DecodeNext());
    CHECK(!receiver.DecodeNext());
    CHECK(renderer->Presented.back() == 4);

    const ReceiverStats stats = receiver.GetStats();
    CHECK(stats.DecodeFailures == 1);
    CHECK(stats.DiscardedNoReference == 1);
    return true;
}

static bool TestReceiverThread()
{
    spdlog::info("Receiver decode thread test");

    auto decoder = std::make_shared<TestDecoder>();
    auto renderer = std::make_shared<TestRenderer>();
    KeyframeRequests requests;
    auto receiver = std::make_shared<StreamReceiver>();
    InitializeReceiver(*receiver, decoder, renderer, requests);
    receiver->Start();

    CHECK(receiver->OnFrame(MakeFrame(0, true), GetTimeUsec()) == ReceiveResult::Accepted);

    uint32_t presented = 0;
    for (int i = 0; i < 200 && !receiver->GetPresentedSequence(presented); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    CHECK(receiver->GetPresentedSequence(presented));
    CHECK(presented == 0);

    const uint64_t t0 = GetTimeUsec();
    receiver->Stop();
    const uint64_t stop_usec = GetTimeUsec() - t0;
    spdlog::info("Stop took {} msec", stop_usec / 1000.f);

    // One frame interval plus scheduling slack
    CHECK(stop_usec < 500 * 1000);
    return true;
}


//------------------------------------------------------------------------------
// SharingStatusCache

static bool TestSharingStatusCache()
{
    spdlog::info("Sharing status cache test");

    SharingStatusCache cache;

    protos::DisplayInfo main_display;
    main_display.DisplayId = 1;
    main_display.Name = "Main";
    main_display.Width = 1920;
    main_display.Height = 1080;
    main_display.Primary = true;

    protos::DisplayInfo side_display;
    side_display.DisplayId = 2;
    side_display.Name = "Side";
    side_display.Width = 1280;
    side_display.Height = 1024;

    protos::MessageScreenOffer offer;
    offer.Displays.push_back(main_display);
    offer.Displays.push_back(side_display);

    CHECK(cache.ApplyOffer("aaaa", offer, 100).empty());
    CHECK(cache.IsSharing("aaaa", 1));
    CHECK(cache.IsSharing("aaaa", 2));
    CHECK(cache.GetLastUpdatedUsec("aaaa") == 100);

    offer.Displays.erase(offer.Displays.begin());
    std::vector<uint32_t> withdrawn = cache.ApplyOffer("aaaa", offer, 200);
    CHECK(withdrawn.size() == 1 && withdrawn[0] == 1);
    CHECK(!cache.IsSharing("aaaa", 1));

    protos::DisplayInfo found;
    CHECK(cache.Lookup("aaaa", 2, found));
    CHECK(found == side_display);
    CHECK(!cache.Lookup("aaaa", 1, found));

    protos::MessageScreenOffer other;
    other.Displays.push_back(main_display);
    CHECK(cache.ApplyOffer("bbbb", other, 300).empty());
    CHECK(cache.Snapshot().size() == 2);

    // Empty offer: Not sharing anything
    withdrawn = cache.ApplyOffer("aaaa", protos::MessageScreenOffer(), 400);
    CHECK(withdrawn.size() == 1 && withdrawn[0] == 2);
    CHECK(cache.GetLastUpdatedUsec("aaaa") == 0);

    withdrawn = cache.RemovePeer("bbbb");
    CHECK(withdrawn.size() == 1 && withdrawn[0] == 1);
    CHECK(cache.RemovePeer("bbbb").empty());
    CHECK(cache.Snapshot().empty());
    return true;
}


//------------------------------------------------------------------------------
// Entrypoint

int main(int argc, char* argv[])
{
    LANMEET_UNUSED2(argc, argv);

    SetupAsyncDiskLog("pipeline_test.txt");

    if (!TestSchedulerDeltaDeadline() ||
        !TestSchedulerKeyframeRetry() ||
        !TestReceiverKeyframePreserved() ||
        !TestReceiverDeltaChain() ||
        !TestReceiverFreshness() ||
        !TestReceiverGap() ||
        !TestReceiverDecodeFailure() ||
        !TestReceiverThread() ||
        !TestSharingStatusCache())
    {
        spdlog::error("Pipeline tests FAILED");
        return LANMEET_APP_FAILURE;
    }

    spdlog::info("Pipeline tests passed");
    return LANMEET_APP_SUCCESS;
}
