// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "WireCodec.hpp"

#include <core_logging.hpp>
#include <core_serializer.hpp>

using namespace lanmeet;
using namespace protos;

#define CHECK(cond) \
    if (!(cond)) { \
        spdlog::error("Check failed: {} ({}:{})", #cond, __FILE__, __LINE__); \
        return false; \
    }


//------------------------------------------------------------------------------
// Sample messages

static std::vector<Message> MakeSampleMessages()
{
    std::vector<Message> messages;

    MessageHandshake handshake;
    handshake.PeerId = "a1b2c3d4e5f60718";
    handshake.Name = "Alice";
    handshake.AppVersion = "0.1.0";
    handshake.Capabilities = Capability_ScreenShare | Capability_Chat;
    for (unsigned i = 0; i < kPublicKeyBytes; ++i) {
        handshake.PublicKey[i] = static_cast<uint8_t>( i * 7 );
    }
    messages.push_back(handshake);

    MessageHandshakeAck ack;
    ack.PeerId = "ffee";
    ack.Name = "Bob";
    ack.Accepted = false;
    ack.Reason = "Version mismatch";
    messages.push_back(ack);

    MessageDisconnect disconnect;
    disconnect.Reason = DisconnectReason_HeartbeatTimeout;
    messages.push_back(disconnect);

    MessageHeartbeat heartbeat;
    heartbeat.Sequence = 0xfffffffe;
    heartbeat.TimestampUsec = 0x0102030405060708ULL;
    messages.push_back(heartbeat);

    MessageHeartbeatAck heartbeat_ack;
    heartbeat_ack.Sequence = 12;
    heartbeat_ack.EchoTimestampUsec = 99;
    messages.push_back(heartbeat_ack);

    MessageScreenOffer offer;
    messages.push_back(offer); // Empty list means "not sharing"
    DisplayInfo display;
    display.DisplayId = 1;
    display.Name = "Built-in Display";
    display.Width = 1920;
    display.Height = 1080;
    display.Primary = true;
    offer.Displays.push_back(display);
    display.DisplayId = 2;
    display.Name = "";
    display.Primary = false;
    offer.Displays.push_back(display);
    messages.push_back(offer);

    MessageScreenRequest request;
    request.DisplayId = 1;
    request.PreferredFps = 60;
    request.PreferredQuality = StreamQuality_High;
    messages.push_back(request);

    MessageScreenStart start;
    start.DisplayId = 1;
    start.Width = 1920;
    start.Height = 1080;
    start.Fps = 30;
    start.Codec = "h264";
    messages.push_back(start);

    MessageScreenFrame frame;
    frame.DisplayId = 1;
    frame.TimestampUsec = 123456789;
    frame.FrameKind = FrameKind_Key;
    frame.Sequence = 0;
    messages.push_back(frame); // Empty payload
    frame.FrameKind = FrameKind_Delta;
    frame.Sequence = 1;
    frame.Data.assign(100000, 0x5a);
    messages.push_back(frame);

    MessageScreenStop stop;
    stop.DisplayId = 7;
    stop.Origin = StopOrigin_Viewer;
    messages.push_back(stop);

    MessageRequestKeyframe keyframe_request;
    keyframe_request.DisplayId = 1;
    keyframe_request.LastSequence = 41;
    messages.push_back(keyframe_request);

    MessageControlRequest control_request;
    control_request.FromUser = "Bob";
    messages.push_back(control_request);

    MessageControlGrant grant;
    grant.ToUser = "Bob";
    messages.push_back(grant);

    messages.push_back(MessageControlRevoke());

    MessageInputEvent input;
    input.EventType = InputEventType_MouseScroll;
    input.X = 0.25f;
    input.Y = 0.75f;
    input.Button = MouseButton_Middle;
    input.ScrollX = -1.5f;
    input.ScrollY = 3.f;
    input.KeyCode = 0x41;
    input.Modifiers = Modifier_Shift | Modifier_Meta;
    messages.push_back(input);

    MessageChat chat;
    chat.From = "Alice";
    chat.Content = ""; // Codec accepts empty content
    chat.TimestampMsec = 1570000000000ULL;
    messages.push_back(chat);

    MessageFileOffer file_offer;
    file_offer.FileId = "f1";
    file_offer.Name = "notes.txt";
    file_offer.Size = 5ULL * 1024 * 1024 * 1024;
    file_offer.Checksum = "abcdef";
    messages.push_back(file_offer);

    MessageFileAccept file_accept;
    file_accept.FileId = "f1";
    messages.push_back(file_accept);

    MessageFileReject file_reject;
    file_reject.FileId = "f2";
    messages.push_back(file_reject);

    MessageFileChunk chunk;
    chunk.FileId = "f1";
    chunk.Offset = kFileChunkBytes;
    chunk.Data.resize(kFileChunkBytes);
    for (size_t i = 0; i < chunk.Data.size(); ++i) {
        chunk.Data[i] = static_cast<uint8_t>( i * 31 + (i >> 8) );
    }
    messages.push_back(chunk);

    MessageFileComplete file_complete;
    file_complete.FileId = "f1";
    messages.push_back(file_complete);

    MessageFileCancel file_cancel;
    messages.push_back(file_cancel);

    return messages;
}


//------------------------------------------------------------------------------
// Tests

static bool TestRoundTrip()
{
    spdlog::info("Round trip test");

    const std::vector<Message> messages = MakeSampleMessages();

    bool seen[256] = {};

    for (const Message& msg : messages)
    {
        const uint8_t type = static_cast<uint8_t>( GetMessageType(msg) );
        seen[type] = true;

        std::vector<uint8_t> frame;
        CHECK(EncodeMessage(msg, frame));
        CHECK(frame.size() >= static_cast<size_t>(kHeaderBytes));
        CHECK(frame[0] == kMagic0 && frame[1] == kMagic1);
        CHECK(frame[2] == kProtocolVersion);
        CHECK(frame[3] == type);
        CHECK(ReadU32_BE(&frame[4]) == frame.size() - kHeaderBytes);

        Message decoded;
        int frame_bytes = 0;
        const DecodeResult result = DecodeMessage(frame.data(), static_cast<int>(frame.size()), decoded, frame_bytes);
        if (result != DecodeResult::Success) {
            spdlog::error("Decode failed for {}: {}", MessageTypeToString(type), DecodeResultToString(result));
            return false;
        }
        CHECK(frame_bytes == static_cast<int>(frame.size()));
        CHECK(decoded == msg);
    }

    // Every message type is covered
    for (int type = 0; type < 256; ++type) {
        if (IsKnownMessageType(static_cast<uint8_t>(type)) && !seen[type]) {
            spdlog::error("Message type {} not covered", MessageTypeToString(static_cast<uint8_t>(type)));
            return false;
        }
    }

    return true;
}

static bool TestEncodeLimits()
{
    spdlog::info("Encode limits test");

    std::vector<uint8_t> frame{ 0x99 };

    MessageChat chat;
    chat.Content.assign(0x10000, 'x');
    CHECK(!EncodeMessage(chat, frame));
    CHECK(frame.size() == 1 && frame[0] == 0x99);

    chat.Content.resize(0xffff);
    CHECK(EncodeMessage(chat, frame));
    CHECK(frame[0] == 0x99 && frame[1] == kMagic0);

    MessageScreenFrame big;
    big.Data.resize(kMaxPayloadBytes);
    frame.clear();
    CHECK(!EncodeMessage(big, frame));
    CHECK(frame.empty());

    return true;
}

static bool TestCorruptFrames()
{
    spdlog::info("Corrupt frame test");

    MessageScreenStop stop;
    stop.DisplayId = 3;
    std::vector<uint8_t> good;
    CHECK(EncodeMessage(stop, good));

    Message msg;
    int frame_bytes = 0;

    // Incomplete frames need more data
    for (size_t i = 0; i < good.size(); ++i) {
        CHECK(DecodeMessage(good.data(), static_cast<int>(i), msg, frame_bytes) == DecodeResult::NeedMoreData);
    }

    std::vector<uint8_t> bad = good;
    bad[0] = 'X';
    CHECK(DecodeMessage(bad.data(), 1, msg, frame_bytes) == DecodeResult::CorruptFrame);

    bad = good;
    bad[1] = 'X';
    CHECK(DecodeMessage(bad.data(), static_cast<int>(bad.size()), msg, frame_bytes) == DecodeResult::CorruptFrame);

    bad = good;
    bad[2] = kProtocolVersion + 1;
    CHECK(DecodeMessage(bad.data(), 3, msg, frame_bytes) == DecodeResult::NeedMoreData);
    CHECK(DecodeMessage(bad.data(), 4, msg, frame_bytes) == DecodeResult::CorruptFrame);

    // Handshakes from another version still decode
    MessageHandshake future_handshake;
    future_handshake.PeerId = "aaaa0001";
    future_handshake.ProtocolVersion = kProtocolVersion + 1;
    bad.clear();
    CHECK(EncodeMessage(future_handshake, bad));
    bad[2] = kProtocolVersion + 1;
    CHECK(DecodeMessage(bad.data(), static_cast<int>(bad.size()), msg, frame_bytes) == DecodeResult::Success);
    CHECK(std::get<MessageHandshake>(msg).ProtocolVersion == kProtocolVersion + 1);

    MessageHandshakeAck future_ack;
    future_ack.Reason = "Protocol version mismatch";
    bad.clear();
    CHECK(EncodeMessage(future_ack, bad));
    bad[2] = kProtocolVersion + 1;
    CHECK(DecodeMessage(bad.data(), static_cast<int>(bad.size()), msg, frame_bytes) == DecodeResult::Success);
    CHECK(!std::get<MessageHandshakeAck>(msg).Accepted);

    bad = good;
    bad[3] = 0x7f; // Unknown type
    CHECK(DecodeMessage(bad.data(), static_cast<int>(bad.size()), msg, frame_bytes) == DecodeResult::CorruptFrame);

    bad = good;
    WriteU32_BE(&bad[4], kMaxPayloadBytes + 1);
    CHECK(DecodeMessage(bad.data(), kHeaderBytes, msg, frame_bytes) == DecodeResult::CorruptFrame);

    // Trailing payload bytes
    bad = good;
    bad.push_back(0);
    WriteU32_BE(&bad[4], static_cast<uint32_t>(bad.size() - kHeaderBytes));
    CHECK(DecodeMessage(bad.data(), static_cast<int>(bad.size()), msg, frame_bytes) == DecodeResult::CorruptFrame);

    // Truncated payload with a consistent length field
    bad = good;
    bad.pop_back();
    WriteU32_BE(&bad[4], static_cast<uint32_t>(bad.size() - kHeaderBytes));
    CHECK(DecodeMessage(bad.data(), static_cast<int>(bad.size()), msg, frame_bytes) == DecodeResult::CorruptFrame);

    // Invalid frame kind
    MessageScreenFrame frame;
    frame.FrameKind = FrameKind_Delta;
    bad.clear();
    CHECK(EncodeMessage(frame, bad));
    bad[kHeaderBytes + 4 + 8] = 2;
    CHECK(DecodeMessage(bad.data(), static_cast<int>(bad.size()), msg, frame_bytes) == DecodeResult::CorruptFrame);

    // Invalid boolean
    MessageScreenOffer offer;
    offer.Displays.resize(1);
    bad.clear();
    CHECK(EncodeMessage(offer, bad));
    bad.back() = 2;
    CHECK(DecodeMessage(bad.data(), static_cast<int>(bad.size()), msg, frame_bytes) == DecodeResult::CorruptFrame);

    return true;
}

static bool TestStreamDecoder()
{
    spdlog::info("Stream decoder test");

    const std::vector<Message> messages = MakeSampleMessages();

    std::vector<uint8_t> stream;
    for (const Message& msg : messages) {
        CHECK(EncodeMessage(msg, stream));
    }

    // Feed the stream in uneven slices
    StreamDecoder decoder;
    std::vector<Message> decoded;
    size_t offset = 0;
    int slice = 1;
    while (offset < stream.size())
    {
        int bytes = slice;
        if (offset + bytes > stream.size()) {
            bytes = static_cast<int>(stream.size() - offset);
        }
        decoder.Feed(stream.data() + offset, bytes);
        offset += bytes;
        slice = (slice * 3 + 1) % 20011;

        Message msg;
        DecodeResult result;
        while ((result = decoder.Next(msg)) == DecodeResult::Success) {
            decoded.push_back(msg);
        }
        CHECK(result == DecodeResult::NeedMoreData);
    }

    CHECK(decoded.size() == messages.size());
    for (size_t i = 0; i < messages.size(); ++i) {
        CHECK(decoded[i] == messages[i]);
    }
    CHECK(decoder.GetBufferedBytes() == 0);

    // Byte-at-a-time
    decoder.Reset();
    MessageHeartbeat heartbeat;
    heartbeat.Sequence = 5;
    std::vector<uint8_t> frame;
    CHECK(EncodeMessage(heartbeat, frame));
    Message msg;
    for (size_t i = 0; i + 1 < frame.size(); ++i) {
        decoder.Feed(&frame[i], 1);
        CHECK(decoder.Next(msg) == DecodeResult::NeedMoreData);
    }
    decoder.Feed(&frame.back(), 1);
    CHECK(decoder.Next(msg) == DecodeResult::Success);
    CHECK(std::get<MessageHeartbeat>(msg) == heartbeat);

    // Garbage corrupts the stream permanently
    const uint8_t garbage[3] = { 'G', 'E', 'T' };
    decoder.Feed(garbage, sizeof(garbage));
    CHECK(decoder.Next(msg) == DecodeResult::CorruptFrame);
    CHECK(decoder.IsCorrupt());
    decoder.Feed(frame.data(), static_cast<int>(frame.size()));
    CHECK(decoder.Next(msg) == DecodeResult::CorruptFrame);

    decoder.Reset();
    decoder.Feed(frame.data(), static_cast<int>(frame.size()));
    CHECK(decoder.Next(msg) == DecodeResult::Success);

    return true;
}

static bool TestSanitize()
{
    spdlog::info("Sanitize test");

    CHECK(SanitizeString("Alice\n\x01", 64) == "Alice");
    CHECK(SanitizeString("abcdef", 3) == "abc");
    CHECK(QualityToBitrate(StreamQuality_Low) < QualityToBitrate(StreamQuality_Medium));
    CHECK(QualityToBitrate(StreamQuality_Medium) < QualityToBitrate(StreamQuality_High));
    return true;
}


//------------------------------------------------------------------------------
// Entrypoint

int main(int argc, char* argv[])
{
    LANMEET_UNUSED2(argc, argv);

    SetupAsyncDiskLog("protocol_test.txt");

    if (!TestRoundTrip() ||
        !TestEncodeLimits() ||
        !TestCorruptFrames() ||
        !TestStreamDecoder() ||
        !TestSanitize())
    {
        spdlog::error("Protocol tests FAILED");
        return LANMEET_APP_FAILURE;
    }

    spdlog::info("Protocol tests passed");
    return LANMEET_APP_SUCCESS;
}
