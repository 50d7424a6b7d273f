// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

/*
    Synthetic media for the headless peer

    Stands in for real screen capture and hardware codecs so the mesh can be
    exercised on any machine:

    + SyntheticCapture renders a scrolling test pattern per display.
    + RunLengthEncoder/Decoder compress 32-bit pixels as runs.  Keyframes
      code the frame itself, delta frames code the XOR against the previous
      frame, which is mostly zero for screen content.
    + LoggingRenderer reports the presented frame rate.
*/

#pragma once

#include <MediaInterfaces.hpp> // mesh_session

#include <atomic>
#include <map>
#include <mutex>

namespace lanmeet {


//------------------------------------------------------------------------------
// Constants

#define LANMEET_SYNTHETIC_CODEC "rle32"

static const uint32_t kSyntheticWidth = 320;
static const uint32_t kSyntheticHeight = 180;

// Longest run in one RLE entry
static const unsigned kMaxRunLength = 255;

// Bytes per RLE entry: Count(1) | Pixel(4)
static const unsigned kRunBytes = 5;

// Periodic keyframe so late joiners recover even without requests
static const unsigned kKeyframeIntervalFrames = 300;


//------------------------------------------------------------------------------
// Run-length Pixel Coding

/// Append runs of identical 32-bit pixels to `output`
void EncodePixelRuns(const std::vector<uint32_t>& pixels, std::vector<uint8_t>& output);

/// Returns false if the data is malformed or does not expand to `pixel_count`
bool DecodePixelRuns(const uint8_t* data, size_t bytes, size_t pixel_count, std::vector<uint32_t>& pixels);


//------------------------------------------------------------------------------
// SyntheticCapture

class SyntheticCapture : public CaptureSource
{
public:
    std::vector<protos::DisplayInfo> GetDisplays() override;
    bool NextFrame(uint32_t display_id, RawFrame& frame) override;

protected:
    std::mutex Lock;
    std::map<uint32_t, uint32_t> FrameCounters;
};


//------------------------------------------------------------------------------
// RunLengthEncoder

class RunLengthEncoder : public VideoEncoder
{
public:
    explicit RunLengthEncoder(const EncoderParams& params);

    bool Encode(const RawFrame& raw, EncodedFrame& encoded) override;
    void ForceKeyframe() override;

protected:
    EncoderParams Params;
    std::vector<uint32_t> Reference;
    std::atomic<bool> NextKeyframe = ATOMIC_VAR_INIT(true);
    unsigned FramesSinceKeyframe = 0;
};


//------------------------------------------------------------------------------
// RunLengthDecoder

class RunLengthDecoder : public VideoDecoder
{
public:
    RunLengthDecoder(uint32_t width, uint32_t height);

    bool Decode(const EncodedFrame& encoded, DecodedFrame& decoded) override;

protected:
    uint32_t Width = 0, Height = 0;
    std::vector<uint32_t> Reference;
    bool HasReference = false;
};


//------------------------------------------------------------------------------
// LoggingRenderer

class LoggingRenderer : public FrameRenderer
{
public:
    LoggingRenderer(const PeerIdentity& sharer, uint32_t display_id);

    void Present(const DecodedFrame& frame) override;

protected:
    std::string LogName;
    uint64_t WindowStartUsec = 0;
    unsigned WindowFrames = 0;
    uint64_t TotalFrames = 0;
};


//------------------------------------------------------------------------------
// SyntheticMediaFactory

class SyntheticMediaFactory : public MediaFactory
{
public:
    std::string GetCodecName() const override
    {
        return LANMEET_SYNTHETIC_CODEC;
    }
    std::shared_ptr<VideoEncoder> CreateEncoder(const EncoderParams& params) override;
    std::shared_ptr<VideoDecoder> CreateDecoder(const protos::MessageScreenStart& start) override;
    std::shared_ptr<FrameRenderer> CreateRenderer(
        const PeerIdentity& sharer,
        const protos::MessageScreenStart& start) override;
};


//------------------------------------------------------------------------------
// LoggingCollaborators

/// Logs remote control, chat and file transfer traffic
class LoggingCollaborators : public CollaboratorHandler
{
public:
    void OnCollaboratorMessage(const PeerIdentity& peer, const protos::Message& msg) override;
};


} // namespace lanmeet
