// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

/*
    Media collaborators

    Screen capture, video codecs, rendering and the remote-control, chat and
    file-transfer handlers live outside this library.  The session layer only
    talks to them through these interfaces.
*/

#pragma once

#include <MeshProtocol.hpp> // mesh_protocol
#include <PeerLink.hpp> // mesh_transport

#include <memory>
#include <string>
#include <vector>

namespace lanmeet {


//------------------------------------------------------------------------------
// Frames

struct RawFrame
{
    uint32_t Width = 0;
    uint32_t Height = 0;

    // Packed RGBA
    std::vector<uint8_t> Pixels;

    uint64_t TimestampUsec = 0;
};

struct EncodedFrame
{
    bool IsKeyframe = false;
    std::vector<uint8_t> Data;

    // Stamped by the sharing session, strictly increasing per stream
    uint32_t Sequence = 0;

    uint64_t TimestampUsec = 0;
};

enum class PixelFormat
{
    RGBA,
    NV12
};

struct DecodedFrame
{
    uint32_t Width = 0;
    uint32_t Height = 0;
    PixelFormat Format = PixelFormat::RGBA;
    std::vector<uint8_t> Pixels;

    uint32_t Sequence = 0;
    uint64_t TimestampUsec = 0;
};


//------------------------------------------------------------------------------
// Collaborators

class CaptureSource
{
public:
    virtual ~CaptureSource() = default;

    /// Displays that can be shared
    virtual std::vector<protos::DisplayInfo> GetDisplays() = 0;

    /// Returns false if no frame could be captured
    virtual bool NextFrame(uint32_t display_id, RawFrame& frame) = 0;
};

class VideoEncoder
{
public:
    virtual ~VideoEncoder() = default;

    /// Fills IsKeyframe and Data.  Returns false on failure
    virtual bool Encode(const RawFrame& raw, EncodedFrame& encoded) = 0;

    /// Next Encode() produces a keyframe
    virtual void ForceKeyframe() = 0;
};

class VideoDecoder
{
public:
    virtual ~VideoDecoder() = default;

    /// Returns false if the frame could not be decoded
    virtual bool Decode(const EncodedFrame& encoded, DecodedFrame& decoded) = 0;
};

class FrameRenderer
{
public:
    virtual ~FrameRenderer() = default;

    virtual void Present(const DecodedFrame& frame) = 0;
};

struct EncoderParams
{
    uint32_t DisplayId = 0;
    uint32_t Width = 0;
    uint32_t Height = 0;
    unsigned Fps = protos::kDefaultFps;
    unsigned BitrateBPS = 0;
};

/// Creates per-stream codec and render contexts
class MediaFactory
{
public:
    virtual ~MediaFactory() = default;

    /// Codec name announced in ScreenStart
    virtual std::string GetCodecName() const = 0;

    /// Returns nullptr on failure
    virtual std::shared_ptr<VideoEncoder> CreateEncoder(const EncoderParams& params) = 0;
    virtual std::shared_ptr<VideoDecoder> CreateDecoder(const protos::MessageScreenStart& start) = 0;
    virtual std::shared_ptr<FrameRenderer> CreateRenderer(
        const PeerIdentity& sharer,
        const protos::MessageScreenStart& start) = 0;
};

/// Remote control, input, chat and file transfer messages
class CollaboratorHandler
{
public:
    virtual ~CollaboratorHandler() = default;

    virtual void OnCollaboratorMessage(const PeerIdentity& peer, const protos::Message& msg) = 0;
};


} // namespace lanmeet
