// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "SyntheticMedia.hpp"

#include <core_logging.hpp>

#include <cstring>

namespace lanmeet {


//------------------------------------------------------------------------------
// Run-length Pixel Coding

void EncodePixelRuns(const std::vector<uint32_t>& pixels, std::vector<uint8_t>& output)
{
    const size_t count = pixels.size();
    size_t i = 0;

    while (i < count)
    {
        const uint32_t pixel = pixels[i];
        unsigned run = 1;
        while (i + run < count && run < kMaxRunLength && pixels[i + run] == pixel) {
            ++run;
        }

        uint8_t entry[kRunBytes];
        entry[0] = static_cast<uint8_t>( run );
        std::memcpy(entry + 1, &pixel, 4);
        output.insert(output.end(), entry, entry + kRunBytes);

        i += run;
    }
}

bool DecodePixelRuns(const uint8_t* data, size_t bytes, size_t pixel_count, std::vector<uint32_t>& pixels)
{
    if (bytes % kRunBytes != 0) {
        return false;
    }

    pixels.clear();
    pixels.reserve(pixel_count);

    for (size_t offset = 0; offset < bytes; offset += kRunBytes)
    {
        const unsigned run = data[offset];
        if (run == 0 || pixels.size() + run > pixel_count) {
            return false;
        }

        uint32_t pixel;
        std::memcpy(&pixel, data + offset + 1, 4);
        pixels.insert(pixels.end(), run, pixel);
    }

    return pixels.size() == pixel_count;
}


//------------------------------------------------------------------------------
// SyntheticCapture

std::vector<protos::DisplayInfo> SyntheticCapture::GetDisplays()
{
    std::vector<protos::DisplayInfo> displays(2);

    displays[0].DisplayId = 1;
    displays[0].Name = "Synthetic Primary";
    displays[0].Width = kSyntheticWidth;
    displays[0].Height = kSyntheticHeight;
    displays[0].Primary = true;

    displays[1].DisplayId = 2;
    displays[1].Name = "Synthetic Secondary";
    displays[1].Width = kSyntheticWidth;
    displays[1].Height = kSyntheticHeight;

    return displays;
}

bool SyntheticCapture::NextFrame(uint32_t display_id, RawFrame& frame)
{
    if (display_id != 1 && display_id != 2) {
        spdlog::error("Synthetic capture: No display {}", display_id);
        return false;
    }

    uint32_t counter;
    {
        std::lock_guard<std::mutex> locker(Lock);
        counter = FrameCounters[display_id]++;
    }

    frame.Width = kSyntheticWidth;
    frame.Height = kSyntheticHeight;
    frame.TimestampUsec = GetTimeUsec();
    frame.Pixels.resize(kSyntheticWidth * kSyntheticHeight * 4);

    // Horizontal color bands scrolling down one row per frame
    static const uint8_t kPalette[4][3] = {
        { 32, 64, 128 },
        { 48, 96, 48 },
        { 128, 48, 32 },
        { 96, 96, 96 }
    };
    const uint32_t box_x = (counter * 4) % (kSyntheticWidth - 16);
    const uint32_t box_y = (kSyntheticHeight / 2) - 8;

    uint8_t* pixel = frame.Pixels.data();
    for (uint32_t y = 0; y < kSyntheticHeight; ++y)
    {
        const uint8_t* band = kPalette[((y + counter) / 30 + display_id) % 4];
        for (uint32_t x = 0; x < kSyntheticWidth; ++x, pixel += 4)
        {
            // Moving white box
            const bool in_box = x >= box_x && x < box_x + 16 && y >= box_y && y < box_y + 16;
            pixel[0] = in_box ? 255 : band[0];
            pixel[1] = in_box ? 255 : band[1];
            pixel[2] = in_box ? 255 : band[2];
            pixel[3] = 255;
        }
    }

    return true;
}


//------------------------------------------------------------------------------
// RunLengthEncoder

RunLengthEncoder::RunLengthEncoder(const EncoderParams& params)
    : Params(params)
{
    spdlog::info("RLE encoder for display {}: {}x{} @ {} FPS target {} bps",
        params.DisplayId, params.Width, params.Height, params.Fps, params.BitrateBPS);
}

void RunLengthEncoder::ForceKeyframe()
{
    NextKeyframe = true;
}

bool RunLengthEncoder::Encode(const RawFrame& raw, EncodedFrame& encoded)
{
    const size_t pixel_count = static_cast<size_t>( raw.Width ) * raw.Height;
    if (pixel_count == 0 || raw.Pixels.size() != pixel_count * 4) {
        spdlog::error("RLE encoder: Invalid frame {}x{} with {} bytes", raw.Width, raw.Height, raw.Pixels.size());
        return false;
    }

    std::vector<uint32_t> current(pixel_count);
    std::memcpy(current.data(), raw.Pixels.data(), pixel_count * 4);

    bool keyframe = NextKeyframe.exchange(false);
    if (Reference.size() != pixel_count || FramesSinceKeyframe >= kKeyframeIntervalFrames) {
        keyframe = true;
    }

    encoded.Data.clear();
    encoded.IsKeyframe = keyframe;
    encoded.TimestampUsec = raw.TimestampUsec;

    if (keyframe) {
        EncodePixelRuns(current, encoded.Data);
        FramesSinceKeyframe = 0;
    } else {
        std::vector<uint32_t> residual(pixel_count);
        for (size_t i = 0; i < pixel_count; ++i) {
            residual[i] = current[i] ^ Reference[i];
        }
        EncodePixelRuns(residual, encoded.Data);
        ++FramesSinceKeyframe;
    }

    Reference.swap(current);
    return true;
}


//------------------------------------------------------------------------------
// RunLengthDecoder

RunLengthDecoder::RunLengthDecoder(uint32_t width, uint32_t height)
    : Width(width)
    , Height(height)
{
}

bool RunLengthDecoder::Decode(const EncodedFrame& encoded, DecodedFrame& decoded)
{
    const size_t pixel_count = static_cast<size_t>( Width ) * Height;

    std::vector<uint32_t> pixels;
    if (!DecodePixelRuns(encoded.Data.data(), encoded.Data.size(), pixel_count, pixels)) {
        spdlog::warn("RLE decoder: Malformed frame seq={} bytes={}", encoded.Sequence, encoded.Data.size());
        return false;
    }

    if (!encoded.IsKeyframe)
    {
        if (!HasReference) {
            return false;
        }
        for (size_t i = 0; i < pixel_count; ++i) {
            pixels[i] ^= Reference[i];
        }
    }

    decoded.Width = Width;
    decoded.Height = Height;
    decoded.Format = PixelFormat::RGBA;
    decoded.Pixels.resize(pixel_count * 4);
    std::memcpy(decoded.Pixels.data(), pixels.data(), pixel_count * 4);

    Reference.swap(pixels);
    HasReference = true;
    return true;
}


//------------------------------------------------------------------------------
// LoggingRenderer

LoggingRenderer::LoggingRenderer(const PeerIdentity& sharer, uint32_t display_id)
{
    LogName = fmt::format("[Render {} display {}]", sharer.ToString(), display_id);
}

void LoggingRenderer::Present(const DecodedFrame& frame)
{
    const uint64_t now_usec = GetTimeUsec();
    if (WindowStartUsec == 0) {
        WindowStartUsec = now_usec;
        spdlog::info("{} First frame: {}x{} seq={}", LogName, frame.Width, frame.Height, frame.Sequence);
    }

    ++WindowFrames;
    ++TotalFrames;

    // Every 5 seconds:
    const uint64_t elapsed_usec = now_usec - WindowStartUsec;
    if (elapsed_usec >= 5 * 1000 * 1000) {
        spdlog::info("{} Presenting {} FPS: seq={} total={}", LogName,
            WindowFrames * 1000000.f / elapsed_usec, frame.Sequence, TotalFrames);
        WindowStartUsec = now_usec;
        WindowFrames = 0;
    }
}


//------------------------------------------------------------------------------
// SyntheticMediaFactory

std::shared_ptr<VideoEncoder> SyntheticMediaFactory::CreateEncoder(const EncoderParams& params)
{
    return std::make_shared<RunLengthEncoder>(params);
}

std::shared_ptr<VideoDecoder> SyntheticMediaFactory::CreateDecoder(const protos::MessageScreenStart& start)
{
    if (start.Codec != LANMEET_SYNTHETIC_CODEC) {
        spdlog::error("Unsupported codec '{}' for display {}", start.Codec, start.DisplayId);
        return nullptr;
    }
    if (start.Width == 0 || start.Height == 0) {
        spdlog::error("Invalid stream resolution {}x{} for display {}", start.Width, start.Height, start.DisplayId);
        return nullptr;
    }
    return std::make_shared<RunLengthDecoder>(start.Width, start.Height);
}

std::shared_ptr<FrameRenderer> SyntheticMediaFactory::CreateRenderer(
    const PeerIdentity& sharer,
    const protos::MessageScreenStart& start)
{
    return std::make_shared<LoggingRenderer>(sharer, start.DisplayId);
}


//------------------------------------------------------------------------------
// LoggingCollaborators

void LoggingCollaborators::OnCollaboratorMessage(const PeerIdentity& peer, const protos::Message& msg)
{
    switch (protos::GetMessageType(msg))
    {
    case protos::MessageType_ChatMessage:
    {
        const auto& chat = std::get<protos::MessageChat>(msg);
        spdlog::info("[Chat] {} ({}): {}", chat.From, peer.ToString(), chat.Content);
        break;
    }
    case protos::MessageType_ControlRequest:
        spdlog::info("{} requests remote control as '{}'", peer.ToString(),
            std::get<protos::MessageControlRequest>(msg).FromUser);
        break;
    case protos::MessageType_ControlGrant:
        spdlog::info("{} granted remote control to '{}'", peer.ToString(),
            std::get<protos::MessageControlGrant>(msg).ToUser);
        break;
    case protos::MessageType_ControlRevoke:
        spdlog::info("{} revoked remote control", peer.ToString());
        break;
    case protos::MessageType_InputEvent:
    {
        const auto& input = std::get<protos::MessageInputEvent>(msg);
        spdlog::debug("{} input event type={} x={} y={}", peer.ToString(),
            (unsigned)input.EventType, input.X, input.Y);
        break;
    }
    case protos::MessageType_FileOffer:
    {
        const auto& offer = std::get<protos::MessageFileOffer>(msg);
        spdlog::info("{} offers file '{}' ({} bytes) id={}", peer.ToString(), offer.Name, offer.Size, offer.FileId);
        break;
    }
    default:
        spdlog::debug("{} sent {}", peer.ToString(),
            protos::MessageTypeToString(protos::GetMessageType(msg)));
        break;
    }
}


} // namespace lanmeet
