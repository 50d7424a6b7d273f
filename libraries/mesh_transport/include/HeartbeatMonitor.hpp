// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

/*
    Heartbeat liveness tracking for one connection

    One heartbeat is outstanding at a time.  A heartbeat that is not acked
    within the timeout counts as missed, and the next one goes out when the
    interval elapses.  MaxMissed consecutive misses mark the connection as
    timed out.  Any matching ack resets the miss count.

    Round trip times feed a smoothed estimate used to spot congestion.
*/

#pragma once

#include <MeshProtocol.hpp> // mesh_protocol

#include <cstdint>

namespace lanmeet {


//------------------------------------------------------------------------------
// HeartbeatSettings

struct HeartbeatSettings
{
    uint64_t IntervalUsec = 1000 * 1000;
    uint64_t TimeoutUsec = 1000 * 1000;
    unsigned MaxMissed = 3;
};


//------------------------------------------------------------------------------
// HeartbeatMonitor

class HeartbeatMonitor
{
public:
    void Initialize(const HeartbeatSettings& settings);

    /// Returns true if a heartbeat should be sent now, filling in `msg`
    bool OnTick(uint64_t now_usec, protos::MessageHeartbeat& msg);

    /// Returns false for stale or unexpected acks
    bool OnAck(const protos::MessageHeartbeatAck& ack, uint64_t now_usec);

    bool IsTimedOut() const
    {
        return TimedOut;
    }
    unsigned GetMissedCount() const
    {
        return Missed;
    }
    uint64_t GetLastRttUsec() const
    {
        return LastRttUsec;
    }
    uint64_t GetSmoothedRttUsec() const
    {
        return SmoothedRttUsec;
    }

    /// Last round trip was more than twice the smoothed estimate
    bool IsRttSpike() const
    {
        return RttSpike;
    }

protected:
    HeartbeatSettings Settings;

    uint32_t Sequence = 0;
    bool EverSent = false;
    bool Outstanding = false;
    uint64_t SentUsec = 0;

    unsigned Missed = 0;
    bool TimedOut = false;

    uint64_t LastRttUsec = 0;
    uint64_t SmoothedRttUsec = 0;
    bool RttSpike = false;
};


} // namespace lanmeet
