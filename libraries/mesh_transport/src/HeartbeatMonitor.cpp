// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "HeartbeatMonitor.hpp"

namespace lanmeet {


//------------------------------------------------------------------------------
// Constants

// Round trips below this are never reported as spikes
static const uint64_t kMinSpikeRttUsec = 20 * 1000;


//------------------------------------------------------------------------------
// HeartbeatMonitor

void HeartbeatMonitor::Initialize(const HeartbeatSettings& settings)
{
    Settings = settings;
    if (Settings.MaxMissed < 1) {
        Settings.MaxMissed = 1;
    }

    Sequence = 0;
    EverSent = false;
    Outstanding = false;
    SentUsec = 0;
    Missed = 0;
    TimedOut = false;
    LastRttUsec = 0;
    SmoothedRttUsec = 0;
    RttSpike = false;
}

bool HeartbeatMonitor::OnTick(uint64_t now_usec, protos::MessageHeartbeat& msg)
{
    if (TimedOut) {
        return false;
    }

    if (Outstanding && now_usec - SentUsec >= Settings.TimeoutUsec) {
        Outstanding = false;
        if (++Missed >= Settings.MaxMissed) {
            TimedOut = true;
            return false;
        }
    }

    if (Outstanding) {
        return false;
    }
    if (EverSent && now_usec - SentUsec < Settings.IntervalUsec) {
        return false;
    }

    ++Sequence;
    EverSent = true;
    Outstanding = true;
    SentUsec = now_usec;

    msg.Sequence = Sequence;
    msg.TimestampUsec = now_usec;
    return true;
}

bool HeartbeatMonitor::OnAck(const protos::MessageHeartbeatAck& ack, uint64_t now_usec)
{
    if (!Outstanding || ack.Sequence != Sequence) {
        return false;
    }

    Outstanding = false;
    Missed = 0;

    const uint64_t rtt = (now_usec > SentUsec) ? (now_usec - SentUsec) : 0;
    LastRttUsec = rtt;

    if (SmoothedRttUsec == 0) {
        SmoothedRttUsec = rtt;
        RttSpike = false;
    } else {
        RttSpike = (rtt > 2 * SmoothedRttUsec && rtt > kMinSpikeRttUsec);
        SmoothedRttUsec = (SmoothedRttUsec * 7 + rtt) / 8;
    }

    return true;
}


} // namespace lanmeet
