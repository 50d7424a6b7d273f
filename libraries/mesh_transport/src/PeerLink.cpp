// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "PeerLink.hpp"

#include <core_logging.hpp> // core

namespace lanmeet {


//------------------------------------------------------------------------------
// PeerIdentity

std::string PeerIdentity::ToString() const
{
    // Peer ids are long: The first 8 characters are enough to tell peers apart
    return fmt::format("{}/{}", Name, PeerId.substr(0, 8));
}


//------------------------------------------------------------------------------
// Enumerations

const char* CloseReasonToString(CloseReason reason)
{
    static_assert((int)CloseReason::Count == 7, "Update this");
    switch (reason)
    {
    case CloseReason::LocalRequest: return "LocalRequest";
    case CloseReason::PeerLost: return "PeerLost";
    case CloseReason::ProtocolError: return "ProtocolError";
    case CloseReason::HeartbeatTimeout: return "HeartbeatTimeout";
    case CloseReason::Rejected: return "Rejected";
    case CloseReason::PeerRequest: return "PeerRequest";
    case CloseReason::Shutdown: return "Shutdown";
    default: break;
    }
    return "Unknown";
}

uint8_t CloseReasonToDisconnectCode(CloseReason reason)
{
    switch (reason)
    {
    case CloseReason::ProtocolError:
        return protos::DisconnectReason_ProtocolError;
    case CloseReason::HeartbeatTimeout:
        return protos::DisconnectReason_HeartbeatTimeout;
    case CloseReason::Rejected:
        return protos::DisconnectReason_Rejected;
    case CloseReason::Shutdown:
        return protos::DisconnectReason_Shutdown;
    default:
        break;
    }
    return protos::DisconnectReason_Normal;
}

const char* ConnectErrorToString(ConnectError error)
{
    static_assert((int)ConnectError::Count == 4, "Update this");
    switch (error)
    {
    case ConnectError::None: return "None";
    case ConnectError::Unreachable: return "Unreachable";
    case ConnectError::TlsRejected: return "TlsRejected";
    case ConnectError::Timeout: return "Timeout";
    default: break;
    }
    return "Unknown";
}

const char* SendResultToString(SendResult result)
{
    switch (result)
    {
    case SendResult::Sent: return "Sent";
    case SendResult::Dropped: return "Dropped";
    case SendResult::ConnectionClosed: return "ConnectionClosed";
    default: break;
    }
    return "Unknown";
}

const char* FaultKindToString(FaultKind kind)
{
    switch (kind)
    {
    case FaultKind::ConnectError: return "ConnectError";
    case FaultKind::ProtocolError: return "ProtocolError";
    case FaultKind::StreamFault: return "StreamFault";
    case FaultKind::DeliveryMiss: return "DeliveryMiss";
    case FaultKind::SessionStateError: return "SessionStateError";
    default: break;
    }
    return "Unknown";
}


} // namespace lanmeet
