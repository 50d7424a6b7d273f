// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "PeerNode.hpp"

#include <core_logging.hpp>

#include <condition_variable>

using namespace lanmeet;

#define CHECK(cond) \
    if (!(cond)) { \
        spdlog::error("Check failed: {} ({}:{})", #cond, __FILE__, __LINE__); \
        return false; \
    }


//------------------------------------------------------------------------------
// RecordingSink

class RecordingSink : public PeerEventSink
{
public:
    void OnPeerConnected(const PeerIdentity& peer) override
    {
        std::lock_guard<std::mutex> locker(Lock);
        Connected.push_back(peer.PeerId);
        Condition.notify_all();
    }
    void OnPeerMessage(const PeerIdentity& peer, const protos::Message& msg) override
    {
        std::lock_guard<std::mutex> locker(Lock);
        if (auto chat = std::get_if<protos::MessageChat>(&msg)) {
            Chats.push_back(peer.PeerId + ":" + chat->Content);
        }
        Condition.notify_all();
    }
    void OnPeerDisconnected(const PeerIdentity& peer, CloseReason reason) override
    {
        std::lock_guard<std::mutex> locker(Lock);
        Disconnected.push_back(peer.PeerId);
        LastReason = reason;
        Condition.notify_all();
    }
    void OnConnectFailed(const std::string& address, ConnectError error) override
    {
        std::lock_guard<std::mutex> locker(Lock);
        Failures.push_back(address + ":" + ConnectErrorToString(error));
        Condition.notify_all();
    }

    // Wait up to `timeout_msec` for the predicate to hold
    template<typename Pred>
    bool WaitFor(unsigned timeout_msec, Pred pred)
    {
        std::unique_lock<std::mutex> locker(Lock);
        return Condition.wait_for(locker, std::chrono::milliseconds(timeout_msec), [&]() {
            return pred(*this);
        });
    }

    std::mutex Lock;
    std::condition_variable Condition;
    std::vector<std::string> Connected;
    std::vector<std::string> Chats;
    std::vector<std::string> Disconnected;
    std::vector<std::string> Failures;
    CloseReason LastReason = CloseReason::LocalRequest;
};

class CountingFaults : public FaultSink
{
public:
    void OnFault(const FaultSignal& fault) override
    {
        spdlog::info("Fault: {} {}", FaultKindToString(fault.Kind), fault.Detail);
        ++Count;
    }

    std::atomic<unsigned> Count = ATOMIC_VAR_INIT(0);
};


//------------------------------------------------------------------------------
// Tests

static PeerIdentity MakeIdentity(const char* peer_id, const char* name)
{
    PeerIdentity identity;
    identity.PeerId = peer_id;
    identity.Name = name;
    identity.AppVersion = "node_test";
    identity.Capabilities = protos::Capability_All;
    return identity;
}

static bool TestParsePeerAddress()
{
    spdlog::info("ParsePeerAddress test");

    std::string host;
    uint16_t port = 0;

    CHECK(ParsePeerAddress("192.168.1.20:4000", host, port));
    CHECK(host == "192.168.1.20" && port == 4000);
    CHECK(ParsePeerAddress("desk-pc", host, port));
    CHECK(host == "desk-pc" && port == protos::kDefaultPeerPort);
    CHECK(!ParsePeerAddress("", host, port));
    CHECK(!ParsePeerAddress(":4000", host, port));
    CHECK(!ParsePeerAddress("host:", host, port));
    CHECK(!ParsePeerAddress("host:99999", host, port));
    CHECK(!ParsePeerAddress("host:12ab", host, port));
    CHECK(!ParsePeerAddress("host:0", host, port));
    return true;
}

static bool TestEventDropPolicy()
{
    spdlog::info("Peer event drop policy test");

    CHECK(IsDroppablePeerEvent(protos::MessageScreenFrame()));

    // Losing any of these would leave a stream or a peer in the wrong state
    CHECK(!IsDroppablePeerEvent(protos::MessageScreenStop()));
    CHECK(!IsDroppablePeerEvent(protos::MessageScreenStart()));
    CHECK(!IsDroppablePeerEvent(protos::MessageScreenOffer()));
    CHECK(!IsDroppablePeerEvent(protos::MessageScreenRequest()));
    CHECK(!IsDroppablePeerEvent(protos::MessageRequestKeyframe()));
    CHECK(!IsDroppablePeerEvent(protos::MessageDisconnect()));
    CHECK(!IsDroppablePeerEvent(protos::MessageChat()));
    CHECK(!IsDroppablePeerEvent(protos::MessageFileChunk()));
    return true;
}

static bool TestTwoNodes()
{
    spdlog::info("Two node test");

    static const uint16_t kAlicePort = 29876;
    static const uint16_t kBobPort = 29877;

    ConnectionRegistry alice_registry, bob_registry;
    RecordingSink alice_sink, bob_sink;
    CountingFaults faults;

    PeerNodeSettings alice_settings;
    alice_settings.Port = kAlicePort;
    alice_settings.PeerAddresses.push_back(fmt::format("127.0.0.1:{}", kBobPort));

    PeerNodeSettings bob_settings;
    bob_settings.Port = kBobPort;

    PeerNode alice, bob;
    CHECK(bob.Initialize(bob_settings, MakeIdentity("bb00", "Bob"), &bob_registry, &bob_sink, &faults));
    CHECK(alice.Initialize(alice_settings, MakeIdentity("aa00", "Alice"), &alice_registry, &alice_sink, &faults));

    bool ok = alice_sink.WaitFor(10000, [](RecordingSink& s) { return !s.Connected.empty(); }) &&
        bob_sink.WaitFor(10000, [](RecordingSink& s) { return !s.Connected.empty(); });
    if (ok) {
        ok = alice_registry.Contains("bb00") && bob_registry.Contains("aa00");
    }

    if (ok)
    {
        protos::MessageChat chat;
        chat.From = "Alice";
        chat.Content = "hello bob";
        ok = alice_registry.Broadcast(chat).GetSentCount() == 1;
    }
    if (ok) {
        ok = bob_sink.WaitFor(5000, [](RecordingSink& s) { return !s.Chats.empty(); });
    }
    if (ok) {
        std::lock_guard<std::mutex> locker(bob_sink.Lock);
        ok = bob_sink.Chats[0] == "aa00:hello bob";
    }

    // Heartbeats keep the link alive
    if (ok)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(2500));
        auto link = alice_registry.Lookup("bb00");
        ok = link && link->IsOpen() && link->GetStats().MissedHeartbeats == 0;
    }

    // Disconnect reaches the other side
    if (ok)
    {
        ok = alice_registry.Unregister("bb00", CloseReason::LocalRequest);
    }
    if (ok) {
        ok = bob_sink.WaitFor(5000, [](RecordingSink& s) { return !s.Disconnected.empty(); });
    }
    if (ok) {
        std::lock_guard<std::mutex> locker(bob_sink.Lock);
        ok = bob_sink.LastReason == CloseReason::PeerRequest ||
            bob_sink.LastReason == CloseReason::PeerLost;
    }

    alice.Shutdown();
    bob.Shutdown();

    CHECK(ok);
    CHECK(alice_registry.GetCount() == 0);
    CHECK(bob_registry.GetCount() == 0);
    return true;
}

static bool TestUnreachable()
{
    spdlog::info("Unreachable peer test");

    ConnectionRegistry registry;
    RecordingSink sink;
    CountingFaults faults;

    PeerNodeSettings settings;
    settings.Port = 29878;
    settings.HandshakeTimeoutUsec = 1000 * 1000;

    PeerNode node;
    CHECK(node.Initialize(settings, MakeIdentity("cc00", "Carol"), &registry, &sink, &faults));

    // Nobody listens on this port
    const ConnectError result = node.Open("127.0.0.1", 29879);
    bool ok = (result == ConnectError::Unreachable) ||
        sink.WaitFor(30000, [](RecordingSink& s) { return !s.Failures.empty(); });

    node.Shutdown();

    CHECK(ok);
    CHECK(registry.GetCount() == 0);
    return true;
}


//------------------------------------------------------------------------------
// Entrypoint

int main(int argc, char* argv[])
{
    LANMEET_UNUSED2(argc, argv);

    SetupAsyncDiskLog("node_test.txt");

    if (!TestParsePeerAddress() ||
        !TestEventDropPolicy() ||
        !TestTwoNodes() ||
        !TestUnreachable())
    {
        spdlog::error("Node tests FAILED");
        return LANMEET_APP_FAILURE;
    }

    spdlog::info("Node tests passed");
    return LANMEET_APP_SUCCESS;
}
