// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "core_logging.hpp"
#include "core_serializer.hpp"
#include "core_string.hpp"
#include "core_mmap.hpp"

#include <cstdio>
using namespace lanmeet;

#define CHECK(cond) \
    if (!(cond)) { \
        spdlog::error("Check failed: {} ({}:{})", #cond, __FILE__, __LINE__); \
        return false; \
    }


//------------------------------------------------------------------------------
// Serializer

static bool TestSerializer()
{
    spdlog::info("Serializer test");

    uint8_t buffer[15];
    WriteByteStream writer(buffer, sizeof(buffer));
    writer.Write8(0xab).Write16_BE(0x0102).Write32_BE(0x03040506).Write64_BE(0x0708090a0b0c0d0eULL);
    writer.WriteBuffer(nullptr, 0);
    CHECK(writer.WrittenBytes == 15);
    CHECK(writer.Remaining() == 0);

    // Big-endian layout on the wire
    CHECK(buffer[1] == 0x01 && buffer[2] == 0x02);
    CHECK(buffer[3] == 0x03 && buffer[6] == 0x06);
    CHECK(buffer[7] == 0x07 && buffer[14] == 0x0e);

    ReadByteStream reader(buffer, sizeof(buffer));
    CHECK(reader.Read8() == 0xab);
    CHECK(reader.Read16_BE() == 0x0102);
    CHECK(reader.Read32_BE() == 0x03040506);
    CHECK(reader.Read64_BE() == 0x0708090a0b0c0d0eULL);
    CHECK(reader.Remaining() == 0);

    // Unaligned offsets
    uint8_t raw[13] = {};
    WriteU32_BE(raw + 1, 0x11223344);
    WriteU64_BE(raw + 5, 0x8899aabbccddeeffULL);
    CHECK(raw[1] == 0x11 && raw[4] == 0x44);
    CHECK(raw[5] == 0x88 && raw[12] == 0xff);
    CHECK(ReadU32_BE(raw + 1) == 0x11223344);
    CHECK(ReadU64_BE(raw + 5) == 0x8899aabbccddeeffULL);
    CHECK(ReadU16_BE(raw + 3) == 0x3344);
    return true;
}


//------------------------------------------------------------------------------
// Strings

static bool TestStrings()
{
    spdlog::info("String test");

    CHECK(HexString(0x1234) == "1234");
    CHECK(HexString(0) == "00");

    const uint8_t bytes[4] = { 0x00, 0x0f, 0xa0, 0xff };
    CHECK(HexString(bytes, 4) == "000fa0ff");
    CHECK(HexString(bytes, 0).empty());

    CHECK(IsHexString("000fa0ff"));
    CHECK(IsHexString("ABCdef"));
    CHECK(!IsHexString(""));
    CHECK(!IsHexString("12g4"));

    CHECK(StrCaseCompare("H264", "h264") == 0);
    CHECK(StrCaseCompare("h264", "vp8") != 0);
    return true;
}


//------------------------------------------------------------------------------
// WorkerQueue

static bool TestWorkerQueue()
{
    spdlog::info("WorkerQueue test");

    WorkerQueue worker;
    CHECK(!worker.SubmitWork([]() {}));

    worker.Initialize(100, "TestWorker");

    std::mutex lock;
    std::vector<int> order;
    std::atomic<int> completed = ATOMIC_VAR_INIT(0);

    for (int i = 0; i < 50; ++i) {
        const bool submitted = worker.SubmitWork([i, &lock, &order, &completed]() {
            std::lock_guard<std::mutex> locker(lock);
            order.push_back(i);
            ++completed;
        });
        CHECK(submitted);
    }

    const uint64_t t0 = GetTimeMsec();
    while (completed < 50 && GetTimeMsec() - t0 < 5000) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    CHECK(completed == 50);

    {
        std::lock_guard<std::mutex> locker(lock);
        for (int i = 0; i < 50; ++i) {
            CHECK(order[i] == i);
        }
    }

    worker.Shutdown();
    CHECK(worker.IsTerminated());
    CHECK(!worker.SubmitWork([]() {}));
    return true;
}

static bool TestWorkerQueueOverflow()
{
    spdlog::info("WorkerQueue overflow test");

    WorkerQueue worker;
    worker.Initialize(2, "TestOverflow");

    std::mutex gate;
    std::unique_lock<std::mutex> gate_locker(gate);

    // First item blocks the worker thread until the gate opens
    std::atomic<bool> started = ATOMIC_VAR_INIT(false);
    CHECK(worker.SubmitWork([&]() {
        started = true;
        std::lock_guard<std::mutex> locker(gate);
    }));

    const uint64_t t0 = GetTimeMsec();
    while (!started && GetTimeMsec() - t0 < 5000) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    CHECK(started);

    std::atomic<unsigned> ran = ATOMIC_VAR_INIT(0);
    CHECK(worker.SubmitWork([&]() { ++ran; }));
    CHECK(worker.SubmitWork([&]() { ++ran; }));
    CHECK(!worker.SubmitWork([&]() { ++ran; }));
    CHECK(worker.GetQueueDepth() == 2);

    // Unbounded work still gets in when the queue is full
    CHECK(worker.SubmitWork([&]() { ++ran; }, false));
    CHECK(worker.GetQueueDepth() == 3);

    gate_locker.unlock();

    const uint64_t t1 = GetTimeMsec();
    while (ran < 3 && GetTimeMsec() - t1 < 5000) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    CHECK(ran == 3);

    worker.Shutdown();
    CHECK(!worker.SubmitWork([]() {}, false));
    return true;
}


//------------------------------------------------------------------------------
// Mapped files

static bool TestMappedFile()
{
    spdlog::info("Mapped file test");

    const std::string path = "core_test_mmap.bin";
    const char text[] = "port: 19876\n";
    CHECK(WriteBufferToFile(path.c_str(), text, sizeof(text) - 1));

    MappedReadOnlySmallFile mmf;
    CHECK(mmf.Read(path.c_str()));
    CHECK(mmf.GetDataBytes() == sizeof(text) - 1);
    CHECK(0 == memcmp(mmf.GetData(), text, sizeof(text) - 1));
    mmf.Close();

    CHECK(!mmf.Read("core_test_missing_file.bin"));

    std::remove(path.c_str());
    return true;
}


//------------------------------------------------------------------------------
// Entrypoint

int main(int argc, char* argv[])
{
    LANMEET_UNUSED2(argc, argv);

    SetupAsyncDiskLog("core_test.txt");

    spdlog::info("Core library tests");

    if (!TestSerializer() ||
        !TestStrings() ||
        !TestWorkerQueue() ||
        !TestWorkerQueueOverflow() ||
        !TestMappedFile())
    {
        spdlog::error("Core library tests FAILED");
        return LANMEET_APP_FAILURE;
    }

    spdlog::info("Core library tests passed");
    return LANMEET_APP_SUCCESS;
}
