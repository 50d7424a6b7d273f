// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "core.hpp"

#if !defined(_WIN32)
    #include <pthread.h>
    #include <unistd.h>
#endif // _WIN32

#ifdef _WIN32
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <windows.h>
#elif __MACH__
    #include <mach/mach_time.h>
    #include <mach/mach.h>
    #include <mach/clock.h>
#else
    #include <time.h>
    #include <sys/time.h>
#endif

namespace lanmeet {


//------------------------------------------------------------------------------
// Timing

#ifdef _WIN32
// Precomputed frequency inverse
static double PerfFrequencyInverseUsec = 0.;
static double PerfFrequencyInverseMsec = 0.;

static void InitPerfFrequencyInverse()
{
    LARGE_INTEGER freq = {};
    if (!::QueryPerformanceFrequency(&freq) || freq.QuadPart == 0) {
        return;
    }
    const double invFreq = 1. / (double)freq.QuadPart;
    PerfFrequencyInverseUsec = 1000000. * invFreq;
    PerfFrequencyInverseMsec = 1000. * invFreq;
}
#elif __MACH__
static bool m_clock_serv_init = false;
static clock_serv_t m_clock_serv = 0;

static void InitClockServ()
{
    m_clock_serv_init = true;
    host_get_clock_service(mach_host_self(), SYSTEM_CLOCK, &m_clock_serv);
}
#endif // _WIN32

uint64_t GetTimeUsec()
{
#ifdef _WIN32
    LARGE_INTEGER timeStamp = {};
    if (!::QueryPerformanceCounter(&timeStamp)) {
        return 0;
    }
    if (PerfFrequencyInverseUsec == 0.) {
        InitPerfFrequencyInverse();
    }
    return (uint64_t)(PerfFrequencyInverseUsec * timeStamp.QuadPart);
#elif __MACH__
    if (!m_clock_serv_init) {
        InitClockServ();
    }

    mach_timespec_t tv;
    clock_get_time(m_clock_serv, &tv);

    return 1000000 * tv.tv_sec + tv.tv_nsec / 1000;
#else
    // CLOCK_MONOTONIC is slewed by NTP but never jumps, and frame deadlines
    // only care about short intervals.
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint64_t>(ts.tv_nsec / 1000) + static_cast<uint64_t>(ts.tv_sec) * 1000000;
#endif
}

uint64_t GetTimeMsec()
{
#ifdef _WIN32
    LARGE_INTEGER timeStamp = {};
    if (!::QueryPerformanceCounter(&timeStamp)) {
        return 0;
    }
    if (PerfFrequencyInverseMsec == 0.) {
        InitPerfFrequencyInverse();
    }
    return (uint64_t)(PerfFrequencyInverseMsec * timeStamp.QuadPart);
#else
    return GetTimeUsec() / 1000;
#endif
}


//------------------------------------------------------------------------------
// Thread Tools

#ifdef _WIN32
const DWORD MS_VC_EXCEPTION = 0x406D1388;
#pragma pack(push,8)
typedef struct tagTHREADNAME_INFO
{
    DWORD dwType;       // Must be 0x1000.
    LPCSTR szName;      // Pointer to name (in user addr space).
    DWORD dwThreadID;   // Thread ID (-1=caller thread).
    DWORD dwFlags;      // Reserved for future use, must be zero.
} THREADNAME_INFO;
#pragma pack(pop)
void SetCurrentThreadName(const char* threadName)
{
    THREADNAME_INFO info;
    info.dwType = 0x1000;
    info.szName = threadName;
    info.dwThreadID = ::GetCurrentThreadId();
    info.dwFlags = 0;
#pragma warning(push)
#pragma warning(disable: 6320 6322)
    __try
    {
        RaiseException(MS_VC_EXCEPTION, 0, sizeof(info) / sizeof(ULONG_PTR), (ULONG_PTR*)&info);
    }
    __except (EXCEPTION_EXECUTE_HANDLER)
    {
    }
#pragma warning(pop)
}
#elif __MACH__
void SetCurrentThreadName(const char* threadName)
{
    pthread_setname_np(threadName);
}
#else
void SetCurrentThreadName(const char* threadName)
{
    // Linux limits thread names to 15 characters plus terminator
    char name[16];
    size_t i = 0;
    for (; i < sizeof(name) - 1 && threadName[i] != '\0'; ++i) {
        name[i] = threadName[i];
    }
    name[i] = '\0';
    pthread_setname_np(pthread_self(), name);
}
#endif


//------------------------------------------------------------------------------
// WorkerQueue

void WorkerQueue::Initialize(unsigned max_queue_size, const char* thread_name)
{
    MaxQueueSize = max_queue_size;
    ThreadName = thread_name;

    Terminated = false;
    Thread = std::make_shared<std::thread>(&WorkerQueue::Loop, this);
}

void WorkerQueue::Shutdown()
{
    Terminated = true;

    // Make sure that queue notification happens after termination flag is set
    {
        std::unique_lock<std::mutex> locker(QueueLock);
        QueueCondition.notify_all();
    }

    JoinThread(Thread);

    QueuePublic.clear();
    QueuePrivate.clear();
}

bool WorkerQueue::SubmitWork(WorkerCallback callback, bool bounded)
{
    std::unique_lock locker(QueueLock);

    if (Terminated || (bounded && QueuePublic.size() >= MaxQueueSize)) {
        return false;
    }

    QueuePublic.push_back(callback);
    QueueCondition.notify_all();
    return true;
}

unsigned WorkerQueue::GetQueueDepth() const
{
    std::unique_lock locker(QueueLock);
    return static_cast<unsigned>( QueuePublic.size() );
}

void WorkerQueue::Loop()
{
    SetCurrentThreadName(ThreadName);

    while (!Terminated)
    {
        {
            std::unique_lock<std::mutex> locker(QueueLock);

            if (QueuePublic.empty() && !Terminated) {
                QueueCondition.wait_for(locker, std::chrono::milliseconds(100));
            }

            if (QueuePublic.empty()) {
                continue;
            }

            std::swap(QueuePublic, QueuePrivate);
        }

        for (auto& callback : QueuePrivate) {
            callback();
        }
        QueuePrivate.clear();
    }
}


} // namespace lanmeet
