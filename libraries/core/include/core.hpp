// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#pragma once

#include <cstdint>
#include <atomic>
#include <mutex>
#include <thread>
#include <list>
#include <memory>
#include <condition_variable>


//------------------------------------------------------------------------------
// Application Return Values

#define LANMEET_APP_SUCCESS 0
#define LANMEET_APP_FAILURE -1


//------------------------------------------------------------------------------
// Portability Macros

// Specify an intentionally unused variable (often a function parameter)
#define LANMEET_UNUSED(x) (void)(x);
#define LANMEET_UNUSED2(x, y) (void)(x); (void)(y);

// Compiler-specific debug break
#if defined(_DEBUG) || defined(DEBUG) || defined(LANMEET_DEBUG_IN_RELEASE)
    #define LANMEET_DEBUG
    #if defined(_WIN32)
        #define LANMEET_DEBUG_BREAK() __debugbreak()
    #else // _WIN32
        #define LANMEET_DEBUG_BREAK() __builtin_trap()
    #endif // _WIN32
    #define LANMEET_DEBUG_ASSERT(cond) { if (!(cond)) { LANMEET_DEBUG_BREAK(); } }
#else // _DEBUG
    #define LANMEET_DEBUG_BREAK() ;
    #define LANMEET_DEBUG_ASSERT(cond) ;
#endif // _DEBUG

// Compiler-specific force inline keyword
#if defined(_MSC_VER)
    #define LANMEET_INLINE inline __forceinline
#else // _MSC_VER
    #define LANMEET_INLINE inline __attribute__((always_inline))
#endif // _MSC_VER


#include <vector>       // std::vector
#include <functional>   // std::function
#include <chrono>       // std::chrono

namespace lanmeet {


//------------------------------------------------------------------------------
// C++ Convenience Classes

/// Derive from NoCopy to disallow copies of the derived class
struct NoCopy
{
    LANMEET_INLINE NoCopy() {}
    NoCopy(const NoCopy&) = delete;
    NoCopy& operator=(const NoCopy&) = delete;
};

/// Join a std::shared_ptr<std::thread>
inline void JoinThread(std::shared_ptr<std::thread>& th)
{
    if (th) {
        try {
            if (th->joinable()) {
                th->join();
            }
        } catch (std::system_error& /*err*/) {}
        th = nullptr;
    }
}


//------------------------------------------------------------------------------
// High-resolution timers

/// Get time in microseconds
uint64_t GetTimeUsec();

/// Get time in milliseconds
uint64_t GetTimeMsec();


//------------------------------------------------------------------------------
// Thread Tools

/// Set the current thread name
void SetCurrentThreadName(const char* name);


//------------------------------------------------------------------------------
// WorkerQueue

using WorkerCallback = std::function<void()>;

// Queue up a maximum number of work items, run in order on one thread
class WorkerQueue
{
public:
    ~WorkerQueue()
    {
        Shutdown();
    }
    void Initialize(unsigned max_queue_size, const char* thread_name = "WorkerQueue");
    void Shutdown();

    // Returns false if queue overflowed or the worker is shut down.
    // Work submitted with bounded=false is queued even past the limit
    bool SubmitWork(WorkerCallback callback, bool bounded = true);

    bool IsTerminated() const
    {
        return Terminated;
    }

    // Number of work items waiting to run
    unsigned GetQueueDepth() const;

protected:
    unsigned MaxQueueSize = 2;
    const char* ThreadName = "WorkerQueue";

    std::atomic<bool> Terminated = ATOMIC_VAR_INIT(true);
    std::shared_ptr<std::thread> Thread;

    mutable std::mutex QueueLock;
    std::condition_variable QueueCondition;
    std::list<WorkerCallback> QueuePublic;
    std::list<WorkerCallback> QueuePrivate;

    void Loop();
};


} // namespace lanmeet
