#pragma once

#include "Log.hpp"
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// RAMPART LOGGING CATEGORIES
// =============================================================================
// Four categories on top of Log.hpp. Each one supports atomic throttling so
// hot paths (ticker messages, stream batches) do not flood the console.
//
//   App    : init, lifecycle, config, shutdown
//   Data   : market data, WebSocket, REST fallback, cache
//   Stream : event streams, consumer groups, fallback loops, trimming
//   Guard  : circuit breakers, backpressure, resource pressure

namespace Rampart::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp    = 1;    // Log every app event (low frequency)
    inline constexpr int kData   = 20;   // Log every 20th data operation
    inline constexpr int kStream = 10;   // Log every 10th stream operation
    inline constexpr int kGuard  = 1;    // Breaker/backpressure decisions are always interesting
}

// Atomic throttling macro with runtime env var override
#define RLOG_THROTTLED(cat, defaultInterval, ...)                                   \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static const uint32_t _interval = []() {                                     \
            const char* env = std::getenv("RAMPART_LOG_" #cat "_INTERVAL");         \
            const int v = env ? std::atoi(env) : (defaultInterval);                 \
            return static_cast<uint32_t>(v > 0 ? v : 1);                            \
        }();                                                                         \
        if ((_counter.fetch_add(1, std::memory_order_relaxed) % _interval) == 0) {  \
            LOG_I(#cat, __VA_ARGS__);                                                \
        }                                                                            \
    } while(false)

// Primary logging macros (automatically throttled for hot paths)
#define rLog_App(...)     RLOG_THROTTLED(App, ::Rampart::log_throttle::kApp, __VA_ARGS__)
#define rLog_Data(...)    RLOG_THROTTLED(Data, ::Rampart::log_throttle::kData, __VA_ARGS__)
#define rLog_Stream(...)  RLOG_THROTTLED(Stream, ::Rampart::log_throttle::kStream, __VA_ARGS__)
#define rLog_Guard(...)   RLOG_THROTTLED(Guard, ::Rampart::log_throttle::kGuard, __VA_ARGS__)

// Override macros for specific throttle intervals
#define rLog_DataN(n, ...)   RLOG_THROTTLED(Data, n, __VA_ARGS__)
#define rLog_StreamN(n, ...) RLOG_THROTTLED(Stream, n, __VA_ARGS__)
#define rLog_GuardN(n, ...)  RLOG_THROTTLED(Guard, n, __VA_ARGS__)

// Always-on macros (no throttling for critical messages)
#define rLog_Warning(...)  LOG_W("App", __VA_ARGS__)
#define rLog_Error(...)    LOG_E("App", __VA_ARGS__)

// Runtime control:
//   export RAMPART_LOG=debug                 # global level (trace|debug|info|warn|error)
//   export RAMPART_LOG_Data_INTERVAL=1       # log every data operation
//   export RAMPART_LOG_Stream_INTERVAL=100   # log every 100th stream operation
