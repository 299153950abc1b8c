#pragma once
#include <gatecore/config.h>

#include <chrono>
#include <cstdint>

namespace gatecore {

// 超时判断统一使用单调时钟，协议里的时间戳使用系统时钟
using steady_clock = std::chrono::steady_clock;
using steady_point = steady_clock::time_point;

inline int64_t get_system_clock_seconds() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

inline int64_t get_system_clock_millis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

template <typename Rep, typename Period>
int64_t to_millis(const std::chrono::duration<Rep, Period>& dur) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(dur).count();
}

}  // namespace gatecore
