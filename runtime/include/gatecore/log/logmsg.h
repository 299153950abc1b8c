#pragma once
#include <gatecore/log/types.h>

#include <source_location>

namespace gatecore {

// 一条日志在格式化之前的全部信息，只在 logger::log 调用期间有效
struct log_message {  // NOLINT(cppcoreguidelines-pro-type-member-init)
    std::string_view logger_name;
    log_level level{log_level::off};
    log_clock_point point;
    int32_t tid{0};
    std::source_location source;
    log_context context;
    std::string_view payload;
};

}  // namespace gatecore
