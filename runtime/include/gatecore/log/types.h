#pragma once

#include <fmt/format.h>
#include <gatecore/config.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace gatecore {

enum class log_level : uint8_t { off = 0, critical = 1, error = 2, warn = 3, info = 4, debug = 5, trace = 6 };

enum class log_time_type : uint8_t { local = 0, utc = 1 };

using atomic_log_level = std::atomic<log_level>;

using log_levels = std::unordered_map<std::string, log_level>;

using log_clock = std::chrono::system_clock;

using log_clock_point = log_clock::time_point;

using log_buf_t = fmt::basic_memory_buffer<char, 250>;

// 当前线程正在处理的连接、会话和玩家，0 表示没有
struct log_context {
    uint64_t connection{0};
    uint64_t session{0};
    uint64_t player{0};

    [[nodiscard]] bool empty() const noexcept { return connection == 0 && session == 0 && player == 0; }
};

// 格式化结果中需要着色的区间 [start, stop)
struct log_color_range {
    size_t start{0};
    size_t stop{0};

    [[nodiscard]] bool empty() const noexcept { return stop <= start; }
};

struct log_message;

GATECORE_API std::string_view to_string_view(log_level level) noexcept;

// 单个大写字母，off 返回 'O'
GATECORE_API char to_letter(log_level level) noexcept;

// 完整名字，不区分大小写，另外接受 warning 和 err
GATECORE_API std::optional<log_level> parse_log_level(std::string_view strv) noexcept;

GATECORE_API std::optional<log_time_type> parse_log_time_type(std::string_view strv) noexcept;

class log_formatter;

class log_appender;

using log_appender_ptr = std::shared_ptr<log_appender>;

class logger;

using logger_ptr = std::shared_ptr<logger>;

}  // namespace gatecore
