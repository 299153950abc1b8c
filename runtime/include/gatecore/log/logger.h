#pragma once
#include <gatecore/config.h>
#include <gatecore/log/types.h>

#include <ranges>
#include <source_location>
#include <string>
#include <vector>

namespace gatecore {

// 当前线程的连接上下文，没有 log_scope 时为空
GATECORE_API const log_context &current_log_context() noexcept;

// 作用域内当前线程输出的日志都带上 ctx，可以嵌套，析构时恢复外层的上下文
class log_scope {
  public:
    GATECORE_API explicit log_scope(const log_context &ctx) noexcept;

    GATECORE_API ~log_scope() noexcept;

    GATECORE_NON_COPYABLE(log_scope)

  private:
    log_context previous_;
};

class logger : public std::enable_shared_from_this<logger> {
  public:
    template <std::ranges::range Range>
    logger(const std::string_view &name, const Range &range)
        : name_(name), appenders_(std::ranges::begin(range), std::ranges::end(range)) {}

    GATECORE_API logger(const std::string_view &name, log_appender_ptr appender);

    GATECORE_NON_COPYABLE(logger)

    ~logger() noexcept = default;

    GATECORE_API void set_level(log_level level);

    [[nodiscard]] GATECORE_API log_level level() const { return level_; }

    [[nodiscard]] GATECORE_API bool should_log(log_level level) const;

    [[nodiscard]] GATECORE_API const std::string &name() const { return name_; }

    GATECORE_API void set_formatter(std::unique_ptr<log_formatter> formatter);

    GATECORE_API void set_pattern(const std::string_view &pattern, log_time_type time_type = log_time_type::local);

    GATECORE_API void flush() const;

    GATECORE_API void log(const std::source_location &source, log_level level, const log_buf_t &buf) const;

    template <typename... Args>
    void log(const std::source_location &source, log_level level, const fmt::format_string<Args...> &fmt,
             Args &&...args) const {
        if (!should_log(level)) return;

        log_buf_t buf;
        try {
            fmt::format_to(std::back_inserter(buf), fmt, std::forward<Args>(args)...);
        } catch (const std::exception &e) {
            buf.clear();
            fmt::format_to(std::back_inserter(buf), "log format error: {}", e.what());
        }
        log(source, level, buf);
    }

  private:
    std::string name_;
    atomic_log_level level_{log_level::trace};
    std::vector<log_appender_ptr> appenders_;
};

}  // namespace gatecore
