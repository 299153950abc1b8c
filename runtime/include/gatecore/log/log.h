#pragma once
#include <gatecore/log/logger.h>

#include <cstdio>
#include <source_location>

/*
 * 日志接口参考 https://github.com/gabime/spdlog
 * 每个函数都有一个以 logger_ptr 开头的重载，传入空指针时使用默认 logger
 */

namespace gatecore {

GATECORE_API void write_console(const std::string_view &strv, FILE *file);

template <typename... Args>
void print_error(fmt::format_string<Args...> fmt, Args &&...args) {
    log_buf_t buf;
    fmt::format_to(std::back_inserter(buf), fmt, std::forward<Args>(args)...);
    write_console({buf.data(), buf.size()}, stderr);
}

GATECORE_API void load_log_config(const std::string &path);

GATECORE_API void register_logger(logger_ptr new_logger);

GATECORE_API logger_ptr find_logger(const std::string &name);

GATECORE_API void drop_logger(const std::string &name);

GATECORE_API void drop_all_loggers();

GATECORE_API logger_ptr default_logger();

GATECORE_API void set_default_logger(logger_ptr new_default_logger);

GATECORE_API void set_log_level(log_level level);

GATECORE_API void set_log_levels(log_levels levels, const log_level *global_level = nullptr);

GATECORE_API void set_log_pattern(const std::string_view &pattern, log_time_type time_type = log_time_type::local);

GATECORE_API void log_flush();

namespace detail {

template <typename... Args>
void log_to(const logger_ptr &ptr, const std::source_location &source, log_level level,
            const fmt::format_string<Args...> &fmt, Args &&...args) {
    if (ptr) {
        return ptr->log(source, level, fmt, std::forward<Args>(args)...);
    }

    if (const auto fallback = default_logger()) {
        fallback->log(source, level, fmt, std::forward<Args>(args)...);
    }
}

}  // namespace detail

template <typename... Args>
struct log {
    log(log_level level, const fmt::format_string<Args...> &fmt, Args &&...args,
        const std::source_location &source = std::source_location::current()) {
        detail::log_to({}, source, level, fmt, std::forward<Args>(args)...);
    }

    log(const logger_ptr &ptr, log_level level, const fmt::format_string<Args...> &fmt, Args &&...args,
        const std::source_location &source = std::source_location::current()) {
        detail::log_to(ptr, source, level, fmt, std::forward<Args>(args)...);
    }
};

template <typename... Args>
log(log_level level, const fmt::format_string<Args...> &fmt, Args &&...args) -> log<Args...>;

template <typename... Args>
log(const logger_ptr &ptr, log_level level, const fmt::format_string<Args...> &fmt, Args &&...args) -> log<Args...>;

#define GATECORE_DEFINE_LOG_FUNCTION(func)                                                                        \
    template <typename... Args>                                                                                   \
    struct func {                                                                                                 \
        explicit func(const fmt::format_string<Args...> &fmt, Args &&...args,                                     \
                      const std::source_location &source = std::source_location::current()) {                     \
            detail::log_to({}, source, log_level::func, fmt, std::forward<Args>(args)...);                        \
        }                                                                                                         \
                                                                                                                  \
        func(const logger_ptr &ptr, const fmt::format_string<Args...> &fmt, Args &&...args,                       \
             const std::source_location &source = std::source_location::current()) {                              \
            detail::log_to(ptr, source, log_level::func, fmt, std::forward<Args>(args)...);                       \
        }                                                                                                         \
    };                                                                                                            \
                                                                                                                  \
    template <typename... Args>                                                                                   \
    func(const fmt::format_string<Args...> &fmt, Args &&...args) -> func<Args...>;                                \
                                                                                                                  \
    template <typename... Args>                                                                                   \
    func(const logger_ptr &ptr, const fmt::format_string<Args...> &fmt, Args &&...args) -> func<Args...>;

GATECORE_DEFINE_LOG_FUNCTION(critical)
GATECORE_DEFINE_LOG_FUNCTION(error)
GATECORE_DEFINE_LOG_FUNCTION(warn)
GATECORE_DEFINE_LOG_FUNCTION(info)
GATECORE_DEFINE_LOG_FUNCTION(debug)
GATECORE_DEFINE_LOG_FUNCTION(trace)

#undef GATECORE_DEFINE_LOG_FUNCTION

}  // namespace gatecore
