#pragma once
#include <gatecore/log/logger.h>

#include <mutex>
#include <unordered_map>

namespace gatecore {

// 具名 logger 的注册表，保存默认 logger
class log_system {
  public:
    GATECORE_NON_COPYABLE(log_system)

    static log_system& instance();

    void register_logger(logger_ptr new_logger);

    logger_ptr find(const std::string& name);

    void drop(const std::string& name);

    void drop_all();

    logger_ptr default_logger();

    void set_default(logger_ptr new_default_logger);

    void set_level(log_level level);

    void set_levels(log_levels levels, const log_level* global_level);

    void set_pattern(const std::string_view& pattern, log_time_type time_type);

    void flush();

  private:
    log_system();

    ~log_system() noexcept = default;

    std::mutex mtx_;
    std::unordered_map<std::string, logger_ptr> loggers_;
    logger_ptr default_logger_;
    log_levels levels_;
    log_level global_level_{log_level::info};
};

}  // namespace gatecore
