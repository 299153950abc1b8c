#pragma once
#include <gatecore/log/formatter.h>

#include <mutex>

namespace gatecore {

/*
 * 输出端的基类，格式化和写入都在 mtx_ 内完成
 * 子类只需要实现 write 和 sync
 */
class log_appender {
  public:
    GATECORE_API log_appender();

    virtual ~log_appender() noexcept = default;

    GATECORE_NON_COPYABLE(log_appender)

    GATECORE_API void log(const log_message& msg);

    GATECORE_API void flush();

    GATECORE_API void set_pattern(const std::string_view& pattern, log_time_type tp = log_time_type::local);

    GATECORE_API void set_formatter(std::unique_ptr<log_formatter> formatter);

    GATECORE_API void set_level(log_level level) { level_.store(level, std::memory_order::relaxed); }

    [[nodiscard]] GATECORE_API log_level level() const { return level_.load(std::memory_order::relaxed); }

    [[nodiscard]] GATECORE_API bool should_log(log_level level) const {
        return level != log_level::off && level <= this->level();
    }

  protected:
    // text 以换行结尾
    virtual void write(const log_message& msg, std::string_view text, log_color_range color) = 0;

    virtual void sync() = 0;

  private:
    atomic_log_level level_{log_level::trace};
    std::unique_ptr<log_formatter> formatter_;
    log_buf_t buf_;
    std::mutex mtx_;
};

}  // namespace gatecore
