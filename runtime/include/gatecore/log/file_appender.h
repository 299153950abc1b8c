#pragma once
#include <gatecore/log/appender.h>

#include <ctime>
#include <filesystem>
#include <fstream>

namespace gatecore {

struct file_appender_config {
    // 文件名前缀（不含目录和扩展名）
    std::string name;
    std::string log_directory{"./"};
    // 单个文件的最大字节数，0 表示不限制
    std::size_t max_size{0};
    log_time_type file_time{log_time_type::local};
    // 跨天时换新文件
    bool daily_roll{false};
};

class file_appender final : public log_appender {
  public:
    GATECORE_API explicit file_appender(file_appender_config config);

    ~file_appender() noexcept override = default;

    GATECORE_NON_COPYABLE(file_appender)

  protected:
    GATECORE_API void write(const log_message& msg, std::string_view text, log_color_range color) override;

    GATECORE_API void sync() override;

  private:
    void make_full_name();

    void roll_file();

    std::filesystem::path full_name_;
    std::chrono::seconds file_secs_{0};
    size_t file_id_{0};
    size_t file_size_{0};
    log_clock_point cached_point_;
    std::tm cached_tm_{};
    std::ofstream file_stream_;
    file_appender_config config_;
};

}  // namespace gatecore
