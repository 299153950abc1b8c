#pragma once
#include <gatecore/log/appender.h>

#include <cstdio>

namespace gatecore {

enum class console_stream : uint8_t { out, err };

// 输出到 stdout 或 stderr，终端支持时按等级着色
class console_appender final : public log_appender {
  public:
    GATECORE_API explicit console_appender(console_stream stream = console_stream::out);

    ~console_appender() noexcept override = default;

    GATECORE_NON_COPYABLE(console_appender)

    // 覆盖自动检测的结果，重定向到文件时可以强制关闭
    GATECORE_API void set_color(bool enable) { color_ = enable; }

    [[nodiscard]] GATECORE_API bool color() const { return color_; }

  protected:
    GATECORE_API void write(const log_message& msg, std::string_view text, log_color_range color) override;

    GATECORE_API void sync() override;

  private:
    FILE* file_;
    bool color_;
};

}  // namespace gatecore
