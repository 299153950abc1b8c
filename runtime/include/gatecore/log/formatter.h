#pragma once
#include <gatecore/log/types.h>

#include <ctime>
#include <string>
#include <vector>

namespace gatecore {

/*
 * 支持的格式符:
 * %Y %m %d %H %M %S 日期时间, %e 毫秒
 * %l 日志等级, %L 日志等级缩写, %n logger名字, %t 线程id
 * %s 源文件名, %# 行号, %v 日志内容
 * %c 连接上下文 "[conn:1 session:2 player:3] "，为 0 的字段不输出，没有上下文时为空
 * %C 连接id, %I 会话id, %P 玩家id
 * %^ %$ 着色区间的开始和结束, %% 百分号
 */
class log_formatter {
  public:
    static constexpr std::string_view default_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%L%$] [%t] %c%v [%s:%#]";

    GATECORE_API log_formatter();

    GATECORE_API explicit log_formatter(const std::string_view& pattern, log_time_type tp = log_time_type::local);

    GATECORE_NON_COPYABLE(log_formatter)

    ~log_formatter() noexcept = default;

    GATECORE_API void set_pattern(const std::string_view& pattern);

    GATECORE_API log_color_range format(const log_message& msg, log_buf_t& dest);

    [[nodiscard]] GATECORE_API std::unique_ptr<log_formatter> clone() const;

  private:
    struct token {
        // 0 表示 literal
        char flag{0};
        std::string literal;
    };

    const std::tm& get_time(const log_message& msg);

    std::string pattern_;
    log_time_type time_type_;
    std::tm cached_tm_{};
    std::chrono::seconds last_log_secs_{0};
    std::vector<token> tokens_;
};

}  // namespace gatecore
