#include <gatecore/log/appender.h>
#include <gatecore/log/logmsg.h>

namespace gatecore {

log_appender::log_appender() : formatter_(std::make_unique<log_formatter>()) {}

void log_appender::log(const log_message& msg) {
    if (!should_log(msg.level)) return;

    std::scoped_lock lock(mtx_);
    buf_.clear();
    const auto color = formatter_->format(msg, buf_);
    write(msg, {buf_.data(), buf_.size()}, color);
}

void log_appender::flush() {
    std::scoped_lock lock(mtx_);
    sync();
}

void log_appender::set_pattern(const std::string_view& pattern, log_time_type tp) {
    set_formatter(std::make_unique<log_formatter>(pattern, tp));
}

void log_appender::set_formatter(std::unique_ptr<log_formatter> formatter) {
    std::scoped_lock lock(mtx_);
    formatter_ = std::move(formatter);
}

}  // namespace gatecore
