#include <gatecore/log/appender.h>
#include <gatecore/log/log.h>
#include <gatecore/log/logger.h>
#include <gatecore/log/logmsg.h>
#include <gatecore/utils/os.h>

namespace gatecore {

static thread_local log_context thread_context;

const log_context& current_log_context() noexcept { return thread_context; }

log_scope::log_scope(const log_context& ctx) noexcept : previous_(thread_context) { thread_context = ctx; }

log_scope::~log_scope() noexcept { thread_context = previous_; }

logger::logger(const std::string_view& name, log_appender_ptr appender) : name_(name), appenders_({std::move(appender)}) {}

void logger::set_level(log_level level) { level_.store(level, std::memory_order::relaxed); }

bool logger::should_log(log_level level) const {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(level_.load(std::memory_order::relaxed));
}

void logger::set_formatter(std::unique_ptr<log_formatter> formatter) {
    for (auto it = appenders_.begin(); it != appenders_.end(); ++it) {
        if (std::next(it) == appenders_.end()) {
            (*it)->set_formatter(std::move(formatter));
            break;
        }
        (*it)->set_formatter(formatter->clone());
    }
}

void logger::set_pattern(const std::string_view& pattern, log_time_type time_type) {
    set_formatter(std::make_unique<log_formatter>(pattern, time_type));
}

void logger::flush() const {
    for (const auto& appender : appenders_) {
        try {
            appender->flush();
        } catch (const std::exception& e) {
            print_error("logger {} flush fail, {}\n", name_, e.what());
        }
    }
}

void logger::log(const std::source_location& source, log_level level, const log_buf_t& buf) const {
    if (!should_log(level)) {
        return;
    }

    log_message msg;
    msg.logger_name = name_;
    msg.level = level;
    msg.point = log_clock::now();
    msg.tid = os::tid();
    msg.source = source;
    msg.context = thread_context;
    msg.payload = std::string_view(buf.data(), buf.size());

    for (const auto& appender : appenders_) {
        try {
            appender->log(msg);
        } catch (const std::exception& e) {
            print_error("logger {} write fail, {}\n", name_, e.what());
        }
    }
}

}  // namespace gatecore
