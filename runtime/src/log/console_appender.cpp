#include <gatecore/log/console_appender.h>
#include <gatecore/log/log.h>
#include <gatecore/log/logmsg.h>
#include <gatecore/utils/os.h>

namespace gatecore {

// stdout 和 stderr 可能是同一个终端，共用一把锁避免交错
static std::mutex console_mtx;

static std::string_view level_color(log_level level) {
    switch (level) {
        case log_level::critical:
            return "\033[1m\033[41m";
        case log_level::error:
            return "\033[31m\033[1m";
        case log_level::warn:
            return "\033[33m\033[1m";
        case log_level::info:
            return "\033[32m";
        case log_level::debug:
            return "\033[36m";
        case log_level::trace:
            return "\033[37m";
        default:
            return {};
    }
}

static void put(std::string_view text, FILE* file) {
    fwrite(text.data(), sizeof(char), text.size(), file);  // NOLINT(cert-err33-c)
}

static FILE* stream_file(console_stream stream) { return stream == console_stream::err ? stderr : stdout; }

console_appender::console_appender(console_stream stream)
    : file_(stream_file(stream)), color_(os::is_color_terminal() && os::in_terminal(file_)) {}

void console_appender::write(const log_message& msg, std::string_view text, log_color_range color) {
    const auto code = level_color(msg.level);
    std::scoped_lock lock(console_mtx);
    if (!color_ || color.empty() || code.empty()) {
        put(text, file_);
    } else {
        put(text.substr(0, color.start), file_);
        put(code, file_);
        put(text.substr(color.start, color.stop - color.start), file_);
        put("\033[m", file_);
        put(text.substr(color.stop), file_);
    }
    fflush(file_);  // NOLINT(cert-err33-c)
}

void console_appender::sync() {
    std::scoped_lock lock(console_mtx);
    fflush(file_);  // NOLINT(cert-err33-c)
}

void write_console(const std::string_view& strv, FILE* file) {
    std::scoped_lock lock(console_mtx);
    put(strv, file);
}

}  // namespace gatecore
