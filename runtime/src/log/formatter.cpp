#include <fmt/chrono.h>
#include <gatecore/log/formatter.h>
#include <gatecore/log/logmsg.h>

namespace gatecore {

static void append_strv(log_buf_t& dest, std::string_view strv) { dest.append(strv.data(), strv.data() + strv.size()); }

static void pad2(log_buf_t& dest, int v) {
    if (v >= 0 && v < 100) {
        dest.push_back(static_cast<char>('0' + v / 10));
        dest.push_back(static_cast<char>('0' + v % 10));
    } else {
        fmt::format_to(std::back_inserter(dest), "{:02}", v);
    }
}

static std::string_view file_basename(const char* filename) {
    std::string_view strv(filename);
    if (const auto pos = strv.find_last_of("/\\"); pos != std::string_view::npos) {
        return strv.substr(pos + 1);
    }
    return strv;
}

static void append_context(log_buf_t& dest, const log_context& ctx) {
    if (ctx.empty()) return;

    auto out = std::back_inserter(dest);
    dest.push_back('[');
    const auto start = dest.size();
    if (ctx.connection != 0) {
        fmt::format_to(out, "conn:{}", ctx.connection);
    }
    if (ctx.session != 0) {
        fmt::format_to(out, "{}session:{}", dest.size() > start ? " " : "", ctx.session);
    }
    if (ctx.player != 0) {
        fmt::format_to(out, "{}player:{}", dest.size() > start ? " " : "", ctx.player);
    }
    append_strv(dest, "] ");
}

log_formatter::log_formatter() : log_formatter(default_pattern) {}

log_formatter::log_formatter(const std::string_view& pattern, log_time_type tp) : time_type_(tp) { set_pattern(pattern); }

void log_formatter::set_pattern(const std::string_view& pattern) {
    pattern_ = pattern;
    tokens_.clear();

    std::string literal;
    for (size_t i = 0; i < pattern.size(); ++i) {
        const char ch = pattern[i];
        if (ch != '%' || i + 1 == pattern.size()) {
            literal.push_back(ch);
            continue;
        }

        const char flag = pattern[++i];
        if (flag == '%') {
            literal.push_back('%');
            continue;
        }

        if (!literal.empty()) {
            tokens_.push_back({0, std::move(literal)});
            literal.clear();
        }
        tokens_.push_back({flag, {}});
    }

    if (!literal.empty()) {
        tokens_.push_back({0, std::move(literal)});
    }
}

const std::tm& log_formatter::get_time(const log_message& msg) {
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(msg.point.time_since_epoch());
    if (secs != last_log_secs_) {
        cached_tm_ = time_type_ == log_time_type::local ? fmt::localtime(log_clock::to_time_t(msg.point))
                                                        : fmt::gmtime(log_clock::to_time_t(msg.point));
        last_log_secs_ = secs;
    }
    return cached_tm_;
}

log_color_range log_formatter::format(const log_message& msg, log_buf_t& dest) {
    const auto& tm = get_time(msg);
    log_color_range color;

    for (const auto& tk : tokens_) {
        switch (tk.flag) {
            case 0:
                append_strv(dest, tk.literal);
                break;
            case 'Y':
                fmt::format_to(std::back_inserter(dest), "{}", tm.tm_year + 1900);
                break;
            case 'm':
                pad2(dest, tm.tm_mon + 1);
                break;
            case 'd':
                pad2(dest, tm.tm_mday);
                break;
            case 'H':
                pad2(dest, tm.tm_hour);
                break;
            case 'M':
                pad2(dest, tm.tm_min);
                break;
            case 'S':
                pad2(dest, tm.tm_sec);
                break;
            case 'e': {
                const auto ms =
                    std::chrono::duration_cast<std::chrono::milliseconds>(msg.point.time_since_epoch()).count() % 1000;
                fmt::format_to(std::back_inserter(dest), "{:03}", ms);
                break;
            }
            case 'l':
                append_strv(dest, to_string_view(msg.level));
                break;
            case 'L':
                dest.push_back(to_letter(msg.level));
                break;
            case 'n':
                append_strv(dest, msg.logger_name);
                break;
            case 't':
                fmt::format_to(std::back_inserter(dest), "{}", msg.tid);
                break;
            case 's':
                append_strv(dest, file_basename(msg.source.file_name()));
                break;
            case '#':
                fmt::format_to(std::back_inserter(dest), "{}", msg.source.line());
                break;
            case 'v':
                append_strv(dest, msg.payload);
                break;
            case 'c':
                append_context(dest, msg.context);
                break;
            case 'C':
                fmt::format_to(std::back_inserter(dest), "{}", msg.context.connection);
                break;
            case 'I':
                fmt::format_to(std::back_inserter(dest), "{}", msg.context.session);
                break;
            case 'P':
                fmt::format_to(std::back_inserter(dest), "{}", msg.context.player);
                break;
            case '^':
                color.start = dest.size();
                break;
            case '$':
                color.stop = dest.size();
                break;
            default:
                // 不认识的格式符原样输出
                dest.push_back('%');
                dest.push_back(tk.flag);
                break;
        }
    }

    dest.push_back('\n');
    return color;
}

std::unique_ptr<log_formatter> log_formatter::clone() const {
    return std::make_unique<log_formatter>(pattern_, time_type_);
}

}  // namespace gatecore
