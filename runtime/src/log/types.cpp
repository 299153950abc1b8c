#include <gatecore/log/types.h>

#include <array>

namespace gatecore {

namespace {

struct level_name {
    log_level level;
    std::string_view name;
};

constexpr std::array level_names{
    level_name{log_level::off, "off"},     level_name{log_level::critical, "critical"},
    level_name{log_level::error, "error"}, level_name{log_level::warn, "warn"},
    level_name{log_level::info, "info"},   level_name{log_level::debug, "debug"},
    level_name{log_level::trace, "trace"}, level_name{log_level::warn, "warning"},
    level_name{log_level::error, "err"},
};

bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
        auto ch = lhs[i];
        if (ch >= 'A' && ch <= 'Z') {
            ch = static_cast<char>(ch - 'A' + 'a');
        }
        if (ch != rhs[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string_view to_string_view(log_level level) noexcept {
    const auto index = static_cast<size_t>(level);
    // 别名排在最后，前 7 项和枚举值一一对应
    if (index <= static_cast<size_t>(log_level::trace)) {
        return level_names[index].name;
    }
    return {};
}

char to_letter(log_level level) noexcept {
    const auto name = to_string_view(level);
    if (name.empty()) {
        return '?';
    }
    return static_cast<char>(name[0] - 'a' + 'A');
}

std::optional<log_level> parse_log_level(std::string_view strv) noexcept {
    for (const auto& item : level_names) {
        if (iequals(strv, item.name)) {
            return item.level;
        }
    }
    return std::nullopt;
}

std::optional<log_time_type> parse_log_time_type(std::string_view strv) noexcept {
    if (iequals(strv, "local")) {
        return log_time_type::local;
    }
    if (iequals(strv, "utc")) {
        return log_time_type::utc;
    }
    return std::nullopt;
}

}  // namespace gatecore
