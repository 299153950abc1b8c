#include <gatecore/log/console_appender.h>
#include <gatecore/log/file_appender.h>
#include <gatecore/log/log.h>
#include <gatecore/log/log_system.h>
#include <gatecore/utils/toml_types.hpp>

#include <fstream>

namespace gatecore {

struct log_options {
    std::string pattern;
    log_time_type time_type{log_time_type::local};
    log_level level{log_level::info};
};

static log_time_type read_time_type(const std::string& key, const toml_table_t& table, log_time_type default_value) {
    std::string temp;
    if (!read_toml_string(temp, key, table)) {
        return default_value;
    }
    if (const auto value = parse_log_time_type(temp)) {
        return *value;
    }
    throw std::logic_error(fmt::format("log config '{}' need local or utc, got '{}'", key, temp));
}

static void read_pattern_and_time_type(log_options& config, const toml_table_t& table) {
    read_toml_string(config.pattern, "pattern", table);
    config.time_type = read_time_type("time", table, config.time_type);
}

static void read_level(log_options& config, const toml_table_t& table) {
    std::string temp;
    if (!read_toml_string(temp, "level", table)) {
        return;
    }
    if (const auto level = parse_log_level(temp)) {
        config.level = *level;
        return;
    }
    throw std::logic_error(fmt::format("log config unknown level '{}'", temp));
}

static log_appender_ptr create_appender(const log_options& logger_config, const std::string& logger_name,
                                        const toml_table_t& table) {
    log_options custom_config = logger_config;
    read_pattern_and_time_type(custom_config, table);
    read_level(custom_config, table);

    std::string type;
    if (!read_toml_string(type, "type", table)) {
        throw std::logic_error(fmt::format("logger '{}' appender need 'type'", logger_name));
    }

    log_appender_ptr appender;
    if (type == "stdout" || type == "stderr") {
        auto console = std::make_shared<console_appender>(type == "stdout" ? console_stream::out : console_stream::err);
        if (bool color = console->color(); read_toml_boolean(color, "color", table)) {
            console->set_color(color);
        }
        appender = std::move(console);
    } else if (type == "file") {
        file_appender_config file_config;
        file_config.name = logger_name.empty() ? "gatecore" : logger_name;
        read_toml_string(file_config.name, "name", table);
        read_toml_string(file_config.log_directory, "log_directory", table);
        int64_t max_size = 0;
        if (read_toml_integer(max_size, "max_size", table) && max_size > 0) {
            file_config.max_size = static_cast<size_t>(max_size);
        }
        file_config.file_time = read_time_type("file_time", table, file_config.file_time);
        read_toml_boolean(file_config.daily_roll, "daily_roll", table);
        appender = std::make_shared<file_appender>(std::move(file_config));
    } else {
        throw std::logic_error(fmt::format("logger '{}' unknown appender type '{}'", logger_name, type));
    }

    if (!custom_config.pattern.empty()) {
        appender->set_pattern(custom_config.pattern, custom_config.time_type);
    }
    appender->set_level(custom_config.level);
    return appender;
}

static logger_ptr create_logger(const log_options& global, const std::string& name, const toml_table_t& table) {
    log_options custom_config = global;
    read_pattern_and_time_type(custom_config, table);
    read_level(custom_config, table);

    const auto it = table.find("appenders");
    if (it == table.end() || !it->second.is_array()) {
        return {};
    }

    std::vector<log_appender_ptr> appenders;
    for (const auto& val : it->second.as_array()) {
        if (val.is_table()) {
            appenders.emplace_back(create_appender(custom_config, name, val.as_table()));
        }
    }

    if (appenders.empty()) {
        return {};
    }

    auto ptr = std::make_shared<logger>(name, appenders);
    ptr->set_level(custom_config.level);
    return ptr;
}

void load_log_config(const std::string& path) {
    std::ifstream ifs(path, std::ios_base::binary | std::ios_base::in);
    if (!ifs.is_open()) {
        throw std::logic_error(fmt::format("load_log_config open {} fail, {}", path, std::generic_category().message(errno)));
    }

    const auto config = toml::parse(ifs, path);
    const auto& root = config.as_table();

    log_options global;
    read_pattern_and_time_type(global, root);
    read_level(global, root);

    std::string default_name;
    read_toml_string(default_name, "default", root);

    // 先全部构造出来，配置有误时不影响当前的 logger
    std::vector<logger_ptr> loggers;
    logger_ptr new_default;
    for (const auto& [key, value] : root) {
        if (!value.is_table()) {
            continue;
        }

        auto custom = create_logger(global, key, value.as_table());
        if (!custom) {
            continue;
        }

        if (key == default_name) {
            new_default = custom;
        } else {
            loggers.emplace_back(std::move(custom));
        }
    }

    if (!new_default) {
        new_default = std::make_shared<logger>("", std::make_shared<console_appender>());
        if (!global.pattern.empty()) {
            new_default->set_pattern(global.pattern, global.time_type);
        }
        new_default->set_level(global.level);
    }

    auto& system = log_system::instance();
    system.drop_all();
    system.set_levels({}, &global.level);
    for (auto& ptr : loggers) {
        system.register_logger(std::move(ptr));
    }
    system.set_default(std::move(new_default));
}

void register_logger(logger_ptr new_logger) { return log_system::instance().register_logger(std::move(new_logger)); }

logger_ptr find_logger(const std::string& name) { return log_system::instance().find(name); }

void drop_logger(const std::string& name) { return log_system::instance().drop(name); }

void drop_all_loggers() { return log_system::instance().drop_all(); }

logger_ptr default_logger() { return log_system::instance().default_logger(); }

void set_default_logger(logger_ptr new_default_logger) {
    return log_system::instance().set_default(std::move(new_default_logger));
}

void set_log_level(log_level level) { return log_system::instance().set_level(level); }

void set_log_levels(log_levels levels, const log_level* global_level) {
    return log_system::instance().set_levels(std::move(levels), global_level);
}

void set_log_pattern(const std::string_view& pattern, log_time_type time_type) {
    return log_system::instance().set_pattern(pattern, time_type);
}

void log_flush() { return log_system::instance().flush(); }

}  // namespace gatecore
