#include <gatecore/log/console_appender.h>
#include <gatecore/log/log_system.h>

#include <stdexcept>

namespace gatecore {

log_system::log_system() {
    default_logger_ = std::make_shared<logger>("", std::make_shared<console_appender>());
    default_logger_->set_level(global_level_);
}

log_system& log_system::instance() {
    static log_system system;
    return system;
}

void log_system::register_logger(logger_ptr new_logger) {
    std::scoped_lock lock(mtx_);
    const auto& name = new_logger->name();
    if (loggers_.contains(name)) {
        throw std::logic_error(fmt::format("logger with name '{}' already exists", name));
    }

    if (const auto it = levels_.find(name); it != levels_.end()) {
        new_logger->set_level(it->second);
    }

    loggers_.emplace(name, std::move(new_logger));
}

logger_ptr log_system::find(const std::string& name) {
    std::scoped_lock lock(mtx_);
    if (const auto it = loggers_.find(name); it != loggers_.end()) {
        return it->second;
    }
    return {};
}

void log_system::drop(const std::string& name) {
    std::scoped_lock lock(mtx_);
    loggers_.erase(name);
    if (default_logger_ && default_logger_->name() == name) {
        default_logger_.reset();
    }
}

void log_system::drop_all() {
    std::scoped_lock lock(mtx_);
    loggers_.clear();
    default_logger_.reset();
}

logger_ptr log_system::default_logger() {
    std::scoped_lock lock(mtx_);
    return default_logger_;
}

void log_system::set_default(logger_ptr new_default_logger) {
    std::scoped_lock lock(mtx_);
    if (default_logger_) {
        loggers_.erase(default_logger_->name());
    }

    if (new_default_logger) {
        loggers_[new_default_logger->name()] = new_default_logger;
    }

    default_logger_ = std::move(new_default_logger);
}

void log_system::set_level(log_level level) {
    std::scoped_lock lock(mtx_);
    for (const auto& [_, ptr] : loggers_) {
        ptr->set_level(level);
    }
    if (default_logger_) {
        default_logger_->set_level(level);
    }
    global_level_ = level;
}

void log_system::set_levels(log_levels levels, const log_level* global_level) {
    std::scoped_lock lock(mtx_);
    levels_ = std::move(levels);
    if (global_level != nullptr) {
        global_level_ = *global_level;
    }

    for (const auto& [name, ptr] : loggers_) {
        if (const auto it = levels_.find(name); it != levels_.end()) {
            ptr->set_level(it->second);
        } else if (global_level != nullptr) {
            ptr->set_level(*global_level);
        }
    }
}

void log_system::set_pattern(const std::string_view& pattern, log_time_type time_type) {
    std::scoped_lock lock(mtx_);
    for (const auto& [_, ptr] : loggers_) {
        ptr->set_pattern(pattern, time_type);
    }
    if (default_logger_) {
        default_logger_->set_pattern(pattern, time_type);
    }
}

void log_system::flush() {
    std::scoped_lock lock(mtx_);
    for (const auto& [_, ptr] : loggers_) {
        ptr->flush();
    }
    if (default_logger_) {
        default_logger_->flush();
    }
}

}  // namespace gatecore
