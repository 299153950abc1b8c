#include <fmt/chrono.h>
#include <gatecore/log/file_appender.h>
#include <gatecore/log/log.h>
#include <gatecore/log/logmsg.h>
#include <gatecore/utils/os.h>

namespace gatecore {

static std::tm to_tm(const log_clock_point& point, log_time_type tp) {
    const auto t = log_clock::to_time_t(point);
    return tp == log_time_type::local ? fmt::localtime(t) : fmt::gmtime(t);
}

file_appender::file_appender(file_appender_config config) : config_(std::move(config)) {
    cached_point_ = log_clock::now();
    cached_tm_ = to_tm(cached_point_, config_.file_time);

    std::error_code ec;
    std::filesystem::create_directories(config_.log_directory, ec);
    if (ec) {
        print_error("file_appender create directory {} fail, {}\n", config_.log_directory, ec.message());
    }
}

void file_appender::write(const log_message& msg, std::string_view text, log_color_range) {
    using std::chrono::seconds;
    const auto& point = msg.point;

    if (duration_cast<seconds>(point.time_since_epoch()) > duration_cast<seconds>(cached_point_.time_since_epoch())) {
        const auto current_tm = to_tm(point, config_.file_time);
        if (config_.daily_roll && (current_tm.tm_year != cached_tm_.tm_year || current_tm.tm_yday != cached_tm_.tm_yday)) {
            roll_file();
        }

        cached_tm_ = current_tm;
        cached_point_ = point;
    }

    if (!file_stream_.is_open()) {
        make_full_name();
        file_stream_.open(full_name_, std::ios_base::binary | std::ios_base::out | std::ios_base::trunc);
        if (!file_stream_.is_open()) {
            print_error("file_appender::open {} fail, {}\n", full_name_.string(), std::generic_category().message(errno));
            return;
        }
    }

    file_stream_.write(text.data(), static_cast<std::streamsize>(text.size()));
    file_size_ += text.size();

    if (config_.max_size > 0 && file_size_ >= config_.max_size) {
        roll_file();
    }
}

void file_appender::sync() {
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
}

void file_appender::make_full_name() {
    using std::chrono::seconds;
    if (const auto current = duration_cast<seconds>(cached_point_.time_since_epoch()); file_secs_ < current) {
        file_secs_ = current;
        file_id_ = 0;
    }

    std::string name;
    if (file_id_ == 0) {
        name = fmt::format("{}_{:%Y-%m-%d_%H-%M-%S}_{}.log", config_.name, cached_tm_, os::pid());
    } else {
        name = fmt::format("{}_{:%Y-%m-%d_%H-%M-%S}_{}_{}.log", config_.name, cached_tm_, os::pid(), file_id_);
    }

    full_name_ = std::filesystem::path(config_.log_directory) / name;
    ++file_id_;
}

void file_appender::roll_file() {
    if (!file_stream_.is_open()) {
        return;
    }

    file_stream_.close();
    file_size_ = 0;
}

}  // namespace gatecore
