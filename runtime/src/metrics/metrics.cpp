#include <gatecore/metrics/metrics.h>

namespace gatecore {

metrics_sink_ptr metrics_or_null(metrics_sink_ptr sink) {
    if (sink) {
        return sink;
    }

    static const auto null_sink = std::make_shared<null_metrics>();
    return null_sink;
}

void metrics_registry::inc_counter(std::string_view name, int64_t delta) {
    std::scoped_lock lock(mtx_);
    if (const auto it = counters_.find(name); it != counters_.end()) {
        it->second += delta;
        return;
    }
    counters_.emplace(std::string(name), delta);
}

void metrics_registry::observe_duration(std::string_view name, std::chrono::nanoseconds duration) {
    std::scoped_lock lock(mtx_);
    auto it = durations_.find(name);
    if (it == durations_.end()) {
        it = durations_.emplace(std::string(name), duration_summary{}).first;
    }

    auto& summary = it->second;
    ++summary.count;
    summary.sum += duration;
    if (duration > summary.max) {
        summary.max = duration;
    }
}

int64_t metrics_registry::counter(std::string_view name) const {
    std::scoped_lock lock(mtx_);
    if (const auto it = counters_.find(name); it != counters_.end()) {
        return it->second;
    }
    return 0;
}

metrics_snapshot metrics_registry::snapshot() const {
    std::scoped_lock lock(mtx_);
    metrics_snapshot result;
    result.counters.insert(counters_.begin(), counters_.end());
    result.durations.insert(durations_.begin(), durations_.end());
    return result;
}

}  // namespace gatecore
