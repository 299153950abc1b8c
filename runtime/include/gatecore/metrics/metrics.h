#pragma once
#include <gatecore/config.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace gatecore {

// 指标上报接口，调用方不关心结果
class metrics_sink {
  public:
    metrics_sink() = default;

    virtual ~metrics_sink() noexcept = default;

    GATECORE_NON_COPYABLE(metrics_sink)

    virtual void inc_counter(std::string_view name, int64_t delta = 1) = 0;

    virtual void observe_duration(std::string_view name, std::chrono::nanoseconds duration) = 0;
};

using metrics_sink_ptr = std::shared_ptr<metrics_sink>;

class null_metrics final : public metrics_sink {
  public:
    null_metrics() = default;

    ~null_metrics() noexcept override = default;

    GATECORE_NON_COPYABLE(null_metrics)

    void inc_counter(std::string_view, int64_t) override {}

    void observe_duration(std::string_view, std::chrono::nanoseconds) override {}
};

// 传入空指针时返回一个共享的 null_metrics
GATECORE_API metrics_sink_ptr metrics_or_null(metrics_sink_ptr sink);

struct duration_summary {
    int64_t count{0};
    std::chrono::nanoseconds sum{0};
    std::chrono::nanoseconds max{0};
};

struct metrics_snapshot {
    std::map<std::string, int64_t> counters;
    std::map<std::string, duration_summary> durations;
};

class metrics_registry final : public metrics_sink {
  public:
    GATECORE_API metrics_registry() = default;

    ~metrics_registry() noexcept override = default;

    GATECORE_NON_COPYABLE(metrics_registry)

    GATECORE_API void inc_counter(std::string_view name, int64_t delta) override;

    GATECORE_API void observe_duration(std::string_view name, std::chrono::nanoseconds duration) override;

    [[nodiscard]] GATECORE_API int64_t counter(std::string_view name) const;

    [[nodiscard]] GATECORE_API metrics_snapshot snapshot() const;

  private:
    mutable std::mutex mtx_;
    std::map<std::string, int64_t, std::less<>> counters_;
    std::map<std::string, duration_summary, std::less<>> durations_;
};

}  // namespace gatecore
