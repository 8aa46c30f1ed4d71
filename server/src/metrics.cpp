#include "ferry/server/metrics.hpp"

#include <exception>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ferry::server
{

    void LogMetricsSink::record(std::string_view name, std::int64_t value)
    {
        const nlohmann::json observation{
            {"metric", std::string(name)},
            {"value", value},
        };
        spdlog::info("metric {}", observation.dump());
    }

    void emit_metric(MetricsSink &sink, std::string_view name, std::int64_t value) noexcept
    {
        try
        {
            sink.record(name, value);
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Failed to record metric {}: {}", name, ex.what());
        }
    }

} // namespace ferry::server
