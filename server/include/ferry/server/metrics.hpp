#pragma once

#include <cstdint>
#include <string_view>

namespace ferry::server
{

    inline constexpr std::string_view kMetricDownloads = "Downloads";
    inline constexpr std::string_view kMetricUploads = "Uploads";
    inline constexpr std::string_view kMetricActiveClients = "ActiveClients";

    class MetricsSink
    {
    public:
        virtual ~MetricsSink() = default;

        virtual void record(std::string_view name, std::int64_t value) = 0;
    };

    /// Writes every observation as a one-line JSON object to the default logger.
    class LogMetricsSink : public MetricsSink
    {
    public:
        void record(std::string_view name, std::int64_t value) override;
    };

    /// Fire-and-forget: sink failures are logged and dropped.
    void emit_metric(MetricsSink &sink, std::string_view name, std::int64_t value) noexcept;

} // namespace ferry::server
