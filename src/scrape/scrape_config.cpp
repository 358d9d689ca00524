#include "scrape/scrape_config.hpp"

#include <stdexcept>
#include <fmt/core.h>

#include "common/units.hpp"

void ScrapeJobConfig::validate() const
{
    if (JobName.empty())
        throw std::invalid_argument("job_name is empty");
    if (Scheme != "http" && Scheme != "https")
        throw std::invalid_argument(fmt::format("invalid scheme \"{}\", must be http or https", Scheme));
    if (MetricsPath.empty() || MetricsPath.front() != '/')
        throw std::invalid_argument(fmt::format("metrics_path \"{}\" must start with '/'", MetricsPath));
    if (ScrapeInterval <= std::chrono::milliseconds::zero())
        throw std::invalid_argument("scrape_interval must be greater than zero");
    if (ScrapeTimeout <= std::chrono::milliseconds::zero())
        throw std::invalid_argument("scrape_timeout must be greater than zero");
    if (ScrapeTimeout > ScrapeInterval)
        throw std::invalid_argument(fmt::format(
            "scrape timeout greater than scrape interval for scrape config with job name \"{}\" ({} > {})",
            JobName, units::formatDuration(ScrapeTimeout), units::formatDuration(ScrapeInterval)));

    try {
        HTTPClient.validate();
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument(fmt::format("http_client_config: {}", e.what()));
    }
}

bool operator==(const ScrapeJobConfig& a, const ScrapeJobConfig& b)
{
    return a.JobName == b.JobName && a.HonorLabels == b.HonorLabels &&
           a.HonorTimestamps == b.HonorTimestamps && a.Params == b.Params &&
           a.ScrapeInterval == b.ScrapeInterval && a.ScrapeTimeout == b.ScrapeTimeout &&
           a.MetricsPath == b.MetricsPath && a.Scheme == b.Scheme &&
           a.BodySizeLimit == b.BodySizeLimit && a.SampleLimit == b.SampleLimit &&
           a.TargetLimit == b.TargetLimit && a.LabelLimit == b.LabelLimit &&
           a.LabelNameLengthLimit == b.LabelNameLengthLimit &&
           a.LabelValueLengthLimit == b.LabelValueLengthLimit &&
           a.HTTPClient == b.HTTPClient;
}
