#include "scrape/config_builder.hpp"

#include <stdexcept>

#include "common/config_error.hpp"

ScrapeJobConfig buildScrapeConfig(const std::string& instanceID, const SupervisorConfig& args)
{
    ScrapeJobConfig sc;
    sc.JobName = args.JobName.empty() ? instanceID : args.JobName;

    sc.HonorLabels     = args.HonorLabels;
    sc.HonorTimestamps = args.HonorTimestamps;
    sc.Params          = args.Params;
    sc.ScrapeInterval  = args.ScrapeInterval;
    sc.ScrapeTimeout   = args.ScrapeTimeout;
    sc.MetricsPath     = args.MetricsPath;
    sc.Scheme          = args.Scheme;

    sc.BodySizeLimit         = args.BodySizeLimit;
    sc.SampleLimit           = args.SampleLimit;
    sc.TargetLimit           = args.TargetLimit;
    sc.LabelLimit            = args.LabelLimit;
    sc.LabelNameLengthLimit  = args.LabelNameLengthLimit;
    sc.LabelValueLengthLimit = args.LabelValueLengthLimit;

    sc.HTTPClient = args.HTTPClient;

    try {
        sc.validate();
    } catch (const std::invalid_argument& e) {
        throw ConfigError(CONFIG_STAGE_BUILD, e.what());
    }
    return sc;
}
