#pragma once
#include <string>

#include "scrape/scrape_config.hpp"
#include "scrape/supervisor_config.hpp"

// 把 supervisor 参数映射为引擎的抓取任务配置。
// 不做业务规则预检，校验交给 ScrapeJobConfig::validate；失败抛 ConfigError(CONFIG_STAGE_BUILD)。
ScrapeJobConfig buildScrapeConfig(const std::string& instanceID, const SupervisorConfig& args);
