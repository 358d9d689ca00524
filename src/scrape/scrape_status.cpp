#include "scrape/scrape_status.hpp"

#include <date/date.h>

namespace
{
    std::string formatTime(std::chrono::system_clock::time_point tp)
    {
        if (tp == std::chrono::system_clock::time_point{}) return "";
        return date::format("%FT%TZ", date::floor<std::chrono::milliseconds>(tp));
    }
} // namespace

void to_json(nlohmann::json& j, const TargetStatus& s)
{
    j = nlohmann::json{
        {"job", s.JobName},
        {"url", s.URL},
        {"health", healthName(s.Health)},
        {"labels", s.Labels},
        {"last_error", s.LastError},
        {"last_scrape", formatTime(s.LastScrape)},
        {"last_scrape_duration", std::chrono::duration<double>(s.LastScrapeDuration).count()},
    };
}

void to_json(nlohmann::json& j, const ScraperStatus& s)
{
    j = nlohmann::json::object();
    j["target"] = nlohmann::json::array();
    for (const auto& t : s.Targets) {
        j["target"].push_back(t);
    }
}
