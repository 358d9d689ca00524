#include "scrape/scrape_target.hpp"

#include <utility>

std::uint64_t labelSetHash(const std::string& url, const LabelSet& labels)
{
    constexpr std::uint64_t kOffset = 14695981039346656037ULL;
    constexpr std::uint64_t kPrime  = 1099511628211ULL;

    std::uint64_t h = kOffset;
    auto mix = [&h](const std::string& s) {
        for (unsigned char c : s) {
            h ^= c;
            h *= kPrime;
        }
        h ^= 0xff;   // 分隔符，避免 "ab"+"c" 与 "a"+"bc" 相同
        h *= kPrime;
    };
    mix(url);
    for (const auto& [name, value] : labels) {
        mix(name);
        mix(value);
    }
    return h;
}

ScrapeTarget::ScrapeTarget(std::string job, std::string url, LabelSet labels, LabelSet discoveredLabels)
    : job_(std::move(job)),
      url_(std::move(url)),
      labels_(std::move(labels)),
      discovered_(std::move(discoveredLabels)),
      hash_(labelSetHash(url_, labels_))
{
}

TargetHealth ScrapeTarget::health() const
{
    std::lock_guard lg(mtx_);
    return health_;
}

std::string ScrapeTarget::lastError() const
{
    std::lock_guard lg(mtx_);
    return lastError_;
}

std::chrono::system_clock::time_point ScrapeTarget::lastScrape() const
{
    std::lock_guard lg(mtx_);
    return lastScrape_;
}

std::chrono::nanoseconds ScrapeTarget::lastScrapeDuration() const
{
    std::lock_guard lg(mtx_);
    return lastDuration_;
}

void ScrapeTarget::report(std::chrono::system_clock::time_point start,
                          std::chrono::nanoseconds duration,
                          const std::string& error)
{
    std::lock_guard lg(mtx_);
    health_       = error.empty() ? TargetHealth::Up : TargetHealth::Down;
    lastError_    = error;
    lastScrape_   = start;
    lastDuration_ = duration;
}
