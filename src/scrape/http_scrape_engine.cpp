#include "scrape/http_scrape_engine.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <mutex>
#include <sstream>
#include <stdexcept>

#include <curl/curl.h>
#include <fmt/core.h>

#include "common/units.hpp"

namespace
{
    struct CurlDeleter {
        void operator()(CURL* c) const { curl_easy_cleanup(c); }
    };
    struct SlistDeleter {
        void operator()(curl_slist* l) const { curl_slist_free_all(l); }
    };
    using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
    using CurlSlist  = std::unique_ptr<curl_slist, SlistDeleter>;

    struct FetchContext {
        std::string     body;
        std::uint64_t   limit    = 0;
        bool            exceeded = false;
        std::stop_token stop;
    };

    size_t write_cb(char* ptr, size_t size, size_t n, void* userdata)
    {
        auto* ctx = static_cast<FetchContext*>(userdata);
        const size_t len = size * n;
        if (ctx->limit > 0 && ctx->body.size() + len > ctx->limit) {
            ctx->exceeded = true;
            return 0;   // 让 curl 以 CURLE_WRITE_ERROR 结束
        }
        ctx->body.append(ptr, len);
        return len;
    }

    int progress_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
    {
        auto* ctx = static_cast<FetchContext*>(userdata);
        return ctx->stop.stop_requested() ? 1 : 0;
    }

    bool hasPrefix(const std::string& s, const std::string& prefix)
    {
        return s.compare(0, prefix.size(), prefix) == 0;
    }

    std::string urlEscape(const std::string& in)
    {
        static const char* hex = "0123456789ABCDEF";
        std::string out;
        out.reserve(in.size());
        for (unsigned char c : in) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                out += static_cast<char>(c);
            } else {
                out += '%';
                out += hex[c >> 4];
                out += hex[c & 0x0f];
            }
        }
        return out;
    }

    bool isSampleLine(const std::string& line)
    {
        auto pos = line.find_first_not_of(" \t\r");
        return pos != std::string::npos && line[pos] != '#';
    }

    std::once_flag curlInitOnce;
} // namespace

/* ---------- 构造/析构 ---------- */
HttpScrapeEngine::HttpScrapeEngine(EngineOptions opts, std::shared_ptr<Fanout> fanout, size_t numWorkers)
    : opts_(std::move(opts)),
      fanout_(std::move(fanout)),
      scheduler_(numWorkers)
{
    std::call_once(curlInitOnce, [] {
        if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK)
            throw std::runtime_error("curl_global_init failed");
        spdlog::debug("HttpScrapeEngine: curl_global_init done");
    });
    spdlog::info("HttpScrapeEngine: initialized with {} workers, extra_metrics={}",
                 numWorkers, opts_.ExtraMetrics);
}

HttpScrapeEngine::~HttpScrapeEngine()
{
    stop();
}

/* ---------- IScrapeEngine ---------- */
void HttpScrapeEngine::applyConfig(const ScrapeJobConfig& config)
{
    try {
        config.validate();
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(fmt::format("scrape job \"{}\" rejected: {}", config.JobName, e.what()));
    }

    std::unique_lock lk(mtx_);
    if (config_ && *config_ == config) {
        spdlog::debug("HttpScrapeEngine: config for job {} unchanged", config.JobName);
        return;
    }
    config_ = config;
    rebuildLocked();
    spdlog::info("HttpScrapeEngine: applied config for job {} (interval {}, timeout {})",
                 config.JobName, units::formatDuration(config.ScrapeInterval),
                 units::formatDuration(config.ScrapeTimeout));
}

void HttpScrapeEngine::run(TargetSetChannel& targetSets)
{
    spdlog::info("HttpScrapeEngine: waiting for target sets");
    auto token = stop_.get_token();
    while (auto sets = targetSets.receive(token)) {
        sync(std::move(*sets));
    }
    spdlog::info("HttpScrapeEngine: target set input closed");
}

TargetsByJob HttpScrapeEngine::targetsActive() const
{
    TargetsByJob out;
    std::shared_lock lk(mtx_);
    for (const auto& [hash, entry] : active_) {
        out[entry.target->job()].push_back(entry.target);
    }
    lk.unlock();

    for (auto& [job, targets] : out) {
        std::sort(targets.begin(), targets.end(), [](const auto& a, const auto& b) {
            return a->url() < b->url();
        });
    }
    return out;
}

void HttpScrapeEngine::stop()
{
    if (stopped_.exchange(true)) return;
    stop_.request_stop();
    scheduler_.shutdown();
    {
        std::unique_lock lk(mtx_);
        active_.clear();
    }
    spdlog::info("HttpScrapeEngine: stopped");
}

/* ---------- 目标同步 ---------- */
void HttpScrapeEngine::sync(TargetSets sets)
{
    std::unique_lock lk(mtx_);
    for (auto& [provider, groups] : sets) {
        targetSets_[provider] = std::move(groups);
    }
    rebuildLocked();
}

void HttpScrapeEngine::rebuildLocked()
{
    if (stopped_) return;
    if (!config_) {
        spdlog::debug("HttpScrapeEngine: no config applied yet, deferring {} target providers", targetSets_.size());
        return;
    }
    const auto& cfg = *config_;

    std::map<std::uint64_t, PopulatedTarget> desired;
    for (const auto& [provider, groups] : targetSets_) {
        for (const auto& group : groups) {
            for (const auto& raw : group.Targets) {
                std::string reason;
                auto populated = populateTarget(raw, cfg, reason);
                if (!populated) {
                    spdlog::warn("HttpScrapeEngine: dropping target from {}: {}", group.Source, reason);
                    continue;
                }
                auto hash = labelSetHash(populated->URL, populated->Labels);
                desired.emplace(hash, std::move(*populated));
            }
        }
    }

    targetCount_ = desired.size();
    targetLimitExceeded_ = cfg.TargetLimit > 0 && targetCount_ > cfg.TargetLimit;
    if (targetLimitExceeded_) {
        spdlog::warn("HttpScrapeEngine: job {} has {} targets, exceeding target_limit {}",
                     cfg.JobName, targetCount_, cfg.TargetLimit);
    }

    size_t removed = 0;
    for (auto it = active_.begin(); it != active_.end();) {
        if (desired.count(it->first) == 0) {
            scheduler_.cancelTimer(it->second.timerId);
            it = active_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    const bool reschedule = scheduledInterval_ != cfg.ScrapeInterval;
    scheduledInterval_ = cfg.ScrapeInterval;

    size_t added = 0;
    for (auto& [hash, populated] : desired) {
        auto it = active_.find(hash);
        if (it != active_.end()) {
            if (reschedule) {
                scheduler_.cancelTimer(it->second.timerId);
                scheduleLocked(it->second);
            }
            continue;
        }
        ActiveTarget entry{
            std::make_shared<ScrapeTarget>(cfg.JobName, populated.URL,
                                           std::move(populated.Labels),
                                           std::move(populated.Discovered)),
            0};
        scheduleLocked(entry);
        active_.emplace(hash, std::move(entry));
        ++added;
    }

    spdlog::debug("HttpScrapeEngine: job {} synced, {} active, {} added, {} removed",
                  cfg.JobName, active_.size(), added, removed);
}

void HttpScrapeEngine::scheduleLocked(ActiveTarget& entry)
{
    const auto interval = scheduledInterval_;
    // 用目标 hash 把首次抓取打散到一个周期内
    const auto offset = TimerScheduler::Duration(
        static_cast<TimerScheduler::Duration::rep>(entry.target->hash() %
                                                   static_cast<std::uint64_t>(interval.count())));
    std::weak_ptr<ScrapeTarget> weak = entry.target;
    entry.timerId = scheduler_.registerRepeatingTimer(interval, offset, [this, weak] {
        if (auto target = weak.lock()) scrape(target);
    });
}

/* ---------- 标签与 URL ---------- */
std::optional<HttpScrapeEngine::PopulatedTarget>
HttpScrapeEngine::populateTarget(const LabelSet& raw, const ScrapeJobConfig& config, std::string& reason)
{
    LabelSet lset = raw;
    auto setDefault = [&lset](const std::string& name, const std::string& value) {
        lset.emplace(name, value);   // 已存在时不覆盖
    };

    setDefault(LABEL_JOB, config.JobName);
    setDefault(LABEL_SCHEME, config.Scheme);
    setDefault(LABEL_METRICS_PATH, config.MetricsPath);
    setDefault(LABEL_SCRAPE_INTERVAL, units::formatDuration(config.ScrapeInterval));
    setDefault(LABEL_SCRAPE_TIMEOUT, units::formatDuration(config.ScrapeTimeout));
    for (const auto& [name, values] : config.Params) {
        if (!values.empty()) setDefault(LABEL_PARAM_PREFIX + name, values.front());
    }

    auto addr = lset.find(LABEL_ADDRESS);
    if (addr == lset.end() || addr->second.empty()) {
        reason = "no address";
        return std::nullopt;
    }
    const std::string address = addr->second;
    if (address.find('/') != std::string::npos) {
        reason = fmt::format("invalid address \"{}\"", address);
        return std::nullopt;
    }

    const std::string scheme = lset[LABEL_SCHEME];
    if (scheme != "http" && scheme != "https") {
        reason = fmt::format("invalid scheme \"{}\" for target {}", scheme, address);
        return std::nullopt;
    }
    std::string path = lset[LABEL_METRICS_PATH];
    if (path.empty() || path.front() != '/') path.insert(path.begin(), '/');

    setDefault(LABEL_INSTANCE, address);

    // __param_<name> 覆盖同名参数的第一个值
    auto params = config.Params;
    for (const auto& [name, value] : lset) {
        if (hasPrefix(name, LABEL_PARAM_PREFIX)) {
            auto key = name.substr(std::string(LABEL_PARAM_PREFIX).size());
            auto& values = params[key];
            if (values.empty()) values.push_back(value);
            else values.front() = value;
        }
    }

    PopulatedTarget out;
    out.URL = fmt::format("{}://{}{}", scheme, address, path);
    char sep = path.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [key, values] : params) {
        for (const auto& value : values) {
            out.URL += sep;
            out.URL += urlEscape(key) + "=" + urlEscape(value);
            sep = '&';
        }
    }

    for (const auto& [name, value] : lset) {
        if (!hasPrefix(name, "__") && !value.empty())
            out.Labels.emplace(name, value);
    }
    out.Discovered = std::move(lset);
    return out;
}

std::string HttpScrapeEngine::checkLabelLimits(const LabelSet& labels, const ScrapeJobConfig& config)
{
    if (config.LabelLimit > 0 && labels.size() > config.LabelLimit)
        return fmt::format("label_limit exceeded (number of labels: {}, limit: {})",
                           labels.size(), config.LabelLimit);

    for (const auto& [name, value] : labels) {
        if (config.LabelNameLengthLimit > 0 && name.size() > config.LabelNameLengthLimit)
            return fmt::format("label_name_length_limit exceeded (label name: {}, length: {}, limit: {})",
                               name, name.size(), config.LabelNameLengthLimit);
        if (config.LabelValueLengthLimit > 0 && value.size() > config.LabelValueLengthLimit)
            return fmt::format("label_value_length_limit exceeded (label name: {}, value length: {}, limit: {})",
                               name, value.size(), config.LabelValueLengthLimit);
    }
    return {};
}

std::string HttpScrapeEngine::stripTimestamp(const std::string& line)
{
    // <metric>[{labels}] <value> [<timestamp>]
    auto end = line.find_last_not_of(" \t\r");
    if (end == std::string::npos) return line;

    auto labelsEnd = line.rfind('}');
    auto searchFrom = labelsEnd == std::string::npos ? 0 : labelsEnd + 1;

    std::vector<std::pair<size_t, size_t>> tokens;   // [start, end)
    size_t pos = searchFrom;
    while (pos <= end) {
        auto start = line.find_first_not_of(" \t", pos);
        if (start == std::string::npos || start > end) break;
        auto stop = line.find_first_of(" \t", start);
        if (stop == std::string::npos || stop > end + 1) stop = end + 1;
        tokens.emplace_back(start, stop);
        pos = stop;
    }

    // 无标签时第一个 token 是指标名
    const size_t valueTokens = labelsEnd == std::string::npos ? 2 : 1;
    if (tokens.size() <= valueTokens) return line.substr(0, end + 1);
    return line.substr(0, tokens[valueTokens - 1].second);
}

/* ---------- 抓取 ---------- */
void HttpScrapeEngine::scrape(const std::shared_ptr<ScrapeTarget>& target)
{
    std::optional<ScrapeJobConfig> cfg;
    bool limitExceeded = false;
    size_t targetCount = 0;
    {
        std::shared_lock lk(mtx_);
        cfg = config_;
        limitExceeded = targetLimitExceeded_;
        targetCount = targetCount_;
    }
    if (!cfg || stop_.stop_requested()) return;

    const auto start = std::chrono::system_clock::now();
    const auto steadyStart = std::chrono::steady_clock::now();

    std::string error;
    std::vector<std::string> lines;
    std::uint64_t bodyBytes = 0;

    if (limitExceeded) {
        error = fmt::format("target_limit exceeded (number of targets: {}, limit: {})",
                            targetCount, cfg->TargetLimit);
    }
    if (error.empty()) error = checkLabelLimits(target->labels(), *cfg);
    if (error.empty()) {
        try {
            error = fetch(*target, *cfg, lines, bodyBytes);
        } catch (const std::exception& e) {
            error = e.what();
        }
    }

    std::vector<std::string> samples;
    if (error.empty()) {
        for (auto& line : lines) {
            if (!isSampleLine(line)) continue;
            samples.push_back(cfg->HonorTimestamps ? std::move(line) : stripTimestamp(line));
        }
        if (cfg->SampleLimit > 0 && samples.size() > cfg->SampleLimit) {
            error = fmt::format("sample_limit exceeded (number of samples: {}, limit: {})",
                                samples.size(), cfg->SampleLimit);
        }
    }
    if (stop_.stop_requested()) return;   // 停止过程中被中断的抓取不计入状态

    const auto duration = std::chrono::steady_clock::now() - steadyStart;
    target->report(start, std::chrono::duration_cast<std::chrono::nanoseconds>(duration), error);

    if (!error.empty()) {
        spdlog::debug("HttpScrapeEngine: scrape of {} failed: {}", target->url(), error);
        samples.clear();
    }

    ScrapeBatch batch;
    batch.Job         = cfg->JobName;
    batch.HonorLabels = cfg->HonorLabels;
    batch.Labels      = target->labels();
    batch.Timestamp   = start;
    batch.Lines       = std::move(samples);

    const double seconds = std::chrono::duration<double>(duration).count();
    const size_t scraped = batch.Lines.size();
    batch.Lines.push_back(fmt::format("up {}", error.empty() ? 1 : 0));
    batch.Lines.push_back(fmt::format("scrape_duration_seconds {}", seconds));
    batch.Lines.push_back(fmt::format("scrape_samples_scraped {}", scraped));
    if (opts_.ExtraMetrics) {
        batch.Lines.push_back(fmt::format("scrape_timeout_seconds {}",
                                          std::chrono::duration<double>(cfg->ScrapeTimeout).count()));
        batch.Lines.push_back(fmt::format("scrape_sample_limit {}", cfg->SampleLimit));
        batch.Lines.push_back(fmt::format("scrape_body_size_bytes {}",
                                          error.empty() ? static_cast<std::int64_t>(bodyBytes) : -1));
    }

    if (fanout_) fanout_->append(batch);
}

std::string HttpScrapeEngine::fetch(const ScrapeTarget& target,
                                    const ScrapeJobConfig& config,
                                    std::vector<std::string>& lines,
                                    std::uint64_t& bodyBytes)
{
    CurlHandle curl(curl_easy_init());
    if (!curl) return "curl_easy_init failed";
    CURL* h = curl.get();

    FetchContext ctx;
    ctx.limit = config.BodySizeLimit;
    ctx.stop  = stop_.get_token();

    char errbuf[CURL_ERROR_SIZE] = {0};
    const auto& http = config.HTTPClient;

    curl_slist* raw = nullptr;
    raw = curl_slist_append(raw, "Accept: text/plain;version=0.0.4;q=1,*/*;q=0.1");
    raw = curl_slist_append(raw, fmt::format("X-Prometheus-Scrape-Timeout-Seconds: {}",
                                             std::chrono::duration<double>(config.ScrapeTimeout).count()).c_str());
    if (!http.bearer_token.empty() || !http.bearer_token_file.empty()) {
        raw = curl_slist_append(raw, ("Authorization: Bearer " + http.resolvedBearerToken()).c_str());
    }
    CurlSlist headers(raw);

    curl_easy_setopt(h, CURLOPT_URL, target.url().c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_USERAGENT, opts_.UserAgent.c_str());
    curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(config.ScrapeTimeout.count()));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, progress_cb);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, http.follow_redirects ? 1L : 0L);
    curl_easy_setopt(h, CURLOPT_HTTP_VERSION,
                     http.enable_http2 ? CURL_HTTP_VERSION_2TLS : CURL_HTTP_VERSION_1_1);

    const std::string password = http.resolvedPassword();
    if (http.basic_auth) {
        curl_easy_setopt(h, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(h, CURLOPT_USERNAME, http.basic_auth->username.c_str());
        curl_easy_setopt(h, CURLOPT_PASSWORD, password.c_str());
    }
    if (!http.proxy_url.empty()) {
        curl_easy_setopt(h, CURLOPT_PROXY, http.proxy_url.c_str());
    }
    const auto& tls = http.tls_config;
    if (!tls.ca_file.empty())   curl_easy_setopt(h, CURLOPT_CAINFO, tls.ca_file.c_str());
    if (!tls.cert_file.empty()) curl_easy_setopt(h, CURLOPT_SSLCERT, tls.cert_file.c_str());
    if (!tls.key_file.empty())  curl_easy_setopt(h, CURLOPT_SSLKEY, tls.key_file.c_str());
    if (tls.insecure_skip_verify) {
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    CURLcode res = curl_easy_perform(h);
    if (ctx.exceeded)
        return fmt::format("body size limit exceeded (limit: {} bytes)", config.BodySizeLimit);
    if (res == CURLE_ABORTED_BY_CALLBACK)
        return "scrape aborted: engine stopping";
    if (res != CURLE_OK)
        return errbuf[0] != '\0' ? std::string(errbuf) : std::string(curl_easy_strerror(res));

    long code = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &code);
    if (code != 200)
        return fmt::format("server returned HTTP status {}", code);

    bodyBytes = ctx.body.size();
    std::istringstream in(ctx.body);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(std::move(line));
    }
    return {};
}
