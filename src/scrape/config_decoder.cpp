#include "scrape/config_decoder.hpp"

#include <limits>
#include <map>
#include <set>
#include <vector>
#include <stdexcept>
#include <fmt/core.h>

#include "common/config_error.hpp"
#include "common/units.hpp"

namespace
{
    void checkKeys(const YAML::Node& node, const std::string& where, const std::set<std::string>& allowed)
    {
        if (!node.IsMap())
            throw std::invalid_argument(fmt::format("{} must be a mapping", where));
        for (const auto& kv : node) {
            auto key = kv.first.as<std::string>();
            if (!allowed.count(key))
                throw std::invalid_argument(fmt::format("unknown field \"{}\" in {}", key, where));
        }
    }

    template <typename T>
    void readScalar(const YAML::Node& node, const char* key, T& out)
    {
        if (!node[key]) return;
        try {
            out = node[key].as<T>();
        } catch (const YAML::Exception& e) {
            throw std::invalid_argument(fmt::format("bad value for {}: {}", key, e.what()));
        }
    }

    void readDuration(const YAML::Node& node, const char* key, std::chrono::milliseconds& out)
    {
        if (!node[key]) return;
        try {
            out = units::parseDuration(node[key].as<std::string>());
        } catch (const std::exception& e) {
            throw std::invalid_argument(fmt::format("bad duration for {}: {}", key, e.what()));
        }
    }

    void readLimit(const YAML::Node& node, const char* key, unsigned& out)
    {
        if (!node[key]) return;
        long long value = 0;
        try {
            value = node[key].as<long long>();
        } catch (const YAML::Exception& e) {
            throw std::invalid_argument(fmt::format("bad value for {}: {}", key, e.what()));
        }
        if (value < 0 || value > static_cast<long long>(std::numeric_limits<unsigned>::max()))
            throw std::invalid_argument(fmt::format("{} out of range: {}", key, value));
        out = static_cast<unsigned>(value);
    }

    HTTPClientConfig decodeHTTPClient(const YAML::Node& node)
    {
        HTTPClientConfig http;
        checkKeys(node, "http_client_config",
                  {"basic_auth", "bearer_token", "bearer_token_file", "proxy_url",
                   "follow_redirects", "enable_http2", "tls_config"});

        if (const auto& ba = node["basic_auth"]) {
            checkKeys(ba, "basic_auth", {"username", "password", "password_file"});
            BasicAuth auth;
            readScalar(ba, "username", auth.username);
            readScalar(ba, "password", auth.password);
            readScalar(ba, "password_file", auth.password_file);
            http.basic_auth = auth;
        }
        readScalar(node, "bearer_token", http.bearer_token);
        readScalar(node, "bearer_token_file", http.bearer_token_file);
        readScalar(node, "proxy_url", http.proxy_url);
        readScalar(node, "follow_redirects", http.follow_redirects);
        readScalar(node, "enable_http2", http.enable_http2);

        if (const auto& tls = node["tls_config"]) {
            checkKeys(tls, "tls_config", {"ca_file", "cert_file", "key_file", "insecure_skip_verify"});
            readScalar(tls, "ca_file", http.tls_config.ca_file);
            readScalar(tls, "cert_file", http.tls_config.cert_file);
            readScalar(tls, "key_file", http.tls_config.key_file);
            readScalar(tls, "insecure_skip_verify", http.tls_config.insecure_skip_verify);
        }
        return http;
    }

    SupervisorConfig decode(const YAML::Node& node, const ReceiverLookup& lookup)
    {
        SupervisorConfig args;
        checkKeys(node, SCRAPE_CONFIG_SECTION,
                  {"targets", "forward_to", "job_name", "honor_labels", "honor_timestamps", "params",
                   "scrape_interval", "scrape_timeout", "metrics_path", "scheme", "body_size_limit",
                   "sample_limit", "target_limit", "label_limit", "label_name_length_limit",
                   "label_value_length_limit", "http_client_config", "extra_metrics"});

        if (const auto& targets = node["targets"]) {
            if (!targets.IsSequence())
                throw std::invalid_argument("targets must be a sequence");
            for (const auto& t : targets) {
                if (!t.IsMap())
                    throw std::invalid_argument("each target must be a mapping of labels");
                args.Targets.push_back(t.as<std::map<std::string, std::string>>());
            }
        }

        if (const auto& forward = node["forward_to"]) {
            for (const auto& name : forward.as<std::vector<std::string>>()) {
                auto receiver = lookup ? lookup(name) : nullptr;
                if (!receiver)
                    throw std::invalid_argument(fmt::format("forward_to references unknown receiver \"{}\"", name));
                args.ForwardTo.push_back(std::move(receiver));
            }
        }

        readScalar(node, "job_name", args.JobName);
        readScalar(node, "honor_labels", args.HonorLabels);
        readScalar(node, "honor_timestamps", args.HonorTimestamps);

        if (const auto& params = node["params"]) {
            if (!params.IsMap())
                throw std::invalid_argument("params must be a mapping");
            for (const auto& kv : params) {
                auto name = kv.first.as<std::string>();
                if (kv.second.IsSequence())
                    args.Params[name] = kv.second.as<std::vector<std::string>>();
                else
                    args.Params[name] = {kv.second.as<std::string>()};
            }
        }

        readDuration(node, "scrape_interval", args.ScrapeInterval);
        readDuration(node, "scrape_timeout", args.ScrapeTimeout);
        readScalar(node, "metrics_path", args.MetricsPath);
        readScalar(node, "scheme", args.Scheme);

        if (const auto& limit = node["body_size_limit"]) {
            try {
                args.BodySizeLimit = units::parseBytes(limit.as<std::string>());
            } catch (const std::exception& e) {
                throw std::invalid_argument(fmt::format("bad size for body_size_limit: {}", e.what()));
            }
        }
        readLimit(node, "sample_limit", args.SampleLimit);
        readLimit(node, "target_limit", args.TargetLimit);
        readLimit(node, "label_limit", args.LabelLimit);
        readLimit(node, "label_name_length_limit", args.LabelNameLengthLimit);
        readLimit(node, "label_value_length_limit", args.LabelValueLengthLimit);

        if (const auto& http = node["http_client_config"])
            args.HTTPClient = decodeHTTPClient(http);

        readScalar(node, "extra_metrics", args.ExtraMetrics);
        return args;
    }
} // namespace

SupervisorConfig decodeSupervisorConfig(const Config& config, const ReceiverLookup& lookup)
{
    try {
        return decode(config.getRawNode(SCRAPE_CONFIG_SECTION), lookup);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(CONFIG_STAGE_DECODE, e.what());
    } catch (const YAML::Exception& e) {
        throw ConfigError(CONFIG_STAGE_DECODE, e.what());
    } catch (const std::runtime_error& e) {
        throw ConfigError(CONFIG_STAGE_DECODE, e.what());
    }
}
