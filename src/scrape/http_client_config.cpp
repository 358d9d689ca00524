#include "scrape/http_client_config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <fmt/core.h>

namespace
{
    std::string readSecretFile(const std::string& path)
    {
        std::ifstream ifs(path);
        if (!ifs)
            throw std::runtime_error(fmt::format("unable to read secret file {}", path));
        std::stringstream ss;
        ss << ifs.rdbuf();
        auto secret = ss.str();
        while (!secret.empty() && (secret.back() == '\n' || secret.back() == '\r'))
            secret.pop_back();
        return secret;
    }
} // namespace

void HTTPClientConfig::validate() const
{
    int authMethods = 0;
    if (basic_auth) ++authMethods;
    if (!bearer_token.empty()) ++authMethods;
    if (!bearer_token_file.empty()) ++authMethods;
    if (authMethods > 1)
        throw std::invalid_argument(
            "at most one of basic_auth, bearer_token & bearer_token_file must be configured");

    if (basic_auth && !basic_auth->password.empty() && !basic_auth->password_file.empty())
        throw std::invalid_argument(
            "at most one of basic_auth password & password_file must be configured");

    if (tls_config.cert_file.empty() != tls_config.key_file.empty())
        throw std::invalid_argument(
            "exactly one of key or cert file specified, both are required for client certificates");

    if (!proxy_url.empty()) {
        auto sep = proxy_url.find("://");
        auto scheme = sep == std::string::npos ? std::string() : proxy_url.substr(0, sep);
        if (scheme != "http" && scheme != "https" && scheme != "socks5")
            throw std::invalid_argument(fmt::format("unsupported proxy_url scheme in \"{}\"", proxy_url));
        if (sep + 3 >= proxy_url.size())
            throw std::invalid_argument(fmt::format("proxy_url \"{}\" has no host", proxy_url));
    }
}

std::string HTTPClientConfig::resolvedPassword() const
{
    if (!basic_auth) return {};
    if (!basic_auth->password_file.empty()) return readSecretFile(basic_auth->password_file);
    return basic_auth->password;
}

std::string HTTPClientConfig::resolvedBearerToken() const
{
    if (!bearer_token_file.empty()) return readSecretFile(bearer_token_file);
    return bearer_token;
}

bool operator==(const BasicAuth& a, const BasicAuth& b)
{
    return a.username == b.username && a.password == b.password &&
           a.password_file == b.password_file;
}

bool operator==(const TLSConfig& a, const TLSConfig& b)
{
    return a.ca_file == b.ca_file && a.cert_file == b.cert_file && a.key_file == b.key_file &&
           a.insecure_skip_verify == b.insecure_skip_verify;
}

bool operator==(const HTTPClientConfig& a, const HTTPClientConfig& b)
{
    return a.basic_auth == b.basic_auth && a.bearer_token == b.bearer_token &&
           a.bearer_token_file == b.bearer_token_file && a.proxy_url == b.proxy_url &&
           a.follow_redirects == b.follow_redirects && a.enable_http2 == b.enable_http2 &&
           a.tls_config == b.tls_config;
}
