#pragma once

#include <optional>
#include <string>

struct BasicAuth {
    std::string username;
    std::string password;
    std::string password_file;
};

struct TLSConfig {
    std::string ca_file;
    std::string cert_file;
    std::string key_file;
    bool        insecure_skip_verify = false;
};

struct HTTPClientConfig {
    std::optional<BasicAuth> basic_auth;
    std::string              bearer_token;
    std::string              bearer_token_file;
    std::string              proxy_url;
    bool                     follow_redirects = true;
    bool                     enable_http2     = true;
    TLSConfig                tls_config;

    // 抛出 std::invalid_argument 描述第一处冲突
    void validate() const;

    // 按需读取 *_file，返回实际使用的凭据
    std::string resolvedPassword() const;
    std::string resolvedBearerToken() const;
};

bool operator==(const BasicAuth& a, const BasicAuth& b);
bool operator==(const TLSConfig& a, const TLSConfig& b);
bool operator==(const HTTPClientConfig& a, const HTTPClientConfig& b);
