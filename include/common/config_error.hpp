#pragma once
#include <stdexcept>
#include <string>
#include <utility>

// 配置阶段的失败：stage 标明是哪一步（构建 / 应用 / 解码）出的错
class ConfigError : public std::runtime_error {
public:
    ConfigError(std::string stage, std::string cause)
        : std::runtime_error(stage + ": " + cause),
          stage_(std::move(stage)),
          cause_(std::move(cause)) {}

    const std::string& stage() const noexcept { return stage_; }
    const std::string& cause() const noexcept { return cause_; }

private:
    std::string stage_;
    std::string cause_;
};

#define CONFIG_STAGE_BUILD  "invalid scrape_config"
#define CONFIG_STAGE_APPLY  "error applying scrape configs"
#define CONFIG_STAGE_DECODE "invalid scrape arguments"
