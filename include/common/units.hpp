#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace units
{
    using Duration = std::chrono::milliseconds;

    // Prometheus 风格的时长："1m30s"、"500ms"、"2h"，单位 ms s m h d w y
    Duration parseDuration(const std::string& text);
    std::string formatDuration(Duration d);

    // 二进制单位的字节数："10MiB"、"512KB"、"1GB"，KB 与 KiB 同为 1024
    std::uint64_t parseBytes(const std::string& text);
    std::string formatBytes(std::uint64_t bytes);
} // namespace units
