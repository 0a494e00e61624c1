#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace pml::core {

/**
 * @brief 库内日志级别。
 *
 * 库内部使用名为 "pml" 的 spdlog logger（克隆自默认 logger 的 sink），
 * 默认级别 warn：渲染错误与告警会以 warn 输出，组件解析细节走 debug/trace。
 * spdlog 类型不出现在 public headers 中。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

// "trace" / "debug" / "info" / "warn" / "error" / "critical" / "off"（"warning" 也接受）
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;
[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

} // namespace pml::core
