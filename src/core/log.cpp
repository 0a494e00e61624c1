#include "pml/core/log.hpp"

#include "core/log_internal.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <memory>
#include <utility>

namespace pml::core {
namespace {

// LogLevel 与 spdlog::level::level_enum 的取值顺序一致（trace=0 ... off=6），
// 这里直接做数值映射；新增级别时两边需同步。
static_assert(static_cast<int>(LogLevel::trace) == spdlog::level::trace);
static_assert(static_cast<int>(LogLevel::error) == spdlog::level::err);
static_assert(static_cast<int>(LogLevel::off) == spdlog::level::off);

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    return static_cast<spdlog::level::level_enum>(level);
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    if (level < spdlog::level::trace || level > spdlog::level::off) {
        return LogLevel::off;
    }
    return static_cast<LogLevel>(level);
}

constexpr std::array<std::pair<std::string_view, LogLevel>, 7> kLevelNames{{
    {"trace", LogLevel::trace},
    {"debug", LogLevel::debug},
    {"info", LogLevel::info},
    {"warn", LogLevel::warn},
    {"error", LogLevel::error},
    {"critical", LogLevel::critical},
    {"off", LogLevel::off},
}};

std::shared_ptr<spdlog::logger> make_logger() {
    // 复用默认 logger 的 sink 配置，仅替换名称，便于业务侧区分日志来源。
    auto lg = spdlog::default_logger()->clone("pml");
    lg->set_level(spdlog::level::warn);
    return lg;
}

} // namespace

namespace detail {

spdlog::logger& logger() {
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return *instance;
}

} // namespace detail

void set_log_level(LogLevel level) noexcept {
    detail::logger().set_level(to_spdlog_level(level));
}

LogLevel log_level() noexcept { return from_spdlog_level(detail::logger().level()); }

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    if (name == "warning") {
        return LogLevel::warn;
    }
    for (const auto& [text, level] : kLevelNames) {
        if (text == name) {
            return level;
        }
    }
    return std::nullopt;
}

std::string_view to_string(LogLevel level) noexcept {
    for (const auto& [text, value] : kLevelNames) {
        if (value == level) {
            return text;
        }
    }
    return "off";
}

} // namespace pml::core
