#pragma once

#include "pml/core/common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pml {

enum class OutputFormat : std::uint8_t {
  xml = 0,
  markdown = 1,
  json = 2,
  text = 3,
};

// 结构组件包裹内容的方式。
enum class Delimiter : std::uint8_t {
  xml = 0,       // <tag>\n...\n</tag>
  markdown = 1,  // ## tag\n\n...
  none = 2,
};

[[nodiscard]] std::string_view to_string(OutputFormat f) noexcept;
[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view s) noexcept;
[[nodiscard]] std::string_view to_string(Delimiter d) noexcept;
[[nodiscard]] std::optional<Delimiter> parse_delimiter(std::string_view s) noexcept;

// 文档级默认分隔方式：xml -> xml，markdown -> markdown，其余 -> none。
[[nodiscard]] Delimiter default_delimiter(OutputFormat f) noexcept;

struct LlmConfig {
  std::string model{"claude-3-sonnet"};
  std::string provider{"anthropic"};
  std::optional<int> max_tokens{};
  std::optional<double> temperature{};
};

struct OutputConfig {
  OutputFormat format{OutputFormat::xml};
  bool trim{true};
  std::string indent{std::string(core::kDefaultIndent)};
};

struct CodeConfig {
  std::string language{"typescript"};
};

/**
 * @brief 运行环境事实。
 *
 * 空字段（timestamp 为 0）在渲染开始时由 gather_runtime_config() 补齐；
 * 预先填好的字段保持不变，便于测试固定输出。
 */
struct RuntimeConfig {
  std::string hostname{};
  std::string username{};
  std::string cwd{};
  std::int64_t timestamp{0};  // 毫秒（Unix epoch）
  std::string date{};         // YYYY-MM-DD（本地时间）
  std::string time{};         // HH:MM:SS（本地时间）
};

struct EnvironmentContext {
  LlmConfig llm{};
  OutputConfig output{};
  CodeConfig code{};
  RuntimeConfig runtime{};
};

// 读取主机名、用户名、当前目录与时钟；单项失败时该项留空。
[[nodiscard]] RuntimeConfig gather_runtime_config();

// 用 gather_runtime_config() 的结果补齐 runtime 中的空字段。
void fill_runtime_defaults(RuntimeConfig& runtime);

}  // namespace pml
