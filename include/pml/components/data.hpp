#pragma once

#include "pml/component/component.hpp"

#include <string>
#include <string_view>

namespace pml::components {

// 由扩展名推断代码块语言（".cpp" -> "cpp"）；未知返回空串。
[[nodiscard]] std::string_view language_for_extension(std::string_view extension) noexcept;

/**
 * @brief 读取本地文件，输出为带文件名注释的代码块：
 *
 *   <!-- name.ext -->
 *   ```lang
 *   ...
 *   ```
 *
 * 读取失败时输出 "[Error reading file: <原因>]"，不记渲染错误。
 */
class File final : public Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "File"; }
  [[nodiscard]] const Schema* schema() const noexcept override;
  [[nodiscard]] Node render(const Props& props, const Value& resolved, RenderContext& ctx) const override;
};

// 子节点放入代码块；language 缺省取 env.code.language。
class Code final : public Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "Code"; }
  [[nodiscard]] const Schema* schema() const noexcept override;
  [[nodiscard]] Node render(const Props& props, const Value& resolved, RenderContext& ctx) const override;
};

// value 按 env.output.indent 的宽度缩进输出 JSON。
class Json final : public Component {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "Json"; }
  [[nodiscard]] const Schema* schema() const noexcept override;
  [[nodiscard]] Node render(const Props& props, const Value& resolved, RenderContext& ctx) const override;
};

}  // namespace pml::components
