#pragma once

#include "pml/element/element.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pml {

// Prompt 根节点上的描述信息（用于列举/检索提示词，不需要渲染）。
struct PromptMetadata {
  std::string name;
  std::optional<std::string> description{};
  std::optional<std::string> version{};
  std::vector<std::string> tags{};
};

/**
 * @brief 读取根节点（或根片段中第一个 Prompt）的元数据。
 *
 * 根节点不是 Prompt，或 Prompt 缺少 name 时返回 nullopt。
 */
[[nodiscard]] std::optional<PromptMetadata> extract_metadata(const Node& root);

}  // namespace pml
