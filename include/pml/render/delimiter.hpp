#pragma once

#include "pml/element/element.hpp"
#include "pml/render/environment.hpp"

#include <string_view>

namespace pml {

class Props;
class RenderContext;

/**
 * @brief 用分隔方式包裹内容：
 * - xml:      "<tag>\n" content "\n</tag>\n"
 * - markdown: "## tag\n\n" content "\n\n"
 * - none:     content "\n"
 *
 * content 可以是任意节点（其中的元素照常渲染）。
 */
[[nodiscard]] Node wrap_with_delimiter(Node content, std::string_view tag, Delimiter delimiter);

// props 中的 delimiter（xml/markdown/none）优先，否则取 env.output.format 对应的默认值。
[[nodiscard]] Delimiter delimiter_for(const Props& props, const RenderContext& ctx);

}  // namespace pml
