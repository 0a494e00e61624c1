#pragma once

#include "pml/element/element.hpp"
#include "pml/render/options.hpp"

#include <asio/awaitable.hpp>

namespace pml {

/**
 * @brief 渲染元素树（协程版本）。
 *
 * 按文档顺序逐节点执行：物化 props -> schema 校验 -> resolve -> render。
 * 节点级问题（校验失败、组件异常、未知组件、循环引用、超深嵌套）只影响该节点：
 * 记入 errors 后回退为渲染其子节点，其余部分照常输出。
 *
 * 只在交互组件等待答案时挂起；不并行处理兄弟节点。
 */
asio::awaitable<RenderResult> async_render(Node root, RenderOptions options = {});

/**
 * @brief 同步渲染：内部创建私有 io_context 并运行到结束。
 *
 * 注意：不要在已运行的 io_context 线程内调用（会阻塞该线程）；此时请用 async_render。
 */
[[nodiscard]] RenderResult render(const Node& root, RenderOptions options = {});

}  // namespace pml
