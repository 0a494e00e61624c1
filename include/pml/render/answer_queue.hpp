#pragma once

#include "pml/core/common.hpp"
#include "pml/render/context.hpp"

#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>

#include <functional>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pml {

/**
 * @brief 内置的答案提供者：外部代码通过 supply() 投递答案。
 *
 * 语义：
 * - async_answer(): 若已有同名的预投递答案，立即取走并返回；
 *   否则挂起，直到 supply(同名)、cancel() 或超时；
 * - supply(): 有同名等待者时唤醒最早的一个，否则暂存到 backlog；
 * - cancel(): 唤醒所有等待者并返回 nullopt（不清空 backlog）；
 * - 超时返回 nullopt，组件回退到默认值。
 *
 * 注意：
 * - 与渲染同一执行器/线程使用；跨线程投递请先 asio::post 到该执行器。
 * - 每个等待者挂在自己的 steady_timer 上，supply/cancel 通过 timer->cancel() 唤醒。
 */
class AnswerQueue final : public AnswerProvider {
 public:
  using RequestHandler = std::function<void(const InputRequirement&)>;

  explicit AnswerQueue(std::optional<core::duration> timeout = std::nullopt);

  asio::awaitable<std::optional<Value>> async_answer(const InputRequirement& requirement) override;

  void supply(std::string name, Value value);
  void cancel() noexcept;

  // 有新的等待者挂起时回调（可在回调中同步调用 supply）。
  void on_request(RequestHandler handler) { on_request_ = std::move(handler); }

  // 当前挂起的等待者数量。
  [[nodiscard]] std::size_t pending() const noexcept { return waiters_.size(); }
  // 挂起等待者的答案名（按挂起顺序）。
  [[nodiscard]] std::vector<std::string> waiting_for() const;
  // 已投递但尚未被取走的答案数量。
  [[nodiscard]] std::size_t backlog() const noexcept { return backlog_.size(); }

 private:
  struct Waiter {
    std::string name;
    std::shared_ptr<asio::steady_timer> timer;
    std::optional<Value> value{};
    bool woken{false};
  };

  struct Supplied {
    std::string name;
    Value value;
  };

  std::optional<core::duration> timeout_;
  RequestHandler on_request_{};
  std::list<std::shared_ptr<Waiter>> waiters_{};
  std::list<Supplied> backlog_{};
};

}  // namespace pml
