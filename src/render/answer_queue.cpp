#include "pml/render/answer_queue.hpp"

#include "core/log_internal.hpp"

#include <asio/as_tuple.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

namespace pml {

/*
 * 唤醒来源的区分：
 * - supply() 先写入 waiter->value 再 cancel 定时器 -> 返回该值；
 * - cancel() 只置 woken -> 返回 nullopt；
 * - 两者都没有：定时器自然到期 -> 超时，返回 nullopt。
 */
AnswerQueue::AnswerQueue(std::optional<core::duration> timeout) : timeout_(timeout) {}

asio::awaitable<std::optional<Value>> AnswerQueue::async_answer(const InputRequirement& requirement) {
  for (auto it = backlog_.begin(); it != backlog_.end(); ++it) {
    if (it->name == requirement.name) {
      Value value = std::move(it->value);
      backlog_.erase(it);
      co_return value;
    }
  }

  auto ex = co_await asio::this_coro::executor;
  auto waiter = std::make_shared<Waiter>();
  waiter->name = requirement.name;
  waiter->timer = std::make_shared<asio::steady_timer>(ex);
  if (timeout_.has_value()) {
    waiter->timer->expires_after(*timeout_);
  } else {
    waiter->timer->expires_at(asio::steady_timer::time_point::max());
  }

  auto it = waiters_.insert(waiters_.end(), waiter);
  core::detail::logger().debug("answer queue: waiting for '{}'", requirement.name);

  if (on_request_) {
    on_request_(requirement);
  }

  // 回调里可能已同步投递或取消；此时定时器尚未开始等待，cancel() 不会生效。
  if (!waiter->woken) {
    auto [ec] = co_await waiter->timer->async_wait(asio::as_tuple(asio::use_awaitable));
    (void)ec;
  }
  waiters_.erase(it);

  if (waiter->value.has_value()) {
    co_return std::move(waiter->value);
  }
  if (!waiter->woken) {
    core::detail::logger().debug("answer queue: '{}' timed out", requirement.name);
  }
  co_return std::nullopt;
}

void AnswerQueue::supply(std::string name, Value value) {
  for (const auto& waiter : waiters_) {
    if (waiter->name == name && !waiter->woken) {
      waiter->value = std::move(value);
      waiter->woken = true;
      waiter->timer->cancel();
      return;
    }
  }
  backlog_.push_back(Supplied{std::move(name), std::move(value)});
}

void AnswerQueue::cancel() noexcept {
  for (const auto& waiter : waiters_) {
    waiter->woken = true;
    waiter->timer->cancel();
  }
}

std::vector<std::string> AnswerQueue::waiting_for() const {
  std::vector<std::string> names;
  names.reserve(waiters_.size());
  for (const auto& waiter : waiters_) {
    names.push_back(waiter->name);
  }
  return names;
}

}  // namespace pml
