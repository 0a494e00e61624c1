#pragma once

// 库内部使用的 logger 访问点；不安装、不出现在 public headers 中。

namespace spdlog {
class logger;
} // namespace spdlog

namespace pml::core::detail {

// 名为 "pml" 的库 logger（首次调用时从默认 logger 克隆 sink 配置）。
spdlog::logger& logger();

} // namespace pml::core::detail
