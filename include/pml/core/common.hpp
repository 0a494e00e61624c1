#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace pml::core {

// 默认最大树深：超过即判定为循环/失控结构，按“失败关闭”处理。
inline constexpr std::size_t kDefaultMaxDepth = 256;

// 默认缩进字符串（两个空格）。
inline constexpr const char* kDefaultIndent = "  ";

using steady_clock = std::chrono::steady_clock;
using duration = steady_clock::duration;

}  // 命名空间 pml::core
