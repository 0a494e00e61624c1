#pragma once

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pml {

class Element;
class Value;

using ElementPtr = std::shared_ptr<const Element>;

struct Undefined final {
  friend bool operator==(const Undefined&, const Undefined&) = default;
};

struct Null final {
  friend bool operator==(const Null&, const Null&) = default;
};

using Array = std::vector<Value>;

struct Member;

/**
 * @brief 有序键值对象（保持插入顺序，键唯一）。
 *
 * 成员函数在 value.cpp 中实现：Member 在此处仍是不完整类型。
 */
class Object final {
 public:
  Object();
  Object(std::initializer_list<Member> members);
  Object(const Object&);
  Object(Object&&) noexcept;
  Object& operator=(const Object&);
  Object& operator=(Object&&) noexcept;
  ~Object();

  [[nodiscard]] const Value* find(std::string_view key) const noexcept;
  [[nodiscard]] Value* find(std::string_view key) noexcept;
  [[nodiscard]] bool contains(std::string_view key) const noexcept { return find(key) != nullptr; }

  // 已存在则覆盖，否则追加到末尾。
  void set(std::string key, Value value);
  bool erase(std::string_view key) noexcept;

  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;
  [[nodiscard]] const std::vector<Member>& members() const noexcept { return members_; }

  friend bool operator==(const Object& lhs, const Object& rhs) noexcept;

 private:
  std::vector<Member> members_;
};

// 路径片段：对象键或数组下标。
using PathSegment = std::variant<std::string, std::size_t>;
using Path = std::vector<PathSegment>;

[[nodiscard]] std::string path_to_string(const Path& path);

/**
 * @brief 延迟引用：“目标元素 resolve 结果中 path 处的值”。
 *
 * 不是终值；渲染器在使用前必须先解析（见 render/renderer）。
 */
struct DeferredRef final {
  ElementPtr element;
  Path path;

  friend bool operator==(const DeferredRef& lhs, const DeferredRef& rhs) noexcept {
    return lhs.element == rhs.element && lhs.path == rhs.path;
  }
};

/**
 * @brief 动态值（属性值、答案、resolve 结果、渲染节点共用）。
 *
 * 约定：
 * - Undefined 表示“缺失”，Null 表示显式空值；二者渲染时都被丢弃；
 * - 数值统一使用 double；
 * - Element 按身份（指针）比较，其余按结构比较。
 */
class Value final {
 public:
  using storage_type =
    std::variant<Undefined, Null, bool, double, std::string, Array, Object, ElementPtr, DeferredRef>;

  Value() noexcept : storage_(Undefined{}) {}
  Value(Undefined v) noexcept : storage_(v) {}
  Value(Null v) noexcept : storage_(v) {}
  Value(std::nullptr_t) noexcept : storage_(Null{}) {}
  Value(bool v) noexcept : storage_(v) {}
  Value(int v) noexcept : storage_(static_cast<double>(v)) {}
  Value(long v) noexcept : storage_(static_cast<double>(v)) {}
  Value(long long v) noexcept : storage_(static_cast<double>(v)) {}
  Value(unsigned v) noexcept : storage_(static_cast<double>(v)) {}
  Value(unsigned long v) noexcept : storage_(static_cast<double>(v)) {}
  Value(double v) noexcept : storage_(v) {}
  Value(const char* v) : storage_(std::string(v)) {}
  Value(std::string_view v) : storage_(std::string(v)) {}
  Value(std::string v) noexcept : storage_(std::move(v)) {}
  Value(Array v) noexcept : storage_(std::move(v)) {}
  Value(Object v) noexcept : storage_(std::move(v)) {}
  Value(ElementPtr v) noexcept : storage_(std::move(v)) {}
  Value(DeferredRef v) noexcept : storage_(std::move(v)) {}

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }
  [[nodiscard]] storage_type& storage() noexcept { return storage_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] T* get_if() noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] bool is() const noexcept {
    return std::holds_alternative<T>(storage_);
  }

  [[nodiscard]] bool is_undefined() const noexcept { return is<Undefined>(); }
  [[nodiscard]] bool is_null() const noexcept { return is<Null>(); }
  // undefined 或 null。
  [[nodiscard]] bool is_nullish() const noexcept { return is_undefined() || is_null(); }
  [[nodiscard]] bool is_element() const noexcept;
  [[nodiscard]] bool is_deferred() const noexcept { return is<DeferredRef>(); }

  [[nodiscard]] std::optional<double> as_number() const noexcept;
  [[nodiscard]] std::optional<std::string_view> as_string() const noexcept;
  [[nodiscard]] std::optional<bool> as_bool() const noexcept;

  // 类型名（用于校验错误的 received/expected 描述）。
  [[nodiscard]] std::string_view kind_name() const noexcept;

  friend bool operator==(const Value& lhs, const Value& rhs) noexcept;
  friend bool operator!=(const Value& lhs, const Value& rhs) noexcept { return !(lhs == rhs); }

 private:
  storage_type storage_;
};

struct Member final {
  std::string key;
  Value value;

  friend bool operator==(const Member&, const Member&) = default;
};

/**
 * @brief 真值判定：bool 原值；数值非 0；字符串非空；数组/对象/元素为真；
 * undefined/null 为假。
 */
[[nodiscard]] bool truthy(const Value& v) noexcept;

/**
 * @brief 转为渲染文本：undefined/null 为空串，bool 为 "true"/"false"，
 * 整数值不带小数点，数组逐项拼接（逗号分隔），对象输出 JSON。
 */
[[nodiscard]] std::string to_display_string(const Value& v);

/**
 * @brief 紧凑/缩进 JSON 序列化（元素与延迟引用输出为 null）。
 */
[[nodiscard]] std::string to_json(const Value& v, int indent = 0);

/**
 * @brief 沿路径取值；任一中间段缺失返回 Undefined（不抛异常）。
 */
[[nodiscard]] Value follow_path(const Value& root, const Path& path);

// 数值格式化：整数不带小数部分，其余使用最短往返表示。
[[nodiscard]] std::string format_number(double v);

}  // namespace pml
