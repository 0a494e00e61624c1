#include "pml/value/value.hpp"

#include "pml/element/element.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

namespace pml {

Object::Object() = default;
Object::Object(std::initializer_list<Member> members) {
  members_.reserve(members.size());
  for (const auto& m : members) {
    set(m.key, m.value);
  }
}
Object::Object(const Object&) = default;
Object::Object(Object&&) noexcept = default;
Object& Object::operator=(const Object&) = default;
Object& Object::operator=(Object&&) noexcept = default;
Object::~Object() = default;

const Value* Object::find(std::string_view key) const noexcept {
  for (const auto& m : members_) {
    if (m.key == key) {
      return &m.value;
    }
  }
  return nullptr;
}

Value* Object::find(std::string_view key) noexcept {
  for (auto& m : members_) {
    if (m.key == key) {
      return &m.value;
    }
  }
  return nullptr;
}

void Object::set(std::string key, Value value) {
  if (auto* existing = find(key)) {
    *existing = std::move(value);
    return;
  }
  members_.push_back(Member{std::move(key), std::move(value)});
}

bool Object::erase(std::string_view key) noexcept {
  for (auto it = members_.begin(); it != members_.end(); ++it) {
    if (it->key == key) {
      members_.erase(it);
      return true;
    }
  }
  return false;
}

std::size_t Object::size() const noexcept { return members_.size(); }
bool Object::empty() const noexcept { return members_.empty(); }

bool operator==(const Object& lhs, const Object& rhs) noexcept {
  // 键集合与对应值相同即相等，不要求插入顺序一致。
  if (lhs.members_.size() != rhs.members_.size()) {
    return false;
  }
  for (const auto& m : lhs.members_) {
    const auto* other = rhs.find(m.key);
    if (other == nullptr || !(*other == m.value)) {
      return false;
    }
  }
  return true;
}

std::string path_to_string(const Path& path) {
  std::string out;
  for (const auto& seg : path) {
    if (const auto* key = std::get_if<std::string>(&seg)) {
      if (!out.empty()) {
        out += '.';
      }
      out += *key;
    } else {
      out += '[';
      out += std::to_string(std::get<std::size_t>(seg));
      out += ']';
    }
  }
  return out;
}

bool Value::is_element() const noexcept {
  const auto* el = get_if<ElementPtr>();
  return el != nullptr && is_branded_element(el->get());
}

std::optional<double> Value::as_number() const noexcept {
  if (const auto* d = get_if<double>()) {
    return *d;
  }
  return std::nullopt;
}

std::optional<std::string_view> Value::as_string() const noexcept {
  if (const auto* s = get_if<std::string>()) {
    return std::string_view(*s);
  }
  return std::nullopt;
}

std::optional<bool> Value::as_bool() const noexcept {
  if (const auto* b = get_if<bool>()) {
    return *b;
  }
  return std::nullopt;
}

std::string_view Value::kind_name() const noexcept {
  switch (storage_.index()) {
    case 0: return "undefined";
    case 1: return "null";
    case 2: return "boolean";
    case 3: return "number";
    case 4: return "string";
    case 5: return "array";
    case 6: return "object";
    case 7: return "element";
    case 8: return "reference";
  }
  return "unknown";
}

bool operator==(const Value& lhs, const Value& rhs) noexcept {
  if (lhs.storage_.index() != rhs.storage_.index()) {
    return false;
  }
  return std::visit(
    [&rhs](const auto& a) -> bool {
      using T = std::decay_t<decltype(a)>;
      const auto& b = std::get<T>(rhs.storage_);
      if constexpr (std::is_same_v<T, Array>) {
        if (a.size() != b.size()) {
          return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
          if (!(a[i] == b[i])) {
            return false;
          }
        }
        return true;
      } else {
        return a == b;
      }
    },
    lhs.storage_);
}

bool truthy(const Value& v) noexcept {
  return std::visit(
    [](const auto& x) -> bool {
      using T = std::decay_t<decltype(x)>;
      if constexpr (std::is_same_v<T, Undefined> || std::is_same_v<T, Null>) {
        return false;
      } else if constexpr (std::is_same_v<T, bool>) {
        return x;
      } else if constexpr (std::is_same_v<T, double>) {
        return x != 0.0 && !std::isnan(x);
      } else if constexpr (std::is_same_v<T, std::string>) {
        return !x.empty();
      } else if constexpr (std::is_same_v<T, ElementPtr>) {
        return x != nullptr;
      } else {
        return true;
      }
    },
    v.storage());
}

std::string format_number(double v) {
  if (std::isnan(v)) {
    return "NaN";
  }
  if (std::isinf(v)) {
    return v > 0 ? "Infinity" : "-Infinity";
  }
  // 在 int64 可精确表示的范围内按整数输出（1.0 -> "1"）。
  if (std::trunc(v) == v && std::fabs(v) < 9.007199254740992e15) {
    return std::to_string(static_cast<long long>(v));
  }
  char buf[64];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec != std::errc{}) {
    return std::to_string(v);
  }
  return std::string(buf, ptr);
}

namespace {

// JSON 中没有 undefined / element / 延迟引用，统一输出 null；
// 可精确表示的整数按整数输出（1.0 -> 1），非有限数 dump 时为 null。
nlohmann::ordered_json to_json_value(const Value& v) {
  return std::visit(
    [](const auto& x) -> nlohmann::ordered_json {
      using T = std::decay_t<decltype(x)>;
      if constexpr (std::is_same_v<T, bool>) {
        return x;
      } else if constexpr (std::is_same_v<T, double>) {
        if (std::trunc(x) == x && std::fabs(x) < 9.007199254740992e15) {
          return static_cast<std::int64_t>(x);
        }
        return x;
      } else if constexpr (std::is_same_v<T, std::string>) {
        return x;
      } else if constexpr (std::is_same_v<T, Array>) {
        auto out = nlohmann::ordered_json::array();
        for (const auto& item : x) {
          out.push_back(to_json_value(item));
        }
        return out;
      } else if constexpr (std::is_same_v<T, Object>) {
        auto out = nlohmann::ordered_json::object();
        for (const auto& m : x.members()) {
          out[m.key] = to_json_value(m.value);
        }
        return out;
      } else {
        return nullptr;
      }
    },
    v.storage());
}

}  // namespace

std::string to_json(const Value& v, int indent) {
  // indent <= 0 为紧凑格式；非法 UTF-8 以 U+FFFD 替换而不是抛异常
  return to_json_value(v).dump(indent > 0 ? indent : -1, ' ', false,
                               nlohmann::ordered_json::error_handler_t::replace);
}

std::string to_display_string(const Value& v) {
  return std::visit(
    [&v](const auto& x) -> std::string {
      using T = std::decay_t<decltype(x)>;
      if constexpr (std::is_same_v<T, bool>) {
        return x ? "true" : "false";
      } else if constexpr (std::is_same_v<T, double>) {
        return format_number(x);
      } else if constexpr (std::is_same_v<T, std::string>) {
        return x;
      } else if constexpr (std::is_same_v<T, Array>) {
        std::string out;
        for (std::size_t i = 0; i < x.size(); ++i) {
          if (i != 0) {
            out += ", ";
          }
          out += to_display_string(x[i]);
        }
        return out;
      } else if constexpr (std::is_same_v<T, Object>) {
        return to_json(v);
      } else {
        return {};
      }
    },
    v.storage());
}

Value follow_path(const Value& root, const Path& path) {
  const Value* current = &root;
  for (const auto& seg : path) {
    if (current->is_nullish()) {
      return Undefined{};
    }
    if (const auto* key = std::get_if<std::string>(&seg)) {
      if (const auto* obj = current->get_if<Object>()) {
        current = obj->find(*key);
        if (current == nullptr) {
          return Undefined{};
        }
        continue;
      }
      // 数组允许用数字字符串作为下标（"0"、"1"...）
      if (const auto* arr = current->get_if<Array>()) {
        std::size_t idx = 0;
        auto [ptr, ec] = std::from_chars(key->data(), key->data() + key->size(), idx);
        if (ec != std::errc{} || ptr != key->data() + key->size() || idx >= arr->size()) {
          return Undefined{};
        }
        current = &(*arr)[idx];
        continue;
      }
      if (*key == "length") {
        if (const auto* s = current->get_if<std::string>()) {
          return static_cast<double>(s->size());
        }
      }
      return Undefined{};
    }

    const auto idx = std::get<std::size_t>(seg);
    if (const auto* arr = current->get_if<Array>()) {
      if (idx >= arr->size()) {
        return Undefined{};
      }
      current = &(*arr)[idx];
      continue;
    }
    return Undefined{};
  }
  return *current;
}

}  // namespace pml
