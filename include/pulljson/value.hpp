#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "number.hpp"
#include "text.hpp"

namespace pulljson {

// A materialized JSON value, as produced by the prefix extractor.
class value {
public:
  using array = std::vector<value>;
  // Insertion order is kept; duplicate keys are kept too.
  using object = std::vector<std::pair<std::string, value>>;

  enum class kind { null, boolean, number, string, array, object };

  value() noexcept : data_(std::monostate{}) {}
  value(std::nullptr_t) noexcept : data_(std::monostate{}) {}
  value(bool b) : data_(b) {}
  value(pulljson::number n) : data_(std::move(n)) {}
  value(std::string s) : data_(std::move(s)) {}
  value(const char* s) : data_(std::string(s)) {}
  value(array a) : data_(std::move(a)) {}
  value(object o) : data_(std::move(o)) {}

  kind type() const noexcept {
    switch (data_.index()) {
      case 0: return kind::null;
      case 1: return kind::boolean;
      case 2: return kind::number;
      case 3: return kind::string;
      case 4: return kind::array;
      case 5: return kind::object;
      default: return kind::null;
    }
  }

  bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }
  bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
  bool is_number() const noexcept { return std::holds_alternative<pulljson::number>(data_); }
  bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
  bool is_array() const noexcept { return std::holds_alternative<array>(data_); }
  bool is_object() const noexcept { return std::holds_alternative<object>(data_); }

  bool as_bool() const { return std::get<bool>(data_); }
  const pulljson::number& as_number() const { return std::get<pulljson::number>(data_); }
  const std::string& as_string() const { return std::get<std::string>(data_); }
  const array& as_array() const { return std::get<array>(data_); }
  const object& as_object() const { return std::get<object>(data_); }

  array& as_array() { return std::get<array>(data_); }
  object& as_object() { return std::get<object>(data_); }
  std::string& as_string() { return std::get<std::string>(data_); }

  // First member with this key.
  const value* find(std::string_view key) const noexcept {
    if (!is_object()) return nullptr;
    for (const auto& kv : std::get<object>(data_)) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

  value* find(std::string_view key) noexcept {
    if (!is_object()) return nullptr;
    for (auto& kv : std::get<object>(data_)) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

  friend bool operator==(const value& a, const value& b) { return a.data_ == b.data_; }
  friend bool operator!=(const value& a, const value& b) { return !(a == b); }

private:
  // index: 0 null, 1 bool, 2 number, 3 string, 4 array, 5 object
  std::variant<std::monostate, bool, pulljson::number, std::string, array, object> data_;
};

namespace detail {

inline void dump_compact_iter(std::string& out, const value& root) {
  struct frame {
    const value* v{nullptr};
    std::size_t idx{0};
  };
  // Non-recursive; nesting depth is bounded only by the input.
  std::vector<frame> stack;
  stack.push_back(frame{&root, 0});

  while (!stack.empty()) {
    frame& f = stack.back();
    const value& v = *f.v;

    switch (v.type()) {
      case value::kind::null:
        out += "null";
        stack.pop_back();
        break;
      case value::kind::boolean:
        out += v.as_bool() ? "true" : "false";
        stack.pop_back();
        break;
      case value::kind::number:
        out += v.as_number().to_string();
        stack.pop_back();
        break;
      case value::kind::string:
        dump_escaped(out, v.as_string());
        stack.pop_back();
        break;
      case value::kind::array: {
        const auto& a = v.as_array();
        if (f.idx == 0) out.push_back('[');
        if (f.idx == a.size()) {
          out.push_back(']');
          stack.pop_back();
          break;
        }
        if (f.idx > 0) out.push_back(',');
        const value* child = &a[f.idx++];
        stack.push_back(frame{child, 0});
        break;
      }
      case value::kind::object: {
        const auto& o = v.as_object();
        if (f.idx == 0) out.push_back('{');
        if (f.idx == o.size()) {
          out.push_back('}');
          stack.pop_back();
          break;
        }
        if (f.idx > 0) out.push_back(',');
        const auto& kv = o[f.idx++];
        dump_escaped(out, kv.first);
        out.push_back(':');
        stack.push_back(frame{&kv.second, 0});
        break;
      }
    }
  }
}

} // namespace detail

inline void dump_to(std::string& out, const value& v) { detail::dump_compact_iter(out, v); }

inline std::string dump(const value& v) {
  std::string out;
  dump_to(out, v);
  return out;
}

} // namespace pulljson
