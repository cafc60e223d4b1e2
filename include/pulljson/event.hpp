#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

#include "number.hpp"
#include "text.hpp"

namespace pulljson {

enum class event_kind : std::uint8_t {
  null_value = 0,
  boolean,
  integer,
  double_value,
  number,
  string,
  start_map,
  map_key,
  end_map,
  start_array,
  end_array
};

constexpr std::size_t event_kind_count = 11;

inline const char* to_string(event_kind k) noexcept {
  switch (k) {
    case event_kind::null_value: return "null";
    case event_kind::boolean: return "boolean";
    case event_kind::integer: return "integer";
    case event_kind::double_value: return "double";
    case event_kind::number: return "number";
    case event_kind::string: return "string";
    case event_kind::start_map: return "start_map";
    case event_kind::map_key: return "map_key";
    case event_kind::end_map: return "end_map";
    case event_kind::start_array: return "start_array";
    case event_kind::end_array: return "end_array";
  }
  return "unknown";
}

inline bool is_numeric(event_kind k) noexcept {
  return k == event_kind::integer || k == event_kind::double_value || k == event_kind::number;
}

// A value that begins at this event: scalars and container openings.
inline bool starts_value(event_kind k) noexcept {
  return k != event_kind::map_key && k != event_kind::end_map && k != event_kind::end_array;
}

// index: 0 none, 1 bool, 2 number, 3 text
using event_value = std::variant<std::monostate, bool, pulljson::number, std::string>;

struct event {
  event_kind kind{event_kind::null_value};
  event_value value;

  event() = default;
  explicit event(event_kind k) : kind(k) {}
  event(event_kind k, event_value v) : kind(k), value(std::move(v)) {}

  bool as_bool() const { return std::get<bool>(value); }
  const pulljson::number& as_number() const { return std::get<pulljson::number>(value); }
  const std::string& as_string() const { return std::get<std::string>(value); }
};

inline bool operator==(const event& a, const event& b) {
  return a.kind == b.kind && a.value == b.value;
}

inline bool operator!=(const event& a, const event& b) { return !(a == b); }

inline std::string to_string(const event& e) {
  std::string out = to_string(e.kind);
  switch (e.value.index()) {
    case 1:
      out += e.as_bool() ? " true" : " false";
      break;
    case 2:
      out.push_back(' ');
      out += e.as_number().to_string();
      break;
    case 3:
      out.push_back(' ');
      detail::dump_escaped(out, e.as_string());
      break;
    default:
      break;
  }
  return out;
}

inline std::ostream& operator<<(std::ostream& os, const event& e) { return os << to_string(e); }

} // namespace pulljson
