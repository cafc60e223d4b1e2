#pragma once

// Context builder: tags every event with the path of the value it belongs to.

#include <cstddef>
#include <istream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "basic_parse.hpp"
#include "event.hpp"
#include "text.hpp"

namespace pulljson {

struct path_element {
  bool is_index{false};
  std::string key;
  std::size_t index{0};

  static path_element make_key(std::string k) {
    path_element e;
    e.key = std::move(k);
    return e;
  }

  static path_element make_index(std::size_t i) {
    path_element e;
    e.is_index = true;
    e.index = i;
    return e;
  }
};

inline bool operator==(const path_element& a, const path_element& b) {
  if (a.is_index != b.is_index) return false;
  return a.is_index ? a.index == b.index : a.key == b.key;
}

inline bool operator!=(const path_element& a, const path_element& b) { return !(a == b); }

using json_path = std::vector<path_element>;

namespace detail {

inline bool is_identifier(std::string_view s) noexcept {
  if (s.empty()) return false;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    const bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    if (!alpha && !(i > 0 && is_digit(c))) return false;
  }
  return true;
}

} // namespace detail

// a.b[2].c, with ["..."] for keys that are not plain identifiers. The root
// path formats as an empty string.
inline std::string format_path(const json_path& path) {
  std::string out;
  for (const auto& e : path) {
    if (e.is_index) {
      out.push_back('[');
      out += std::to_string(e.index);
      out.push_back(']');
    } else if (detail::is_identifier(e.key)) {
      if (!out.empty()) out.push_back('.');
      out += e.key;
    } else {
      out.push_back('[');
      detail::dump_escaped(out, e.key);
      out.push_back(']');
    }
  }
  return out;
}

struct parse_event {
  json_path path;
  event_kind kind{event_kind::null_value};
  event_value value;

  pulljson::event to_event() const { return pulljson::event(kind, value); }
};

// Values and container openings carry their own path; map keys and container
// ends carry the path of the enclosing container.
class parse_stream {
public:
  using iterator = detail::pull_iterator<parse_stream, parse_event>;

  explicit parse_stream(event_stream events) : events_(std::move(events)) {}

  bool next(parse_event& out) {
    event e;
    if (!events_.next(e)) return false;

    out.kind = e.kind;
    out.value = std::move(e.value);
    switch (e.kind) {
      case event_kind::map_key:
        out.path = path_;
        frames_.back().key = out.value.index() == 3 ? std::get<std::string>(out.value) : std::string();
        break;
      case event_kind::end_map:
      case event_kind::end_array:
        frames_.pop_back();
        out.path = path_;
        if (!path_.empty()) path_.pop_back();
        break;
      case event_kind::start_map:
      case event_kind::start_array:
        out.path = value_path();
        path_ = out.path;
        frames_.push_back(frame{e.kind == event_kind::start_array, 0, std::string()});
        break;
      default:
        out.path = value_path();
        break;
    }
    return true;
  }

  // Path of the innermost open container.
  const json_path& current_path() const noexcept { return path_; }
  std::size_t depth() const noexcept { return frames_.size(); }
  session_state state() const noexcept { return events_.state(); }

  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

private:
  struct frame {
    bool is_array{false};
    std::size_t next_index{0};
    std::string key;
  };

  json_path value_path() {
    json_path p = path_;
    if (frames_.empty()) return p;
    frame& f = frames_.back();
    if (f.is_array) {
      p.push_back(path_element::make_index(f.next_index++));
    } else {
      p.push_back(path_element::make_key(f.key));
    }
    return p;
  }

  event_stream events_;
  json_path path_;
  std::vector<frame> frames_;
};

inline parse_stream parse(event_stream events) { return parse_stream(std::move(events)); }

inline parse_stream parse(byte_source& src, const parse_options& opts = {}) {
  return parse_stream(basic_parse(src, opts));
}

inline parse_stream parse(std::istream& in, const parse_options& opts = {}) {
  return parse_stream(basic_parse(in, opts));
}

// The text must outlive the stream.
inline parse_stream parse(std::string_view text, const parse_options& opts = {}) {
  return parse_stream(basic_parse(text, opts));
}

} // namespace pulljson
