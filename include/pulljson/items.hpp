#pragma once

// Prefix extractor: rebuilds the complete values found at a path pattern.

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "error.hpp"
#include "parse.hpp"
#include "value.hpp"

namespace pulljson {

// Segments separated by '.': `name`, `["any key"]`, `[N]`, `[*]` (any array
// index), `*` (any map key). Bracket segments may follow without a dot:
// `rows[*].id`. The empty pattern selects the root value.
class path_pattern {
public:
  enum class segment_kind { key, index, any_key, any_index };

  struct segment {
    segment_kind kind{segment_kind::key};
    std::string key;
    std::size_t index{0};
  };

  path_pattern() = default;

  static path_pattern parse(std::string_view text) {
    path_pattern out;
    std::size_t i = 0;
    bool need_segment = false;
    while (i < text.size()) {
      if (text[i] == '[') {
        out.segments_.push_back(parse_bracket(text, i));
      } else {
        if (!out.segments_.empty() && !need_segment) bad(text, "expected '.' or '['");
        const std::size_t begin = i;
        while (i < text.size() && text[i] != '.' && text[i] != '[') ++i;
        if (i == begin) bad(text, "empty segment");
        segment s;
        const std::string_view name = text.substr(begin, i - begin);
        if (name == "*") {
          s.kind = segment_kind::any_key;
        } else {
          s.key = std::string(name);
        }
        out.segments_.push_back(std::move(s));
      }
      need_segment = false;
      if (i < text.size() && text[i] == '.') {
        ++i;
        need_segment = true;
      }
    }
    if (need_segment) bad(text, "trailing '.'");
    return out;
  }

  bool matches(const json_path& path) const noexcept {
    if (path.size() != segments_.size()) return false;
    for (std::size_t k = 0; k < path.size(); ++k) {
      const segment& s = segments_[k];
      const path_element& e = path[k];
      switch (s.kind) {
        case segment_kind::key:
          if (e.is_index || e.key != s.key) return false;
          break;
        case segment_kind::index:
          if (!e.is_index || e.index != s.index) return false;
          break;
        case segment_kind::any_key:
          if (e.is_index) return false;
          break;
        case segment_kind::any_index:
          if (!e.is_index) return false;
          break;
      }
    }
    return true;
  }

  const std::vector<segment>& segments() const noexcept { return segments_; }
  bool is_root() const noexcept { return segments_.empty(); }

private:
  [[noreturn]] static void bad(std::string_view text, const char* why) {
    throw std::invalid_argument("pulljson: bad path pattern '" + std::string(text) + "': " + why);
  }

  static segment parse_bracket(std::string_view text, std::size_t& i) {
    ++i; // '['
    segment s;
    if (i < text.size() && text[i] == '*') {
      ++i;
      s.kind = segment_kind::any_index;
    } else if (i < text.size() && detail::is_digit(text[i])) {
      s.kind = segment_kind::index;
      std::size_t v = 0;
      while (i < text.size() && detail::is_digit(text[i])) {
        const auto d = static_cast<std::size_t>(text[i] - '0');
        if (v > (static_cast<std::size_t>(-1) - d) / 10u) bad(text, "index out of range");
        v = v * 10u + d;
        ++i;
      }
      s.index = v;
    } else if (i < text.size() && text[i] == '"') {
      ++i;
      s.kind = segment_kind::key;
      s.key = parse_quoted(text, i);
    } else {
      bad(text, "expected '*', index or quoted key after '['");
    }
    if (i >= text.size() || text[i] != ']') bad(text, "expected ']'");
    ++i;
    return s;
  }

  // JSON string escapes; i is just past the opening quote.
  static std::string parse_quoted(std::string_view text, std::size_t& i) {
    std::string out;
    while (i < text.size() && text[i] != '"') {
      const char c = text[i++];
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (i >= text.size()) break;
      const char esc = text[i++];
      switch (esc) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          if (text.size() - i < 4) bad(text, "short \\u escape");
          std::uint32_t cp = 0;
          for (int k = 0; k < 4; ++k) {
            const int h = detail::hex_val(text[i++]);
            if (h < 0) bad(text, "bad \\u escape");
            cp = (cp << 4) | static_cast<std::uint32_t>(h);
          }
          detail::append_utf8(out, cp);
          break;
        }
        default:
          bad(text, "bad escape in quoted key");
      }
    }
    if (i >= text.size()) bad(text, "unterminated quoted key");
    ++i; // closing quote
    return out;
  }

  std::vector<segment> segments_;
};

namespace detail {

// Rebuilds one value from its events, keeping a stack of pointers to the open
// containers.
class value_builder {
public:
  void reset() {
    root_ = value();
    stack_.clear();
    key_.clear();
  }

  // True once the value that started with the first event is complete.
  bool add(event_kind kind, event_value&& v) {
    switch (kind) {
      case event_kind::start_map:
        stack_.push_back(handle_value(value(value::object{})));
        return false;
      case event_kind::start_array:
        stack_.push_back(handle_value(value(value::array{})));
        return false;
      case event_kind::map_key:
        key_ = std::move(std::get<std::string>(v));
        return false;
      case event_kind::end_map:
      case event_kind::end_array:
        if (stack_.empty()) throw json_error("pulljson: unbalanced container end");
        stack_.pop_back();
        return stack_.empty();
      case event_kind::null_value:
        handle_value(value());
        break;
      case event_kind::boolean:
        handle_value(value(std::get<bool>(v)));
        break;
      case event_kind::string:
        handle_value(value(std::move(std::get<std::string>(v))));
        break;
      default:
        handle_value(value(std::move(std::get<pulljson::number>(v))));
        break;
    }
    return stack_.empty();
  }

  value take() { return std::move(root_); }

private:
  value* handle_value(value&& v) {
    if (stack_.empty()) {
      root_ = std::move(v);
      return &root_;
    }
    value* top = stack_.back();
    if (top->is_array()) {
      auto& a = top->as_array();
      a.push_back(std::move(v));
      return &a.back();
    }
    auto& o = top->as_object();
    o.emplace_back(std::move(key_), std::move(v));
    key_.clear();
    return &o.back().second;
  }

  value root_;
  std::vector<value*> stack_;
  std::string key_;
};

} // namespace detail

class item_stream {
public:
  using iterator = detail::pull_iterator<item_stream, value>;

  item_stream(parse_stream events, path_pattern prefix)
      : events_(std::move(events)), prefix_(std::move(prefix)) {}

  bool next(value& out) {
    parse_event pe;
    while (events_.next(pe)) {
      if (!starts_value(pe.kind) || !prefix_.matches(pe.path)) continue;
      builder_.reset();
      bool done = builder_.add(pe.kind, std::move(pe.value));
      while (!done) {
        if (!events_.next(pe)) throw json_error("pulljson: event stream ended inside a value");
        done = builder_.add(pe.kind, std::move(pe.value));
      }
      out = builder_.take();
      return true;
    }
    return false;
  }

  const path_pattern& prefix() const noexcept { return prefix_; }

  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

private:
  parse_stream events_;
  path_pattern prefix_;
  detail::value_builder builder_;
};

inline item_stream items(parse_stream events, std::string_view prefix) {
  return item_stream(std::move(events), path_pattern::parse(prefix));
}

inline item_stream items(event_stream events, std::string_view prefix) {
  return item_stream(parse_stream(std::move(events)), path_pattern::parse(prefix));
}

// The text must outlive the stream.
inline item_stream items(std::string_view text, std::string_view prefix, const parse_options& opts = {}) {
  return item_stream(parse(text, opts), path_pattern::parse(prefix));
}

inline item_stream items(std::istream& in, std::string_view prefix, const parse_options& opts = {}) {
  return item_stream(parse(in, opts), path_pattern::parse(prefix));
}

} // namespace pulljson
