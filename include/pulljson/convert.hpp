#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "error.hpp"
#include "event.hpp"
#include "number.hpp"
#include "text.hpp"

namespace pulljson {
namespace convert {

// Raw payload of one token: a byte span, or a flag for booleans.
struct payload {
  std::string_view bytes;
  int flag{0};
};

inline bool to_boolean(int flag) noexcept { return flag != 0; }

inline number to_integer(std::string_view lexeme) {
  auto n = number::parse_integer(lexeme);
  if (!n) throw decode_error("pulljson: not an integer lexeme: " + std::string(lexeme));
  return std::move(*n);
}

inline number to_decimal(std::string_view lexeme) {
  std::optional<number> n;
  try {
    n = number::parse_decimal(lexeme);
  } catch (const std::out_of_range& e) {
    throw decode_error(e.what());
  }
  if (!n) throw decode_error("pulljson: not a number lexeme: " + std::string(lexeme));
  return std::move(*n);
}

// Exact integer first so integers never pass through a decimal form.
inline number to_number(std::string_view lexeme) {
  if (auto i = number::parse_integer(lexeme)) return std::move(*i);
  return to_decimal(lexeme);
}

inline std::string to_text(std::string_view bytes, bool check_utf8) {
  if (check_utf8 && !detail::is_valid_utf8(bytes)) {
    throw decode_error("pulljson: string payload is not valid UTF-8");
  }
  return std::string(bytes);
}

using converter = event_value (*)(const payload& p, bool check_utf8);

// Indexed by event_kind.
inline const std::array<converter, event_kind_count>& converters() {
  static const std::array<converter, event_kind_count> table = {{
      /* null_value   */ [](const payload&, bool) -> event_value { return std::monostate{}; },
      /* boolean      */ [](const payload& p, bool) -> event_value { return to_boolean(p.flag); },
      /* integer      */ [](const payload& p, bool) -> event_value { return to_integer(p.bytes); },
      /* double_value */ [](const payload& p, bool) -> event_value { return to_decimal(p.bytes); },
      /* number       */ [](const payload& p, bool) -> event_value { return to_number(p.bytes); },
      /* string       */ [](const payload& p, bool utf8) -> event_value { return to_text(p.bytes, utf8); },
      /* start_map    */ [](const payload&, bool) -> event_value { return std::monostate{}; },
      /* map_key      */ [](const payload& p, bool utf8) -> event_value { return to_text(p.bytes, utf8); },
      /* end_map      */ [](const payload&, bool) -> event_value { return std::monostate{}; },
      /* start_array  */ [](const payload&, bool) -> event_value { return std::monostate{}; },
      /* end_array    */ [](const payload&, bool) -> event_value { return std::monostate{}; },
  }};
  return table;
}

inline event make_event(event_kind kind, const payload& p, bool check_utf8) {
  return event(kind, converters()[static_cast<std::size_t>(kind)](p, check_utf8));
}

} // namespace convert
} // namespace pulljson
