#pragma once

// Serializes an event sequence back to compact JSON text.

#include <cstddef>
#include <string>
#include <vector>

#include "error.hpp"
#include "event.hpp"
#include "text.hpp"

namespace pulljson {

class event_writer {
public:
  event_writer() { slots_.push_back(slot::top); }

  // Throws json_error when the event cannot appear at this point.
  void write(const event& e) {
    switch (e.kind) {
      case event_kind::map_key: {
        slot& s = slots_.back();
        if (s != slot::map_key_first && s != slot::map_key_next) fail(e);
        if (s == slot::map_key_next) out_.push_back(',');
        detail::dump_escaped(out_, e.as_string());
        out_.push_back(':');
        s = slot::map_value;
        return;
      }
      case event_kind::end_map: {
        const slot s = slots_.back();
        if (s != slot::map_key_first && s != slot::map_key_next) fail(e);
        slots_.pop_back();
        out_.push_back('}');
        return;
      }
      case event_kind::end_array: {
        const slot s = slots_.back();
        if (s != slot::array_first && s != slot::array_next) fail(e);
        slots_.pop_back();
        out_.push_back(']');
        return;
      }
      default:
        break;
    }

    begin_value(e);
    if (is_numeric(e.kind)) {
      out_ += e.as_number().to_string();
      return;
    }
    switch (e.kind) {
      case event_kind::null_value:
        out_ += "null";
        break;
      case event_kind::boolean:
        out_ += e.as_bool() ? "true" : "false";
        break;
      case event_kind::string:
        detail::dump_escaped(out_, e.as_string());
        break;
      case event_kind::start_map:
        out_.push_back('{');
        slots_.push_back(slot::map_key_first);
        break;
      case event_kind::start_array:
        out_.push_back('[');
        slots_.push_back(slot::array_first);
        break;
      default:
        break;
    }
  }

  // True when no container is open.
  bool complete() const noexcept { return slots_.size() == 1 && values_ != 0; }

  const std::string& str() const noexcept { return out_; }
  std::string take() { return std::move(out_); }

private:
  enum class slot { top, array_first, array_next, map_key_first, map_key_next, map_value };

  void begin_value(const event& e) {
    slot& s = slots_.back();
    switch (s) {
      case slot::top:
        // Multiple top-level values go one per line.
        if (values_ != 0) out_.push_back('\n');
        ++values_;
        return;
      case slot::array_first:
        s = slot::array_next;
        return;
      case slot::array_next:
        out_.push_back(',');
        return;
      case slot::map_value:
        s = slot::map_key_next;
        return;
      default:
        fail(e);
    }
  }

  [[noreturn]] static void fail(const event& e) {
    throw json_error(std::string("pulljson: unexpected ") + to_string(e.kind) + " event while writing");
  }

  std::vector<slot> slots_;
  std::string out_;
  std::size_t values_{0};
};

// Writes every event of `events` (anything iterable yielding pulljson::event).
template <class Events>
inline std::string write_events(Events&& events) {
  event_writer w;
  for (const event& e : events) w.write(e);
  if (!w.complete()) throw json_error("pulljson: event sequence ended inside a value");
  return w.take();
}

} // namespace pulljson
