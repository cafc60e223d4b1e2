#pragma once

// Chunked reader loop: pulls bytes from a source, pushes them through the
// recognizer and hands the resulting events out one at a time.

#include <cstddef>
#include <exception>
#include <istream>
#include <iterator>
#include <memory>
#include <memory_resource>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "convert.hpp"
#include "error.hpp"
#include "event.hpp"
#include "log.hpp"
#include "recognizer.hpp"
#include "source.hpp"

namespace pulljson {

// unified: every number is reported as event_kind::number.
// split: integer for lexemes without fraction or exponent, double_value otherwise.
enum class number_mode { unified, split };

struct parse_options {
  bool allow_comments{false};
  bool check_utf8{false};
  std::size_t chunk_size{64 * 1024};
  number_mode numbers{number_mode::unified};
  bool multiple_values{false};
  // 0: unlimited
  std::size_t max_depth{0};
  std::pmr::memory_resource* resource{nullptr};
};

inline void validate(const parse_options& opts) {
  if (opts.chunk_size == 0) throw std::invalid_argument("pulljson: chunk_size must be greater than zero");
}

enum class session_state { reading, completing, done, failed };

inline const char* to_string(session_state s) noexcept {
  switch (s) {
    case session_state::reading: return "reading";
    case session_state::completing: return "completing";
    case session_state::done: return "done";
    case session_state::failed: return "failed";
  }
  return "unknown";
}

namespace detail {

// Receives recognizer callbacks and appends converted events to one buffer.
// Conversion failures are kept as a deferred exception and cancel the parse.
struct event_channel {
  std::vector<event> events;
  std::exception_ptr deferred;
  bool check_utf8{false};

  int push(event_kind kind, const convert::payload& p) noexcept {
    try {
      events.push_back(convert::make_event(kind, p, check_utf8));
      return 1;
    } catch (...) {
      deferred = std::current_exception();
      return 0;
    }
  }

  template <event_kind K>
  static int on_plain(void* ctx) {
    return static_cast<event_channel*>(ctx)->push(K, convert::payload{});
  }

  template <event_kind K>
  static int on_bytes(void* ctx, const char* s, std::size_t len) {
    return static_cast<event_channel*>(ctx)->push(K, convert::payload{std::string_view(s, len), 0});
  }

  static int on_boolean(void* ctx, int v) {
    return static_cast<event_channel*>(ctx)->push(event_kind::boolean, convert::payload{{}, v});
  }
};

inline recognizer_callbacks common_callbacks() {
  recognizer_callbacks cb;
  cb.on_null = &event_channel::on_plain<event_kind::null_value>;
  cb.on_boolean = &event_channel::on_boolean;
  cb.on_string = &event_channel::on_bytes<event_kind::string>;
  cb.on_start_map = &event_channel::on_plain<event_kind::start_map>;
  cb.on_map_key = &event_channel::on_bytes<event_kind::map_key>;
  cb.on_end_map = &event_channel::on_plain<event_kind::end_map>;
  cb.on_start_array = &event_channel::on_plain<event_kind::start_array>;
  cb.on_end_array = &event_channel::on_plain<event_kind::end_array>;
  return cb;
}

// Shared by every session; built on first use and never modified.
inline const recognizer_callbacks& callbacks_for(number_mode mode) {
  static const recognizer_callbacks unified = [] {
    recognizer_callbacks cb = common_callbacks();
    cb.on_number = &event_channel::on_bytes<event_kind::number>;
    return cb;
  }();
  static const recognizer_callbacks split = [] {
    recognizer_callbacks cb = common_callbacks();
    cb.on_integer = &event_channel::on_bytes<event_kind::integer>;
    cb.on_double = &event_channel::on_bytes<event_kind::double_value>;
    return cb;
  }();
  return mode == number_mode::split ? split : unified;
}

class session {
public:
  session(byte_source& src, std::unique_ptr<byte_source> owned, const parse_options& opts)
      : opts_(opts), owned_(std::move(owned)), src_(&src) {
    validate(opts_);
    channel_.check_utf8 = opts_.check_utf8;

    recognizer_config cfg;
    cfg.allow_comments = opts_.allow_comments;
    cfg.check_utf8 = opts_.check_utf8;
    cfg.multiple_values = opts_.multiple_values;
    cfg.max_depth = opts_.max_depth;
    cfg.resource = opts_.resource;
    rec_.reset(recognizer::allocate(&callbacks_for(opts_.numbers), cfg, &channel_));
    if (!rec_) throw resource_error("pulljson: cannot allocate recognizer");

    buf_.resize(opts_.chunk_size);
    logger()->debug("session opened (chunk_size={}, comments={}, utf8={}, multiple_values={})", opts_.chunk_size,
                    opts_.allow_comments, opts_.check_utf8, opts_.multiple_values);
  }

  ~session() { close(); }

  session(const session&) = delete;
  session& operator=(const session&) = delete;

  bool next(event& out) {
    for (;;) {
      if (pos_ < channel_.events.size()) {
        out = std::move(channel_.events[pos_++]);
        return true;
      }
      channel_.events.clear();
      pos_ = 0;

      // Terminal states only become visible once their events are handed out.
      state_ = target_;
      if (pending_) {
        std::exception_ptr e = std::move(pending_);
        pending_ = nullptr;
        std::rethrow_exception(e);
      }
      if (state_ == session_state::done || state_ == session_state::failed) return false;
      step();
    }
  }

  session_state state() const noexcept { return state_; }
  std::size_t bytes_read() const noexcept { return bytes_read_; }

private:
  void step() {
    std::size_t n = 0;
    try {
      n = src_->read(buf_.data(), buf_.size());
    } catch (...) {
      logger()->debug("source read failed after {} bytes", bytes_read_);
      state_ = target_ = session_state::failed;
      close();
      throw;
    }

    if (n != 0) {
      bytes_read_ += n;
      logger()->trace("chunk of {} bytes (total {})", n, bytes_read_);
      const recognizer_status st = rec_->feed(buf_.data(), n);
      if (st == recognizer_status::syntax_error) {
        fail_malformed(buf_.data(), n);
      } else if (st == recognizer_status::cancelled) {
        fail_cancelled();
      }
      return;
    }

    state_ = target_ = session_state::completing;
    const recognizer_status st = rec_->finalize();
    switch (st) {
      case recognizer_status::ok:
        target_ = session_state::done;
        close();
        break;
      case recognizer_status::insufficient_data: {
        const std::size_t at = rec_->bytes_consumed();
        logger()->debug("input ended inside a value at offset {}", at);
        pending_ = std::make_exception_ptr(premature_end_error(at));
        target_ = session_state::failed;
        close();
        break;
      }
      case recognizer_status::syntax_error:
        fail_malformed(nullptr, 0);
        break;
      case recognizer_status::cancelled:
        fail_cancelled();
        break;
    }
  }

  void fail_malformed(const char* data, std::size_t len) {
    std::string diagnostic = rec_->get_error(true, data, len);
    const error err = rec_->last_error();
    logger()->debug("{}", diagnostic);
    pending_ = std::make_exception_ptr(malformed_input_error(diagnostic, err));
    target_ = session_state::failed;
    close();
  }

  void fail_cancelled() {
    if (channel_.deferred) {
      pending_ = channel_.deferred;
      channel_.deferred = nullptr;
      logger()->debug("event conversion failed after {} bytes", bytes_read_);
    } else {
      pending_ = std::make_exception_ptr(json_error("pulljson: recognizer cancelled without a pending error"));
    }
    target_ = session_state::failed;
    close();
  }

  void close() noexcept {
    if (!rec_) return;
    rec_.reset();
    logger()->debug("session closed ({}, {} bytes read)", to_string(target_), bytes_read_);
  }

  parse_options opts_;
  std::unique_ptr<byte_source> owned_;
  byte_source* src_;
  std::vector<char> buf_;
  event_channel channel_;
  std::size_t pos_{0};
  recognizer_ptr rec_;
  session_state state_{session_state::reading};
  session_state target_{session_state::reading};
  // Raised once the events recognized before it have been handed out.
  std::exception_ptr pending_;
  std::size_t bytes_read_{0};
};

// Input iterator over anything with bool next(Value&).
template <class Stream, class Value>
class pull_iterator {
public:
  using iterator_category = std::input_iterator_tag;
  using value_type = Value;
  using difference_type = std::ptrdiff_t;
  using pointer = const Value*;
  using reference = const Value&;

  pull_iterator() = default;
  explicit pull_iterator(Stream* s) : s_(s) { advance(); }

  reference operator*() const { return cur_; }
  pointer operator->() const { return &cur_; }

  pull_iterator& operator++() {
    advance();
    return *this;
  }

  friend bool operator==(const pull_iterator& a, const pull_iterator& b) { return a.s_ == b.s_; }
  friend bool operator!=(const pull_iterator& a, const pull_iterator& b) { return a.s_ != b.s_; }

private:
  void advance() {
    if (s_ != nullptr && !s_->next(cur_)) s_ = nullptr;
  }

  Stream* s_{nullptr};
  Value cur_{};
};

} // namespace detail

// Lazy, forward-only, single-pass sequence of events. Destroying it releases
// the recognizer even when the input was not read to the end.
class event_stream {
public:
  using iterator = detail::pull_iterator<event_stream, event>;

  explicit event_stream(byte_source& src, const parse_options& opts = {})
      : s_(std::make_unique<detail::session>(src, nullptr, opts)) {}

  explicit event_stream(std::unique_ptr<byte_source> src, const parse_options& opts = {}) {
    if (!src) throw std::invalid_argument("pulljson: null byte source");
    byte_source& ref = *src;
    s_ = std::make_unique<detail::session>(ref, std::move(src), opts);
  }

  // false once the input is exhausted or after a failure has been raised.
  bool next(event& out) { return s_ && s_->next(out); }

  session_state state() const noexcept { return s_ ? s_->state() : session_state::done; }
  std::size_t bytes_read() const noexcept { return s_ ? s_->bytes_read() : 0; }

  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

private:
  std::unique_ptr<detail::session> s_;
};

inline event_stream basic_parse(byte_source& src, const parse_options& opts = {}) {
  return event_stream(src, opts);
}

inline event_stream basic_parse(std::unique_ptr<byte_source> src, const parse_options& opts = {}) {
  return event_stream(std::move(src), opts);
}

inline event_stream basic_parse(std::istream& in, const parse_options& opts = {}) {
  return event_stream(std::make_unique<istream_source>(in), opts);
}

// The text must outlive the stream.
inline event_stream basic_parse(std::string_view text, const parse_options& opts = {}) {
  return event_stream(std::make_unique<string_source>(text), opts);
}

} // namespace pulljson
