#pragma once

// Incremental (push) JSON recognizer. Bytes are fed in arbitrary chunks; every
// recognized token is reported synchronously through a table of callbacks while
// feed() runs. Tokens may straddle chunk boundaries at any byte.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <memory_resource>
#include <new>
#include <string>
#include <vector>

#include "error.hpp"
#include "text.hpp"

namespace pulljson {

enum class recognizer_status { ok, cancelled, insufficient_data, syntax_error };

inline const char* to_string(recognizer_status s) noexcept {
  switch (s) {
    case recognizer_status::ok: return "ok";
    case recognizer_status::cancelled: return "cancelled";
    case recognizer_status::insufficient_data: return "insufficient_data";
    case recognizer_status::syntax_error: return "syntax_error";
  }
  return "unknown";
}

// One entry per token kind. Return nonzero to continue, zero to cancel the
// parse. A null entry skips that token. Numeric payloads are the raw lexeme.
// When on_number is set it takes every number and on_integer/on_double are
// never called.
struct recognizer_callbacks {
  int (*on_null)(void* ctx) = nullptr;
  int (*on_boolean)(void* ctx, int value) = nullptr;
  int (*on_integer)(void* ctx, const char* s, std::size_t len) = nullptr;
  int (*on_double)(void* ctx, const char* s, std::size_t len) = nullptr;
  int (*on_number)(void* ctx, const char* s, std::size_t len) = nullptr;
  int (*on_string)(void* ctx, const char* s, std::size_t len) = nullptr;
  int (*on_start_map)(void* ctx) = nullptr;
  int (*on_map_key)(void* ctx, const char* s, std::size_t len) = nullptr;
  int (*on_end_map)(void* ctx) = nullptr;
  int (*on_start_array)(void* ctx) = nullptr;
  int (*on_end_array)(void* ctx) = nullptr;
};

struct recognizer_config {
  bool allow_comments{false};
  bool check_utf8{false};
  // Accept whitespace-separated top-level values one after another.
  bool multiple_values{false};
  // 0: unlimited
  std::size_t max_depth{0};
  // nullptr: std::pmr::get_default_resource()
  std::pmr::memory_resource* resource{nullptr};
};

class recognizer {
public:
  // Returns nullptr when the memory resource cannot provide the handle.
  static recognizer* allocate(const recognizer_callbacks* callbacks, const recognizer_config& config, void* ctx) noexcept {
    std::pmr::memory_resource* mr = config.resource ? config.resource : std::pmr::get_default_resource();
    void* mem = nullptr;
    try {
      mem = mr->allocate(sizeof(recognizer), alignof(recognizer));
    } catch (const std::bad_alloc&) {
      return nullptr;
    }
    try {
      return ::new (mem) recognizer(callbacks, config, ctx, mr);
    } catch (const std::bad_alloc&) {
      mr->deallocate(mem, sizeof(recognizer), alignof(recognizer));
      return nullptr;
    }
  }

  static void release(recognizer* r) noexcept {
    if (r == nullptr) return;
    std::pmr::memory_resource* mr = r->mr_;
    r->~recognizer();
    mr->deallocate(r, sizeof(recognizer), alignof(recognizer));
  }

  recognizer(const recognizer&) = delete;
  recognizer& operator=(const recognizer&) = delete;

  // ok once a complete top-level value has been seen, insufficient_data while
  // one is still open. syntax_error and cancelled are sticky.
  recognizer_status feed(const char* data, std::size_t len) {
    if (status_ == recognizer_status::cancelled || status_ == recognizer_status::syntax_error) return status_;
    chunk_begin_ = offset_;
    std::size_t i = 0;
    const recognizer_status st = consume(data, len, i);
    advance_position(data, i);
    offset_ += i;
    if (st == recognizer_status::syntax_error) {
      err_.line = line_;
      err_.column = column_;
    }
    return st;
  }

  // End of input. Flushes a pending top-level number; insufficient_data when
  // the document (or a comment) is still open.
  recognizer_status finalize() {
    if (status_ == recognizer_status::cancelled || status_ == recognizer_status::syntax_error) return status_;
    chunk_begin_ = offset_;
    switch (lex_) {
      case lex_state::between:
        break;
      case lex_state::line_comment:
        lex_ = lex_state::between;
        break;
      case lex_state::number:
        if (!number_complete()) return recognizer_status::insufficient_data;
        lex_ = lex_state::between;
        if (!emit_number()) return status_;
        break;
      default:
        return recognizer_status::insufficient_data;
    }
    if (stack_.size() == 1 &&
        (stack_.back() == state::complete || (cfg_.multiple_values && stack_.back() == state::start))) {
      return recognizer_status::ok;
    }
    return recognizer_status::insufficient_data;
  }

  // Positional diagnostic for the last syntax error (empty when there is
  // none). When verbose and `data` is the chunk that failed, a window of it is
  // appended with a caret under the offending byte.
  std::string get_error(bool verbose, const char* data, std::size_t len) const {
    if (!err_) return {};
    std::string out = "parse error: ";
    out += error_message(err_.code);
    out += " at line " + std::to_string(err_.line);
    out += ", column " + std::to_string(err_.column);
    out += " (offset " + std::to_string(err_.offset) + ")";

    if (verbose && data != nullptr && err_.offset >= chunk_begin_ && err_.offset - chunk_begin_ < len) {
      constexpr std::size_t window = 30;
      const std::size_t at = err_.offset - chunk_begin_;
      const std::size_t from = at > window ? at - window : 0;
      const std::size_t to = (len - at > window) ? at + window : len;
      out += "\n  ";
      for (std::size_t k = from; k < to; ++k) {
        const unsigned char c = static_cast<unsigned char>(data[k]);
        out.push_back((c < 0x20 || c == 0x7F) ? ' ' : static_cast<char>(c));
      }
      out += "\n  ";
      out.append(at - from, ' ');
      out.push_back('^');
    }
    return out;
  }

  const error& last_error() const noexcept { return err_; }
  recognizer_status status() const noexcept { return status_; }
  std::size_t bytes_consumed() const noexcept { return offset_; }
  std::size_t depth() const noexcept { return stack_.size() - 1; }

private:
  // Grammar position. The bottom entry is the top level (start/complete);
  // each open container pushes one entry.
  enum class state : std::uint8_t {
    start,
    complete,
    map_start,      // after '{'
    map_need_key,   // after ','
    map_sep,        // after key, before ':'
    map_need_val,   // after ':'
    map_got_val,
    array_start,    // after '['
    array_need_val, // after ','
    array_got_val
  };

  enum class lex_state : std::uint8_t {
    between,
    string,
    escape,
    unicode,
    number,
    literal,
    comment_open,
    line_comment,
    block_comment,
    block_comment_star
  };

  enum class num_state : std::uint8_t { sign, zero, int_digits, dot, frac_digits, exp, exp_sign, exp_digits };

  recognizer(const recognizer_callbacks* callbacks, const recognizer_config& config, void* ctx,
             std::pmr::memory_resource* mr)
      : cb_(callbacks), ctx_(ctx), cfg_(config), mr_(mr), stack_(mr), tok_(mr) {
    stack_.reserve(16);
    stack_.push_back(state::start);
  }

  ~recognizer() = default;

  recognizer_status consume(const char* data, std::size_t len, std::size_t& i) {
    while (i < len) {
      bool ok = true;
      switch (lex_) {
        case lex_state::between: ok = scan_between(data, len, i); break;
        case lex_state::string: ok = scan_string(data, len, i); break;
        case lex_state::escape: ok = scan_escape(data, i); break;
        case lex_state::unicode: ok = scan_unicode(data, len, i); break;
        case lex_state::number: ok = scan_number(data, len, i); break;
        case lex_state::literal: ok = scan_literal(data, len, i); break;
        case lex_state::comment_open: ok = scan_comment_open(data, i); break;
        case lex_state::line_comment: scan_line_comment(data, len, i); break;
        case lex_state::block_comment: scan_block_comment(data, len, i); break;
        case lex_state::block_comment_star: scan_block_comment_star(data, i); break;
      }
      if (!ok) return status_;
    }
    if (lex_ == lex_state::between && stack_.size() == 1 && stack_.back() == state::complete) {
      return recognizer_status::ok;
    }
    return recognizer_status::insufficient_data;
  }

  // ---- tokens between values -------------------------------------------

  bool scan_between(const char* data, std::size_t len, std::size_t& i) {
    while (i < len && detail::is_ws(data[i])) ++i;
    if (i >= len) return true;

    const char c = data[i];
    switch (c) {
      case '/':
        if (!cfg_.allow_comments) return fail(error_code::comments_not_allowed, i);
        lex_ = lex_state::comment_open;
        ++i;
        return true;
      case '{':
      case '[': {
        if (!begin_value(i)) return false;
        if (cfg_.max_depth != 0 && depth() + 1 > cfg_.max_depth) return fail(error_code::nesting_too_deep, i);
        ++i;
        if (c == '{') {
          stack_.push_back(state::map_start);
          return emit(cb_->on_start_map);
        }
        stack_.push_back(state::array_start);
        return emit(cb_->on_start_array);
      }
      case '}': {
        const state s = stack_.back();
        if (s != state::map_start && s != state::map_got_val) return fail(unexpected_token(), i);
        ++i;
        stack_.pop_back();
        return emit(cb_->on_end_map);
      }
      case ']': {
        const state s = stack_.back();
        if (s != state::array_start && s != state::array_got_val) return fail(unexpected_token(), i);
        ++i;
        stack_.pop_back();
        return emit(cb_->on_end_array);
      }
      case ',': {
        state& s = stack_.back();
        if (s == state::map_got_val) {
          s = state::map_need_key;
        } else if (s == state::array_got_val) {
          s = state::array_need_val;
        } else {
          return fail(unexpected_token(), i);
        }
        ++i;
        return true;
      }
      case ':': {
        state& s = stack_.back();
        if (s != state::map_sep) return fail(unexpected_token(), i);
        s = state::map_need_val;
        ++i;
        return true;
      }
      case '"': {
        state& s = stack_.back();
        if (s == state::map_start || s == state::map_need_key) {
          s = state::map_sep;
          key_ = true;
        } else {
          if (!begin_value(i)) return false;
          key_ = false;
        }
        ++i;
        tok_.clear();
        utf8_need_ = 0;
        high_surrogate_ = 0;
        lex_ = lex_state::string;
        return true;
      }
      case 't': return begin_literal("true", 4, i);
      case 'f': return begin_literal("false", 5, i);
      case 'n': return begin_literal("null", 4, i);
      default:
        break;
    }

    if (c == '-' || detail::is_digit(c)) {
      if (!begin_value(i)) return false;
      tok_.clear();
      tok_.push_back(c);
      num_ = (c == '-') ? num_state::sign : (c == '0' ? num_state::zero : num_state::int_digits);
      num_is_int_ = true;
      lex_ = lex_state::number;
      ++i;
      return true;
    }
    return fail(unexpected_token(), i);
  }

  // A value is about to start at data[i]: advance the enclosing state.
  bool begin_value(std::size_t i) {
    state& s = stack_.back();
    switch (s) {
      case state::start:
        s = state::complete;
        return true;
      case state::complete:
        if (cfg_.multiple_values) return true;
        return fail(error_code::trailing_characters, i);
      case state::map_need_val:
        s = state::map_got_val;
        return true;
      case state::array_start:
      case state::array_need_val:
        s = state::array_got_val;
        return true;
      default:
        return fail(unexpected_token(), i);
    }
  }

  error_code unexpected_token() const noexcept {
    switch (stack_.back()) {
      case state::complete: return error_code::trailing_characters;
      case state::map_start:
      case state::map_need_key: return error_code::expected_key_string;
      case state::map_sep: return error_code::expected_colon;
      case state::map_got_val:
      case state::array_got_val: return error_code::expected_comma_or_end;
      default: return error_code::invalid_value;
    }
  }

  // ---- strings -----------------------------------------------------------

  bool scan_string(const char* data, std::size_t len, std::size_t& i) {
    const std::size_t run_begin = i;
    while (i < len) {
      const unsigned char c = static_cast<unsigned char>(data[i]);
      if (utf8_need_ != 0) {
        if (c < utf8_lo_ || c > utf8_hi_) return fail(error_code::invalid_utf8, i);
        --utf8_need_;
        utf8_lo_ = 0x80;
        utf8_hi_ = 0xBF;
        ++i;
        continue;
      }
      if (c == '"' || c == '\\' || c < 0x20) break;
      if (c >= 0x80 && cfg_.check_utf8) {
        unsigned need = 0;
        if (!detail::utf8_lead(c, need, utf8_lo_, utf8_hi_)) return fail(error_code::invalid_utf8, i);
        utf8_need_ = static_cast<std::uint8_t>(need);
      }
      ++i;
    }
    if (i > run_begin) {
      flush_surrogate();
      tok_.append(data + run_begin, i - run_begin);
    }
    if (i >= len) return true;

    const char c = data[i];
    if (c == '"') {
      flush_surrogate();
      ++i;
      lex_ = lex_state::between;
      return emit(key_ ? cb_->on_map_key : cb_->on_string, tok_.data(), tok_.size());
    }
    if (c == '\\') {
      ++i;
      lex_ = lex_state::escape;
      return true;
    }
    return fail(error_code::invalid_string, i);
  }

  bool scan_escape(const char* data, std::size_t& i) {
    char out = 0;
    switch (data[i]) {
      case '"': out = '"'; break;
      case '\\': out = '\\'; break;
      case '/': out = '/'; break;
      case 'b': out = '\b'; break;
      case 'f': out = '\f'; break;
      case 'n': out = '\n'; break;
      case 'r': out = '\r'; break;
      case 't': out = '\t'; break;
      case 'u':
        ++i;
        cp_ = 0;
        hex_count_ = 0;
        lex_ = lex_state::unicode;
        return true;
      default:
        return fail(error_code::invalid_escape, i);
    }
    flush_surrogate();
    tok_.push_back(out);
    ++i;
    lex_ = lex_state::string;
    return true;
  }

  bool scan_unicode(const char* data, std::size_t len, std::size_t& i) {
    while (i < len && hex_count_ < 4) {
      const int h = detail::hex_val(data[i]);
      if (h < 0) return fail(error_code::invalid_unicode_escape, i);
      cp_ = (cp_ << 4) | static_cast<std::uint32_t>(h);
      ++hex_count_;
      ++i;
    }
    if (hex_count_ < 4) return true;

    if (high_surrogate_ != 0) {
      if (cp_ >= 0xDC00u && cp_ <= 0xDFFFu) {
        const std::uint32_t hi = high_surrogate_ - 0xD800u;
        const std::uint32_t lo = cp_ - 0xDC00u;
        detail::append_utf8(tok_, 0x10000u + ((hi << 10) | lo));
        high_surrogate_ = 0;
        lex_ = lex_state::string;
        return true;
      }
      flush_surrogate();
    }
    if (cp_ >= 0xD800u && cp_ <= 0xDBFFu) {
      // Wait for a possible low half.
      high_surrogate_ = cp_;
    } else {
      detail::append_utf8(tok_, cp_);
    }
    lex_ = lex_state::string;
    return true;
  }

  void flush_surrogate() {
    if (high_surrogate_ == 0) return;
    detail::append_utf8(tok_, high_surrogate_);
    high_surrogate_ = 0;
  }

  // ---- numbers -----------------------------------------------------------

  bool scan_number(const char* data, std::size_t len, std::size_t& i) {
    const std::size_t run_begin = i;
    while (i < len) {
      const char c = data[i];
      const bool digit = detail::is_digit(c);
      switch (num_) {
        case num_state::sign:
          if (c == '0') {
            num_ = num_state::zero;
          } else if (digit) {
            num_ = num_state::int_digits;
          } else {
            return fail(error_code::invalid_number, i);
          }
          break;
        case num_state::zero:
          if (digit) return fail(error_code::invalid_number, i);
          if (c == '.') {
            num_ = num_state::dot;
          } else if (c == 'e' || c == 'E') {
            num_ = num_state::exp;
          } else {
            return end_number(data, run_begin, i);
          }
          break;
        case num_state::int_digits:
          if (digit) break;
          if (c == '.') {
            num_ = num_state::dot;
          } else if (c == 'e' || c == 'E') {
            num_ = num_state::exp;
          } else {
            return end_number(data, run_begin, i);
          }
          break;
        case num_state::dot:
          if (!digit) return fail(error_code::invalid_number, i);
          num_ = num_state::frac_digits;
          break;
        case num_state::frac_digits:
          if (digit) break;
          if (c == 'e' || c == 'E') {
            num_ = num_state::exp;
          } else {
            return end_number(data, run_begin, i);
          }
          break;
        case num_state::exp:
          if (c == '+' || c == '-') {
            num_ = num_state::exp_sign;
          } else if (digit) {
            num_ = num_state::exp_digits;
          } else {
            return fail(error_code::invalid_number, i);
          }
          break;
        case num_state::exp_sign:
          if (!digit) return fail(error_code::invalid_number, i);
          num_ = num_state::exp_digits;
          break;
        case num_state::exp_digits:
          if (!digit) return end_number(data, run_begin, i);
          break;
      }
      if (num_ == num_state::dot || num_ == num_state::exp) num_is_int_ = false;
      ++i;
    }
    tok_.append(data + run_begin, i - run_begin);
    return true;
  }

  // data[i] is the first byte after the number; it is left for scan_between.
  bool end_number(const char* data, std::size_t run_begin, std::size_t i) {
    tok_.append(data + run_begin, i - run_begin);
    lex_ = lex_state::between;
    return emit_number();
  }

  bool number_complete() const noexcept {
    return num_ == num_state::zero || num_ == num_state::int_digits || num_ == num_state::frac_digits ||
           num_ == num_state::exp_digits;
  }

  bool emit_number() {
    if (cb_->on_number != nullptr) return emit(cb_->on_number, tok_.data(), tok_.size());
    return emit(num_is_int_ ? cb_->on_integer : cb_->on_double, tok_.data(), tok_.size());
  }

  // ---- literals ----------------------------------------------------------

  bool begin_literal(const char* lit, std::uint8_t lit_len, std::size_t& i) {
    if (!begin_value(i)) return false;
    lit_ = lit;
    lit_len_ = lit_len;
    lit_pos_ = 1;
    lex_ = lex_state::literal;
    ++i;
    return true;
  }

  bool scan_literal(const char* data, std::size_t len, std::size_t& i) {
    while (i < len && lit_pos_ < lit_len_) {
      if (data[i] != lit_[lit_pos_]) return fail(error_code::invalid_value, i);
      ++lit_pos_;
      ++i;
    }
    if (lit_pos_ < lit_len_) return true;
    lex_ = lex_state::between;
    switch (lit_[0]) {
      case 't': return emit_boolean(1);
      case 'f': return emit_boolean(0);
      default: return emit(cb_->on_null);
    }
  }

  // ---- comments ----------------------------------------------------------

  bool scan_comment_open(const char* data, std::size_t& i) {
    if (data[i] == '/') {
      lex_ = lex_state::line_comment;
    } else if (data[i] == '*') {
      lex_ = lex_state::block_comment;
    } else {
      return fail(error_code::invalid_comment, i);
    }
    ++i;
    return true;
  }

  void scan_line_comment(const char* data, std::size_t len, std::size_t& i) {
    const void* nl = std::memchr(data + i, '\n', len - i);
    if (nl == nullptr) {
      i = len;
      return;
    }
    i = static_cast<std::size_t>(static_cast<const char*>(nl) - data) + 1;
    lex_ = lex_state::between;
  }

  void scan_block_comment(const char* data, std::size_t len, std::size_t& i) {
    const void* star = std::memchr(data + i, '*', len - i);
    if (star == nullptr) {
      i = len;
      return;
    }
    i = static_cast<std::size_t>(static_cast<const char*>(star) - data) + 1;
    lex_ = lex_state::block_comment_star;
  }

  void scan_block_comment_star(const char* data, std::size_t& i) {
    if (data[i] == '/') {
      lex_ = lex_state::between;
    } else if (data[i] != '*') {
      lex_ = lex_state::block_comment;
    }
    ++i;
  }

  // ---- callbacks and failure --------------------------------------------

  bool emit(int (*fn)(void*)) {
    if (fn != nullptr && fn(ctx_) == 0) return cancel();
    return true;
  }

  bool emit(int (*fn)(void*, const char*, std::size_t), const char* s, std::size_t n) {
    if (fn != nullptr && fn(ctx_, s, n) == 0) return cancel();
    return true;
  }

  bool emit_boolean(int v) {
    if (cb_->on_boolean != nullptr && cb_->on_boolean(ctx_, v) == 0) return cancel();
    return true;
  }

  bool cancel() {
    status_ = recognizer_status::cancelled;
    err_.code = error_code::cancelled;
    return false;
  }

  bool fail(error_code code, std::size_t at) {
    status_ = recognizer_status::syntax_error;
    err_.code = code;
    err_.offset = chunk_begin_ + at;
    return false;
  }

  void advance_position(const char* data, std::size_t n) noexcept {
    for (std::size_t k = 0; k < n; ++k) {
      if (data[k] == '\n') {
        ++line_;
        column_ = 1;
      } else {
        ++column_;
      }
    }
  }

  const recognizer_callbacks* cb_;
  void* ctx_;
  recognizer_config cfg_;
  std::pmr::memory_resource* mr_;

  std::pmr::vector<state> stack_;
  std::pmr::string tok_;

  lex_state lex_{lex_state::between};
  num_state num_{num_state::sign};
  bool num_is_int_{true};
  bool key_{false};

  const char* lit_{nullptr};
  std::uint8_t lit_len_{0};
  std::uint8_t lit_pos_{0};

  std::uint32_t cp_{0};
  std::uint8_t hex_count_{0};
  std::uint32_t high_surrogate_{0};

  std::uint8_t utf8_need_{0};
  unsigned char utf8_lo_{0x80};
  unsigned char utf8_hi_{0xBF};

  recognizer_status status_{recognizer_status::ok};
  error err_;
  std::size_t offset_{0};
  std::size_t chunk_begin_{0};
  std::size_t line_{1};
  std::size_t column_{1};
};

struct recognizer_deleter {
  void operator()(recognizer* r) const noexcept { recognizer::release(r); }
};

using recognizer_ptr = std::unique_ptr<recognizer, recognizer_deleter>;

} // namespace pulljson
