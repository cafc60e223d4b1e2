#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace pulljson {

enum class error_code {
  ok = 0,
  invalid_value,
  invalid_number,
  invalid_string,
  invalid_escape,
  invalid_unicode_escape,
  invalid_utf8,
  expected_colon,
  expected_comma_or_end,
  expected_key_string,
  trailing_characters,
  nesting_too_deep,
  comments_not_allowed,
  invalid_comment,
  cancelled
};

// Position of the offending byte, counted over the whole stream (not the chunk).
struct error {
  error_code code{error_code::ok};
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};

  constexpr explicit operator bool() const noexcept { return code != error_code::ok; }
};

inline const char* error_message(error_code code) noexcept {
  switch (code) {
    case error_code::ok: return "no error";
    case error_code::invalid_value: return "invalid value";
    case error_code::invalid_number: return "invalid number";
    case error_code::invalid_string: return "invalid character inside string";
    case error_code::invalid_escape: return "invalid escape sequence";
    case error_code::invalid_unicode_escape: return "invalid \\u escape";
    case error_code::invalid_utf8: return "invalid UTF-8 byte sequence";
    case error_code::expected_colon: return "expected ':' after object key";
    case error_code::expected_comma_or_end: return "expected ',' or closing bracket";
    case error_code::expected_key_string: return "expected string object key";
    case error_code::trailing_characters: return "trailing characters after top-level value";
    case error_code::nesting_too_deep: return "nesting too deep";
    case error_code::comments_not_allowed: return "probable comment found, comments are not enabled";
    case error_code::invalid_comment: return "invalid comment";
    case error_code::cancelled: return "parse cancelled by callback";
  }
  return "unknown error";
}

class json_error : public std::runtime_error {
public:
  explicit json_error(const std::string& what) : std::runtime_error(what) {}
};

// The recognizer rejected the byte stream. what() is the positional diagnostic.
class malformed_input_error : public json_error {
public:
  malformed_input_error(const std::string& diagnostic, const error& err)
      : json_error(diagnostic), err_(err) {}

  const error& err() const noexcept { return err_; }

private:
  error err_;
};

// Everything seen was valid, but the input ended inside a value.
class premature_end_error : public json_error {
public:
  explicit premature_end_error(std::size_t offset)
      : json_error("pulljson: incomplete or empty JSON input (ended at offset " + std::to_string(offset) + ")"),
        offset_(offset) {}

  std::size_t offset() const noexcept { return offset_; }

private:
  std::size_t offset_;
};

class decode_error : public json_error {
public:
  explicit decode_error(const std::string& what) : json_error(what) {}
};

class resource_error : public json_error {
public:
  explicit resource_error(const std::string& what) : json_error(what) {}
};

} // namespace pulljson
