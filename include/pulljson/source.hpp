#pragma once

#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <istream>
#include <string>
#include <string_view>

#include "error.hpp"

namespace pulljson {

// Pull-style byte producer. read() returns 0 only once the input is exhausted.
class byte_source {
public:
  virtual ~byte_source() = default;
  virtual std::size_t read(char* buf, std::size_t n) = 0;
};

// Borrows the text; it must outlive the source.
class string_source final : public byte_source {
public:
  explicit string_source(std::string_view text) noexcept : text_(text) {}

  std::size_t read(char* buf, std::size_t n) override {
    const std::size_t take = (text_.size() - pos_ < n) ? text_.size() - pos_ : n;
    if (take != 0) std::memcpy(buf, text_.data() + pos_, take);
    pos_ += take;
    return take;
  }

private:
  std::string_view text_;
  std::size_t pos_{0};
};

class istream_source final : public byte_source {
public:
  explicit istream_source(std::istream& in) noexcept : in_(in) {}

  std::size_t read(char* buf, std::size_t n) override {
    if (n == 0 || in_.eof()) return 0;
    in_.read(buf, static_cast<std::streamsize>(n));
    const auto got = static_cast<std::size_t>(in_.gcount());
    if (in_.bad() || (in_.fail() && !in_.eof())) {
      throw json_error("pulljson: input stream read failed");
    }
    return got;
  }

private:
  std::istream& in_;
};

class file_source final : public byte_source {
public:
  explicit file_source(const std::string& path) : path_(path) {
#if defined(_MSC_VER)
    if (fopen_s(&f_, path.c_str(), "rb") != 0) f_ = nullptr;
#else
    f_ = std::fopen(path.c_str(), "rb");
#endif
    if (f_ == nullptr) {
      throw json_error("pulljson: cannot open file: " + path + ": " + std::strerror(errno));
    }
  }

  ~file_source() override {
    if (f_ != nullptr) std::fclose(f_);
  }

  file_source(const file_source&) = delete;
  file_source& operator=(const file_source&) = delete;

  std::size_t read(char* buf, std::size_t n) override {
    const std::size_t got = std::fread(buf, 1, n, f_);
    if (got < n && std::ferror(f_) != 0) {
      throw json_error("pulljson: read failed: " + path_);
    }
    return got;
  }

  const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
  std::FILE* f_{nullptr};
};

} // namespace pulljson
