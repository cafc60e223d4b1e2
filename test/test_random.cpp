#include "test_common.hpp"

#include <string>
#include <vector>

using namespace pulljson;

namespace {

struct rng {
  std::uint64_t s{0x9E3779B97F4A7C15ull};
  std::uint64_t next_u64() {
    // xorshift64*
    std::uint64_t x = s;
    x ^= x >> 12;
    x ^= x << 25;
    x ^= x >> 27;
    s = x;
    return x * 2685821657736338717ull;
  }
  std::uint32_t next_u32() { return static_cast<std::uint32_t>(next_u64() >> 32); }
  std::size_t range(std::size_t n) { return n ? static_cast<std::size_t>(next_u64() % n) : 0u; }
  bool coin() { return (next_u64() & 1ull) != 0; }
};

std::string random_string(rng& r, std::size_t max_len) {
  const std::size_t len = r.range(max_len + 1);
  std::string out;
  out.reserve(len);
  for (std::size_t i = 0; i < len; ++i) {
    switch (r.next_u32() % 18u) {
      case 0: out.push_back('\"'); break;
      case 1: out.push_back('\\'); break;
      case 2: out.push_back('\n'); break;
      case 3: out.push_back('\x01'); break;
      case 4: out += "\xC3\xA9"; break;
      case 5: out += "\xF0\x9F\x98\x83"; break;
      default: out.push_back(static_cast<char>(' ' + (r.next_u32() % 95u))); break;
    }
  }
  return out;
}

std::string random_digits(rng& r, std::size_t max_len) {
  std::string d(1, static_cast<char>('1' + r.range(9)));
  const std::size_t extra = r.range(max_len);
  for (std::size_t i = 0; i < extra; ++i) d.push_back(static_cast<char>('0' + r.range(10)));
  return d;
}

// Lexeme in the JSON number grammar: integers up to 45 digits, fractions,
// exponents and trailing zeros.
std::string random_number(rng& r) {
  std::string out;
  if (r.coin()) out.push_back('-');
  out += r.range(5) == 0 ? std::string("0") : random_digits(r, 45);
  if (r.coin()) {
    out.push_back('.');
    out += std::to_string(r.range(1000));
    if (r.coin()) out += "00";
  }
  if (r.range(3) == 0) {
    out.push_back(r.coin() ? 'e' : 'E');
    if (r.coin()) out.push_back(r.coin() ? '+' : '-');
    out += std::to_string(r.range(400));
  }
  return out;
}

void random_doc(rng& r, int depth, std::string& out) {
  const std::uint32_t k = r.next_u32() % (depth <= 0 ? 5u : 7u);
  switch (k) {
    case 0: out += "null"; return;
    case 1: out += r.coin() ? "true" : "false"; return;
    case 2:
    case 3: out += random_number(r); return;
    case 4: detail::dump_escaped(out, random_string(r, 20)); return;
    case 5: {
      out.push_back('[');
      const std::size_t n = r.range(6);
      for (std::size_t i = 0; i < n; ++i) {
        if (i) out += r.coin() ? ", " : ",";
        random_doc(r, depth - 1, out);
      }
      out.push_back(']');
      return;
    }
    default: {
      out += "{ ";
      const std::size_t n = r.range(6);
      for (std::size_t i = 0; i < n; ++i) {
        if (i) out += ",\n";
        detail::dump_escaped(out, random_string(r, 10));
        out += r.coin() ? ":" : " : ";
        random_doc(r, depth - 1, out);
      }
      out += " }";
      return;
    }
  }
}

} // namespace

void test_random() {
  rng r;
  // Deterministic pseudo-fuzz: random documents must give the same events
  // for any chunking, and re-serialized events must read back unchanged.
  for (int iter = 0; iter < 1000; ++iter) {
    std::string doc;
    random_doc(r, 4, doc);

    const std::vector<event> whole = pulljson_test::collect(doc);
    const std::size_t chunk = 1 + r.range(17);
    const std::vector<event> chunked = pulljson_test::collect(doc, pulljson_test::with_chunk(chunk));
    PULLJSON_CHECK(chunked == whole);
    // Equality is by numeric value; integers must also stay integers.
    for (std::size_t i = 0; i < whole.size(); ++i) {
      if (whole[i].kind != event_kind::number) continue;
      PULLJSON_CHECK(chunked[i].as_number().is_integer() == whole[i].as_number().is_integer());
    }

    parse_options strict;
    strict.check_utf8 = true;
    PULLJSON_CHECK(pulljson_test::collect(doc, strict) == whole);

    const std::string text = write_events(whole);
    PULLJSON_CHECK(pulljson_test::collect(text) == whole);

    // The root item holds the same value as the events.
    auto root = items(doc, "");
    value v;
    PULLJSON_CHECK(root.next(v));
    PULLJSON_CHECK(dump(v) == text);
    PULLJSON_CHECK(!root.next(v));

    // Cutting the document short is never reported as malformed.
    if (doc.size() > 1) {
      const std::string cut = doc.substr(0, 1 + r.range(doc.size() - 1));
      std::exception_ptr err;
      (void)pulljson_test::collect_until_error(cut, pulljson_test::with_chunk(chunk), err);
      if (err) {
        try {
          std::rethrow_exception(err);
        } catch (const premature_end_error&) {
        }
      }
    }
  }
}
