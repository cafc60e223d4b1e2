#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#if defined(_M_X64) || defined(__SSE2__)
  #include <immintrin.h>
#endif

namespace pulljson {
namespace detail {

inline bool is_ws(char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

inline int hex_val(char c) noexcept {
  const unsigned char uc = static_cast<unsigned char>(c);
  if (uc >= static_cast<unsigned char>('0') && uc <= static_cast<unsigned char>('9')) {
    return static_cast<int>(uc - static_cast<unsigned char>('0'));
  }
  const unsigned char lc = static_cast<unsigned char>(uc | 0x20u); // ASCII to-lower
  if (lc >= static_cast<unsigned char>('a') && lc <= static_cast<unsigned char>('f')) {
    return 10 + static_cast<int>(lc - static_cast<unsigned char>('a'));
  }
  return -1;
}

// Surrogate code points are written in their 3-byte form; strict UTF-8
// validation rejects them afterwards.
template <class String>
inline void append_utf8(String& out, std::uint32_t cp) {
  if (cp <= 0x7Fu) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FFu) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp <= 0xFFFFu) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

// Classifies a UTF-8 lead byte (RFC 3629). On success `need` is the number of
// continuation bytes and [lo, hi] the allowed range of the first of them; the
// rest are always 0x80..0xBF. Overlongs and surrogates are excluded here.
inline bool utf8_lead(unsigned char c, unsigned& need, unsigned char& lo, unsigned char& hi) noexcept {
  lo = 0x80;
  hi = 0xBF;
  if (c < 0x80) {
    need = 0;
  } else if (c >= 0xC2 && c <= 0xDF) {
    need = 1;
  } else if (c == 0xE0) {
    need = 2;
    lo = 0xA0;
  } else if (c == 0xED) {
    need = 2;
    hi = 0x9F;
  } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
    need = 2;
  } else if (c == 0xF0) {
    need = 3;
    lo = 0x90;
  } else if (c >= 0xF1 && c <= 0xF3) {
    need = 3;
  } else if (c == 0xF4) {
    need = 3;
    hi = 0x8F;
  } else {
    return false;
  }
  return true;
}

inline bool is_valid_utf8(std::string_view s) noexcept {
  const auto* p = reinterpret_cast<const unsigned char*>(s.data());
  const std::size_t n = s.size();
  std::size_t i = 0;
  while (i < n) {
    if (p[i] < 0x80) {
      ++i;
      continue;
    }
    unsigned need = 0;
    unsigned char lo = 0;
    unsigned char hi = 0;
    if (!utf8_lead(p[i], need, lo, hi)) return false;
    if (need > n - i - 1) return false;
    ++i;
    for (unsigned k = 0; k < need; ++k, ++i) {
      if (p[i] < lo || p[i] > hi) return false;
      lo = 0x80;
      hi = 0xBF;
    }
  }
  return true;
}

inline std::size_t find_first_escape(std::string_view s) noexcept {
  const char* p = s.data();
  const std::size_t n = s.size();
  std::size_t i = 0;

#if defined(_M_X64) || defined(__SSE2__)
  const __m128i q = _mm_set1_epi8('"');
  const __m128i bs = _mm_set1_epi8('\\');
  const __m128i k1f = _mm_set1_epi8(0x1F);
  const __m128i zero = _mm_setzero_si128();

  while (i + 16 <= n) {
    const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(p + i));
    const __m128i is_q = _mm_cmpeq_epi8(v, q);
    const __m128i is_bs = _mm_cmpeq_epi8(v, bs);
    // Unsigned check for v <= 0x1F using saturated subtract.
    const __m128i sub = _mm_subs_epu8(v, k1f);
    const __m128i is_ctrl = _mm_cmpeq_epi8(sub, zero);
    const __m128i any = _mm_or_si128(_mm_or_si128(is_q, is_bs), is_ctrl);
    const int mask = _mm_movemask_epi8(any);
    if (mask != 0) {
#if defined(_MSC_VER)
      unsigned long bit = 0;
      _BitScanForward(&bit, static_cast<unsigned long>(mask));
      return i + static_cast<std::size_t>(bit);
#else
      return i + static_cast<std::size_t>(__builtin_ctz(static_cast<unsigned>(mask)));
#endif
    }
    i += 16;
  }
#endif

  for (; i < n; ++i) {
    const unsigned char uc = static_cast<unsigned char>(p[i]);
    const char c = p[i];
    if (c == '"' || c == '\\' || uc <= 0x1F) return i;
  }
  return n;
}

inline void dump_escaped(std::string& out, std::string_view s) {
  static constexpr char hex[] = "0123456789ABCDEF";

  const char* data = s.data();
  const std::size_t n = s.size();
  const std::size_t first = find_first_escape(s);

  out.push_back('"');
  if (first == n) {
    out.append(data, n);
    out.push_back('"');
    return;
  }

  if (first > 0) out.append(data, first);

  std::size_t chunk_begin = first;
  for (std::size_t i = first; i < n; ++i) {
    const unsigned char uc = static_cast<unsigned char>(data[i]);
    const char c = data[i];

    const char* esc = nullptr;
    std::size_t esc_len = 0;

    switch (c) {
      case '"': esc = "\\\""; esc_len = 2; break;
      case '\\': esc = "\\\\"; esc_len = 2; break;
      case '\b': esc = "\\b"; esc_len = 2; break;
      case '\f': esc = "\\f"; esc_len = 2; break;
      case '\n': esc = "\\n"; esc_len = 2; break;
      case '\r': esc = "\\r"; esc_len = 2; break;
      case '\t': esc = "\\t"; esc_len = 2; break;
      default: break;
    }

    if (esc != nullptr) {
      if (i > chunk_begin) out.append(data + chunk_begin, i - chunk_begin);
      out.append(esc, esc_len);
      chunk_begin = i + 1;
      continue;
    }

    if (uc <= 0x1F) {
      if (i > chunk_begin) out.append(data + chunk_begin, i - chunk_begin);
      out.append("\\u00", 4);
      out.push_back(hex[(uc >> 4) & 0xF]);
      out.push_back(hex[uc & 0xF]);
      chunk_begin = i + 1;
      continue;
    }
  }

  if (n > chunk_begin) out.append(data + chunk_begin, n - chunk_begin);
  out.push_back('"');
}

} // namespace detail
} // namespace pulljson
