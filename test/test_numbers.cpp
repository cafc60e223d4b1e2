#include "test_common.hpp"

#include <limits>
#include <stdexcept>
#include <string>

using namespace pulljson;
using pulljson_test::num;

static void test_integer_boundaries() {
  {
    const number n = num("0");
    PULLJSON_CHECK(n.is_integer());
    PULLJSON_CHECK(n.as_int64() == 0);
  }
  {
    // Negative zero is canonicalized for integers.
    const number n = num("-0");
    PULLJSON_CHECK(n.is_integer());
    PULLJSON_CHECK(!n.is_negative());
    PULLJSON_CHECK(n.to_string() == "0");
  }
  {
    const number n = num("9223372036854775807");
    PULLJSON_CHECK(n.fits_int64());
    PULLJSON_CHECK(n.as_int64() == (std::numeric_limits<std::int64_t>::max)());
  }
  {
    const number n = num("-9223372036854775808");
    PULLJSON_CHECK(n.fits_int64());
    PULLJSON_CHECK(n.as_int64() == (std::numeric_limits<std::int64_t>::min)());
  }
  {
    const number n = num("9223372036854775808");
    PULLJSON_CHECK(n.is_integer());
    PULLJSON_CHECK(!n.fits_int64());
    PULLJSON_EXPECT_THROW_AS(std::range_error, n.as_int64());
    PULLJSON_CHECK(n.to_string() == "9223372036854775808");
  }
}

static void test_big_integers_stay_exact() {
  const std::string digits = "1234567890123456789012345678901234567890";
  const number n = num(digits);
  PULLJSON_CHECK(n.is_integer());
  PULLJSON_CHECK(n.to_string() == digits);
  PULLJSON_CHECK(n.as_integer() == number::big_int(digits.c_str()));

  const number neg = num("-" + digits);
  PULLJSON_CHECK(neg.is_negative());
  PULLJSON_CHECK(neg.as_integer() == -number::big_int(digits.c_str()));
  PULLJSON_CHECK(neg != n);
}

static void test_decimal_forms() {
  struct row {
    const char* lexeme;
    const char* printed;
  };
  const row rows[] = {
      {"1.25", "1.25"},
      {"0.0", "0.0"},
      {"10.000", "10.000"},
      {"1e10", "1E+10"},
      {"1E+10", "1E+10"},
      {"1e-10", "1E-10"},
      {"-3.14159e-2", "-0.0314159"},
      {"0.000001", "0.000001"},
      {"123.456e1", "1234.56"},
      {"1.5e7", "1.5E+7"},
  };
  for (const auto& r : rows) {
    const number n = num(r.lexeme);
    PULLJSON_CHECK(n.is_decimal());
    PULLJSON_CHECK(n.to_string() == r.printed);
    // The printed form reads back as the same value.
    PULLJSON_CHECK(num(n.to_string()) == n);
  }

  const number d = num("-3.14159e-2");
  PULLJSON_CHECK(d.is_negative());
  PULLJSON_CHECK(d.coefficient() == 314159);
  PULLJSON_CHECK(d.exponent() == -7);
  PULLJSON_CHECK(num("1.25").to_double() == 1.25);
}

static void test_numeric_equality() {
  PULLJSON_CHECK(num("1") == num("1.0"));
  PULLJSON_CHECK(num("1.50") == num("1.5"));
  PULLJSON_CHECK(num("15e-1") == num("1.5"));
  PULLJSON_CHECK(num("100") == num("1e2"));
  PULLJSON_CHECK(num("-0") == num("0"));
  PULLJSON_CHECK(num("-0.0") == num("0"));
  PULLJSON_CHECK(num("1") != num("2"));
  PULLJSON_CHECK(num("1") != num("-1"));
  PULLJSON_CHECK(num("0.1") != num("0.01"));
}

static void test_invalid_numbers() {
  const char* bad[] = {
      "",
      "-",
      "+1",
      "00",
      "01",
      "-01",
      "1.",
      ".1",
      "1e",
      "1e+",
      "1e-",
      "--1",
      "0x10",
      "NaN",
      "Infinity",
  };
  for (const char* s : bad) {
    PULLJSON_EXPECT_THROW_AS(std::invalid_argument, number::parse(s));
  }
  PULLJSON_EXPECT_THROW_AS(std::out_of_range, number::parse("1e99999999999999999999"));
}

static void test_number_events() {
  {
    const auto evs = pulljson_test::collect("[0, -7, 2.50, 6.02e23]");
    PULLJSON_CHECK(evs.size() == 6);
    PULLJSON_CHECK(evs[1] == pulljson_test::ev_num("0"));
    PULLJSON_CHECK(evs[2].as_number().as_int64() == -7);
    PULLJSON_CHECK(evs[3].as_number() == num("2.5"));
    PULLJSON_CHECK(evs[3].as_number().is_decimal());
    PULLJSON_CHECK(evs[4].as_number() == num("602000000000000000000000"));
    for (std::size_t i = 1; i < 5; ++i) PULLJSON_CHECK(evs[i].kind == event_kind::number);
  }
  {
    // A lone top-level number ends at end of input.
    const auto evs = pulljson_test::collect("  42");
    PULLJSON_CHECK(evs.size() == 1);
    PULLJSON_CHECK(evs[0].as_number().as_int64() == 42);
  }
  {
    parse_options opt;
    opt.numbers = number_mode::split;
    const auto evs = pulljson_test::collect("[1, 1.5, 2e3, 123456789012345678901234567890]", opt);
    PULLJSON_CHECK(evs.size() == 6);
    PULLJSON_CHECK(evs[1].kind == event_kind::integer);
    PULLJSON_CHECK(evs[2].kind == event_kind::double_value);
    PULLJSON_CHECK(evs[3].kind == event_kind::double_value);
    PULLJSON_CHECK(evs[3].as_number() == num("2000"));
    PULLJSON_CHECK(evs[4].kind == event_kind::integer);
    PULLJSON_CHECK(evs[4].as_number().to_string() == "123456789012345678901234567890");
  }
  {
    // Exponent outside the decimal range: events before it still arrive.
    std::exception_ptr err;
    const auto evs = pulljson_test::collect_until_error("[1, 1e99999999999999999999, 2]", {}, err);
    PULLJSON_CHECK(evs.size() == 2);
    PULLJSON_CHECK(evs[1] == pulljson_test::ev_num("1"));
    PULLJSON_EXPECT_THROW_AS(decode_error, std::rethrow_exception(err));
  }
}

void test_numbers() {
  test_integer_boundaries();
  test_big_integers_stay_exact();
  test_decimal_forms();
  test_numeric_equality();
  test_invalid_numbers();
  test_number_events();
}
