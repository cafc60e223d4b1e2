#include "test_common.hpp"

#include <string>
#include <vector>

using namespace pulljson;
using pulljson_test::collect;
using pulljson_test::ev;
using pulljson_test::ev_bool;
using pulljson_test::ev_key;
using pulljson_test::ev_num;
using pulljson_test::ev_str;

static void test_compact_output() {
  PULLJSON_CHECK(write_events(collect(R"( { "a" : [ 1 , 2.50 , -3E+2 ] , "b" : { } , "c" : [ ] } )")) ==
                 R"({"a":[1,2.50,-3E+2],"b":{},"c":[]})");
  PULLJSON_CHECK(write_events(collect("\"tab\\tq\\\"\\u0001\"")) == "\"tab\\tq\\\"\\u0001\"");
  PULLJSON_CHECK(write_events(collect("null")) == "null");
}

static void test_events_survive_a_round_trip() {
  const char* docs[] = {
      R"([1, "x", {"k": true}])",
      R"({"big": 1234567890123456789012345678901234567890, "d": [0.10, 1e-7, 25E3, -0.0]})",
      R"({"nested": [[[]], {"": {"": null}}], "s": "\u00e9\ud83d\ude03\n"})",
      R"("just a string")",
  };
  for (const char* doc : docs) {
    const std::vector<event> first = collect(doc);
    const std::string text = write_events(first);
    const std::vector<event> second = collect(text);
    PULLJSON_CHECK(first == second);
    // A second pass prints identically.
    PULLJSON_CHECK(write_events(second) == text);
  }
}

static void test_split_numbers_written() {
  parse_options opt;
  opt.numbers = number_mode::split;
  const std::string text = write_events(collect("[7, 7.0, 7e0]", opt));
  PULLJSON_CHECK(text == "[7,7.0,7]");
  const auto back = collect(text);
  PULLJSON_CHECK(back[1].as_number() == back[2].as_number());
  PULLJSON_CHECK(back[2].as_number() == back[3].as_number());
}

static void test_multiple_top_level_values() {
  parse_options opt;
  opt.multiple_values = true;
  PULLJSON_CHECK(write_events(collect("1 [2] {\"a\":3}", opt)) == "1\n[2]\n{\"a\":3}");
}

static void test_ill_formed_sequences_rejected() {
  {
    event_writer w;
    w.write(ev(event_kind::start_map));
    PULLJSON_EXPECT_THROW_AS(json_error, w.write(ev_num("1")));
  }
  {
    event_writer w;
    w.write(ev(event_kind::start_array));
    PULLJSON_EXPECT_THROW_AS(json_error, w.write(ev(event_kind::end_map)));
    PULLJSON_EXPECT_THROW_AS(json_error, w.write(ev_key("k")));
  }
  {
    event_writer w;
    PULLJSON_EXPECT_THROW_AS(json_error, w.write(ev(event_kind::end_array)));
  }
  {
    event_writer w;
    w.write(ev(event_kind::start_map));
    w.write(ev_key("k"));
    PULLJSON_EXPECT_THROW_AS(json_error, w.write(ev(event_kind::end_map)));
    w.write(ev_bool(false));
    w.write(ev(event_kind::end_map));
    PULLJSON_CHECK(w.complete());
    PULLJSON_CHECK(w.str() == "{\"k\":false}");
  }
  {
    const std::vector<event> open = {ev(event_kind::start_array), ev_str("x")};
    PULLJSON_EXPECT_THROW_AS(json_error, write_events(open));
  }
}

void test_writer() {
  test_compact_output();
  test_events_survive_a_round_trip();
  test_split_numbers_written();
  test_multiple_top_level_values();
  test_ill_formed_sequences_rejected();
}
