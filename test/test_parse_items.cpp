#include "test_common.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pulljson;

namespace {

std::vector<std::string> formatted_paths(std::string_view doc) {
  std::vector<std::string> out;
  for (const parse_event& pe : parse(doc)) {
    out.push_back(format_path(pe.path) + " " + to_string(pe.kind));
  }
  return out;
}

std::vector<std::string> dumped_items(std::string_view doc, std::string_view prefix, const parse_options& opt = {}) {
  std::vector<std::string> out;
  for (const value& v : items(doc, prefix, opt)) out.push_back(dump(v));
  return out;
}

} // namespace

static void test_paths() {
  const auto got = formatted_paths(R"({"a": [1, {"b": null}], "c d": true})");
  const std::vector<std::string> expected = {
      " start_map",
      " map_key",
      "a start_array",
      "a[0] number",
      "a[1] start_map",
      "a[1] map_key",
      "a[1].b null",
      "a[1] end_map",
      "a end_array",
      " map_key",
      "[\"c d\"] boolean",
      " end_map",
  };
  PULLJSON_CHECK(got == expected);
}

static void test_array_indices_advance_after_containers() {
  const auto got = formatted_paths("[[], {}, 3, [4]]");
  const std::vector<std::string> expected = {
      " start_array", "[0] start_array", "[0] end_array", "[1] start_map", "[1] end_map",
      "[2] number",   "[3] start_array", "[3][0] number", "[3] end_array", " end_array",
  };
  PULLJSON_CHECK(got == expected);
}

static void test_format_path() {
  json_path p;
  PULLJSON_CHECK(format_path(p).empty());
  p.push_back(path_element::make_key("rows"));
  p.push_back(path_element::make_index(2));
  p.push_back(path_element::make_key("_id9"));
  p.push_back(path_element::make_key("9lives"));
  p.push_back(path_element::make_key("q\"t"));
  PULLJSON_CHECK(format_path(p) == "rows[2]._id9[\"9lives\"][\"q\\\"t\"]");

  json_path q;
  q.push_back(path_element::make_index(0));
  q.push_back(path_element::make_key("x"));
  PULLJSON_CHECK(format_path(q) == "[0].x");
}

static void test_parse_stream_state() {
  auto events = parse(R"({"a": {"b": [1]}})");
  parse_event pe;
  while (events.next(pe)) {
    if (pe.kind == event_kind::number) {
      PULLJSON_CHECK(events.depth() == 3);
      PULLJSON_CHECK(format_path(events.current_path()) == "a.b");
      PULLJSON_CHECK(format_path(pe.path) == "a.b[0]");
      PULLJSON_CHECK(pe.to_event() == pulljson_test::ev_num("1"));
    }
  }
  PULLJSON_CHECK(events.depth() == 0);
  PULLJSON_CHECK(events.state() == session_state::done);
}

static void test_path_patterns() {
  PULLJSON_CHECK(path_pattern::parse("").is_root());
  PULLJSON_CHECK(path_pattern::parse("a.b[2].c").segments().size() == 4);
  PULLJSON_CHECK(path_pattern::parse("rows[*].id").segments().size() == 3);
  PULLJSON_CHECK(path_pattern::parse("[\"a.b\"][0]").segments()[0].key == "a.b");
  PULLJSON_CHECK(path_pattern::parse("[\"tab\\there\\u0041\"]").segments()[0].key == "tab\there" "A");
  PULLJSON_CHECK(path_pattern::parse("*.x").segments()[0].kind == path_pattern::segment_kind::any_key);

  const char* bad[] = {".a", "a.", "a..b", "a[", "a[x]", "a[1", "[\"open", "a[\"k\"]b", "[\"\\q\"]"};
  for (const char* p : bad) {
    PULLJSON_EXPECT_THROW_AS(std::invalid_argument, path_pattern::parse(p));
  }

  json_path p;
  p.push_back(path_element::make_key("rows"));
  p.push_back(path_element::make_index(5));
  PULLJSON_CHECK(path_pattern::parse("rows[5]").matches(p));
  PULLJSON_CHECK(path_pattern::parse("rows[*]").matches(p));
  PULLJSON_CHECK(path_pattern::parse("*[*]").matches(p));
  PULLJSON_CHECK(!path_pattern::parse("rows[4]").matches(p));
  PULLJSON_CHECK(!path_pattern::parse("rows.*").matches(p));
  PULLJSON_CHECK(!path_pattern::parse("rows").matches(p));
}

static void test_items_at_prefix() {
  const char* doc = R"({"rows": [{"id": 1, "tags": ["x"]}, {"id": 2.50, "tags": []}], "total": 2})";
  {
    const auto got = dumped_items(doc, "rows[*]");
    const std::vector<std::string> expected = {R"({"id":1,"tags":["x"]})", R"({"id":2.50,"tags":[]})"};
    PULLJSON_CHECK(got == expected);
  }
  {
    const auto got = dumped_items(doc, "rows[*].id");
    PULLJSON_CHECK(got == (std::vector<std::string>{"1", "2.50"}));
  }
  {
    const auto got = dumped_items(doc, "rows[1].tags");
    PULLJSON_CHECK(got == std::vector<std::string>{"[]"});
  }
  {
    const auto got = dumped_items(doc, "total");
    PULLJSON_CHECK(got == std::vector<std::string>{"2"});
  }
  PULLJSON_CHECK(dumped_items(doc, "missing").empty());

  // The root pattern yields the whole document once, and nested matches are
  // not reported on their own.
  const auto root = dumped_items(doc, "");
  PULLJSON_CHECK(root.size() == 1);
  PULLJSON_CHECK(root[0] == R"({"rows":[{"id":1,"tags":["x"]},{"id":2.50,"tags":[]}],"total":2})");
}

static void test_items_values() {
  auto stream = items(R"([{"name": "a", "n": 12345678901234567890123, "ok": true, "z": null, "name": "b"}])", "[*]");
  value v;
  PULLJSON_CHECK(stream.next(v));
  PULLJSON_CHECK(v.is_object());
  PULLJSON_CHECK(v.as_object().size() == 5);
  PULLJSON_CHECK(v.find("name")->as_string() == "a");
  PULLJSON_CHECK(v.find("n")->as_number().to_string() == "12345678901234567890123");
  PULLJSON_CHECK(v.find("ok")->as_bool());
  PULLJSON_CHECK(v.find("z")->is_null());
  PULLJSON_CHECK(v.find("none") == nullptr);
  PULLJSON_CHECK(!stream.next(v));

  value::object o;
  o.emplace_back("name", value("a"));
  PULLJSON_CHECK(value(o) != v);
}

static void test_items_over_streams() {
  parse_options opt;
  opt.multiple_values = true;
  opt.chunk_size = 3;
  {
    // JSON lines: the root pattern matches each top-level value.
    const auto got = dumped_items("{\"id\":1}\n{\"id\":2}\n[3]", "", opt);
    const std::vector<std::string> expected = {R"({"id":1})", R"({"id":2})", "[3]"};
    PULLJSON_CHECK(got == expected);
  }
  {
    std::istringstream in(R"({"a": {"b": [10, 20]}})");
    std::vector<std::string> got;
    for (const value& v : items(in, "a.b[*]")) got.push_back(dump(v));
    PULLJSON_CHECK(got == (std::vector<std::string>{"10", "20"}));
  }
  {
    // Errors inside a matching value propagate from the item stream.
    PULLJSON_EXPECT_THROW_AS(premature_end_error, dumped_items(R"({"rows": [{"id": 1}, {"id": )", "rows[*]"));
    PULLJSON_EXPECT_THROW_AS(std::invalid_argument, items("[]", "a..b"));
  }
}

void test_parse_items() {
  test_paths();
  test_array_indices_advance_after_containers();
  test_format_path();
  test_parse_stream_state();
  test_path_patterns();
  test_items_at_prefix();
  test_items_values();
  test_items_over_streams();
}
