#include <pulljson/pulljson.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <algorithm>
#include <iostream>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

// nlohmann/json
#include <nlohmann/json.hpp>

// jsoncpp
#include <json/json.h>

// RapidJSON
#include <rapidjson/memorystream.h>
#include <rapidjson/reader.h>

namespace {

using clock_type = std::chrono::high_resolution_clock;

template <class T>
inline void do_not_optimize(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

std::string make_payload(std::size_t n_objects, std::size_t str_len) {
  std::mt19937_64 rng(1234567);
  std::uniform_int_distribution<int> ch('a', 'z');

  std::string s;
  s.reserve(n_objects * (str_len + 64));
  s.push_back('[');
  for (std::size_t i = 0; i < n_objects; ++i) {
    if (i) s.push_back(',');
    s += "{\"id\":";
    s += std::to_string(static_cast<std::uint64_t>(i));
    s += ",\"ok\":";
    s += (i % 2 == 0) ? "true" : "false";
    s += ",\"name\":\"";
    for (std::size_t k = 0; k < str_len; ++k) s.push_back(static_cast<char>(ch(rng)));
    if ((i % 16) == 0) s += "\\n\\u4F60\\u597D";
    s += "\",\"val\":";
    s += (i % 3 == 0) ? "3.141592653589793" : "1e-10";
    s += "}";
  }
  s.push_back(']');
  return s;
}

std::string make_numbers_payload(std::size_t n_numbers) {
  // Arbitrary precision is the expensive path for pulljson.
  std::string s;
  s.reserve(n_numbers * 28);
  s.push_back('[');
  for (std::size_t i = 0; i < n_numbers; ++i) {
    if (i) s.push_back(',');
    switch (i & 3u) {
      case 0: s += "3.141592653589793"; break;
      case 1: s += "-0.000000000123456789"; break;
      case 2: s += "1.234567890123456e-200"; break;
      default: s += "12345678901234567890123"; break;
    }
  }
  s.push_back(']');
  return s;
}

std::size_t scale_iters(std::size_t base_iters, std::size_t base_bytes, std::size_t new_bytes) {
  if (base_iters == 0) return 0;
  if (base_bytes == 0 || new_bytes == 0) return base_iters;
  const double ratio = static_cast<double>(base_bytes) / static_cast<double>(new_bytes);
  const auto out = static_cast<std::size_t>(static_cast<double>(base_iters) * ratio + 0.5);
  return (out > 0) ? out : 1;
}

struct bench_result {
  double seconds{0.0};
  std::size_t bytes{0};
};

template <class Fn>
bench_result run_median(std::size_t runs, Fn&& fn) {
  if (runs <= 1) return fn();
  std::vector<double> secs;
  secs.reserve(runs);
  std::size_t bytes = 0;
  for (std::size_t r = 0; r < runs; ++r) {
    const auto br = fn();
    secs.push_back(br.seconds);
    bytes = br.bytes;
  }
  std::nth_element(secs.begin(), secs.begin() + (secs.size() / 2), secs.end());
  return {secs[secs.size() / 2], bytes};
}

void print_mbps(const char* name, const bench_result& r) {
  const double mib = static_cast<double>(r.bytes) / (1024.0 * 1024.0);
  const double mibps = (r.seconds > 0.0) ? (mib / r.seconds) : 0.0;
  std::cout << name << ": " << mibps << " MiB/s (" << r.seconds << " s)" << "\n";
}

[[noreturn]] void input_failed(const char* who) {
  std::cerr << who << ": input parse failed\n";
  std::exit(1);
}

bench_result bench_pulljson_events(std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    std::size_t n = 0;
    try {
      auto stream = pulljson::basic_parse(json);
      pulljson::event e;
      while (stream.next(e)) ++n;
    } catch (const pulljson::json_error&) {
      input_failed("pulljson");
    }
    do_not_optimize(n);
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

bench_result bench_pulljson_istream(std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    std::istringstream in{std::string(json)};
    std::size_t n = 0;
    try {
      auto stream = pulljson::basic_parse(in);
      pulljson::event e;
      while (stream.next(e)) ++n;
    } catch (const pulljson::json_error&) {
      input_failed("pulljson");
    }
    do_not_optimize(n);
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

// Counts events without building a document.
struct nlohmann_counter {
  using json = nlohmann::json;
  std::size_t n{0};

  bool null() { return ++n, true; }
  bool boolean(bool) { return ++n, true; }
  bool number_integer(json::number_integer_t) { return ++n, true; }
  bool number_unsigned(json::number_unsigned_t) { return ++n, true; }
  bool number_float(json::number_float_t, const json::string_t&) { return ++n, true; }
  bool string(json::string_t&) { return ++n, true; }
  bool binary(json::binary_t&) { return ++n, true; }
  bool start_object(std::size_t) { return ++n, true; }
  bool key(json::string_t&) { return ++n, true; }
  bool end_object() { return ++n, true; }
  bool start_array(std::size_t) { return ++n, true; }
  bool end_array() { return ++n, true; }
  bool parse_error(std::size_t, const std::string&, const nlohmann::detail::exception&) { return false; }
};

bench_result bench_nlohmann_sax(std::string_view json_text, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    nlohmann_counter sax;
    if (!nlohmann::json::sax_parse(json_text, &sax)) input_failed("nlohmann");
    do_not_optimize(sax.n);
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json_text.size() * iters};
}

struct rapidjson_counter : rapidjson::BaseReaderHandler<rapidjson::UTF8<>, rapidjson_counter> {
  std::size_t n{0};
  bool Default() { return ++n, true; }
};

bench_result bench_rapidjson_reader(std::string_view json_text, std::size_t iters, bool full_precision) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    rapidjson::Reader reader;
    rapidjson::MemoryStream ms(json_text.data(), json_text.size());
    rapidjson_counter handler;
    const bool ok = full_precision ? !reader.Parse<rapidjson::kParseFullPrecisionFlag>(ms, handler).IsError()
                                   : !reader.Parse(ms, handler).IsError();
    if (!ok) input_failed("rapidjson");
    do_not_optimize(handler.n);
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json_text.size() * iters};
}

bench_result bench_jsoncpp_parse(std::string_view json, std::size_t iters) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["allowComments"] = false;
  builder["strictRoot"] = true;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    Json::Value root;
    std::string errs;
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errs)) input_failed("jsoncpp");
    do_not_optimize(root.type());
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_objects = 2000;
  std::size_t iters = 50;
  std::size_t runs = 5;

  if (argc >= 2) n_objects = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::string payload = make_payload(n_objects, 24);
  std::cout << "payload bytes: " << payload.size() << "\n";

  const std::size_t numbers_count = std::max<std::size_t>(1, n_objects * 16);
  const std::string numbers_payload = make_numbers_payload(numbers_count);
  const std::size_t numbers_iters = scale_iters(iters, payload.size(), numbers_payload.size());
  std::cout << "numbers payload bytes: " << numbers_payload.size() << " (" << numbers_count
            << " numbers, iters=" << numbers_iters << ")\n";

  // Warm-up
  do_not_optimize(bench_pulljson_events(payload, 1).seconds);
  do_not_optimize(bench_nlohmann_sax(payload, 1).seconds);
  do_not_optimize(bench_rapidjson_reader(payload, 1, false).seconds);
  do_not_optimize(bench_jsoncpp_parse(payload, 1).seconds);

  std::cout << "\n== Events ==\n";
  print_mbps("pulljson basic_parse(string)", run_median(runs, [&] { return bench_pulljson_events(payload, iters); }));
  print_mbps("pulljson basic_parse(istream)", run_median(runs, [&] { return bench_pulljson_istream(payload, iters); }));
  print_mbps("nlohmann sax", run_median(runs, [&] { return bench_nlohmann_sax(payload, iters); }));
  print_mbps("rapidjson reader", run_median(runs, [&] { return bench_rapidjson_reader(payload, iters, false); }));
  print_mbps("jsoncpp parse(dom)", run_median(runs, [&] { return bench_jsoncpp_parse(payload, iters); }));

  std::cout << "\n== Events (numbers) ==\n";
  print_mbps("pulljson basic_parse(string)", run_median(runs, [&] { return bench_pulljson_events(numbers_payload, numbers_iters); }));
  print_mbps("nlohmann sax", run_median(runs, [&] { return bench_nlohmann_sax(numbers_payload, numbers_iters); }));
  print_mbps("rapidjson reader(full precision)",
             run_median(runs, [&] { return bench_rapidjson_reader(numbers_payload, numbers_iters, true); }));
  print_mbps("jsoncpp parse(dom)", run_median(runs, [&] { return bench_jsoncpp_parse(numbers_payload, numbers_iters); }));

  return 0;
}
