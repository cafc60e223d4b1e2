#include <pulljson/pulljson.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

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
  s.reserve(n_objects * (str_len + 72));
  s += "{\"rows\":[";
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
    s += ",\"tags\":[null,\"t\"]}";
  }
  s += "]}";
  return s;
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

bench_result bench_events(std::string_view json, std::size_t iters, const pulljson::parse_options& opt) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto stream = pulljson::basic_parse(json, opt);
    pulljson::event e;
    std::size_t n = 0;
    while (stream.next(e)) ++n;
    do_not_optimize(n);
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

bench_result bench_parse_paths(std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto stream = pulljson::parse(json);
    std::size_t depth = 0;
    for (const pulljson::parse_event& pe : stream) depth += pe.path.size();
    do_not_optimize(depth);
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

bench_result bench_items(std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto rows = pulljson::items(json, "rows[*]");
    std::size_t n = 0;
    for (const pulljson::value& v : rows) n += v.as_object().size();
    do_not_optimize(n);
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), json.size() * iters};
}

bench_result bench_write(std::string_view json, std::size_t iters) {
  std::vector<pulljson::event> events;
  try {
    auto stream = pulljson::basic_parse(json);
    for (auto& e : stream) events.push_back(e);
  } catch (const pulljson::json_error& e) {
    std::cerr << "input parse failed: " << e.what() << "\n";
    std::exit(1);
  }

  const auto t0 = clock_type::now();
  std::size_t bytes = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    const std::string out = pulljson::write_events(events);
    bytes += out.size();
    do_not_optimize(out.size());
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), bytes};
}

void print_mbps(const std::string& name, const bench_result& r) {
  const double mb = static_cast<double>(r.bytes) / (1024.0 * 1024.0);
  const double mbps = (r.seconds > 0.0) ? (mb / r.seconds) : 0.0;
  std::cout << name << ": " << mbps << " MiB/s (" << r.seconds << " s)" << "\n";
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_objects = 2000;
  std::size_t str_len = 24;
  std::size_t iters = 50;
  std::size_t runs = 5;

  if (argc >= 2) n_objects = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::string payload = make_payload(n_objects, str_len);
  std::cout << "payload bytes: " << payload.size() << "\n";

  // Warm-up
  print_mbps("warm-up", bench_events(payload, 1, {}));

  std::cout << "\n== Events by chunk size ==\n";
  for (const std::size_t chunk : {std::size_t{64}, std::size_t{4096}, std::size_t{64 * 1024}, payload.size()}) {
    pulljson::parse_options opt;
    opt.chunk_size = chunk;
    print_mbps("basic_parse(chunk=" + std::to_string(chunk) + ")", run_median(runs, [&] { return bench_events(payload, iters, opt); }));
  }
  {
    pulljson::parse_options opt;
    opt.check_utf8 = true;
    print_mbps("basic_parse(check_utf8)", run_median(runs, [&] { return bench_events(payload, iters, opt); }));
    opt.check_utf8 = false;
    opt.numbers = pulljson::number_mode::split;
    print_mbps("basic_parse(split numbers)", run_median(runs, [&] { return bench_events(payload, iters, opt); }));
  }

  std::cout << "\n== Higher layers ==\n";
  print_mbps("parse(paths)", run_median(runs, [&] { return bench_parse_paths(payload, iters); }));
  print_mbps("items(rows[*])", run_median(runs, [&] { return bench_items(payload, iters); }));
  print_mbps("write_events", run_median(runs, [&] { return bench_write(payload, iters); }));

  return 0;
}
