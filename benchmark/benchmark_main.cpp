#include <pxjson/pxjson.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <algorithm>
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
  s.reserve(n_objects * (str_len + 64));
  s.push_back('[');
  for (std::size_t i = 0; i < n_objects; ++i) {
    if (i) s.push_back(',');
    s += "{\"id\":";
    s += std::to_string(static_cast<std::uint64_t>(i));
    s += ",\"ok\":";
    s += (i % 2 == 0) ? "true" : "false";
    s += ",\"name\":\"";

    for (std::size_t k = 0; k < str_len; ++k) {
      s.push_back(static_cast<char>(ch(rng)));
    }

    // Escapes and a surrogate pair now and then.
    if ((i % 16) == 0) {
      s += "\\n";
      s += "\\u4F60\\u597D\\uD83D\\uDE03";
    }

    s += "\",\"val\":";
    s += (i % 3 == 0) ? "3.141592653589793" : "1e-10";
    s += "}";
  }
  s.push_back(']');
  return s;
}

// The same documents, concatenated with a newline between them.
std::string make_stream_payload(std::size_t n_objects, std::size_t str_len) {
  const std::string one = make_payload(1, str_len);
  std::string s;
  s.reserve(n_objects * (one.size() + 1));
  for (std::size_t i = 0; i < n_objects; ++i) {
    s += one;
    s.push_back('\n');
  }
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

bench_result bench_decode(std::string_view json, std::size_t iters, pxjson::parse_options opt) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto r = pxjson::decode(json, opt);
    do_not_optimize(r.err.code);
    do_not_optimize(r.val.type());
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, json.size() * iters};
}

// Events only: the parser runs without building a tree.
bench_result bench_pull(std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    pxjson::parser p(json);
    pxjson::event ev;
    std::size_t n = 0;
    while (p.next(ev)) ++n;
    do_not_optimize(n);
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, json.size() * iters};
}

bench_result bench_decode_stream(std::string_view json, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    std::size_t n = 0;
    for (const pxjson::parse_result& r : pxjson::decode_stream(json)) {
      do_not_optimize(r.val.type());
      ++n;
    }
    do_not_optimize(n);
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, json.size() * iters};
}

bench_result bench_encode(std::string_view json, std::size_t iters, bool pretty) {
  auto r = pxjson::decode(json);
  if (r.err) {
    std::cerr << "input parse failed: " << pxjson::describe(r.err) << "\n";
    std::exit(1);
  }
  pxjson::encode_options opt;
  opt.pretty = pretty;

  const auto t0 = clock_type::now();
  std::size_t bytes = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    auto out = pxjson::encode(r.val, opt);
    bytes += out.size();
    do_not_optimize(out.size());
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, bytes};
}

void print_mbps(const char* name, const bench_result& r) {
  const double mb = static_cast<double>(r.bytes) / (1024.0 * 1024.0);
  const double mbps = (r.seconds > 0.0) ? (mb / r.seconds) : 0.0;
  std::cout << name << ": " << mbps << " MiB/s (" << r.seconds << " s)" << "\n";
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_objects = 2000;
  std::size_t str_len = 24;
  std::size_t iters = 200;
  std::size_t runs = 5;

  if (argc >= 2) n_objects = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::string payload = make_payload(n_objects, str_len);
  const std::string stream_payload = make_stream_payload(n_objects, str_len);
  std::cout << "payload bytes: " << payload.size() << "\n";

  // Warm-up
  {
    auto r = pxjson::decode(payload);
    do_not_optimize(r.val.type());
  }

  pxjson::parse_options decimals;
  decimals.use_decimals = true;

  print_mbps("pull(events)", run_median(runs, [&] { return bench_pull(payload, iters); }));
  print_mbps("decode", run_median(runs, [&] { return bench_decode(payload, iters, {}); }));
  print_mbps("decode(decimals)", run_median(runs, [&] { return bench_decode(payload, iters, decimals); }));
  print_mbps("decode(stream)", run_median(runs, [&] { return bench_decode_stream(stream_payload, iters); }));
  print_mbps("encode", run_median(runs, [&] { return bench_encode(payload, iters, false); }));
  print_mbps("encode(pretty)", run_median(runs, [&] { return bench_encode(payload, iters, true); }));

  return 0;
}
