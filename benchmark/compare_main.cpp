#include <pxjson/pxjson.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <json/json.h>

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/reader.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

// Runs the same inputs through pxjson and the other JSON libraries, level by
// level: token events, trees, document streams and output.

namespace {

using clock_type = std::chrono::steady_clock;

volatile std::size_t g_sink = 0;

struct workload {
  std::string name;
  std::string text;
};

// Records with nested arrays, escapes and non-ASCII text.
workload records_workload(std::size_t n) {
  std::uint64_t state = 0x2545F4914F6CDD1Dull;
  const auto next = [&state] {
    state ^= state << 13;
    state ^= state >> 7;
    state ^= state << 17;
    return state;
  };
  std::string s = "[";
  for (std::size_t i = 0; i < n; ++i) {
    if (i) s += ",\n";
    s += "{\"id\":" + std::to_string(i);
    s += ",\"active\":";
    s += (next() & 1u) ? "true" : "false";
    s += ",\"label\":\"item-" + std::to_string(next() % 100000u);
    if (i % 8 == 0) s += "\\t\\\"quoted\\\" \\u00e9\\uD83D\\uDE00";
    s += "\",\"score\":" + std::to_string(next() % 1000u) + "." + std::to_string(next() % 1000u);
    s += ",\"tags\":[";
    const std::size_t tags = next() % 4u;
    for (std::size_t t = 0; t < tags; ++t) {
      if (t) s += ",";
      s += "\"t" + std::to_string(t) + "\"";
    }
    s += "],\"parent\":";
    s += (i % 5 == 0) ? std::string("null") : std::to_string(i / 5);
    s += "}";
  }
  s += "]";
  return {"records", std::move(s)};
}

// Prices and measurements: the case decimals exist for.
workload numbers_workload(std::size_t n) {
  static const char* const samples[] = {"19.99", "0.1", "-273.15", "6.02214076e23", "1.000000000000000000001",
                                        "42", "-7", "9007199254740993", "2.2250738585072014e-308"};
  std::string s = "[";
  for (std::size_t i = 0; i < n; ++i) {
    if (i) s += ",";
    s += samples[i % (sizeof(samples) / sizeof(samples[0]))];
  }
  s += "]";
  return {"numbers", std::move(s)};
}

// One small document per line.
workload lines_workload(std::size_t n) {
  std::string s;
  for (std::size_t i = 0; i < n; ++i) {
    s += "{\"seq\":" + std::to_string(i) + ",\"event\":\"tick\",\"values\":[" + std::to_string(i % 7) + ",0.5]}\n";
  }
  return {"lines", std::move(s)};
}

struct contender {
  std::string name;
  // Processes the input once and returns a count for cross-checking.
  std::function<std::size_t(const std::string&)> run;
};

struct measurement {
  double best_seconds{0.0};
  double median_seconds{0.0};
  std::size_t result{0};
};

measurement measure(const contender& c, const std::string& input, std::size_t iters, std::size_t runs) {
  measurement m;
  std::vector<double> secs;
  for (std::size_t r = 0; r < std::max<std::size_t>(runs, 1); ++r) {
    const auto t0 = clock_type::now();
    for (std::size_t i = 0; i < iters; ++i) {
      m.result = c.run(input);
      g_sink = g_sink + m.result;
    }
    secs.push_back(std::chrono::duration<double>(clock_type::now() - t0).count());
  }
  std::sort(secs.begin(), secs.end());
  m.best_seconds = secs.front();
  m.median_seconds = secs[secs.size() / 2];
  return m;
}

void run_table(const char* title, const workload& w, const std::vector<contender>& contenders, std::size_t iters,
               std::size_t runs) {
  std::cout << "\n== " << title << " / " << w.name << " (" << w.text.size() << " bytes x " << iters << ") ==\n";
  const double mib = static_cast<double>(w.text.size() * iters) / (1024.0 * 1024.0);
  std::size_t expected = 0;
  bool first = true;
  for (const contender& c : contenders) {
    const measurement m = measure(c, w.text, iters, runs);
    const double rate = m.median_seconds > 0.0 ? mib / m.median_seconds : 0.0;
    std::cout << "  " << std::left << std::setw(28) << c.name << std::right << std::setw(10) << std::fixed
              << std::setprecision(1) << rate << " MiB/s  best " << std::setprecision(4) << m.best_seconds << " s";
    if (first) {
      expected = m.result;
      first = false;
    } else if (m.result != expected) {
      std::cout << "  [count " << m.result << " != " << expected << "]";
    }
    std::cout << "\n";
  }
}

// Token events -------------------------------------------------------------

std::size_t pxjson_events(const std::string& text) {
  pxjson::parser p(text);
  pxjson::event ev;
  std::size_t n = 0;
  while (p.next(ev)) {
    if (ev.type == pxjson::event_type::error) {
      std::cerr << "pxjson: " << pxjson::describe(ev.err) << "\n";
      std::exit(1);
    }
    ++n;
  }
  return n;
}

struct nlohmann_counter : nlohmann::json_sax<nlohmann::json> {
  std::size_t n{0};
  bool null() override { return ++n, true; }
  bool boolean(bool) override { return ++n, true; }
  bool number_integer(number_integer_t) override { return ++n, true; }
  bool number_unsigned(number_unsigned_t) override { return ++n, true; }
  bool number_float(number_float_t, const string_t&) override { return ++n, true; }
  bool string(string_t&) override { return ++n, true; }
  bool binary(binary_t&) override { return ++n, true; }
  bool start_object(std::size_t) override { return ++n, true; }
  bool key(string_t&) override { return ++n, true; }
  bool end_object() override { return ++n, true; }
  bool start_array(std::size_t) override { return ++n, true; }
  bool end_array() override { return ++n, true; }
  bool parse_error(std::size_t, const std::string&, const nlohmann::detail::exception& ex) override {
    std::cerr << "nlohmann: " << ex.what() << "\n";
    return false;
  }
};

std::size_t nlohmann_events(const std::string& text) {
  nlohmann_counter counter;
  if (!nlohmann::json::sax_parse(text, &counter)) std::exit(1);
  return counter.n;
}

struct rapidjson_counter : rapidjson::BaseReaderHandler<rapidjson::UTF8<>, rapidjson_counter> {
  std::size_t n{0};
  bool Default() {
    ++n;
    return true;
  }
};

std::size_t rapidjson_events(const std::string& text) {
  rapidjson::Reader reader;
  rapidjson::StringStream ss(text.c_str());
  rapidjson_counter counter;
  if (!reader.Parse(ss, counter)) {
    std::cerr << "rapidjson: parse error at " << reader.GetErrorOffset() << "\n";
    std::exit(1);
  }
  return counter.n;
}

// Trees --------------------------------------------------------------------

std::size_t pxjson_tree(const std::string& text, const pxjson::parse_options& opt) {
  const pxjson::parse_result r = pxjson::decode(text, opt);
  if (r.err) std::exit(1);
  if (const pxjson::array* a = r.val.get_ptr<pxjson::array>()) return a->size();
  return 1;
}

std::size_t nlohmann_tree(const std::string& text) {
  const nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded()) std::exit(1);
  return j.is_array() ? j.size() : 1;
}

std::unique_ptr<Json::CharReader> jsoncpp_reader() {
  Json::CharReaderBuilder builder;
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  return std::unique_ptr<Json::CharReader>(builder.newCharReader());
}

std::size_t jsoncpp_tree(const std::string& text) {
  static const std::unique_ptr<Json::CharReader> reader = jsoncpp_reader();
  Json::Value root;
  std::string errs;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
    std::cerr << "jsoncpp: " << errs << "\n";
    std::exit(1);
  }
  return root.isArray() ? root.size() : 1;
}

std::size_t rapidjson_tree(const std::string& text, unsigned flags_full_precision) {
  rapidjson::Document d;
  if (flags_full_precision) {
    d.Parse<rapidjson::kParseFullPrecisionFlag>(text.data(), text.size());
  } else {
    d.Parse(text.data(), text.size());
  }
  if (d.HasParseError()) std::exit(1);
  return d.IsArray() ? d.Size() : 1;
}

// Document streams ---------------------------------------------------------

std::size_t pxjson_stream(const std::string& text) {
  std::size_t n = 0;
  for (const pxjson::parse_result& r : pxjson::decode_stream(text)) {
    if (r.err) std::exit(1);
    ++n;
  }
  return n;
}

std::size_t nlohmann_lines(const std::string& text) {
  std::size_t n = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t end = text.find('\n', pos);
    if (end == std::string::npos) end = text.size();
    if (end > pos) {
      const nlohmann::json j = nlohmann::json::parse(text.begin() + static_cast<std::ptrdiff_t>(pos),
                                                     text.begin() + static_cast<std::ptrdiff_t>(end), nullptr, false);
      if (j.is_discarded()) std::exit(1);
      ++n;
    }
    pos = end + 1;
  }
  return n;
}

std::size_t rapidjson_stream(const std::string& text) {
  rapidjson::StringStream ss(text.c_str());
  std::size_t n = 0;
  for (;;) {
    while (ss.Peek() == ' ' || ss.Peek() == '\n' || ss.Peek() == '\r' || ss.Peek() == '\t') ss.Take();
    if (ss.Peek() == '\0') break;
    rapidjson::Document d;
    d.ParseStream<rapidjson::kParseStopWhenDoneFlag>(ss);
    if (d.HasParseError()) std::exit(1);
    ++n;
  }
  return n;
}

// Output -------------------------------------------------------------------

template <class Tree>
std::function<std::size_t(const std::string&)> emit_with(std::shared_ptr<Tree> tree,
                                                         std::function<std::size_t(const Tree&)> emit) {
  return [tree, emit](const std::string&) { return emit(*tree); };
}

std::vector<contender> output_contenders(const std::string& text, bool pretty) {
  std::vector<contender> out;

  auto px = std::make_shared<pxjson::value>(pxjson::decode_or_throw(text));
  pxjson::encode_options opt;
  opt.pretty = pretty;
  out.push_back({"pxjson encode", emit_with<pxjson::value>(px, [opt](const pxjson::value& v) {
                   return pxjson::encode(v, opt).size();
                 })});

  auto nl = std::make_shared<nlohmann::json>(nlohmann::json::parse(text));
  out.push_back({"nlohmann dump", emit_with<nlohmann::json>(nl, [pretty](const nlohmann::json& j) {
                   return (pretty ? j.dump(2) : j.dump()).size();
                 })});

  auto jc = std::make_shared<Json::Value>();
  {
    std::string errs;
    if (!jsoncpp_reader()->parse(text.data(), text.data() + text.size(), jc.get(), &errs)) std::exit(1);
  }
  out.push_back({"jsoncpp writeString", emit_with<Json::Value>(jc, [pretty](const Json::Value& v) {
                   Json::StreamWriterBuilder wb;
                   wb["indentation"] = pretty ? "  " : "";
                   wb["emitUTF8"] = true;
                   return Json::writeString(wb, v).size();
                 })});

  auto rj = std::make_shared<rapidjson::Document>();
  rj->Parse(text.data(), text.size());
  out.push_back({"rapidjson Writer", emit_with<rapidjson::Document>(rj, [pretty](const rapidjson::Document& d) {
                   rapidjson::StringBuffer sb;
                   if (pretty) {
                     rapidjson::PrettyWriter<rapidjson::StringBuffer> w(sb);
                     w.SetIndent(' ', 2);
                     d.Accept(w);
                   } else {
                     rapidjson::Writer<rapidjson::StringBuffer> w(sb);
                     d.Accept(w);
                   }
                   return sb.GetSize();
                 })});
  return out;
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n = 2000;
  std::size_t iters = 50;
  std::size_t runs = 5;
  if (argc >= 2) n = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const workload records = records_workload(n);
  const workload numbers = numbers_workload(n * 16);
  const workload lines = lines_workload(n * 4);

  pxjson::parse_options decimals;
  decimals.use_decimals = true;

  // Event counts agree between the pull parser and the SAX interfaces.
  const std::vector<contender> events = {
      {"pxjson parser::next", pxjson_events},
      {"nlohmann sax_parse", nlohmann_events},
      {"rapidjson Reader", rapidjson_events},
  };
  run_table("events", records, events, iters, runs);
  run_table("events", numbers, events, iters, runs);

  const std::vector<contender> trees = {
      {"pxjson decode", [](const std::string& t) { return pxjson_tree(t, {}); }},
      {"pxjson decode(decimals)", [decimals](const std::string& t) { return pxjson_tree(t, decimals); }},
      {"nlohmann parse", nlohmann_tree},
      {"jsoncpp parse", jsoncpp_tree},
      {"rapidjson Parse", [](const std::string& t) { return rapidjson_tree(t, 0); }},
      {"rapidjson Parse(full prec.)", [](const std::string& t) { return rapidjson_tree(t, 1); }},
  };
  run_table("tree", records, trees, iters, runs);
  run_table("tree", numbers, trees, iters, runs);

  const std::vector<contender> streams = {
      {"pxjson decode_stream", pxjson_stream},
      {"nlohmann per line", nlohmann_lines},
      {"rapidjson StopWhenDone", rapidjson_stream},
  };
  run_table("stream", lines, streams, iters, runs);

  run_table("encode", records, output_contenders(records.text, false), iters, runs);
  run_table("encode(pretty)", records, output_contenders(records.text, true), iters, runs);

  return 0;
}
