#include <pxjson/pxjson.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

struct cli_options {
  pxjson::parse_options parse;
  bool stream{false};
  bool pretty{false};
  bool echo{false};
};

bool slurp_file(const char* path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

// Non-finite doubles (from literals such as 1e400) cannot be written back.
bool echo_value(const pxjson::value& v, const pxjson::encode_options& eopt) {
  try {
    std::cout << pxjson::encode(v, eopt) << "\n";
  } catch (const std::runtime_error& e) {
    std::cerr << "encode failed: " << e.what() << "\n";
    return false;
  }
  return true;
}

// Returns 0 if every document decodes, 1 on a parse error, 2 on an I/O error.
int parse_one(const char* path, const cli_options& opt, bool verbose) {
  std::string s;
  if (!slurp_file(path, s)) {
    if (verbose) std::cerr << "failed to read file: " << path << "\n";
    return 2;
  }

  pxjson::encode_options eopt;
  eopt.pretty = opt.pretty;

  if (opt.stream) {
    std::size_t count = 0;
    for (const pxjson::parse_result& r : pxjson::decode_stream_bytes(s, opt.parse)) {
      if (r.err) {
        if (verbose) {
          std::cerr << "parse failed: " << path << " (document " << count << ")\n";
          std::cerr << "  " << pxjson::describe(r.err) << "\n";
        }
        return 1;
      }
      if (opt.echo && !echo_value(r.val, eopt)) return 1;
      ++count;
    }
    return 0;
  }

  const pxjson::parse_result r = pxjson::decode_bytes(s, opt.parse);
  if (r.err) {
    if (verbose) std::cerr << "parse failed: " << path << "\n  " << pxjson::describe(r.err) << "\n";
    return 1;
  }
  if (opt.echo && !echo_value(r.val, eopt)) return 1;
  return 0;
}

void usage() {
  std::cerr << "usage: pxjson_parse_file [options] <file.json>\n";
  std::cerr << "       pxjson_parse_file [options] --list <paths.txt>\n";
  std::cerr << "options:\n";
  std::cerr << "  --lenient    accept a trailing comma before ] or }\n";
  std::cerr << "  --decimals   decode non-integral numbers as exact decimals\n";
  std::cerr << "  --stream     accept a sequence of concatenated documents\n";
  std::cerr << "  --depth N    nesting limit (default " << PXJSON_DEFAULT_DEPTH_LIMIT << ")\n";
  std::cerr << "  --echo       re-encode each decoded document to stdout\n";
  std::cerr << "  --pretty     like --echo, indented\n";
}

} // namespace

int main(int argc, char** argv) {
  cli_options opt;
  const char* list_path = nullptr;
  const char* path = nullptr;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};
    if (arg == "--lenient") {
      opt.parse.strict = false;
    } else if (arg == "--decimals") {
      opt.parse.use_decimals = true;
    } else if (arg == "--stream") {
      opt.stream = true;
    } else if (arg == "--echo") {
      opt.echo = true;
    } else if (arg == "--pretty") {
      opt.echo = true;
      opt.pretty = true;
    } else if (arg == "--depth" && i + 1 < argc) {
      char* end = nullptr;
      const unsigned long long n = std::strtoull(argv[++i], &end, 10);
      if (!end || *end != '\0' || n == 0) {
        std::cerr << "invalid --depth value: " << argv[i] << "\n";
        return 2;
      }
      opt.parse.depth_limit = static_cast<std::size_t>(n);
    } else if (arg == "--list" && i + 1 < argc) {
      list_path = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && !path) {
      path = argv[i];
    } else {
      usage();
      return 2;
    }
  }

  if (list_path) {
    if (path) {
      usage();
      return 2;
    }
    std::ifstream in(list_path);
    if (!in) {
      std::cerr << "failed to read list file: " << list_path << "\n";
      return 2;
    }

    bool any_fail = false;
    bool any_io_fail = false;
    std::string line;
    while (std::getline(in, line)) {
      if (line.empty()) continue;
      const int rc = parse_one(line.c_str(), opt, false);
      if (rc == 0) {
        std::cout << line << "\tOK\n";
      } else {
        std::cout << line << "\tFAIL\n";
        any_fail = true;
        if (rc == 2) any_io_fail = true;
      }
    }
    return any_io_fail ? 2 : (any_fail ? 1 : 0);
  }

  if (!path) {
    usage();
    return 2;
  }
  return parse_one(path, opt, true);
}
