#include "test_common.hpp"

#include <cstring>
#include <string>

using namespace pxjson;

static void test_common_syntax_errors() {
  {
    auto r = decode("{\"a\":1,}");
    pxjson_test::check_err(r.err, error_code::trailing_comma);
  }
  {
    auto r = decode("[1 2]");
    pxjson_test::check_err(r.err, error_code::invalid_syntax);
  }
  {
    auto r = decode("\"unterminated");
    pxjson_test::check_err(r.err, error_code::unexpected_eof);
  }
  {
    auto r = decode("01");
    pxjson_test::check_err(r.err, error_code::invalid_number);
  }
  {
    auto r = decode("]");
    pxjson_test::check_err(r.err, error_code::invalid_syntax);
  }
  {
    auto r = decode("nullx");
    pxjson_test::check_err(r.err, error_code::trailing_characters);
  }
}

static void test_error_line_column_tracking() {
  const char* json = "{\n  \"a\": 1,\n  \"b\": 01\n}";
  auto r = decode(json);
  pxjson_test::check_err(r.err, error_code::invalid_number);
  PXJSON_CHECK(r.err.offset < std::strlen(json));
  // The bad token is on the third line (zero-based 2).
  PXJSON_CHECK(r.err.line == 2);
  PXJSON_CHECK(r.err.column >= 1);
}

static void test_key_errors() {
  {
    auto r = decode(R"({"a" 1})");
    pxjson_test::check_err(r.err, error_code::expected_colon);
  }
  {
    auto r = decode(R"({a:1})");
    pxjson_test::check_err(r.err, error_code::non_string_key);
  }
  {
    auto r = decode(R"({1:1})");
    pxjson_test::check_err(r.err, error_code::non_string_key);
  }
  {
    auto r = decode(R"({,"a":1})");
    pxjson_test::check_err(r.err, error_code::missing_key);
  }
  {
    auto r = decode(R"({:1})");
    pxjson_test::check_err(r.err, error_code::missing_key);
  }
  {
    // End of input where the colon belongs.
    auto r = decode(R"({"a")");
    pxjson_test::check_err(r.err, error_code::unexpected_eof);
  }
}

static void test_value_errors() {
  {
    auto r = decode("[,1]");
    pxjson_test::check_err(r.err, error_code::missing_value);
  }
  {
    auto r = decode("[1,,2]");
    pxjson_test::check_err(r.err, error_code::missing_value);
  }
  {
    auto r = decode(R"({"a":})");
    pxjson_test::check_err(r.err, error_code::missing_value);
  }
  {
    auto r = decode(R"({"a":,"b":1})");
    pxjson_test::check_err(r.err, error_code::missing_value);
  }
  {
    auto r = decode("[1,]");
    pxjson_test::check_err_at(r.err, error_code::trailing_comma, 0, 4);
  }
}

static void test_lenient_trailing_comma() {
  parse_options opt;
  opt.strict = false;
  {
    auto r = decode("[1,]", opt);
    PXJSON_CHECK(!r.err);
    PXJSON_CHECK(r.val == value(array{1}));
  }
  {
    auto r = decode(R"({"a":1,})", opt);
    PXJSON_CHECK(!r.err);
    PXJSON_CHECK(r.val == value(object{{"a", 1}}));
  }
  // Only a single comma after a value is tolerated.
  pxjson_test::check_err(decode("[1,,]", opt).err, error_code::missing_value);
  pxjson_test::check_err(decode("[,]", opt).err, error_code::missing_value);
  pxjson_test::check_err(decode("{,}", opt).err, error_code::missing_key);
}

static void test_depth_limit() {
  {
    parse_options opt;
    opt.depth_limit = 3;
    pxjson_test::check_err(decode("[[[[[1]]]]]", opt).err, error_code::exceeded_depth_limit);
    opt.depth_limit = 10;
    auto r = decode("[[[[[1]]]]]", opt);
    PXJSON_CHECK(!r.err);
    const value* v = &r.val;
    for (int level = 0; level < 5; ++level) {
      const array* a = v->get_ptr<array>();
      PXJSON_CHECK(a && a->size() == 1);
      v = &(*a)[0];
    }
    PXJSON_CHECK(*v == value(1));
  }
  {
    parse_options opt;
    opt.depth_limit = 2;
    pxjson_test::check_err(decode("[[[0]]]", opt).err, error_code::exceeded_depth_limit);
    PXJSON_CHECK(!decode("[[0]]", opt).err);
    PXJSON_CHECK(!decode(R"({"a":[1]})", opt).err);
    pxjson_test::check_err(decode(R"({"a":{"b":{}}})", opt).err, error_code::exceeded_depth_limit);
  }
  {
    parse_options opt;
    opt.depth_limit = 0;
    pxjson_test::check_err(decode("[]", opt).err, error_code::exceeded_depth_limit);
    PXJSON_CHECK(!decode("1", opt).err);
  }
  {
    // Default limit.
    const std::string deep(PXJSON_DEFAULT_DEPTH_LIMIT + 1, '[');
    auto r = decode(deep);
    pxjson_test::check_err_at(r.err, error_code::exceeded_depth_limit, 0, PXJSON_DEFAULT_DEPTH_LIMIT + 1);
  }
}

static void test_or_throw_variants() {
  PXJSON_EXPECT_THROW(decode_or_throw("[1,"));
  PXJSON_EXPECT_THROW(decode_bytes_or_throw(std::string("\x00\x00\xFE", 3)));

  try {
    (void)decode_or_throw("{\"a\" 1}");
    pxjson_test::fail("decode_or_throw", __FILE__, __LINE__, "expected parse_error");
  } catch (const parse_error& e) {
    PXJSON_CHECK(e.err().code == error_code::expected_colon);
    PXJSON_CHECK(std::string(e.what()) == "pxjson: expected_colon at line 0, column 6");
  }

  const value v = decode_or_throw(" [true] ");
  PXJSON_CHECK(v == value(array{true}));
}

static void test_error_names() {
  PXJSON_CHECK(std::string(error_code_name(error_code::lone_leading_surrogate_in_unicode_escape)) ==
               "lone_leading_surrogate_in_unicode_escape");
  PXJSON_CHECK(std::string(error_code_name(error_code::exceeded_depth_limit)) == "exceeded_depth_limit");

  error e;
  PXJSON_CHECK(!e);
  e.code = error_code::unexpected_eof;
  e.line = 3;
  e.column = 7;
  PXJSON_CHECK(static_cast<bool>(e));
  PXJSON_CHECK(describe(e) == "unexpected_eof at line 3, column 7");
}

void test_errors() {
  test_common_syntax_errors();
  test_error_line_column_tracking();
  test_key_errors();
  test_value_errors();
  test_lenient_trailing_comma();
  test_depth_limit();
  test_or_throw_variants();
  test_error_names();
}
