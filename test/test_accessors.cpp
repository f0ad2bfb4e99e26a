#include "test_common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace pxjson;

namespace {

const value& sample() {
  static const value v = decode_or_throw(R"({
    "name": "widget",
    "count": 3,
    "ratio": 0.25,
    "big": 3000000000,
    "huge": 1e30,
    "flag": true,
    "nothing": null,
    "numtext": "42",
    "tags": ["a", "b"],
    "object": {"elements": [{"name": null}, {"name": "x"}]}
  })");
  return v;
}

} // namespace

static void test_get_if_no_coercion() {
  const value& v = sample();
  PXJSON_CHECK(get_if<std::int64_t>(*v.find("count")) == 3);
  PXJSON_CHECK(get_if<double>(*v.find("count")) == 3.0);
  PXJSON_CHECK(get_if<std::int64_t>(*v.find("ratio")) == 0);
  PXJSON_CHECK(get_if<decimal>(*v.find("ratio"))->to_string() == "0.25");
  PXJSON_CHECK(!get_if<std::int64_t>(*v.find("numtext")));
  PXJSON_CHECK(!get_if<std::int64_t>(*v.find("flag")));
  PXJSON_CHECK(get_if<bool>(*v.find("flag")) == true);
  PXJSON_CHECK(!get_if<bool>(*v.find("count")));
  PXJSON_CHECK(!get_if<std::int32_t>(*v.find("big")));
  PXJSON_CHECK(!get_if<std::int64_t>(*v.find("huge")));

  const std::string* s = get_if<std::string>(*v.find("name"));
  PXJSON_CHECK(s && *s == "widget");
  PXJSON_CHECK(get_if<std::string>(*v.find("count")) == nullptr);
  PXJSON_CHECK(get_if<array>(*v.find("tags"))->size() == 2);
  PXJSON_CHECK(get_if<object>(*v.find("tags")) == nullptr);
  PXJSON_CHECK(!get_if<double>(*v.find("nothing")));
}

static void test_as_coerces() {
  const value& v = sample();
  PXJSON_CHECK(as<std::int64_t>(*v.find("numtext")) == 42);
  PXJSON_CHECK(as<double>(*v.find("numtext")) == 42.0);
  PXJSON_CHECK(as<std::string>(*v.find("count")) == std::string("3"));
  PXJSON_CHECK(as<std::string>(*v.find("flag")) == std::string("true"));
  PXJSON_CHECK(as<std::string>(*v.find("ratio")) == std::string("0.25"));
  PXJSON_CHECK(as<decimal>(value("1.10"))->to_string() == "1.10");
  PXJSON_CHECK(as<std::int64_t>(value("12345678901234567890")) == std::nullopt);
  PXJSON_CHECK(as<std::int64_t>(value("1.9")) == 1);
  // Only complete JSON numbers convert.
  PXJSON_CHECK(!as<std::int64_t>(value("42abc")));
  PXJSON_CHECK(!as<std::int64_t>(value(" 42")));
  PXJSON_CHECK(!as<std::int64_t>(value("+42")));
  PXJSON_CHECK(!as<double>(value("")));
  // Bools have no numeric form.
  PXJSON_CHECK(!as<std::int64_t>(value(true)));
  PXJSON_CHECK(!as<std::string>(*v.find("nothing")));
  PXJSON_CHECK(!as<std::string>(*v.find("tags")));
}

static void test_get_throws_with_path() {
  const value& v = sample();
  PXJSON_CHECK(get<std::string>(v, "name") == "widget");
  PXJSON_CHECK(get<std::int64_t>(v, "count") == 3);
  PXJSON_CHECK(get<std::int32_t>(v, "count") == 3);
  PXJSON_CHECK(get<double>(v, "ratio") == 0.25);
  PXJSON_CHECK(get<bool>(v, "flag"));
  PXJSON_CHECK(get<std::string>(*v.find("tags"), 1) == "b");
  PXJSON_CHECK(get<array>(v, "tags").size() == 2);

  {
    const access_error e = PXJSON_EXPECT_ACCESS_ERROR(get<std::int64_t>(v, "name"));
    PXJSON_CHECK(std::string(e.what()) == "name: expected number, found string");
    PXJSON_CHECK(e.error_kind() == access_error::kind::missing_or_invalid_type);
    PXJSON_CHECK(e.path() == std::string("name"));
    PXJSON_CHECK(e.actual() == json_type::string);
  }
  {
    const access_error e = PXJSON_EXPECT_ACCESS_ERROR(get<std::string>(v, "absent"));
    PXJSON_CHECK(std::string(e.what()) == "absent: expected string, found missing value");
    PXJSON_CHECK(!e.actual());
  }
  {
    const access_error e = PXJSON_EXPECT_ACCESS_ERROR(get<std::string>(*v.find("tags"), 5));
    PXJSON_CHECK(std::string(e.what()) == "[5]: expected string, found missing value");
  }
  {
    // Strings are not coerced by get.
    const access_error e = PXJSON_EXPECT_ACCESS_ERROR(get<std::int64_t>(v, "numtext"));
    PXJSON_CHECK(std::string(e.what()) == "numtext: expected number, found string");
  }
  {
    // No path on the single-value form.
    const access_error e = PXJSON_EXPECT_ACCESS_ERROR(get<bool>(value(1)));
    PXJSON_CHECK(!e.path());
    PXJSON_CHECK(std::string(e.what()) == "expected bool, found number");
  }
  {
    // The container itself has the wrong type.
    const access_error e = PXJSON_EXPECT_ACCESS_ERROR(get<std::string>(value(1), "k"));
    PXJSON_CHECK(std::string(e.what()) == "expected object, found number");
  }
}

static void test_out_of_range() {
  const value& v = sample();
  {
    const access_error e = PXJSON_EXPECT_ACCESS_ERROR(get<std::int32_t>(v, "big"));
    PXJSON_CHECK(e.error_kind() == access_error::kind::out_of_range);
    PXJSON_CHECK(std::string(e.what()) == "big: value 3000000000 is out of range for int32");
    PXJSON_CHECK(e.value_text() == "3000000000");
    PXJSON_CHECK(e.target() == "int32");
  }
  {
    const access_error e = PXJSON_EXPECT_ACCESS_ERROR(to<std::int64_t>(v, "huge"));
    PXJSON_CHECK(std::string(e.what()) == "huge: value 1e+30 is out of range for int64");
  }
  {
    parse_options opt;
    opt.use_decimals = true;
    const value d = decode_or_throw("[1e400]", opt);
    const access_error e = PXJSON_EXPECT_ACCESS_ERROR(get<double>(d, 0));
    PXJSON_CHECK(std::string(e.what()) == "[0]: value 1E+400 is out of range for double");
  }
  PXJSON_CHECK(get<std::int64_t>(v, "big") == 3000000000LL);
  PXJSON_CHECK(to<std::int64_t>(value(-2.9)) == -2);
}

static void test_or_null_forms() {
  const value& v = sample();
  PXJSON_CHECK(!get_or_null<std::string>(v, "nothing"));
  PXJSON_CHECK(!get_or_null<std::string>(v, "absent"));
  PXJSON_CHECK(*get_or_null<std::string>(v, "name") == "widget");
  PXJSON_CHECK(get_or_null<std::int64_t>(v, "count") == 3);
  PXJSON_CHECK(!get_or_null<std::int64_t>(v, "nothing"));
  PXJSON_CHECK(!get_or_null<std::int64_t>(*v.find("tags"), 9));
  PXJSON_CHECK(!get_or_null<bool>(value()));

  {
    // A type mismatch still throws, naming the nullable expectation.
    const access_error e = PXJSON_EXPECT_ACCESS_ERROR(get_or_null<std::int64_t>(v, "name"));
    PXJSON_CHECK(std::string(e.what()) == "name: expected number or null, found string");
    PXJSON_CHECK(e.expected().nullable);
  }
  {
    const access_error e = PXJSON_EXPECT_ACCESS_ERROR(to_or_null<std::int64_t>(v, "tags"));
    PXJSON_CHECK(std::string(e.what()) == "tags: expected number or null, found array");
  }
  {
    // Out-of-range values throw too; only null and absence are empty.
    const access_error e = PXJSON_EXPECT_ACCESS_ERROR(get_or_null<std::int32_t>(v, "big"));
    PXJSON_CHECK(e.error_kind() == access_error::kind::out_of_range);
    PXJSON_CHECK(std::string(e.what()) == "big: value 3000000000 is out of range for int32");
    const access_error t = PXJSON_EXPECT_ACCESS_ERROR(to_or_null<std::int32_t>(v, "big"));
    PXJSON_CHECK(t.error_kind() == access_error::kind::out_of_range);
  }
  PXJSON_CHECK(to_or_null<std::int64_t>(v, "numtext") == 42);
  PXJSON_CHECK(!to_or_null<std::string>(v, "nothing"));
  PXJSON_CHECK(!to_or_null<double>(v, "absent"));
  PXJSON_CHECK(to_or_null<std::string>(*v.find("tags"), 0) == std::string("a"));
}

static void test_to_coerces_and_throws() {
  const value& v = sample();
  PXJSON_CHECK(to<std::int64_t>(v, "numtext") == 42);
  PXJSON_CHECK(to<std::int32_t>(v, "numtext") == 42);
  PXJSON_CHECK(to<std::string>(v, "count") == "3");
  PXJSON_CHECK(to<std::string>(v, "nothing") == "null");
  PXJSON_CHECK(to<std::string>(value(false)) == "false");
  PXJSON_CHECK(to<decimal>(v, "count").to_string() == "3");

  const access_error e = PXJSON_EXPECT_ACCESS_ERROR(to<double>(*v.find("tags"), 0));
  PXJSON_CHECK(std::string(e.what()) == "[0]: expected number, found string");
}

static void test_closure_paths() {
  const value& v = sample();
  {
    const access_error e = PXJSON_EXPECT_ACCESS_ERROR(get_object(v, "object", [](const object& o) {
      return get_array(o, "elements", [](const array& a) {
        return get_object(a, 0, [](const object& el) { return get<std::string>(el, "name"); });
      });
    }));
    PXJSON_CHECK(std::string(e.what()) == "object.elements[0].name: expected string, found null");
    PXJSON_CHECK(e.path() == std::string("object.elements[0].name"));
  }
  {
    const std::string name = get_object(v, "object", [](const object& o) {
      return get_array(o, "elements", [](const array& a) {
        return get_object(a, 1, [](const object& el) { return get<std::string>(el, "name"); });
      });
    });
    PXJSON_CHECK(name == "x");
  }
  {
    // The closure's own result passes through untouched.
    const std::size_t n = get_array(v, "tags", [](const array& a) { return a.size(); });
    PXJSON_CHECK(n == 2);
  }
  {
    const access_error e =
        PXJSON_EXPECT_ACCESS_ERROR(get_array(v, "object", [](const array& a) { return a.size(); }));
    PXJSON_CHECK(std::string(e.what()) == "object: expected array, found object");
  }
  {
    const access_error e =
        PXJSON_EXPECT_ACCESS_ERROR(get_object(v, "missing", [](const object& o) { return o.size(); }));
    PXJSON_CHECK(std::string(e.what()) == "missing: expected object, found missing value");
  }
}

static void test_closure_or_null() {
  const value& v = sample();
  int calls = 0;
  const auto count = [&calls](const object& o) {
    ++calls;
    return o.size();
  };
  PXJSON_CHECK(!get_object_or_null(v, "nothing", count));
  PXJSON_CHECK(!get_object_or_null(v, "absent", count));
  PXJSON_CHECK(calls == 0);
  PXJSON_CHECK(get_object_or_null(v, "object", count) == std::size_t{1});
  PXJSON_CHECK(calls == 1);

  PXJSON_CHECK(get_array_or_null(v, "tags", [](const array& a) { return a.size(); }) == std::size_t{2});
  PXJSON_CHECK(!get_array_or_null(*v.find("tags"), 7, [](const array& a) { return a.size(); }));

  const access_error e =
      PXJSON_EXPECT_ACCESS_ERROR(get_array_or_null(v, "name", [](const array& a) { return a.size(); }));
  PXJSON_CHECK(std::string(e.what()) == "name: expected array or null, found string");

  // Errors inside the closure are still prefixed.
  const access_error inner = PXJSON_EXPECT_ACCESS_ERROR(get_object_or_null(
      v, "object", [](const object& o) { return get<std::int64_t>(o, "elements"); }));
  PXJSON_CHECK(std::string(inner.what()) == "object.elements: expected number, found array");
}

static void test_map_and_flat_map() {
  const value v = decode_or_throw(R"([{"id":1},{"id":2},{"id":null},{"id":"x"}])");
  {
    const array& a = get<array>(v);
    const std::vector<std::int64_t> ids =
        map(array(a.begin(), a.begin() + 2), [](const value& el) { return get<std::int64_t>(el, "id"); });
    PXJSON_CHECK((ids == std::vector<std::int64_t>{1, 2}));
  }
  {
    const access_error e =
        PXJSON_EXPECT_ACCESS_ERROR(map(v, [](const value& el) { return get<std::int64_t>(el, "id"); }));
    PXJSON_CHECK(std::string(e.what()) == "[2].id: expected number, found null");
  }
  {
    const value nums = decode_or_throw(R"([{"id":1},{"id":null},{},{"id":4}])");
    const std::vector<std::int64_t> ids =
        flat_map(nums, [](const value& el) { return get_or_null<std::int64_t>(el, "id"); });
    PXJSON_CHECK((ids == std::vector<std::int64_t>{1, 4}));
  }
  {
    const access_error e = PXJSON_EXPECT_ACCESS_ERROR(
        flat_map(v, [](const value& el) { return get_or_null<std::int64_t>(el, "id"); }));
    PXJSON_CHECK(std::string(e.what()) == "[3].id: expected number or null, found string");
  }
}

static void test_error_prefixing() {
  const access_error base = access_error::missing_or_invalid_type(std::nullopt, expected_type{json_type::string, false},
                                                                  json_type::number);
  PXJSON_CHECK(std::string(base.with_prefix("a").what()) == "a: expected string, found number");
  PXJSON_CHECK(std::string(base.with_prefix("a").with_prefix("[1]").what()) == "[1].a: expected string, found number");
  PXJSON_CHECK(std::string(base.with_prefix("[1]").with_prefix("a").what()) == "a[1]: expected string, found number");
  PXJSON_CHECK(base.with_prefix("[0]").with_prefix("[2]").path() == std::string("[2][0]"));
}

void test_accessors() {
  test_get_if_no_coercion();
  test_as_coerces();
  test_get_throws_with_path();
  test_out_of_range();
  test_or_null_forms();
  test_to_coerces_and_throws();
  test_closure_paths();
  test_closure_or_null();
  test_map_and_flat_map();
  test_error_prefixing();
}
