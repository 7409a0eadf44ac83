/*
 * Copyright 2023 SiFive, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You should have received a copy of LICENSE.Apache2 along with
 * this software. If not, you may obtain a copy at
 *
 *    https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <sstream>

#include "json/json5.h"
#include "unit.h"

static bool parse(const std::string& body, JAST& out, std::string& errors) {
  std::stringstream errs;
  bool ok = JAST::parse(body, errs, out);
  errors = errs.str();
  return ok;
}

TEST(json_plain_object) {
  JAST json;
  std::string errs;
  ASSERT_TRUE(parse(R"({"a": 1, "b": "two", "c": [true, false, null], "d": 1.5})", json, errs))
      << errs;
  ASSERT_EQUAL(JSON_OBJECT, json.kind);
  EXPECT_EQUAL(1, *json.get("a").expect_integer());
  EXPECT_EQUAL("two", *json.get("b").expect_string());
  ASSERT_EQUAL(size_t(3), json.get("c").children.size());
  EXPECT_TRUE(*json.get("c").children[0].second.expect_boolean());
  EXPECT_EQUAL(JSON_NULLVAL, json.get("c").children[2].second.kind);
  EXPECT_TRUE(*json.get("d").expect_number() == 1.5);
}

TEST(json5_extensions) {
  JAST json;
  std::string errs;
  const char* body = R"(
    // line comment
    {
      unquoted: 'single',
      /* block
         comment */
      hex: 0x1F,
      trailing: [1, 2,],
      half: .5,
      plus: +7,
    }
  )";
  ASSERT_TRUE(parse(body, json, errs)) << errs;
  EXPECT_EQUAL("single", *json.get("unquoted").expect_string());
  EXPECT_EQUAL(31, *json.get("hex").expect_integer());
  EXPECT_EQUAL(size_t(2), json.get("trailing").children.size());
  EXPECT_TRUE(*json.get("half").expect_number() == 0.5);
  EXPECT_EQUAL(7, *json.get("plus").expect_integer());
}

TEST(json_string_escapes) {
  JAST json;
  std::string errs;
  ASSERT_TRUE(parse(R"({"s": "a\nb\t\"q\"é😀"})", json, errs)) << errs;
  EXPECT_EQUAL("a\nb\t\"q\"\xc3\xa9\xf0\x9f\x98\x80", *json.get("s").expect_string());
}

TEST(json_null_bytes_survive) {
  JAST json;
  std::string errs;
  ASSERT_TRUE(parse(R"({"s": "a\u0000b"})", json, errs)) << errs;
  EXPECT_EQUAL(std::string("a\0b", 3), *json.get("s").expect_string());
}

TEST(json_rejects_garbage) {
  JAST json;
  std::string errs;
  EXPECT_FALSE(parse(R"({"a": })", json, errs));
  EXPECT_FALSE(errs.empty());
  EXPECT_FALSE(parse(R"({"a": 1)", json, errs));
  EXPECT_FALSE(parse(R"("unterminated)", json, errs));
  EXPECT_FALSE(parse(R"({"a": 1} extra)", json, errs));
  EXPECT_FALSE(parse(R"(/* never closed)", json, errs));
}

TEST(json_get_opt_distinguishes_null) {
  JAST json;
  std::string errs;
  ASSERT_TRUE(parse(R"({"present": null})", json, errs)) << errs;
  EXPECT_TRUE((bool)json.get_opt("present"));
  EXPECT_FALSE((bool)json.get_opt("absent"));
  EXPECT_EQUAL(JSON_NULLVAL, json.get("absent").kind);
}

TEST(json_expect_wrong_kind) {
  JAST json;
  std::string errs;
  ASSERT_TRUE(parse(R"({"n": 1, "s": "1", "d": 2.5})", json, errs)) << errs;
  EXPECT_FALSE((bool)json.get("n").expect_string());
  EXPECT_FALSE((bool)json.get("s").expect_integer());
  EXPECT_FALSE((bool)json.get("d").expect_integer());
  EXPECT_FALSE((bool)json.get("n").expect_boolean());
}

TEST(json_print_then_parse) {
  JAST out(JSON_OBJECT);
  out.add("name", "x\"y\n");
  out.add("count", 3);
  out.add("flag", true);
  JAST& list = out.add("list", JSON_ARRAY);
  list.add(std::string("a"));
  list.add(JSON_NULLVAL);

  std::stringstream ss;
  ss << out;
  EXPECT_EQUAL(R"({"name":"x\"y\n","count":3,"flag":true,"list":["a",null]})", ss.str());

  JAST back;
  std::string errs;
  ASSERT_TRUE(parse(ss.str(), back, errs)) << errs;
  EXPECT_EQUAL("x\"y\n", *back.get("name").expect_string());
  EXPECT_EQUAL(3, *back.get("count").expect_integer());
}

TEST(json5_unicode_keys_and_loose_numbers) {
  JAST json;
  std::string errs;
  const char* body = "{ caf\xc3\xa9: 1, n: 5., e: 5.e2, neg: -0x10, s: '\\uD83D\\uDE00' }";
  ASSERT_TRUE(parse(body, json, errs)) << errs;
  EXPECT_EQUAL(1, *json.get("caf\xc3\xa9").expect_integer());
  EXPECT_EQUAL("5.0", json.get("n").value);
  EXPECT_TRUE(*json.get("e").expect_number() == 500);
  EXPECT_EQUAL(-16, *json.get("neg").expect_integer());
  EXPECT_EQUAL("\xf0\x9f\x98\x80", *json.get("s").expect_string());
}

TEST(json_lone_surrogate_rejected) {
  JAST json;
  std::string errs;
  EXPECT_FALSE(parse(R"({"s": "\uD83D"})", json, errs));
  EXPECT_FALSE(parse(R"({"s": "\01"})", json, errs));
}

TEST(json_error_location) {
  JAST json;
  std::string errs;
  EXPECT_FALSE(parse("{\n  /* one\n two */ \"a\": }", json, errs));
  EXPECT_TRUE(errs.find("<string>:3:14") != std::string::npos) << errs;
}
