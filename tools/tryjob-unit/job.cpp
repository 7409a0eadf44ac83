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

#include "tryjob/job.h"

#include "fixture.h"
#include "unit.h"

using tryjob::Job;

static tjl::result<Job, tryjob::MalformedJobError> decode_body(const std::string& json) {
  return tryjob::decode(tryjob::netstring("5") + tryjob::netstring(json));
}

TEST(job_netstring_framing) {
  EXPECT_EQUAL("5:hello,", tryjob::netstring("hello"));
  EXPECT_EQUAL("0:,", tryjob::netstring(""));

  std::string data = "1:5,3:abc,";
  size_t pos = 0;
  auto first = tryjob::read_netstring(data, pos);
  ASSERT_TRUE((bool)first);
  EXPECT_EQUAL("5", *first);
  auto second = tryjob::read_netstring(data, pos);
  ASSERT_TRUE((bool)second);
  EXPECT_EQUAL("abc", *second);
  EXPECT_EQUAL(data.size(), pos);
}

TEST(job_netstring_errors) {
  size_t pos = 0;
  EXPECT_FALSE((bool)tryjob::read_netstring("", pos));
  pos = 0;
  EXPECT_FALSE((bool)tryjob::read_netstring("x:abc,", pos));
  pos = 0;
  EXPECT_FALSE((bool)tryjob::read_netstring("10:abc,", pos));
  pos = 0;
  EXPECT_FALSE((bool)tryjob::read_netstring("3:abc;", pos));
  pos = 0;
  EXPECT_FALSE((bool)tryjob::read_netstring(":abc,", pos));
}

TEST(job_encode_is_deterministic) {
  Job job = sample_job({"a", "b"});
  job.properties["owner"] = "alice";
  EXPECT_EQUAL(tryjob::encode(job), tryjob::encode(job));

  std::string encoded = tryjob::encode(job);
  EXPECT_EQUAL(0u, encoded.find("1:5,"));
  // Keys in their fixed order.
  size_t jobid = encoded.find("\"jobid\"");
  size_t baserev = encoded.find("\"baserev\"");
  size_t builders = encoded.find("\"builderNames\"");
  size_t properties = encoded.find("\"properties\"");
  EXPECT_TRUE(jobid < baserev);
  EXPECT_TRUE(baserev < builders);
  EXPECT_TRUE(builders < properties);
}

TEST(job_decode_inverts_encode) {
  Job full = sample_job({"a", "b"});
  full.comment = tjl::some(std::string("try this"));
  full.source.repository = "git://example/repo";
  full.source.project = "proj";
  full.properties["k"] = "v";

  Job bare;
  bare.jobid = "j";
  bare.builder_names = {"x"};

  Job binary = sample_job({"c"});
  binary.source.patch = tjl::some(tryjob::Patch(0, std::string("\0\xff,:\"\n", 6)));

  for (const Job* job : {&full, &bare, &binary}) {
    auto back = tryjob::decode(tryjob::encode(*job));
    ASSERT_TRUE((bool)back);
    EXPECT_EQUAL(*job, *back);
  }
}

TEST(job_encode_omits_missing_patch) {
  Job job = sample_job({"a"});
  job.source.patch = {};
  std::string encoded = tryjob::encode(job);
  EXPECT_EQUAL(std::string::npos, encoded.find("patch_level"));
  EXPECT_EQUAL(std::string::npos, encoded.find("patch_body"));
  EXPECT_TRUE(encoded.find("\"branch\":\"main\"") != std::string::npos);

  job.source.branch = {};
  encoded = tryjob::encode(job);
  EXPECT_TRUE(encoded.find("\"branch\":null") != std::string::npos);
  EXPECT_TRUE(encoded.find("\"comment\":null") != std::string::npos);
}

TEST(job_decode_rejects_bad_version) {
  std::string body = tryjob::encode(sample_job({"a"}));
  body[2] = '4';
  auto job = tryjob::decode(body);
  ASSERT_FALSE((bool)job);
  EXPECT_TRUE(job.error().why.find("version") != std::string::npos) << job.error().why;
}

TEST(job_decode_rejects_truncation_and_trailing_bytes) {
  std::string encoded = tryjob::encode(sample_job({"a"}));
  EXPECT_FALSE((bool)tryjob::decode(encoded.substr(0, encoded.size() - 1)));
  EXPECT_FALSE((bool)tryjob::decode(encoded + "x"));
  EXPECT_FALSE((bool)tryjob::decode("1:5,"));
  EXPECT_FALSE((bool)tryjob::decode(""));
}

TEST(job_decode_rejects_bad_fields) {
  EXPECT_FALSE((bool)decode_body("not json"));
  EXPECT_FALSE((bool)decode_body("[1, 2]"));
  EXPECT_FALSE((bool)decode_body(R"({"baserev": "r", "builderNames": []})"));
  EXPECT_FALSE((bool)decode_body(R"({"jobid": "j", "builderNames": []})"));
  EXPECT_FALSE((bool)decode_body(R"({"jobid": "j", "baserev": "r"})"));
  EXPECT_FALSE((bool)decode_body(R"({"jobid": "j", "baserev": "r", "builderNames": "a"})"));
  EXPECT_FALSE((bool)decode_body(R"({"jobid": "j", "baserev": "r", "builderNames": [1]})"));
  EXPECT_FALSE(
      (bool)decode_body(R"({"jobid": "j", "baserev": "r", "builderNames": ["a", "a"]})"));
  EXPECT_FALSE((bool)decode_body(
      R"({"jobid": "j", "baserev": "r", "builderNames": [], "patch_level": 1})"));
  EXPECT_FALSE((bool)decode_body(
      R"({"jobid": "j", "baserev": "r", "builderNames": [], "patch_level": "1", "patch_body": ""})"));
  EXPECT_FALSE(
      (bool)decode_body(R"({"jobid": "j", "baserev": "r", "builderNames": [], "comment": 3})"));
  EXPECT_FALSE(
      (bool)decode_body(R"({"jobid": "j", "baserev": "r", "builderNames": [], "properties": []})"));
}

TEST(job_decode_minimal) {
  auto job = decode_body(R"({"jobid": "j", "baserev": "", "builderNames": []})");
  ASSERT_TRUE((bool)job);
  EXPECT_EQUAL("j", job->jobid);
  EXPECT_EQUAL("", job->source.revision);
  EXPECT_FALSE((bool)job->source.branch);
  EXPECT_FALSE((bool)job->source.patch);
  EXPECT_FALSE((bool)job->comment);
  EXPECT_TRUE(job->builder_names.empty());
}
