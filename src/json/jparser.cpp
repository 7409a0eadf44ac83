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

#include <errno.h>
#include <string.h>

#include "json5.h"

static void unexpected(const char *wanted, JLexer &jlex, std::ostream &errs) {
  if (!jlex.fail) {
    errs << "Was expecting " << wanted << ", but got a " << jsymbolTable[jlex.next.type] << " at "
         << jlex.next.location;
  }
  jlex.fail = true;
}

static bool expect(SymbolJSON type, JLexer &jlex, std::ostream &errs) {
  if (jlex.next.type != type) {
    unexpected(jsymbolTable[type], jlex, errs);
    return false;
  }
  return true;
}

static JAST parse_jvalue(JLexer &jlex, std::ostream &errs);

// JSON5Array:
//   []
//   [JSON5ElementList ,opt]
static JAST parse_jarray(JLexer &jlex, std::ostream &errs) {
  jlex.consume();

  JChildren values;
  while (!jlex.fail) {
    if (jlex.next.type == JSON_SCLOSE) {
      jlex.consume();
      break;
    }

    values.emplace_back("", parse_jvalue(jlex, errs));
    if (jlex.next.type == JSON_COMMA) {
      jlex.consume();
    } else if (jlex.next.type == JSON_SCLOSE) {
      jlex.consume();
      break;
    } else {
      unexpected("COMMA/SCLOSE", jlex, errs);
    }
  }

  return JAST(JSON_ARRAY, std::move(values));
}

// JSON5Object:
//   {}
//   {JSON5MemberList ,opt}
// JSON5Member:
//   JSON5Identifier : JSON5Value
//   JSON5String : JSON5Value
static JAST parse_jobject(JLexer &jlex, std::ostream &errs) {
  jlex.consume();

  JChildren values;
  while (!jlex.fail) {
    if (jlex.next.type == JSON_BCLOSE) {
      jlex.consume();
      break;
    }

    std::string key;
    if (jlex.next.type == JSON_ID || jlex.next.type == JSON_STR) {
      key = std::move(jlex.next.value);
      jlex.consume();
    } else {
      unexpected("ID/STR", jlex, errs);
      break;
    }

    if (!expect(JSON_COLON, jlex, errs)) break;
    jlex.consume();

    values.emplace_back(std::move(key), parse_jvalue(jlex, errs));

    if (jlex.next.type == JSON_COMMA) {
      jlex.consume();
    } else if (jlex.next.type == JSON_BCLOSE) {
      jlex.consume();
      break;
    } else {
      unexpected("COMMA/BCLOSE", jlex, errs);
    }
  }

  return JAST(JSON_OBJECT, std::move(values));
}

static JAST parse_jvalue(JLexer &jlex, std::ostream &errs) {
  switch (jlex.next.type) {
    case JSON_NULLVAL:
    case JSON_TRUE:
    case JSON_FALSE:
    case JSON_NAN: {
      JAST out(jlex.next.type);
      jlex.consume();
      return out;
    }
    case JSON_INTEGER:
    case JSON_DOUBLE:
    case JSON_INFINITY:
    case JSON_STR: {
      JAST out(jlex.next.type, std::move(jlex.next.value));
      jlex.consume();
      return out;
    }
    case JSON_BOPEN:
      return parse_jobject(jlex, errs);
    case JSON_SOPEN:
      return parse_jarray(jlex, errs);
    default:
      unexpected("a value", jlex, errs);
      return JAST(JSON_ERROR);
  }
}

static bool parse_text(JLexer &jlex, std::ostream &errs, JAST &out) {
  out = parse_jvalue(jlex, errs);
  expect(JSON_END, jlex, errs);
  return !jlex.fail;
}

bool JAST::parse(const char *file, std::ostream &errs, JAST &out) {
  JLexer jlex(file);
  if (jlex.fail) {
    errs << "Open " << file << ": " << strerror(errno);
    return false;
  }
  return parse_text(jlex, errs, out);
}

bool JAST::parse(const std::string &body, std::ostream &errs, JAST &out) {
  JLexer jlex(body);
  return parse_text(jlex, errs, out);
}

bool JAST::parse(const char *body, size_t len, std::ostream &errs, JAST &out) {
  JLexer jlex(body, len);
  return parse_text(jlex, errs, out);
}
