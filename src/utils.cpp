////////////////////////////////////////////////////////////////////////////////
/// @brief utilities
///
/// @file
///
/// DISCLAIMER
///
/// Copyright 2015 ArangoDB GmbH, Cologne, Germany
///
/// Licensed under the Apache License, Version 2.0 (the "License");
/// you may not use this file except in compliance with the License.
/// You may obtain a copy of the License at
///
///     http://www.apache.org/licenses/LICENSE-2.0
///
/// Unless required by applicable law or agreed to in writing, software
/// distributed under the License is distributed on an "AS IS" BASIS,
/// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
/// See the License for the specific language governing permissions and
/// limitations under the License.
///
/// Copyright holder is ArangoDB GmbH, Cologne, Germany
///
/// @author Dr. Frank Celler
/// @author Copyright 2015, ArangoDB GmbH, Cologne, Germany
////////////////////////////////////////////////////////////////////////////////

#include "utils.h"

#include "pbjson.hpp"

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include <stout/error.hpp>

using namespace dbaas;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

typedef boost::archive::iterators::base64_from_binary<
  boost::archive::iterators::transform_width<string::const_iterator, 6, 8>>
  Base64Encoder;

typedef boost::archive::iterators::transform_width<
  boost::archive::iterators::binary_from_base64<string::const_iterator>, 8, 6>
  Base64Decoder;

////////////////////////////////////////////////////////////////////////////////
/// @brief shared null value for missing paths
////////////////////////////////////////////////////////////////////////////////

static const picojson::value NULL_VALUE;

////////////////////////////////////////////////////////////////////////////////
/// @brief checks a base64 character
////////////////////////////////////////////////////////////////////////////////

static bool isBase64 (char c) {
  return ('A' <= c && c <= 'Z')
      || ('a' <= c && c <= 'z')
      || ('0' <= c && c <= '9')
      || c == '+' || c == '/';
}

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief splits a string
////////////////////////////////////////////////////////////////////////////////

vector<string> dbaas::split (const string& value, char separator) {
  vector<string> result;
  string::size_type p = 0;
  string::size_type q;

  while ((q = value.find(separator, p)) != string::npos) {
    result.emplace_back(value, p, q - p);
    p = q + 1;
  }

  result.emplace_back(value, p);
  return result;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief joins a vector of string
////////////////////////////////////////////////////////////////////////////////

string dbaas::join (const vector<string>& value, string separator) {
  string result = "";
  string sep = "";

  for (const auto& v : value) {
    result += sep + v;
    sep = separator;
  }

  return result;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief jsonify a protobuf message
////////////////////////////////////////////////////////////////////////////////

string dbaas::toJson (::google::protobuf::Message const& msg) {
  string result;
  pbjson::pb2json(&msg, result);
  return result;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief parses json into a protobuf message, returns an error text or ""
////////////////////////////////////////////////////////////////////////////////

string dbaas::fromJson (const string& json, ::google::protobuf::Message* msg) {
  string err;

  if (pbjson::json2pb(json, msg, err) != 0 && err.empty()) {
    err = "cannot parse request body";
  }

  return err;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief looks up a nested value, returns a null value if missing
////////////////////////////////////////////////////////////////////////////////

const picojson::value& dbaas::jsonGet (const picojson::value& root,
                                       JsonPath path) {
  const picojson::value* current = &root;

  for (const auto& key : path) {
    if (! current->is<picojson::object>()) {
      return NULL_VALUE;
    }

    const auto& o = current->get<picojson::object>();
    auto iter = o.find(key);

    if (iter == o.end()) {
      return NULL_VALUE;
    }

    current = &iter->second;
  }

  return *current;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief looks up a nested string
////////////////////////////////////////////////////////////////////////////////

string dbaas::jsonString (const picojson::value& root,
                          JsonPath path,
                          const string& def) {
  const picojson::value& v = jsonGet(root, path);

  if (v.is<string>()) {
    return v.get<string>();
  }

  // quantities like "cpu: 1" arrive as numbers
  if (v.is<double>()) {
    return v.to_str();
  }

  return def;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief looks up a nested number
////////////////////////////////////////////////////////////////////////////////

int64_t dbaas::jsonInt (const picojson::value& root,
                        JsonPath path,
                        int64_t def) {
  const picojson::value& v = jsonGet(root, path);

  if (v.is<double>()) {
    return static_cast<int64_t>(v.get<double>());
  }

  return def;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief looks up a nested boolean
////////////////////////////////////////////////////////////////////////////////

bool dbaas::jsonBool (const picojson::value& root, JsonPath path, bool def) {
  const picojson::value& v = jsonGet(root, path);

  if (v.is<bool>()) {
    return v.get<bool>();
  }

  return def;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief returns the nested value, creating intermediate objects
////////////////////////////////////////////////////////////////////////////////

picojson::value& dbaas::jsonSet (picojson::value& root, JsonPath path) {
  picojson::value* current = &root;

  for (const auto& key : path) {
    if (! current->is<picojson::object>()) {
      *current = picojson::value(picojson::object());
    }

    current = &current->get<picojson::object>()[key];
  }

  return *current;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief base64 encoding as used in secret data
////////////////////////////////////////////////////////////////////////////////

string dbaas::encodeBase64 (const string& value) {
  string result(Base64Encoder(value.begin()), Base64Encoder(value.end()));

  result.append((3 - value.size() % 3) % 3, '=');
  return result;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief base64 decoding as used in secret data
////////////////////////////////////////////////////////////////////////////////

Try<string> dbaas::decodeBase64 (const string& value) {
  if (value.size() % 4 != 0) {
    return Error("base64 value has a bad length");
  }

  size_t padding = 0;
  string input = value;

  while (padding < 2 && ! input.empty() && input[input.size() - 1 - padding] == '=') {
    input[input.size() - 1 - padding] = 'A';
    ++padding;
  }

  for (char c : input) {
    if (! isBase64(c)) {
      return Error("base64 value contains an illegal character");
    }
  }

  string result(Base64Decoder(input.begin()), Base64Decoder(input.end()));
  result.erase(result.size() - padding);

  return result;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
