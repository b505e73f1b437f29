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

#ifndef DBAAS_UTILS_H
#define DBAAS_UTILS_H 1

#include <stdint.h>

#include <initializer_list>
#include <string>
#include <vector>

#include <picojson.h>

#include <stout/try.hpp>

namespace google {
  namespace protobuf {
    class Message;
  }
}

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

namespace dbaas {
  using namespace std;

////////////////////////////////////////////////////////////////////////////////
/// @brief path of object keys into a json document
////////////////////////////////////////////////////////////////////////////////

  typedef initializer_list<string> JsonPath;

////////////////////////////////////////////////////////////////////////////////
/// @brief splits a string
////////////////////////////////////////////////////////////////////////////////

  vector<string> split (const string&, char separator);

////////////////////////////////////////////////////////////////////////////////
/// @brief joins a vector of string
////////////////////////////////////////////////////////////////////////////////

  string join (const vector<string>&, string separator);

////////////////////////////////////////////////////////////////////////////////
/// @brief jsonify a protobuf message
////////////////////////////////////////////////////////////////////////////////

  string toJson (::google::protobuf::Message const&);

////////////////////////////////////////////////////////////////////////////////
/// @brief parses json into a protobuf message, returns an error text or ""
////////////////////////////////////////////////////////////////////////////////

  string fromJson (const string&, ::google::protobuf::Message*);

////////////////////////////////////////////////////////////////////////////////
/// @brief looks up a nested value, returns a null value if missing
////////////////////////////////////////////////////////////////////////////////

  const picojson::value& jsonGet (const picojson::value&, JsonPath);

////////////////////////////////////////////////////////////////////////////////
/// @brief looks up a nested string
////////////////////////////////////////////////////////////////////////////////

  string jsonString (const picojson::value&, JsonPath, const string& def = "");

////////////////////////////////////////////////////////////////////////////////
/// @brief looks up a nested number
////////////////////////////////////////////////////////////////////////////////

  int64_t jsonInt (const picojson::value&, JsonPath, int64_t def = 0);

////////////////////////////////////////////////////////////////////////////////
/// @brief looks up a nested boolean
////////////////////////////////////////////////////////////////////////////////

  bool jsonBool (const picojson::value&, JsonPath, bool def = false);

////////////////////////////////////////////////////////////////////////////////
/// @brief returns the nested value, creating intermediate objects
////////////////////////////////////////////////////////////////////////////////

  picojson::value& jsonSet (picojson::value&, JsonPath);

////////////////////////////////////////////////////////////////////////////////
/// @brief base64 encoding as used in secret data
////////////////////////////////////////////////////////////////////////////////

  string encodeBase64 (const string&);

////////////////////////////////////////////////////////////////////////////////
/// @brief base64 decoding as used in secret data
////////////////////////////////////////////////////////////////////////////////

  Try<string> decodeBase64 (const string&);
}

#endif

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------

// Local Variables:
// mode: outline-minor
// outline-regexp: "/// @brief\\|/// {@inheritDoc}\\|/// @page\\|// --SECTION--\\|/// @\\}"
// End:
