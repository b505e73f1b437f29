////////////////////////////////////////////////////////////////////////////////
/// @brief result of an operation against the Kubernetes cluster
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

#include "Result.h"

using namespace dbaas;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief converts an error code into its wire name
////////////////////////////////////////////////////////////////////////////////

string dbaas::toString (ErrorCode code) {
  switch (code) {
    case ErrorCode::NONE:             return "OK";
    case ErrorCode::NOT_FOUND:        return "NOT_FOUND";
    case ErrorCode::ALREADY_EXISTS:   return "ALREADY_EXISTS";
    case ErrorCode::NOT_READY:        return "FAILED_PRECONDITION";
    case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
    case ErrorCode::INTERNAL:         return "INTERNAL";
  }

  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// --SECTION--                                                      class Result
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief prefixes the message with a context, keeps the code
////////////////////////////////////////////////////////////////////////////////

Result Result::wrap (const string& context) const {
  if (! isError()) {
    return *this;
  }

  return Result(_code, context + ": " + _message);
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
