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

#ifndef DBAAS_RESULT_H
#define DBAAS_RESULT_H 1

#include <string>

namespace dbaas {

// -----------------------------------------------------------------------------
// --SECTION--                                                         ErrorCode
// -----------------------------------------------------------------------------

  enum class ErrorCode {
    NONE,
    NOT_FOUND,
    ALREADY_EXISTS,
    NOT_READY,
    INVALID_ARGUMENT,
    INTERNAL
  };

////////////////////////////////////////////////////////////////////////////////
/// @brief converts an error code into its wire name
////////////////////////////////////////////////////////////////////////////////

  std::string toString (ErrorCode);

// -----------------------------------------------------------------------------
// --SECTION--                                                      class Result
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief outcome of an operation
///
/// A result is either no-error or carries an error code and a message. The
/// code is the only thing callers inspect for control flow, the message is
/// meant for humans.
////////////////////////////////////////////////////////////////////////////////

  class Result {

// -----------------------------------------------------------------------------
// --SECTION--                                             static public methods
// -----------------------------------------------------------------------------

    public:

      static Result noError () {
        return Result(ErrorCode::NONE, "");
      }

      static Result error (ErrorCode code, const std::string& message) {
        return Result(code, message);
      }

      static Result notFound (const std::string& message) {
        return Result(ErrorCode::NOT_FOUND, message);
      }

      static Result invalidArgument (const std::string& message) {
        return Result(ErrorCode::INVALID_ARGUMENT, message);
      }

      static Result internalError (const std::string& message) {
        return Result(ErrorCode::INTERNAL, message);
      }

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

    private:

      Result (ErrorCode code, const std::string& message)
        : _code(code), _message(message) {
      }

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

    public:

      bool isError () const {
        return _code != ErrorCode::NONE;
      }

      bool is (ErrorCode code) const {
        return _code == code;
      }

      ErrorCode code () const {
        return _code;
      }

      const std::string& message () const {
        return _message;
      }

////////////////////////////////////////////////////////////////////////////////
/// @brief prefixes the message with a context, keeps the code
////////////////////////////////////////////////////////////////////////////////

      Result wrap (const std::string& context) const;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private variables
// -----------------------------------------------------------------------------

    private:

      ErrorCode _code;
      std::string _message;
  };
}

#endif

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------

// Local Variables:
// mode: outline-minor
// outline-regexp: "/// @brief\\|/// {@inheritDoc}\\|/// @page\\|// --SECTION--\\|/// @\\}"
// End:
