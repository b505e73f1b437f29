////////////////////////////////////////////////////////////////////////////////
/// @brief memory and cpu quantities
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

#ifndef DBAAS_UNITS_H
#define DBAAS_UNITS_H 1

#include <stdint.h>

#include <string>

#include <stout/try.hpp>

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

namespace dbaas {

////////////////////////////////////////////////////////////////////////////////
/// @brief parses a byte quantity
///
/// Accepts a decimal number followed by one of the suffixes "", "m", "K",
/// "Ki", "M", "Mi", "G", "Gi", "T" or "Ti". A lower case scale letter is
/// accepted for the kilo to tera suffixes, "m" always means milli. The
/// result is rounded up to the next integer.
////////////////////////////////////////////////////////////////////////////////

  Try<uint64_t> bytesFromString (const std::string&);

////////////////////////////////////////////////////////////////////////////////
/// @brief parses a cpu quantity into millicpus
///
/// "250m" is read as 250 millicpus, "1.5" as 1500 millicpus.
////////////////////////////////////////////////////////////////////////////////

  Try<uint64_t> milliCPUFromString (const std::string&);

////////////////////////////////////////////////////////////////////////////////
/// @brief formats a byte quantity
////////////////////////////////////////////////////////////////////////////////

  std::string stringFromBytes (uint64_t);

////////////////////////////////////////////////////////////////////////////////
/// @brief formats millicpus
////////////////////////////////////////////////////////////////////////////////

  std::string stringFromMilliCPU (uint64_t);
}

#endif

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------

// Local Variables:
// mode: outline-minor
// outline-regexp: "/// @brief\\|/// {@inheritDoc}\\|/// @page\\|// --SECTION--\\|/// @\\}"
// End:
