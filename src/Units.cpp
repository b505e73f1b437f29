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

#include "Units.h"

#include <ctype.h>
#include <errno.h>
#include <stdlib.h>

#include <cmath>
#include <map>

#include <stout/error.hpp>
#include <stout/stringify.hpp>

using namespace dbaas;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief suffix coefficients
////////////////////////////////////////////////////////////////////////////////

static const map<string, double>& suffixes () {
  static const map<string, double> SUFFIXES = {
    { "",   1.0 },
    { "m",  0.001 },
    { "K",  1000.0 },
    { "Ki", 1024.0 },
    { "M",  1000.0 * 1000.0 },
    { "Mi", 1024.0 * 1024.0 },
    { "G",  1000.0 * 1000.0 * 1000.0 },
    { "Gi", 1024.0 * 1024.0 * 1024.0 },
    { "T",  1000.0 * 1000.0 * 1000.0 * 1000.0 },
    { "Ti", 1024.0 * 1024.0 * 1024.0 * 1024.0 }
  };

  return SUFFIXES;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief checks for digits with at most one decimal point
////////////////////////////////////////////////////////////////////////////////

static bool isDecimal (const string& value) {
  bool digits = false;
  bool dot = false;

  for (char c : value) {
    if (isdigit(static_cast<unsigned char>(c))) {
      digits = true;
    }
    else if (c == '.' && ! dot) {
      dot = true;
    }
    else {
      return false;
    }
  }

  return digits;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief checks for digits only
////////////////////////////////////////////////////////////////////////////////

static bool isInteger (const string& value) {
  if (value.empty()) {
    return false;
  }

  for (char c : value) {
    if (! isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }

  return true;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief rounds up and range-checks a scaled quantity
////////////////////////////////////////////////////////////////////////////////

static Try<uint64_t> toUnsigned (double value, const string& original) {
  double rounded = ceil(value);

  // 2^64 is exactly representable as a double
  if (rounded >= 18446744073709551616.0) {
    return Error("quantity '" + original + "' is out of range");
  }

  return static_cast<uint64_t>(rounded);
}

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief parses a byte quantity
////////////////////////////////////////////////////////////////////////////////

Try<uint64_t> dbaas::bytesFromString (const string& memory) {
  if (memory.empty()) {
    return Error("can't convert an empty string to a number");
  }

  string::size_type i = memory.size();

  while (0 < i && ! isdigit(static_cast<unsigned char>(memory[i - 1]))) {
    --i;
  }

  string suffix = memory.substr(i);
  string number = memory.substr(0, i);

  auto iter = suffixes().find(suffix);

  if (iter == suffixes().end() && ! suffix.empty() && suffix != "m") {
    string upper = suffix;
    upper[0] = static_cast<char>(toupper(static_cast<unsigned char>(upper[0])));
    iter = suffixes().find(upper);
  }

  if (iter == suffixes().end()) {
    return Error("suffix '" + suffix + "' not supported");
  }

  if (! isDecimal(number)) {
    return Error("given value '" + number + "' is not a number");
  }

  double value = strtod(number.c_str(), nullptr);

  return toUnsigned(value * iter->second, memory);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief parses a cpu quantity into millicpus
////////////////////////////////////////////////////////////////////////////////

Try<uint64_t> dbaas::milliCPUFromString (const string& cpu) {
  if (cpu.empty()) {
    return Error("can't convert an empty string to a number");
  }

  if (cpu[cpu.size() - 1] == 'm') {
    string number = cpu.substr(0, cpu.size() - 1);

    if (! isInteger(number)) {
      return Error("given value '" + number + "' is not a number of millicpus");
    }

    errno = 0;
    unsigned long long millis = strtoull(number.c_str(), nullptr, 10);

    if (errno == ERANGE) {
      return Error("quantity '" + cpu + "' is out of range");
    }

    return static_cast<uint64_t>(millis);
  }

  if (! isDecimal(cpu)) {
    return Error("given value '" + cpu + "' is not a number");
  }

  double value = strtod(cpu.c_str(), nullptr);

  return toUnsigned(round(value * 1000.0), cpu);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief formats a byte quantity
////////////////////////////////////////////////////////////////////////////////

string dbaas::stringFromBytes (uint64_t bytes) {
  return stringify(bytes);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief formats millicpus
////////////////////////////////////////////////////////////////////////////////

string dbaas::stringFromMilliCPU (uint64_t millis) {
  return stringify(millis) + "m";
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
