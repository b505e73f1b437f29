////////////////////////////////////////////////////////////////////////////////
/// @brief cluster state classifier
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

#include "ClusterState.h"

#include <algorithm>

#include <boost/algorithm/string.hpp>

#include <glog/logging.h>

using namespace dbaas;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief direct mapping of an operator state
////////////////////////////////////////////////////////////////////////////////

static ClusterState mapAppState (const string& state) {
  string s = boost::algorithm::to_lower_copy(state);

  if (s == "unknown") {
    return ClusterState::INVALID;
  }
  else if (s == "initializing" || s == "stopping" || s == "pending") {
    return ClusterState::CHANGING;
  }
  else if (s == "ready") {
    return ClusterState::READY;
  }
  else if (s == "error") {
    return ClusterState::FAILED;
  }
  else if (s == "paused") {
    return ClusterState::PAUSED;
  }

  // a freshly created resource has no status yet
  if (! s.empty()) {
    LOG(WARNING)
    << "unknown operator state '" << state << "'";
  }

  return ClusterState::CHANGING;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief converts a cluster state into a string
////////////////////////////////////////////////////////////////////////////////

string dbaas::toString (ClusterState state) {
  switch (state) {
    case ClusterState::INVALID:   return "INVALID";
    case ClusterState::CHANGING:  return "CHANGING";
    case ClusterState::READY:     return "READY";
    case ClusterState::FAILED:    return "FAILED";
    case ClusterState::DELETING:  return "DELETING";
    case ClusterState::PAUSED:    return "PAUSED";
    case ClusterState::UPGRADING: return "UPGRADING";
  }

  return "UNKNOWN";
}

////////////////////////////////////////////////////////////////////////////////
/// @brief severity rank used when combining member states
////////////////////////////////////////////////////////////////////////////////

int dbaas::severity (ClusterState state) {
  static const ClusterState ORDER[] = {
    ClusterState::INVALID,
    ClusterState::CHANGING,
    ClusterState::FAILED,
    ClusterState::READY,
    ClusterState::DELETING,
    ClusterState::PAUSED,
    ClusterState::UPGRADING
  };

  const auto* end = ORDER + sizeof(ORDER) / sizeof(ORDER[0]);
  return static_cast<int>(find(ORDER, end, state) - ORDER);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief maps an operator application state to a cluster state
////////////////////////////////////////////////////////////////////////////////

ClusterState dbaas::classify (const string& appState,
                              bool paused,
                              const Option<vector<string>>& memberStates) {
  ClusterState state = mapAppState(appState);

  if (state == ClusterState::PAUSED
   || (paused && state == ClusterState::READY)) {
    return ClusterState::PAUSED;
  }

  if (state != ClusterState::FAILED || memberStates.isNone()) {
    return state;
  }

  const vector<string>& members = memberStates.get();

  if (members.empty()) {
    return ClusterState::INVALID;
  }

  ClusterState lowest = mapAppState(members[0]);

  for (const auto& member : members) {
    ClusterState s = mapAppState(member);

    if (severity(s) < severity(lowest)) {
      lowest = s;
    }
  }

  return lowest;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
