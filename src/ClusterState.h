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

#ifndef DBAAS_CLUSTER_STATE_H
#define DBAAS_CLUSTER_STATE_H 1

#include <string>
#include <vector>

#include <stout/option.hpp>

namespace dbaas {

// -----------------------------------------------------------------------------
// --SECTION--                                                      ClusterState
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief state of a database cluster as seen by clients
////////////////////////////////////////////////////////////////////////////////

  enum class ClusterState {
    INVALID,
    CHANGING,
    READY,
    FAILED,
    DELETING,
    PAUSED,
    UPGRADING
  };

  std::string toString (ClusterState);

////////////////////////////////////////////////////////////////////////////////
/// @brief severity rank used when combining member states
///
/// The order is INVALID < CHANGING < FAILED < READY, remaining states rank
/// after READY.
////////////////////////////////////////////////////////////////////////////////

  int severity (ClusterState);

////////////////////////////////////////////////////////////////////////////////
/// @brief maps an operator application state to a cluster state
///
/// @c memberStates holds the replica set member states if the operator
/// reports them. An aggregate "error" is then replaced by the lowest member
/// state, since the operator reports a forming replica set as failed.
////////////////////////////////////////////////////////////////////////////////

  ClusterState classify (const std::string& appState,
                         bool paused,
                         const Option<std::vector<std::string>>& memberStates
                           = None());
}

#endif

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------

// Local Variables:
// mode: outline-minor
// outline-regexp: "/// @brief\\|/// {@inheritDoc}\\|/// @page\\|// --SECTION--\\|/// @\\}"
// End:
