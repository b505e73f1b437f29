////////////////////////////////////////////////////////////////////////////////
/// @brief clusters still being deleted
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

#ifndef DBAAS_DELETION_TRACKER_H
#define DBAAS_DELETION_TRACKER_H 1

#include "Result.h"

#include <set>
#include <string>
#include <vector>

#include <picojson.h>

namespace dbaas {
  class KubeCtl;

////////////////////////////////////////////////////////////////////////////////
/// @brief label holding the cluster name of a pod
////////////////////////////////////////////////////////////////////////////////

  extern const std::string INSTANCE_LABEL;

////////////////////////////////////////////////////////////////////////////////
/// @brief label holding the operator deployment of a pod
////////////////////////////////////////////////////////////////////////////////

  extern const std::string MANAGED_BY_LABEL;

////////////////////////////////////////////////////////////////////////////////
/// @brief names of clusters which still have pods but no custom resource
///
/// Pods whose cluster is in @c known or which are not managed by
/// @c managedBy are skipped. Every name found is added to @c known, so each
/// cluster is reported once.
////////////////////////////////////////////////////////////////////////////////

  std::vector<std::string> findDeleting (const picojson::value& pods,
                                         const std::string& managedBy,
                                         std::set<std::string>& known);

////////////////////////////////////////////////////////////////////////////////
/// @brief lists all pods and finds clusters being deleted
////////////////////////////////////////////////////////////////////////////////

  Result findDeleting (KubeCtl&,
                       const std::string& managedBy,
                       std::set<std::string>& known,
                       std::vector<std::string>& deleting);
}

#endif

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------

// Local Variables:
// mode: outline-minor
// outline-regexp: "/// @brief\\|/// {@inheritDoc}\\|/// @page\\|// --SECTION--\\|/// @\\}"
// End:
