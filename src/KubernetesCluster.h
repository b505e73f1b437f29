////////////////////////////////////////////////////////////////////////////////
/// @brief properties of the Kubernetes cluster
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

#ifndef DBAAS_KUBERNETES_CLUSTER_H
#define DBAAS_KUBERNETES_CLUSTER_H 1

#include "Result.h"

#include <string>
#include <vector>

#include <picojson.h>

namespace dbaas {
  class KubeCtl;

// -----------------------------------------------------------------------------
// --SECTION--                                                         constants
// -----------------------------------------------------------------------------

  extern const std::string XTRADB_API_GROUP;
  extern const std::string MONGODB_API_GROUP;

// -----------------------------------------------------------------------------
// --SECTION--                                             KubernetesClusterType
// -----------------------------------------------------------------------------

  enum class KubernetesClusterType {
    UNKNOWN,
    MINIKUBE,
    EKS
  };

////////////////////////////////////////////////////////////////////////////////
/// @brief guesses the cluster type from a list of storage classes
////////////////////////////////////////////////////////////////////////////////

  KubernetesClusterType clusterTypeFromStorageClasses (const picojson::value&);

////////////////////////////////////////////////////////////////////////////////
/// @brief guesses the cluster type, UNKNOWN if the lookup fails
////////////////////////////////////////////////////////////////////////////////

  KubernetesClusterType clusterType (KubeCtl&);

// -----------------------------------------------------------------------------
// --SECTION--                                                         operators
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief installed operator versions, empty if not installed
////////////////////////////////////////////////////////////////////////////////

  struct OperatorVersions {
    std::string xtradb;
    std::string psmdb;
  };

////////////////////////////////////////////////////////////////////////////////
/// @brief highest operator version of an api group
///
/// Entries look like "pxc.percona.com/v1-6-0". Returns "1.6.0" or "" if no
/// entry of the group carries a three-part version.
////////////////////////////////////////////////////////////////////////////////

  std::string latestOperatorVersion (const std::vector<std::string>& apiVersions,
                                     const std::string& group);

////////////////////////////////////////////////////////////////////////////////
/// @brief reads the installed operator versions
////////////////////////////////////////////////////////////////////////////////

  Result checkOperators (KubeCtl&, OperatorVersions&);

////////////////////////////////////////////////////////////////////////////////
/// @brief api version of a custom resource for an operator version
////////////////////////////////////////////////////////////////////////////////

  std::string operatorApiVersion (const std::string& group,
                                  const std::string& version);
}

#endif

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------

// Local Variables:
// mode: outline-minor
// outline-regexp: "/// @brief\\|/// {@inheritDoc}\\|/// @page\\|// --SECTION--\\|/// @\\}"
// End:
