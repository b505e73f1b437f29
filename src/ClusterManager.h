////////////////////////////////////////////////////////////////////////////////
/// @brief common part of the database cluster managers
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

#ifndef DBAAS_CLUSTER_MANAGER_H
#define DBAAS_CLUSTER_MANAGER_H 1

#include "dbaas.pb.h"

#include "ClusterState.h"
#include "KubernetesCluster.h"
#include "Result.h"

#include <stdint.h>

#include <string>
#include <vector>

#include <picojson.h>

#include <stout/option.hpp>

namespace dbaas {
  class KubeCtl;

////////////////////////////////////////////////////////////////////////////////
/// @brief converts a cluster state into its wire representation
////////////////////////////////////////////////////////////////////////////////

  DBClusterState toDBClusterState (ClusterState);

// -----------------------------------------------------------------------------
// --SECTION--                                              class ClusterManager
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief translates between clusters and operator custom resources
///
/// A manager lives for one request and uses the kubectl client of that
/// request. The derived classes know the custom resource of one operator.
////////////////////////////////////////////////////////////////////////////////

  class ClusterManager {

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

    public:

      explicit ClusterManager (KubeCtl&);

      ClusterManager (const ClusterManager&) = delete;

      ClusterManager& operator= (const ClusterManager&) = delete;

      virtual ~ClusterManager ();

// -----------------------------------------------------------------------------
// --SECTION--                                            virtual public methods
// -----------------------------------------------------------------------------

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief resource kind as understood by kubectl
////////////////////////////////////////////////////////////////////////////////

      virtual std::string kind () const = 0;

////////////////////////////////////////////////////////////////////////////////
/// @brief kind as written into documents
////////////////////////////////////////////////////////////////////////////////

      virtual std::string documentKind () const = 0;

////////////////////////////////////////////////////////////////////////////////
/// @brief api group of the custom resource
////////////////////////////////////////////////////////////////////////////////

      virtual std::string apiGroup () const = 0;

////////////////////////////////////////////////////////////////////////////////
/// @brief deployment name of the operator, found in pod labels
////////////////////////////////////////////////////////////////////////////////

      virtual std::string managedBy () const = 0;

////////////////////////////////////////////////////////////////////////////////
/// @brief state of a custom resource
///
/// A CHANGING cluster whose database pods do not all run the image of the
/// custom resource is UPGRADING.
////////////////////////////////////////////////////////////////////////////////

      ClusterState clusterState (const picojson::value& resource);

// -----------------------------------------------------------------------------
// --SECTION--                                         virtual protected methods
// -----------------------------------------------------------------------------

    protected:

////////////////////////////////////////////////////////////////////////////////
/// @brief operator application state of a custom resource
////////////////////////////////////////////////////////////////////////////////

      virtual std::string appState (const picojson::value& resource) const = 0;

////////////////////////////////////////////////////////////////////////////////
/// @brief states of the replica set members, if reported
////////////////////////////////////////////////////////////////////////////////

      virtual Option<std::vector<std::string>> memberStates (
        const picojson::value& resource) const;

////////////////////////////////////////////////////////////////////////////////
/// @brief database image of a custom resource
////////////////////////////////////////////////////////////////////////////////

      virtual std::string image (const picojson::value& resource) const = 0;

////////////////////////////////////////////////////////////////////////////////
/// @brief name of the database container in a pod
////////////////////////////////////////////////////////////////////////////////

      virtual std::string dataContainer () const = 0;

// -----------------------------------------------------------------------------
// --SECTION--                                                 protected methods
// -----------------------------------------------------------------------------

    protected:

////////////////////////////////////////////////////////////////////////////////
/// @brief fetches the custom resource of a cluster
////////////////////////////////////////////////////////////////////////////////

      Result getCluster (const std::string& name, picojson::value& resource);

////////////////////////////////////////////////////////////////////////////////
/// @brief fails with ALREADY_EXISTS if the cluster exists
////////////////////////////////////////////////////////////////////////////////

      Result checkAbsent (const std::string& name);

////////////////////////////////////////////////////////////////////////////////
/// @brief lists the custom resources and the clusters being deleted
////////////////////////////////////////////////////////////////////////////////

      Result listClusters (picojson::array& resources,
                           std::vector<std::string>& deleting);

////////////////////////////////////////////////////////////////////////////////
/// @brief reads the operator version, NOT_READY if not installed
////////////////////////////////////////////////////////////////////////////////

      Result operatorVersion (std::string& version);

////////////////////////////////////////////////////////////////////////////////
/// @brief fresh custom resource document
////////////////////////////////////////////////////////////////////////////////

      picojson::value newDocument (const std::string& name,
                                   const std::string& version,
                                   const std::vector<std::string>& finalizers);

////////////////////////////////////////////////////////////////////////////////
/// @brief prepares a fetched custom resource to be applied again
////////////////////////////////////////////////////////////////////////////////

      void prepareUpdate (picojson::value& resource);

////////////////////////////////////////////////////////////////////////////////
/// @brief deletes the custom resource and, best effort, its secrets
////////////////////////////////////////////////////////////////////////////////

      Result deleteCluster (const std::string& name,
                            const std::vector<std::string>& secrets);

////////////////////////////////////////////////////////////////////////////////
/// @brief restarts a stateful set
///
/// If @c optional is true, a missing stateful set is reported as NOT_FOUND
/// without trying to restart it.
////////////////////////////////////////////////////////////////////////////////

      Result restartStatefulSet (const std::string& name, bool optional);

////////////////////////////////////////////////////////////////////////////////
/// @brief checks whether the pods run the image of the custom resource
////////////////////////////////////////////////////////////////////////////////

      Result podsMatchImage (const std::string& name,
                             const std::string& image,
                             bool& match);

// -----------------------------------------------------------------------------
// --SECTION--                                          static protected methods
// -----------------------------------------------------------------------------

    protected:

////////////////////////////////////////////////////////////////////////////////
/// @brief rejects an empty cluster name
////////////////////////////////////////////////////////////////////////////////

      static Result checkName (const std::string& name);

////////////////////////////////////////////////////////////////////////////////
/// @brief rejects negative limits
////////////////////////////////////////////////////////////////////////////////

      static Result checkComputeResources (const ComputeResources&,
                                           const std::string& what);

////////////////////////////////////////////////////////////////////////////////
/// @brief sets the limits of a new resource block
////////////////////////////////////////////////////////////////////////////////

      static void setComputeResources (picojson::value& resources,
                                       const ComputeResources&);

////////////////////////////////////////////////////////////////////////////////
/// @brief changes the limits of an existing resource block
///
/// Only fields present in the request are changed, a zero removes the
/// limit.
////////////////////////////////////////////////////////////////////////////////

      static void updateComputeResources (picojson::value& resources,
                                          const ComputeResources&);

////////////////////////////////////////////////////////////////////////////////
/// @brief reads the limits of a resource block
////////////////////////////////////////////////////////////////////////////////

      static Result readComputeResources (const picojson::value& resources,
                                          ComputeResources*);

////////////////////////////////////////////////////////////////////////////////
/// @brief persistent volume claim of the given size
////////////////////////////////////////////////////////////////////////////////

      static picojson::value volumeSpec (int64_t diskSize);

////////////////////////////////////////////////////////////////////////////////
/// @brief reads the size of a persistent volume claim, 0 if missing
////////////////////////////////////////////////////////////////////////////////

      static Result readDiskSize (const picojson::value& volumeSpec,
                                  int64_t& diskSize);

////////////////////////////////////////////////////////////////////////////////
/// @brief monitoring client block
////////////////////////////////////////////////////////////////////////////////

      static picojson::value pmmSpec (const PMMParams&, bool withUser);

////////////////////////////////////////////////////////////////////////////////
/// @brief checks an image upgrade, only the tag may change
////////////////////////////////////////////////////////////////////////////////

      static Result validateImage (const std::string& current,
                                   const std::string& next);

////////////////////////////////////////////////////////////////////////////////
/// @brief adds the ready and total counts to the operation
////////////////////////////////////////////////////////////////////////////////

      static void addSteps (RunningOperation*, const picojson::value& status);

// -----------------------------------------------------------------------------
// --SECTION--                                               protected variables
// -----------------------------------------------------------------------------

    protected:

      KubeCtl& _kubectl;
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
