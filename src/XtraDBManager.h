////////////////////////////////////////////////////////////////////////////////
/// @brief manager for XtraDB clusters
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

#ifndef DBAAS_XTRADB_MANAGER_H
#define DBAAS_XTRADB_MANAGER_H 1

#include "ClusterManager.h"

namespace dbaas {

// -----------------------------------------------------------------------------
// --SECTION--                                               class XtraDBManager
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief manages PerconaXtraDBCluster resources
////////////////////////////////////////////////////////////////////////////////

  class XtraDBManager : public ClusterManager {

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

    public:

      explicit XtraDBManager (KubeCtl&);

// -----------------------------------------------------------------------------
// --SECTION--                                            virtual public methods
// -----------------------------------------------------------------------------

    public:

      std::string kind () const override;

      std::string documentKind () const override;

      std::string apiGroup () const override;

      std::string managedBy () const override;

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief lists the clusters including those being deleted
////////////////////////////////////////////////////////////////////////////////

      Result list (ListXtraDBClustersResponse*);

////////////////////////////////////////////////////////////////////////////////
/// @brief creates a cluster and its secret
///
/// Exactly one of ProxySQL and HAProxy must be requested.
////////////////////////////////////////////////////////////////////////////////

      Result create (const CreateXtraDBClusterRequest&);

////////////////////////////////////////////////////////////////////////////////
/// @brief changes size, resources, image or pauses and resumes a cluster
///
/// A paused cluster can only be resumed. Any other change requires a ready
/// cluster.
////////////////////////////////////////////////////////////////////////////////

      Result update (const UpdateXtraDBClusterRequest&);

////////////////////////////////////////////////////////////////////////////////
/// @brief deletes a cluster
////////////////////////////////////////////////////////////////////////////////

      Result remove (const std::string& name);

////////////////////////////////////////////////////////////////////////////////
/// @brief restarts the database and the proxy pods
////////////////////////////////////////////////////////////////////////////////

      Result restart (const std::string& name);

////////////////////////////////////////////////////////////////////////////////
/// @brief reads the root credentials of a ready or changing cluster
////////////////////////////////////////////////////////////////////////////////

      Result credentials (const std::string& name, XtraDBCredentials*);

////////////////////////////////////////////////////////////////////////////////
/// @brief builds the custom resource of a new cluster
////////////////////////////////////////////////////////////////////////////////

      picojson::value document (const CreateXtraDBClusterRequest&,
                                const std::string& operatorVersion,
                                KubernetesClusterType,
                                const std::string& secretName);

////////////////////////////////////////////////////////////////////////////////
/// @brief name of the secret holding the cluster passwords
////////////////////////////////////////////////////////////////////////////////

      static std::string secretName (const std::string& name);

// -----------------------------------------------------------------------------
// --SECTION--                                         virtual protected methods
// -----------------------------------------------------------------------------

    protected:

      std::string appState (const picojson::value&) const override;

      std::string image (const picojson::value&) const override;

      std::string dataContainer () const override;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

    private:

      Result summary (const picojson::value& resource,
                      ListXtraDBClustersResponse::Cluster*);

      static Result checkResources (const XtraDBClusterParams&);
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
