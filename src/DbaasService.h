////////////////////////////////////////////////////////////////////////////////
/// @brief rpc operations of the controller
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

#ifndef DBAAS_DBAAS_SERVICE_H
#define DBAAS_DBAAS_SERVICE_H 1

#include "Result.h"

#include "dbaas.pb.h"

#include <functional>
#include <memory>
#include <string>

namespace dbaas {
  class KubeCtl;

// -----------------------------------------------------------------------------
// --SECTION--                                                class DbaasService
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief operations on XtraDB and MongoDB clusters
///
/// Every operation builds its own client from the kubeconfig of the request,
/// so operations do not share state and may run in parallel.
////////////////////////////////////////////////////////////////////////////////

  class DbaasService {

// -----------------------------------------------------------------------------
// --SECTION--                                                      public types
// -----------------------------------------------------------------------------

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief creates a client for a kubeconfig
////////////////////////////////////////////////////////////////////////////////

      typedef std::function<Result(const std::string& kubeconfig,
                                   std::unique_ptr<KubeCtl>&)> KubeCtlFactory;

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief constructor using kubectl processes
////////////////////////////////////////////////////////////////////////////////

      DbaasService ();

      explicit DbaasService (KubeCtlFactory);

      DbaasService (const DbaasService&) = delete;

      DbaasService& operator= (const DbaasService&) = delete;

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

    public:

      Result listXtraDBClusters (const ListXtraDBClustersRequest&,
                                 ListXtraDBClustersResponse*);

      Result createXtraDBCluster (const CreateXtraDBClusterRequest&,
                                  CreateXtraDBClusterResponse*);

      Result updateXtraDBCluster (const UpdateXtraDBClusterRequest&,
                                  UpdateXtraDBClusterResponse*);

      Result deleteXtraDBCluster (const DeleteXtraDBClusterRequest&,
                                  DeleteXtraDBClusterResponse*);

      Result restartXtraDBCluster (const RestartXtraDBClusterRequest&,
                                   RestartXtraDBClusterResponse*);

      Result getXtraDBClusterCredentials (
        const GetXtraDBClusterCredentialsRequest&,
        GetXtraDBClusterCredentialsResponse*);

      Result listMongoDBClusters (const ListMongoDBClustersRequest&,
                                  ListMongoDBClustersResponse*);

      Result createMongoDBCluster (const CreateMongoDBClusterRequest&,
                                   CreateMongoDBClusterResponse*);

      Result updateMongoDBCluster (const UpdateMongoDBClusterRequest&,
                                   UpdateMongoDBClusterResponse*);

      Result deleteMongoDBCluster (const DeleteMongoDBClusterRequest&,
                                   DeleteMongoDBClusterResponse*);

      Result restartMongoDBCluster (const RestartMongoDBClusterRequest&,
                                    RestartMongoDBClusterResponse*);

      Result getMongoDBClusterCredentials (
        const GetMongoDBClusterCredentialsRequest&,
        GetMongoDBClusterCredentialsResponse*);

////////////////////////////////////////////////////////////////////////////////
/// @brief checks that the cluster answers and reports the operators
////////////////////////////////////////////////////////////////////////////////

      Result checkConnection (const CheckKubernetesClusterConnectionRequest&,
                              CheckKubernetesClusterConnectionResponse*);

      Result getLogs (const GetLogsRequest&, GetLogsResponse*);

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

    private:

      Result connect (const KubeAuth&, std::unique_ptr<KubeCtl>&);

// -----------------------------------------------------------------------------
// --SECTION--                                                 private variables
// -----------------------------------------------------------------------------

    private:

      KubeCtlFactory _factory;
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
