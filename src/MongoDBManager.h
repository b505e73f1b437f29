////////////////////////////////////////////////////////////////////////////////
/// @brief manager for MongoDB clusters
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

#ifndef DBAAS_MONGODB_MANAGER_H
#define DBAAS_MONGODB_MANAGER_H 1

#include "ClusterManager.h"

namespace dbaas {

// -----------------------------------------------------------------------------
// --SECTION--                                              class MongoDBManager
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief manages PerconaServerMongoDB resources
///
/// A cluster consists of the replica set "rs0". Clusters with more than one
/// member are sharded with a config server replica set and mongos routers.
////////////////////////////////////////////////////////////////////////////////

  class MongoDBManager : public ClusterManager {

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

    public:

      explicit MongoDBManager (KubeCtl&);

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

      Result list (ListMongoDBClustersResponse*);

      Result create (const CreateMongoDBClusterRequest&);

      Result update (const UpdateMongoDBClusterRequest&);

      Result remove (const std::string& name);

      Result restart (const std::string& name);

////////////////////////////////////////////////////////////////////////////////
/// @brief reads the user admin credentials of a ready cluster
////////////////////////////////////////////////////////////////////////////////

      Result credentials (const std::string& name, MongoDBCredentials*);

////////////////////////////////////////////////////////////////////////////////
/// @brief builds the custom resource of a new cluster
////////////////////////////////////////////////////////////////////////////////

      picojson::value document (const CreateMongoDBClusterRequest&,
                                const std::string& operatorVersion,
                                KubernetesClusterType,
                                const std::string& secretName);

      static std::string secretName (const std::string& name);

// -----------------------------------------------------------------------------
// --SECTION--                                         virtual protected methods
// -----------------------------------------------------------------------------

    protected:

      std::string appState (const picojson::value&) const override;

      Option<std::vector<std::string>> memberStates (
        const picojson::value&) const override;

      std::string image (const picojson::value&) const override;

      std::string dataContainer () const override;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

    private:

      Result summary (const picojson::value& resource,
                      ListMongoDBClustersResponse::Cluster*);
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
