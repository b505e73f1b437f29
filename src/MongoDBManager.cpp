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

#include "MongoDBManager.h"

#include "Global.h"
#include "KubeCtl.h"
#include "Secrets.h"
#include "utils.h"

#include <glog/logging.h>

using namespace dbaas;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private variables
// -----------------------------------------------------------------------------

static const string DEFAULT_IMAGE = "percona/percona-server-mongodb:4.2.8-8";
static const string BACKUP_IMAGE = "percona/percona-server-mongodb-operator:";
static const string REPLSET_NAME = "rs0";

////////////////////////////////////////////////////////////////////////////////
/// @brief users expected by the operator
////////////////////////////////////////////////////////////////////////////////

static const SecretData USERS = {
  { "MONGODB_BACKUP_USER",          "backup" },
  { "MONGODB_CLUSTER_ADMIN_USER",   "clusterAdmin" },
  { "MONGODB_CLUSTER_MONITOR_USER", "clusterMonitor" },
  { "MONGODB_USER_ADMIN_USER",      "userAdmin" }
};

static const vector<string> PASSWORD_KEYS = {
  "MONGODB_BACKUP_PASSWORD",
  "MONGODB_CLUSTER_ADMIN_PASSWORD",
  "MONGODB_CLUSTER_MONITOR_PASSWORD",
  "MONGODB_USER_ADMIN_PASSWORD"
};

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

static picojson::value number (int64_t value) {
  return picojson::value(static_cast<double>(value));
}

////////////////////////////////////////////////////////////////////////////////
/// @brief the first replica set of a custom resource or null
////////////////////////////////////////////////////////////////////////////////

static const picojson::value* firstReplset (const picojson::value& resource) {
  const picojson::value& replsets = jsonGet(resource, { "spec", "replsets" });

  if (! replsets.is<picojson::array>()
   || replsets.get<picojson::array>().empty()) {
    return nullptr;
  }

  return &replsets.get<picojson::array>()[0];
}

static picojson::value* firstReplset (picojson::value& resource) {
  picojson::value& replsets = jsonSet(resource, { "spec", "replsets" });

  if (! replsets.is<picojson::array>()
   || replsets.get<picojson::array>().empty()) {
    return nullptr;
  }

  return &replsets.get<picojson::array>()[0];
}

////////////////////////////////////////////////////////////////////////////////
/// @brief arbiter block, arbiters are never used
////////////////////////////////////////////////////////////////////////////////

static picojson::value arbiterSpec (const picojson::value& affinity) {
  picojson::value arbiter;

  jsonSet(arbiter, { "enabled" }) = picojson::value(false);
  jsonSet(arbiter, { "size" }) = number(1);
  jsonSet(arbiter, { "affinity" }) = affinity;

  return arbiter;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief mongod configuration
////////////////////////////////////////////////////////////////////////////////

static picojson::value mongodSpec (const string& name) {
  picojson::value mongod;

  jsonSet(mongod, { "net", "port" }) = number(27017);

  jsonSet(mongod, { "operationProfiling", "mode" }) = picojson::value("slowOp");
  jsonSet(mongod, { "operationProfiling", "slowOpThresholdMs" }) = number(100);
  jsonSet(mongod, { "operationProfiling", "rateLimit" }) = number(100);

  jsonSet(mongod, { "security", "redactClientLogData" }) = picojson::value(false);
  jsonSet(mongod, { "security", "enableEncryption" }) = picojson::value(true);
  jsonSet(mongod, { "security", "encryptionKeySecret" }) =
    picojson::value(name + "-mongodb-encryption-key");
  jsonSet(mongod, { "security", "encryptionCipherMode" }) =
    picojson::value("AES256-CBC");

  jsonSet(mongod, { "setParameter", "ttlMonitorSleepSecs" }) = number(60);

  picojson::value& storage = jsonSet(mongod, { "storage" });

  jsonSet(storage, { "engine" }) = picojson::value("wiredTiger");
  jsonSet(storage, { "mmapv1", "nsSize" }) = number(16);
  jsonSet(storage, { "mmapv1", "smallfiles" }) = picojson::value(false);
  jsonSet(storage, { "wiredTiger", "collectionConfig", "blockCompressor" }) =
    picojson::value("snappy");
  jsonSet(storage, { "wiredTiger", "engineConfig", "directoryForIndexes" }) =
    picojson::value(false);
  jsonSet(storage, { "wiredTiger", "engineConfig", "journalCompressor" }) =
    picojson::value("snappy");
  jsonSet(storage, { "wiredTiger", "indexConfig", "prefixCompression" }) =
    picojson::value(true);

  return mongod;
}

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

MongoDBManager::MongoDBManager (KubeCtl& kubectl)
  : ClusterManager(kubectl) {
}

// -----------------------------------------------------------------------------
// --SECTION--                                            virtual public methods
// -----------------------------------------------------------------------------

string MongoDBManager::kind () const {
  return "perconaservermongodb";
}

string MongoDBManager::documentKind () const {
  return "PerconaServerMongoDB";
}

string MongoDBManager::apiGroup () const {
  return MONGODB_API_GROUP;
}

string MongoDBManager::managedBy () const {
  return "percona-server-mongodb-operator";
}

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief lists the clusters including those being deleted
////////////////////////////////////////////////////////////////////////////////

Result MongoDBManager::list (ListMongoDBClustersResponse* response) {
  picojson::array resources;
  vector<string> deleting;

  Result res = listClusters(resources, deleting);

  if (res.isError()) {
    return res;
  }

  for (const auto& resource : resources) {
    res = summary(resource, response->add_clusters());

    if (res.isError()) {
      return res;
    }
  }

  for (const auto& name : deleting) {
    auto* cluster = response->add_clusters();

    cluster->set_name(name);
    cluster->set_state(DB_CLUSTER_STATE_DELETING);
    cluster->mutable_operation()->set_finished_steps(0);
    cluster->mutable_operation()->set_total_steps(0);
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief creates a cluster and its secret
////////////////////////////////////////////////////////////////////////////////

Result MongoDBManager::create (const CreateMongoDBClusterRequest& request) {
  const string& name = request.name();
  const MongoDBClusterParams& params = request.params();

  Result res = checkName(name);

  if (res.isError()) {
    return res;
  }

  if (params.cluster_size() < 1) {
    return Result::invalidArgument("cluster size must be at least 1");
  }

  if (params.replicaset().disk_size() <= 0) {
    return Result::invalidArgument("replica set disk size must be positive");
  }

  res = checkComputeResources(params.replicaset().compute_resources(),
                              "replica set");

  if (res.isError()) {
    return res;
  }

  res = checkAbsent(name);

  if (res.isError()) {
    return res;
  }

  string version;
  res = operatorVersion(version);

  if (res.isError()) {
    return res;
  }

  KubernetesClusterType type = clusterType(_kubectl);

  string secret = secretName(name);
  SecretData values = USERS;

  if (request.has_pmm()) {
    values["PMM_SERVER_USER"] = request.pmm().login();
    values["PMM_SERVER_PASSWORD"] = request.pmm().password();
  }

  picojson::value doc = document(request, version, type, secret);

  res = provisionSecret(_kubectl,
                        Global::mongodbSecretTemplate(),
                        secret,
                        values,
                        PASSWORD_KEYS);

  if (res.isError()) {
    return res.wrap("cannot create secret for PSMDB");
  }

  LOG(INFO)
  << "creating MongoDB cluster '" << name << "' of size "
  << params.cluster_size() << " with operator " << version;

  return _kubectl.apply(doc);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief changes size, resources, image or pauses and resumes a cluster
////////////////////////////////////////////////////////////////////////////////

Result MongoDBManager::update (const UpdateMongoDBClusterRequest& request) {
  const string& name = request.name();
  const auto& params = request.params();

  Result res = checkName(name);

  if (res.isError()) {
    return res;
  }

  if (params.has_cluster_size() && params.cluster_size() < 1) {
    return Result::invalidArgument("cluster size must be at least 1");
  }

  res = checkComputeResources(params.replicaset().compute_resources(),
                              "replica set");

  if (res.isError()) {
    return res;
  }

  picojson::value resource;
  res = getCluster(name, resource);

  if (res.isError()) {
    return res;
  }

  ClusterState state = clusterState(resource);

  if (params.resume() && state == ClusterState::PAUSED) {
    jsonSet(resource, { "spec", "pause" }) = picojson::value(false);
    prepareUpdate(resource);
    return _kubectl.apply(resource);
  }

  if (state != ClusterState::READY) {
    return Result::error(ErrorCode::NOT_READY,
                         "MongoDB cluster '" + name + "' is not ready, state is "
                         + toString(state));
  }

  picojson::value* replset = firstReplset(resource);

  if (replset == nullptr) {
    return Result::internalError(
      "MongoDB cluster '" + name + "' has no replica set");
  }

  if (params.has_cluster_size()) {
    jsonSet(*replset, { "size" }) = number(params.cluster_size());
  }

  if (params.suspend()) {
    jsonSet(resource, { "spec", "pause" }) = picojson::value(true);
  }

  if (params.replicaset().has_compute_resources()) {
    updateComputeResources(jsonSet(*replset, { "resources" }),
                           params.replicaset().compute_resources());
  }

  const string& next = params.image();
  string current = image(resource);

  if (! next.empty() && next != current) {
    res = validateImage(current, next);

    if (res.isError()) {
      return res;
    }

    jsonSet(resource, { "spec", "image" }) = picojson::value(next);
  }

  prepareUpdate(resource);
  return _kubectl.apply(resource);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief deletes a cluster and the secrets created by the operator
////////////////////////////////////////////////////////////////////////////////

Result MongoDBManager::remove (const string& name) {
  Result res = checkName(name);

  if (res.isError()) {
    return res;
  }

  return deleteCluster(name, {
    secretName(name),
    "internal-" + name + "-users",
    name + "-ssl",
    name + "-ssl-internal",
    name + "-mongodb-keyfile",
    name + "-mongodb-encryption-key"
  });
}

////////////////////////////////////////////////////////////////////////////////
/// @brief restarts the replica set
////////////////////////////////////////////////////////////////////////////////

Result MongoDBManager::restart (const string& name) {
  Result res = checkName(name);

  if (res.isError()) {
    return res;
  }

  res = restartStatefulSet(name + "-" + REPLSET_NAME, true);

  if (res.is(ErrorCode::NOT_FOUND)) {
    return Result::noError();
  }

  return res;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief reads the user admin credentials of a ready cluster
////////////////////////////////////////////////////////////////////////////////

Result MongoDBManager::credentials (const string& name,
                                    MongoDBCredentials* credentials) {
  static const string context = "cannot get PSMDB cluster credentials";

  Result res = checkName(name);

  if (res.isError()) {
    return res;
  }

  picojson::value resource;
  res = getCluster(name, resource);

  if (res.isError()) {
    return res.wrap(context);
  }

  ClusterState state = clusterState(resource);

  if (state != ClusterState::READY) {
    return Result::error(ErrorCode::NOT_READY,
                         context + ": cluster state is " + toString(state)
                         + ", READY is expected");
  }

  SecretData secret;
  res = getSecret(_kubectl, secretName(name), secret);

  if (res.isError()) {
    return res.wrap("cannot get PSMDB cluster secrets");
  }

  credentials->set_username(secret["MONGODB_USER_ADMIN_USER"]);
  credentials->set_password(secret["MONGODB_USER_ADMIN_PASSWORD"]);
  credentials->set_host(jsonString(resource, { "status", "host" }));
  credentials->set_port(27017);
  credentials->set_replicaset(REPLSET_NAME);

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief builds the custom resource of a new cluster
////////////////////////////////////////////////////////////////////////////////

picojson::value MongoDBManager::document (const CreateMongoDBClusterRequest& request,
                                          const string& version,
                                          KubernetesClusterType type,
                                          const string& secret) {
  const string& name = request.name();
  const MongoDBClusterParams& params = request.params();
  const int32_t size = params.cluster_size();
  const bool minikube = type == KubernetesClusterType::MINIKUBE;

  string exposeType = "ClusterIP";

  if (request.expose()) {
    exposeType = minikube ? "NodePort" : "LoadBalancer";
  }

  picojson::value affinity;
  jsonSet(affinity, { "antiAffinityTopologyKey" }) =
    picojson::value(minikube ? "none" : "kubernetes.io/hostname");

  picojson::value doc = newDocument(name, version, { "delete-psmdb-pvc" });
  picojson::value& spec = jsonSet(doc, { "spec" });

  jsonSet(spec, { "updateStrategy" }) = picojson::value("RollingUpdate");
  jsonSet(spec, { "crVersion" }) = picojson::value(version);
  jsonSet(spec, { "image" }) = picojson::value(
    params.image().empty() ? DEFAULT_IMAGE : params.image());
  jsonSet(spec, { "secrets", "users" }) = picojson::value(secret);

  // sharding
  picojson::value& sharding = jsonSet(spec, { "sharding" });

  jsonSet(sharding, { "enabled" }) = picojson::value(true);
  jsonSet(sharding, { "configsvrReplSet", "size" }) = number(size);
  jsonSet(sharding, { "configsvrReplSet", "volumeSpec" }) =
    volumeSpec(params.replicaset().disk_size());
  jsonSet(sharding, { "configsvrReplSet", "arbiter" }) = arbiterSpec(affinity);
  jsonSet(sharding, { "configsvrReplSet", "affinity" }) = affinity;

  jsonSet(sharding, { "mongos", "size" }) = number(size);
  jsonSet(sharding, { "mongos", "affinity" }) = affinity;
  jsonSet(sharding, { "mongos", "expose", "exposeType" }) =
    picojson::value(exposeType);

  setComputeResources(jsonSet(sharding, { "mongos", "resources" }),
                      params.replicaset().compute_resources());

  // replica set
  picojson::value replset;

  jsonSet(replset, { "name" }) = picojson::value(REPLSET_NAME);
  jsonSet(replset, { "size" }) = number(size);
  jsonSet(replset, { "arbiter" }) = arbiterSpec(affinity);
  jsonSet(replset, { "volumeSpec" }) = volumeSpec(params.replicaset().disk_size());
  jsonSet(replset, { "podDisruptionBudget", "maxUnavailable" }) = number(1);
  jsonSet(replset, { "affinity" }) = affinity;
  jsonSet(replset, { "configuration" }) = picojson::value(
    "      operationProfiling:\n"
    "        mode: slowOp\n");

  setComputeResources(jsonSet(replset, { "resources" }),
                      params.replicaset().compute_resources());

  // a single member cannot be sharded, expose the member itself
  if (size == 1) {
    jsonSet(spec, { "allowUnsafeConfigurations" }) = picojson::value(true);
    jsonSet(sharding, { "enabled" }) = picojson::value(false);

    if (request.expose()) {
      jsonSet(replset, { "expose", "enabled" }) = picojson::value(true);
      jsonSet(replset, { "expose", "exposeType" }) = picojson::value(exposeType);
      jsonSet(sharding, { "mongos", "expose", "exposeType" }) =
        picojson::value("ClusterIP");
    }
  }

  jsonSet(spec, { "replsets" }) = picojson::value(picojson::array{ replset });

  // monitoring
  if (request.has_pmm()) {
    jsonSet(spec, { "pmm" }) = pmmSpec(request.pmm(), false);
  }
  else {
    jsonSet(spec, { "pmm", "enabled" }) = picojson::value(false);
  }

  jsonSet(spec, { "mongod" }) = mongodSpec(name);

  // backup
  jsonSet(spec, { "backup", "enabled" }) = picojson::value(true);
  jsonSet(spec, { "backup", "image" }) = picojson::value(
    params.backup_image().empty() ? BACKUP_IMAGE + version + "-backup"
                                  : params.backup_image());
  jsonSet(spec, { "backup", "serviceAccountName" }) = picojson::value(managedBy());

  return doc;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief name of the secret holding the cluster users
////////////////////////////////////////////////////////////////////////////////

string MongoDBManager::secretName (const string& name) {
  return "dbaas-" + name + "-psmdb-secrets";
}

// -----------------------------------------------------------------------------
// --SECTION--                                         virtual protected methods
// -----------------------------------------------------------------------------

string MongoDBManager::appState (const picojson::value& resource) const {
  string state = jsonString(resource, { "status", "state" });

  // the operator did not yet look at the resource
  if (state.empty()) {
    return "unknown";
  }

  return state;
}

Option<vector<string>> MongoDBManager::memberStates (
    const picojson::value& resource) const {
  vector<string> states;
  const picojson::value& replsets = jsonGet(resource, { "status", "replsets" });

  if (replsets.is<picojson::object>()) {
    for (const auto& kv : replsets.get<picojson::object>()) {
      states.push_back(jsonString(kv.second, { "status" }));
    }
  }

  return states;
}

string MongoDBManager::image (const picojson::value& resource) const {
  return jsonString(resource, { "spec", "image" });
}

string MongoDBManager::dataContainer () const {
  return "mongod";
}

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief projects a custom resource into a cluster summary
////////////////////////////////////////////////////////////////////////////////

Result MongoDBManager::summary (const picojson::value& resource,
                                ListMongoDBClustersResponse::Cluster* cluster) {
  const picojson::value& spec = jsonGet(resource, { "spec" });
  const picojson::value& status = jsonGet(resource, { "status" });
  const picojson::value* replset = firstReplset(resource);

  static const picojson::value EMPTY;

  if (replset == nullptr) {
    replset = &EMPTY;
  }

  cluster->set_name(jsonString(resource, { "metadata", "name" }));

  MongoDBClusterParams* params = cluster->mutable_params();
  int32_t size = static_cast<int32_t>(jsonInt(*replset, { "size" }));

  params->set_cluster_size(size);
  params->set_image(jsonString(spec, { "image" }));
  params->set_backup_image(jsonString(spec, { "backup", "image" }));

  auto* rs = params->mutable_replicaset();
  int64_t diskSize = 0;

  Result res = readDiskSize(jsonGet(*replset, { "volumeSpec" }), diskSize);

  if (res.isError()) {
    return res;
  }

  rs->set_disk_size(diskSize);

  res = readComputeResources(jsonGet(*replset, { "resources" }),
                             rs->mutable_compute_resources());

  if (res.isError()) {
    return res;
  }

  RunningOperation* operation = cluster->mutable_operation();
  operation->set_finished_steps(0);
  operation->set_total_steps(0);

  const picojson::value& conditions = jsonGet(status, { "conditions" });

  if (conditions.is<picojson::array>()
   && ! conditions.get<picojson::array>().empty()) {
    string message = jsonString(status, { "message" });

    if (message.empty()) {
      message = jsonString(conditions.get<picojson::array>().back(),
                           { "message" });
    }

    const picojson::value& replsets = jsonGet(status, { "replsets" });

    if (replsets.is<picojson::object>()) {
      for (const auto& kv : replsets.get<picojson::object>()) {
        addSteps(operation, kv.second);
      }
    }

    if (size != 1) {
      addSteps(operation, jsonGet(status, { "mongos" }));
    }

    operation->set_message(message);
  }

  string exposeType =
    jsonString(spec, { "sharding", "mongos", "expose", "exposeType" });

  cluster->set_exposed(
    (! exposeType.empty() && exposeType != "ClusterIP")
    || jsonBool(*replset, { "expose", "enabled" }));

  cluster->set_state(toDBClusterState(clusterState(resource)));

  return Result::noError();
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
