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

#include "XtraDBManager.h"

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

static const string DEFAULT_IMAGE = "percona/percona-xtradb-cluster:8.0.20-11.1";
static const string OPERATOR_IMAGE = "percona/percona-xtradb-cluster-operator:";
static const string PULL_POLICY = "IfNotPresent";
static const string AFFINITY_OFF = "none";

////////////////////////////////////////////////////////////////////////////////
/// @brief password keys expected by the operator
////////////////////////////////////////////////////////////////////////////////

static const vector<string> PASSWORD_KEYS = {
  "root",
  "xtrabackup",
  "monitor",
  "clustercheck",
  "proxyadmin",
  "operator",
  "replication"
};

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief checks whether a proxy is configured in a custom resource
////////////////////////////////////////////////////////////////////////////////

static bool hasProxy (const picojson::value& resource, const string& proxy) {
  const picojson::value& spec = jsonGet(resource, { "spec", proxy });

  return spec.is<picojson::object>()
      && jsonBool(spec, { "enabled" }, true);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief number as json value
////////////////////////////////////////////////////////////////////////////////

static picojson::value number (int64_t value) {
  return picojson::value(static_cast<double>(value));
}

////////////////////////////////////////////////////////////////////////////////
/// @brief pod block shared by both proxies
////////////////////////////////////////////////////////////////////////////////

static picojson::value proxySpec (int32_t size, const string& serviceType) {
  picojson::value spec;

  jsonSet(spec, { "enabled" }) = picojson::value(true);
  jsonSet(spec, { "imagePullPolicy" }) = picojson::value(PULL_POLICY);
  jsonSet(spec, { "size" }) = number(size);
  jsonSet(spec, { "affinity", "antiAffinityTopologyKey" }) =
    picojson::value(AFFINITY_OFF);
  jsonSet(spec, { "serviceType" }) = picojson::value(serviceType);

  return spec;
}

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

XtraDBManager::XtraDBManager (KubeCtl& kubectl)
  : ClusterManager(kubectl) {
}

// -----------------------------------------------------------------------------
// --SECTION--                                            virtual public methods
// -----------------------------------------------------------------------------

string XtraDBManager::kind () const {
  return "perconaxtradbcluster";
}

string XtraDBManager::documentKind () const {
  return "PerconaXtraDBCluster";
}

string XtraDBManager::apiGroup () const {
  return XTRADB_API_GROUP;
}

string XtraDBManager::managedBy () const {
  return "percona-xtradb-cluster-operator";
}

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief lists the clusters including those being deleted
////////////////////////////////////////////////////////////////////////////////

Result XtraDBManager::list (ListXtraDBClustersResponse* response) {
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

Result XtraDBManager::create (const CreateXtraDBClusterRequest& request) {
  const string& name = request.name();
  const XtraDBClusterParams& params = request.params();

  Result res = checkName(name);

  if (res.isError()) {
    return res;
  }

  if (params.has_proxysql() == params.has_haproxy()) {
    return Result::invalidArgument(
      "pxc cluster must have one and only one proxy type defined");
  }

  if (params.cluster_size() < 1) {
    return Result::invalidArgument("cluster size must be at least 1");
  }

  if (params.pxc().disk_size() <= 0) {
    return Result::invalidArgument("pxc disk size must be positive");
  }

  if (params.has_proxysql() && params.proxysql().disk_size() <= 0) {
    return Result::invalidArgument("proxysql disk size must be positive");
  }

  res = checkResources(params);

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

  SecretData values;

  if (request.has_pmm()) {
    values["pmmserver"] = request.pmm().password();
  }

  picojson::value doc = document(request, version, type, secret);

  res = provisionSecret(_kubectl,
                        Global::xtradbSecretTemplate(),
                        secret,
                        values,
                        PASSWORD_KEYS);

  if (res.isError()) {
    return res.wrap("cannot create secret for PXC");
  }

  LOG(INFO)
  << "creating XtraDB cluster '" << name << "' of size "
  << params.cluster_size() << " with operator " << version;

  return _kubectl.apply(doc);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief changes size, resources, image or pauses and resumes a cluster
////////////////////////////////////////////////////////////////////////////////

Result XtraDBManager::update (const UpdateXtraDBClusterRequest& request) {
  const string& name = request.name();
  const auto& params = request.params();

  Result res = checkName(name);

  if (res.isError()) {
    return res;
  }

  if (params.has_proxysql() && params.has_haproxy()) {
    return Result::invalidArgument(
      "can't update both proxies, only one should be in use");
  }

  if (params.has_cluster_size() && params.cluster_size() < 1) {
    return Result::invalidArgument("cluster size must be at least 1");
  }

  res = checkResources(params);

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
                         "XtraDB cluster '" + name + "' is not ready, state is "
                         + toString(state));
  }

  if (params.suspend()) {
    jsonSet(resource, { "spec", "pause" }) = picojson::value(true);
  }

  if (params.has_cluster_size()) {
    jsonSet(resource, { "spec", "pxc", "size" }) = number(params.cluster_size());

    for (const string proxy : { "proxysql", "haproxy" }) {
      if (hasProxy(resource, proxy)) {
        jsonSet(resource, { "spec", proxy, "size" }) =
          number(params.cluster_size());
      }
    }
  }

  if (params.has_pxc()) {
    if (params.pxc().has_compute_resources()) {
      updateComputeResources(jsonSet(resource, { "spec", "pxc", "resources" }),
                             params.pxc().compute_resources());
    }

    const string& next = params.pxc().image();
    string current = image(resource);

    if (! next.empty() && next != current) {
      res = validateImage(current, next);

      if (res.isError()) {
        return res;
      }

      jsonSet(resource, { "spec", "pxc", "image" }) = picojson::value(next);
    }
  }

  if (params.has_proxysql() && params.proxysql().has_compute_resources()) {
    updateComputeResources(
      jsonSet(resource, { "spec", "proxysql", "resources" }),
      params.proxysql().compute_resources());
  }

  if (params.has_haproxy() && params.haproxy().has_compute_resources()) {
    updateComputeResources(
      jsonSet(resource, { "spec", "haproxy", "resources" }),
      params.haproxy().compute_resources());
  }

  prepareUpdate(resource);
  return _kubectl.apply(resource);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief deletes a cluster
////////////////////////////////////////////////////////////////////////////////

Result XtraDBManager::remove (const string& name) {
  Result res = checkName(name);

  if (res.isError()) {
    return res;
  }

  return deleteCluster(name, { secretName(name), "internal-" + name });
}

////////////////////////////////////////////////////////////////////////////////
/// @brief restarts the database and the proxy pods
////////////////////////////////////////////////////////////////////////////////

Result XtraDBManager::restart (const string& name) {
  Result res = checkName(name);

  if (res.isError()) {
    return res;
  }

  res = restartStatefulSet(name + "-pxc", false);

  if (res.isError()) {
    return res;
  }

  for (const string proxy : { "proxysql", "haproxy" }) {
    res = restartStatefulSet(name + "-" + proxy, true);

    if (! res.is(ErrorCode::NOT_FOUND)) {
      return res;
    }
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief reads the root credentials of a ready or changing cluster
////////////////////////////////////////////////////////////////////////////////

Result XtraDBManager::credentials (const string& name,
                                   XtraDBCredentials* credentials) {
  static const string context = "cannot get XtraDB cluster credentials";

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

  if (state != ClusterState::READY && state != ClusterState::CHANGING) {
    return Result::error(ErrorCode::NOT_READY,
                         context + ": cluster state is " + toString(state)
                         + ", READY or CHANGING is expected");
  }

  SecretData secret;
  res = getSecret(_kubectl, secretName(name), secret);

  if (res.isError()) {
    return res.wrap("cannot get XtraDB cluster secrets");
  }

  credentials->set_username("root");
  credentials->set_password(secret["root"]);
  credentials->set_host(jsonString(resource, { "status", "host" }));
  credentials->set_port(3306);

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief builds the custom resource of a new cluster
////////////////////////////////////////////////////////////////////////////////

picojson::value XtraDBManager::document (const CreateXtraDBClusterRequest& request,
                                         const string& version,
                                         KubernetesClusterType type,
                                         const string& secret) {
  const string& name = request.name();
  const XtraDBClusterParams& params = request.params();
  const string storageName = "pxc-backup-storage-" + name;

  picojson::value doc =
    newDocument(name, version, { "delete-proxysql-pvc", "delete-pxc-pvc" });

  picojson::value& spec = jsonSet(doc, { "spec" });

  jsonSet(spec, { "updateStrategy" }) = picojson::value("RollingUpdate");
  jsonSet(spec, { "crVersion" }) = picojson::value(version);
  jsonSet(spec, { "allowUnsafeConfigurations" }) = picojson::value(true);
  jsonSet(spec, { "secretsName" }) = picojson::value(secret);

  // database nodes
  picojson::value& pxc = jsonSet(spec, { "pxc" });
  const string& pxcImage = params.pxc().image();

  jsonSet(pxc, { "size" }) = number(params.cluster_size());
  jsonSet(pxc, { "image" }) =
    picojson::value(pxcImage.empty() ? DEFAULT_IMAGE : pxcImage);
  jsonSet(pxc, { "imagePullPolicy" }) = picojson::value(PULL_POLICY);
  jsonSet(pxc, { "volumeSpec" }) = volumeSpec(params.pxc().disk_size());
  jsonSet(pxc, { "affinity", "antiAffinityTopologyKey" }) =
    picojson::value(AFFINITY_OFF);
  jsonSet(pxc, { "podDisruptionBudget", "maxUnavailable" }) = number(1);

  setComputeResources(jsonSet(pxc, { "resources" }),
                      params.pxc().compute_resources());

  // monitoring
  if (request.has_pmm()) {
    picojson::value pmm = pmmSpec(request.pmm(), true);
    jsonSet(pmm, { "imagePullPolicy" }) = picojson::value(PULL_POLICY);
    jsonSet(spec, { "pmm" }) = pmm;
  }
  else {
    jsonSet(spec, { "pmm", "enabled" }) = picojson::value(false);
  }

  // backup
  picojson::value& backup = jsonSet(spec, { "backup" });
  picojson::value schedule;

  jsonSet(schedule, { "name" }) = picojson::value("test");
  jsonSet(schedule, { "schedule" }) = picojson::value("*/30 * * * *");
  jsonSet(schedule, { "keep" }) = number(3);
  jsonSet(schedule, { "storageName" }) = picojson::value(storageName);

  jsonSet(backup, { "image" }) =
    picojson::value(OPERATOR_IMAGE + version + "-pxc8.0-backup");
  jsonSet(backup, { "schedule" }) =
    picojson::value(picojson::array{ schedule });
  jsonSet(backup, { "storages", storageName, "type" }) =
    picojson::value("filesystem");
  jsonSet(backup, { "storages", storageName, "volume" }) =
    volumeSpec(params.pxc().disk_size());
  jsonSet(backup, { "serviceAccountName" }) =
    picojson::value(managedBy());

  // proxy
  string serviceType =
    (request.expose() && type != KubernetesClusterType::MINIKUBE)
    ? "LoadBalancer" : "NodePort";

  picojson::value proxy = proxySpec(params.cluster_size(), serviceType);

  if (params.has_proxysql()) {
    const string& proxyImage = params.proxysql().image();

    jsonSet(proxy, { "image" }) = picojson::value(
      proxyImage.empty() ? OPERATOR_IMAGE + version + "-proxysql" : proxyImage);
    jsonSet(proxy, { "volumeSpec" }) = volumeSpec(params.proxysql().disk_size());

    setComputeResources(jsonSet(proxy, { "resources" }),
                        params.proxysql().compute_resources());

    jsonSet(spec, { "proxysql" }) = proxy;
  }
  else {
    const string& proxyImage = params.haproxy().image();

    jsonSet(proxy, { "image" }) = picojson::value(
      proxyImage.empty() ? OPERATOR_IMAGE + version + "-haproxy" : proxyImage);

    setComputeResources(jsonSet(proxy, { "resources" }),
                        params.haproxy().compute_resources());

    jsonSet(spec, { "haproxy" }) = proxy;
  }

  return doc;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief name of the secret holding the cluster passwords
////////////////////////////////////////////////////////////////////////////////

string XtraDBManager::secretName (const string& name) {
  return "dbaas-" + name + "-pxc-secrets";
}

// -----------------------------------------------------------------------------
// --SECTION--                                         virtual protected methods
// -----------------------------------------------------------------------------

string XtraDBManager::appState (const picojson::value& resource) const {
  if (! jsonGet(resource, { "spec", "pxc" }).is<picojson::object>()) {
    return "unknown";
  }

  return jsonString(resource, { "status", "state" });
}

string XtraDBManager::image (const picojson::value& resource) const {
  return jsonString(resource, { "spec", "pxc", "image" });
}

string XtraDBManager::dataContainer () const {
  return "pxc";
}

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief projects a custom resource into a cluster summary
////////////////////////////////////////////////////////////////////////////////

Result XtraDBManager::summary (const picojson::value& resource,
                               ListXtraDBClustersResponse::Cluster* cluster) {
  const picojson::value& spec = jsonGet(resource, { "spec" });
  const picojson::value& status = jsonGet(resource, { "status" });

  cluster->set_name(jsonString(resource, { "metadata", "name" }));

  XtraDBClusterParams* params = cluster->mutable_params();
  params->set_cluster_size(static_cast<int32_t>(jsonInt(spec, { "pxc", "size" })));

  auto* pxc = params->mutable_pxc();
  int64_t diskSize = 0;

  Result res = readDiskSize(jsonGet(spec, { "pxc", "volumeSpec" }), diskSize);

  if (res.isError()) {
    return res;
  }

  pxc->set_image(jsonString(spec, { "pxc", "image" }));
  pxc->set_disk_size(diskSize);

  res = readComputeResources(jsonGet(spec, { "pxc", "resources" }),
                             pxc->mutable_compute_resources());

  if (res.isError()) {
    return res;
  }

  RunningOperation* operation = cluster->mutable_operation();
  operation->set_finished_steps(0);
  operation->set_total_steps(0);

  const picojson::value& conditions = jsonGet(status, { "conditions" });

  if (conditions.is<picojson::array>()
   && ! conditions.get<picojson::array>().empty()) {
    addSteps(operation, jsonGet(status, { "haproxy" }));
    addSteps(operation, jsonGet(status, { "proxysql" }));
    addSteps(operation, jsonGet(status, { "pxc" }));

    const picojson::value& messages = jsonGet(status, { "message" });
    vector<string> lines;

    if (messages.is<picojson::array>()) {
      for (const auto& m : messages.get<picojson::array>()) {
        if (m.is<string>()) {
          lines.push_back(m.get<string>());
        }
      }
    }

    operation->set_message(join(lines, ";"));
  }

  string serviceType;

  if (hasProxy(resource, "proxysql")) {
    auto* proxysql = params->mutable_proxysql();

    res = readDiskSize(jsonGet(spec, { "proxysql", "volumeSpec" }), diskSize);

    if (res.isError()) {
      return res;
    }

    proxysql->set_image(jsonString(spec, { "proxysql", "image" }));
    proxysql->set_disk_size(diskSize);

    res = readComputeResources(jsonGet(spec, { "proxysql", "resources" }),
                               proxysql->mutable_compute_resources());

    if (res.isError()) {
      return res;
    }

    serviceType = jsonString(spec, { "proxysql", "serviceType" });
  }
  else if (hasProxy(resource, "haproxy")) {
    auto* haproxy = params->mutable_haproxy();

    haproxy->set_image(jsonString(spec, { "haproxy", "image" }));

    res = readComputeResources(jsonGet(spec, { "haproxy", "resources" }),
                               haproxy->mutable_compute_resources());

    if (res.isError()) {
      return res;
    }

    serviceType = jsonString(spec, { "haproxy", "serviceType" });
  }

  cluster->set_exposed(! serviceType.empty() && serviceType != "ClusterIP");
  cluster->set_state(toDBClusterState(clusterState(resource)));

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief rejects negative limits of the database and the proxies
////////////////////////////////////////////////////////////////////////////////

Result XtraDBManager::checkResources (const XtraDBClusterParams& params) {
  Result res = checkComputeResources(params.pxc().compute_resources(), "pxc");

  if (res.isError()) {
    return res;
  }

  res = checkComputeResources(params.proxysql().compute_resources(), "proxysql");

  if (res.isError()) {
    return res;
  }

  return checkComputeResources(params.haproxy().compute_resources(), "haproxy");
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
