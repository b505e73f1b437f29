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

#include "ClusterManager.h"

#include "DeletionTracker.h"
#include "Global.h"
#include "KubeCtl.h"
#include "Secrets.h"
#include "Units.h"
#include "utils.h"

#include <limits>
#include <set>

#include <glog/logging.h>

using namespace dbaas;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief converts a cluster state into its wire representation
////////////////////////////////////////////////////////////////////////////////

DBClusterState dbaas::toDBClusterState (ClusterState state) {
  switch (state) {
    case ClusterState::INVALID:   return DB_CLUSTER_STATE_INVALID;
    case ClusterState::CHANGING:  return DB_CLUSTER_STATE_CHANGING;
    case ClusterState::READY:     return DB_CLUSTER_STATE_READY;
    case ClusterState::FAILED:    return DB_CLUSTER_STATE_FAILED;
    case ClusterState::DELETING:  return DB_CLUSTER_STATE_DELETING;
    case ClusterState::PAUSED:    return DB_CLUSTER_STATE_PAUSED;
    case ClusterState::UPGRADING: return DB_CLUSTER_STATE_UPGRADING;
  }

  return DB_CLUSTER_STATE_INVALID;
}

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief constructor
////////////////////////////////////////////////////////////////////////////////

ClusterManager::ClusterManager (KubeCtl& kubectl)
  : _kubectl(kubectl) {
}

////////////////////////////////////////////////////////////////////////////////
/// @brief destructor
////////////////////////////////////////////////////////////////////////////////

ClusterManager::~ClusterManager () {
}

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief state of a custom resource
////////////////////////////////////////////////////////////////////////////////

ClusterState ClusterManager::clusterState (const picojson::value& resource) {
  ClusterState state = classify(appState(resource),
                                jsonBool(resource, { "spec", "pause" }),
                                memberStates(resource));

  if (state != ClusterState::CHANGING) {
    return state;
  }

  string name = jsonString(resource, { "metadata", "name" });
  bool match = true;
  Result res = podsMatchImage(name, image(resource), match);

  if (res.isError()) {
    LOG(WARNING)
    << "failed to check if cluster '" << name << "' is upgrading: "
    << res.message();

    return ClusterState::INVALID;
  }

  return match ? ClusterState::CHANGING : ClusterState::UPGRADING;
}

// -----------------------------------------------------------------------------
// --SECTION--                                         virtual protected methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief states of the replica set members, if reported
////////////////////////////////////////////////////////////////////////////////

Option<vector<string>> ClusterManager::memberStates (
    const picojson::value&) const {
  return None();
}

// -----------------------------------------------------------------------------
// --SECTION--                                                 protected methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief fetches the custom resource of a cluster
////////////////////////////////////////////////////////////////////////////////

Result ClusterManager::getCluster (const string& name,
                                   picojson::value& resource) {

  // an empty name would list all clusters of the kind
  Result res = checkName(name);

  if (res.isError()) {
    return res;
  }

  return _kubectl.get(kind(), name, resource);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief fails with ALREADY_EXISTS if the cluster exists
////////////////////////////////////////////////////////////////////////////////

Result ClusterManager::checkAbsent (const string& name) {
  picojson::value resource;
  Result res = getCluster(name, resource);

  if (res.is(ErrorCode::NOT_FOUND)) {
    return Result::noError();
  }

  if (res.isError()) {
    return res;
  }

  return Result::error(ErrorCode::ALREADY_EXISTS,
                       "Cluster '" + name + "' already exists");
}

////////////////////////////////////////////////////////////////////////////////
/// @brief lists the custom resources and the clusters being deleted
////////////////////////////////////////////////////////////////////////////////

Result ClusterManager::listClusters (picojson::array& resources,
                                     vector<string>& deleting) {
  picojson::value list;
  Result res = _kubectl.get(kind(), "", list);

  if (res.isError()) {
    return res.wrap("couldn't get " + documentKind() + " clusters");
  }

  const picojson::value& items = jsonGet(list, { "items" });

  if (items.is<picojson::array>()) {
    resources = items.get<picojson::array>();
  }
  else {
    resources.clear();
  }

  set<string> known;

  for (const auto& resource : resources) {
    known.insert(jsonString(resource, { "metadata", "name" }));
  }

  res = findDeleting(_kubectl, managedBy(), known, deleting);

  if (res.isError()) {
    return res.wrap("cannot get deleting clusters");
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief reads the operator version, NOT_READY if not installed
////////////////////////////////////////////////////////////////////////////////

Result ClusterManager::operatorVersion (string& version) {
  OperatorVersions operators;
  Result res = checkOperators(_kubectl, operators);

  if (res.isError()) {
    return res;
  }

  version = (apiGroup() == XTRADB_API_GROUP) ? operators.xtradb
                                             : operators.psmdb;

  if (version.empty()) {
    return Result::error(ErrorCode::NOT_READY,
                         "operator for " + apiGroup() + " is not installed");
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief fresh custom resource document
////////////////////////////////////////////////////////////////////////////////

picojson::value ClusterManager::newDocument (const string& name,
                                             const string& version,
                                             const vector<string>& finalizers) {
  picojson::value doc;

  jsonSet(doc, { "apiVersion" }) =
    picojson::value(operatorApiVersion(apiGroup(), version));
  jsonSet(doc, { "kind" }) = picojson::value(documentKind());
  jsonSet(doc, { "metadata", "name" }) = picojson::value(name);

  picojson::array list;

  for (const auto& f : finalizers) {
    list.push_back(picojson::value(f));
  }

  jsonSet(doc, { "metadata", "finalizers" }) = picojson::value(list);

  return doc;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief prepares a fetched custom resource to be applied again
////////////////////////////////////////////////////////////////////////////////

void ClusterManager::prepareUpdate (picojson::value& resource) {
  jsonSet(resource, { "apiVersion" }) = picojson::value(apiGroup() + "/v1");
  jsonSet(resource, { "kind" }) = picojson::value(documentKind());

  resource.get<picojson::object>().erase("status");

  // no optimistic locking, updates are guarded by the cluster state
  picojson::value& metadata = jsonSet(resource, { "metadata" });

  if (metadata.is<picojson::object>()) {
    auto& m = metadata.get<picojson::object>();

    m.erase("resourceVersion");
    m.erase("managedFields");
    m.erase("generation");
    m.erase("uid");
    m.erase("creationTimestamp");
  }
}

////////////////////////////////////////////////////////////////////////////////
/// @brief deletes the custom resource and, best effort, its secrets
////////////////////////////////////////////////////////////////////////////////

Result ClusterManager::deleteCluster (const string& name,
                                      const vector<string>& secrets) {
  picojson::value doc;

  jsonSet(doc, { "apiVersion" }) = picojson::value(apiGroup() + "/v1");
  jsonSet(doc, { "kind" }) = picojson::value(documentKind());
  jsonSet(doc, { "metadata", "name" }) = picojson::value(name);

  Result res = _kubectl.remove(doc);

  if (res.isError()) {
    return res.wrap("cannot delete " + documentKind());
  }

  // the cluster is gone once the resource is deleted, left-over secrets
  // do not change that
  deleteSecrets(_kubectl, secrets);

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief restarts a stateful set
////////////////////////////////////////////////////////////////////////////////

Result ClusterManager::restartStatefulSet (const string& name, bool optional) {
  if (optional) {
    picojson::value statefulSet;
    Result res = _kubectl.get("statefulset", name, statefulSet);

    if (res.isError()) {
      return res;
    }
  }

  string output;
  return _kubectl.run({ "rollout", "restart", "StatefulSets", name },
                      nullptr,
                      output);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief checks whether the pods run the image of the custom resource
////////////////////////////////////////////////////////////////////////////////

Result ClusterManager::podsMatchImage (const string& name,
                                       const string& image,
                                       bool& match) {
  picojson::value pods;
  Result res = _kubectl.getSelected("pods", INSTANCE_LABEL + "=" + name, pods);

  if (res.isError()) {
    return res;
  }

  const picojson::value& items = jsonGet(pods, { "items" });

  if (! items.is<picojson::array>() || items.get<picojson::array>().empty()) {
    match = true;
    return Result::noError();
  }

  set<string> images;
  string container = dataContainer();

  for (const auto& pod : items.get<picojson::array>()) {
    const picojson::value& containers = jsonGet(pod, { "spec", "containers" });

    if (! containers.is<picojson::array>()) {
      continue;
    }

    for (const auto& c : containers.get<picojson::array>()) {
      if (jsonString(c, { "name" }) == container) {
        string i = jsonString(c, { "image" });

        if (! i.empty()) {
          images.insert(i);
        }
      }
    }
  }

  match = images.size() == 1 && *images.begin() == image;
  return Result::noError();
}

// -----------------------------------------------------------------------------
// --SECTION--                                          static protected methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief rejects an empty cluster name
////////////////////////////////////////////////////////////////////////////////

Result ClusterManager::checkName (const string& name) {
  if (name.empty()) {
    return Result::invalidArgument("cluster name must not be empty");
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief rejects negative limits
////////////////////////////////////////////////////////////////////////////////

Result ClusterManager::checkComputeResources (const ComputeResources& compute,
                                              const string& what) {
  if (compute.cpu_m() < 0) {
    return Result::invalidArgument(what + " cpu must not be negative");
  }

  if (compute.memory_bytes() < 0) {
    return Result::invalidArgument(what + " memory must not be negative");
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief sets the limits of a new resource block
////////////////////////////////////////////////////////////////////////////////

void ClusterManager::setComputeResources (picojson::value& resources,
                                          const ComputeResources& compute) {
  if (compute.cpu_m() > 0) {
    jsonSet(resources, { "limits", "cpu" }) =
      picojson::value(stringFromMilliCPU(compute.cpu_m()));
  }

  if (compute.memory_bytes() > 0) {
    jsonSet(resources, { "limits", "memory" }) =
      picojson::value(stringFromBytes(compute.memory_bytes()));
  }
}

////////////////////////////////////////////////////////////////////////////////
/// @brief changes the limits of an existing resource block
////////////////////////////////////////////////////////////////////////////////

void ClusterManager::updateComputeResources (picojson::value& resources,
                                             const ComputeResources& compute) {
  picojson::value& limits = jsonSet(resources, { "limits" });

  if (! limits.is<picojson::object>()) {
    limits = picojson::value(picojson::object());
  }

  auto& l = limits.get<picojson::object>();

  if (compute.has_cpu_m()) {
    if (compute.cpu_m() > 0) {
      l["cpu"] = picojson::value(stringFromMilliCPU(compute.cpu_m()));
    }
    else {
      l.erase("cpu");
    }
  }

  if (compute.has_memory_bytes()) {
    if (compute.memory_bytes() > 0) {
      l["memory"] = picojson::value(stringFromBytes(compute.memory_bytes()));
    }
    else {
      l.erase("memory");
    }
  }
}

////////////////////////////////////////////////////////////////////////////////
/// @brief reads the limits of a resource block
////////////////////////////////////////////////////////////////////////////////

Result ClusterManager::readComputeResources (const picojson::value& resources,
                                             ComputeResources* compute) {
  string cpu = jsonString(resources, { "limits", "cpu" });

  if (! cpu.empty()) {
    Try<uint64_t> millis = milliCPUFromString(cpu);

    if (millis.isError()) {
      return Result::internalError("cannot parse cpu limit: " + millis.error());
    }

    if (millis.get() > static_cast<uint64_t>(numeric_limits<int32_t>::max())) {
      return Result::internalError("cpu limit '" + cpu + "' is out of range");
    }

    compute->set_cpu_m(static_cast<int32_t>(millis.get()));
  }

  string memory = jsonString(resources, { "limits", "memory" });

  if (! memory.empty()) {
    Try<uint64_t> bytes = bytesFromString(memory);

    if (bytes.isError()) {
      return Result::internalError(
        "cannot parse memory limit: " + bytes.error());
    }

    if (bytes.get() > static_cast<uint64_t>(numeric_limits<int64_t>::max())) {
      return Result::internalError(
        "memory limit '" + memory + "' is out of range");
    }

    compute->set_memory_bytes(static_cast<int64_t>(bytes.get()));
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief persistent volume claim of the given size
////////////////////////////////////////////////////////////////////////////////

picojson::value ClusterManager::volumeSpec (int64_t diskSize) {
  picojson::value volume;

  jsonSet(volume, { "persistentVolumeClaim", "resources", "requests", "storage" })
    = picojson::value(stringFromBytes(static_cast<uint64_t>(diskSize)));

  return volume;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief reads the size of a persistent volume claim, 0 if missing
////////////////////////////////////////////////////////////////////////////////

Result ClusterManager::readDiskSize (const picojson::value& volume,
                                     int64_t& diskSize) {
  string storage = jsonString(
    volume,
    { "persistentVolumeClaim", "resources", "requests", "storage" },
    "0");

  Try<uint64_t> bytes = bytesFromString(storage);

  if (bytes.isError()) {
    return Result::internalError("cannot parse disk size: " + bytes.error());
  }

  diskSize = static_cast<int64_t>(bytes.get());
  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief monitoring client block
////////////////////////////////////////////////////////////////////////////////

picojson::value ClusterManager::pmmSpec (const PMMParams& pmm, bool withUser) {
  picojson::value spec;

  jsonSet(spec, { "enabled" }) = picojson::value(true);
  jsonSet(spec, { "serverHost" }) = picojson::value(pmm.public_address());

  if (withUser) {
    jsonSet(spec, { "serverUser" }) = picojson::value(pmm.login());
  }

  jsonSet(spec, { "image" }) = picojson::value(Global::pmmClientImage());
  jsonSet(spec, { "resources", "requests", "memory" }) = picojson::value("300M");
  jsonSet(spec, { "resources", "requests", "cpu" }) = picojson::value("500m");

  return spec;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief checks an image upgrade, only the tag may change
////////////////////////////////////////////////////////////////////////////////

Result ClusterManager::validateImage (const string& current,
                                      const string& next) {
  vector<string> nextParts = split(next, ':');

  if (nextParts.size() != 2) {
    return Result::invalidArgument("image has to have version tag");
  }

  vector<string> currentParts = split(current, ':');
  string currentTag = currentParts.size() > 1 ? currentParts[1] : "";

  if (currentParts[0] != nextParts[0]) {
    return Result::invalidArgument(
      "expected image is \"" + currentParts[0] + "\", \""
      + nextParts[0] + "\" was given");
  }

  if (currentTag == nextParts[1]) {
    return Result::invalidArgument(
      "failed to change image: the database version \""
      + nextParts[1] + "\" is already in use");
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief adds the ready and total counts to the operation
////////////////////////////////////////////////////////////////////////////////

void ClusterManager::addSteps (RunningOperation* operation,
                               const picojson::value& status) {
  operation->set_finished_steps(operation->finished_steps()
                                + static_cast<int32_t>(jsonInt(status, { "ready" })));
  operation->set_total_steps(operation->total_steps()
                             + static_cast<int32_t>(jsonInt(status, { "size" })));
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
