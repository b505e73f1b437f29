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

#include "KubernetesCluster.h"

#include "KubeCtl.h"
#include "utils.h"

#include <boost/algorithm/string.hpp>

#include <glog/logging.h>

#include <stout/numify.hpp>

using namespace dbaas;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                         constants
// -----------------------------------------------------------------------------

const string dbaas::XTRADB_API_GROUP = "pxc.percona.com";
const string dbaas::MONGODB_API_GROUP = "psmdb.percona.com";

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief parses a version like "v1-6-0"
////////////////////////////////////////////////////////////////////////////////

static bool parseOperatorVersion (const string& value, vector<int>& result) {
  if (value.empty() || value[0] != 'v') {
    return false;
  }

  string numbers = value.substr(1);
  vector<string> parts;
  boost::split(parts, numbers, boost::is_any_of("-"));

  if (parts.size() != 3) {
    return false;
  }

  result.clear();

  for (const auto& part : parts) {
    Try<int> n = numify<int>(part);

    if (n.isError() || n.get() < 0) {
      LOG(WARNING)
      << "cannot parse operator version '" << value << "'";
      return false;
    }

    result.push_back(n.get());
  }

  return true;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief guesses the cluster type from a list of storage classes
////////////////////////////////////////////////////////////////////////////////

KubernetesClusterType dbaas::clusterTypeFromStorageClasses (
    const picojson::value& classes) {
  const picojson::value& items = jsonGet(classes, { "items" });

  if (! items.is<picojson::array>()) {
    return KubernetesClusterType::UNKNOWN;
  }

  for (const auto& item : items.get<picojson::array>()) {
    string provisioner = jsonString(item, { "provisioner" });

    if (provisioner.find("aws") != string::npos) {
      return KubernetesClusterType::EKS;
    }

    if (provisioner.find("minikube") != string::npos
     || provisioner.find("kubevirt.io/hostpath-provisioner") != string::npos
     || provisioner.find("standard") != string::npos) {
      return KubernetesClusterType::MINIKUBE;
    }
  }

  return KubernetesClusterType::UNKNOWN;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief guesses the cluster type, UNKNOWN if the lookup fails
////////////////////////////////////////////////////////////////////////////////

KubernetesClusterType dbaas::clusterType (KubeCtl& kubectl) {
  picojson::value classes;
  Result res = kubectl.get("storageclasses", "", classes);

  if (res.isError()) {
    LOG(ERROR)
    << "failed to get kubernetes cluster type: " << res.message();
    return KubernetesClusterType::UNKNOWN;
  }

  return clusterTypeFromStorageClasses(classes);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief highest operator version of an api group
////////////////////////////////////////////////////////////////////////////////

string dbaas::latestOperatorVersion (const vector<string>& apiVersions,
                                     const string& group) {
  string prefix = group + "/";
  vector<int> latest;

  for (const auto& api : apiVersions) {
    if (! boost::starts_with(api, prefix)) {
      continue;
    }

    vector<int> version;

    if (! parseOperatorVersion(api.substr(prefix.size()), version)) {
      continue;
    }

    if (latest.empty() || latest < version) {
      latest = version;
    }
  }

  if (latest.empty()) {
    return "";
  }

  return to_string(latest[0]) + "." + to_string(latest[1]) + "."
       + to_string(latest[2]);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief reads the installed operator versions
////////////////////////////////////////////////////////////////////////////////

Result dbaas::checkOperators (KubeCtl& kubectl, OperatorVersions& operators) {
  string output;
  Result res = kubectl.run({ "api-versions" }, nullptr, output);

  if (res.isError()) {
    return res.wrap("can't get api versions list");
  }

  vector<string> apiVersions;
  boost::split(apiVersions, output, boost::is_any_of("\n"));

  for (auto& api : apiVersions) {
    boost::trim(api);
  }

  operators.xtradb = latestOperatorVersion(apiVersions, XTRADB_API_GROUP);
  operators.psmdb = latestOperatorVersion(apiVersions, MONGODB_API_GROUP);

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief api version of a custom resource for an operator version
////////////////////////////////////////////////////////////////////////////////

string dbaas::operatorApiVersion (const string& group, const string& version) {
  return group + "/v" + boost::replace_all_copy(version, ".", "-");
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
