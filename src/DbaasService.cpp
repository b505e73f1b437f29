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

#include "DbaasService.h"

#include "Global.h"
#include "KubeCtl.h"
#include "KubernetesCluster.h"
#include "LogsSource.h"
#include "MongoDBManager.h"
#include "XtraDBManager.h"

#include <glog/logging.h>

#include <chrono>

using namespace dbaas;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief creates a kubectl process client limited by the request timeout
////////////////////////////////////////////////////////////////////////////////

static Result processFactory (const string& kubeconfig,
                              unique_ptr<KubeCtl>& kubectl) {
  auto deadline = chrono::steady_clock::now()
                + chrono::seconds(Global::requestTimeout());

  unique_ptr<KubeCtlProcess> process(new KubeCtlProcess(kubeconfig, deadline));
  Result res = process->init();

  if (res.isError()) {
    return res;
  }

  kubectl = std::move(process);
  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief a cluster is addressed by a non-empty name
////////////////////////////////////////////////////////////////////////////////

static Result checkClusterName (const string& name) {
  if (name.empty()) {
    return Result::invalidArgument("cluster name must not be empty");
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief suspend and resume exclude each other
////////////////////////////////////////////////////////////////////////////////

static Result checkSuspendResume (bool suspend, bool resume) {
  if (suspend && resume) {
    return Result::invalidArgument(
      "resume and suspend cannot be set together");
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief operator status for the wire
////////////////////////////////////////////////////////////////////////////////

static void setOperator (Operator* op, const string& version) {
  op->set_version(version);
  op->set_status(version.empty() ? OPERATORS_STATUS_NOT_INSTALLED
                                 : OPERATORS_STATUS_OK);
}

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

DbaasService::DbaasService ()
  : _factory(&processFactory) {
}

DbaasService::DbaasService (KubeCtlFactory factory)
  : _factory(std::move(factory)) {
}

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

// .............................................................................
// XtraDB clusters
// .............................................................................

Result DbaasService::listXtraDBClusters (const ListXtraDBClustersRequest& request,
                                         ListXtraDBClustersResponse* response) {
  unique_ptr<KubeCtl> kubectl;
  Result res = connect(request.kube_auth(), kubectl);

  if (res.isError()) {
    return res;
  }

  XtraDBManager manager(*kubectl);
  return manager.list(response);
}

Result DbaasService::createXtraDBCluster (const CreateXtraDBClusterRequest& request,
                                          CreateXtraDBClusterResponse*) {
  Result res = checkClusterName(request.name());

  if (res.isError()) {
    return res;
  }

  unique_ptr<KubeCtl> kubectl;
  res = connect(request.kube_auth(), kubectl);

  if (res.isError()) {
    return res;
  }

  XtraDBManager manager(*kubectl);
  return manager.create(request);
}

Result DbaasService::updateXtraDBCluster (const UpdateXtraDBClusterRequest& request,
                                          UpdateXtraDBClusterResponse*) {
  Result res = checkClusterName(request.name());

  if (res.isError()) {
    return res;
  }

  res = checkSuspendResume(request.params().suspend(),
                           request.params().resume());

  if (res.isError()) {
    return res;
  }

  unique_ptr<KubeCtl> kubectl;
  res = connect(request.kube_auth(), kubectl);

  if (res.isError()) {
    return res;
  }

  XtraDBManager manager(*kubectl);
  return manager.update(request);
}

Result DbaasService::deleteXtraDBCluster (const DeleteXtraDBClusterRequest& request,
                                          DeleteXtraDBClusterResponse*) {
  Result res = checkClusterName(request.name());

  if (res.isError()) {
    return res;
  }

  unique_ptr<KubeCtl> kubectl;
  res = connect(request.kube_auth(), kubectl);

  if (res.isError()) {
    return res;
  }

  XtraDBManager manager(*kubectl);
  return manager.remove(request.name());
}

Result DbaasService::restartXtraDBCluster (const RestartXtraDBClusterRequest& request,
                                           RestartXtraDBClusterResponse*) {
  Result res = checkClusterName(request.name());

  if (res.isError()) {
    return res;
  }

  unique_ptr<KubeCtl> kubectl;
  res = connect(request.kube_auth(), kubectl);

  if (res.isError()) {
    return res;
  }

  XtraDBManager manager(*kubectl);
  return manager.restart(request.name());
}

Result DbaasService::getXtraDBClusterCredentials (
    const GetXtraDBClusterCredentialsRequest& request,
    GetXtraDBClusterCredentialsResponse* response) {
  Result res = checkClusterName(request.name());

  if (res.isError()) {
    return res;
  }

  unique_ptr<KubeCtl> kubectl;
  res = connect(request.kube_auth(), kubectl);

  if (res.isError()) {
    return res;
  }

  XtraDBManager manager(*kubectl);
  return manager.credentials(request.name(), response->mutable_credentials());
}

// .............................................................................
// MongoDB clusters
// .............................................................................

Result DbaasService::listMongoDBClusters (const ListMongoDBClustersRequest& request,
                                          ListMongoDBClustersResponse* response) {
  unique_ptr<KubeCtl> kubectl;
  Result res = connect(request.kube_auth(), kubectl);

  if (res.isError()) {
    return res;
  }

  MongoDBManager manager(*kubectl);
  return manager.list(response);
}

Result DbaasService::createMongoDBCluster (const CreateMongoDBClusterRequest& request,
                                           CreateMongoDBClusterResponse*) {
  Result res = checkClusterName(request.name());

  if (res.isError()) {
    return res;
  }

  unique_ptr<KubeCtl> kubectl;
  res = connect(request.kube_auth(), kubectl);

  if (res.isError()) {
    return res;
  }

  MongoDBManager manager(*kubectl);
  return manager.create(request);
}

Result DbaasService::updateMongoDBCluster (const UpdateMongoDBClusterRequest& request,
                                           UpdateMongoDBClusterResponse*) {
  Result res = checkClusterName(request.name());

  if (res.isError()) {
    return res;
  }

  res = checkSuspendResume(request.params().suspend(),
                           request.params().resume());

  if (res.isError()) {
    return res;
  }

  unique_ptr<KubeCtl> kubectl;
  res = connect(request.kube_auth(), kubectl);

  if (res.isError()) {
    return res;
  }

  MongoDBManager manager(*kubectl);
  return manager.update(request);
}

Result DbaasService::deleteMongoDBCluster (const DeleteMongoDBClusterRequest& request,
                                           DeleteMongoDBClusterResponse*) {
  Result res = checkClusterName(request.name());

  if (res.isError()) {
    return res;
  }

  unique_ptr<KubeCtl> kubectl;
  res = connect(request.kube_auth(), kubectl);

  if (res.isError()) {
    return res;
  }

  MongoDBManager manager(*kubectl);
  return manager.remove(request.name());
}

Result DbaasService::restartMongoDBCluster (const RestartMongoDBClusterRequest& request,
                                            RestartMongoDBClusterResponse*) {
  Result res = checkClusterName(request.name());

  if (res.isError()) {
    return res;
  }

  unique_ptr<KubeCtl> kubectl;
  res = connect(request.kube_auth(), kubectl);

  if (res.isError()) {
    return res;
  }

  MongoDBManager manager(*kubectl);
  return manager.restart(request.name());
}

Result DbaasService::getMongoDBClusterCredentials (
    const GetMongoDBClusterCredentialsRequest& request,
    GetMongoDBClusterCredentialsResponse* response) {
  Result res = checkClusterName(request.name());

  if (res.isError()) {
    return res;
  }

  unique_ptr<KubeCtl> kubectl;
  res = connect(request.kube_auth(), kubectl);

  if (res.isError()) {
    return res;
  }

  MongoDBManager manager(*kubectl);
  return manager.credentials(request.name(), response->mutable_credentials());
}

// .............................................................................
// Kubernetes clusters
// .............................................................................

////////////////////////////////////////////////////////////////////////////////
/// @brief checks that the cluster answers and reports the operators
////////////////////////////////////////////////////////////////////////////////

Result DbaasService::checkConnection (
    const CheckKubernetesClusterConnectionRequest& request,
    CheckKubernetesClusterConnectionResponse* response) {
  static const string context = "Unable to connect to Kubernetes cluster";

  unique_ptr<KubeCtl> kubectl;
  Result res = connect(request.kube_auth(), kubectl);

  if (res.isError()) {
    return Result::error(ErrorCode::NOT_READY, context + ": " + res.message());
  }

  string output;
  res = kubectl->run({ "version", "-o", "json" }, nullptr, output);

  if (res.isError()) {
    return Result::error(ErrorCode::NOT_READY, context + ": " + res.message());
  }

  OperatorVersions operators;
  res = checkOperators(*kubectl, operators);

  if (res.isError()) {
    return res;
  }

  setOperator(response->mutable_operators()->mutable_xtradb(), operators.xtradb);
  setOperator(response->mutable_operators()->mutable_psmdb(), operators.psmdb);

  return Result::noError();
}

// .............................................................................
// logs
// .............................................................................

Result DbaasService::getLogs (const GetLogsRequest& request,
                              GetLogsResponse* response) {
  Result res = checkClusterName(request.cluster_name());

  if (res.isError()) {
    return res;
  }

  unique_ptr<KubeCtl> kubectl;
  res = connect(request.kube_auth(), kubectl);

  if (res.isError()) {
    return res;
  }

  res = collectLogs(*kubectl,
                    LogsSourceType::ALL_LOGS,
                    request.cluster_name(),
                    response->mutable_logs());

  if (res.isError()) {
    return Result::internalError(res.wrap("failed to get logs").message());
  }

  return Result::noError();
}

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief builds the client of a request
////////////////////////////////////////////////////////////////////////////////

Result DbaasService::connect (const KubeAuth& auth,
                              unique_ptr<KubeCtl>& kubectl) {
  if (auth.kubeconfig().empty()) {
    return Result::invalidArgument("kubeconfig must not be empty");
  }

  Result res = _factory(auth.kubeconfig(), kubectl);

  if (res.isError()) {
    LOG(WARNING) << "cannot create kubectl client: " << res.message();
    return res;
  }

  return Result::noError();
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
