////////////////////////////////////////////////////////////////////////////////
/// @brief tests of the rpc operations
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

#include <gtest/gtest.h>

#include "DbaasService.h"
#include "utils/MockKubeCtl.h"

using namespace dbaas;
using namespace dbaas::test;
using namespace std;

using ::testing::NiceMock;

// -----------------------------------------------------------------------------
// --SECTION--                                                          fixtures
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief client handed out per request, answers from a shared script
////////////////////////////////////////////////////////////////////////////////

class ForwardingKubeCtl : public KubeCtl {
  public:
    explicit ForwardingKubeCtl (KubeCtl& target)
      : _target(target) {
    }

    Result run (const vector<string>& args,
                const picojson::value* input,
                string& output) override {
      return _target.run(args, input, output);
    }

  private:
    KubeCtl& _target;
};

class DbaasServiceTest : public ::testing::Test {
  protected:
    DbaasServiceTest ()
      : connects(0),
        service([this] (const string& kubeconfig, unique_ptr<KubeCtl>& kubectl) {
          ++connects;
          lastKubeconfig = kubeconfig;

          if (! connectError.empty()) {
            return Result::internalError(connectError);
          }

          kubectl.reset(new ForwardingKubeCtl(this->kubectl));
          return Result::noError();
        }) {
      kubectl.respond("api-versions",
                      "apps/v1\npxc.percona.com/v1-6-0\npxc.percona.com/v1\n");
      kubectl.respond("get -o=json pods", R"({"items": []})");
    }

    KubeAuth auth () const {
      KubeAuth a;
      a.set_kubeconfig("apiVersion: v1");
      return a;
    }

    NiceMock<MockKubeCtl> kubectl;
    int connects;
    string lastKubeconfig;
    string connectError;
    DbaasService service;
};

// -----------------------------------------------------------------------------
// --SECTION--                                                       connections
// -----------------------------------------------------------------------------

TEST_F(DbaasServiceTest, EmptyKubeconfig) {
  ListXtraDBClustersRequest request;
  ListXtraDBClustersResponse response;

  Result res = service.listXtraDBClusters(request, &response);

  EXPECT_TRUE(res.is(ErrorCode::INVALID_ARGUMENT));
  EXPECT_EQ(0, connects);
}

TEST_F(DbaasServiceTest, ClientPerRequest) {
  ListXtraDBClustersRequest request;
  *request.mutable_kube_auth() = auth();
  kubectl.respond("get -o=json perconaxtradbcluster", R"({"items": []})");

  ListXtraDBClustersResponse response;
  ASSERT_FALSE(service.listXtraDBClusters(request, &response).isError());
  ASSERT_FALSE(service.listXtraDBClusters(request, &response).isError());

  EXPECT_EQ(2, connects);
  EXPECT_EQ("apiVersion: v1", lastKubeconfig);
}

TEST_F(DbaasServiceTest, FactoryFailure) {
  connectError = "no kubectl for server version";

  DeleteMongoDBClusterRequest request;
  *request.mutable_kube_auth() = auth();
  request.set_name("mongo");

  DeleteMongoDBClusterResponse response;
  Result res = service.deleteMongoDBCluster(request, &response);

  EXPECT_TRUE(res.is(ErrorCode::INTERNAL));
  EXPECT_TRUE(kubectl.commands.empty());
}

TEST_F(DbaasServiceTest, EmptyClusterName) {
  UpdateXtraDBClusterRequest update;
  *update.mutable_kube_auth() = auth();
  update.mutable_params()->set_cluster_size(3);

  UpdateXtraDBClusterResponse updateResponse;
  Result res = service.updateXtraDBCluster(update, &updateResponse);

  EXPECT_TRUE(res.is(ErrorCode::INVALID_ARGUMENT));
  EXPECT_EQ("cluster name must not be empty", res.message());

  RestartMongoDBClusterRequest restart;
  *restart.mutable_kube_auth() = auth();

  RestartMongoDBClusterResponse restartResponse;
  EXPECT_TRUE(service.restartMongoDBCluster(restart, &restartResponse)
              .is(ErrorCode::INVALID_ARGUMENT));

  GetXtraDBClusterCredentialsRequest credentials;
  *credentials.mutable_kube_auth() = auth();

  GetXtraDBClusterCredentialsResponse credentialsResponse;
  EXPECT_TRUE(service.getXtraDBClusterCredentials(credentials, &credentialsResponse)
              .is(ErrorCode::INVALID_ARGUMENT));

  GetLogsRequest logs;
  *logs.mutable_kube_auth() = auth();

  GetLogsResponse logsResponse;
  EXPECT_TRUE(service.getLogs(logs, &logsResponse).is(ErrorCode::INVALID_ARGUMENT));

  EXPECT_EQ(0, connects);
  EXPECT_TRUE(kubectl.commands.empty());
}

// -----------------------------------------------------------------------------
// --SECTION--                                                           updates
// -----------------------------------------------------------------------------

TEST_F(DbaasServiceTest, SuspendAndResumeTogether) {
  UpdateXtraDBClusterRequest xtradb;
  *xtradb.mutable_kube_auth() = auth();
  xtradb.set_name("db1");
  xtradb.mutable_params()->set_suspend(true);
  xtradb.mutable_params()->set_resume(true);

  UpdateXtraDBClusterResponse xtradbResponse;
  Result res = service.updateXtraDBCluster(xtradb, &xtradbResponse);

  EXPECT_TRUE(res.is(ErrorCode::INVALID_ARGUMENT));
  EXPECT_EQ("resume and suspend cannot be set together", res.message());

  UpdateMongoDBClusterRequest mongodb;
  *mongodb.mutable_kube_auth() = auth();
  mongodb.set_name("mongo");
  mongodb.mutable_params()->set_suspend(true);
  mongodb.mutable_params()->set_resume(true);

  UpdateMongoDBClusterResponse mongodbResponse;
  EXPECT_TRUE(service.updateMongoDBCluster(mongodb, &mongodbResponse)
              .is(ErrorCode::INVALID_ARGUMENT));

  EXPECT_EQ(0, connects);
}

TEST_F(DbaasServiceTest, UpdateMissingCluster) {
  UpdateXtraDBClusterRequest request;
  *request.mutable_kube_auth() = auth();
  request.set_name("db1");
  request.mutable_params()->set_cluster_size(3);

  UpdateXtraDBClusterResponse response;
  EXPECT_TRUE(service.updateXtraDBCluster(request, &response)
              .is(ErrorCode::NOT_FOUND));
}

// -----------------------------------------------------------------------------
// --SECTION--                                                  other operations
// -----------------------------------------------------------------------------

TEST_F(DbaasServiceTest, CreateMongoDBWithoutOperator) {
  CreateMongoDBClusterRequest request;
  *request.mutable_kube_auth() = auth();
  request.set_name("mongo");
  request.mutable_params()->set_cluster_size(3);
  request.mutable_params()->mutable_replicaset()->set_disk_size(1073741824);

  CreateMongoDBClusterResponse response;
  Result res = service.createMongoDBCluster(request, &response);

  EXPECT_TRUE(res.is(ErrorCode::NOT_READY));
  EXPECT_TRUE(kubectl.applied.empty());
}

TEST_F(DbaasServiceTest, RestartXtraDB) {
  RestartXtraDBClusterRequest request;
  *request.mutable_kube_auth() = auth();
  request.set_name("db1");

  RestartXtraDBClusterResponse response;
  ASSERT_FALSE(service.restartXtraDBCluster(request, &response).isError());
  EXPECT_TRUE(kubectl.called("rollout restart StatefulSets db1-pxc"));
}

TEST_F(DbaasServiceTest, CredentialsOfMissingCluster) {
  GetXtraDBClusterCredentialsRequest request;
  *request.mutable_kube_auth() = auth();
  request.set_name("db1");

  GetXtraDBClusterCredentialsResponse response;
  Result res = service.getXtraDBClusterCredentials(request, &response);

  EXPECT_TRUE(res.is(ErrorCode::NOT_FOUND));
  EXPECT_FALSE(response.has_credentials() && response.credentials().has_host());
}

TEST_F(DbaasServiceTest, CheckConnection) {
  kubectl.respond("version -o json", R"({"serverVersion": {"minor": "18"}})");

  CheckKubernetesClusterConnectionRequest request;
  *request.mutable_kube_auth() = auth();

  CheckKubernetesClusterConnectionResponse response;
  Result res = service.checkConnection(request, &response);

  ASSERT_FALSE(res.isError()) << res.message();
  EXPECT_EQ(OPERATORS_STATUS_OK, response.operators().xtradb().status());
  EXPECT_EQ("1.6.0", response.operators().xtradb().version());
  EXPECT_EQ(OPERATORS_STATUS_NOT_INSTALLED, response.operators().psmdb().status());
  EXPECT_EQ("", response.operators().psmdb().version());
}

TEST_F(DbaasServiceTest, CheckConnectionUnreachable) {
  kubectl.fail("version -o json", ErrorCode::INTERNAL,
               "Unable to connect to the server: dial tcp: i/o timeout");

  CheckKubernetesClusterConnectionRequest request;
  *request.mutable_kube_auth() = auth();

  CheckKubernetesClusterConnectionResponse response;
  Result res = service.checkConnection(request, &response);

  EXPECT_TRUE(res.is(ErrorCode::NOT_READY));
  EXPECT_EQ("Unable to connect to Kubernetes cluster: "
            "Unable to connect to the server: dial tcp: i/o timeout",
            res.message());
  EXPECT_FALSE(kubectl.called("api-versions"));
}

TEST_F(DbaasServiceTest, CheckConnectionFactoryFailure) {
  connectError = "invalid kubeconfig";

  CheckKubernetesClusterConnectionRequest request;
  *request.mutable_kube_auth() = auth();

  CheckKubernetesClusterConnectionResponse response;
  Result res = service.checkConnection(request, &response);

  EXPECT_TRUE(res.is(ErrorCode::NOT_READY));
  EXPECT_EQ("Unable to connect to Kubernetes cluster: invalid kubeconfig",
            res.message());
}

TEST_F(DbaasServiceTest, GetLogs) {
  kubectl.respond("get -o=json pods -l app.kubernetes.io/instance=db1", R"({"items": [
    { "metadata": { "name": "db1-pxc-0" },
      "spec": { "containers": [ { "name": "pxc" } ] } }
  ]})");
  kubectl.respond("logs db1-pxc-0 -c pxc --tail=3000", "line 1\nline 2");
  kubectl.respond(
    "get -o=json events --field-selector=involvedObject.name=db1-pxc-0",
    R"({"items": []})");

  GetLogsRequest request;
  *request.mutable_kube_auth() = auth();
  request.set_cluster_name("db1");

  GetLogsResponse response;
  Result res = service.getLogs(request, &response);

  ASSERT_FALSE(res.isError()) << res.message();
  ASSERT_EQ(2, response.logs_size());
  EXPECT_EQ("pxc", response.logs(0).container());
  EXPECT_EQ(2, response.logs(0).logs_size());
  EXPECT_EQ("Events:\t<none>", response.logs(1).logs(0));
}

TEST_F(DbaasServiceTest, GetLogsFailure) {
  kubectl.fail("get -o=json pods -l app.kubernetes.io/instance=db1",
               ErrorCode::NOT_FOUND, "namespace gone");

  GetLogsRequest request;
  *request.mutable_kube_auth() = auth();
  request.set_cluster_name("db1");

  GetLogsResponse response;
  Result res = service.getLogs(request, &response);

  EXPECT_TRUE(res.is(ErrorCode::INTERNAL));
  EXPECT_EQ("failed to get logs: failed to get pods: namespace gone",
            res.message());
}
