////////////////////////////////////////////////////////////////////////////////
/// @brief tests of the MongoDB cluster manager
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

#include "MongoDBManager.h"
#include "utils/MockKubeCtl.h"

using namespace dbaas;
using namespace dbaas::test;
using namespace std;

using ::testing::NiceMock;

// -----------------------------------------------------------------------------
// --SECTION--                                                          fixtures
// -----------------------------------------------------------------------------

static const string GET_CLUSTER = "get -o=json perconaservermongodb mongo";
static const string GET_PODS = "get -o=json pods -l app.kubernetes.io/instance=mongo";

static string cluster (const string& state,
                       int size = 3,
                       const string& replsetState = "ready") {
  return R"({
    "apiVersion": "psmdb.percona.com/v1-6-0",
    "kind": "PerconaServerMongoDB",
    "metadata": { "name": "mongo", "resourceVersion": "17" },
    "spec": {
      "image": "percona/percona-server-mongodb:4.2.8-8",
      "backup": { "image": "percona/percona-server-mongodb-operator:1.6.0-backup" },
      "sharding": { "mongos": { "expose": { "exposeType": "ClusterIP" } } },
      "replsets": [ {
        "name": "rs0",
        "size": )" + to_string(size) + R"(,
        "expose": { "enabled": true },
        "volumeSpec": { "persistentVolumeClaim": { "resources": {
          "requests": { "storage": "2Gi" } } } },
        "resources": { "limits": { "cpu": "1", "memory": "512Mi" } }
      } ]
    },
    "status": {
      "state": ")" + state + R"(",
      "host": "mongo-rs0.default",
      "conditions": [ { "type": "ready", "message": "all members up" } ],
      "replsets": { "rs0": { "ready": 2, "size": 3, "status": ")"
        + replsetState + R"(" } },
      "mongos": { "ready": 1, "size": 3 }
    }
  })";
}

class MongoDBManagerTest : public ::testing::Test {
  protected:
    MongoDBManagerTest ()
      : manager(kubectl) {
      kubectl.respond("api-versions", "psmdb.percona.com/v1-6-0\n");
      kubectl.respond("get -o=json storageclasses",
                      R"({"items": [{"provisioner": "kubernetes.io/aws-ebs"}]})");
      kubectl.respond(GET_PODS, R"({"items": []})");
      kubectl.respond("get -o=json pods", R"({"items": []})");
    }

    CreateMongoDBClusterRequest createRequest (int size) {
      CreateMongoDBClusterRequest request;

      request.set_name("mongo");
      request.set_expose(true);
      request.mutable_params()->set_cluster_size(size);
      request.mutable_params()->mutable_replicaset()->set_disk_size(2147483648);
      request.mutable_params()->mutable_replicaset()
        ->mutable_compute_resources()->set_memory_bytes(536870912);

      return request;
    }

    NiceMock<MockKubeCtl> kubectl;
    MongoDBManager manager;
};

// -----------------------------------------------------------------------------
// --SECTION--                                                            create
// -----------------------------------------------------------------------------

TEST_F(MongoDBManagerTest, CreateSharded) {
  Result res = manager.create(createRequest(3));

  ASSERT_FALSE(res.isError()) << res.message();
  ASSERT_EQ(2u, kubectl.applied.size());

  const picojson::value& secret = kubectl.applied[0];
  EXPECT_EQ("dbaas-mongo-psmdb-secrets", jsonString(secret, { "metadata", "name" }));
  EXPECT_EQ(encodeBase64("userAdmin"),
            jsonString(secret, { "data", "MONGODB_USER_ADMIN_USER" }));
  EXPECT_EQ(32u, jsonString(secret, { "data", "MONGODB_USER_ADMIN_PASSWORD" }).size());

  const picojson::value& doc = kubectl.applied[1];
  EXPECT_EQ("psmdb.percona.com/v1-6-0", jsonString(doc, { "apiVersion" }));
  EXPECT_EQ("PerconaServerMongoDB", jsonString(doc, { "kind" }));
  EXPECT_EQ("percona/percona-server-mongodb:4.2.8-8",
            jsonString(doc, { "spec", "image" }));
  EXPECT_EQ("dbaas-mongo-psmdb-secrets",
            jsonString(doc, { "spec", "secrets", "users" }));
  EXPECT_EQ("percona/percona-server-mongodb-operator:1.6.0-backup",
            jsonString(doc, { "spec", "backup", "image" }));

  EXPECT_TRUE(jsonBool(doc, { "spec", "sharding", "enabled" }));
  EXPECT_EQ(3, jsonInt(doc, { "spec", "sharding", "mongos", "size" }));
  EXPECT_EQ("LoadBalancer",
            jsonString(doc, { "spec", "sharding", "mongos", "expose", "exposeType" }));
  EXPECT_EQ("kubernetes.io/hostname", jsonString(doc,
    { "spec", "sharding", "mongos", "affinity", "antiAffinityTopologyKey" }));
  EXPECT_FALSE(jsonBool(doc, { "spec", "allowUnsafeConfigurations" }));

  const picojson::value& replsets = jsonGet(doc, { "spec", "replsets" });
  ASSERT_TRUE(replsets.is<picojson::array>());
  ASSERT_EQ(1u, replsets.get<picojson::array>().size());

  const picojson::value& rs0 = replsets.get<picojson::array>()[0];
  EXPECT_EQ("rs0", jsonString(rs0, { "name" }));
  EXPECT_EQ(3, jsonInt(rs0, { "size" }));
  EXPECT_EQ("2147483648", jsonString(rs0, { "volumeSpec", "persistentVolumeClaim",
                                            "resources", "requests", "storage" }));
  EXPECT_EQ("536870912", jsonString(rs0, { "resources", "limits", "memory" }));
  EXPECT_FALSE(jsonBool(rs0, { "expose", "enabled" }));
  EXPECT_EQ("mongo-mongodb-encryption-key", jsonString(doc,
    { "spec", "mongod", "security", "encryptionKeySecret" }));
}

TEST_F(MongoDBManagerTest, CreateSingleMember) {
  kubectl.respond("get -o=json storageclasses",
                  R"({"items": [{"provisioner": "k8s.io/minikube-hostpath"}]})");

  ASSERT_FALSE(manager.create(createRequest(1)).isError());
  ASSERT_EQ(2u, kubectl.applied.size());

  const picojson::value& doc = kubectl.applied[1];
  EXPECT_TRUE(jsonBool(doc, { "spec", "allowUnsafeConfigurations" }));
  EXPECT_FALSE(jsonBool(doc, { "spec", "sharding", "enabled" }, true));
  EXPECT_EQ("ClusterIP",
            jsonString(doc, { "spec", "sharding", "mongos", "expose", "exposeType" }));

  const picojson::value& rs0 =
    jsonGet(doc, { "spec", "replsets" }).get<picojson::array>()[0];
  EXPECT_TRUE(jsonBool(rs0, { "expose", "enabled" }));
  EXPECT_EQ("NodePort", jsonString(rs0, { "expose", "exposeType" }));
  EXPECT_EQ("none", jsonString(rs0, { "affinity", "antiAffinityTopologyKey" }));
}

TEST_F(MongoDBManagerTest, CreateWithPmm) {
  CreateMongoDBClusterRequest request = createRequest(3);
  request.mutable_pmm()->set_public_address("pmm.example.com");
  request.mutable_pmm()->set_login("admin");
  request.mutable_pmm()->set_password("secret");

  ASSERT_FALSE(manager.create(request).isError());
  ASSERT_EQ(2u, kubectl.applied.size());

  const picojson::value& secret = kubectl.applied[0];
  EXPECT_EQ(encodeBase64("admin"), jsonString(secret, { "data", "PMM_SERVER_USER" }));
  EXPECT_EQ(encodeBase64("secret"),
            jsonString(secret, { "data", "PMM_SERVER_PASSWORD" }));

  const picojson::value& doc = kubectl.applied[1];
  EXPECT_TRUE(jsonBool(doc, { "spec", "pmm", "enabled" }));
  EXPECT_EQ("pmm.example.com", jsonString(doc, { "spec", "pmm", "serverHost" }));
  EXPECT_EQ("", jsonString(doc, { "spec", "pmm", "serverUser" }));
}

TEST_F(MongoDBManagerTest, CreateValidation) {
  CreateMongoDBClusterRequest request = createRequest(0);
  EXPECT_TRUE(manager.create(request).is(ErrorCode::INVALID_ARGUMENT));

  request = createRequest(3);
  request.mutable_params()->mutable_replicaset()->set_disk_size(0);
  EXPECT_TRUE(manager.create(request).is(ErrorCode::INVALID_ARGUMENT));

  request = createRequest(3);
  request.clear_name();
  EXPECT_TRUE(manager.create(request).is(ErrorCode::INVALID_ARGUMENT));

  request = createRequest(3);
  request.mutable_params()->mutable_replicaset()
    ->mutable_compute_resources()->set_memory_bytes(-1);
  EXPECT_TRUE(manager.create(request).is(ErrorCode::INVALID_ARGUMENT));

  EXPECT_TRUE(kubectl.commands.empty());
}

TEST_F(MongoDBManagerTest, CreateExisting) {
  kubectl.respond(GET_CLUSTER, cluster("ready"));

  EXPECT_TRUE(manager.create(createRequest(3)).is(ErrorCode::ALREADY_EXISTS));
  EXPECT_TRUE(kubectl.applied.empty());
}

TEST_F(MongoDBManagerTest, CreateWithoutOperator) {
  kubectl.respond("api-versions", "pxc.percona.com/v1-6-0\n");

  EXPECT_TRUE(manager.create(createRequest(3)).is(ErrorCode::NOT_READY));
  EXPECT_TRUE(kubectl.applied.empty());
}

// -----------------------------------------------------------------------------
// --SECTION--                                                            update
// -----------------------------------------------------------------------------

TEST_F(MongoDBManagerTest, UpdateReady) {
  kubectl.respond(GET_CLUSTER, cluster("ready"));

  UpdateMongoDBClusterRequest request;
  request.set_name("mongo");
  request.mutable_params()->set_cluster_size(5);
  request.mutable_params()->mutable_replicaset()
    ->mutable_compute_resources()->set_cpu_m(2500);
  request.mutable_params()->set_image("percona/percona-server-mongodb:4.4.2-4");

  Result res = manager.update(request);

  ASSERT_FALSE(res.isError()) << res.message();
  ASSERT_EQ(1u, kubectl.applied.size());

  const picojson::value& doc = kubectl.applied[0];
  const picojson::value& rs0 =
    jsonGet(doc, { "spec", "replsets" }).get<picojson::array>()[0];

  EXPECT_EQ("psmdb.percona.com/v1", jsonString(doc, { "apiVersion" }));
  EXPECT_EQ(5, jsonInt(rs0, { "size" }));
  EXPECT_EQ("2500m", jsonString(rs0, { "resources", "limits", "cpu" }));
  EXPECT_EQ("512Mi", jsonString(rs0, { "resources", "limits", "memory" }));
  EXPECT_EQ("percona/percona-server-mongodb:4.4.2-4",
            jsonString(doc, { "spec", "image" }));
  EXPECT_TRUE(jsonGet(doc, { "status" }).is<picojson::null>());
}

TEST_F(MongoDBManagerTest, UpdateSameImage) {
  kubectl.respond(GET_CLUSTER, cluster("ready"));

  UpdateMongoDBClusterRequest request;
  request.set_name("mongo");
  request.mutable_params()->set_image("percona/percona-server-mongodb:4.2.8-8");

  // an unchanged image is no upgrade
  ASSERT_FALSE(manager.update(request).isError());
  EXPECT_EQ(1u, kubectl.applied.size());
}

TEST_F(MongoDBManagerTest, UpdateFailedCluster) {
  kubectl.respond(GET_CLUSTER, cluster("error", 3, "initializing"));

  UpdateMongoDBClusterRequest request;
  request.set_name("mongo");
  request.mutable_params()->set_cluster_size(5);

  Result res = manager.update(request);

  EXPECT_TRUE(res.is(ErrorCode::NOT_READY));
  EXPECT_EQ("MongoDB cluster 'mongo' is not ready, state is CHANGING",
            res.message());
  EXPECT_TRUE(kubectl.applied.empty());
}

TEST_F(MongoDBManagerTest, UpdateMissingCluster) {
  UpdateMongoDBClusterRequest request;
  request.set_name("mongo");
  request.mutable_params()->set_suspend(true);

  EXPECT_TRUE(manager.update(request).is(ErrorCode::NOT_FOUND));
}

TEST_F(MongoDBManagerTest, ResumePaused) {
  kubectl.respond(GET_CLUSTER, cluster("paused"));

  UpdateMongoDBClusterRequest request;
  request.set_name("mongo");
  request.mutable_params()->set_resume(true);

  ASSERT_FALSE(manager.update(request).isError());
  ASSERT_EQ(1u, kubectl.applied.size());
  EXPECT_FALSE(jsonBool(kubectl.applied[0], { "spec", "pause" }, true));
}

TEST_F(MongoDBManagerTest, UpdateRejectsNegativeLimits) {
  kubectl.respond(GET_CLUSTER, cluster("ready"));

  UpdateMongoDBClusterRequest request;
  request.set_name("mongo");
  request.mutable_params()->mutable_replicaset()
    ->mutable_compute_resources()->set_cpu_m(-500);

  Result res = manager.update(request);

  EXPECT_TRUE(res.is(ErrorCode::INVALID_ARGUMENT));
  EXPECT_EQ("replica set cpu must not be negative", res.message());
  EXPECT_TRUE(kubectl.commands.empty());
}

TEST_F(MongoDBManagerTest, EmptyNameIsRejected) {
  UpdateMongoDBClusterRequest update;
  update.mutable_params()->set_cluster_size(3);
  EXPECT_TRUE(manager.update(update).is(ErrorCode::INVALID_ARGUMENT));

  MongoDBCredentials credentials;
  EXPECT_TRUE(manager.credentials("", &credentials).is(ErrorCode::INVALID_ARGUMENT));
  EXPECT_TRUE(manager.restart("").is(ErrorCode::INVALID_ARGUMENT));
  EXPECT_TRUE(manager.remove("").is(ErrorCode::INVALID_ARGUMENT));

  EXPECT_TRUE(kubectl.commands.empty());
  EXPECT_TRUE(kubectl.deleted.empty());
}

// -----------------------------------------------------------------------------
// --SECTION--                                                              list
// -----------------------------------------------------------------------------

TEST_F(MongoDBManagerTest, List) {
  kubectl.respond("get -o=json perconaservermongodb",
                  "{\"items\": [" + cluster("ready") + "]}");

  ListMongoDBClustersResponse response;
  Result res = manager.list(&response);

  ASSERT_FALSE(res.isError()) << res.message();
  ASSERT_EQ(1, response.clusters_size());

  const auto& mongo = response.clusters(0);
  EXPECT_EQ("mongo", mongo.name());
  EXPECT_EQ(DB_CLUSTER_STATE_READY, mongo.state());
  EXPECT_EQ(3, mongo.params().cluster_size());
  EXPECT_EQ("percona/percona-server-mongodb:4.2.8-8", mongo.params().image());
  EXPECT_EQ("percona/percona-server-mongodb-operator:1.6.0-backup",
            mongo.params().backup_image());
  EXPECT_EQ(2147483648, mongo.params().replicaset().disk_size());
  EXPECT_EQ(1000, mongo.params().replicaset().compute_resources().cpu_m());
  EXPECT_EQ(536870912,
            mongo.params().replicaset().compute_resources().memory_bytes());
  EXPECT_TRUE(mongo.exposed());
  EXPECT_EQ(3, mongo.operation().finished_steps());
  EXPECT_EQ(6, mongo.operation().total_steps());
  EXPECT_EQ("all members up", mongo.operation().message());
}

TEST_F(MongoDBManagerTest, ListSingleMemberSkipsRouters) {
  kubectl.respond("get -o=json perconaservermongodb",
                  "{\"items\": [" + cluster("ready", 1) + "]}");

  ListMongoDBClustersResponse response;
  ASSERT_FALSE(manager.list(&response).isError());
  ASSERT_EQ(1, response.clusters_size());

  EXPECT_EQ(2, response.clusters(0).operation().finished_steps());
  EXPECT_EQ(3, response.clusters(0).operation().total_steps());
}

TEST_F(MongoDBManagerTest, ListWithoutStatus) {
  kubectl.respond("get -o=json perconaservermongodb", R"({"items": [
    { "metadata": { "name": "fresh" }, "spec": {} }
  ]})");

  ListMongoDBClustersResponse response;
  ASSERT_FALSE(manager.list(&response).isError());
  ASSERT_EQ(1, response.clusters_size());
  EXPECT_EQ(DB_CLUSTER_STATE_INVALID, response.clusters(0).state());
  EXPECT_EQ(0, response.clusters(0).params().cluster_size());
}

TEST_F(MongoDBManagerTest, ListMemoryOutOfRange) {
  string resource = cluster("ready");
  resource.replace(resource.find("512Mi"), 5, "10000000Ti");

  kubectl.respond("get -o=json perconaservermongodb",
                  "{\"items\": [" + resource + "]}");

  ListMongoDBClustersResponse response;
  Result res = manager.list(&response);

  EXPECT_TRUE(res.is(ErrorCode::INTERNAL));
  EXPECT_EQ("memory limit '10000000Ti' is out of range", res.message());
}

TEST_F(MongoDBManagerTest, ListFailure) {
  kubectl.fail("get -o=json perconaservermongodb",
               ErrorCode::INTERNAL, "forbidden");

  ListMongoDBClustersResponse response;
  Result res = manager.list(&response);

  EXPECT_TRUE(res.is(ErrorCode::INTERNAL));
  EXPECT_EQ("couldn't get PerconaServerMongoDB clusters: forbidden", res.message());
}

// -----------------------------------------------------------------------------
// --SECTION--                                         credentials, restart, delete
// -----------------------------------------------------------------------------

TEST_F(MongoDBManagerTest, Credentials) {
  kubectl.respond(GET_CLUSTER, cluster("ready"));
  kubectl.respond("get -o=json secret dbaas-mongo-psmdb-secrets", R"({"data": {
    "MONGODB_USER_ADMIN_USER": "dXNlckFkbWlu",
    "MONGODB_USER_ADMIN_PASSWORD": "cGFzcw=="
  }})");

  MongoDBCredentials credentials;
  Result res = manager.credentials("mongo", &credentials);

  ASSERT_FALSE(res.isError()) << res.message();
  EXPECT_EQ("userAdmin", credentials.username());
  EXPECT_EQ("pass", credentials.password());
  EXPECT_EQ("mongo-rs0.default", credentials.host());
  EXPECT_EQ(27017, credentials.port());
  EXPECT_EQ("rs0", credentials.replicaset());
}

TEST_F(MongoDBManagerTest, CredentialsNeedReadyCluster) {
  kubectl.respond(GET_CLUSTER, cluster("initializing"));

  MongoDBCredentials credentials;
  Result res = manager.credentials("mongo", &credentials);

  EXPECT_TRUE(res.is(ErrorCode::NOT_READY));
  EXPECT_EQ("cannot get PSMDB cluster credentials: cluster state is CHANGING, "
            "READY is expected", res.message());
}

TEST_F(MongoDBManagerTest, CredentialsMissingSecret) {
  kubectl.respond(GET_CLUSTER, cluster("ready"));

  MongoDBCredentials credentials;
  EXPECT_TRUE(manager.credentials("mongo", &credentials).is(ErrorCode::NOT_FOUND));
}

TEST_F(MongoDBManagerTest, Restart) {
  kubectl.respond("get -o=json statefulset mongo-rs0", "{}");

  ASSERT_FALSE(manager.restart("mongo").isError());
  EXPECT_TRUE(kubectl.called("rollout restart StatefulSets mongo-rs0"));
}

TEST_F(MongoDBManagerTest, RestartWithoutReplicaSet) {
  ASSERT_FALSE(manager.restart("mongo").isError());
  EXPECT_FALSE(kubectl.called("rollout restart StatefulSets mongo-rs0"));
}

TEST_F(MongoDBManagerTest, Delete) {
  ASSERT_FALSE(manager.remove("mongo").isError());
  ASSERT_EQ(7u, kubectl.deleted.size());

  EXPECT_EQ("PerconaServerMongoDB", jsonString(kubectl.deleted[0], { "kind" }));
  EXPECT_EQ("dbaas-mongo-psmdb-secrets",
            jsonString(kubectl.deleted[1], { "metadata", "name" }));
  EXPECT_EQ("mongo-mongodb-encryption-key",
            jsonString(kubectl.deleted[6], { "metadata", "name" }));
}
