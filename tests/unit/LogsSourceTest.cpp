////////////////////////////////////////////////////////////////////////////////
/// @brief tests of the log collection
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

#include "LogsSource.h"
#include "utils/MockKubeCtl.h"

using namespace dbaas;
using namespace dbaas::test;
using namespace std;

using ::testing::NiceMock;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

static void addEntry (LogsList& logs, const vector<string>& lines) {
  Logs* entry = logs.Add();

  entry->set_pod("pod");

  for (const auto& line : lines) {
    entry->add_logs(line);
  }
}

static vector<string> linesOf (const Logs& entry) {
  return vector<string>(entry.logs().begin(), entry.logs().end());
}

static const string PODS = R"({"items": [ {
  "metadata": { "name": "db1-pxc-0" },
  "spec": {
    "containers": [ { "name": "pxc" }, { "name": "pmm-client" }, { "name": "logs" } ],
    "initContainers": [ { "name": "pxc-init" } ]
  },
  "status": {
    "containerStatuses": [
      { "name": "pxc", "ready": true, "state": { "running": {} } },
      { "name": "pmm-client", "ready": false, "state": { "running": {} } },
      { "name": "logs", "ready": false,
        "state": { "waiting": { "reason": "ContainerCreating" } } }
    ],
    "initContainerStatuses": [
      { "name": "pxc-init", "ready": true, "state": { "terminated": {} } }
    ]
  }
} ]})";

static const string EVENTS = R"({"items": [
  { "type": "Normal", "reason": "Scheduled",
    "source": { "component": "default-scheduler" },
    "message": "Successfully assigned db1-pxc-0" },
  { "type": "Warning", "reason": "Unhealthy",
    "source": { "component": "kubelet" },
    "message": "Readiness probe failed" }
]})";

// -----------------------------------------------------------------------------
// --SECTION--                                                       limitLines
// -----------------------------------------------------------------------------

TEST(LogsSourceTest, LimitKeepsShortLogs) {
  LogsList logs;
  addEntry(logs, { "a", "b", "c", "d" });
  addEntry(logs, {});

  limitLines(&logs, 10);

  ASSERT_EQ(2, logs.size());
  EXPECT_EQ((vector<string>{ "a", "b", "c", "d" }), linesOf(logs.Get(0)));
  EXPECT_TRUE(linesOf(logs.Get(1)).empty());
}

TEST(LogsSourceTest, LimitSharesLinesFairly) {
  LogsList logs;
  addEntry(logs, { "a", "b", "c", "d", "e", "f", "g" });
  addEntry(logs, { "h", "i", "j" });
  addEntry(logs, { "l", "m", "o", "p", "q", "r", "s" });

  limitLines(&logs, 10);

  EXPECT_EQ((vector<string>{ "d", "e", "f", "g" }), linesOf(logs.Get(0)));
  EXPECT_EQ((vector<string>{ "h", "i", "j" }), linesOf(logs.Get(1)));
  EXPECT_EQ((vector<string>{ "q", "r", "s" }), linesOf(logs.Get(2)));
}

TEST(LogsSourceTest, LimitGivesRestToLongestLog) {
  LogsList logs;
  addEntry(logs, { "1", "2", "3", "4", "5", "6", "7",
                   "8", "9", "10", "11", "12", "13", "14" });
  addEntry(logs, { "a" });
  addEntry(logs, { "b" });
  addEntry(logs, { "c" });
  addEntry(logs, { "d" });

  limitLines(&logs, 10);

  EXPECT_EQ((vector<string>{ "9", "10", "11", "12", "13", "14" }),
            linesOf(logs.Get(0)));
  EXPECT_EQ((vector<string>{ "a" }), linesOf(logs.Get(1)));
  EXPECT_EQ((vector<string>{ "d" }), linesOf(logs.Get(4)));
}

// -----------------------------------------------------------------------------
// --SECTION--                                                        podEvents
// -----------------------------------------------------------------------------

TEST(LogsSourceTest, EventsTable) {
  NiceMock<MockKubeCtl> kubectl;
  kubectl.respond(
    "get -o=json events --field-selector=involvedObject.name=db1-pxc-0", EVENTS);

  vector<string> lines;
  Result res = podEvents(kubectl, "db1-pxc-0", lines);

  ASSERT_FALSE(res.isError()) << res.message();
  ASSERT_EQ(5u, lines.size());
  EXPECT_EQ("Events:", lines[0]);
  EXPECT_EQ("  Type\tReason\tFrom\tMessage", lines[1]);
  EXPECT_EQ("  ----\t------\t----\t-------", lines[2]);
  EXPECT_EQ("  Normal\tScheduled\tdefault-scheduler\tSuccessfully assigned db1-pxc-0",
            lines[3]);
  EXPECT_EQ("  Warning\tUnhealthy\tkubelet\tReadiness probe failed", lines[4]);
}

TEST(LogsSourceTest, NoEvents) {
  NiceMock<MockKubeCtl> kubectl;
  kubectl.respond(
    "get -o=json events --field-selector=involvedObject.name=db1-pxc-0",
    R"({"items": []})");

  vector<string> lines;
  ASSERT_FALSE(podEvents(kubectl, "db1-pxc-0", lines).isError());
  EXPECT_EQ((vector<string>{ "Events:\t<none>" }), lines);
}

TEST(LogsSourceTest, BrokenEvents) {
  NiceMock<MockKubeCtl> kubectl;
  kubectl.respond(
    "get -o=json events --field-selector=involvedObject.name=db1-pxc-0", "{");

  vector<string> lines;
  EXPECT_TRUE(podEvents(kubectl, "db1-pxc-0", lines).is(ErrorCode::INTERNAL));
}

// -----------------------------------------------------------------------------
// --SECTION--                                                      collectLogs
// -----------------------------------------------------------------------------

class CollectLogsTest : public ::testing::Test {
  protected:
    CollectLogsTest () {
      kubectl.respond("get -o=json pods -l app.kubernetes.io/instance=db1", PODS);
      kubectl.respond("logs db1-pxc-0 -c pxc --tail=3000", "started\nready\n");
      kubectl.respond("logs db1-pxc-0 -c pmm-client --tail=3000", "");
      kubectl.respond("logs db1-pxc-0 -c pxc-init --tail=3000", "copied");
      kubectl.respond(
        "get -o=json events --field-selector=involvedObject.name=db1-pxc-0",
        EVENTS);
    }

    NiceMock<MockKubeCtl> kubectl;
};

TEST_F(CollectLogsTest, AllLogs) {
  LogsList logs;
  Result res = collectLogs(kubectl, LogsSourceType::ALL_LOGS, "db1", &logs);

  ASSERT_FALSE(res.isError()) << res.message();
  ASSERT_EQ(3, logs.size());

  EXPECT_EQ("db1-pxc-0", logs.Get(0).pod());
  EXPECT_EQ("pxc", logs.Get(0).container());
  EXPECT_EQ((vector<string>{ "started", "ready", "" }), linesOf(logs.Get(0)));

  EXPECT_EQ("pxc-init", logs.Get(1).container());
  EXPECT_EQ((vector<string>{ "copied" }), linesOf(logs.Get(1)));

  EXPECT_EQ("", logs.Get(2).container());
  EXPECT_EQ(5, logs.Get(2).logs_size());

  // waiting containers have no logs yet
  EXPECT_FALSE(kubectl.called("logs db1-pxc-0 -c logs --tail=3000"));
}

TEST_F(CollectLogsTest, FailingOnly) {
  kubectl.respond("logs db1-pxc-0 -c pmm-client --tail=3000", "connection lost");

  LogsList logs;
  Result res = collectLogs(kubectl, LogsSourceType::FAILING_ONLY, "db1", &logs);

  ASSERT_FALSE(res.isError()) << res.message();
  ASSERT_EQ(2, logs.size());
  EXPECT_EQ("pmm-client", logs.Get(0).container());
  EXPECT_EQ("", logs.Get(1).container());

  EXPECT_FALSE(kubectl.called("logs db1-pxc-0 -c pxc --tail=3000"));
}

TEST_F(CollectLogsTest, NoPods) {
  kubectl.respond("get -o=json pods -l app.kubernetes.io/instance=db1",
                  R"({"items": []})");

  LogsList logs;
  ASSERT_FALSE(collectLogs(kubectl, LogsSourceType::ALL_LOGS, "db1", &logs).isError());
  EXPECT_EQ(0, logs.size());
}

TEST_F(CollectLogsTest, PodListFailure) {
  kubectl.fail("get -o=json pods -l app.kubernetes.io/instance=db1",
               ErrorCode::INTERNAL, "forbidden");

  LogsList logs;
  Result res = collectLogs(kubectl, LogsSourceType::ALL_LOGS, "db1", &logs);

  EXPECT_TRUE(res.is(ErrorCode::INTERNAL));
  EXPECT_EQ("failed to get pods: forbidden", res.message());
}

TEST_F(CollectLogsTest, ContainerLogFailure) {
  kubectl.fail("logs db1-pxc-0 -c pxc --tail=3000", ErrorCode::INTERNAL, "gone");

  LogsList logs;
  Result res = collectLogs(kubectl, LogsSourceType::ALL_LOGS, "db1", &logs);

  EXPECT_TRUE(res.isError());
  EXPECT_EQ("couldn't get logs: gone", res.message());
}
