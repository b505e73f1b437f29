////////////////////////////////////////////////////////////////////////////////
/// @brief tests of the cluster state classifier
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

#include "ClusterState.h"

#include <string>
#include <vector>

using namespace dbaas;
using namespace std;

TEST(ClusterStateTest, DirectMapping) {
  EXPECT_EQ(ClusterState::INVALID, classify("unknown", false));
  EXPECT_EQ(ClusterState::CHANGING, classify("initializing", false));
  EXPECT_EQ(ClusterState::CHANGING, classify("stopping", false));
  EXPECT_EQ(ClusterState::CHANGING, classify("pending", false));
  EXPECT_EQ(ClusterState::READY, classify("ready", false));
  EXPECT_EQ(ClusterState::FAILED, classify("error", false));
  EXPECT_EQ(ClusterState::PAUSED, classify("paused", false));
}

TEST(ClusterStateTest, CaseInsensitive) {
  EXPECT_EQ(ClusterState::READY, classify("Ready", false));
  EXPECT_EQ(ClusterState::FAILED, classify("ERROR", false));
}

TEST(ClusterStateTest, MissingOrUnknownStateIsChanging) {
  EXPECT_EQ(ClusterState::CHANGING, classify("", false));
  EXPECT_EQ(ClusterState::CHANGING, classify("something-new", false));
}

TEST(ClusterStateTest, PausedFlagOnlyAppliesToReady) {
  EXPECT_EQ(ClusterState::PAUSED, classify("ready", true));
  EXPECT_EQ(ClusterState::CHANGING, classify("initializing", true));
  EXPECT_EQ(ClusterState::FAILED, classify("error", true));
}

TEST(ClusterStateTest, ErrorCorrectedByMembers) {
  vector<string> members = { "ready", "initializing", "ready" };
  EXPECT_EQ(ClusterState::CHANGING, classify("error", false, members));
}

TEST(ClusterStateTest, ErrorKeptIfMembersFail) {
  vector<string> members = { "ready", "error" };
  EXPECT_EQ(ClusterState::FAILED, classify("error", false, members));
}

TEST(ClusterStateTest, ErrorWithoutMembersIsInvalid) {
  EXPECT_EQ(ClusterState::INVALID, classify("error", false, vector<string>()));
}

TEST(ClusterStateTest, ErrorWithAllMembersReady) {
  vector<string> members = { "ready", "ready" };
  EXPECT_EQ(ClusterState::READY, classify("error", false, members));
}

TEST(ClusterStateTest, MembersIgnoredUnlessError) {
  vector<string> members = { "error" };
  EXPECT_EQ(ClusterState::READY, classify("ready", false, members));
}

TEST(ClusterStateTest, SeverityOrder) {
  EXPECT_LT(severity(ClusterState::INVALID), severity(ClusterState::CHANGING));
  EXPECT_LT(severity(ClusterState::CHANGING), severity(ClusterState::FAILED));
  EXPECT_LT(severity(ClusterState::FAILED), severity(ClusterState::READY));
}

TEST(ClusterStateTest, Names) {
  EXPECT_EQ("READY", toString(ClusterState::READY));
  EXPECT_EQ("UPGRADING", toString(ClusterState::UPGRADING));
}
