////////////////////////////////////////////////////////////////////////////////
/// @brief container logs and pod events of a cluster
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

#include "LogsSource.h"

#include "DeletionTracker.h"
#include "Global.h"
#include "KubeCtl.h"
#include "utils.h"

#include <glog/logging.h>

#include <stout/stringify.hpp>

using namespace dbaas;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                  public variables
// -----------------------------------------------------------------------------

const size_t dbaas::OVERALL_LINES_LIMIT = 1000;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief finds the status of a container
////////////////////////////////////////////////////////////////////////////////

static const picojson::value* containerStatus (const picojson::value& statuses,
                                               const string& container) {
  if (! statuses.is<picojson::array>()) {
    return nullptr;
  }

  for (const auto& status : statuses.get<picojson::array>()) {
    if (jsonString(status, { "name" }) == container) {
      return &status;
    }
  }

  return nullptr;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief checks if a container is wanted by a source
////////////////////////////////////////////////////////////////////////////////

static bool wanted (LogsSourceType type, const picojson::value* status) {
  if (status != nullptr
   && jsonGet(*status, { "state", "waiting" }).is<picojson::object>()) {
    return false;
  }

  switch (type) {
    case LogsSourceType::ALL_LOGS:
      return true;

    case LogsSourceType::FAILING_ONLY:
      return status != nullptr && ! jsonBool(*status, { "ready" }, true);
  }

  return false;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief fetches the last lines of a container
////////////////////////////////////////////////////////////////////////////////

static Result containerLogs (KubeCtl& kubectl,
                             const string& pod,
                             const string& container,
                             vector<string>& lines) {
  string output;

  Result res = kubectl.run(
    { "logs", pod, "-c", container,
      "--tail=" + stringify(Global::logLines()) },
    nullptr,
    output);

  if (res.isError()) {
    return res.wrap("couldn't get logs");
  }

  lines.clear();

  if (! output.empty()) {
    lines = split(output, '\n');
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief collects the logs of one pod
////////////////////////////////////////////////////////////////////////////////

static Result podLogs (KubeCtl& kubectl,
                       LogsSourceType type,
                       const picojson::value& pod,
                       LogsList* logs) {
  const string name = jsonString(pod, { "metadata", "name" });

  static const vector<pair<string, string>> GROUPS = {
    { "containers",     "containerStatuses" },
    { "initContainers", "initContainerStatuses" }
  };

  for (const auto& group : GROUPS) {
    const picojson::value& containers = jsonGet(pod, { "spec", group.first });
    const picojson::value& statuses = jsonGet(pod, { "status", group.second });

    if (! containers.is<picojson::array>()) {
      continue;
    }

    for (const auto& container : containers.get<picojson::array>()) {
      const string cname = jsonString(container, { "name" });

      if (! wanted(type, containerStatus(statuses, cname))) {
        VLOG(1) << "skipping container '" << cname << "' of pod '" << name << "'";
        continue;
      }

      vector<string> lines;
      Result res = containerLogs(kubectl, name, cname, lines);

      if (res.isError()) {
        return res;
      }

      if (lines.empty()) {
        continue;
      }

      Logs* entry = logs->Add();

      entry->set_pod(name);
      entry->set_container(cname);

      for (auto& line : lines) {
        entry->add_logs(line);
      }
    }
  }

  vector<string> events;
  Result res = podEvents(kubectl, name, events);

  if (res.isError()) {
    return res.wrap("failed to get events");
  }

  Logs* entry = logs->Add();

  entry->set_pod(name);
  entry->set_container("");

  for (auto& line : events) {
    entry->add_logs(line);
  }

  return Result::noError();
}

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief collects logs of all pods of a cluster
////////////////////////////////////////////////////////////////////////////////

Result dbaas::collectLogs (KubeCtl& kubectl,
                           LogsSourceType type,
                           const string& clusterName,
                           LogsList* logs) {
  picojson::value pods;
  Result res = kubectl.getSelected(
    "pods", INSTANCE_LABEL + "=" + clusterName, pods);

  if (res.isError()) {
    return res.wrap("failed to get pods");
  }

  const picojson::value& items = jsonGet(pods, { "items" });

  if (items.is<picojson::array>()) {
    for (const auto& pod : items.get<picojson::array>()) {
      res = podLogs(kubectl, type, pod, logs);

      if (res.isError()) {
        return res;
      }
    }
  }

  limitLines(logs, OVERALL_LINES_LIMIT);

  LOG(INFO)
  << "collected " << logs->size() << " log entries for cluster '"
  << clusterName << "'";

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief renders the events of a pod
////////////////////////////////////////////////////////////////////////////////

Result dbaas::podEvents (KubeCtl& kubectl,
                         const string& pod,
                         vector<string>& lines) {
  string output;

  Result res = kubectl.run(
    { "get", "-o=json", "events",
      "--field-selector=involvedObject.name=" + pod },
    nullptr,
    output);

  if (res.isError()) {
    return res.wrap("couldn't describe pod");
  }

  picojson::value events;
  string err = picojson::parse(events, output);

  if (! err.empty()) {
    return Result::internalError("cannot parse events: " + err);
  }

  lines.clear();

  const picojson::value& items = jsonGet(events, { "items" });

  if (! items.is<picojson::array>() || items.get<picojson::array>().empty()) {
    lines.push_back("Events:\t<none>");
    return Result::noError();
  }

  lines.push_back("Events:");
  lines.push_back("  Type\tReason\tFrom\tMessage");
  lines.push_back("  ----\t------\t----\t-------");

  for (const auto& event : items.get<picojson::array>()) {
    lines.push_back(
      "  " + jsonString(event, { "type" })
      + "\t" + jsonString(event, { "reason" })
      + "\t" + jsonString(event, { "source", "component" })
      + "\t" + jsonString(event, { "message" }));
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief limits the overall number of lines
////////////////////////////////////////////////////////////////////////////////

void dbaas::limitLines (LogsList* logs, size_t limit) {
  const int n = logs->size();
  vector<size_t> counts(n, 0);

  size_t total = 0;
  bool changed = true;

  while (total < limit && changed) {
    changed = false;

    for (int i = 0; i < n && total < limit; ++i) {
      if (counts[i] < static_cast<size_t>(logs->Get(i).logs_size())) {
        ++counts[i];
        ++total;
        changed = true;
      }
    }
  }

  for (int i = 0; i < n; ++i) {
    Logs* entry = logs->Mutable(i);
    int drop = entry->logs_size() - static_cast<int>(counts[i]);

    if (0 < drop) {
      entry->mutable_logs()->DeleteSubrange(0, drop);
    }
  }
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
