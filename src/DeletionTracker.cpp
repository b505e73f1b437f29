////////////////////////////////////////////////////////////////////////////////
/// @brief clusters still being deleted
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

#include "DeletionTracker.h"

#include "KubeCtl.h"
#include "utils.h"

using namespace dbaas;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                  public variables
// -----------------------------------------------------------------------------

const string dbaas::INSTANCE_LABEL = "app.kubernetes.io/instance";

const string dbaas::MANAGED_BY_LABEL = "app.kubernetes.io/managed-by";

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief names of clusters which still have pods but no custom resource
////////////////////////////////////////////////////////////////////////////////

vector<string> dbaas::findDeleting (const picojson::value& pods,
                                    const string& managedBy,
                                    set<string>& known) {
  vector<string> result;
  const picojson::value& items = jsonGet(pods, { "items" });

  if (! items.is<picojson::array>()) {
    return result;
  }

  for (const auto& pod : items.get<picojson::array>()) {
    const picojson::value& labels = jsonGet(pod, { "metadata", "labels" });

    string instance = jsonString(labels, { INSTANCE_LABEL });

    if (instance.empty() || known.find(instance) != known.end()) {
      continue;
    }

    if (jsonString(labels, { MANAGED_BY_LABEL }) != managedBy) {
      continue;
    }

    result.push_back(instance);
    known.insert(instance);
  }

  return result;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief lists all pods and finds clusters being deleted
////////////////////////////////////////////////////////////////////////////////

Result dbaas::findDeleting (KubeCtl& kubectl,
                            const string& managedBy,
                            set<string>& known,
                            vector<string>& deleting) {
  picojson::value pods;
  Result res = kubectl.get("pods", "", pods);

  if (res.isError()) {
    return res.wrap("cannot list pods");
  }

  deleting = findDeleting(pods, managedBy, known);
  return Result::noError();
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
