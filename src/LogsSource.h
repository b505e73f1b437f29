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

#ifndef DBAAS_LOGS_SOURCE_H
#define DBAAS_LOGS_SOURCE_H 1

#include "Result.h"

#include "dbaas.pb.h"

#include <string>
#include <vector>

#include <google/protobuf/repeated_field.h>

namespace dbaas {
  class KubeCtl;

// -----------------------------------------------------------------------------
// --SECTION--                                                      public types
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief which containers are asked for logs
////////////////////////////////////////////////////////////////////////////////

  enum class LogsSourceType {
    ALL_LOGS,
    FAILING_ONLY
  };

  typedef ::google::protobuf::RepeatedPtrField<Logs> LogsList;

// -----------------------------------------------------------------------------
// --SECTION--                                                 public constants
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief maximal number of lines in a logs response
////////////////////////////////////////////////////////////////////////////////

  extern const size_t OVERALL_LINES_LIMIT;

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief collects logs of all pods of a cluster
///
/// Each pod gets one entry per container and init container with output and
/// one entry with an empty container name holding the events of the pod.
/// Waiting containers are skipped. The result is cut down to
/// OVERALL_LINES_LIMIT lines.
////////////////////////////////////////////////////////////////////////////////

  Result collectLogs (KubeCtl&,
                      LogsSourceType,
                      const std::string& clusterName,
                      LogsList* logs);

////////////////////////////////////////////////////////////////////////////////
/// @brief renders the events of a pod
////////////////////////////////////////////////////////////////////////////////

  Result podEvents (KubeCtl&,
                    const std::string& pod,
                    std::vector<std::string>& lines);

////////////////////////////////////////////////////////////////////////////////
/// @brief limits the overall number of lines
///
/// Lines are handed out round-robin, one per entry and round, until the
/// limit is reached or all entries are exhausted. Every entry keeps its
/// last lines.
////////////////////////////////////////////////////////////////////////////////

  void limitLines (LogsList* logs, size_t limit);
}

#endif

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------

// Local Variables:
// mode: outline-minor
// outline-regexp: "/// @brief\\|/// {@inheritDoc}\\|/// @page\\|// --SECTION--\\|/// @\\}"
// End:
