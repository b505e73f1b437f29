////////////////////////////////////////////////////////////////////////////////
/// @brief kubectl client
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

#ifndef DBAAS_KUBECTL_H
#define DBAAS_KUBECTL_H 1

#include "Result.h"

#include <chrono>
#include <string>
#include <vector>

#include <picojson.h>

namespace dbaas {

// -----------------------------------------------------------------------------
// --SECTION--                                                     class KubeCtl
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief client for the cluster management tool
///
/// Every call is a single synchronous invocation. An object that does not
/// exist is reported as ErrorCode::NOT_FOUND, every other failure as
/// ErrorCode::INTERNAL with the command line and the captured stderr.
////////////////////////////////////////////////////////////////////////////////

  class KubeCtl {

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

    public:

      virtual ~KubeCtl ();

// -----------------------------------------------------------------------------
// --SECTION--                                            virtual public methods
// -----------------------------------------------------------------------------

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief runs the tool with the given arguments
///
/// If @c input is not null, it is written indented to the standard input of
/// the tool. The standard output is stored in @c output.
////////////////////////////////////////////////////////////////////////////////

      virtual Result run (const std::vector<std::string>& args,
                          const picojson::value* input,
                          std::string& output) = 0;

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief fetches an object or a list of objects as json
///
/// An empty @c name lists all objects of the kind.
////////////////////////////////////////////////////////////////////////////////

      Result get (const std::string& kind,
                  const std::string& name,
                  picojson::value& result);

////////////////////////////////////////////////////////////////////////////////
/// @brief fetches a list of objects matching a label selector
////////////////////////////////////////////////////////////////////////////////

      Result getSelected (const std::string& kind,
                          const std::string& selector,
                          picojson::value& result);

////////////////////////////////////////////////////////////////////////////////
/// @brief creates or updates an object
////////////////////////////////////////////////////////////////////////////////

      Result apply (const picojson::value&);

////////////////////////////////////////////////////////////////////////////////
/// @brief deletes an object
////////////////////////////////////////////////////////////////////////////////

      Result remove (const picojson::value&);

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

    private:

      Result runJson (const std::vector<std::string>& args,
                      picojson::value& result);
  };

// -----------------------------------------------------------------------------
// --SECTION--                                              class KubeCtlProcess
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief client executing a kubectl binary
///
/// The kubeconfig is written into a private temporary directory which lives
/// as long as the client. The tool runs in its own process group, which is
/// killed when the deadline expires.
////////////////////////////////////////////////////////////////////////////////

  class KubeCtlProcess : public KubeCtl {

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

    public:

      KubeCtlProcess (const std::string& kubeconfig,
                      std::chrono::steady_clock::time_point deadline);

      ~KubeCtlProcess ();

      KubeCtlProcess (const KubeCtlProcess&) = delete;
      KubeCtlProcess& operator= (const KubeCtlProcess&) = delete;

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

    public:

////////////////////////////////////////////////////////////////////////////////
/// @brief writes the kubeconfig and selects the kubectl version
////////////////////////////////////////////////////////////////////////////////

      Result init ();

////////////////////////////////////////////////////////////////////////////////
/// {@inheritDoc}
////////////////////////////////////////////////////////////////////////////////

      Result run (const std::vector<std::string>& args,
                  const picojson::value* input,
                  std::string& output) override;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

    private:

      Result execute (const std::vector<std::string>& args,
                      const std::string& input,
                      std::string& output);

      void selectVersion ();

// -----------------------------------------------------------------------------
// --SECTION--                                                 private variables
// -----------------------------------------------------------------------------

    private:

      const std::string _kubeconfig;
      const std::chrono::steady_clock::time_point _deadline;

      std::string _directory;
      std::string _kubeconfigPath;
      std::vector<std::string> _command;
  };
}

#endif

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------

// Local Variables:
// mode: outline-minor
// outline-regexp: "/// @brief\\|/// {@inheritDoc}\\|/// @page\\|// --SECTION--\\|/// @\\}"
// End:
