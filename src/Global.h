////////////////////////////////////////////////////////////////////////////////
/// @brief global defines and configuration objects
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

#ifndef DBAAS_GLOBAL_H
#define DBAAS_GLOBAL_H 1

#include <string>

namespace dbaas {

// -----------------------------------------------------------------------------
// --SECTION--                                                      class Global
// -----------------------------------------------------------------------------

  class Global {
    public:
      static std::string kubectl ();
      static void setKubectl (const std::string&);

      static std::string kubectlDirectory ();
      static void setKubectlDirectory (const std::string&);

      static int requestTimeout ();
      static void setRequestTimeout (int);

      static int logLines ();
      static void setLogLines (int);

      static std::string pmmClientImage ();
      static void setPmmClientImage (const std::string&);

      static std::string xtradbSecretTemplate ();
      static void setXtradbSecretTemplate (const std::string&);

      static std::string mongodbSecretTemplate ();
      static void setMongodbSecretTemplate (const std::string&);
  };
}

#endif
