////////////////////////////////////////////////////////////////////////////////
/// @brief cluster credentials
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

#ifndef DBAAS_SECRETS_H
#define DBAAS_SECRETS_H 1

#include "Result.h"

#include <map>
#include <string>
#include <vector>

#include <picojson.h>

namespace dbaas {
  class KubeCtl;

////////////////////////////////////////////////////////////////////////////////
/// @brief decoded content of a secret
////////////////////////////////////////////////////////////////////////////////

  typedef std::map<std::string, std::string> SecretData;

////////////////////////////////////////////////////////////////////////////////
/// @brief generates a random password
///
/// Only letters and digits are used, both operators reject some of the
/// special characters.
////////////////////////////////////////////////////////////////////////////////

  std::string generatePassword (size_t length = 24);

////////////////////////////////////////////////////////////////////////////////
/// @brief builds a secret document with base64 encoded data
////////////////////////////////////////////////////////////////////////////////

  picojson::value secretDocument (const std::string& name, const SecretData&);

////////////////////////////////////////////////////////////////////////////////
/// @brief reads and decodes a secret
////////////////////////////////////////////////////////////////////////////////

  Result getSecret (KubeCtl&, const std::string& name, SecretData&);

////////////////////////////////////////////////////////////////////////////////
/// @brief creates the secret of a new cluster
///
/// The data of the template secret is copied if the template exists. Then
/// @c values are set and every key in @c passwordKeys gets a fresh password.
////////////////////////////////////////////////////////////////////////////////

  Result provisionSecret (KubeCtl&,
                          const std::string& templateName,
                          const std::string& name,
                          const SecretData& values,
                          const std::vector<std::string>& passwordKeys);

////////////////////////////////////////////////////////////////////////////////
/// @brief deletes secrets, failures are only logged
////////////////////////////////////////////////////////////////////////////////

  void deleteSecrets (KubeCtl&, const std::vector<std::string>& names);
}

#endif

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------

// Local Variables:
// mode: outline-minor
// outline-regexp: "/// @brief\\|/// {@inheritDoc}\\|/// @page\\|// --SECTION--\\|/// @\\}"
// End:
