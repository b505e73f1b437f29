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

#include "Secrets.h"

#include "KubeCtl.h"
#include "utils.h"

#include <random>

#include <glog/logging.h>

using namespace dbaas;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private variables
// -----------------------------------------------------------------------------

static const string PASSWORD_CHARACTERS =
  "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief generates a random password
////////////////////////////////////////////////////////////////////////////////

string dbaas::generatePassword (size_t length) {
  random_device rd;
  uniform_int_distribution<size_t> dist(0, PASSWORD_CHARACTERS.size() - 1);

  string result;
  result.reserve(length);

  for (size_t i = 0;  i < length;  ++i) {
    result += PASSWORD_CHARACTERS[dist(rd)];
  }

  return result;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief builds a secret document with base64 encoded data
////////////////////////////////////////////////////////////////////////////////

picojson::value dbaas::secretDocument (const string& name,
                                       const SecretData& data) {
  picojson::object encoded;

  for (const auto& kv : data) {
    encoded[kv.first] = picojson::value(encodeBase64(kv.second));
  }

  picojson::object metadata;
  metadata["name"] = picojson::value(name);

  picojson::object secret;
  secret["apiVersion"] = picojson::value("v1");
  secret["kind"] = picojson::value("Secret");
  secret["metadata"] = picojson::value(metadata);
  secret["type"] = picojson::value("Opaque");
  secret["data"] = picojson::value(encoded);

  return picojson::value(secret);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief reads and decodes a secret
////////////////////////////////////////////////////////////////////////////////

Result dbaas::getSecret (KubeCtl& kubectl, const string& name, SecretData& data) {
  picojson::value secret;
  Result res = kubectl.get("secret", name, secret);

  if (res.isError()) {
    return res;
  }

  data.clear();

  const picojson::value& encoded = jsonGet(secret, { "data" });

  if (! encoded.is<picojson::object>()) {
    return Result::noError();
  }

  for (const auto& kv : encoded.get<picojson::object>()) {
    if (! kv.second.is<string>()) {
      continue;
    }

    Try<string> value = decodeBase64(kv.second.get<string>());

    if (value.isError()) {
      return Result::internalError(
        "secret '" + name + "' key '" + kv.first + "': " + value.error());
    }

    data[kv.first] = value.get();
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief creates the secret of a new cluster
////////////////////////////////////////////////////////////////////////////////

Result dbaas::provisionSecret (KubeCtl& kubectl,
                               const string& templateName,
                               const string& name,
                               const SecretData& values,
                               const vector<string>& passwordKeys) {
  SecretData data;

  if (! templateName.empty()) {
    Result res = getSecret(kubectl, templateName, data);

    if (res.is(ErrorCode::NOT_FOUND)) {
      LOG(INFO)
      << "no secret template '" << templateName << "', generating '"
      << name << "' from scratch";
    }
    else if (res.isError()) {
      return res.wrap("cannot read secret template");
    }
  }

  for (const auto& kv : values) {
    data[kv.first] = kv.second;
  }

  for (const auto& key : passwordKeys) {
    data[key] = generatePassword();
  }

  Result res = kubectl.apply(secretDocument(name, data));

  if (res.isError()) {
    return res.wrap("cannot create secret '" + name + "'");
  }

  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief deletes secrets, failures are only logged
////////////////////////////////////////////////////////////////////////////////

void dbaas::deleteSecrets (KubeCtl& kubectl, const vector<string>& names) {
  for (const auto& name : names) {
    Result res = kubectl.remove(secretDocument(name, SecretData()));

    if (res.isError()) {
      LOG(ERROR)
      << "cannot delete secret '" << name << "': " << res.message();
    }
  }
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
