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

#include "Global.h"

using namespace dbaas;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private variables
// -----------------------------------------------------------------------------

static string KUBECTL = "/opt/dbaas-tools/bin/kubectl-1.16";
static string KUBECTL_DIRECTORY = "/opt/dbaas-tools/bin";
static int REQUEST_TIMEOUT = 120;
static int LOG_LINES = 3000;
static string PMM_CLIENT_IMAGE = "percona/pmm-client:2";
static string XTRADB_SECRET_TEMPLATE = "my-cluster-secrets";
static string MONGODB_SECRET_TEMPLATE = "my-cluster-name-secrets";

// -----------------------------------------------------------------------------
// --SECTION--                                             static public methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief default kubectl binary
////////////////////////////////////////////////////////////////////////////////

string Global::kubectl () {
  return KUBECTL;
}

void Global::setKubectl (const string& path) {
  KUBECTL = path;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief directory holding versioned kubectl binaries
////////////////////////////////////////////////////////////////////////////////

string Global::kubectlDirectory () {
  return KUBECTL_DIRECTORY;
}

void Global::setKubectlDirectory (const string& path) {
  KUBECTL_DIRECTORY = path;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief request timeout in seconds
////////////////////////////////////////////////////////////////////////////////

int Global::requestTimeout () {
  return REQUEST_TIMEOUT;
}

void Global::setRequestTimeout (int seconds) {
  REQUEST_TIMEOUT = seconds;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief tail lines per container
////////////////////////////////////////////////////////////////////////////////

int Global::logLines () {
  return LOG_LINES;
}

void Global::setLogLines (int lines) {
  LOG_LINES = lines;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief pmm client image
////////////////////////////////////////////////////////////////////////////////

string Global::pmmClientImage () {
  return PMM_CLIENT_IMAGE;
}

void Global::setPmmClientImage (const string& image) {
  PMM_CLIENT_IMAGE = image;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief secret templates
////////////////////////////////////////////////////////////////////////////////

string Global::xtradbSecretTemplate () {
  return XTRADB_SECRET_TEMPLATE;
}

void Global::setXtradbSecretTemplate (const string& name) {
  XTRADB_SECRET_TEMPLATE = name;
}

string Global::mongodbSecretTemplate () {
  return MONGODB_SECRET_TEMPLATE;
}

void Global::setMongodbSecretTemplate (const string& name) {
  MONGODB_SECRET_TEMPLATE = name;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
