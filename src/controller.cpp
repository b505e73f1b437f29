////////////////////////////////////////////////////////////////////////////////
/// @brief dbaas controller
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

#include <signal.h>

#include <iostream>
#include <string>

#include "DbaasService.h"
#include "Global.h"
#include "HttpServer.h"

#include <glog/logging.h>

#include <stout/exit.hpp>
#include <stout/flags.hpp>
#include <stout/numify.hpp>
#include <stout/os.hpp>

using namespace std;
using namespace dbaas;

// -----------------------------------------------------------------------------
// --SECTION--                                                       class Flags
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief command line options
////////////////////////////////////////////////////////////////////////////////

class Flags : public virtual flags::FlagsBase {
  public:
    Flags () {
      add(&Flags::http_port,
          "http_port",
          "HTTP port to serve the API on",
          20201);

      add(&Flags::kubectl,
          "kubectl",
          "default kubectl binary",
          Global::kubectl());

      add(&Flags::kubectl_dir,
          "kubectl_dir",
          "directory holding versioned kubectl binaries",
          Global::kubectlDirectory());

      add(&Flags::request_timeout,
          "request_timeout",
          "timeout of a request in seconds",
          Global::requestTimeout());

      add(&Flags::log_lines,
          "log_lines",
          "number of log lines fetched per container",
          Global::logLines());

      add(&Flags::pmm_client_image,
          "pmm_client_image",
          "image of the PMM client sidecar",
          Global::pmmClientImage());

      add(&Flags::pxc_secret_template,
          "pxc_secret_template",
          "secret cloned for new XtraDB clusters",
          Global::xtradbSecretTemplate());

      add(&Flags::psmdb_secret_template,
          "psmdb_secret_template",
          "secret cloned for new MongoDB clusters",
          Global::mongodbSecretTemplate());

      add(&Flags::log_dir,
          "log_dir",
          "directory for log files, logs to stderr if empty",
          "");
    }

  public:
    int http_port;
    string kubectl;
    string kubectl_dir;
    int request_timeout;
    int log_lines;
    string pmm_client_image;
    string pxc_secret_template;
    string psmdb_secret_template;
    string log_dir;
};

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief update from env
////////////////////////////////////////////////////////////////////////////////

static void updateFromEnv (const string& name, string& var) {
  Option<string> env = os::getenv(name);

  if (env.isSome()) {
    var = env.get();
  }
}

////////////////////////////////////////////////////////////////////////////////
/// @brief update from env
////////////////////////////////////////////////////////////////////////////////

static void updateFromEnv (const string& name, int& var) {
  Option<string> env = os::getenv(name);

  if (env.isSome()) {
    Try<int> value = numify<int>(env.get());

    if (value.isError()) {
      EXIT(EXIT_FAILURE)
        << "cannot parse '" << name << "': " << value.error();
    }

    var = value.get();
  }
}

////////////////////////////////////////////////////////////////////////////////
/// @brief prints help
////////////////////////////////////////////////////////////////////////////////

static void usage (const string& argv0, const flags::FlagsBase& flags) {
  cerr << "Usage: " << argv0 << " [...]" << "\n"
       << "\n"
       << "Supported options:" << "\n"
       << flags.usage() << "\n"
       << "Supported environment:" << "\n"
       << "  DBAAS_HTTP_PORT      overrides '--http_port'\n"
       << "  DBAAS_KUBECTL        overrides '--kubectl'\n"
       << "  DBAAS_KUBECTL_DIR    overrides '--kubectl_dir'\n"
       << "  DBAAS_REQUEST_TIMEOUT\n"
       << "                       overrides '--request_timeout'\n"
       << "  DBAAS_LOG_LINES      overrides '--log_lines'\n"
       << "  DBAAS_PMM_CLIENT_IMAGE\n"
       << "                       overrides '--pmm_client_image'\n"
       << "  DBAAS_PXC_SECRET_TEMPLATE\n"
       << "                       overrides '--pxc_secret_template'\n"
       << "  DBAAS_PSMDB_SECRET_TEMPLATE\n"
       << "                       overrides '--psmdb_secret_template'\n"
       << "  DBAAS_LOG_DIR        overrides '--log_dir'\n"
       << "\n";
}

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief dbaas controller
////////////////////////////////////////////////////////////////////////////////

int main (int argc, char** argv) {

  // ...........................................................................
  // command line options
  // ...........................................................................

  Flags flags;

  auto load = flags.load(None(), argc, argv);

  if (load.isError()) {
    cerr << load.error() << endl;
    usage(argv[0], flags);
    exit(EXIT_FAILURE);
  }

  if (flags.help) {
    usage(argv[0], flags);
    exit(EXIT_SUCCESS);
  }

  updateFromEnv("DBAAS_HTTP_PORT", flags.http_port);
  updateFromEnv("DBAAS_KUBECTL", flags.kubectl);
  updateFromEnv("DBAAS_KUBECTL_DIR", flags.kubectl_dir);
  updateFromEnv("DBAAS_REQUEST_TIMEOUT", flags.request_timeout);
  updateFromEnv("DBAAS_LOG_LINES", flags.log_lines);
  updateFromEnv("DBAAS_PMM_CLIENT_IMAGE", flags.pmm_client_image);
  updateFromEnv("DBAAS_PXC_SECRET_TEMPLATE", flags.pxc_secret_template);
  updateFromEnv("DBAAS_PSMDB_SECRET_TEMPLATE", flags.psmdb_secret_template);
  updateFromEnv("DBAAS_LOG_DIR", flags.log_dir);

  // ...........................................................................
  // logging
  // ...........................................................................

  if (flags.log_dir.empty()) {
    FLAGS_logtostderr = true;
  }
  else {
    FLAGS_log_dir = flags.log_dir;
  }

  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();

  // ...........................................................................
  // global options
  // ...........................................................................

  if (flags.request_timeout < 1) {
    EXIT(EXIT_FAILURE) << "request timeout must be positive";
  }

  if (flags.log_lines < 1) {
    EXIT(EXIT_FAILURE) << "log lines must be positive";
  }

  LOG(INFO) << "kubectl: " << flags.kubectl;
  Global::setKubectl(flags.kubectl);
  LOG(INFO) << "kubectl directory: " << flags.kubectl_dir;
  Global::setKubectlDirectory(flags.kubectl_dir);
  LOG(INFO) << "request timeout: " << flags.request_timeout << "s";
  Global::setRequestTimeout(flags.request_timeout);
  LOG(INFO) << "log lines: " << flags.log_lines;
  Global::setLogLines(flags.log_lines);
  LOG(INFO) << "PMM client image: " << flags.pmm_client_image;
  Global::setPmmClientImage(flags.pmm_client_image);
  LOG(INFO) << "XtraDB secret template: " << flags.pxc_secret_template;
  Global::setXtradbSecretTemplate(flags.pxc_secret_template);
  LOG(INFO) << "MongoDB secret template: " << flags.psmdb_secret_template;
  Global::setMongodbSecretTemplate(flags.psmdb_secret_template);

  // ...........................................................................
  // signals
  // ...........................................................................

  // kubectl might go away while we write its input
  signal(SIGPIPE, SIG_IGN);

  // block termination signals, server threads inherit the mask
  sigset_t stopSignals;
  sigemptyset(&stopSignals);
  sigaddset(&stopSignals, SIGINT);
  sigaddset(&stopSignals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stopSignals, nullptr);

  // ...........................................................................
  // run
  // ...........................................................................

  DbaasService service;
  HttpServer http(service);

  LOG(INFO) << "http port: " << flags.http_port;
  Result res = http.start(flags.http_port);

  if (res.isError()) {
    EXIT(EXIT_FAILURE) << res.message();
  }

  int sig = 0;
  sigwait(&stopSignals, &sig);

  LOG(INFO) << "received signal " << sig << ", shutting down";
  http.stop();

  return EXIT_SUCCESS;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
