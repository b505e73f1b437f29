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

#include "KubeCtl.h"

#include "Global.h"
#include "utils.h"

#include <ctype.h>
#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>

#include <glog/logging.h>

#include <stout/numify.hpp>
#include <stout/os.hpp>
#include <stout/stringify.hpp>

using namespace dbaas;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief markers of a missing object in the stderr of kubectl
////////////////////////////////////////////////////////////////////////////////

static bool isNotFound (const string& err) {
  return err.find("not found") != string::npos
      || err.find("NotFound") != string::npos;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief closes both ends of a pipe
////////////////////////////////////////////////////////////////////////////////

static void closePipe (int* fds) {
  for (int i = 0;  i < 2;  ++i) {
    if (fds[i] != -1) {
      close(fds[i]);
      fds[i] = -1;
    }
  }
}

////////////////////////////////////////////////////////////////////////////////
/// @brief low level exec, never returns
////////////////////////////////////////////////////////////////////////////////

static void executeChild (const vector<string>& cmd,
                          int* in, int* out, int* err) {

  // kill the tool if the controller goes away
  prctl(PR_SET_PDEATHSIG, SIGKILL);

  // own process group, so that a timeout also reaches the grandchildren
  setpgid(0, 0);

  // the controller blocks the termination signals in all threads
  sigset_t all;
  sigemptyset(&all);
  sigprocmask(SIG_SETMASK, &all, nullptr);

  dup2(in[0], 0);
  dup2(out[1], 1);
  dup2(err[1], 2);

  closePipe(in);
  closePipe(out);
  closePipe(err);

  signal(SIGPIPE, SIG_DFL);

  vector<char*> argv;

  for (const auto& a : cmd) {
    argv.push_back(const_cast<char*>(a.c_str()));
  }

  argv.push_back(nullptr);

  execvp(argv[0], argv.data());

  // upps, exec failed
  _exit(127);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief reads what is available from a pipe, closes it at end of file
////////////////////////////////////////////////////////////////////////////////

static void drain (int& fd, string& buffer) {
  char chunk[4096];
  ssize_t n = read(fd, chunk, sizeof(chunk));

  if (n > 0) {
    buffer.append(chunk, n);
  }
  else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
    close(fd);
    fd = -1;
  }
}

////////////////////////////////////////////////////////////////////////////////
/// @brief the default kubectl command
////////////////////////////////////////////////////////////////////////////////

static vector<string> defaultCommand () {
  string kubectl = Global::kubectl();

  if (os::exists(kubectl)) {
    return { kubectl };
  }

  return { "minikube", "kubectl", "--" };
}

// -----------------------------------------------------------------------------
// --SECTION--                                                     class KubeCtl
// -----------------------------------------------------------------------------

KubeCtl::~KubeCtl () {
}

////////////////////////////////////////////////////////////////////////////////
/// @brief fetches an object or a list of objects as json
////////////////////////////////////////////////////////////////////////////////

Result KubeCtl::get (const string& kind,
                     const string& name,
                     picojson::value& result) {
  vector<string> args = { "get", "-o=json", kind };

  if (! name.empty()) {
    args.push_back(name);
  }

  return runJson(args, result);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief fetches a list of objects matching a label selector
////////////////////////////////////////////////////////////////////////////////

Result KubeCtl::getSelected (const string& kind,
                             const string& selector,
                             picojson::value& result) {
  return runJson({ "get", "-o=json", kind, "-l", selector }, result);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief creates or updates an object
////////////////////////////////////////////////////////////////////////////////

Result KubeCtl::apply (const picojson::value& resource) {
  string output;
  return run({ "apply", "-f", "-" }, &resource, output);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief deletes an object
////////////////////////////////////////////////////////////////////////////////

Result KubeCtl::remove (const picojson::value& resource) {
  string output;
  return run({ "delete", "-f", "-" }, &resource, output);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief runs the tool and parses its output
////////////////////////////////////////////////////////////////////////////////

Result KubeCtl::runJson (const vector<string>& args, picojson::value& result) {
  string output;
  Result res = run(args, nullptr, output);

  if (res.isError()) {
    return res;
  }

  string err = picojson::parse(result, output);

  if (! err.empty()) {
    return Result::internalError(
      "cannot parse output of '" + join(args, " ") + "': " + err);
  }

  return Result::noError();
}

// -----------------------------------------------------------------------------
// --SECTION--                                              class KubeCtlProcess
// -----------------------------------------------------------------------------

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief constructor
////////////////////////////////////////////////////////////////////////////////

KubeCtlProcess::KubeCtlProcess (const string& kubeconfig,
                                chrono::steady_clock::time_point deadline)
  : _kubeconfig(kubeconfig),
    _deadline(deadline),
    _command(defaultCommand()) {
}

////////////////////////////////////////////////////////////////////////////////
/// @brief destructor
////////////////////////////////////////////////////////////////////////////////

KubeCtlProcess::~KubeCtlProcess () {
  if (_directory.empty()) {
    return;
  }

  Try<Nothing> removed = os::rmdir(_directory);

  if (removed.isError()) {
    LOG(ERROR)
    << "cannot remove kubeconfig directory '" << _directory << "': "
    << removed.error();
  }
}

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief writes the kubeconfig and selects the kubectl version
////////////////////////////////////////////////////////////////////////////////

Result KubeCtlProcess::init () {
  if (! _kubeconfig.empty()) {
    Try<string> directory = os::mkdtemp("/tmp/dbaas-kubeconfig-XXXXXX");

    if (directory.isError()) {
      return Result::internalError(
        "cannot create kubeconfig directory: " + directory.error());
    }

    _directory = directory.get();
    _kubeconfigPath = _directory + "/kubeconfig.json";

    int fd = open(_kubeconfigPath.c_str(),
                  O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                  S_IRUSR | S_IWUSR);

    if (fd < 0) {
      return Result::internalError(
        "cannot create '" + _kubeconfigPath + "': " + strerror(errno));
    }

    Try<Nothing> written = os::write(fd, _kubeconfig);
    close(fd);

    if (written.isError()) {
      return Result::internalError(
        "cannot write '" + _kubeconfigPath + "': " + written.error());
    }
  }

  selectVersion();
  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// {@inheritDoc}
////////////////////////////////////////////////////////////////////////////////

Result KubeCtlProcess::run (const vector<string>& args,
                            const picojson::value* input,
                            string& output) {
  string data;

  if (input != nullptr) {
    data = input->serialize(true);
  }

  return execute(args, data, output);
}

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief picks a kubectl binary matching the server version
///
/// kubectl supports one minor version of skew in either direction. The
/// default binary is kept if the server cannot be asked.
////////////////////////////////////////////////////////////////////////////////

void KubeCtlProcess::selectVersion () {
  string output;
  Result res = execute({ "version", "-o", "json" }, "", output);

  if (res.isError()) {
    LOG(WARNING)
    << "cannot determine server version, using default kubectl";
    return;
  }

  picojson::value version;
  string err = picojson::parse(version, output);

  if (! err.empty()) {
    LOG(WARNING)
    << "cannot parse kubectl version: " << err;
    return;
  }

  // EKS reports minor versions like "16+"
  string majorStr = jsonString(version, { "serverVersion", "major" });
  string minorStr = jsonString(version, { "serverVersion", "minor" });

  while (! minorStr.empty() && ! isdigit(static_cast<unsigned char>(minorStr[minorStr.size() - 1]))) {
    minorStr.erase(minorStr.size() - 1);
  }

  Try<int> major = numify<int>(majorStr);
  Try<int> minor = numify<int>(minorStr);

  if (major.isError() || minor.isError()) {
    LOG(WARNING)
    << "unexpected server version '" << majorStr << "." << minorStr << "'";
    return;
  }

  for (int delta : { 1, 0, -1 }) {
    string path = Global::kubectlDirectory() + "/kubectl-"
                + stringify(major.get()) + "." + stringify(minor.get() + delta);

    if (os::exists(path)) {
      VLOG(1) << "using " << path;
      _command = { path };
      return;
    }
  }
}

////////////////////////////////////////////////////////////////////////////////
/// @brief forks kubectl, feeds it and collects its output
////////////////////////////////////////////////////////////////////////////////

Result KubeCtlProcess::execute (const vector<string>& args,
                                const string& input,
                                string& output) {
  vector<string> cmd = _command;
  cmd.insert(cmd.end(), args.begin(), args.end());

  if (! _kubeconfigPath.empty()) {
    cmd.push_back("--kubeconfig=" + _kubeconfigPath);
  }

  string cmdline = join(cmd, " ");

  VLOG(1) << "executing " << cmdline;

  int in[2] = { -1, -1 };
  int out[2] = { -1, -1 };
  int err[2] = { -1, -1 };

  if (pipe2(in, O_CLOEXEC) != 0
   || pipe2(out, O_CLOEXEC) != 0
   || pipe2(err, O_CLOEXEC) != 0) {
    string msg = strerror(errno);
    closePipe(in);
    closePipe(out);
    closePipe(err);
    return Result::internalError("cannot create pipes: " + msg);
  }

  pid_t pid = fork();

  // child process
  if (pid == 0) {
    executeChild(cmd, in, out, err);
  }

  // parent
  if (pid == -1) {
    string msg = strerror(errno);
    closePipe(in);
    closePipe(out);
    closePipe(err);
    return Result::internalError("fork failed: " + msg);
  }

  // also in the parent, the child may not have run yet
  setpgid(pid, pid);

  close(in[0]);
  close(out[1]);
  close(err[1]);

  int inFd = in[1];
  int outFd = out[0];
  int errFd = err[0];

  if (input.empty()) {
    close(inFd);
    inFd = -1;
  }

  string stdoutData;
  string stderrData;
  size_t written = 0;
  bool expired = false;

  while (outFd != -1 || errFd != -1) {
    auto now = chrono::steady_clock::now();

    if (_deadline <= now) {
      expired = true;
      break;
    }

    auto remaining =
      chrono::duration_cast<chrono::milliseconds>(_deadline - now).count();

    vector<pollfd> fds;

    if (inFd != -1) {
      fds.push_back({ inFd, POLLOUT, 0 });
    }

    if (outFd != -1) {
      fds.push_back({ outFd, POLLIN, 0 });
    }

    if (errFd != -1) {
      fds.push_back({ errFd, POLLIN, 0 });
    }

    int n = poll(fds.data(), fds.size(), static_cast<int>(remaining));

    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }

      LOG(ERROR)
      << "poll failed: " << strerror(errno);
      expired = true;
      break;
    }

    for (const auto& p : fds) {
      if (p.revents == 0) {
        continue;
      }

      if (p.fd == inFd) {
        size_t len = min(input.size() - written, static_cast<size_t>(PIPE_BUF));
        ssize_t w = write(inFd, input.data() + written, len);

        if (w > 0) {
          written += w;
        }

        if (written == input.size() || (w < 0 && errno != EINTR && errno != EAGAIN)) {
          close(inFd);
          inFd = -1;
        }
      }
      else if (p.fd == outFd) {
        drain(outFd, stdoutData);
      }
      else if (p.fd == errFd) {
        drain(errFd, stderrData);
      }
    }
  }

  if (inFd != -1) {
    close(inFd);
  }

  if (outFd != -1) {
    close(outFd);
  }

  if (errFd != -1) {
    close(errFd);
  }

  int s = 0;

  // a child may close its output and keep running
  while (! expired) {
    pid_t r = waitpid(pid, &s, WNOHANG);

    if (r == pid) {
      break;
    }

    if (r == -1 && errno != EINTR) {
      string msg = strerror(errno);
      kill(-pid, SIGKILL);
      return Result::internalError("waitpid failed: " + msg + "\ncmd: " + cmdline);
    }

    if (_deadline <= chrono::steady_clock::now()) {
      expired = true;
      break;
    }

    usleep(10 * 1000);
  }

  if (expired) {
    kill(-pid, SIGKILL);

    while (waitpid(pid, &s, 0) == -1 && errno == EINTR) {
    }

    LOG(WARNING)
    << "killed '" << cmdline << "', deadline exceeded";

    return Result::internalError("deadline exceeded\ncmd: " + cmdline);
  }

  string status;

  if (WIFEXITED(s)) {
    if (WEXITSTATUS(s) == 0) {
      output = stdoutData;
      return Result::noError();
    }

    status = "exit status " + stringify(WEXITSTATUS(s));
  }
  else if (WIFSIGNALED(s)) {
    status = "signal: " + string(strsignal(WTERMSIG(s)));
  }
  else {
    status = "stopped";
  }

  LOG(WARNING)
  << "'" << cmdline << "' failed with " << status << ": " << stderrData;

  string message = status + "\ncmd: " + cmdline + "\nstderr: " + stderrData;

  if (isNotFound(stderrData)) {
    return Result::notFound(message);
  }

  return Result::internalError(message);
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
