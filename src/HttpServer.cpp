////////////////////////////////////////////////////////////////////////////////
/// @brief http server
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

#include "HttpServer.h"

#include "DbaasService.h"
#include "utils.h"

#include <glog/logging.h>
#include <picojson.h>

#include <string.h>

#include <map>
#include <string>

using namespace std;
using namespace dbaas;

#define GET             0
#define POST            1

#if MHD_VERSION >= 0x00097002
typedef enum MHD_Result MhdResult;
#else
typedef int MhdResult;
#endif

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief http status of a result
////////////////////////////////////////////////////////////////////////////////

int dbaas::httpStatus (const Result& res) {
  switch (res.code()) {
    case ErrorCode::NONE:             return MHD_HTTP_OK;
    case ErrorCode::NOT_FOUND:        return MHD_HTTP_NOT_FOUND;
    case ErrorCode::ALREADY_EXISTS:   return MHD_HTTP_CONFLICT;
    case ErrorCode::NOT_READY:        return MHD_HTTP_PRECONDITION_FAILED;
    case ErrorCode::INVALID_ARGUMENT: return MHD_HTTP_BAD_REQUEST;
    case ErrorCode::INTERNAL:         return MHD_HTTP_INTERNAL_SERVER_ERROR;
  }

  return MHD_HTTP_INTERNAL_SERVER_ERROR;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief error body of a result
////////////////////////////////////////////////////////////////////////////////

string dbaas::errorBody (const Result& res) {
  picojson::object result;
  result["code"] = picojson::value(toString(res.code()));
  result["message"] = picojson::value(res.message());

  return picojson::value(result).serialize();
}

// -----------------------------------------------------------------------------
// --SECTION--                                              class HttpServerImpl
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief http server implementation class
////////////////////////////////////////////////////////////////////////////////

class dbaas::HttpServerImpl {
  public:
    typedef int (HttpServerImpl::*PostMethod)(const string&, string&);

  public:
    explicit HttpServerImpl (DbaasService& service)
      : _service(service) {
    }

  public:
    static PostMethod postMethod (const string& url);

  public:
    int POST_XTRADB_LIST (const string&, string&);
    int POST_XTRADB_CREATE (const string&, string&);
    int POST_XTRADB_UPDATE (const string&, string&);
    int POST_XTRADB_DELETE (const string&, string&);
    int POST_XTRADB_RESTART (const string&, string&);
    int POST_XTRADB_CREDENTIALS (const string&, string&);

    int POST_MONGODB_LIST (const string&, string&);
    int POST_MONGODB_CREATE (const string&, string&);
    int POST_MONGODB_UPDATE (const string&, string&);
    int POST_MONGODB_DELETE (const string&, string&);
    int POST_MONGODB_RESTART (const string&, string&);
    int POST_MONGODB_CREDENTIALS (const string&, string&);

    int POST_KUBERNETES_CHECK (const string&, string&);
    int POST_LOGS_GET (const string&, string&);

    string GET_V1_HEALTH ();

  private:
    template<typename REQUEST, typename RESPONSE>
    int rpc (const string& body,
             string& out,
             Result (DbaasService::*method)(const REQUEST&, RESPONSE*));

  private:
    DbaasService& _service;
};

////////////////////////////////////////////////////////////////////////////////
/// @brief finds the handler of a POST url
////////////////////////////////////////////////////////////////////////////////

HttpServerImpl::PostMethod HttpServerImpl::postMethod (const string& url) {
  static const map<string, PostMethod> ROUTES = {
    { "/v1/XtraDBClusters/List",           &HttpServerImpl::POST_XTRADB_LIST },
    { "/v1/XtraDBClusters/Create",         &HttpServerImpl::POST_XTRADB_CREATE },
    { "/v1/XtraDBClusters/Update",         &HttpServerImpl::POST_XTRADB_UPDATE },
    { "/v1/XtraDBClusters/Delete",         &HttpServerImpl::POST_XTRADB_DELETE },
    { "/v1/XtraDBClusters/Restart",        &HttpServerImpl::POST_XTRADB_RESTART },
    { "/v1/XtraDBClusters/GetCredentials", &HttpServerImpl::POST_XTRADB_CREDENTIALS },

    { "/v1/MongoDBClusters/List",           &HttpServerImpl::POST_MONGODB_LIST },
    { "/v1/MongoDBClusters/Create",         &HttpServerImpl::POST_MONGODB_CREATE },
    { "/v1/MongoDBClusters/Update",         &HttpServerImpl::POST_MONGODB_UPDATE },
    { "/v1/MongoDBClusters/Delete",         &HttpServerImpl::POST_MONGODB_DELETE },
    { "/v1/MongoDBClusters/Restart",        &HttpServerImpl::POST_MONGODB_RESTART },
    { "/v1/MongoDBClusters/GetCredentials", &HttpServerImpl::POST_MONGODB_CREDENTIALS },

    { "/v1/KubernetesClusters/CheckConnection", &HttpServerImpl::POST_KUBERNETES_CHECK },
    { "/v1/Logs/Get",                           &HttpServerImpl::POST_LOGS_GET }
  };

  auto iter = ROUTES.find(url);

  if (iter == ROUTES.end()) {
    return nullptr;
  }

  return iter->second;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief parses the request, calls the service and renders the response
////////////////////////////////////////////////////////////////////////////////

template<typename REQUEST, typename RESPONSE>
int HttpServerImpl::rpc (const string& body,
                         string& out,
                         Result (DbaasService::*method)(const REQUEST&, RESPONSE*)) {
  REQUEST request;
  string err = fromJson(body.empty() ? "{}" : body, &request);

  if (! err.empty()) {
    Result res = Result::invalidArgument("cannot parse request: " + err);
    out = errorBody(res);
    return httpStatus(res);
  }

  RESPONSE response;
  Result res = (_service.*method)(request, &response);

  if (res.isError()) {
    LOG(WARNING)
    << "request failed with " << toString(res.code()) << ": " << res.message();

    out = errorBody(res);
    return httpStatus(res);
  }

  out = toJson(response);
  return MHD_HTTP_OK;
}

// .............................................................................
// XtraDB clusters
// .............................................................................

int HttpServerImpl::POST_XTRADB_LIST (const string& body, string& out) {
  return rpc(body, out, &DbaasService::listXtraDBClusters);
}

int HttpServerImpl::POST_XTRADB_CREATE (const string& body, string& out) {
  return rpc(body, out, &DbaasService::createXtraDBCluster);
}

int HttpServerImpl::POST_XTRADB_UPDATE (const string& body, string& out) {
  return rpc(body, out, &DbaasService::updateXtraDBCluster);
}

int HttpServerImpl::POST_XTRADB_DELETE (const string& body, string& out) {
  return rpc(body, out, &DbaasService::deleteXtraDBCluster);
}

int HttpServerImpl::POST_XTRADB_RESTART (const string& body, string& out) {
  return rpc(body, out, &DbaasService::restartXtraDBCluster);
}

int HttpServerImpl::POST_XTRADB_CREDENTIALS (const string& body, string& out) {
  return rpc(body, out, &DbaasService::getXtraDBClusterCredentials);
}

// .............................................................................
// MongoDB clusters
// .............................................................................

int HttpServerImpl::POST_MONGODB_LIST (const string& body, string& out) {
  return rpc(body, out, &DbaasService::listMongoDBClusters);
}

int HttpServerImpl::POST_MONGODB_CREATE (const string& body, string& out) {
  return rpc(body, out, &DbaasService::createMongoDBCluster);
}

int HttpServerImpl::POST_MONGODB_UPDATE (const string& body, string& out) {
  return rpc(body, out, &DbaasService::updateMongoDBCluster);
}

int HttpServerImpl::POST_MONGODB_DELETE (const string& body, string& out) {
  return rpc(body, out, &DbaasService::deleteMongoDBCluster);
}

int HttpServerImpl::POST_MONGODB_RESTART (const string& body, string& out) {
  return rpc(body, out, &DbaasService::restartMongoDBCluster);
}

int HttpServerImpl::POST_MONGODB_CREDENTIALS (const string& body, string& out) {
  return rpc(body, out, &DbaasService::getMongoDBClusterCredentials);
}

// .............................................................................
// Kubernetes clusters and logs
// .............................................................................

int HttpServerImpl::POST_KUBERNETES_CHECK (const string& body, string& out) {
  return rpc(body, out, &DbaasService::checkConnection);
}

int HttpServerImpl::POST_LOGS_GET (const string& body, string& out) {
  return rpc(body, out, &DbaasService::getLogs);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief GET /v1/health.json
////////////////////////////////////////////////////////////////////////////////

string HttpServerImpl::GET_V1_HEALTH () {
  picojson::object result;
  result["health"] = picojson::value(true);

  return picojson::value(result).serialize();
}

// -----------------------------------------------------------------------------
// --SECTION--                                                  helper functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief connection structure
////////////////////////////////////////////////////////////////////////////////

struct ConnectionInfo {
  int type;

  bool health;
  HttpServerImpl::PostMethod postMethod;

  string body;
};

////////////////////////////////////////////////////////////////////////////////
/// @brief queues a json response
////////////////////////////////////////////////////////////////////////////////

static MhdResult sendJson (struct MHD_Connection* connection,
                           int status,
                           const string& body) {
  struct MHD_Response* response = MHD_create_response_from_buffer(
    body.length(), (void*) body.c_str(),
    MHD_RESPMEM_MUST_COPY);

  if (response == nullptr) {
    return MHD_NO;
  }

  MHD_add_response_header(
    response,
    "Content-Type",
    "application/json; charset=utf-8");

  MhdResult ret = MHD_queue_response(connection, status, response);
  MHD_destroy_response(response);

  return ret;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief callback if request has completed
////////////////////////////////////////////////////////////////////////////////

static void requestCompleted (void* cls,
                              struct MHD_Connection* connection,
                              void** con_cls,
                              enum MHD_RequestTerminationCode toe) {
  ConnectionInfo* conInfo = reinterpret_cast<ConnectionInfo*>(*con_cls);

  if (nullptr == conInfo) {
    return;
  }

  delete conInfo;
  *con_cls = nullptr;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief callback for daemon
////////////////////////////////////////////////////////////////////////////////

static MhdResult answerRequest (
  void* cls,
  struct MHD_Connection* connection,
  const char* url,
  const char* method,
  const char* version,
  const char* upload_data,
  size_t* upload_data_size,
  void** ptr) {
  HttpServerImpl* me = reinterpret_cast<HttpServerImpl*>(cls);

  // find correct callback
  if (*ptr == nullptr) {
    ConnectionInfo* conInfo = new ConnectionInfo();

    conInfo->health = false;
    conInfo->postMethod = nullptr;

    if (0 == strcmp(method, MHD_HTTP_METHOD_GET)) {
      conInfo->type = GET;
      conInfo->health = (0 == strcmp(url, "/v1/health.json"));
    }
    else if (0 == strcmp(method, MHD_HTTP_METHOD_POST)) {
      conInfo->type = POST;
      conInfo->postMethod = HttpServerImpl::postMethod(url);
    }
    else {
      delete conInfo;
      return MHD_NO;
    }

    *ptr = reinterpret_cast<void*>(conInfo);
    return MHD_YES;
  }

  ConnectionInfo* conInfo = reinterpret_cast<ConnectionInfo*>(*ptr);

  // collect the body
  if (*upload_data_size != 0) {
    conInfo->body += string(upload_data, *upload_data_size);
    *upload_data_size = 0;

    return MHD_YES;
  }

  LOG(INFO)
  << "handling http request '" << method << " " << url << "'";

  // handle GET
  if (conInfo->health) {
    return sendJson(connection, MHD_HTTP_OK, me->GET_V1_HEALTH());
  }

  // handle POST
  if (conInfo->postMethod != nullptr) {
    string out;
    int status = (me->*(conInfo->postMethod))(conInfo->body, out);

    return sendJson(connection, status, out);
  }

  Result res = Result::notFound("unknown path '" + string(url) + "'");
  return sendJson(connection, httpStatus(res), errorBody(res));
}

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief constructor
////////////////////////////////////////////////////////////////////////////////

HttpServer::HttpServer (DbaasService& service)
  : _daemon(nullptr) {
  _impl = new HttpServerImpl(service);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief destructor
////////////////////////////////////////////////////////////////////////////////

HttpServer::~HttpServer () {
  stop();
  delete _impl;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief starts the server on a given port
////////////////////////////////////////////////////////////////////////////////

Result HttpServer::start (int port) {
  _daemon = MHD_start_daemon (
    MHD_USE_THREAD_PER_CONNECTION | MHD_USE_SELECT_INTERNALLY,
    port,
    nullptr, nullptr,
    &answerRequest, (void*) _impl,
    MHD_OPTION_CONNECTION_TIMEOUT, (unsigned int) 600,
    MHD_OPTION_NOTIFY_COMPLETED, requestCompleted, nullptr,
    MHD_OPTION_END);

  if (_daemon == nullptr) {
    return Result::internalError(
      "cannot start http server on port " + to_string(port));
  }

  LOG(INFO) << "http server listening on port " << port;
  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief stops the server
////////////////////////////////////////////////////////////////////////////////

void HttpServer::stop () {
  if (_daemon != nullptr) {
    MHD_stop_daemon(_daemon);
    _daemon = nullptr;
  }
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
