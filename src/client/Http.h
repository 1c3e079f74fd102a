// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#ifndef CHUNKXFER_CLIENT_HTTP_H_
#define CHUNKXFER_CLIENT_HTTP_H_

#include <stdint.h>

#include <iostream>
#include <map>
#include <string>

#include "boost/shared_ptr.hpp"

namespace CX {

namespace Client {

namespace Http {

struct HttpMethod {
  enum Value { Get, Head, Put, Post, Delete };
};

std::string HttpMethodToString(HttpMethod::Value method);

// Status codes the transfer core reacts to
struct HttpStatus {
  enum Value {
    RequestNotMade = 0,
    Ok = 200,
    Created = 201,
    Accepted = 202,
    NoContent = 204,
    PartialContent = 206,
    NotModified = 304,
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,
    RequestTimeout = 408,
    Conflict = 409,
    PreconditionFailed = 412,
    RequestedRangeNotSatisfiable = 416,
    TooManyRequests = 429,
    InternalServerError = 500,
    BadGateway = 502,
    ServiceUnavailable = 503,
    GatewayTimeout = 504
  };
};

// Get status name, e.g. "PreconditionFailed" for 412
//
// @param  : status code
// @return : name, "UnknownStatus" for unlisted codes
std::string HttpStatusToName(int status);

bool IsSuccessStatus(int status);

// Header names
extern const char *const CONTENT_LENGTH;
extern const char *const CONTENT_MD5;
extern const char *const CONTENT_RANGE;
extern const char *const CONTENT_TYPE;
extern const char *const ETAG;
extern const char *const IF_MATCH;
extern const char *const IF_MODIFIED_SINCE;
extern const char *const IF_NONE_MATCH;
extern const char *const IF_UNMODIFIED_SINCE;
extern const char *const LAST_MODIFIED;
extern const char *const RANGE;

struct CaseInsensitiveLess {
  bool operator()(const std::string &lhs, const std::string &rhs) const;
};

typedef std::map<std::string, std::string, CaseInsensitiveLess> HeaderMap;

class HttpRequest {
 public:
  HttpRequest() : m_method(HttpMethod::Get), m_contentLength(0) {}
  HttpRequest(HttpMethod::Value method, const std::string &url)
      : m_method(method), m_url(url), m_contentLength(0) {}

 public:
  HttpMethod::Value GetMethod() const { return m_method; }
  const std::string &GetURL() const { return m_url; }
  const HeaderMap &GetHeaders() const { return m_headers; }
  bool HasHeader(const std::string &name) const;
  // Return empty string if header is absent
  std::string GetHeader(const std::string &name) const;
  const boost::shared_ptr<std::iostream> &GetBody() const { return m_body; }
  uint64_t GetContentLength() const { return m_contentLength; }

  void SetHeader(const std::string &name, const std::string &value);
  void RemoveHeader(const std::string &name);

  // Append "key=value" to the url query, value is percent-encoded
  void AddQueryParameter(const std::string &key, const std::string &value);

  // Set body stream and its length, Content-Length follows the length
  void SetBody(const boost::shared_ptr<std::iostream> &body, uint64_t length);

 private:
  HttpMethod::Value m_method;
  std::string m_url;
  HeaderMap m_headers;
  boost::shared_ptr<std::iostream> m_body;
  uint64_t m_contentLength;
};

class HttpResponse {
 public:
  HttpResponse() : m_status(HttpStatus::RequestNotMade) {}
  explicit HttpResponse(int status) : m_status(status) {}

 public:
  int GetStatus() const { return m_status; }
  const HeaderMap &GetHeaders() const { return m_headers; }
  bool HasHeader(const std::string &name) const;
  std::string GetHeader(const std::string &name) const;
  const boost::shared_ptr<std::iostream> &GetBody() const { return m_body; }

  // Read the remaining body into a string
  //
  // @param  : output
  // @return : bytes read
  uint64_t ReadBody(std::string *content) const;

  void SetStatus(int status) { m_status = status; }
  void SetHeader(const std::string &name, const std::string &value);
  void SetBody(const boost::shared_ptr<std::iostream> &body) { m_body = body; }

 private:
  int m_status;
  HeaderMap m_headers;
  boost::shared_ptr<std::iostream> m_body;
};

}  // namespace Http
}  // namespace Client
}  // namespace CX

#endif  // CHUNKXFER_CLIENT_HTTP_H_
