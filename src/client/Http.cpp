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

#include "client/Http.h"

#include <stdint.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <iterator>
#include <string>
#include <utility>

#include "boost/exception/to_string.hpp"
#include "boost/shared_ptr.hpp"

#include "base/StringUtils.h"

namespace CX {

namespace Client {

namespace Http {

using boost::shared_ptr;
using boost::to_string;
using std::iostream;
using std::make_pair;
using std::pair;
using std::string;

const char *const CONTENT_LENGTH = "Content-Length";
const char *const CONTENT_MD5 = "Content-MD5";
const char *const CONTENT_RANGE = "Content-Range";
const char *const CONTENT_TYPE = "Content-Type";
const char *const ETAG = "ETag";
const char *const IF_MATCH = "If-Match";
const char *const IF_MODIFIED_SINCE = "If-Modified-Since";
const char *const IF_NONE_MATCH = "If-None-Match";
const char *const IF_UNMODIFIED_SINCE = "If-Unmodified-Since";
const char *const LAST_MODIFIED = "Last-Modified";
const char *const RANGE = "Range";

// --------------------------------------------------------------------------
string HttpMethodToString(HttpMethod::Value method) {
  switch (method) {
    case HttpMethod::Get:
      return "GET";
    case HttpMethod::Head:
      return "HEAD";
    case HttpMethod::Put:
      return "PUT";
    case HttpMethod::Post:
      return "POST";
    case HttpMethod::Delete:
      return "DELETE";
    default:
      return "GET";
  }
}

// --------------------------------------------------------------------------
string HttpStatusToName(int status) {
  static const pair<int, const char *> statusToNames[] = {
      // keep in sorted order
      make_pair(0, "RequestNotMade"),
      make_pair(200, "Ok"),
      make_pair(201, "Created"),
      make_pair(202, "Accepted"),
      make_pair(204, "NoContent"),
      make_pair(206, "PartialContent"),
      make_pair(304, "NotModified"),
      make_pair(400, "BadRequest"),
      make_pair(401, "Unauthorized"),
      make_pair(403, "Forbidden"),
      make_pair(404, "NotFound"),
      make_pair(405, "MethodNotAllowed"),
      make_pair(408, "RequestTimeout"),
      make_pair(409, "Conflict"),
      make_pair(412, "PreconditionFailed"),
      make_pair(416, "RequestedRangeNotSatisfiable"),
      make_pair(429, "TooManyRequests"),
      make_pair(500, "InternalServerError"),
      make_pair(502, "BadGateway"),
      make_pair(503, "ServiceUnavailable"),
      make_pair(504, "GatewayTimeout"),
  };

  int n = sizeof(statusToNames) / sizeof(statusToNames[0]);
  // binary search
  int low = 0;
  int high = n - 1;
  while (low <= high) {
    int mid = (low + high) / 2;
    if (status == statusToNames[mid].first) {
      return statusToNames[mid].second;
    }
    if (status < statusToNames[mid].first) {
      high = mid - 1;
    } else {
      low = mid + 1;
    }
  }
  return "UnknownStatus";
}

// --------------------------------------------------------------------------
bool IsSuccessStatus(int status) { return status >= 200 && status < 300; }

// --------------------------------------------------------------------------
bool CaseInsensitiveLess::operator()(const string &lhs,
                                     const string &rhs) const {
  string::size_type n = std::min(lhs.size(), rhs.size());
  for (string::size_type i = 0; i < n; ++i) {
    int l = std::tolower(static_cast<unsigned char>(lhs[i]));
    int r = std::tolower(static_cast<unsigned char>(rhs[i]));
    if (l != r) {
      return l < r;
    }
  }
  return lhs.size() < rhs.size();
}

namespace {

string LookupHeader(const HeaderMap &headers, const string &name) {
  HeaderMap::const_iterator it = headers.find(name);
  return it != headers.end() ? it->second : string();
}

}  // namespace

// --------------------------------------------------------------------------
bool HttpRequest::HasHeader(const string &name) const {
  return m_headers.find(name) != m_headers.end();
}

// --------------------------------------------------------------------------
string HttpRequest::GetHeader(const string &name) const {
  return LookupHeader(m_headers, name);
}

// --------------------------------------------------------------------------
void HttpRequest::SetHeader(const string &name, const string &value) {
  m_headers[name] = value;
}

// --------------------------------------------------------------------------
void HttpRequest::RemoveHeader(const string &name) { m_headers.erase(name); }

// --------------------------------------------------------------------------
void HttpRequest::AddQueryParameter(const string &key, const string &value) {
  m_url.append(m_url.find('?') == string::npos ? "?" : "&");
  m_url.append(key);
  m_url.append("=");
  m_url.append(CX::StringUtils::URLEncode(value));
}

// --------------------------------------------------------------------------
void HttpRequest::SetBody(const shared_ptr<iostream> &body, uint64_t length) {
  m_body = body;
  m_contentLength = length;
  SetHeader(CONTENT_LENGTH, to_string(length));
}

// --------------------------------------------------------------------------
bool HttpResponse::HasHeader(const string &name) const {
  return m_headers.find(name) != m_headers.end();
}

// --------------------------------------------------------------------------
string HttpResponse::GetHeader(const string &name) const {
  return LookupHeader(m_headers, name);
}

// --------------------------------------------------------------------------
void HttpResponse::SetHeader(const string &name, const string &value) {
  m_headers[name] = value;
}

// --------------------------------------------------------------------------
uint64_t HttpResponse::ReadBody(string *content) const {
  if (content == NULL) {
    return 0;
  }
  content->clear();
  if (!m_body) {
    return 0;
  }
  content->assign(std::istreambuf_iterator<char>(*m_body),
                  std::istreambuf_iterator<char>());
  return content->size();
}

}  // namespace Http
}  // namespace Client
}  // namespace CX
