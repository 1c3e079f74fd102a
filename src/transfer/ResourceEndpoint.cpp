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

#include "transfer/ResourceEndpoint.h"

#include <stdint.h>
#include <stdio.h>

#include <sstream>
#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/make_shared.hpp"
#include "boost/optional.hpp"
#include "boost/property_tree/exceptions.hpp"
#include "boost/property_tree/ptree.hpp"
#include "boost/property_tree/xml_parser.hpp"
#include "boost/shared_ptr.hpp"

#include "base/HashUtils.h"
#include "base/LogMacros.h"
#include "base/TimeUtils.h"
#include "client/Utils.h"

namespace CX {

namespace Transfer {

using boost::optional;
using boost::shared_ptr;
using boost::to_string;
using boost::property_tree::ptree;
using CX::Client::ClientError;
using CX::Client::TransferError;
using CX::Client::Http::HttpMethod;
using CX::Client::Http::HttpRequest;
using CX::Client::Utils::BuildRequestRange;
using CX::Client::Utils::BuildRequestRangeStart;
using std::string;
using std::stringstream;
using std::vector;

const char *const RANGE_GET_CONTENT_MD5_HEADER = "x-ms-range-get-content-md5";

namespace {

const char *const BLOB_TYPE_HEADER = "x-ms-blob-type";
const char *const FILE_TYPE_HEADER = "x-ms-type";
const char *const FILE_CONTENT_LENGTH_HEADER = "x-ms-content-length";
const char *const FILE_RANGE_HEADER = "x-ms-range";
const char *const FILE_WRITE_HEADER = "x-ms-write";

void ResetRequest(HttpMethod::Value method, const string &url,
                  HttpRequest *request) {
  *request = HttpRequest(method, url);
}

void SetXMLBody(const string &xml, HttpRequest *request) {
  shared_ptr<stringstream> body = boost::make_shared<stringstream>(xml);
  request->SetBody(body, xml.size());
  request->SetHeader(CX::Client::Http::CONTENT_TYPE, "application/xml");
}

ListPageOutcome MakeListError(const string &msg) {
  return ListPageOutcome(ClientError<TransferError::Value>(
      TransferError::UNEXPECTED_RESPONSE, "ParseListResponse", msg, false));
}

}  // namespace

// --------------------------------------------------------------------------
void ResourceEndpoint::BuildDownloadRequest(uint64_t start,
                                            const optional<uint64_t> &stop,
                                            bool requestContentMD5,
                                            HttpRequest *request) const {
  ResetRequest(HttpMethod::Get, m_url, request);
  request->SetHeader(CX::Client::Http::RANGE,
                     stop ? BuildRequestRange(start, *stop)
                          : BuildRequestRangeStart(start));
  if (requestContentMD5) {
    request->SetHeader(RANGE_GET_CONTENT_MD5_HEADER, "true");
  }
}

// --------------------------------------------------------------------------
void ResourceEndpoint::BuildFullDownloadRequest(HttpRequest *request) const {
  ResetRequest(HttpMethod::Get, m_url, request);
}

// --------------------------------------------------------------------------
ListPageOutcome ResourceEndpoint::ParseEnumerationResults(
    const string &body, const string &entriesTag, const string &fileTag,
    const string &directoryTag) {
  ListPage page;
  try {
    ptree tree;
    std::istringstream in(body);
    boost::property_tree::read_xml(
        in, tree, boost::property_tree::xml_parser::trim_whitespace);

    optional<ptree &> results = tree.get_child_optional("EnumerationResults");
    if (!results) {
      return MakeListError("Missing EnumerationResults element");
    }

    optional<ptree &> entries = results->get_child_optional(entriesTag);
    if (entries) {
      BOOST_FOREACH(const ptree::value_type &entry, *entries) {
        if (entry.first != fileTag && entry.first != directoryTag) {
          continue;
        }
        ListedItem item;
        item.m_name = entry.second.get<string>("Name", "");
        item.m_isDirectory = (entry.first == directoryTag);
        item.m_size = entry.second.get<uint64_t>("Properties.Content-Length", 0);
        item.m_eTag = entry.second.get<string>("Properties.Etag", "");
        optional<string> lastModified =
            entry.second.get_optional<string>("Properties.Last-Modified");
        if (lastModified) {
          std::pair<bool, time_t> res =
              CX::TimeUtils::HttpDateToSeconds(*lastModified);
          if (res.first) {
            item.m_lastModified = res.second;
          } else {
            DebugWarning("Ignore malformed Last-Modified " << *lastModified
                                                          << " of "
                                                          << item.m_name);
          }
        }
        page.m_items.push_back(item);
      }
    }

    string next = results->get<string>("NextMarker", "");
    if (!next.empty()) {
      page.m_nextToken = next;
    }
  } catch (const boost::property_tree::ptree_error &err) {
    return MakeListError(string("Malformed listing: ") + err.what());
  }
  return ListPageOutcome(page);
}

// --------------------------------------------------------------------------
string MakeBlockId(uint32_t index) {
  char buf[40];
  snprintf(buf, sizeof(buf), "%032u", index);
  return CX::HashUtils::Base64Encode(string(buf));
}

// --------------------------------------------------------------------------
BlockBlobEndpoint::BlockBlobEndpoint(const string &url)
    : ResourceEndpoint(url) {}

// --------------------------------------------------------------------------
bool BlockBlobEndpoint::BuildPrepareUploadRequest(
    uint64_t totalSize, HttpRequest *request) const {
  return false;
}

// --------------------------------------------------------------------------
void BlockBlobEndpoint::BuildSingleUploadRequest(uint64_t length,
                                                 HttpRequest *request) const {
  ResetRequest(HttpMethod::Put, GetURL(), request);
  request->SetHeader(BLOB_TYPE_HEADER, "BlockBlob");
  request->SetHeader(CX::Client::Http::CONTENT_LENGTH, to_string(length));
}

// --------------------------------------------------------------------------
void BlockBlobEndpoint::BuildChunkUploadRequest(
    const ChunkDescriptor &descriptor, HttpRequest *request) const {
  ResetRequest(HttpMethod::Put, GetURL(), request);
  request->AddQueryParameter("comp", "block");
  request->AddQueryParameter("blockid", MakeBlockId(descriptor.GetIndex()));
  request->SetHeader(CX::Client::Http::CONTENT_LENGTH,
                     to_string(descriptor.GetLength()));
}

// --------------------------------------------------------------------------
bool BlockBlobEndpoint::BuildCommitUploadRequest(
    const vector<ChunkResult> &results, HttpRequest *request) const {
  ResetRequest(HttpMethod::Put, GetURL(), request);
  request->AddQueryParameter("comp", "blocklist");

  string xml = "<?xml version=\"1.0\" encoding=\"utf-8\"?><BlockList>";
  BOOST_FOREACH(const ChunkResult &result, results) {
    xml += "<Latest>" + MakeBlockId(result.GetIndex()) + "</Latest>";
  }
  xml += "</BlockList>";
  SetXMLBody(xml, request);
  return true;
}

// --------------------------------------------------------------------------
void BlockBlobEndpoint::BuildListRequest(const optional<string> &marker,
                                         uint32_t maxResults,
                                         HttpRequest *request) const {
  ResetRequest(HttpMethod::Get, GetURL(), request);
  request->AddQueryParameter("restype", "container");
  request->AddQueryParameter("comp", "list");
  request->AddQueryParameter("maxresults", to_string(maxResults));
  if (marker) {
    request->AddQueryParameter("marker", *marker);
  }
}

// --------------------------------------------------------------------------
ListPageOutcome BlockBlobEndpoint::ParseListResponse(const string &body) const {
  return ParseEnumerationResults(body, "Blobs", "Blob", "BlobPrefix");
}

// --------------------------------------------------------------------------
FileRangeEndpoint::FileRangeEndpoint(const string &url)
    : ResourceEndpoint(url) {}

// --------------------------------------------------------------------------
bool FileRangeEndpoint::BuildPrepareUploadRequest(uint64_t totalSize,
                                                  HttpRequest *request) const {
  ResetRequest(HttpMethod::Put, GetURL(), request);
  request->SetHeader(FILE_TYPE_HEADER, "file");
  request->SetHeader(FILE_CONTENT_LENGTH_HEADER, to_string(totalSize));
  request->SetHeader(CX::Client::Http::CONTENT_LENGTH, "0");
  return true;
}

// --------------------------------------------------------------------------
void FileRangeEndpoint::BuildSingleUploadRequest(uint64_t length,
                                                 HttpRequest *request) const {
  BuildChunkUploadRequest(ChunkDescriptor(0, 0, length, true), request);
}

// --------------------------------------------------------------------------
void FileRangeEndpoint::BuildChunkUploadRequest(
    const ChunkDescriptor &descriptor, HttpRequest *request) const {
  ResetRequest(HttpMethod::Put, GetURL(), request);
  request->AddQueryParameter("comp", "range");
  request->SetHeader(FILE_RANGE_HEADER,
                     BuildRequestRange(descriptor.GetStartOffset(),
                                       descriptor.GetEndOffsetInclusive()));
  request->SetHeader(FILE_WRITE_HEADER, "update");
  request->SetHeader(CX::Client::Http::CONTENT_LENGTH,
                     to_string(descriptor.GetLength()));
}

// --------------------------------------------------------------------------
bool FileRangeEndpoint::BuildCommitUploadRequest(
    const vector<ChunkResult> &results, HttpRequest *request) const {
  return false;
}

// --------------------------------------------------------------------------
void FileRangeEndpoint::BuildListRequest(const optional<string> &marker,
                                         uint32_t maxResults,
                                         HttpRequest *request) const {
  ResetRequest(HttpMethod::Get, GetURL(), request);
  request->AddQueryParameter("restype", "directory");
  request->AddQueryParameter("comp", "list");
  request->AddQueryParameter("maxresults", to_string(maxResults));
  if (marker) {
    request->AddQueryParameter("marker", *marker);
  }
}

// --------------------------------------------------------------------------
ListPageOutcome FileRangeEndpoint::ParseListResponse(const string &body) const {
  return ParseEnumerationResults(body, "Entries", "File", "Directory");
}

}  // namespace Transfer
}  // namespace CX
