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

#ifndef CHUNKXFER_TRANSFER_PAGEDRESULTCURSOR_HPP_
#define CHUNKXFER_TRANSFER_PAGEDRESULTCURSOR_HPP_

#include <stdint.h>

#include <deque>
#include <string>
#include <vector>

#include "boost/function.hpp"
#include "boost/optional.hpp"

#include "base/LogMacros.h"
#include "client/ClientError.hpp"
#include "client/Outcome.hpp"
#include "client/TransferError.h"

namespace CX {

namespace Transfer {

// One page of a listing. A missing or empty next token marks the last page.
template <typename T>
struct PageResult {
  std::vector<T> m_items;
  boost::optional<std::string> m_nextToken;
};

//
// PagedResultCursor
//
// Lazy forward sequence over a paginated listing. Every fetch passes the
// current continuation token (none for the first page) and the page size
// hint, then keeps the token the server returned. Once the server returns
// no token the cursor is exhausted for good.
//
// The token is opaque and round tripped verbatim. A cursor built from a
// token observed on another cursor resumes at that page.
//
template <typename T>
class PagedResultCursor {
 public:
  typedef CX::Client::ClientError<CX::Client::TransferError::Value> CursorError;
  typedef CX::Client::Outcome<PageResult<T>, CursorError> PageOutcome;
  typedef CX::Client::Outcome<std::vector<T>, CursorError> ItemsOutcome;
  typedef boost::function<PageOutcome(const boost::optional<std::string> &,
                                      uint32_t)>
      PageFetcher;

  PagedResultCursor(
      const PageFetcher &fetcher, uint32_t resultsPerPage,
      const boost::optional<std::string> &startToken = boost::none)
      : m_fetcher(fetcher),
        m_resultsPerPage(resultsPerPage),
        m_token(startToken),
        m_exhausted(false),
        m_error(CX::Client::TransferError::GOOD, false),
        m_hasError(false) {}

 public:
  // Fetch the next page
  //
  // @param  : void
  // @return : items of the page, an empty page once exhausted
  //
  // Items already buffered by Next are returned first without a fetch.
  // A failed fetch keeps the token, so calling again retries that page.
  ItemsOutcome NextPage() {
    if (!m_buffered.empty()) {
      std::vector<T> items(m_buffered.begin(), m_buffered.end());
      m_buffered.clear();
      return ItemsOutcome(items);
    }
    if (m_exhausted) {
      return ItemsOutcome(std::vector<T>());
    }

    PageOutcome outcome = m_fetcher(m_token, m_resultsPerPage);
    if (!outcome.IsSuccess()) {
      m_error = outcome.GetError();
      m_hasError = true;
      DebugWarning("Fail to fetch page "
                   << (m_token ? *m_token : std::string("<first>")) << " "
                   << CX::Client::GetMessageForTransferError(m_error));
      return ItemsOutcome(m_error);
    }

    m_hasError = false;
    const boost::optional<std::string> &next = outcome.GetResult().m_nextToken;
    if (next && !next->empty()) {
      m_token = next;
    } else {
      m_token = boost::none;
      m_exhausted = true;
    }
    return ItemsOutcome(outcome.GetResult().m_items);
  }

  // Next item across pages
  //
  // @param  : output item
  // @return : false at the end of the listing or on a failed fetch,
  //           check HasError to tell them apart
  bool Next(T *item) {
    while (m_buffered.empty()) {
      if (m_exhausted || m_hasError) {
        return false;
      }
      ItemsOutcome outcome = NextPage();
      if (!outcome.IsSuccess()) {
        return false;
      }
      m_buffered.insert(m_buffered.end(), outcome.GetResult().begin(),
                        outcome.GetResult().end());
    }
    if (item != NULL) {
      *item = m_buffered.front();
    }
    m_buffered.pop_front();
    return true;
  }

  // Drain the listing
  //
  // @param  : output items
  // @return : error of the failed fetch or GOOD
  CursorError CollectAll(std::vector<T> *items) {
    T item;
    while (Next(&item)) {
      if (items != NULL) {
        items->push_back(item);
      }
    }
    return m_hasError ? m_error
                      : CursorError(CX::Client::TransferError::GOOD, false);
  }

  bool IsExhausted() const { return m_exhausted && m_buffered.empty(); }
  const boost::optional<std::string> &GetContinuationToken() const {
    return m_token;
  }
  uint32_t GetResultsPerPage() const { return m_resultsPerPage; }
  bool HasError() const { return m_hasError; }
  const CursorError &GetError() const { return m_error; }

 private:
  PageFetcher m_fetcher;
  uint32_t m_resultsPerPage;  // hint only
  boost::optional<std::string> m_token;
  bool m_exhausted;
  CursorError m_error;
  bool m_hasError;
  std::deque<T> m_buffered;
};

}  // namespace Transfer
}  // namespace CX

#endif  // CHUNKXFER_TRANSFER_PAGEDRESULTCURSOR_HPP_
