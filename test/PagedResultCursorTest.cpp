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

#include <stdint.h>
#include <stdlib.h>  // for atoi

#include <string>
#include <vector>

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/optional.hpp"
#include "gtest/gtest.h"

#include "base/LogMacros.h"
#include "base/Logging.h"
#include "base/Utils.h"
#include "client/TransferError.h"
#include "transfer/PagedResultCursor.hpp"

namespace CX {

namespace Transfer {

using boost::optional;
using boost::to_string;
using CX::Client::MakeTransferError;
using CX::Client::TransferError;
using std::string;
using std::vector;
using ::testing::Test;

static const char *defaultLogDir = "/tmp/chunkxfer.test.logs/";

typedef PagedResultCursor<string> Cursor;

namespace {

// Serves names "item0".."itemN" a page at a time, the token is the index of
// the first item of the next page.
struct ScriptedLister {
  explicit ScriptedLister(uint32_t total)
      : m_total(total), m_failures(0), m_calls(0), m_lastPageSize(0) {}

  Cursor::PageOutcome Fetch(const optional<string> &token,
                            uint32_t pageSize) {
    ++m_calls;
    m_tokens.push_back(token ? *token : string("<none>"));
    m_lastPageSize = pageSize;
    if (m_failures > 0) {
      --m_failures;
      return Cursor::PageOutcome(MakeTransferError(
          TransferError::THROTTLED, "ServerBusy", "listing throttled"));
    }
    uint32_t start = token ? static_cast<uint32_t>(atoi(token->c_str())) : 0;
    PageResult<string> page;
    uint32_t i = start;
    for (; i < m_total && i < start + pageSize; ++i) {
      page.m_items.push_back("item" + to_string(i));
    }
    if (i < m_total) {
      page.m_nextToken = to_string(i);
    } else {
      page.m_nextToken = string();
    }
    return Cursor::PageOutcome(page);
  }

  uint32_t m_total;
  int m_failures;
  int m_calls;
  uint32_t m_lastPageSize;
  vector<string> m_tokens;
};

}  // namespace

class PagedResultCursorTest : public Test {
 protected:
  static void SetUpTestCase() {
    CX::Utils::CreateDirectoryIfNotExists(defaultLogDir);
    CX::Logging::Log::Instance().Initialize(defaultLogDir);
  }

  Cursor MakeCursor(ScriptedLister *lister, uint32_t pageSize,
                    const optional<string> &token = boost::none) {
    return Cursor(boost::bind(&ScriptedLister::Fetch, lister, _1, _2),
                  pageSize, token);
  }
};

TEST_F(PagedResultCursorTest, PagesUntilExhausted) {
  ScriptedLister lister(5);
  Cursor cursor = MakeCursor(&lister, 2);
  EXPECT_FALSE(cursor.IsExhausted());

  Cursor::ItemsOutcome page = cursor.NextPage();
  ASSERT_TRUE(page.IsSuccess());
  ASSERT_EQ(page.GetResult().size(), 2u);
  EXPECT_EQ(page.GetResult()[0], string("item0"));
  EXPECT_EQ(*cursor.GetContinuationToken(), string("2"));
  EXPECT_EQ(lister.m_lastPageSize, 2u);

  page = cursor.NextPage();
  EXPECT_EQ(page.GetResult().size(), 2u);
  page = cursor.NextPage();
  ASSERT_EQ(page.GetResult().size(), 1u);
  EXPECT_EQ(page.GetResult()[0], string("item4"));
  EXPECT_TRUE(cursor.IsExhausted());
  EXPECT_FALSE(cursor.GetContinuationToken());
  EXPECT_EQ(lister.m_calls, 3);

  // no fetch after the last page
  page = cursor.NextPage();
  EXPECT_TRUE(page.IsSuccess());
  EXPECT_TRUE(page.GetResult().empty());
  EXPECT_EQ(lister.m_calls, 3);
}

TEST_F(PagedResultCursorTest, EmptyListing) {
  ScriptedLister lister(0);
  Cursor cursor = MakeCursor(&lister, 10);
  Cursor::ItemsOutcome page = cursor.NextPage();
  EXPECT_TRUE(page.IsSuccess());
  EXPECT_TRUE(page.GetResult().empty());
  EXPECT_TRUE(cursor.IsExhausted());
}

TEST_F(PagedResultCursorTest, ResumeFromToken) {
  ScriptedLister lister(6);
  Cursor cursor = MakeCursor(&lister, 4, optional<string>("3"));
  vector<string> items;
  EXPECT_EQ(cursor.CollectAll(&items).GetError(), TransferError::GOOD);
  ASSERT_EQ(items.size(), 3u);
  EXPECT_EQ(items.front(), string("item3"));
  EXPECT_EQ(lister.m_tokens.front(), string("3"));
}

TEST_F(PagedResultCursorTest, FailureKeepsToken) {
  ScriptedLister lister(4);
  Cursor cursor = MakeCursor(&lister, 2);
  EXPECT_TRUE(cursor.NextPage().IsSuccess());

  lister.m_failures = 1;
  Cursor::ItemsOutcome page = cursor.NextPage();
  EXPECT_FALSE(page.IsSuccess());
  EXPECT_EQ(page.GetError().GetError(), TransferError::THROTTLED);
  EXPECT_TRUE(cursor.HasError());
  EXPECT_EQ(*cursor.GetContinuationToken(), string("2"));

  // same page is fetched again
  page = cursor.NextPage();
  ASSERT_TRUE(page.IsSuccess());
  EXPECT_EQ(page.GetResult()[0], string("item2"));
  EXPECT_FALSE(cursor.HasError());
  EXPECT_EQ(lister.m_tokens[1], string("2"));
  EXPECT_EQ(lister.m_tokens[2], string("2"));
}

TEST_F(PagedResultCursorTest, NextAcrossPages) {
  ScriptedLister lister(5);
  Cursor cursor = MakeCursor(&lister, 2);
  string item;
  vector<string> items;
  while (cursor.Next(&item)) {
    items.push_back(item);
  }
  EXPECT_FALSE(cursor.HasError());
  ASSERT_EQ(items.size(), 5u);
  for (size_t i = 0; i < items.size(); ++i) {
    EXPECT_EQ(items[i], "item" + to_string(i));
  }
}

TEST_F(PagedResultCursorTest, CollectAllReportsError) {
  ScriptedLister lister(5);
  Cursor cursor = MakeCursor(&lister, 2);
  string item;
  ASSERT_TRUE(cursor.Next(&item));
  lister.m_failures = 3;
  vector<string> items;
  EXPECT_EQ(cursor.CollectAll(&items).GetError(), TransferError::THROTTLED);
  // the buffered item of the first page is still delivered
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0], string("item1"));
}

TEST_F(PagedResultCursorTest, CollectAllWithLoggingMacros) {
  ScriptedLister lister(3);
  Cursor cursor = MakeCursor(&lister, 2);
  vector<string> items;
  Cursor::CursorError err = cursor.CollectAll(&items);
  ErrorIf(!CX::Client::IsGoodTransferError(err),
          "listing failed " << CX::Client::GetMessageForTransferError(err));
  Error("listing drained " << items.size() << " items");
  EXPECT_EQ(err.GetError(), TransferError::GOOD);
  EXPECT_EQ(items.size(), 3u);
  EXPECT_EQ(cursor.GetError().GetError(), TransferError::GOOD);
  EXPECT_TRUE(cursor.IsExhausted());
}

}  // namespace Transfer
}  // namespace CX

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
