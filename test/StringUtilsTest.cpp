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

#include <string>

#include "gtest/gtest.h"

#include "base/StringUtils.h"

using std::string;

TEST(StringUtilsTest, ToLower) {
  EXPECT_EQ(string("etag"), CX::StringUtils::ToLower("ETag"));
  EXPECT_EQ(string("content-md5"), CX::StringUtils::ToLower("Content-MD5"));
  EXPECT_EQ(string("caf\xc9"), CX::StringUtils::ToLower("CAF\xc9"));
}

TEST(StringUtilsTest, Trim) {
  string raw = "--bytes=0-511--";
  EXPECT_EQ(string("--bytes=0-511"), CX::StringUtils::RTrim(raw, '-'));
  EXPECT_EQ(string("bytes=0-511--"), CX::StringUtils::LTrim(raw, '-'));
  EXPECT_EQ(string("bytes=0-511"), CX::StringUtils::Trim(raw, '-'));
  EXPECT_EQ(string(), CX::StringUtils::Trim("----", '-'));
}

TEST(StringUtilsTest, TrimWhitespace) {
  EXPECT_EQ(string("W/\"0x8D\""),
            CX::StringUtils::TrimWhitespace(" \t W/\"0x8D\"\r\n"));
  EXPECT_EQ(string(), CX::StringUtils::TrimWhitespace(" \t\r\n"));
  EXPECT_EQ(string("a b"), CX::StringUtils::TrimWhitespace("a b"));
}

TEST(StringUtilsTest, URLEncode) {
  EXPECT_EQ(string("abc-_.~123"), CX::StringUtils::URLEncode("abc-_.~123"));
  EXPECT_EQ(string("MDAw%2B%2F%3D"), CX::StringUtils::URLEncode("MDAw+/="));
  EXPECT_EQ(string("dir%20name%2Ffile"),
            CX::StringUtils::URLEncode("dir name/file"));
}

TEST(StringUtilsTest, FormatChunk) {
  EXPECT_EQ(string("[chunk=0]"), CX::StringUtils::FormatChunk(0));
  EXPECT_EQ(string("[chunk=42]"), CX::StringUtils::FormatChunk(42));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
