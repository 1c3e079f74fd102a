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

#include "boost/unordered_map.hpp"
#include "gtest/gtest.h"

#include "base/HashUtils.h"

using boost::unordered_map;
using std::string;

struct Color {
  enum Value { White, Red, Black, NIL };
};

TEST(HashUtilsTest, EnumHash) {
  unordered_map<Color::Value, string, CX::HashUtils::EnumHash> mapColor;
  mapColor[Color::White] = "white";
  mapColor[Color::Red] = "red";
  mapColor[Color::Black] = "black";

  EXPECT_EQ(mapColor.at(Color::Red), "red");
  EXPECT_EQ(mapColor.find(Color::NIL), mapColor.end());
}

TEST(HashUtilsTest, StringHash) {
  unordered_map<string, string, CX::HashUtils::StringHash> mapHeader;
  mapHeader["Content-MD5"] = "digest";
  mapHeader["ETag"] = "version";

  EXPECT_EQ(mapHeader.at("ETag"), "version");
  EXPECT_EQ(mapHeader.find("missing"), mapHeader.end());
}

TEST(HashUtilsTest, ContentMD5) {
  using CX::HashUtils::ComputeContentMD5;
  // RFC 1321 test suite, base64 encoded
  EXPECT_EQ(ComputeContentMD5("", 0), "1B2M2Y8AsgTpgAmY7PhCfg==");
  string abc = "abc";
  EXPECT_EQ(ComputeContentMD5(abc.c_str(), abc.size()),
            "kAFQmDzST7DWlj99KOF/cg==");
  EXPECT_EQ(CX::HashUtils::ComputeMD5(abc.c_str(), abc.size()).size(), 16u);
}

TEST(HashUtilsTest, Base64) {
  using CX::HashUtils::Base64Decode;
  using CX::HashUtils::Base64Encode;
  EXPECT_EQ(Base64Encode(""), "");
  EXPECT_EQ(Base64Encode("f"), "Zg==");
  EXPECT_EQ(Base64Encode("fo"), "Zm8=");
  EXPECT_EQ(Base64Encode("foo"), "Zm9v");
  EXPECT_EQ(Base64Encode("foobar"), "Zm9vYmFy");

  string decoded;
  EXPECT_TRUE(Base64Decode("Zm8=", &decoded));
  EXPECT_EQ(decoded, "fo");
  EXPECT_TRUE(Base64Decode("Zm9vYmFy", &decoded));
  EXPECT_EQ(decoded, "foobar");
  EXPECT_FALSE(Base64Decode("Zm9", &decoded));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
