////////////////////////////////////////////////////////////////////////////////
/// @brief tests of the quantity conversions
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

#include <gtest/gtest.h>

#include "Units.h"

using namespace dbaas;

TEST(UnitsTest, BytesWithBinarySuffix) {
  EXPECT_EQ(1073741824u, bytesFromString("1Gi").get());
  EXPECT_EQ(536870912u, bytesFromString("0.5Gi").get());
  EXPECT_EQ(2048u, bytesFromString("2Ki").get());
  EXPECT_EQ(1099511627776u, bytesFromString("1Ti").get());
}

TEST(UnitsTest, BytesWithDecimalSuffix) {
  EXPECT_EQ(1000000000u, bytesFromString("1G").get());
  EXPECT_EQ(300000000u, bytesFromString("300M").get());
  EXPECT_EQ(1000u, bytesFromString("1k").get());
}

TEST(UnitsTest, PlainBytes) {
  EXPECT_EQ(128974848u, bytesFromString("128974848").get());
  EXPECT_EQ(0u, bytesFromString("0").get());
}

TEST(UnitsTest, MilliBytesRoundUp) {
  EXPECT_EQ(1u, bytesFromString("1000m").get());
  EXPECT_EQ(1u, bytesFromString("1m").get());
}

TEST(UnitsTest, BytesErrors) {
  Try<uint64_t> empty = bytesFromString("");
  ASSERT_TRUE(empty.isError());
  EXPECT_EQ("can't convert an empty string to a number", empty.error());

  EXPECT_TRUE(bytesFromString("12Xi").isError());
  EXPECT_TRUE(bytesFromString("Gi").isError());
  EXPECT_TRUE(bytesFromString("1.2.3G").isError());
}

TEST(UnitsTest, MilliCPU) {
  EXPECT_EQ(100u, milliCPUFromString("100m").get());
  EXPECT_EQ(1000u, milliCPUFromString("1").get());
  EXPECT_EQ(500u, milliCPUFromString("0.5").get());
  EXPECT_EQ(2500u, milliCPUFromString("2.5").get());
}

TEST(UnitsTest, MilliCPUErrors) {
  EXPECT_TRUE(milliCPUFromString("").isError());
  EXPECT_TRUE(milliCPUFromString("abc").isError());
  EXPECT_TRUE(milliCPUFromString("1.5m").isError());
  EXPECT_TRUE(milliCPUFromString("m").isError());
}

TEST(UnitsTest, Formatting) {
  EXPECT_EQ("1024", stringFromBytes(1024));
  EXPECT_EQ("500m", stringFromMilliCPU(500));
  EXPECT_EQ("0m", stringFromMilliCPU(0));
}

TEST(UnitsTest, FormattedValuesParseBack) {
  EXPECT_EQ(750u, milliCPUFromString(stringFromMilliCPU(750)).get());
  EXPECT_EQ(1073741824u, bytesFromString(stringFromBytes(1073741824)).get());
}
