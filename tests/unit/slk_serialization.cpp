// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.


#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "slk/serialization.hpp"
#include "slk/streams.hpp"

using namespace rangekv;

enum class Color : uint8_t { RED, GREEN, BLUE };

TEST(SlkSerialization, Primitives) {
  uint64_t number = 0;
  slk::LoadFromString(slk::SaveToString(uint64_t{0x1234567890abcdef}), &number);
  EXPECT_EQ(number, 0x1234567890abcdef);

  bool flag = false;
  slk::LoadFromString(slk::SaveToString(true), &flag);
  EXPECT_TRUE(flag);

  Color color = Color::RED;
  slk::LoadFromString(slk::SaveToString(Color::BLUE), &color);
  EXPECT_EQ(color, Color::BLUE);
}

TEST(SlkSerialization, Containers) {
  const std::map<std::string, std::vector<uint32_t>> original{{"a", {1, 2, 3}}, {"", {}}, {"z", {7}}};
  std::map<std::string, std::vector<uint32_t>> decoded;
  slk::LoadFromString(slk::SaveToString(original), &decoded);
  EXPECT_EQ(decoded, original);

  std::optional<std::string> present;
  slk::LoadFromString(slk::SaveToString(std::optional<std::string>{"x"}), &present);
  EXPECT_EQ(present, "x");

  std::optional<std::string> absent{"stale"};
  slk::LoadFromString(slk::SaveToString(std::optional<std::string>{}), &absent);
  EXPECT_FALSE(absent);
}

TEST(SlkSerialization, Variant) {
  using Value = std::variant<uint64_t, std::string>;
  Value decoded;
  slk::LoadFromString(slk::SaveToString(Value{std::string{"text"}}), &decoded);
  ASSERT_TRUE(std::holds_alternative<std::string>(decoded));
  EXPECT_EQ(std::get<std::string>(decoded), "text");
}

TEST(SlkSerialization, VariantIndexOutOfRange) {
  using Value = std::variant<uint64_t, std::string>;
  using Wider = std::variant<uint64_t, std::string, bool>;
  Value decoded;
  EXPECT_THROW(slk::LoadFromString(slk::SaveToString(Wider{true}), &decoded), slk::SlkDecodeException);
}

TEST(SlkSerialization, LargeValuesSpanSegments) {
  const std::string original(3 * slk::kSegmentMaxDataSize + 17, 'q');
  const auto encoded = slk::SaveToString(original);
  EXPECT_GT(encoded.size(), original.size());

  const auto info = slk::CheckStreamComplete(reinterpret_cast<const uint8_t *>(encoded.data()), encoded.size());
  EXPECT_EQ(info.status, slk::StreamStatus::COMPLETE);

  std::string decoded;
  slk::LoadFromString(encoded, &decoded);
  EXPECT_EQ(decoded, original);
}

TEST(SlkSerialization, TruncatedStreamThrows) {
  const auto encoded = slk::SaveToString(std::string(100, 'x'));
  std::string decoded;
  EXPECT_THROW(slk::LoadFromString(std::string_view{encoded}.substr(0, encoded.size() - 10), &decoded),
               slk::SlkReaderException);

  const auto info = slk::CheckStreamComplete(reinterpret_cast<const uint8_t *>(encoded.data()), encoded.size() - 10);
  EXPECT_EQ(info.status, slk::StreamStatus::PARTIAL);
}

TEST(SlkSerialization, TrailingDataThrows) {
  const auto encoded = slk::SaveToString(std::pair<uint64_t, uint64_t>{1, 2});
  uint64_t only_first = 0;
  EXPECT_THROW(slk::LoadFromString(encoded, &only_first), slk::SlkReaderException);
}
