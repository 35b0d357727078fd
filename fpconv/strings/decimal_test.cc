// Copyright 2026 The fpconv Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "fpconv/strings/decimal.h"

#include <cstdint>
#include <limits>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using fpconv::Decimal;
using ::testing::HasSubstr;
using ::testing::StartsWith;

Decimal MakeDecimal(absl::string_view digits, int decimal_point) {
  absl::StatusOr<Decimal> d = Decimal::FromDigits(digits, decimal_point);
  EXPECT_TRUE(d.ok()) << d.status();
  return d.ok() ? *d : Decimal();
}

TEST(Decimal, DefaultIsZero) {
  Decimal d;
  EXPECT_TRUE(d.empty());
  EXPECT_EQ(d.count(), 0);
  EXPECT_EQ(d.decimal_point(), 0);
  EXPECT_FALSE(d.negative());
  EXPECT_FALSE(d.truncated());
  EXPECT_EQ(d.ToString(), "0");
}

TEST(Decimal, Assign) {
  Decimal d;
  d.Assign(12300);
  EXPECT_EQ(d.digit_view(), "123");
  EXPECT_EQ(d.decimal_point(), 5);

  d.Assign(std::numeric_limits<uint64_t>::max());
  EXPECT_EQ(d.digit_view(), "18446744073709551615");
  EXPECT_EQ(d.decimal_point(), 20);

  d.Assign(0);
  EXPECT_TRUE(d.empty());
  EXPECT_EQ(d.decimal_point(), 0);
}

TEST(Decimal, AssignKeepsSignAndClearsTruncation) {
  Decimal d;
  d.set_negative(true);
  d.Assign(1);
  d.Shift(-1200);
  ASSERT_TRUE(d.truncated());
  d.Assign(7);
  EXPECT_FALSE(d.truncated());
  EXPECT_TRUE(d.negative());
  EXPECT_EQ(d.ToString(), "-0.7e1");
}

TEST(Decimal, ShiftLeft) {
  Decimal d;
  d.Assign(1);
  d.Shift(100);
  EXPECT_EQ(d.digit_view(), "1267650600228229401496703205376");
  EXPECT_EQ(d.decimal_point(), 31);
  EXPECT_FALSE(d.truncated());

  d.Assign(5);
  d.Shift(1);
  EXPECT_EQ(d.digit_view(), "1");
  EXPECT_EQ(d.decimal_point(), 2);
}

TEST(Decimal, ShiftRight) {
  Decimal d;
  d.Assign(125);
  d.Shift(-3);
  EXPECT_EQ(d.digit_view(), "15625");
  EXPECT_EQ(d.decimal_point(), 2);

  d.Assign(1);
  d.Shift(-4);
  EXPECT_EQ(d.digit_view(), "625");
  EXPECT_EQ(d.decimal_point(), -1);
}

TEST(Decimal, ShiftRoundTrip) {
  Decimal d;
  d.Assign(1);
  d.Shift(-200);
  d.Shift(200);
  EXPECT_EQ(d.digit_view(), "1");
  EXPECT_EQ(d.decimal_point(), 1);
  EXPECT_FALSE(d.truncated());
}

TEST(Decimal, ShiftZeroIsNoop) {
  Decimal d;
  d.Shift(500);
  EXPECT_TRUE(d.empty());
  d.Assign(42);
  d.Shift(0);
  EXPECT_EQ(d.digit_view(), "42");
  EXPECT_EQ(d.decimal_point(), 2);
}

TEST(Decimal, SmallestDenormalIsExact) {
  Decimal d;
  d.Assign(1);
  d.Shift(-1074);
  EXPECT_FALSE(d.truncated());
  EXPECT_EQ(d.count(), 751);
  EXPECT_EQ(d.decimal_point(), -323);
  EXPECT_THAT(std::string(d.digit_view()), StartsWith("49406564584124654"));
  EXPECT_EQ(d.digits()[d.count() - 1], '5');
}

TEST(Decimal, LongestBinary64FitsWithoutTruncation) {
  Decimal d;
  d.Assign((uint64_t{1} << 53) - 1);
  d.Shift(-1074);
  EXPECT_FALSE(d.truncated());
  EXPECT_EQ(d.count(), 767);
}

TEST(Decimal, ShiftPastCapacityTruncates) {
  Decimal d;
  d.Assign(1);
  d.Shift(-1200);
  EXPECT_TRUE(d.truncated());
  EXPECT_EQ(d.count(), Decimal::kMaxDigits);
  EXPECT_EQ(d.decimal_point(), -361);
}

TEST(Decimal, RoundToNearest) {
  Decimal d = MakeDecimal("12345", 1);
  d.Round(3);
  EXPECT_EQ(d.digit_view(), "123");

  d = MakeDecimal("12351", 1);
  d.Round(3);
  EXPECT_EQ(d.digit_view(), "124");

  d = MakeDecimal("1236", 1);
  d.Round(3);
  EXPECT_EQ(d.digit_view(), "124");
}

TEST(Decimal, RoundHalfToEven) {
  Decimal d = MakeDecimal("125", 1);
  d.Round(2);
  EXPECT_EQ(d.digit_view(), "12");

  d = MakeDecimal("135", 1);
  d.Round(2);
  EXPECT_EQ(d.digit_view(), "14");

  // Nothing before the tie counts as even.
  d = MakeDecimal("5", 0);
  d.Round(0);
  EXPECT_TRUE(d.empty());
}

TEST(Decimal, RoundTruncatedTieGoesUp) {
  // 2^-1151 keeps 800 digits ending in "25" and drops a non-zero tail, so
  // the stored '5' is above the tie and the even '2' still rounds up.
  Decimal d;
  d.Assign(1);
  d.Shift(-1151);
  ASSERT_TRUE(d.truncated());
  ASSERT_EQ(d.count(), Decimal::kMaxDigits);
  ASSERT_EQ(d.digits()[d.count() - 2], '2');
  ASSERT_EQ(d.digits()[d.count() - 1], '5');
  d.Round(d.count() - 1);
  EXPECT_EQ(d.count(), Decimal::kMaxDigits - 1);
  EXPECT_EQ(d.digits()[d.count() - 1], '3');
}

// A full buffer whose halving needs one digit more than the capacity, so the
// shift drops a final '5' and marks the result truncated.
Decimal TruncatedHalf(absl::string_view leading) {
  std::string digits(leading);
  digits.append(Decimal::kMaxDigits - digits.size() - 1, '0');
  digits.push_back('1');
  Decimal d = MakeDecimal(digits, 0);
  d.Shift(-1);
  return d;
}

TEST(Decimal, RoundDownDropsTruncatedTail) {
  // 0.251000...0001 / 2 = 0.1255000...00005; the last '5' does not fit.
  Decimal d = TruncatedHalf("251");
  ASSERT_TRUE(d.truncated());
  ASSERT_EQ(d.digit_view(), "1255");

  d.RoundDown(3);
  EXPECT_EQ(d.digit_view(), "125");
  EXPECT_FALSE(d.truncated());

  // 0.125 is now an exact tie and rounds to the even digit.
  d.Round(2);
  EXPECT_EQ(d.digit_view(), "12");
}

TEST(Decimal, RoundUpDropsTruncatedTail) {
  Decimal d = TruncatedHalf("249");
  ASSERT_TRUE(d.truncated());
  ASSERT_EQ(d.digit_view(), "1245");

  d.RoundUp(3);
  EXPECT_EQ(d.digit_view(), "125");
  EXPECT_FALSE(d.truncated());
  EXPECT_EQ(d.RoundedInteger(), 0);

  d.Round(2);
  EXPECT_EQ(d.digit_view(), "12");
}

TEST(Decimal, RoundKeepsTruncationOnlyForTheDecision) {
  Decimal d = TruncatedHalf("249");
  ASSERT_TRUE(d.truncated());
  // "1245" plus a dropped tail is above the tie at the fourth digit.
  d.Round(3);
  EXPECT_EQ(d.digit_view(), "125");
  EXPECT_FALSE(d.truncated());
}

TEST(Decimal, RoundCarriesThroughNines) {
  Decimal d = MakeDecimal("9996", 0);
  d.Round(3);
  EXPECT_EQ(d.digit_view(), "1");
  EXPECT_EQ(d.decimal_point(), 1);
}

TEST(Decimal, RoundOutOfRangeIsNoop) {
  Decimal d = MakeDecimal("123", 2);
  d.Round(-1);
  EXPECT_EQ(d.digit_view(), "123");
  d.Round(3);
  EXPECT_EQ(d.digit_view(), "123");
  d.RoundUp(10);
  EXPECT_EQ(d.digit_view(), "123");
  d.RoundDown(5);
  EXPECT_EQ(d.digit_view(), "123");
}

TEST(Decimal, RoundDown) {
  Decimal d = MakeDecimal("1999", 1);
  d.RoundDown(2);
  EXPECT_EQ(d.digit_view(), "19");

  d = MakeDecimal("1009", 1);
  d.RoundDown(3);
  EXPECT_EQ(d.digit_view(), "1");
  EXPECT_EQ(d.decimal_point(), 1);

  d = MakeDecimal("4", -3);
  d.RoundDown(0);
  EXPECT_TRUE(d.empty());
  EXPECT_EQ(d.decimal_point(), 0);
}

TEST(Decimal, RoundUp) {
  Decimal d = MakeDecimal("1201", 1);
  d.RoundUp(2);
  EXPECT_EQ(d.digit_view(), "13");

  d = MakeDecimal("1901", 3);
  d.RoundUp(2);
  EXPECT_EQ(d.digit_view(), "2");
  EXPECT_EQ(d.decimal_point(), 3);

  d = MakeDecimal("999", 2);
  d.RoundUp(1);
  EXPECT_EQ(d.digit_view(), "1");
  EXPECT_EQ(d.decimal_point(), 3);

  d = MakeDecimal("3", -2);
  d.RoundUp(0);
  EXPECT_EQ(d.digit_view(), "1");
  EXPECT_EQ(d.decimal_point(), -1);
}

TEST(Decimal, RoundedInteger) {
  EXPECT_EQ(MakeDecimal("", 0).RoundedInteger(), 0);
  EXPECT_EQ(MakeDecimal("123", 3).RoundedInteger(), 123);
  EXPECT_EQ(MakeDecimal("12", 5).RoundedInteger(), 12000);
  EXPECT_EQ(MakeDecimal("1234", 2).RoundedInteger(), 12);
  EXPECT_EQ(MakeDecimal("126", 2).RoundedInteger(), 13);
  EXPECT_EQ(MakeDecimal("9", 0).RoundedInteger(), 1);
  EXPECT_EQ(MakeDecimal("9", -1).RoundedInteger(), 0);
}

TEST(Decimal, RoundedIntegerTiesToEven) {
  EXPECT_EQ(MakeDecimal("5", 0).RoundedInteger(), 0);
  EXPECT_EQ(MakeDecimal("15", 1).RoundedInteger(), 2);
  EXPECT_EQ(MakeDecimal("25", 1).RoundedInteger(), 2);
  EXPECT_EQ(MakeDecimal("35", 1).RoundedInteger(), 4);
  EXPECT_EQ(MakeDecimal("2501", 1).RoundedInteger(), 3);
}

TEST(Decimal, RoundedIntegerSaturates) {
  EXPECT_EQ(MakeDecimal("1", 21).RoundedInteger(),
            std::numeric_limits<uint64_t>::max());
  EXPECT_EQ(MakeDecimal("1", 20).RoundedInteger(),
            uint64_t{10000000000000000000u});
}

TEST(Decimal, RoundedIntegerSaturatesAtTwentyDigits) {
  constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
  EXPECT_EQ(MakeDecimal("99999999999999999999", 20).RoundedInteger(), kMax);
  EXPECT_EQ(MakeDecimal("18446744073709551616", 20).RoundedInteger(), kMax);
  EXPECT_EQ(MakeDecimal("2", 20).RoundedInteger(), kMax);
  EXPECT_EQ(MakeDecimal("18446744073709551615", 20).RoundedInteger(), kMax);
  EXPECT_EQ(MakeDecimal("18446744073709551614", 20).RoundedInteger(),
            kMax - 1);
  // Rounding up past the largest value also saturates.
  EXPECT_EQ(MakeDecimal("184467440737095516155", 20).RoundedInteger(), kMax);
  EXPECT_EQ(MakeDecimal("184467440737095516145", 20).RoundedInteger(),
            kMax - 1);
}

TEST(Decimal, FromDigitsNormalizes) {
  Decimal d = MakeDecimal("0012300", 4);
  EXPECT_EQ(d.digit_view(), "123");
  EXPECT_EQ(d.decimal_point(), 2);

  d = MakeDecimal("000", 7);
  EXPECT_TRUE(d.empty());
  EXPECT_EQ(d.decimal_point(), 0);

  absl::StatusOr<Decimal> neg = Decimal::FromDigits("25", -1, true);
  ASSERT_TRUE(neg.ok());
  EXPECT_TRUE(neg->negative());
  EXPECT_EQ(neg->ToString(), "-0.25e-1");
}

TEST(Decimal, FromDigitsRejectsNonDigits) {
  absl::StatusOr<Decimal> d = Decimal::FromDigits("12a4", 1);
  ASSERT_FALSE(d.ok());
  EXPECT_EQ(d.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(std::string(d.status().message()), HasSubstr("12a4"));

  d = Decimal::FromDigits(absl::string_view("1\n", 2), 1);
  ASSERT_FALSE(d.ok());
  EXPECT_THAT(std::string(d.status().message()), HasSubstr("1\\n"));

  EXPECT_FALSE(Decimal::FromDigits("-1", 1).ok());
  EXPECT_FALSE(Decimal::FromDigits("1.5", 1).ok());
}

TEST(Decimal, FromDigitsCapacity) {
  std::string digits(Decimal::kMaxDigits, '7');
  EXPECT_TRUE(Decimal::FromDigits(digits, 1).ok());

  // Zeros on either side are not significant.
  EXPECT_TRUE(Decimal::FromDigits("000" + digits + "000", 1).ok());

  digits.push_back('7');
  absl::StatusOr<Decimal> d = Decimal::FromDigits(digits, 1);
  ASSERT_FALSE(d.ok());
  EXPECT_EQ(d.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(std::string(d.status().message()), HasSubstr("801"));
}

TEST(Decimal, ToString) {
  Decimal d;
  d.Assign(15625);
  d.Shift(-10);
  EXPECT_EQ(d.ToString(), "0.152587890625e2");
  d.set_negative(true);
  EXPECT_EQ(d.ToString(), "-0.152587890625e2");
  d.Assign(0);
  EXPECT_EQ(d.ToString(), "-0");
}

}  // namespace
