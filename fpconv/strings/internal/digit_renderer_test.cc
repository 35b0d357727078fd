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

#include "fpconv/strings/internal/digit_renderer.h"

#include <string>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "fpconv/strings/decimal.h"
#include "fpconv/strings/internal/bounded_sink.h"
#include "gtest/gtest.h"

namespace {

using fpconv::Decimal;
using fpconv::format_internal::BoundedSink;
using fpconv::format_internal::DigitsView;
using fpconv::format_internal::RenderDigits;
using fpconv::format_internal::RenderE;
using fpconv::format_internal::RenderF;

DigitsView View(const Decimal& d) { return DigitsView::Of(d); }

Decimal Digits(absl::string_view digits, int decimal_point) {
  absl::StatusOr<Decimal> d = Decimal::FromDigits(digits, decimal_point);
  EXPECT_TRUE(d.ok()) << d.status();
  return d.ok() ? *d : Decimal();
}

std::string E(absl::string_view digits, int dp, bool negative, int precision,
              char e = 'e') {
  const Decimal d = Digits(digits, dp);
  char buf[128];
  BoundedSink sink(absl::MakeSpan(buf));
  RenderE(View(d), negative, precision, e, &sink);
  return std::string(sink.Finalize().written);
}

std::string F(absl::string_view digits, int dp, bool negative, int precision) {
  const Decimal d = Digits(digits, dp);
  char buf[128];
  BoundedSink sink(absl::MakeSpan(buf));
  RenderF(View(d), negative, precision, &sink);
  return std::string(sink.Finalize().written);
}

std::string G(absl::string_view digits, int dp, bool shortest, int precision,
              char fmt = 'g') {
  const Decimal d = Digits(digits, dp);
  char buf[128];
  BoundedSink sink(absl::MakeSpan(buf));
  RenderDigits(View(d), shortest, false, precision, fmt, &sink);
  return std::string(sink.Finalize().written);
}

TEST(DigitsView, At) {
  const Decimal d = Digits("123", 1);
  const DigitsView v = View(d);
  EXPECT_EQ(v.count, 3);
  EXPECT_EQ(v.decimal_point, 1);
  EXPECT_EQ(v.at(0), '1');
  EXPECT_EQ(v.at(2), '3');
  EXPECT_EQ(v.at(3), '0');
  EXPECT_EQ(v.at(-1), '0');
}

TEST(RenderE, Basic) {
  EXPECT_EQ(E("15625", 2, false, 4), "1.5625e+01");
  EXPECT_EQ(E("15625", 2, true, 4), "-1.5625e+01");
  EXPECT_EQ(E("15625", 2, false, 6), "1.562500e+01");
  EXPECT_EQ(E("15625", 2, false, 0), "1e+01");
  EXPECT_EQ(E("15", 1, false, 2, 'E'), "1.50E+00");
}

TEST(RenderE, Zero) {
  EXPECT_EQ(E("", 0, false, 0), "0e+00");
  EXPECT_EQ(E("", 0, false, 2), "0.00e+00");
  EXPECT_EQ(E("", 0, true, 1), "-0.0e+00");
}

TEST(RenderE, ExponentDigits) {
  EXPECT_EQ(E("1", -6, false, 0), "1e-07");
  EXPECT_EQ(E("1", 100, false, 0), "1e+99");
  EXPECT_EQ(E("1", 101, false, 0), "1e+100");
  EXPECT_EQ(E("1", -99, false, 0), "1e-100");
  EXPECT_EQ(E("5", -323, false, 0), "5e-324");
}

TEST(RenderF, Basic) {
  EXPECT_EQ(F("15625", 2, false, 3), "15.625");
  EXPECT_EQ(F("15625", 2, false, 5), "15.62500");
  EXPECT_EQ(F("15625", 2, true, 3), "-15.625");
  EXPECT_EQ(F("314", 1, false, 2), "3.14");
}

TEST(RenderF, PadsIntegerPart) {
  EXPECT_EQ(F("1", 24, false, 0), "100000000000000000000000");
  EXPECT_EQ(F("12", 4, false, 1), "1200.0");
}

TEST(RenderF, LeadingFractionZeros) {
  EXPECT_EQ(F("5", -2, false, 4), "0.0050");
  EXPECT_EQ(F("5", -2, false, 2), "0.00");
  EXPECT_EQ(F("5", -2, false, 0), "0");
}

TEST(RenderF, Zero) {
  EXPECT_EQ(F("", 0, false, 2), "0.00");
  EXPECT_EQ(F("", 0, true, 0), "-0");
}

TEST(RenderDigits, ShortestGeneralSwitchesAtSixDigits) {
  // The shortest precision for 'g' is the digit count.
  EXPECT_EQ(G("1", 6, true, 1), "100000");
  EXPECT_EQ(G("1", 7, true, 1), "1e+06");
  EXPECT_EQ(G("123456789", 9, true, 9), "1.23456789e+08");
  EXPECT_EQ(G("1", -3, true, 1), "0.0001");
  EXPECT_EQ(G("1", -4, true, 1), "1e-05");
  EXPECT_EQ(G("1", -9, true, 1, 'G'), "1E-10");
  EXPECT_EQ(G("", 0, true, 0), "0");
}

TEST(RenderDigits, FixedGeneral) {
  EXPECT_EQ(G("123456", 6, false, 6), "123456");
  EXPECT_EQ(G("123457", 7, false, 6), "1.23457e+06");
  // Trailing zeros are not printed.
  EXPECT_EQ(G("15", 1, false, 6), "1.5");
  EXPECT_EQ(G("123", -3, false, 3), "0.000123");
  EXPECT_EQ(G("1", 1, false, 1), "1");
}

TEST(RenderDigits, DispatchesExplicitStyles) {
  EXPECT_EQ(G("25", 1, false, 1, 'e'), "2.5e+00");
  EXPECT_EQ(G("25", 1, false, 1, 'E'), "2.5E+00");
  EXPECT_EQ(G("25", 1, false, 1, 'f'), "2.5");
  EXPECT_EQ(G("25", 1, false, 1, 'F'), "2.5");
}

TEST(RenderDigits, UnknownStyle) {
  EXPECT_EQ(G("1", 1, false, 2, 'x'), "%x");
  EXPECT_EQ(G("1", 1, true, -1, 'q'), "%q");
}

TEST(RenderDigits, RespectsBufferBound) {
  const Decimal d = Digits("1", 24);
  char buf[5];
  BoundedSink sink(absl::MakeSpan(buf));
  RenderDigits(View(d), false, false, 2, 'f', &sink);
  const fpconv::FormatResult r = sink.Finalize();
  EXPECT_EQ(r.written, "10000");
  EXPECT_EQ(r.required, 27);
}

}  // namespace
