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

#include "fpconv/strings/internal/round_policy.h"

#include <algorithm>
#include <cstdint>

namespace fpconv {
FPCONV_NAMESPACE_BEGIN
namespace format_internal {

namespace {

// Returns digit `i` of `d`, or '0' outside the stored digits.
char DigitAt(const Decimal& d, int i) {
  return i >= 0 && i < d.count() ? d.digits()[i] : '0';
}

}  // namespace

void RoundShortest(Decimal* d, uint64_t mantissa, int exponent,
                   const FloatInfo& info) {
  if (mantissa == 0) {
    d->Assign(0);
    return;
  }

  // Outside the denormal range, 2^exponent <= d < 10^dp. The nearest shorter
  // decimal is at least 10^(dp - count) away while the rounding interval has
  // half-width at most 2^(exponent - mantissa_bits). When
  // 10^(dp - count) > 2^(exponent - mantissa_bits) no shorter decimal fits.
  // log2(10) > 3.32, so the integer test below implies it.
  const int min_exp = info.bias + 1;
  if (exponent > min_exp &&
      332 * (d->decimal_point() - d->count()) >=
          100 * (exponent - info.mantissa_bits)) {
    return;
  }

  // The next float up is (mantissa + 1) * 2^(exponent - mantissa_bits); the
  // upper bound is halfway to it.
  Decimal upper;
  upper.Assign(mantissa * 2 + 1);
  upper.Shift(exponent - info.mantissa_bits - 1);

  // The next float down is (mantissa - 1) at the same exponent, unless
  // `mantissa` is the smallest normal mantissa of a binade above the minimum
  // one. Then the gap below is half as wide.
  uint64_t mantissa_lo;
  int exponent_lo;
  if (mantissa > (uint64_t{1} << info.mantissa_bits) || exponent == min_exp) {
    mantissa_lo = mantissa - 1;
    exponent_lo = exponent;
  } else {
    mantissa_lo = mantissa * 2 - 1;
    exponent_lo = exponent - 1;
  }
  Decimal lower;
  lower.Assign(mantissa_lo * 2 + 1);
  lower.Shift(exponent_lo - info.mantissa_bits - 1);

  // Round-half-to-even parsing lands on `mantissa` from the exact bounds only
  // when `mantissa` is even.
  const bool inclusive = mantissa % 2 == 0;

  // How far the upper bound exceeds the value in the digits seen so far:
  // 0 when equal, 1 when rounding the value up at the current position would
  // meet the upper bound's prefix exactly, 2 when it would stay below it.
  int upper_delta = 0;

  // `upper` has the largest decimal point of the three, so walk its positions
  // and read the value and the lower bound at the aligned positions.
  for (int ui = 0;; ++ui) {
    const int mi = ui - upper.decimal_point() + d->decimal_point();
    if (mi >= d->count()) break;
    const int li = ui - upper.decimal_point() + lower.decimal_point();
    const char l = DigitAt(lower, li);
    const char m = DigitAt(*d, mi);
    const char u = DigitAt(upper, ui);

    // Truncating is safe if it leaves the value above the lower bound, or
    // lands on it exactly and the bound is inclusive.
    const bool round_down_ok =
        l != m || (inclusive && li + 1 == lower.count());

    if (upper_delta == 0 && m + 1 < u) {
      upper_delta = 2;
    } else if (upper_delta == 0 && m != u) {
      upper_delta = 1;
    } else if (upper_delta == 1 && (m != '9' || u != '0')) {
      upper_delta = 2;
    }
    // Rounding up is safe if it stays below the upper bound, or reaches it
    // exactly and the bound is inclusive.
    const bool round_up_ok =
        upper_delta > 0 &&
        (inclusive || upper_delta > 1 || ui + 1 < upper.count());

    if (round_down_ok && round_up_ok) {
      d->Round(mi + 1);
      return;
    }
    if (round_down_ok) {
      d->RoundDown(mi + 1);
      return;
    }
    if (round_up_ok) {
      d->RoundUp(mi + 1);
      return;
    }
  }
}

void RoundToPrecision(Decimal* d, char fmt, int precision) {
  switch (fmt) {
    case 'e':
    case 'E':
      d->Round(precision + 1);
      break;
    case 'f':
    case 'F':
      d->Round(d->decimal_point() + precision);
      break;
    case 'g':
    case 'G':
      d->Round(precision == 0 ? 1 : precision);
      break;
    default:
      break;
  }
}

int ShortestPrecision(const Decimal& d, char fmt) {
  switch (fmt) {
    case 'e':
    case 'E':
      return d.count() - 1;
    case 'f':
    case 'F':
      return std::max(d.count() - d.decimal_point(), 0);
    case 'g':
    case 'G':
      return d.count();
    default:
      return 0;
  }
}

}  // namespace format_internal
FPCONV_NAMESPACE_END
}  // namespace fpconv
