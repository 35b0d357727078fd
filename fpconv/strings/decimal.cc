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
#include <cstring>
#include <limits>
#include <string>

#include "absl/base/internal/raw_logging.h"
#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"

namespace fpconv {
FPCONV_NAMESPACE_BEGIN

constexpr int Decimal::kMaxDigits;
constexpr int Decimal::kMaxShift;

absl::StatusOr<Decimal> Decimal::FromDigits(absl::string_view digits,
                                            int decimal_point, bool negative) {
  for (char c : digits) {
    if (!absl::ascii_isdigit(static_cast<unsigned char>(c))) {
      return absl::InvalidArgumentError(
          absl::StrCat("non-digit character in decimal digits: \"",
                       absl::CEscape(digits), "\""));
    }
  }

  while (!digits.empty() && digits.front() == '0') {
    digits.remove_prefix(1);
    --decimal_point;
  }
  while (!digits.empty() && digits.back() == '0') {
    digits.remove_suffix(1);
  }
  if (digits.size() > static_cast<size_t>(kMaxDigits)) {
    return absl::InvalidArgumentError(
        absl::StrCat("decimal has ", digits.size(),
                     " significant digits; at most ", kMaxDigits,
                     " are supported"));
  }

  Decimal d;
  d.negative_ = negative;
  if (!digits.empty()) {
    std::memcpy(d.digits_, digits.data(), digits.size());
    d.count_ = static_cast<int>(digits.size());
    d.decimal_point_ = decimal_point;
  }
  return d;
}

void Decimal::Assign(uint64_t v) {
  char buf[24];
  int n = 0;
  for (; v > 0; v /= 10) buf[n++] = static_cast<char>('0' + v % 10);

  count_ = 0;
  while (n > 0) digits_[count_++] = buf[--n];
  decimal_point_ = count_;
  truncated_ = false;
  Trim();
}

void Decimal::Trim() {
  while (count_ > 0 && digits_[count_ - 1] == '0') --count_;
  if (count_ == 0) decimal_point_ = 0;
}

// Multiplies by 2^k, working from the least significant digit. The product
// digits come out in reverse order.
void Decimal::LeftShift(int k) {
  ABSL_INTERNAL_CHECK(k > 0 && k <= kMaxShift, "shift out of range");

  // 2^60 < 10^19, so the carry adds at most 19 digits.
  char reversed[kMaxDigits + 20];
  int w = 0;
  uint64_t carry = 0;
  for (int r = count_ - 1; r >= 0; --r) {
    const uint64_t n =
        (static_cast<uint64_t>(digits_[r] - '0') << k) + carry;
    reversed[w++] = static_cast<char>('0' + n % 10);
    carry = n / 10;
  }
  for (; carry > 0; carry /= 10) {
    reversed[w++] = static_cast<char>('0' + carry % 10);
  }

  decimal_point_ += w - count_;

  // Keep the most significant digits when the product does not fit.
  int skip = 0;
  if (w > kMaxDigits) {
    skip = w - kMaxDigits;
    for (int i = 0; i < skip; ++i) {
      if (reversed[i] != '0') truncated_ = true;
    }
  }
  count_ = 0;
  for (int i = w - 1; i >= skip; --i) digits_[count_++] = reversed[i];
  Trim();
}

// Divides by 2^k, working from the most significant digit.
void Decimal::RightShift(int k) {
  ABSL_INTERNAL_CHECK(k > 0 && k <= kMaxShift, "shift out of range");

  int r = 0;  // read position
  int w = 0;  // write position
  uint64_t n = 0;

  // Pick up enough leading digits to produce the first quotient digit.
  for (; (n >> k) == 0; ++r) {
    if (r >= count_) {
      if (n == 0) {
        count_ = 0;
        decimal_point_ = 0;
        return;
      }
      while ((n >> k) == 0) {
        n *= 10;
        ++r;
      }
      break;
    }
    n = n * 10 + static_cast<uint64_t>(digits_[r] - '0');
  }
  decimal_point_ -= r - 1;

  const uint64_t mask = (uint64_t{1} << k) - 1;

  // Put down a quotient digit, pick up the next dividend digit.
  for (; r < count_; ++r) {
    digits_[w++] = static_cast<char>('0' + (n >> k));
    n &= mask;
    n = n * 10 + static_cast<uint64_t>(digits_[r] - '0');
  }

  // Drain the remainder.
  while (n > 0) {
    const uint64_t digit = n >> k;
    n &= mask;
    if (w < kMaxDigits) {
      digits_[w++] = static_cast<char>('0' + digit);
    } else if (digit > 0) {
      truncated_ = true;
    }
    n *= 10;
  }

  count_ = w;
  Trim();
}

void Decimal::Shift(int k) {
  if (count_ == 0) return;
  if (k > 0) {
    for (; k > kMaxShift; k -= kMaxShift) LeftShift(kMaxShift);
    LeftShift(k);
  } else if (k < 0) {
    for (; k < -kMaxShift; k += kMaxShift) RightShift(kMaxShift);
    RightShift(-k);
  }
}

bool Decimal::ShouldRoundUp(int nd) const {
  if (nd < 0 || nd >= count_) return false;
  if (digits_[nd] == '5' && nd + 1 == count_) {
    // Exactly halfway, unless digits were dropped past the end.
    if (truncated_) return true;
    return nd > 0 && (digits_[nd - 1] - '0') % 2 == 1;
  }
  return digits_[nd] >= '5';
}

void Decimal::Round(int nd) {
  if (nd < 0 || nd >= count_) return;
  if (ShouldRoundUp(nd)) {
    RoundUp(nd);
  } else {
    RoundDown(nd);
  }
}

void Decimal::RoundDown(int nd) {
  if (nd < 0 || nd >= count_) return;
  // The dropped digits take any truncated tail with them.
  truncated_ = false;
  count_ = nd;
  Trim();
}

void Decimal::RoundUp(int nd) {
  if (nd < 0 || nd >= count_) return;
  truncated_ = false;

  for (int i = nd - 1; i >= 0; --i) {
    if (digits_[i] < '9') {
      ++digits_[i];
      count_ = i + 1;
      return;
    }
  }

  // All nines: 0.99..9e(dp) becomes 0.1e(dp+1).
  digits_[0] = '1';
  count_ = 1;
  ++decimal_point_;
}

uint64_t Decimal::RoundedInteger() const {
  constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
  if (decimal_point_ > 20) return kMax;

  // Only a 20-digit integer part can exceed 2^64 - 1.
  uint64_t n = 0;
  for (int i = 0; i < decimal_point_; ++i) {
    const uint64_t digit =
        i < count_ ? static_cast<uint64_t>(digits_[i] - '0') : 0;
    if (n > (kMax - digit) / 10) return kMax;
    n = n * 10 + digit;
  }
  if (ShouldRoundUp(decimal_point_)) {
    if (n == kMax) return kMax;
    ++n;
  }
  return n;
}

std::string Decimal::ToString() const {
  const char* sign = negative_ ? "-" : "";
  if (count_ == 0) return absl::StrCat(sign, "0");
  return absl::StrCat(sign, "0.", digit_view(), "e", decimal_point_);
}

FPCONV_NAMESPACE_END
}  // namespace fpconv
