//
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
//
// Decides how many digits of an exact decimal expansion survive formatting.

#ifndef FPCONV_STRINGS_INTERNAL_ROUND_POLICY_H_
#define FPCONV_STRINGS_INTERNAL_ROUND_POLICY_H_

#include <cstdint>

#include "fpconv/base/config.h"
#include "fpconv/numeric/float_bits.h"
#include "fpconv/strings/decimal.h"

namespace fpconv {
FPCONV_NAMESPACE_BEGIN
namespace format_internal {

// Rounds `d`, which must hold exactly `mantissa * 2^(exponent - mantissa_bits)`
// for the layout `info`, to the fewest digits that still convert back to the
// same binary value. Among the shortest candidates the one nearest the exact
// value is kept. A zero mantissa leaves `d` empty.
void RoundShortest(Decimal* d, uint64_t mantissa, int exponent,
                   const FloatInfo& info);

// Rounds `d` to the digits needed to print `precision` digits in style `fmt`:
// `precision + 1` significant digits for 'e', `precision` fraction digits for
// 'f' and `max(precision, 1)` significant digits for 'g'. Other styles leave
// `d` untouched.
void RoundToPrecision(Decimal* d, char fmt, int precision);

// Returns the precision that renders every digit of a shortest `d` in style
// `fmt`.
int ShortestPrecision(const Decimal& d, char fmt);

}  // namespace format_internal
FPCONV_NAMESPACE_END
}  // namespace fpconv

#endif  // FPCONV_STRINGS_INTERNAL_ROUND_POLICY_H_
