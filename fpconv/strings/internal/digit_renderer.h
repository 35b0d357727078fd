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
// Renders already rounded decimal digits as printf-style text.

#ifndef FPCONV_STRINGS_INTERNAL_DIGIT_RENDERER_H_
#define FPCONV_STRINGS_INTERNAL_DIGIT_RENDERER_H_

#include "fpconv/base/config.h"
#include "fpconv/strings/decimal.h"
#include "fpconv/strings/internal/bounded_sink.h"

namespace fpconv {
FPCONV_NAMESPACE_BEGIN
namespace format_internal {

// A read-only snapshot of the digits of a `Decimal`. The value is
// 0.digits[0..count) * 10^decimal_point; an empty view is zero.
struct DigitsView {
  const char* digits;
  int count;
  int decimal_point;

  static DigitsView Of(const Decimal& d) {
    return DigitsView{d.digits(), d.count(), d.decimal_point()};
  }

  // Digit `i`, or '0' outside the stored digits.
  char at(int i) const { return i >= 0 && i < count ? digits[i] : '0'; }
};

// Renders `[-]d.ddde±dd` with `precision` digits after the point. `e` is the
// exponent letter to print ('e' or 'E').
void RenderE(const DigitsView& d, bool negative, int precision, char e,
             BoundedSink* sink);

// Renders `[-]ddd.ddd` with `precision` digits after the point.
void RenderF(const DigitsView& d, bool negative, int precision,
             BoundedSink* sink);

// Renders `d` in style `fmt` ('e', 'E', 'f', 'F', 'g' or 'G'). `shortest`
// selects the 'g' style switch-over used for shortest output. Unknown styles
// render as '%' followed by the style character.
void RenderDigits(const DigitsView& d, bool shortest, bool negative,
                  int precision, char fmt, BoundedSink* sink);

}  // namespace format_internal
FPCONV_NAMESPACE_END
}  // namespace fpconv

#endif  // FPCONV_STRINGS_INTERNAL_DIGIT_RENDERER_H_
