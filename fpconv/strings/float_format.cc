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

#include "fpconv/strings/float_format.h"

#include <cstdint>
#include <string>

#include "fpconv/strings/decimal.h"
#include "fpconv/strings/internal/digit_renderer.h"
#include "fpconv/strings/internal/round_policy.h"

namespace fpconv {
FPCONV_NAMESPACE_BEGIN

namespace format_internal {

void FloatBitsToSink(uint64_t bits, char fmt, int precision, FloatWidth width,
                     BoundedSink* sink) {
  const FloatInfo info = GetFloatInfo(width);
  const DecomposedFloat f = Decompose(bits, width);

  switch (f.kind) {
    case FloatClass::kNaN:
      sink->Append("NaN");
      return;
    case FloatClass::kInfinity:
      sink->Append(f.negative ? "-Inf" : "+Inf");
      return;
    default:
      break;
  }

  // The exact value, mantissa * 2^(exponent - mantissa_bits).
  Decimal d;
  d.Assign(f.mantissa);
  d.Shift(f.exponent - info.mantissa_bits);
  d.set_negative(f.negative);

  const bool shortest = precision < 0;
  if (shortest) {
    RoundShortest(&d, f.mantissa, f.exponent, info);
    precision = ShortestPrecision(d, fmt);
  } else {
    if ((fmt == 'g' || fmt == 'G') && precision == 0) precision = 1;
    RoundToPrecision(&d, fmt, precision);
  }

  RenderDigits(DigitsView::Of(d), shortest, f.negative, precision, fmt, sink);
}

}  // namespace format_internal

FormatResult FormatFloatBits(absl::Span<char> out, uint64_t bits, char fmt,
                             int precision, FloatWidth width) {
  format_internal::BoundedSink sink(out);
  format_internal::FloatBitsToSink(bits, fmt, precision, width, &sink);
  return sink.Finalize();
}

FormatResult FormatFloat(absl::Span<char> out, double value, char fmt,
                         int precision, int bit_width) {
  const FloatWidth width = FloatWidthFromBits(bit_width);
  return FormatFloatBits(out, FloatToBits(value, width), fmt, precision,
                         width);
}

void StrAppendFloat(std::string* dest, double value, char fmt, int precision,
                    int bit_width) {
  // First try with a small fixed size buffer.
  char space[2 * kFloatToBufferSize];
  FormatResult r =
      FormatFloat(absl::MakeSpan(space), value, fmt, precision, bit_width);
  if (!r.truncated()) {
    dest->append(r.written.data(), r.written.size());
    return;
  }

  // Long 'f' output: render again straight into the grown string.
  const size_t old_size = dest->size();
  dest->resize(old_size + r.required);
  r = FormatFloat(absl::MakeSpan(&(*dest)[old_size], r.required), value, fmt,
                  precision, bit_width);
  dest->resize(old_size + r.written.size());
}

std::string FloatToString(double value, char fmt, int precision,
                          int bit_width) {
  std::string result;
  StrAppendFloat(&result, value, fmt, precision, bit_width);
  return result;
}

FPCONV_NAMESPACE_END
}  // namespace fpconv
