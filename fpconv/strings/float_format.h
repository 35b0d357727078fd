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
// -----------------------------------------------------------------------------
// File: float_format.h
// -----------------------------------------------------------------------------
//
// This header contains functions for formatting binary16, binary32 and
// binary64 values as decimal text. Output is correctly rounded for every
// precision, and a negative precision selects the shortest output that
// converts back to the same value.
//
// Supported styles:
//
//   'e', 'E'  d.dddde±dd
//   'f', 'F'  ddd.dddd
//   'g', 'G'  'e' for large or small exponents, 'f' otherwise
//
// Non-finite values print as "NaN", "+Inf" and "-Inf" in every style. An
// unknown style prints '%' followed by the style character.
//
// Example:
//
//   char buf[fpconv::kFloatToBufferSize];
//   fpconv::FormatResult r = fpconv::FormatFloat(absl::MakeSpan(buf), 0.1,
//                                                'g', -1, 32);
//   // r.written == "0.1"
//
//   std::string s = fpconv::FloatToString(1234.5, 'e', 2, 64);  // "1.23e+03"

#ifndef FPCONV_STRINGS_FLOAT_FORMAT_H_
#define FPCONV_STRINGS_FLOAT_FORMAT_H_

#include <cstddef>
#include <cstdint>
#include <string>

#include "absl/types/span.h"
#include "fpconv/base/config.h"
#include "fpconv/numeric/float_bits.h"
#include "fpconv/strings/internal/bounded_sink.h"

namespace fpconv {
FPCONV_NAMESPACE_BEGIN

// A buffer of this size holds any shortest 'e', 'E', 'g' or 'G' output of any
// supported width. 'f' output of large values can be much longer.
constexpr size_t kFloatToBufferSize = 32;

// FormatFloatBits()
//
// Formats the value whose `width` bit pattern is `bits` into `out`, in style
// `fmt` with `precision` digits (negative for shortest). The output is not
// NUL-terminated. If `out` is too small the output is truncated to its size;
// the result's `required` field reports the full length.
FormatResult FormatFloatBits(absl::Span<char> out, uint64_t bits, char fmt,
                             int precision, FloatWidth width);

// FormatFloat()
//
// Rounds `value` to the format of `bit_width` bits and formats it as
// `FormatFloatBits()` does. `bit_width` must be 16, 32 or 64; any other value
// is a programming error and aborts.
FormatResult FormatFloat(absl::Span<char> out, double value, char fmt,
                         int precision, int bit_width);

// FloatToString()
//
// Returns the complete output of `FormatFloat()` as a string.
std::string FloatToString(double value, char fmt, int precision,
                          int bit_width);

// StrAppendFloat()
//
// Appends the complete output of `FormatFloat()` to `*dest`.
void StrAppendFloat(std::string* dest, double value, char fmt, int precision,
                    int bit_width);

namespace format_internal {

// Formats `bits` into `sink`. Shared by the public entry points.
void FloatBitsToSink(uint64_t bits, char fmt, int precision, FloatWidth width,
                     BoundedSink* sink);

}  // namespace format_internal

FPCONV_NAMESPACE_END
}  // namespace fpconv

#endif  // FPCONV_STRINGS_FLOAT_FORMAT_H_
