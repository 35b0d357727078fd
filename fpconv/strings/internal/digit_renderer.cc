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

#include <algorithm>

#include "absl/strings/string_view.h"

namespace fpconv {
FPCONV_NAMESPACE_BEGIN
namespace format_internal {

namespace {

void PrintExponent(int exp, char e, BoundedSink* out) {
  char buf[5];
  char* p = buf;
  *p++ = e;
  if (exp < 0) {
    *p++ = '-';
    exp = -exp;
  } else {
    *p++ = '+';
  }
  // At least two exponent digits.
  if (exp > 99) {
    *p++ = static_cast<char>(exp / 100 + '0');
    *p++ = static_cast<char>(exp / 10 % 10 + '0');
    *p++ = static_cast<char>(exp % 10 + '0');
  } else {
    *p++ = static_cast<char>(exp / 10 + '0');
    *p++ = static_cast<char>(exp % 10 + '0');
  }
  out->Append(absl::string_view(buf, static_cast<size_t>(p - buf)));
}

}  // namespace

void RenderE(const DigitsView& d, bool negative, int precision, char e,
             BoundedSink* sink) {
  if (negative) sink->Append('-');

  sink->Append(d.count != 0 ? d.digits[0] : '0');

  if (precision > 0) {
    sink->Append('.');
    const int end = std::min(d.count, precision + 1);
    if (end > 1) {
      sink->Append(
          absl::string_view(d.digits + 1, static_cast<size_t>(end - 1)));
    }
    sink->Append(static_cast<size_t>(precision + 1 - std::max(end, 1)), '0');
  }

  // Zero prints as 0e+00.
  PrintExponent(d.count == 0 ? 0 : d.decimal_point - 1, e, sink);
}

void RenderF(const DigitsView& d, bool negative, int precision,
             BoundedSink* sink) {
  if (negative) sink->Append('-');

  // Integer part, padded with zeros past the stored digits.
  if (d.decimal_point > 0) {
    const int m = std::min(d.count, d.decimal_point);
    sink->Append(absl::string_view(d.digits, static_cast<size_t>(m)));
    sink->Append(static_cast<size_t>(d.decimal_point - m), '0');
  } else {
    sink->Append('0');
  }

  if (precision <= 0) return;

  sink->Append('.');
  // Zeros between the point and the first stored digit.
  int i = std::min(std::max(-d.decimal_point, 0), precision);
  sink->Append(static_cast<size_t>(i), '0');
  const int start = d.decimal_point + i;
  if (i < precision && start < d.count) {
    const int n = std::min(d.count - start, precision - i);
    sink->Append(absl::string_view(d.digits + start, static_cast<size_t>(n)));
    i += n;
  }
  sink->Append(static_cast<size_t>(precision - i), '0');
}

void RenderDigits(const DigitsView& d, bool shortest, bool negative,
                  int precision, char fmt, BoundedSink* sink) {
  switch (fmt) {
    case 'e':
    case 'E':
      RenderE(d, negative, precision, fmt, sink);
      return;
    case 'f':
    case 'F':
      RenderF(d, negative, precision, sink);
      return;
    case 'g':
    case 'G': {
      int eprec = precision;
      if (eprec > d.count && d.count >= d.decimal_point) eprec = d.count;
      // %e is used if the exponent from the conversion is less than -4 or
      // greater than or equal to the precision. Shortest output decides as if
      // the precision were 6.
      if (shortest) eprec = 6;
      const int exp = d.decimal_point - 1;
      if (exp < -4 || exp >= eprec) {
        if (precision > d.count) precision = d.count;
        RenderE(d, negative, precision - 1, fmt == 'g' ? 'e' : 'E', sink);
        return;
      }
      if (precision > d.decimal_point) precision = d.count;
      RenderF(d, negative, std::max(precision - d.decimal_point, 0), sink);
      return;
    }
    default:
      break;
  }

  sink->Append('%');
  sink->Append(fmt);
}

}  // namespace format_internal
FPCONV_NAMESPACE_END
}  // namespace fpconv
