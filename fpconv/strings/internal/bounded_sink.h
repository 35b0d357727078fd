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
// Output sink for the float renderers. Writes into a caller-owned,
// fixed-capacity buffer and never allocates.

#ifndef FPCONV_STRINGS_INTERNAL_BOUNDED_SINK_H_
#define FPCONV_STRINGS_INTERNAL_BOUNDED_SINK_H_

#include <cstddef>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "fpconv/base/config.h"

namespace fpconv {
FPCONV_NAMESPACE_BEGIN

// FormatResult
//
// The outcome of rendering into a caller-supplied buffer. `written` views the
// bytes actually stored at the front of the buffer. `required` is the length
// the complete output needs; it exceeds `written.size()` exactly when the
// buffer was too small.
struct FormatResult {
  absl::string_view written;
  size_t required = 0;

  bool truncated() const { return required > written.size(); }
};

namespace format_internal {

// Appends bytes to a fixed buffer. Bytes past the capacity are dropped, but
// still counted in `size()`, so a sink over an empty span measures output.
class BoundedSink {
 public:
  explicit BoundedSink(absl::Span<char> buffer)
      : begin_(buffer.data()), pos_(buffer.data()), avail_(buffer.size()) {}

  BoundedSink(const BoundedSink&) = delete;
  BoundedSink& operator=(const BoundedSink&) = delete;

  void Append(absl::string_view v);
  void Append(size_t n, char c);
  void Append(char c) { Append(1, c); }

  // Total bytes appended, stored or not.
  size_t size() const { return size_; }
  // Bytes stored in the buffer.
  size_t written() const { return static_cast<size_t>(pos_ - begin_); }
  bool truncated() const { return size_ > written(); }

  FormatResult Finalize() const {
    return FormatResult{absl::string_view(begin_, written()), size_};
  }

 private:
  char* begin_;
  char* pos_;
  size_t avail_;
  size_t size_ = 0;
};

}  // namespace format_internal
FPCONV_NAMESPACE_END
}  // namespace fpconv

#endif  // FPCONV_STRINGS_INTERNAL_BOUNDED_SINK_H_
