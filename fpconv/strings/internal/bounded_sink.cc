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

#include "fpconv/strings/internal/bounded_sink.h"

#include <algorithm>
#include <cstring>

namespace fpconv {
FPCONV_NAMESPACE_BEGIN
namespace format_internal {

void BoundedSink::Append(absl::string_view v) {
  size_t to_write = std::min(v.size(), avail_);
  if (to_write > 0) std::memcpy(pos_, v.data(), to_write);
  pos_ += to_write;
  avail_ -= to_write;
  size_ += v.size();
}

void BoundedSink::Append(size_t n, char c) {
  size_t to_write = std::min(n, avail_);
  if (to_write > 0) std::memset(pos_, c, to_write);
  pos_ += to_write;
  avail_ -= to_write;
  size_ += n;
}

}  // namespace format_internal
FPCONV_NAMESPACE_END
}  // namespace fpconv
