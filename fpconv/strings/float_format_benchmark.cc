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

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "benchmark/benchmark.h"
#include "absl/base/casts.h"
#include "absl/random/random.h"
#include "absl/types/span.h"
#include "fpconv/numeric/float_bits.h"
#include "fpconv/strings/decimal.h"
#include "fpconv/strings/decimal_to_bits.h"
#include "fpconv/strings/float_format.h"

namespace fpconv {
namespace {

std::vector<double> RandomDoubles(int count) {
  absl::BitGen rng;
  std::vector<double> values;
  values.reserve(static_cast<size_t>(count));
  while (static_cast<int>(values.size()) < count) {
    const double v = absl::bit_cast<double>(absl::Uniform<uint64_t>(rng));
    if (std::isfinite(v)) values.push_back(v);
  }
  return values;
}

void BM_FormatShortest(benchmark::State& state) {
  const int count = 1024;
  const int bit_width = static_cast<int>(state.range(0));
  const std::vector<double> values = RandomDoubles(count);
  char buf[kFloatToBufferSize];

  while (state.KeepRunningBatch(count)) {
    for (int i = 0; i < count; ++i) {
      FormatResult r =
          FormatFloat(absl::MakeSpan(buf), values[i], 'g', -1, bit_width);
      benchmark::DoNotOptimize(r);
    }
  }
}
BENCHMARK(BM_FormatShortest)->Arg(16)->Arg(32)->Arg(64);

void BM_FormatPrecision(benchmark::State& state) {
  const int count = 1024;
  const int precision = static_cast<int>(state.range(0));
  const std::vector<double> values = RandomDoubles(count);
  char buf[64];

  while (state.KeepRunningBatch(count)) {
    for (int i = 0; i < count; ++i) {
      FormatResult r =
          FormatFloat(absl::MakeSpan(buf), values[i], 'e', precision, 64);
      benchmark::DoNotOptimize(r);
    }
  }
}
BENCHMARK(BM_FormatPrecision)->Arg(0)->Arg(6)->Arg(17);

void BM_DecimalToDouble(benchmark::State& state) {
  const int count = 1024;
  const std::vector<double> values = RandomDoubles(count);
  std::vector<Decimal> decimals(static_cast<size_t>(count));
  for (int i = 0; i < count; ++i) {
    const DecomposedFloat f =
        Decompose(absl::bit_cast<uint64_t>(values[i]), FloatWidth::k64);
    decimals[i].Assign(f.mantissa);
    decimals[i].Shift(f.exponent - 52);
  }

  while (state.KeepRunningBatch(count)) {
    for (int i = 0; i < count; ++i) {
      benchmark::DoNotOptimize(DecimalToDouble(decimals[i]));
    }
  }
}
BENCHMARK(BM_DecimalToDouble);

}  // namespace
}  // namespace fpconv
