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
// File: config.h
// -----------------------------------------------------------------------------
//
// This header file defines the fpconv version and the macros that open and
// close the fpconv namespace. Every fpconv header includes it, directly or
// indirectly.

#ifndef FPCONV_BASE_CONFIG_H_
#define FPCONV_BASE_CONFIG_H_

#include "absl/base/config.h"
#include "fpconv/base/options.h"

// FPCONV_VERSION
//
// The release of fpconv, as an integer of the form YYYYMMDD.
#define FPCONV_VERSION 20261019

// FPCONV_NAMESPACE_BEGIN/FPCONV_NAMESPACE_END
//
// An annotation placed at the beginning/end of each `namespace fpconv` scope.
// This is used to inject an inline namespace.
//
// The proper way to write fpconv code in the `fpconv` namespace is:
//
// namespace fpconv {
// FPCONV_NAMESPACE_BEGIN
//
// void Foo();  // fpconv::Foo().
//
// FPCONV_NAMESPACE_END
// }  // namespace fpconv

#if !defined(FPCONV_OPTION_USE_INLINE_NAMESPACE) || \
    !defined(FPCONV_OPTION_INLINE_NAMESPACE_NAME)
#error options.h is misconfigured.
#endif

#if FPCONV_OPTION_USE_INLINE_NAMESPACE == 0
#define FPCONV_NAMESPACE_BEGIN
#define FPCONV_NAMESPACE_END
#elif FPCONV_OPTION_USE_INLINE_NAMESPACE == 1
#define FPCONV_NAMESPACE_BEGIN \
  inline namespace FPCONV_OPTION_INLINE_NAMESPACE_NAME {
#define FPCONV_NAMESPACE_END }
#else
#error options.h is misconfigured.
#endif

#endif  // FPCONV_BASE_CONFIG_H_
