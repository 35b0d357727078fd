#ifndef FPCONV_BASE_OPTIONS_H_
#define FPCONV_BASE_OPTIONS_H_

// Copyright 2026 The fpconv Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//
// -----------------------------------------------------------------------------
// File: options.h
// -----------------------------------------------------------------------------
//
// This file contains fpconv configuration options for setting specific
// implementations instead of letting fpconv determine which implementation to
// use at compile-time. Setting these options may be useful for package or build
// managers who wish to guarantee ABI stability within binary builds (which are
// otherwise difficult to enforce).
//
// *** IMPORTANT NOTICE FOR PACKAGE MANAGERS:  It is important that
// maintainers of package managers who wish to package fpconv read and
// understand this file! ***
//
// fpconv contains a number of possible configuration endpoints. The option
// values are all compile-time constants and must be identical for every
// translation unit that is linked into a single binary.

// FPCONV_OPTION_USE_INLINE_NAMESPACE
// FPCONV_OPTION_INLINE_NAMESPACE_NAME
//
// These options control whether all entities in the fpconv namespace are
// contained within an inner inline namespace. This does not affect how code
// should reference fpconv entities; it only changes the mangled names of the
// symbols, so that two builds of fpconv with different options cannot be
// mixed in one binary by accident.
//
// A value of 0 means not to use inline namespaces.
//
// A value of 1 means to use an inline namespace with the given name inside
// namespace fpconv. If this is set, FPCONV_OPTION_INLINE_NAMESPACE_NAME must
// also be changed to a new, unique identifier name.

#define FPCONV_OPTION_USE_INLINE_NAMESPACE 0
#define FPCONV_OPTION_INLINE_NAMESPACE_NAME head

#endif  // FPCONV_BASE_OPTIONS_H_
