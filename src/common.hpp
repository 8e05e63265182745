/**********************************************************************
This file is part of the Seimei AI Project:
	https://github.com/Acharvak/Seimei-AI

Copyright 2020 Fedor Uvarov

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

   http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
**********************************************************************/
// SPDX-License-Identifier: Apache-2.0

#ifndef DAGNN_COMMON_HPP_
#define DAGNN_COMMON_HPP_

#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

// Parameter buffers are serialized as IEEE-754 binary64, so the engine
// always works in double precision.
#define FLOAT double

#define FCAST(x) static_cast<FLOAT>(x)
#define F1 static_cast<FLOAT>(1)

static_assert(sizeof(FLOAT) == 8 && std::numeric_limits<FLOAT>::is_iec559,
		"dagnn requires 8-byte IEEE-754 doubles");

namespace dagnn {
namespace {
[[noreturn]] inline void unreachable(const std::string& where) {
	throw std::logic_error(where + std::string(": INTERNAL ERROR: unreachable code reached"));
}
}

/// Widths of a span and a weight block (or of two spans) do not agree
class ShapeMismatch : public std::invalid_argument {
public:
	explicit ShapeMismatch(const std::string& what) : std::invalid_argument(what) {
	}
};

/// A buffer does not have the length an operation requires
class SizeMismatch : public std::length_error {
public:
	explicit SizeMismatch(const std::string& what) : std::length_error(what) {
	}
};

/// A layer or weight handle was created by a different builder
class ForeignHandle : public std::invalid_argument {
public:
	explicit ForeignHandle(const std::string& what) : std::invalid_argument(what) {
	}
};
}

#endif
