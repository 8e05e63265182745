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

/**
 * Flat value buffers: parameters, weight gradients and input
 * sensitivities, with the operations a training loop needs to combine,
 * apply and store them.
 *
 * All buffers are immutable values. Copies share their storage, and every
 * operation that "changes" a buffer returns a new one.
 */

#ifndef DAGNN_NNET_WEIGHTS_HPP_
#define DAGNN_NNET_WEIGHTS_HPP_

#include "common.hpp"
#include "xoshiropp.hpp"
#include "nnet/framework.hpp"

#include <cstdint>
#include <H5Cpp.h>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace dagnn::nnet {
/// An immutable sequence of FLOATs
class ValueBuffer {
public:
	ValueBuffer();
	explicit ValueBuffer(vector<FLOAT> values);

	size_t size() const;
	bool empty() const;

	/**
	 * @throw std::out_of_range if index >= size()
	 */
	FLOAT at(size_t index) const;

	/// The value at `index`, or 0 past the end
	FLOAT padded(size_t index) const;

	const vector<FLOAT>& values() const;

	/// May be nullptr if the buffer is empty
	const FLOAT * data() const;

protected:
	shared_ptr<const vector<FLOAT>> storage;
};

bool operator==(const ValueBuffer& a, const ValueBuffer& b);
bool operator!=(const ValueBuffer& a, const ValueBuffer& b);

/// Trainable weights of a network, indexed by WeightSelectors
class ParameterBuffer : public ValueBuffer {
public:
	using ValueBuffer::ValueBuffer;
};

/// Gradient of the loss with respect to each parameter slot
class WeightGradient : public ValueBuffer {
public:
	using ValueBuffer::ValueBuffer;
};

/// Gradient of the loss with respect to each input, in input order
class InputSensitivity : public ValueBuffer {
public:
	using ValueBuffer::ValueBuffer;
};

/**
 * Elementwise sum of the updates. Shorter updates are read as 0 past their
 * end, so the result is as long as the longest one. The sum of nothing is
 * an empty update, which is neutral.
 */
WeightGradient combine(const vector<WeightGradient>& updates);

/// Same as combine({a, b})
WeightGradient operator+(const WeightGradient& a, const WeightGradient& b);

/**
 * Return parameters + rate * update. Both are read as 0 past their end;
 * the result is as long as the longer one.
 */
ParameterBuffer applyDelta(FLOAT rate, const ParameterBuffer& parameters, const WeightGradient& update);

ParameterBuffer packWeights(const vector<FLOAT>& values);
vector<FLOAT> unpackWeights(const ParameterBuffer& buffer);

/**
 * Encode every value as 8 bytes of IEEE-754 binary64 in the byte order of
 * this machine, with no header.
 */
vector<uint8_t> serializeWeights(const ParameterBuffer& buffer);

/**
 * Inverse of serializeWeights. The bytes are always copied.
 *
 * @throw SizeMismatch if `size` is not a multiple of 8
 */
ParameterBuffer deserializeWeights(const uint8_t * bytes, size_t size);
ParameterBuffer deserializeWeights(const vector<uint8_t>& bytes);

/**
 * Write the buffer as {v1, v2, ..., vn}. Each value takes 15 significant
 * digits, or 17 if 15 don't read back exactly, and always uses the classic
 * locale.
 */
std::ostream& operator<<(std::ostream& out, const ValueBuffer& buffer);
string toString(const ValueBuffer& buffer);

/**
 * Parse the format written by operator<<, in the classic locale whatever
 * the global one is. Whitespace is allowed around the braces, values and
 * commas; inf, -inf and nan are accepted.
 *
 * @throw std::invalid_argument if the text is malformed
 */
ParameterBuffer parseWeights(const string& text);

/**
 * Draw `count` weights uniformly from [range.first, range.second),
 * advancing `state`.
 */
ParameterBuffer initialWeights(size_t count, RandomState& state, std::pair<FLOAT, FLOAT> range);

/// As above, with as many weights as `structure` needs
ParameterBuffer initialWeights(const NetworkStructure& structure, RandomState& state,
		std::pair<FLOAT, FLOAT> range);

/**
 * Store the buffer in `group` as a one-dimensional dataset of native
 * doubles called `name`, replacing any existing object of that name.
 *
 * @throw std::runtime_error if HDF5 fails
 */
void saveWeights(H5::Group& group, const string& name, const ParameterBuffer& buffer);

/**
 * Read a buffer stored by saveWeights.
 *
 * @throw std::runtime_error if the dataset doesn't exist, is not
 *     one-dimensional or HDF5 fails
 */
ParameterBuffer loadWeights(H5::Group& group, const string& name);
}

#endif
