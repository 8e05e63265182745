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
 * The randomization collaborator used by stochastic layers, and a small
 * catalogue of sampling functions.
 *
 * A Randomization maps (generator, value, local derivative) to a new
 * (value, local derivative) pair. The generator state is explicit and is
 * advanced in place; nothing else is read or written.
 */

#ifndef DAGNN_NNET_RANDOMIZATIONS_HPP_
#define DAGNN_NNET_RANDOMIZATIONS_HPP_

#include "common.hpp"
#include "xoshiropp.hpp"

#include <functional>
#include <string>
#include <utility>

namespace dagnn::nnet {
struct Randomization {
	std::string name;
	std::function<std::pair<FLOAT, FLOAT>(RandomState&, FLOAT, FLOAT)> function;
};
}

namespace dagnn::nnet::randomizations {
/**
 * Stochastic binary unit: the value, read as a probability, becomes 1 with
 * that probability and 0 otherwise. The derivative is passed through.
 */
class Bernoulli {
public:
	static std::pair<FLOAT, FLOAT> sample(RandomState& state, FLOAT value, FLOAT derivative) {
		return {(from_int(xoshiropp(state)) < value) ? F1 : FCAST(0), derivative};
	}
	static const std::string getName() {
		return name;
	}
private:
	inline static const std::string name {"bernoulli"};
};

/// Inverted dropout with a keep probability of 1/2
class Dropout {
public:
	static std::pair<FLOAT, FLOAT> sample(RandomState& state, FLOAT value, FLOAT derivative) {
		if(xoshiropp(state) >> 63) {
			return {value * 2, derivative * 2};
		} else {
			return {0, 0};
		}
	}
	static const std::string getName() {
		return name;
	}
private:
	inline static const std::string name {"dropout"};
};

template<class Sampler> Randomization make() {
	return Randomization {Sampler::getName(), &Sampler::sample};
}

inline Randomization bernoulli() {
	return make<Bernoulli>();
}

inline Randomization dropout() {
	return make<Dropout>();
}

/**
 * Look up a randomization by the name it serializes under.
 *
 * @throw std::runtime_error if there is no such randomization
 */
inline Randomization byName(const std::string& name) {
	if(name == "bernoulli") {
		return bernoulli();
	} else if(name == "dropout") {
		return dropout();
	} else {
		throw std::runtime_error(std::string("Randomization not available: ") + name);
	}
}
}

#endif
