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
 * This file defines the activation collaborator used by the engine and a
 * catalogue of activation functions. They are all inline due to simplicity.
 *
 * The engine only sees an Activation: a name plus a function from an
 * ordered list of raw node values to an ordered list of
 * (activated value, local derivative) pairs of the same length. The
 * derivative is taken with respect to the raw value.
 */

#ifndef DAGNN_NNET_ACTIVATIONS_HPP_
#define DAGNN_NNET_ACTIVATIONS_HPP_

#include "common.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace dagnn::nnet {
using ActivationPairs = std::vector<std::pair<FLOAT, FLOAT>>;

struct Activation {
	/// Used to refer to the activation in structure descriptions
	std::string name;
	std::function<ActivationPairs(const std::vector<FLOAT>&)> function;
};
}

namespace dagnn::nnet::activations {
class Identity {
public:
	static FLOAT call(FLOAT x) {
		return x;
	}
	static FLOAT derivative([[maybe_unused]] FLOAT x) {
		return F1;
	}
	static const std::string getName() {
		return name;
	}
private:
	inline static const std::string name {"identity"};
};

class TanH {
public:
	static FLOAT call(FLOAT x) {
		return std::tanh(x);
	}
	static FLOAT derivative(FLOAT x) {
		x = std::tanh(x);
		return F1 - x * x;
	}
	static const std::string getName() {
		return name;
	}
private:
	inline static const std::string name {"tanh"};
};

class Sigmoid {
public:
	static FLOAT call(FLOAT x) {
		return F1 / (F1 + std::exp(-x));
	}
	static FLOAT derivative(FLOAT x) {
		auto s = call(x);
		return s * (F1 - s);
	}
	static const std::string getName() {
		return name;
	}
private:
	inline static const std::string name {"sigmoid"};
};

class ReLU {
public:
	static FLOAT call(FLOAT x) {
		return x > 0 ? x : FCAST(0);
	}
	static FLOAT derivative(FLOAT x) {
		return x > 0 ? F1 : FCAST(0);
	}
	static const std::string getName() {
		return name;
	}
private:
	inline static const std::string name {"relu"};
};

/// This is a wrapper for another activation that changes zeros to epsilons
template<class Activation> class Unzero {
public:
	static FLOAT call(FLOAT x) {
		x = Activation::call(x);
		if(!x) {
			return std::numeric_limits<FLOAT>::epsilon();
		} else {
			return x;
		}
	}
	static FLOAT derivative(FLOAT x) {
		return Activation::derivative(x);
	}
	static const std::string getName() {
		return Activation::getName() + "/uz";
	}
};

/**
 * This is a wrapper for another activation that clamps the result
 * between the minimum and maximum representable finite values.
 *
 * Arbitrary limits are not supported because the function would
 * be difficult to derive otherwise.
 */
template<class Activation> class ClampExtremes {
public:
	static FLOAT call(FLOAT x) {
		return std::clamp(Activation::call(x),
				std::numeric_limits<FLOAT>::lowest(),
				std::numeric_limits<FLOAT>::max());
	}

	static FLOAT derivative(FLOAT x) {
		// This should be a sufficient approximation
		return std::clamp(Activation::derivative(x),
						std::numeric_limits<FLOAT>::lowest(),
						std::numeric_limits<FLOAT>::max());
	}

	static const std::string getName() {
		return Activation::getName() + "/finite";
	}
};

/**
 * Softmax over the whole group of values it is given. The derivative
 * reported for each element is the diagonal of the Jacobian, s * (1 - s).
 */
class Softmax {
public:
	static ActivationPairs apply(const std::vector<FLOAT>& xs) {
		ActivationPairs result(xs.size());
		if(xs.empty()) {
			return result;
		}
		auto top = *std::max_element(xs.begin(), xs.end());
		FLOAT total {0};
		for(size_t i {0}; i < xs.size(); ++i) {
			result[i].first = std::exp(xs[i] - top);
			total += result[i].first;
		}
		for(auto& p : result) {
			p.first /= total;
			p.second = p.first * (F1 - p.first);
		}
		return result;
	}
	static const std::string getName() {
		return name;
	}
private:
	inline static const std::string name {"softmax"};
};

/// Turn an elementwise activation class into an Activation
template<class Function> Activation pointwise() {
	return Activation {Function::getName(), [](const std::vector<FLOAT>& xs) -> ActivationPairs {
		ActivationPairs result;
		result.reserve(xs.size());
		for(FLOAT x : xs) {
			result.emplace_back(Function::call(x), Function::derivative(x));
		}
		return result;
	}};
}

inline Activation identity() {
	return pointwise<Identity>();
}

inline Activation tanh() {
	return pointwise<TanH>();
}

inline Activation sigmoid() {
	return pointwise<Sigmoid>();
}

inline Activation relu() {
	return pointwise<ReLU>();
}

inline Activation softmax() {
	return Activation {Softmax::getName(), &Softmax::apply};
}

/**
 * Look up an activation by the name it serializes under.
 *
 * @throw std::runtime_error if there is no such activation
 */
inline Activation byName(const std::string& name) {
	if(name == "identity") {
		return identity();
	} else if(name == "tanh") {
		return tanh();
	} else if(name == "tanh/uz") {
		return pointwise<Unzero<TanH>>();
	} else if(name == "sigmoid") {
		return sigmoid();
	} else if(name == "sigmoid/finite") {
		return pointwise<ClampExtremes<Sigmoid>>();
	} else if(name == "relu") {
		return relu();
	} else if(name == "softmax") {
		return softmax();
	} else {
		throw std::runtime_error(std::string("Activation not available: ") + name);
	}
}
}

#endif
